#include "model/embedding_input.h"

namespace roberta {
namespace {

static bool present(const c10::optional<torch::Tensor>& t) {
  return t.has_value() && t->defined();
}

} // namespace

InputContractError::InputContractError()
    : std::invalid_argument("exactly one of token identifiers or token vectors must be supplied") {}

EmbeddingInput EmbeddingInput::from_token_ids(torch::Tensor ids) {
  if (!ids.defined()) throw InputContractError();
  return EmbeddingInput(TokenIds{std::move(ids)});
}

EmbeddingInput EmbeddingInput::from_token_vectors(torch::Tensor vectors) {
  if (!vectors.defined()) throw InputContractError();
  return EmbeddingInput(TokenVectors{std::move(vectors)});
}

EmbeddingInput EmbeddingInput::from_optional(const c10::optional<torch::Tensor>& ids,
                                             const c10::optional<torch::Tensor>& vectors) {
  const bool has_ids = present(ids);
  const bool has_vectors = present(vectors);
  if (has_ids == has_vectors) throw InputContractError();
  return has_ids ? from_token_ids(*ids) : from_token_vectors(*vectors);
}

const torch::Tensor& EmbeddingInput::token_ids() const {
  const auto* p = std::get_if<TokenIds>(&source_);
  if (!p) throw std::logic_error("EmbeddingInput: holds token vectors, not token ids");
  return p->ids;
}

const torch::Tensor& EmbeddingInput::token_vectors() const {
  const auto* p = std::get_if<TokenVectors>(&source_);
  if (!p) throw std::logic_error("EmbeddingInput: holds token ids, not token vectors");
  return p->vectors;
}

std::vector<int64_t> EmbeddingInput::batch_shape() const {
  if (const auto* p = std::get_if<TokenIds>(&source_)) {
    return p->ids.sizes().vec();
  }
  const torch::Tensor& v = std::get<TokenVectors>(source_).vectors;
  return {v.size(0), v.size(1)};
}

} // namespace roberta
