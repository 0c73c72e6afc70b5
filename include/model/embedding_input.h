#pragma once

#include <c10/util/Optional.h>
#include <torch/torch.h>

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace roberta {

// Raised when a caller supplies both or neither of token ids and token vectors.
class InputContractError : public std::invalid_argument {
public:
  InputContractError();
};

// Source of the base embedding for one forward call.
//
// Holds either token ids [B, T] int64 or precomputed token vectors [B, T, H].
// Instances only come out of the factories below, so a constructed value
// always carries exactly one defined tensor.
class EmbeddingInput {
public:
  struct TokenIds {
    torch::Tensor ids;
  };
  struct TokenVectors {
    torch::Tensor vectors;
  };

  static EmbeddingInput from_token_ids(torch::Tensor ids);
  static EmbeddingInput from_token_vectors(torch::Tensor vectors);

  // An optional holding an undefined tensor counts as absent.
  static EmbeddingInput from_optional(const c10::optional<torch::Tensor>& ids,
                                      const c10::optional<torch::Tensor>& vectors);

  bool has_token_ids() const { return std::holds_alternative<TokenIds>(source_); }

  const torch::Tensor& token_ids() const;
  const torch::Tensor& token_vectors() const;

  // {B, T}: the shape of the ids, or the first two dims of the vectors.
  std::vector<int64_t> batch_shape() const;

private:
  explicit EmbeddingInput(std::variant<TokenIds, TokenVectors> source)
      : source_(std::move(source)) {}

  std::variant<TokenIds, TokenVectors> source_;
};

} // namespace roberta
