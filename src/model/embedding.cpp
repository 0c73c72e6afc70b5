#include "model/embedding.h"

#include "core/tensor_utils.h"
#include "model/position_ids.h"

namespace roberta {

RobertaEmbeddingsImpl::RobertaEmbeddingsImpl(const ModelConfig& cfg) : cfg_(cfg) {
  const std::string bad = validate_embedding_config(cfg_);
  require(bad.empty(), "RobertaEmbeddings: " + bad);

  const int64_t d = cfg_.hidden_size;

  word_embeddings_ = register_module(
      "word_embeddings",
      torch::nn::Embedding(torch::nn::EmbeddingOptions(cfg_.vocab_size, d).padding_idx(padding_idx_)));
  position_embeddings_ = register_module(
      "position_embeddings",
      torch::nn::Embedding(
          torch::nn::EmbeddingOptions(cfg_.max_position_embeddings, d).padding_idx(padding_idx_)));
  token_type_embeddings_ = register_module(
      "token_type_embeddings",
      torch::nn::Embedding(torch::nn::EmbeddingOptions(cfg_.type_vocab_size, d)));

  layer_norm_ = register_module(
      "LayerNorm",
      torch::nn::LayerNorm(torch::nn::LayerNormOptions(std::vector<int64_t>{d}).eps(kLayerNormEps)));

  dropout_ = register_module("dropout", Dropout(cfg_.hidden_dropout_prob));
}

torch::Tensor RobertaEmbeddingsImpl::position_ids_for(const EmbeddingInput& input) const {
  if (input.has_token_ids()) {
    return position_ids_from_token_ids(input.token_ids(), padding_idx_);
  }
  return position_ids_from_token_vectors(input.token_vectors(), padding_idx_);
}

torch::Tensor RobertaEmbeddingsImpl::forward(const EmbeddingInput& input,
                                             const c10::optional<torch::Tensor>& token_type_ids,
                                             const c10::optional<torch::Tensor>& position_ids,
                                             bool train) {
  torch::Tensor base = input.has_token_ids()
                           ? word_embeddings_->forward(input.token_ids())
                           : input.token_vectors().clone();
  const std::vector<int64_t> shape = input.batch_shape();

  torch::Tensor pos = (position_ids.has_value() && position_ids->defined())
                          ? *position_ids
                          : position_ids_for(input);

  torch::Tensor types;
  if (token_type_ids.has_value() && token_type_ids->defined()) {
    types = *token_type_ids;
  } else {
    types = torch::zeros(shape, torch::TensorOptions().dtype(torch::kLong).device(base.device()));
  }

  torch::Tensor h = base + position_embeddings_->forward(pos) + token_type_embeddings_->forward(types);
  h = layer_norm_->forward(h);
  return dropout_->forward(h, train);
}

torch::Tensor RobertaEmbeddingsImpl::forward(const c10::optional<torch::Tensor>& input_ids,
                                             const c10::optional<torch::Tensor>& token_type_ids,
                                             const c10::optional<torch::Tensor>& position_ids,
                                             const c10::optional<torch::Tensor>& inputs_embeds,
                                             bool train) {
  return forward(EmbeddingInput::from_optional(input_ids, inputs_embeds),
                 token_type_ids, position_ids, train);
}

} // namespace roberta
