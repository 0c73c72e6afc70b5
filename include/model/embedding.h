#pragma once

#include <c10/util/Optional.h>
#include <torch/torch.h>

#include "core/config.h"
#include "model/dropout.h"
#include "model/embedding_input.h"

namespace roberta {

// Word + position + token-type embeddings, followed by LayerNorm and dropout.
//
// Submodule names match pretrained RoBERTa checkpoints:
//   word_embeddings, position_embeddings, token_type_embeddings, LayerNorm
class RobertaEmbeddingsImpl : public torch::nn::Module {
public:
  explicit RobertaEmbeddingsImpl(const ModelConfig& cfg);

  // token_type_ids, position_ids: [B, T] int64, optional
  // returns: [B, T, D]
  torch::Tensor forward(const EmbeddingInput& input,
                        const c10::optional<torch::Tensor>& token_type_ids,
                        const c10::optional<torch::Tensor>& position_ids,
                        bool train);

  // Throws InputContractError unless exactly one of input_ids / inputs_embeds
  // is given. No table is read before that check.
  torch::Tensor forward(const c10::optional<torch::Tensor>& input_ids,
                        const c10::optional<torch::Tensor>& token_type_ids,
                        const c10::optional<torch::Tensor>& position_ids,
                        const c10::optional<torch::Tensor>& inputs_embeds,
                        bool train);

  torch::Tensor position_ids_for(const EmbeddingInput& input) const;

  torch::nn::Embedding& word_embeddings() { return word_embeddings_; }
  torch::nn::Embedding& position_embeddings() { return position_embeddings_; }
  torch::nn::Embedding& token_type_embeddings() { return token_type_embeddings_; }
  torch::nn::LayerNorm& layer_norm() { return layer_norm_; }

  int64_t padding_idx() const { return padding_idx_; }
  const ModelConfig& cfg() const { return cfg_; }

private:
  ModelConfig cfg_;
  int64_t padding_idx_ = kPaddingIdx;

  torch::nn::Embedding word_embeddings_{nullptr};
  torch::nn::Embedding position_embeddings_{nullptr};
  torch::nn::Embedding token_type_embeddings_{nullptr};
  torch::nn::LayerNorm layer_norm_{nullptr};
  Dropout dropout_{nullptr};
};

TORCH_MODULE(RobertaEmbeddings);

} // namespace roberta
