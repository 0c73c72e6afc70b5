#pragma once

#include <cstdint>
#include <string>

namespace roberta {

// Padding token id shared by the word and position tables.
constexpr int64_t kPaddingIdx = 1;

// Fixed LayerNorm epsilon of the embedding block.
constexpr double kLayerNormEps = 1e-12;

struct ModelConfig {
  // Model identity
  std::string model_type = "roberta";

  // Embedding tables
  int64_t vocab_size = 0;
  int64_t hidden_size = 0;
  int64_t max_position_embeddings = 0;
  int64_t type_vocab_size = 0;
  int64_t pad_token_id = kPaddingIdx;

  // Encoder stack (consumed outside the embedding block)
  int64_t num_hidden_layers = 0;
  int64_t num_attention_heads = 0;
  int64_t intermediate_size = 0;
  std::string hidden_act = "gelu";
  double initializer_range = 0.02;

  // Regularization
  double hidden_dropout_prob = 0.1;
  double attention_probs_dropout_prob = 0.1;

  // Output flags
  bool output_attentions = false;
  bool output_hidden_states = false;
  bool is_decoder = false;
};

// Returns an empty string when cfg can build an embedding block, otherwise
// a description of the first offending field.
inline std::string validate_embedding_config(const ModelConfig& c) {
  if (c.vocab_size <= 0) return "vocab_size must be > 0";
  if (c.hidden_size <= 0) return "hidden_size must be > 0";
  if (c.max_position_embeddings <= kPaddingIdx + 1) {
    return "max_position_embeddings must leave room past the padding index";
  }
  if (c.type_vocab_size <= 0) return "type_vocab_size must be > 0";
  if (c.hidden_dropout_prob < 0.0 || c.hidden_dropout_prob >= 1.0) {
    return "hidden_dropout_prob must be in [0, 1)";
  }
  return std::string();
}

} // namespace roberta
