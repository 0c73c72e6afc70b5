#pragma once

#include <string>
#include <unordered_set>
#include <vector>

#include "loader/weight_loader.h"
#include "model/embedding.h"

namespace roberta {

struct LoadReport {
  int64_t loaded = 0;
  int64_t missing = 0;
  int64_t mismatched = 0;
  std::vector<std::string> missing_keys;
  std::vector<std::string> mismatch_keys;
  std::vector<std::string> used_keys;
};

struct LoadOptions {
  bool strict = true;
  // Checkpoint key prefix in front of the registered parameter names.
  std::string prefix = "roberta.embeddings";
};

// Copies "<prefix>.<param name>" into every parameter of emb.
// LayerNorm.gamma / LayerNorm.beta are accepted for LayerNorm.weight / .bias.
// With opts.strict, a missing or mis-shaped tensor throws std::runtime_error
// before any parameter is written; otherwise it is recorded in report, that
// parameter keeps its value and the rest are loaded.
bool load_embedding_weights(RobertaEmbeddings& emb,
                            const WeightLoader& wl,
                            LoadReport* report,
                            const LoadOptions& opts = {});

// Keys present in the loader but never consumed, sorted.
std::vector<std::string> diff_unused_keys(const WeightLoader& wl,
                                          const std::vector<std::string>& used_keys);

} // namespace roberta
