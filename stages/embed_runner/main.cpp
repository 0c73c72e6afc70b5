// stages/embed_runner/main.cpp
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "core/config.h"
#include "core/hf_config.h"
#include "core/tensor_utils.h"
#include "loader/model_loader.h"
#include "loader/pt_weight_loader.h"
#include "model/embedding.h"

namespace {

static bool has_flag(int argc, char** argv, const char* name) {
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], name) == 0) return true;
  }
  return false;
}

static std::string arg_str(int argc, char** argv, const char* name, const std::string& def) {
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::strcmp(argv[i], name) == 0) return std::string(argv[i + 1]);
  }
  return def;
}

static int64_t arg_i64(int argc, char** argv, const char* name, int64_t def) {
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::strcmp(argv[i], name) == 0) return std::strtoll(argv[i + 1], nullptr, 10);
  }
  return def;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static void usage() {
  std::fprintf(stderr,
               "embed_runner usage:\n"
               "  --hf-config <config.json>          (required)\n"
               "  [--weights <file>]                 state_dict .pt/.bin, or TorchScript with --torchscript\n"
               "  [--torchscript]\n"
               "  [--prefix <key prefix>]            (default roberta.embeddings)\n"
               "  [--non-strict]\n"
               "  [--input-ids <ids.pt>]             tensor [B,T] int64 saved with torch::save\n"
               "  [--seq-len <T>]                    random ids length when no --input-ids (default 8)\n"
               "  [--device <cpu|cuda:N>]            (default cpu)\n"
               "  [--train]                          apply dropout\n"
               "  [--out <out.pt>]\n");
}

} // namespace

int main(int argc, char** argv) {
  if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
    usage();
    return 0;
  }

  const std::string hf_path = arg_str(argc, argv, "--hf-config", "");
  if (hf_path.empty()) {
    std::fprintf(stderr, "error: --hf-config is required\n");
    usage();
    return 2;
  }

  const std::string weights_path = arg_str(argc, argv, "--weights", "");
  const std::string ids_path = arg_str(argc, argv, "--input-ids", "");
  const std::string out_path = arg_str(argc, argv, "--out", "");
  const std::string device_str = arg_str(argc, argv, "--device", "cpu");
  const int64_t seq_len = arg_i64(argc, argv, "--seq-len", 8);
  const bool train = has_flag(argc, argv, "--train");

  roberta::ModelConfig cfg;
  std::string err;
  if (!roberta::try_load_hf_config_json(hf_path, &cfg, &err)) {
    std::fprintf(stderr, "error: %s\n", err.c_str());
    return 2;
  }
  const std::string bad_cfg = roberta::validate_embedding_config(cfg);
  if (!bad_cfg.empty()) {
    std::fprintf(stderr, "error: %s: %s\n", hf_path.c_str(), bad_cfg.c_str());
    return 2;
  }
  std::fprintf(stderr,
               "[embed_runner] cfg: model_type=%s vocab=%lld hidden=%lld max_pos=%lld types=%lld dropout=%.3f\n",
               cfg.model_type.c_str(), (long long)cfg.vocab_size, (long long)cfg.hidden_size,
               (long long)cfg.max_position_embeddings, (long long)cfg.type_vocab_size,
               cfg.hidden_dropout_prob);

  torch::Device device(torch::kCPU);
  try {
    device = roberta::parse_device(device_str);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "error: %s\n", e.what());
    return 2;
  }
  if (device.is_cuda() && !torch::cuda::is_available()) {
    std::fprintf(stderr, "error: CUDA is not available in this build/runtime\n");
    return 2;
  }

  roberta::RobertaEmbeddings emb(cfg);

  if (!weights_path.empty()) {
    roberta::LoadOptions opts;
    opts.strict = !has_flag(argc, argv, "--non-strict");
    opts.prefix = arg_str(argc, argv, "--prefix", opts.prefix);
    roberta::LoadReport rep;
    try {
      if (has_flag(argc, argv, "--torchscript") || ends_with(weights_path, ".ts")) {
        roberta::TorchScriptWeightLoader wl(weights_path);
        roberta::load_embedding_weights(emb, wl, &rep, opts);
      } else {
        roberta::StateDictWeightLoader wl(weights_path);
        roberta::load_embedding_weights(emb, wl, &rep, opts);
      }
    } catch (const std::exception& e) {
      std::fprintf(stderr, "error: %s\n", e.what());
      return 3;
    }
    std::fprintf(stderr, "[embed_runner] weights: loaded=%lld missing=%lld mismatched=%lld\n",
                 (long long)rep.loaded, (long long)rep.missing, (long long)rep.mismatched);
    for (const auto& k : rep.missing_keys) {
      std::fprintf(stderr, "warning: missing '%s'\n", k.c_str());
    }
    for (const auto& k : rep.mismatch_keys) {
      std::fprintf(stderr, "warning: mismatched %s\n", k.c_str());
    }
  }

  emb->to(device);

  torch::Tensor input_ids;
  try {
    if (!ids_path.empty()) {
      torch::load(input_ids, ids_path);
      roberta::require_dtype(input_ids, torch::kLong, "input_ids");
      roberta::require_shape(input_ids, {-1, -1}, "input_ids");
    } else {
      roberta::require(seq_len > 0 && seq_len + roberta::kPaddingIdx < cfg.max_position_embeddings,
                       "--seq-len out of range for max_position_embeddings");
      // Skip the low special-token ids so no generated token collides with padding.
      const int64_t lo = std::min<int64_t>(roberta::kPaddingIdx + 1, cfg.vocab_size - 1);
      input_ids = torch::randint(lo, cfg.vocab_size, {1, seq_len}, torch::dtype(torch::kLong));
    }
  } catch (const std::exception& e) {
    std::fprintf(stderr, "error: %s\n", e.what());
    return 2;
  }
  input_ids = input_ids.to(device);

  torch::NoGradGuard ng;
  torch::Tensor out;
  try {
    out = emb->forward(input_ids, c10::nullopt, c10::nullopt, c10::nullopt, train);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "error: forward failed: %s\n", e.what());
    return 2;
  }

  std::fprintf(stderr, "[embed_runner] input_ids=%s embeddings=%s train=%d\n",
               roberta::shape_str(input_ids).c_str(), roberta::shape_str(out).c_str(), (int)train);

  if (!out_path.empty()) {
    torch::save(out.cpu(), out_path);
    std::fprintf(stderr, "[embed_runner] wrote %s\n", out_path.c_str());
  }
  return 0;
}
