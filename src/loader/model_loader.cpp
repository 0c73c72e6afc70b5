#include "loader/model_loader.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "core/tensor_utils.h"

namespace roberta {
namespace {

static void record_used(LoadReport* rep, const std::string& key) {
  if (rep) rep->used_keys.push_back(key);
}

// Older TF-converted checkpoints name the LayerNorm affine parameters
// gamma/beta.
static std::vector<std::string> key_candidates(const std::string& prefix, const std::string& name) {
  const std::string base = prefix.empty() ? name : prefix + "." + name;
  std::vector<std::string> keys{base};
  const auto dot = name.rfind('.');
  if (dot != std::string::npos) {
    const std::string owner = name.substr(0, dot);
    const std::string leaf = name.substr(dot + 1);
    const std::string owner_key = prefix.empty() ? owner : prefix + "." + owner;
    if (owner == "LayerNorm" && leaf == "weight") keys.push_back(owner_key + ".gamma");
    if (owner == "LayerNorm" && leaf == "bias") keys.push_back(owner_key + ".beta");
  }
  return keys;
}

// Returns the checkpoint tensor for one parameter, converted to its dtype and
// device, or an undefined tensor when the key is missing or the shape differs.
// The first such problem is kept in *err.
static torch::Tensor resolve_param(const WeightLoader& wl,
                                   const std::vector<std::string>& keys,
                                   const torch::Tensor& param,
                                   LoadReport* rep,
                                   std::string* err) {
  const std::string* found = nullptr;
  for (const auto& k : keys) {
    if (wl.exists(k)) {
      found = &k;
      break;
    }
  }
  if (!found) {
    if (rep) {
      rep->missing++;
      rep->missing_keys.push_back(keys.front());
    }
    if (err->empty()) *err = "load: missing " + keys.front();
    return torch::Tensor();
  }

  const std::string& key = *found;
  torch::Tensor src = wl.get(key);
  record_used(rep, key);

  if (src.sizes() != param.sizes()) {
    if (rep) {
      rep->mismatched++;
      std::ostringstream oss;
      oss << key << ": expected " << shape_str(param) << " got " << shape_str(src);
      rep->mismatch_keys.push_back(oss.str());
    }
    if (err->empty()) *err = "load: shape mismatch for " + key;
    return torch::Tensor();
  }

  return src.to(param.device(), param.scalar_type()).contiguous();
}

} // namespace

bool load_embedding_weights(RobertaEmbeddings& emb,
                            const WeightLoader& wl,
                            LoadReport* rep,
                            const LoadOptions& opts) {
  require((bool)emb, "load_embedding_weights: module is null");

  std::vector<std::pair<torch::Tensor, torch::Tensor>> staged;
  std::string first_error;
  for (auto& p : emb->named_parameters(/*recurse=*/true)) {
    torch::Tensor src = resolve_param(wl, key_candidates(opts.prefix, p.key()), p.value(), rep, &first_error);
    if (src.defined()) staged.emplace_back(p.value(), std::move(src));
  }

  // Every key and shape is checked before the first copy, so a strict
  // failure leaves the module untouched.
  if (opts.strict && !first_error.empty()) {
    throw std::runtime_error(first_error);
  }

  torch::NoGradGuard no_grad;
  for (auto& s : staged) {
    s.first.copy_(s.second);
    if (rep) rep->loaded++;
  }
  return first_error.empty();
}

std::vector<std::string> diff_unused_keys(const WeightLoader& wl,
                                          const std::vector<std::string>& used_keys) {
  std::unordered_set<std::string> used(used_keys.begin(), used_keys.end());
  std::vector<std::string> extra;
  for (const auto& k : wl.list_keys()) {
    if (used.find(k) == used.end()) extra.push_back(k);
  }
  std::sort(extra.begin(), extra.end());
  return extra;
}

} // namespace roberta
