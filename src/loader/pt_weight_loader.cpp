#include "loader/pt_weight_loader.h"

#include <torch/script.h>
#include <torch/serialize.h>

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace roberta {
namespace {

static std::vector<char> read_bytes(const std::string& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    throw std::runtime_error("StateDictWeightLoader: cannot open " + path);
  }
  return std::vector<char>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

TorchScriptWeightLoader::TorchScriptWeightLoader(const std::string& path) {
  torch::jit::Module m;
  try {
    m = torch::jit::load(path);
  } catch (const c10::Error&) {
    throw std::runtime_error(
        "TorchScriptWeightLoader: torch::jit::load failed for " + path +
        ". Archives written by torch.save(state_dict) need StateDictWeightLoader.");
  }
  for (const auto& p : m.named_parameters(/*recurse=*/true)) {
    insert(p.name, p.value);
  }
  for (const auto& b : m.named_buffers(/*recurse=*/true)) {
    insert(b.name, b.value);
  }
}

StateDictWeightLoader::StateDictWeightLoader(const std::string& path) {
  c10::IValue iv;
  try {
    iv = torch::pickle_load(read_bytes(path));
  } catch (const c10::Error& e) {
    throw std::runtime_error("StateDictWeightLoader: failed to unpickle " + path + ": " +
                             e.what_without_backtrace());
  }
  if (!iv.isGenericDict()) {
    throw std::runtime_error("StateDictWeightLoader: " + path + " does not hold a dict");
  }
  for (const auto& it : iv.toGenericDict()) {
    if (!it.key().isString()) {
      throw std::runtime_error("StateDictWeightLoader: " + path + " has non-string keys");
    }
    if (!it.value().isTensor()) continue;
    insert(it.key().toStringRef(), it.value().toTensor());
  }
}

} // namespace roberta
