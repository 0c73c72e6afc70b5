#pragma once

#include <torch/torch.h>

#include <string>

#include "loader/weight_loader.h"

namespace roberta {

// Parameters and buffers of a module saved with torch.jit.save().
class TorchScriptWeightLoader final : public MapWeightLoader {
public:
  explicit TorchScriptWeightLoader(const std::string& path);
};

// A dict of str -> Tensor saved with torch.save(state_dict). Non-tensor
// values (e.g. a stored "_metadata" entry) are ignored.
class StateDictWeightLoader final : public MapWeightLoader {
public:
  explicit StateDictWeightLoader(const std::string& path);
};

} // namespace roberta
