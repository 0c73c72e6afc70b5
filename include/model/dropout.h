#pragma once

#include <torch/torch.h>

#include "core/tensor_utils.h"

namespace roberta {

// Inverted dropout whose mode is chosen by the caller on every forward.
// The module-level train()/eval() flag is not consulted.
class DropoutImpl : public torch::nn::Module {
public:
  explicit DropoutImpl(double p) : p_(p) {
    require(p >= 0.0 && p < 1.0, "Dropout: p must be in [0, 1)");
  }

  torch::Tensor forward(const torch::Tensor& x, bool train) {
    if (!train || p_ == 0.0) return x;
    namespace F = torch::nn::functional;
    return F::dropout(x, F::DropoutFuncOptions().p(p_).training(true));
  }

  double p() const { return p_; }

private:
  double p_;
};

TORCH_MODULE(Dropout);

} // namespace roberta
