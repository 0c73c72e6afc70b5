#pragma once

#include <torch/torch.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace roberta {

inline void require(bool cond, const std::string& msg) {
  if (!cond) throw std::runtime_error(msg);
}

inline void require_dtype(const torch::Tensor& t, c10::ScalarType dt, const std::string& name) {
  require(t.defined(), name + " is undefined");
  require(t.scalar_type() == dt,
          name + " has unexpected dtype " + std::string(c10::toString(t.scalar_type())));
}

inline std::string shape_str(const torch::Tensor& t) {
  if (!t.defined()) return "<undefined>";
  std::string s = "[";
  for (int64_t i = 0; i < t.dim(); ++i) {
    s += std::to_string(t.size(i));
    if (i + 1 < t.dim()) s += ", ";
  }
  s += "]";
  return s;
}

// A negative entry in expected matches any extent.
inline void require_shape(const torch::Tensor& t,
                          const std::vector<int64_t>& expected,
                          const std::string& name) {
  require(t.defined(), name + " is undefined");
  require((int64_t)expected.size() == t.dim(),
          name + " dim mismatch: got " + shape_str(t));
  for (size_t i = 0; i < expected.size(); ++i) {
    if (expected[i] >= 0) {
      require(t.size((int64_t)i) == expected[i],
              name + " shape mismatch at dim " + std::to_string(i) +
                  ": got " + std::to_string(t.size((int64_t)i)) +
                  ", expected " + std::to_string(expected[i]));
    }
  }
}

inline torch::Device parse_device(const std::string& s) {
  try {
    return torch::Device(s);
  } catch (const c10::Error&) {
    throw std::runtime_error("invalid device string: '" + s + "'");
  }
}

} // namespace roberta
