#pragma once

#include <torch/torch.h>
#include <unordered_map>
#include <string>
#include <vector>
#include <stdexcept>

namespace roberta {

// WeightLoader looks tensors up by checkpoint key, e.g.
// "roberta.embeddings.word_embeddings.weight". Tensors may live on any
// device and in any floating dtype; the model loader converts on assignment.
class WeightLoader {
public:
  virtual ~WeightLoader() = default;

  virtual bool exists(const std::string& key) const = 0;
  virtual torch::Tensor get(const std::string& key) const = 0;
  virtual std::vector<std::string> list_keys() const = 0;
};

// In-memory loader; also the storage behind the file-backed loaders.
class MapWeightLoader : public WeightLoader {
public:
  MapWeightLoader() = default;

  void insert(const std::string& key, const torch::Tensor& t) {
    tensors_[key] = t;
  }

  bool exists(const std::string& key) const override {
    return tensors_.find(key) != tensors_.end();
  }

  torch::Tensor get(const std::string& key) const override {
    auto it = tensors_.find(key);
    if (it == tensors_.end()) {
      throw std::runtime_error("WeightLoader: missing key: " + key);
    }
    return it->second;
  }

  std::vector<std::string> list_keys() const override {
    std::vector<std::string> ks;
    ks.reserve(tensors_.size());
    for (const auto& kv : tensors_) ks.push_back(kv.first);
    return ks;
  }

  size_t size() const { return tensors_.size(); }

private:
  std::unordered_map<std::string, torch::Tensor> tensors_;
};

} // namespace roberta
