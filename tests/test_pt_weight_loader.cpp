#include "mini_test.h"

#include <torch/script.h>
#include <torch/serialize.h>
#include <torch/torch.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "loader/pt_weight_loader.h"

static std::string temp_path(const std::string& name) {
  return (std::filesystem::temp_directory_path() / name).string();
}

static std::string write_pickle(const std::string& name, const c10::IValue& iv) {
  const std::string path = temp_path(name);
  const std::vector<char> bytes = torch::pickle_save(iv);
  std::ofstream os(path, std::ios::binary | std::ios::trunc);
  os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  return path;
}

static bool has_key(const std::vector<std::string>& keys, const std::string& k) {
  return std::find(keys.begin(), keys.end(), k) != keys.end();
}

static int state_dict_round_trip() {
  c10::Dict<std::string, torch::Tensor> sd;
  torch::Tensor word = torch::randn({6, 4});
  torch::Tensor bias = torch::arange(4, torch::dtype(torch::kFloat64));
  sd.insert("roberta.embeddings.word_embeddings.weight", word);
  sd.insert("roberta.embeddings.LayerNorm.bias", bias);
  const std::string path = write_pickle("roberta_embed_test_state_dict.pt", c10::IValue(sd));

  roberta::StateDictWeightLoader wl(path);
  CHECK_EQ((int64_t)wl.size(), (int64_t)2);
  CHECK_TRUE(wl.exists("roberta.embeddings.word_embeddings.weight"));
  CHECK_TRUE(torch::equal(wl.get("roberta.embeddings.word_embeddings.weight"), word));
  CHECK_EQ((int64_t)wl.get("roberta.embeddings.LayerNorm.bias").scalar_type(), (int64_t)torch::kFloat64);
  CHECK_TRUE(torch::equal(wl.get("roberta.embeddings.LayerNorm.bias"), bias));
  std::filesystem::remove(path);
  return 0;
}

static int state_dict_skips_non_tensor_values() {
  c10::impl::GenericDict sd(c10::StringType::get(), c10::AnyType::get());
  sd.insert(c10::IValue("roberta.embeddings.LayerNorm.weight"), c10::IValue(torch::ones({4})));
  sd.insert(c10::IValue("_metadata"), c10::IValue(std::string("version 1")));
  sd.insert(c10::IValue("num_batches_tracked"), c10::IValue(int64_t(7)));
  const std::string path = write_pickle("roberta_embed_test_mixed.pt", c10::IValue(sd));

  roberta::StateDictWeightLoader wl(path);
  CHECK_EQ((int64_t)wl.size(), (int64_t)1);
  CHECK_TRUE(wl.exists("roberta.embeddings.LayerNorm.weight"));
  CHECK_TRUE(!wl.exists("_metadata"));
  CHECK_TRUE(!wl.exists("num_batches_tracked"));
  std::filesystem::remove(path);
  return 0;
}

static int state_dict_rejects_bad_payloads() {
  const std::string tensor_path = write_pickle("roberta_embed_test_tensor.pt", c10::IValue(torch::zeros({3})));
  CHECK_THROWS_AS(roberta::StateDictWeightLoader(tensor_path), std::runtime_error,
                  CHECK_TRUE(std::string(ex.what()).find("does not hold a dict") != std::string::npos));
  std::filesystem::remove(tensor_path);

  c10::Dict<int64_t, torch::Tensor> by_index;
  by_index.insert(0, torch::zeros({2}));
  const std::string int_keys_path = write_pickle("roberta_embed_test_int_keys.pt", c10::IValue(by_index));
  CHECK_THROWS_AS(roberta::StateDictWeightLoader(int_keys_path), std::runtime_error,
                  CHECK_TRUE(std::string(ex.what()).find("non-string keys") != std::string::npos));
  std::filesystem::remove(int_keys_path);

  CHECK_THROWS_AS(roberta::StateDictWeightLoader("/nonexistent/roberta/weights.pt"), std::runtime_error,
                  CHECK_TRUE(std::string(ex.what()).find("cannot open") != std::string::npos));

  const std::string junk_path = temp_path("roberta_embed_test_junk.pt");
  {
    std::ofstream os(junk_path, std::ios::binary | std::ios::trunc);
    os << "not a pickle";
  }
  CHECK_THROWS_AS(roberta::StateDictWeightLoader(junk_path), std::runtime_error, (void)ex);
  std::filesystem::remove(junk_path);
  return 0;
}

static int torchscript_named_parameters() {
  torch::jit::Module embeddings("embeddings");
  torch::Tensor word = torch::randn({6, 4});
  embeddings.register_parameter("weight", word, /*is_buffer=*/false);

  torch::jit::Module root("root");
  torch::Tensor scale = torch::full({4}, 0.5);
  torch::Tensor ids = torch::arange(8, torch::dtype(torch::kLong));
  root.register_parameter("scale", scale, /*is_buffer=*/false);
  root.register_buffer("position_ids", ids);
  root.register_module("embeddings", embeddings);

  const std::string path = temp_path("roberta_embed_test_module.ts");
  root.save(path);

  roberta::TorchScriptWeightLoader wl(path);
  const auto keys = wl.list_keys();
  CHECK_EQ((int64_t)keys.size(), (int64_t)3);
  CHECK_TRUE(has_key(keys, "scale"));
  CHECK_TRUE(has_key(keys, "embeddings.weight"));
  CHECK_TRUE(has_key(keys, "position_ids"));
  CHECK_TRUE(torch::equal(wl.get("embeddings.weight"), word));
  CHECK_TRUE(torch::equal(wl.get("position_ids"), ids));
  std::filesystem::remove(path);

  const std::string junk_path = temp_path("roberta_embed_test_not_ts.ts");
  {
    std::ofstream os(junk_path, std::ios::binary | std::ios::trunc);
    os << "not an archive";
  }
  CHECK_THROWS_AS(roberta::TorchScriptWeightLoader(junk_path), std::runtime_error,
                  CHECK_TRUE(std::string(ex.what()).find("StateDictWeightLoader") != std::string::npos));
  std::filesystem::remove(junk_path);
  return 0;
}

int main() {
  RUN_CASE(state_dict_round_trip);
  RUN_CASE(state_dict_skips_non_tensor_values);
  RUN_CASE(state_dict_rejects_bad_payloads);
  RUN_CASE(torchscript_named_parameters);
  return 0;
}
