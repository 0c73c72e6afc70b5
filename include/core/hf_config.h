#pragma once

#include <string>

#include "core/config.h"

namespace roberta {

// Reads a Hugging Face config.json. Only top-level scalar fields are used;
// nested objects and arrays (id2label, architectures, ...) are skipped.
// Throws std::runtime_error on malformed JSON or missing embedding sizes.
ModelConfig load_hf_config_json(const std::string& path);

ModelConfig parse_hf_config_json(const std::string& text);

bool try_load_hf_config_json(const std::string& path, ModelConfig* out, std::string* err);

} // namespace roberta
