#include "core/hf_config.h"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace roberta {
namespace {

struct Scalar {
  enum class Kind { Null, Bool, Number, String, Composite };

  Kind kind = Kind::Null;
  bool b = false;
  double n = 0.0;
  std::string s;
};

using ScalarMap = std::unordered_map<std::string, Scalar>;

[[noreturn]] static void fail(const std::string& what, size_t offset) {
  std::ostringstream oss;
  oss << "hf_config: " << what << " at offset " << offset;
  throw std::runtime_error(oss.str());
}

// Reads the top-level object of a JSON document into a flat key -> scalar
// map. Values that are objects or arrays are validated and skipped, and
// recorded as Kind::Composite.
class FlatJsonReader {
public:
  explicit FlatJsonReader(const std::string& src) : src_(src) {}

  ScalarMap read() {
    ScalarMap out;
    skip_ws();
    expect('{');
    skip_ws();
    if (peek() == '}') {
      ++pos_;
    } else {
      while (true) {
        skip_ws();
        if (peek() != '"') fail("expected string key", pos_);
        std::string key = read_string();
        skip_ws();
        expect(':');
        skip_ws();
        out[std::move(key)] = read_value();
        skip_ws();
        const char c = next();
        if (c == '}') break;
        if (c != ',') fail("expected ',' or '}'", pos_ - 1);
      }
    }
    skip_ws();
    if (pos_ != src_.size()) fail("trailing characters after root object", pos_);
    return out;
  }

private:
  char peek() const { return pos_ < src_.size() ? src_[pos_] : '\0'; }

  char next() {
    if (pos_ >= src_.size()) fail("unexpected end of input", pos_);
    return src_[pos_++];
  }

  void expect(char c) {
    if (next() != c) fail(std::string("expected '") + c + "'", pos_ - 1);
  }

  void skip_ws() {
    while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) ++pos_;
  }

  bool consume_literal(const char* lit) {
    const std::string l(lit);
    if (src_.compare(pos_, l.size(), l) != 0) return false;
    pos_ += l.size();
    return true;
  }

  Scalar read_value() {
    Scalar v;
    const char c = peek();
    if (c == '{' || c == '[') {
      skip_composite();
      v.kind = Scalar::Kind::Composite;
    } else if (c == '"') {
      v.kind = Scalar::Kind::String;
      v.s = read_string();
    } else if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
      v.kind = Scalar::Kind::Number;
      v.n = read_number();
    } else if (consume_literal("true")) {
      v.kind = Scalar::Kind::Bool;
      v.b = true;
    } else if (consume_literal("false")) {
      v.kind = Scalar::Kind::Bool;
    } else if (!consume_literal("null")) {
      fail("invalid value", pos_);
    }
    return v;
  }

  // Walks a nested object or array, tracking bracket depth and strings.
  void skip_composite() {
    std::string stack;
    do {
      const char c = next();
      if (c == '"') {
        --pos_;
        (void)read_string();
      } else if (c == '{' || c == '[') {
        stack.push_back(c == '{' ? '}' : ']');
      } else if (c == '}' || c == ']') {
        if (stack.empty() || stack.back() != c) fail("mismatched bracket", pos_ - 1);
        stack.pop_back();
      }
    } while (!stack.empty());
  }

  std::string read_string() {
    expect('"');
    std::string out;
    while (true) {
      const char c = next();
      if (c == '"') return out;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      const char e = next();
      switch (e) {
        case '"':
        case '\\':
        case '/': out.push_back(e); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
          if (pos_ + 4 > src_.size()) fail("truncated unicode escape", pos_);
          const std::string hex = src_.substr(pos_, 4);
          char* endp = nullptr;
          const unsigned long cp = std::strtoul(hex.c_str(), &endp, 16);
          if (endp != hex.c_str() + 4) fail("bad unicode escape", pos_);
          pos_ += 4;
          append_utf8(out, static_cast<uint32_t>(cp));
          break;
        }
        default:
          fail("unsupported escape sequence", pos_ - 1);
      }
    }
  }

  static void append_utf8(std::string& out, uint32_t code) {
    if (code <= 0x7F) {
      out.push_back(static_cast<char>(code));
    } else if (code <= 0x7FF) {
      out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
      out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
      // A 4-digit escape never exceeds 0xFFFF.
      out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
      out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
  }

  double read_number() {
    const size_t start = pos_;
    if (peek() == '-') ++pos_;
    while (pos_ < src_.size()) {
      const char c = src_[pos_];
      if (std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == 'e' || c == 'E' ||
          c == '+' || c == '-') {
        ++pos_;
      } else {
        break;
      }
    }
    const std::string text = src_.substr(start, pos_ - start);
    char* endp = nullptr;
    const double v = std::strtod(text.c_str(), &endp);
    if (text.empty() || endp != text.c_str() + text.size()) fail("bad number '" + text + "'", start);
    return v;
  }

  const std::string& src_;
  size_t pos_ = 0;
};

static std::string read_text_file(const std::string& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    throw std::runtime_error("hf_config: failed to open file: " + path);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static const Scalar* find(const ScalarMap& m, const char* key) {
  auto it = m.find(key);
  return it == m.end() ? nullptr : &it->second;
}

static void read_int(const ScalarMap& m, const char* key, int64_t* out) {
  const Scalar* v = find(m, key);
  if (!v || v->kind == Scalar::Kind::Null) return;
  if (v->kind != Scalar::Kind::Number || std::floor(v->n) != v->n) {
    throw std::runtime_error(std::string("hf_config: '") + key + "' must be an integer");
  }
  // [-2^63, 2^63) is exactly the range a double converts to int64_t without overflow.
  if (v->n < -9223372036854775808.0 || v->n >= 9223372036854775808.0) {
    throw std::runtime_error(std::string("hf_config: '") + key + "' out of range");
  }
  *out = static_cast<int64_t>(v->n);
}

static void read_double(const ScalarMap& m, const char* key, double* out) {
  const Scalar* v = find(m, key);
  if (!v || v->kind == Scalar::Kind::Null) return;
  if (v->kind != Scalar::Kind::Number) {
    throw std::runtime_error(std::string("hf_config: '") + key + "' must be a number");
  }
  *out = v->n;
}

static void read_bool(const ScalarMap& m, const char* key, bool* out) {
  const Scalar* v = find(m, key);
  if (!v || v->kind == Scalar::Kind::Null) return;
  if (v->kind != Scalar::Kind::Bool) {
    throw std::runtime_error(std::string("hf_config: '") + key + "' must be a boolean");
  }
  *out = v->b;
}

static void read_str(const ScalarMap& m, const char* key, std::string* out) {
  const Scalar* v = find(m, key);
  if (v && v->kind == Scalar::Kind::String) *out = v->s;
}

static void require_positive(const ScalarMap& m, const char* key, int64_t value) {
  if (!find(m, key)) {
    throw std::runtime_error(std::string("hf_config: missing ") + key);
  }
  if (value <= 0) {
    throw std::runtime_error(std::string("hf_config: invalid ") + key);
  }
}

} // namespace

ModelConfig parse_hf_config_json(const std::string& text) {
  const ScalarMap m = FlatJsonReader(text).read();

  ModelConfig cfg;
  read_str(m, "model_type", &cfg.model_type);

  read_int(m, "vocab_size", &cfg.vocab_size);
  read_int(m, "hidden_size", &cfg.hidden_size);
  read_int(m, "max_position_embeddings", &cfg.max_position_embeddings);
  read_int(m, "type_vocab_size", &cfg.type_vocab_size);
  read_int(m, "pad_token_id", &cfg.pad_token_id);

  read_int(m, "num_hidden_layers", &cfg.num_hidden_layers);
  read_int(m, "num_attention_heads", &cfg.num_attention_heads);
  read_int(m, "intermediate_size", &cfg.intermediate_size);
  read_str(m, "hidden_act", &cfg.hidden_act);
  read_double(m, "initializer_range", &cfg.initializer_range);

  read_double(m, "hidden_dropout_prob", &cfg.hidden_dropout_prob);
  read_double(m, "attention_probs_dropout_prob", &cfg.attention_probs_dropout_prob);

  read_bool(m, "output_attentions", &cfg.output_attentions);
  read_bool(m, "output_hidden_states", &cfg.output_hidden_states);
  read_bool(m, "is_decoder", &cfg.is_decoder);

  require_positive(m, "vocab_size", cfg.vocab_size);
  require_positive(m, "hidden_size", cfg.hidden_size);
  require_positive(m, "max_position_embeddings", cfg.max_position_embeddings);
  require_positive(m, "type_vocab_size", cfg.type_vocab_size);

  // The embedding block hard-wires padding index 1.
  if (cfg.pad_token_id != kPaddingIdx) {
    throw std::runtime_error("hf_config: pad_token_id must be " + std::to_string(kPaddingIdx) +
                             ", got " + std::to_string(cfg.pad_token_id));
  }
  return cfg;
}

bool try_load_hf_config_json(const std::string& path, ModelConfig* out, std::string* err) {
  if (!out) {
    if (err) *err = "hf_config: output pointer is null";
    return false;
  }

  try {
    *out = parse_hf_config_json(read_text_file(path));
    return true;
  } catch (const std::exception& e) {
    if (err) *err = e.what();
    return false;
  }
}

ModelConfig load_hf_config_json(const std::string& path) {
  ModelConfig cfg;
  std::string err;
  if (!try_load_hf_config_json(path, &cfg, &err)) {
    throw std::runtime_error(err.empty() ? "hf_config: failed to load" : err);
  }
  return cfg;
}

} // namespace roberta
