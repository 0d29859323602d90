#include "core/json_utils.h"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <string_view>

namespace hydra {

namespace {

// spool 行来自外部进程，限制嵌套深度防止递归失控。
constexpr int kMaxDepth = 32;

// 整段文本必须是合法浮点数（不接受前后缀与空串）。
std::optional<double> ParseDouble(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  errno = 0;
  char* end = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size() || errno == ERANGE) {
    return std::nullopt;
  }
  return value;
}

int HexDigit(char ch) {
  if (ch >= '0' && ch <= '9') return ch - '0';
  if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
  if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
  return -1;
}

// 单字符转义；\u 另行处理，非法返回 0。
char SimpleEscape(char esc) {
  switch (esc) {
    case '"': return '"';
    case '\\': return '\\';
    case '/': return '/';
    case 'b': return '\b';
    case 'f': return '\f';
    case 'n': return '\n';
    case 'r': return '\r';
    case 't': return '\t';
    default: return 0;
  }
}

// BMP 码点按 UTF-8 写出；代理对不合并（Python json.dumps 的 ensure_ascii 输出足够）。
void AppendUtf8(unsigned int codepoint, std::string* out) {
  if (codepoint <= 0x7F) {
    out->push_back(static_cast<char>(codepoint));
  } else if (codepoint <= 0x7FF) {
    out->push_back(static_cast<char>(0xC0 | (codepoint >> 6U)));
    out->push_back(static_cast<char>(0x80 | (codepoint & 0x3FU)));
  } else {
    out->push_back(static_cast<char>(0xE0 | (codepoint >> 12U)));
    out->push_back(static_cast<char>(0x80 | ((codepoint >> 6U) & 0x3FU)));
    out->push_back(static_cast<char>(0x80 | (codepoint & 0x3FU)));
  }
}

/// 递归下降解析器；失败时记录首个错误与偏移。
class JsonReader {
 public:
  explicit JsonReader(std::string_view text) : text_(text) {}

  bool ReadDocument(JsonValue* out) {
    SkipSpace();
    if (!ReadValue(out, 0)) {
      return false;
    }
    SkipSpace();
    return pos_ == text_.size() || Error("JSON 尾部存在多余字符");
  }

  const std::string& error() const { return error_; }

 private:
  bool ReadValue(JsonValue* out, int depth) {
    if (depth > kMaxDepth) {
      return Error("JSON 嵌套过深");
    }
    if (AtEnd()) {
      return Error("JSON 意外结束");
    }
    switch (text_[pos_]) {
      case '{':
        return ReadObject(out, depth);
      case '[':
        return ReadArray(out, depth);
      case '"':
        out->type = JsonType::kString;
        return ReadString(&out->string_value);
      case 't':
        out->type = JsonType::kBool;
        out->bool_value = true;
        return Literal("true");
      case 'f':
        out->type = JsonType::kBool;
        out->bool_value = false;
        return Literal("false");
      case 'n':
        out->type = JsonType::kNull;
        return Literal("null");
      default:
        out->type = JsonType::kNumber;
        return ReadNumber(&out->number_value);
    }
  }

  bool ReadObject(JsonValue* out, int depth) {
    ++pos_;
    out->type = JsonType::kObject;
    out->object_value.clear();
    SkipSpace();
    if (Take('}')) {
      return true;
    }
    while (true) {
      std::string key;
      SkipSpace();
      if (AtEnd() || text_[pos_] != '"') {
        return Error("JSON 对象键必须是字符串");
      }
      if (!ReadString(&key)) {
        return false;
      }
      SkipSpace();
      if (!Take(':')) {
        return Error("JSON 对象缺少 ':'");
      }
      SkipSpace();
      if (!ReadValue(&out->object_value[key], depth + 1)) {
        return false;
      }
      SkipSpace();
      if (Take('}')) {
        return true;
      }
      if (!Take(',')) {
        return Error("JSON 对象缺少 ',' 或 '}'");
      }
    }
  }

  bool ReadArray(JsonValue* out, int depth) {
    ++pos_;
    out->type = JsonType::kArray;
    out->array_value.clear();
    SkipSpace();
    if (Take(']')) {
      return true;
    }
    while (true) {
      SkipSpace();
      out->array_value.emplace_back();
      if (!ReadValue(&out->array_value.back(), depth + 1)) {
        return false;
      }
      SkipSpace();
      if (Take(']')) {
        return true;
      }
      if (!Take(',')) {
        return Error("JSON 数组缺少 ',' 或 ']'");
      }
    }
  }

  bool ReadString(std::string* out) {
    ++pos_;
    out->clear();
    while (!AtEnd()) {
      const char ch = text_[pos_++];
      if (ch == '"') {
        return true;
      }
      if (ch != '\\') {
        out->push_back(ch);
        continue;
      }
      if (AtEnd()) {
        break;
      }
      const char esc = text_[pos_++];
      if (esc != 'u') {
        const char decoded = SimpleEscape(esc);
        if (decoded == 0) {
          return Error("JSON 字符串转义字符非法");
        }
        out->push_back(decoded);
        continue;
      }
      if (pos_ + 4 > text_.size()) {
        break;
      }
      unsigned int codepoint = 0;
      for (int i = 0; i < 4; ++i) {
        const int digit = HexDigit(text_[pos_++]);
        if (digit < 0) {
          return Error("JSON unicode 转义非法");
        }
        codepoint = (codepoint << 4U) | static_cast<unsigned int>(digit);
      }
      AppendUtf8(codepoint, out);
    }
    return Error("JSON 字符串未结束");
  }

  bool ReadNumber(double* out) {
    const std::size_t begin = pos_;
    while (!AtEnd() && std::string_view("+-.eE0123456789").find(text_[pos_]) !=
                           std::string_view::npos) {
      ++pos_;
    }
    const auto value = ParseDouble(std::string(text_.substr(begin, pos_ - begin)));
    if (!value.has_value() || !std::isfinite(*value)) {
      pos_ = begin;
      return Error("JSON 数字解析失败");
    }
    *out = *value;
    return true;
  }

  bool Literal(std::string_view word) {
    if (text_.substr(pos_, word.size()) != word) {
      return Error("JSON 字面量非法");
    }
    pos_ += word.size();
    return true;
  }

  bool Take(char ch) {
    if (!AtEnd() && text_[pos_] == ch) {
      ++pos_;
      return true;
    }
    return false;
  }

  void SkipSpace() {
    while (!AtEnd() && (text_[pos_] == ' ' || text_[pos_] == '\t' ||
                        text_[pos_] == '\n' || text_[pos_] == '\r')) {
      ++pos_;
    }
  }

  bool AtEnd() const { return pos_ >= text_.size(); }

  bool Error(const std::string& message) {
    if (error_.empty()) {
      error_ = message + "，offset=" + std::to_string(pos_);
    }
    return false;
  }

  std::string_view text_;
  std::size_t pos_{0};
  std::string error_;
};

}  // namespace

bool ParseJson(const std::string& text,
               JsonValue* out_value,
               std::string* out_error) {
  if (out_value == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_value 为空";
    }
    return false;
  }
  JsonReader reader(text);
  if (!reader.ReadDocument(out_value)) {
    if (out_error != nullptr) {
      *out_error = reader.error();
    }
    return false;
  }
  return true;
}

const JsonValue* JsonObjectField(const JsonValue* value, const std::string& key) {
  if (value == nullptr || value->type != JsonType::kObject) {
    return nullptr;
  }
  const auto it = value->object_value.find(key);
  if (it == value->object_value.end()) {
    return nullptr;
  }
  return &it->second;
}

const JsonValue* JsonArrayAt(const JsonValue* value, std::size_t index) {
  if (value == nullptr || value->type != JsonType::kArray) {
    return nullptr;
  }
  if (index >= value->array_value.size()) {
    return nullptr;
  }
  return &value->array_value[index];
}

const JsonValue* JsonFindPath(const JsonValue* value,
                              const std::vector<std::string>& object_path) {
  const JsonValue* cursor = value;
  for (const auto& key : object_path) {
    cursor = JsonObjectField(cursor, key);
    if (cursor == nullptr) {
      return nullptr;
    }
  }
  return cursor;
}

std::optional<std::string> JsonAsString(const JsonValue* value) {
  if (value == nullptr) {
    return std::nullopt;
  }
  if (value->type == JsonType::kString) {
    return value->string_value;
  }
  if (value->type == JsonType::kNumber) {
    return std::to_string(value->number_value);
  }
  if (value->type == JsonType::kBool) {
    return value->bool_value ? "true" : "false";
  }
  return std::nullopt;
}

std::optional<double> JsonAsNumber(const JsonValue* value) {
  if (value == nullptr) {
    return std::nullopt;
  }
  if (value->type == JsonType::kNumber) {
    return value->number_value;
  }
  if (value->type == JsonType::kString) {
    return ParseDouble(value->string_value);
  }
  return std::nullopt;
}

std::optional<std::int64_t> JsonAsInt64(const JsonValue* value) {
  const auto number = JsonAsNumber(value);
  if (!number.has_value() || !std::isfinite(*number)) {
    return std::nullopt;
  }
  const double rounded = std::round(*number);
  if (std::fabs(rounded - *number) > 1e-6 ||
      std::fabs(rounded) > static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(rounded);
}

std::string JsonEscape(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (const char ch : text) {
    switch (ch) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char buffer[8];
          std::snprintf(buffer, sizeof(buffer), "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out += buffer;
        } else {
          out.push_back(ch);
        }
    }
  }
  return out;
}

void JsonWriter::BeforeValue() {
  if (after_key_) {
    after_key_ = false;
    return;
  }
  if (!first_in_scope_.empty()) {
    if (!first_in_scope_.back()) {
      out_.push_back(',');
    }
    first_in_scope_.back() = false;
  }
}

JsonWriter& JsonWriter::BeginObject() {
  BeforeValue();
  out_.push_back('{');
  first_in_scope_.push_back(true);
  return *this;
}

JsonWriter& JsonWriter::EndObject() {
  out_.push_back('}');
  if (!first_in_scope_.empty()) {
    first_in_scope_.pop_back();
  }
  return *this;
}

JsonWriter& JsonWriter::BeginArray() {
  BeforeValue();
  out_.push_back('[');
  first_in_scope_.push_back(true);
  return *this;
}

JsonWriter& JsonWriter::EndArray() {
  out_.push_back(']');
  if (!first_in_scope_.empty()) {
    first_in_scope_.pop_back();
  }
  return *this;
}

JsonWriter& JsonWriter::Key(std::string_view key) {
  BeforeValue();
  out_ += "\"" + JsonEscape(key) + "\":";
  after_key_ = true;
  return *this;
}

JsonWriter& JsonWriter::String(std::string_view value) {
  BeforeValue();
  out_ += "\"" + JsonEscape(value) + "\"";
  return *this;
}

JsonWriter& JsonWriter::Number(double value) {
  BeforeValue();
  if (!std::isfinite(value)) {
    out_ += "null";
    return *this;
  }
  std::ostringstream oss;
  oss.precision(10);
  oss << value;
  out_ += oss.str();
  return *this;
}

JsonWriter& JsonWriter::Int(std::int64_t value) {
  BeforeValue();
  out_ += std::to_string(value);
  return *this;
}

JsonWriter& JsonWriter::Bool(bool value) {
  BeforeValue();
  out_ += value ? "true" : "false";
  return *this;
}

JsonWriter& JsonWriter::Null() {
  BeforeValue();
  out_ += "null";
  return *this;
}

}  // namespace hydra
