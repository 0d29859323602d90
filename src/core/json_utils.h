#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hydra {

/// 轻量 JSON AST 节点类型（交易所回报、信号 spool 行）。
enum class JsonType {
  kNull,
  kBool,
  kNumber,
  kString,
  kArray,
  kObject,
};

/// 轻量 JSON 值表示（对象/数组为递归结构）。
struct JsonValue {
  JsonType type{JsonType::kNull};
  bool bool_value{false};
  double number_value{0.0};
  std::string string_value;
  std::vector<JsonValue> array_value;
  std::unordered_map<std::string, JsonValue> object_value;
};

/**
 * @brief JSON 解析入口
 *
 * @param text 原始 JSON 文本
 * @param out_value 解析结果
 * @param out_error 失败原因（可选输出，含 offset）
 * @return false 解析失败
 */
bool ParseJson(const std::string& text,
               JsonValue* out_value,
               std::string* out_error);

/// 获取对象字段；类型不符或字段不存在返回 `nullptr`。
const JsonValue* JsonObjectField(const JsonValue* value, const std::string& key);

/// 获取数组元素；越界返回 `nullptr`。
const JsonValue* JsonArrayAt(const JsonValue* value, std::size_t index);

/// 按对象路径逐段查找子节点；任意一段缺失返回 `nullptr`。
const JsonValue* JsonFindPath(const JsonValue* value,
                              const std::vector<std::string>& object_path);

/// 尝试将节点解释为字符串；失败返回 `std::nullopt`。
std::optional<std::string> JsonAsString(const JsonValue* value);
/// 数值节点或数值字符串（交易所常用 "0.0001" 形式）。
std::optional<double> JsonAsNumber(const JsonValue* value);
/// 整数毫秒时间戳；非整数返回 `std::nullopt`。
std::optional<std::int64_t> JsonAsInt64(const JsonValue* value);

/// 字符串转义（不含两侧引号）。
std::string JsonEscape(std::string_view text);

/**
 * @brief 顺序式 JSON 写入器
 *
 * 用于快照接口与通知负载的序列化。调用方负责 Begin/End 成对，
 * 对象内先 `Key` 再写值；逗号由写入器自动补齐。
 */
class JsonWriter {
 public:
  JsonWriter& BeginObject();
  JsonWriter& EndObject();
  JsonWriter& BeginArray();
  JsonWriter& EndArray();
  JsonWriter& Key(std::string_view key);
  JsonWriter& String(std::string_view value);
  JsonWriter& Number(double value);
  JsonWriter& Int(std::int64_t value);
  JsonWriter& Bool(bool value);
  JsonWriter& Null();

  const std::string& str() const { return out_; }

 private:
  void BeforeValue();

  std::string out_;
  std::vector<bool> first_in_scope_;
  bool after_key_{false};
};

}  // namespace hydra
