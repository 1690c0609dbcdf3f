#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace deepresearch {
namespace json {

// Forward declaration of implementation
class JsonValueImpl;

// JSON types enum
enum class JsonType { Null, Boolean, Integer, Float, String, Array, Object };

// JSON exception
// Deepest array/object nesting accepted by JsonValue::parse
constexpr int kMaxNestingDepth = 128;

class JsonException : public std::runtime_error {
 public:
  explicit JsonException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * JSON value with value semantics.
 *
 * Wraps an insertion-ordered nlohmann node so that objects serialize their
 * keys in the order they were added. Accessors return copies; mutation goes
 * through set(), push_back() and erase().
 */
class JsonValue {
 public:
  // Constructors
  JsonValue();  // Creates null
  JsonValue(std::nullptr_t);
  JsonValue(bool value);
  JsonValue(int value);
  JsonValue(int64_t value);
  JsonValue(double value);
  JsonValue(const std::string& value);
  JsonValue(const char* value);

  JsonValue(const JsonValue& other);
  JsonValue(JsonValue&& other) noexcept;
  JsonValue& operator=(const JsonValue& other);
  JsonValue& operator=(JsonValue&& other) noexcept;
  ~JsonValue();

  // Type checking
  JsonType type() const;
  bool isNull() const;
  bool isBoolean() const;
  bool isInteger() const;
  bool isFloat() const;
  bool isNumber() const;  // Integer or Float
  bool isString() const;
  bool isArray() const;
  bool isObject() const;
  bool empty() const;

  // Value getters (throw if wrong type)
  bool getBool() const;
  int getInt() const;
  int64_t getInt64() const;
  double getFloat() const;
  std::string getString() const;

  // Safe value getters with defaults
  bool getBool(bool defaultValue) const;
  int getInt(int defaultValue) const;
  int64_t getInt64(int64_t defaultValue) const;
  double getFloat(double defaultValue) const;
  std::string getString(const std::string& defaultValue) const;

  // Array operations
  size_t size() const;  // Array or object size
  JsonValue operator[](size_t index) const;
  void push_back(const JsonValue& value);

  // Object operations
  bool contains(const std::string& key) const;
  // Missing keys yield null
  JsonValue operator[](const std::string& key) const;
  // Throws if not found
  JsonValue at(const std::string& key) const;
  void set(const std::string& key, const JsonValue& value);
  void erase(const std::string& key);
  std::vector<std::string> keys() const;
  std::vector<std::pair<std::string, JsonValue>> items() const;

  bool operator==(const JsonValue& other) const;
  bool operator!=(const JsonValue& other) const { return !(*this == other); }

  // Conversion; pretty output uses a two-space indent
  std::string toString(bool pretty = false) const;

  // Static factory methods
  static JsonValue null();
  static JsonValue array();
  static JsonValue object();
  // Throws JsonException on malformed text, numbers out of range, or
  // nesting deeper than kMaxNestingDepth
  static JsonValue parse(const std::string& json_str);

  friend class JsonValueImpl;

 private:
  std::unique_ptr<JsonValueImpl> impl_;
};

// Convenience builders
class JsonObjectBuilder {
 public:
  JsonObjectBuilder() : value_(JsonValue::object()) {}

  JsonObjectBuilder& add(const std::string& key, const JsonValue& val) {
    value_.set(key, val);
    return *this;
  }

  JsonObjectBuilder& add(const std::string& key, bool val) {
    value_.set(key, JsonValue(val));
    return *this;
  }

  JsonObjectBuilder& add(const std::string& key, int val) {
    value_.set(key, JsonValue(val));
    return *this;
  }

  JsonObjectBuilder& add(const std::string& key, int64_t val) {
    value_.set(key, JsonValue(val));
    return *this;
  }

  JsonObjectBuilder& add(const std::string& key, const std::string& val) {
    value_.set(key, JsonValue(val));
    return *this;
  }

  JsonObjectBuilder& add(const std::string& key, const char* val) {
    value_.set(key, JsonValue(val));
    return *this;
  }

  JsonObjectBuilder& addNull(const std::string& key) {
    value_.set(key, JsonValue::null());
    return *this;
  }

  JsonValue build() const { return value_; }

 private:
  JsonValue value_;
};

class JsonArrayBuilder {
 public:
  JsonArrayBuilder() : value_(JsonValue::array()) {}

  JsonArrayBuilder& add(const JsonValue& val) {
    value_.push_back(val);
    return *this;
  }

  JsonArrayBuilder& add(const std::string& val) {
    value_.push_back(JsonValue(val));
    return *this;
  }

  JsonArrayBuilder& add(const char* val) {
    value_.push_back(JsonValue(val));
    return *this;
  }

  JsonValue build() const { return value_; }

 private:
  JsonValue value_;
};

}  // namespace json
}  // namespace deepresearch
