#include "deepresearch/json/json_bridge.h"

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace deepresearch {
namespace json {

// Ordered so that object keys serialize in insertion order
using Node = nlohmann::ordered_json;

// Implementation class that wraps nlohmann::ordered_json
class JsonValueImpl {
 public:
  Node json_;

  JsonValueImpl() : json_(nullptr) {}
  explicit JsonValueImpl(const Node& j) : json_(j) {}
  explicit JsonValueImpl(Node&& j) : json_(std::move(j)) {}

  static JsonValue wrap(const Node& j) {
    JsonValue val;
    val.impl_->json_ = j;
    return val;
  }
};

namespace {

const char* typeName(const Node& j) { return j.type_name(); }

}  // namespace

// JsonValue constructors
JsonValue::JsonValue() : impl_(std::make_unique<JsonValueImpl>()) {}

JsonValue::JsonValue(std::nullptr_t)
    : impl_(std::make_unique<JsonValueImpl>()) {}

JsonValue::JsonValue(bool value)
    : impl_(std::make_unique<JsonValueImpl>(Node(value))) {}

JsonValue::JsonValue(int value)
    : impl_(std::make_unique<JsonValueImpl>(Node(value))) {}

JsonValue::JsonValue(int64_t value)
    : impl_(std::make_unique<JsonValueImpl>(Node(value))) {}

JsonValue::JsonValue(double value)
    : impl_(std::make_unique<JsonValueImpl>(Node(value))) {}

JsonValue::JsonValue(const std::string& value)
    : impl_(std::make_unique<JsonValueImpl>(Node(value))) {}

JsonValue::JsonValue(const char* value)
    : impl_(std::make_unique<JsonValueImpl>(Node(std::string(value)))) {}

JsonValue::JsonValue(const JsonValue& other)
    : impl_(std::make_unique<JsonValueImpl>(other.impl_->json_)) {}

// A moved-from value may only be assigned to or destroyed
JsonValue::JsonValue(JsonValue&& other) noexcept = default;

JsonValue& JsonValue::operator=(const JsonValue& other) {
  if (this != &other) {
    if (impl_) {
      impl_->json_ = other.impl_->json_;
    } else {
      impl_ = std::make_unique<JsonValueImpl>(other.impl_->json_);
    }
  }
  return *this;
}

JsonValue& JsonValue::operator=(JsonValue&& other) noexcept = default;

JsonValue::~JsonValue() = default;

// Type checking
JsonType JsonValue::type() const {
  const auto& j = impl_->json_;
  if (j.is_boolean())
    return JsonType::Boolean;
  if (j.is_number_integer())
    return JsonType::Integer;
  if (j.is_number_float())
    return JsonType::Float;
  if (j.is_string())
    return JsonType::String;
  if (j.is_array())
    return JsonType::Array;
  if (j.is_object())
    return JsonType::Object;
  return JsonType::Null;
}

bool JsonValue::isNull() const { return impl_->json_.is_null(); }
bool JsonValue::isBoolean() const { return impl_->json_.is_boolean(); }
bool JsonValue::isInteger() const { return impl_->json_.is_number_integer(); }
bool JsonValue::isFloat() const { return impl_->json_.is_number_float(); }
bool JsonValue::isNumber() const { return impl_->json_.is_number(); }
bool JsonValue::isString() const { return impl_->json_.is_string(); }
bool JsonValue::isArray() const { return impl_->json_.is_array(); }
bool JsonValue::isObject() const { return impl_->json_.is_object(); }

bool JsonValue::empty() const {
  const auto& j = impl_->json_;
  if (j.is_null())
    return true;
  if (j.is_string())
    return j.get_ref<const std::string&>().empty();
  if (j.is_array() || j.is_object())
    return j.empty();
  // Numbers and booleans are not considered empty
  return false;
}

// Value getters
bool JsonValue::getBool() const {
  if (!isBoolean()) {
    throw JsonException(std::string("Expected boolean, got ") +
                        typeName(impl_->json_));
  }
  return impl_->json_.get<bool>();
}

int JsonValue::getInt() const {
  if (!isNumber()) {
    throw JsonException(std::string("Expected number, got ") +
                        typeName(impl_->json_));
  }
  return impl_->json_.get<int>();
}

int64_t JsonValue::getInt64() const {
  if (!isNumber()) {
    throw JsonException(std::string("Expected number, got ") +
                        typeName(impl_->json_));
  }
  return impl_->json_.get<int64_t>();
}

double JsonValue::getFloat() const {
  if (!isNumber()) {
    throw JsonException(std::string("Expected number, got ") +
                        typeName(impl_->json_));
  }
  return impl_->json_.get<double>();
}

std::string JsonValue::getString() const {
  if (!isString()) {
    throw JsonException(std::string("Expected string, got ") +
                        typeName(impl_->json_));
  }
  return impl_->json_.get<std::string>();
}

// Safe getters with defaults
bool JsonValue::getBool(bool defaultValue) const {
  return isBoolean() ? impl_->json_.get<bool>() : defaultValue;
}

int JsonValue::getInt(int defaultValue) const {
  return isNumber() ? impl_->json_.get<int>() : defaultValue;
}

int64_t JsonValue::getInt64(int64_t defaultValue) const {
  return isNumber() ? impl_->json_.get<int64_t>() : defaultValue;
}

double JsonValue::getFloat(double defaultValue) const {
  return isNumber() ? impl_->json_.get<double>() : defaultValue;
}

std::string JsonValue::getString(const std::string& defaultValue) const {
  return isString() ? impl_->json_.get<std::string>() : defaultValue;
}

// Array operations
size_t JsonValue::size() const {
  if (!isArray() && !isObject()) {
    throw JsonException("Value is not an array or object");
  }
  return impl_->json_.size();
}

JsonValue JsonValue::operator[](size_t index) const {
  if (!isArray()) {
    throw JsonException("Value is not an array");
  }
  if (index >= impl_->json_.size()) {
    throw JsonException("Array index out of range: " + std::to_string(index));
  }
  return JsonValueImpl::wrap(impl_->json_[index]);
}

void JsonValue::push_back(const JsonValue& value) {
  if (isNull()) {
    impl_->json_ = Node::array();
  }
  if (!isArray()) {
    throw JsonException("Value is not an array");
  }
  impl_->json_.push_back(value.impl_->json_);
}

// Object operations
bool JsonValue::contains(const std::string& key) const {
  if (!isObject()) {
    return false;
  }
  return impl_->json_.contains(key);
}

JsonValue JsonValue::operator[](const std::string& key) const {
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  auto it = impl_->json_.find(key);
  if (it == impl_->json_.end()) {
    return JsonValue();
  }
  return JsonValueImpl::wrap(*it);
}

JsonValue JsonValue::at(const std::string& key) const {
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  auto it = impl_->json_.find(key);
  if (it == impl_->json_.end()) {
    throw JsonException("Key not found: " + key);
  }
  return JsonValueImpl::wrap(*it);
}

void JsonValue::set(const std::string& key, const JsonValue& value) {
  if (!isObject()) {
    // Convert to object if null
    if (isNull()) {
      impl_->json_ = Node::object();
    } else {
      throw JsonException("Value is not an object");
    }
  }
  impl_->json_[key] = value.impl_->json_;
}

void JsonValue::erase(const std::string& key) {
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  impl_->json_.erase(key);
}

std::vector<std::string> JsonValue::keys() const {
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  std::vector<std::string> result;
  for (auto& kv : impl_->json_.items()) {
    result.push_back(kv.key());
  }
  return result;
}

std::vector<std::pair<std::string, JsonValue>> JsonValue::items() const {
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  std::vector<std::pair<std::string, JsonValue>> result;
  for (auto& kv : impl_->json_.items()) {
    result.emplace_back(kv.key(), JsonValueImpl::wrap(kv.value()));
  }
  return result;
}

bool JsonValue::operator==(const JsonValue& other) const {
  return impl_->json_ == other.impl_->json_;
}

// Conversion
std::string JsonValue::toString(bool pretty) const {
  // Invalid UTF-8 in caller-supplied strings is replaced instead of throwing
  return impl_->json_.dump(pretty ? 2 : -1, ' ', false,
                           Node::error_handler_t::replace);
}

// Static factory methods
JsonValue JsonValue::null() { return JsonValue(nullptr); }

JsonValue JsonValue::array() { return JsonValueImpl::wrap(Node::array()); }

JsonValue JsonValue::object() { return JsonValueImpl::wrap(Node::object()); }

JsonValue JsonValue::parse(const std::string& json_str) {
  // depth counts the containers already open around the one being started
  Node::parser_callback_t limit_depth = [](int depth,
                                           Node::parse_event_t event, Node&) {
    if ((event == Node::parse_event_t::object_start ||
         event == Node::parse_event_t::array_start) &&
        depth >= kMaxNestingDepth) {
      throw JsonException("Parse error: nesting exceeds " +
                          std::to_string(kMaxNestingDepth) + " levels");
    }
    return true;
  };

  try {
    JsonValue val;
    val.impl_->json_ = Node::parse(json_str, limit_depth);
    return val;
  } catch (const nlohmann::json::exception& e) {
    throw JsonException("Parse error: " + std::string(e.what()));
  }
}

}  // namespace json
}  // namespace deepresearch
