#pragma once

#include <map>
#include <vector>

#include "deepresearch/json/json_bridge.h"
#include "deepresearch/types.h"

namespace deepresearch {
namespace json {

// Forward declarations
template <typename T>
struct JsonSerializeTraits;
template <typename T>
struct JsonDeserializeTraits;

// One entry point per direction; per-type behaviour lives in the traits
class JsonSerializer {
 public:
  template <typename T>
  static JsonValue serialize(const T& value) {
    return JsonSerializeTraits<T>::serialize(value);
  }
};

class JsonDeserializer {
 public:
  template <typename T>
  static T deserialize(const JsonValue& json) {
    return JsonDeserializeTraits<T>::deserialize(json);
  }
};

// Short aliases: to_json(value) and from_json<T>(json)
template <typename T>
inline JsonValue to_json(const T& value) {
  return JsonSerializer::serialize<T>(value);
}

template <typename T>
inline T from_json(const JsonValue& json) {
  return JsonDeserializer::deserialize<T>(json);
}

// ============ BASIC TYPE TRAITS ============

template <>
struct JsonSerializeTraits<std::string> {
  static JsonValue serialize(const std::string& value) {
    return JsonValue(value);
  }
};
template <>
struct JsonSerializeTraits<int> {
  static JsonValue serialize(int value) { return JsonValue(value); }
};
template <>
struct JsonSerializeTraits<int64_t> {
  static JsonValue serialize(int64_t value) { return JsonValue(value); }
};
template <>
struct JsonSerializeTraits<bool> {
  static JsonValue serialize(bool value) { return JsonValue(value); }
};
template <>
struct JsonSerializeTraits<JsonValue> {
  static JsonValue serialize(const JsonValue& value) { return value; }
};

template <>
struct JsonDeserializeTraits<std::string> {
  static std::string deserialize(const JsonValue& json) {
    return json.getString();
  }
};
template <>
struct JsonDeserializeTraits<int> {
  static int deserialize(const JsonValue& json) { return json.getInt(); }
};
template <>
struct JsonDeserializeTraits<int64_t> {
  static int64_t deserialize(const JsonValue& json) { return json.getInt64(); }
};
template <>
struct JsonDeserializeTraits<bool> {
  static bool deserialize(const JsonValue& json) { return json.getBool(); }
};
template <>
struct JsonDeserializeTraits<JsonValue> {
  static JsonValue deserialize(const JsonValue& json) { return json; }
};

// ============ CONTAINER TRAITS ============

template <typename T>
struct JsonSerializeTraits<std::vector<T>> {
  static JsonValue serialize(const std::vector<T>& vec) {
    JsonArrayBuilder builder;
    for (const auto& item : vec) {
      builder.add(JsonSerializer::serialize<T>(item));
    }
    return builder.build();
  }
};

template <typename T>
struct JsonDeserializeTraits<std::vector<T>> {
  static std::vector<T> deserialize(const JsonValue& json) {
    if (!json.isArray()) {
      throw JsonException("Expected array");
    }
    std::vector<T> result;
    size_t size = json.size();
    result.reserve(size);
    for (size_t i = 0; i < size; ++i) {
      result.push_back(JsonDeserializer::deserialize<T>(json[i]));
    }
    return result;
  }
};

template <typename T>
struct JsonSerializeTraits<optional<T>> {
  static JsonValue serialize(const optional<T>& opt) {
    if (opt.has_value()) {
      return JsonSerializer::serialize<T>(opt.value());
    }
    return JsonValue::null();
  }
};

template <typename T>
struct JsonDeserializeTraits<optional<T>> {
  static optional<T> deserialize(const JsonValue& json) {
    if (json.isNull()) {
      return nullopt;
    }
    return deepresearch::make_optional(JsonDeserializer::deserialize<T>(json));
  }
};

template <typename V>
struct JsonSerializeTraits<std::map<std::string, V>> {
  static JsonValue serialize(const std::map<std::string, V>& map) {
    JsonObjectBuilder builder;
    for (const auto& kv : map) {
      builder.add(kv.first, JsonSerializer::serialize<V>(kv.second));
    }
    return builder.build();
  }
};

template <typename V>
struct JsonDeserializeTraits<std::map<std::string, V>> {
  static std::map<std::string, V> deserialize(const JsonValue& json) {
    if (!json.isObject()) {
      throw JsonException("Expected object");
    }
    std::map<std::string, V> result;
    for (const auto& kv : json.items()) {
      result[kv.first] = JsonDeserializer::deserialize<V>(kv.second);
    }
    return result;
  }
};

// ============ ENUM TRAITS ============

template <>
struct JsonSerializeTraits<enums::Role::Value> {
  static JsonValue serialize(enums::Role::Value value) {
    return JsonValue(enums::Role::to_string(value));
  }
};

template <>
struct JsonDeserializeTraits<enums::Role::Value> {
  static enums::Role::Value deserialize(const JsonValue& json);
};

// ============ PROTOCOL TYPE TRAITS ============
// Definitions live in json_serialization.cc. Optional fields that are unset
// are omitted from the output rather than written as null.

#define DEEPRESEARCH_DECLARE_SERIALIZE(Type)     \
  template <>                                    \
  struct JsonSerializeTraits<Type> {             \
    static JsonValue serialize(const Type& value); \
  }

#define DEEPRESEARCH_DECLARE_DESERIALIZE(Type)   \
  template <>                                    \
  struct JsonDeserializeTraits<Type> {           \
    static Type deserialize(const JsonValue& json); \
  }

DEEPRESEARCH_DECLARE_SERIALIZE(TextContent);
DEEPRESEARCH_DECLARE_SERIALIZE(Resource);
DEEPRESEARCH_DECLARE_SERIALIZE(TextResourceContents);
DEEPRESEARCH_DECLARE_SERIALIZE(ReadResourceResult);
DEEPRESEARCH_DECLARE_SERIALIZE(Tool);
DEEPRESEARCH_DECLARE_SERIALIZE(PromptArgument);
DEEPRESEARCH_DECLARE_SERIALIZE(Prompt);
DEEPRESEARCH_DECLARE_SERIALIZE(PromptMessage);
DEEPRESEARCH_DECLARE_SERIALIZE(GetPromptResult);
DEEPRESEARCH_DECLARE_SERIALIZE(Implementation);
DEEPRESEARCH_DECLARE_SERIALIZE(CapabilityFlags);
DEEPRESEARCH_DECLARE_SERIALIZE(ServerCapabilities);
DEEPRESEARCH_DECLARE_SERIALIZE(InitializeResult);
DEEPRESEARCH_DECLARE_SERIALIZE(Error);
DEEPRESEARCH_DECLARE_SERIALIZE(jsonrpc::RequestId);
DEEPRESEARCH_DECLARE_SERIALIZE(jsonrpc::Request);
DEEPRESEARCH_DECLARE_SERIALIZE(jsonrpc::Response);
DEEPRESEARCH_DECLARE_SERIALIZE(jsonrpc::Notification);

DEEPRESEARCH_DECLARE_DESERIALIZE(TextContent);
DEEPRESEARCH_DECLARE_DESERIALIZE(Resource);
DEEPRESEARCH_DECLARE_DESERIALIZE(TextResourceContents);
DEEPRESEARCH_DECLARE_DESERIALIZE(PromptArgument);
DEEPRESEARCH_DECLARE_DESERIALIZE(Prompt);
DEEPRESEARCH_DECLARE_DESERIALIZE(PromptMessage);
DEEPRESEARCH_DECLARE_DESERIALIZE(Implementation);
DEEPRESEARCH_DECLARE_DESERIALIZE(Error);
DEEPRESEARCH_DECLARE_DESERIALIZE(jsonrpc::RequestId);
DEEPRESEARCH_DECLARE_DESERIALIZE(jsonrpc::Request);
DEEPRESEARCH_DECLARE_DESERIALIZE(jsonrpc::Response);
DEEPRESEARCH_DECLARE_DESERIALIZE(jsonrpc::Notification);

#undef DEEPRESEARCH_DECLARE_SERIALIZE
#undef DEEPRESEARCH_DECLARE_DESERIALIZE

}  // namespace json
}  // namespace deepresearch
