#ifndef DEEPRESEARCH_TYPES_H
#define DEEPRESEARCH_TYPES_H

#include <cstdint>
#include <string>
#include <vector>

#include "deepresearch/core/compat.h"
#include "deepresearch/json/json_bridge.h"

namespace deepresearch {

// Free-form structured value carried in params, arguments and results
using Metadata = json::JsonValue;

// Base types
struct TextContent {
  std::string type = "text";
  std::string text;

  TextContent() = default;
  explicit TextContent(const std::string& t) : text(t) {}
};

// Resource descriptor as advertised by resources/list
struct Resource {
  std::string uri;
  std::string name;
  optional<std::string> description;
  optional<std::string> mimeType;

  Resource() = default;
  Resource(const std::string& u, const std::string& n) : uri(u), name(n) {}
};

struct TextResourceContents {
  std::string uri;
  optional<std::string> mimeType;
  std::string text;
};

struct ReadResourceResult {
  std::vector<TextResourceContents> contents;
};

// Tool definitions
struct Tool {
  std::string name;
  optional<std::string> description;
  Metadata inputSchema = Metadata::object();

  Tool() = default;
  explicit Tool(const std::string& n) : name(n) {}
};

// Prompt definitions
struct PromptArgument {
  std::string name;
  optional<std::string> description;
  bool required = false;
};

struct Prompt {
  std::string name;
  optional<std::string> description;
  std::vector<PromptArgument> arguments;

  Prompt() = default;
  explicit Prompt(const std::string& n) : name(n) {}
};

namespace enums {
struct Role {
  enum Value { USER, ASSISTANT };

  static const char* to_string(Value v) {
    return v == USER ? "user" : "assistant";
  }
};
}  // namespace enums

struct PromptMessage {
  enums::Role::Value role = enums::Role::USER;
  TextContent content;

  PromptMessage() = default;
  PromptMessage(enums::Role::Value r, const TextContent& c)
      : role(r), content(c) {}
};

struct GetPromptResult {
  optional<std::string> description;
  std::vector<PromptMessage> messages;
};

// Handshake payloads
struct Implementation {
  std::string name;
  std::string version;

  Implementation() = default;
  Implementation(const std::string& n, const std::string& v)
      : name(n), version(v) {}
};

// A capability category; listChanged/subscribe are only emitted when set
struct CapabilityFlags {
  optional<bool> subscribe;
  optional<bool> listChanged;
};

struct ServerCapabilities {
  Metadata experimental = Metadata::object();
  optional<CapabilityFlags> logging;
  optional<CapabilityFlags> prompts;
  optional<CapabilityFlags> resources;
  optional<CapabilityFlags> tools;
};

struct InitializeResult {
  std::string protocolVersion;
  ServerCapabilities capabilities;
  Implementation serverInfo;
  optional<std::string> instructions;
};

// Error type
struct Error {
  int code = 0;
  std::string message;
  optional<Metadata> data;

  Error() = default;
  Error(int c, const std::string& m) : code(c), message(m) {}
};

// Factory functions for common types
inline TextContent make_text(const std::string& text) {
  return TextContent(text);
}

inline PromptMessage make_user_message(const std::string& text) {
  return PromptMessage(enums::Role::USER, TextContent(text));
}

inline Error make_error(int code, const std::string& message) {
  return Error(code, message);
}

// Builder pattern for descriptors
class ResourceBuilder {
  Resource resource_;

 public:
  ResourceBuilder(const std::string& uri, const std::string& name)
      : resource_(uri, name) {}

  ResourceBuilder& description(const std::string& desc) {
    resource_.description = make_optional(desc);
    return *this;
  }

  ResourceBuilder& mimeType(const std::string& mime) {
    resource_.mimeType = make_optional(mime);
    return *this;
  }

  Resource build() && { return std::move(resource_); }
  Resource build() const& { return resource_; }
};

inline ResourceBuilder build_resource(const std::string& uri,
                                      const std::string& name) {
  return ResourceBuilder(uri, name);
}

class PromptBuilder {
  Prompt prompt_;

 public:
  explicit PromptBuilder(const std::string& name) : prompt_(name) {}

  PromptBuilder& description(const std::string& desc) {
    prompt_.description = make_optional(desc);
    return *this;
  }

  PromptBuilder& argument(const std::string& name,
                          const std::string& desc,
                          bool required = false) {
    prompt_.arguments.push_back(
        PromptArgument{name, make_optional(desc), required});
    return *this;
  }

  Prompt build() && { return std::move(prompt_); }
  Prompt build() const& { return prompt_; }
};

inline PromptBuilder build_prompt(const std::string& name) {
  return PromptBuilder(name);
}

// JSON-RPC message types
namespace jsonrpc {

// Standard JSON-RPC 2.0 error codes
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Absent ids (unparseable requests) are represented by nullptr
using RequestId = variant<std::nullptr_t, std::string, int64_t>;

inline std::string requestIdToString(const RequestId& id) {
  if (holds_alternative<std::string>(id)) {
    return get<std::string>(id);
  }
  if (holds_alternative<int64_t>(id)) {
    return std::to_string(get<int64_t>(id));
  }
  return "null";
}

struct Request {
  std::string jsonrpc = "2.0";
  RequestId id;
  std::string method;
  optional<Metadata> params;

  Request() = default;
  Request(const RequestId& i, const std::string& m) : id(i), method(m) {}
  Request(const RequestId& i, const std::string& m, const Metadata& p)
      : id(i), method(m), params(make_optional(p)) {}
};

struct Response {
  std::string jsonrpc = "2.0";
  RequestId id;
  optional<Metadata> result;
  optional<Error> error;

  Response() = default;
  explicit Response(const RequestId& i) : id(i) {}

  static Response success(const RequestId& id, const Metadata& result) {
    Response r(id);
    r.result = make_optional(result);
    return r;
  }

  static Response make_error(const RequestId& id, const Error& err) {
    Response r(id);
    r.error = make_optional(err);
    return r;
  }
};

struct Notification {
  std::string jsonrpc = "2.0";
  std::string method;
  optional<Metadata> params;

  Notification() = default;
  explicit Notification(const std::string& m) : method(m) {}
};

}  // namespace jsonrpc

}  // namespace deepresearch

#endif  // DEEPRESEARCH_TYPES_H
