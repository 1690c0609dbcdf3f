#include "deepresearch/json/json_serialization.h"

namespace deepresearch {
namespace json {

namespace {

void addOptional(JsonObjectBuilder& builder,
                 const std::string& key,
                 const optional<std::string>& value) {
  if (value.has_value()) {
    builder.add(key, value.value());
  }
}

optional<std::string> optionalString(const JsonValue& json,
                                     const std::string& key) {
  if (!json.contains(key) || json[key].isNull()) {
    return nullopt;
  }
  return make_optional(json[key].getString());
}

void requireObject(const JsonValue& json, const char* what) {
  if (!json.isObject()) {
    throw JsonException(std::string(what) + " must be an object");
  }
}

}  // namespace

// ============ ENUMS ============

enums::Role::Value JsonDeserializeTraits<enums::Role::Value>::deserialize(
    const JsonValue& json) {
  auto str = json.getString();
  if (str == "user") {
    return enums::Role::USER;
  }
  if (str == "assistant") {
    return enums::Role::ASSISTANT;
  }
  throw JsonException("Invalid role: " + str);
}

// ============ CONTENT ============

JsonValue JsonSerializeTraits<TextContent>::serialize(
    const TextContent& content) {
  return JsonObjectBuilder()
      .add("type", content.type)
      .add("text", content.text)
      .build();
}

TextContent JsonDeserializeTraits<TextContent>::deserialize(
    const JsonValue& json) {
  requireObject(json, "Content");
  auto type = json.at("type").getString();
  if (type != "text") {
    throw JsonException("Unsupported content type: " + type);
  }
  return TextContent(json.at("text").getString());
}

// ============ RESOURCES ============

JsonValue JsonSerializeTraits<Resource>::serialize(const Resource& resource) {
  JsonObjectBuilder builder;
  builder.add("uri", resource.uri);
  builder.add("name", resource.name);
  addOptional(builder, "description", resource.description);
  addOptional(builder, "mimeType", resource.mimeType);
  return builder.build();
}

Resource JsonDeserializeTraits<Resource>::deserialize(const JsonValue& json) {
  requireObject(json, "Resource");
  Resource resource(json.at("uri").getString(), json.at("name").getString());
  resource.description = optionalString(json, "description");
  resource.mimeType = optionalString(json, "mimeType");
  return resource;
}

JsonValue JsonSerializeTraits<TextResourceContents>::serialize(
    const TextResourceContents& contents) {
  JsonObjectBuilder builder;
  builder.add("uri", contents.uri);
  addOptional(builder, "mimeType", contents.mimeType);
  builder.add("text", contents.text);
  return builder.build();
}

TextResourceContents JsonDeserializeTraits<TextResourceContents>::deserialize(
    const JsonValue& json) {
  requireObject(json, "Resource contents");
  TextResourceContents contents;
  contents.uri = json.at("uri").getString();
  contents.mimeType = optionalString(json, "mimeType");
  contents.text = json.at("text").getString();
  return contents;
}

JsonValue JsonSerializeTraits<ReadResourceResult>::serialize(
    const ReadResourceResult& result) {
  return JsonObjectBuilder()
      .add("contents", to_json(result.contents))
      .build();
}

// ============ TOOLS ============

JsonValue JsonSerializeTraits<Tool>::serialize(const Tool& tool) {
  JsonObjectBuilder builder;
  builder.add("name", tool.name);
  addOptional(builder, "description", tool.description);
  builder.add("inputSchema", tool.inputSchema);
  return builder.build();
}

// ============ PROMPTS ============

JsonValue JsonSerializeTraits<PromptArgument>::serialize(
    const PromptArgument& arg) {
  JsonObjectBuilder builder;
  builder.add("name", arg.name);
  addOptional(builder, "description", arg.description);
  builder.add("required", arg.required);
  return builder.build();
}

PromptArgument JsonDeserializeTraits<PromptArgument>::deserialize(
    const JsonValue& json) {
  requireObject(json, "Prompt argument");
  PromptArgument arg;
  arg.name = json.at("name").getString();
  arg.description = optionalString(json, "description");
  arg.required = json["required"].getBool(false);
  return arg;
}

JsonValue JsonSerializeTraits<Prompt>::serialize(const Prompt& prompt) {
  JsonObjectBuilder builder;
  builder.add("name", prompt.name);
  addOptional(builder, "description", prompt.description);
  builder.add("arguments", to_json(prompt.arguments));
  return builder.build();
}

Prompt JsonDeserializeTraits<Prompt>::deserialize(const JsonValue& json) {
  requireObject(json, "Prompt");
  Prompt prompt(json.at("name").getString());
  prompt.description = optionalString(json, "description");
  if (json.contains("arguments")) {
    prompt.arguments =
        from_json<std::vector<PromptArgument>>(json["arguments"]);
  }
  return prompt;
}

JsonValue JsonSerializeTraits<PromptMessage>::serialize(
    const PromptMessage& message) {
  return JsonObjectBuilder()
      .add("role", to_json(message.role))
      .add("content", to_json(message.content))
      .build();
}

PromptMessage JsonDeserializeTraits<PromptMessage>::deserialize(
    const JsonValue& json) {
  requireObject(json, "Prompt message");
  return PromptMessage(from_json<enums::Role::Value>(json.at("role")),
                       from_json<TextContent>(json.at("content")));
}

JsonValue JsonSerializeTraits<GetPromptResult>::serialize(
    const GetPromptResult& result) {
  JsonObjectBuilder builder;
  addOptional(builder, "description", result.description);
  builder.add("messages", to_json(result.messages));
  return builder.build();
}

// ============ HANDSHAKE ============

JsonValue JsonSerializeTraits<Implementation>::serialize(
    const Implementation& impl) {
  return JsonObjectBuilder()
      .add("name", impl.name)
      .add("version", impl.version)
      .build();
}

Implementation JsonDeserializeTraits<Implementation>::deserialize(
    const JsonValue& json) {
  requireObject(json, "Implementation");
  return Implementation(json.at("name").getString(),
                        json.at("version").getString());
}

JsonValue JsonSerializeTraits<CapabilityFlags>::serialize(
    const CapabilityFlags& flags) {
  JsonObjectBuilder builder;
  if (flags.subscribe.has_value()) {
    builder.add("subscribe", flags.subscribe.value());
  }
  if (flags.listChanged.has_value()) {
    builder.add("listChanged", flags.listChanged.value());
  }
  return builder.build();
}

JsonValue JsonSerializeTraits<ServerCapabilities>::serialize(
    const ServerCapabilities& caps) {
  JsonObjectBuilder builder;
  builder.add("experimental", caps.experimental);
  if (caps.logging.has_value()) {
    builder.add("logging", to_json(caps.logging.value()));
  }
  if (caps.prompts.has_value()) {
    builder.add("prompts", to_json(caps.prompts.value()));
  }
  if (caps.resources.has_value()) {
    builder.add("resources", to_json(caps.resources.value()));
  }
  if (caps.tools.has_value()) {
    builder.add("tools", to_json(caps.tools.value()));
  }
  return builder.build();
}

JsonValue JsonSerializeTraits<InitializeResult>::serialize(
    const InitializeResult& result) {
  JsonObjectBuilder builder;
  builder.add("protocolVersion", result.protocolVersion);
  builder.add("capabilities", to_json(result.capabilities));
  builder.add("serverInfo", to_json(result.serverInfo));
  addOptional(builder, "instructions", result.instructions);
  return builder.build();
}

// ============ JSON-RPC ============

JsonValue JsonSerializeTraits<Error>::serialize(const Error& error) {
  JsonObjectBuilder builder;
  builder.add("code", error.code);
  builder.add("message", error.message);
  if (error.data.has_value()) {
    builder.add("data", error.data.value());
  }
  return builder.build();
}

Error JsonDeserializeTraits<Error>::deserialize(const JsonValue& json) {
  requireObject(json, "Error");
  Error error(json.at("code").getInt(), json.at("message").getString());
  if (json.contains("data")) {
    error.data = make_optional(json["data"]);
  }
  return error;
}

JsonValue JsonSerializeTraits<jsonrpc::RequestId>::serialize(
    const jsonrpc::RequestId& id) {
  if (holds_alternative<std::string>(id)) {
    return JsonValue(get<std::string>(id));
  }
  if (holds_alternative<int64_t>(id)) {
    return JsonValue(get<int64_t>(id));
  }
  return JsonValue::null();
}

jsonrpc::RequestId JsonDeserializeTraits<jsonrpc::RequestId>::deserialize(
    const JsonValue& json) {
  if (json.isString()) {
    return jsonrpc::RequestId(json.getString());
  }
  if (json.isInteger()) {
    return jsonrpc::RequestId(json.getInt64());
  }
  if (json.isNull()) {
    return jsonrpc::RequestId(nullptr);
  }
  throw JsonException("Invalid request id type");
}

JsonValue JsonSerializeTraits<jsonrpc::Request>::serialize(
    const jsonrpc::Request& request) {
  JsonObjectBuilder builder;
  builder.add("jsonrpc", request.jsonrpc);
  builder.add("id", to_json(request.id));
  builder.add("method", request.method);
  if (request.params.has_value()) {
    builder.add("params", request.params.value());
  }
  return builder.build();
}

jsonrpc::Request JsonDeserializeTraits<jsonrpc::Request>::deserialize(
    const JsonValue& json) {
  requireObject(json, "Request");
  jsonrpc::Request request;
  request.jsonrpc = json.at("jsonrpc").getString();
  if (request.jsonrpc != "2.0") {
    throw JsonException("Unsupported jsonrpc version: " + request.jsonrpc);
  }
  request.id = from_json<jsonrpc::RequestId>(json.at("id"));
  request.method = json.at("method").getString();
  if (json.contains("params") && !json["params"].isNull()) {
    request.params = make_optional(json["params"]);
  }
  return request;
}

JsonValue JsonSerializeTraits<jsonrpc::Response>::serialize(
    const jsonrpc::Response& response) {
  JsonObjectBuilder builder;
  builder.add("jsonrpc", response.jsonrpc);
  builder.add("id", to_json(response.id));
  if (response.error.has_value()) {
    builder.add("error", to_json(response.error.value()));
  } else if (response.result.has_value()) {
    builder.add("result", response.result.value());
  } else {
    builder.add("result", JsonValue::object());
  }
  return builder.build();
}

jsonrpc::Response JsonDeserializeTraits<jsonrpc::Response>::deserialize(
    const JsonValue& json) {
  requireObject(json, "Response");
  jsonrpc::Response response;
  response.jsonrpc = json.at("jsonrpc").getString();
  response.id = from_json<jsonrpc::RequestId>(json.at("id"));
  if (json.contains("result")) {
    response.result = make_optional(json["result"]);
  }
  if (json.contains("error")) {
    response.error = make_optional(from_json<Error>(json["error"]));
  }
  return response;
}

JsonValue JsonSerializeTraits<jsonrpc::Notification>::serialize(
    const jsonrpc::Notification& notification) {
  JsonObjectBuilder builder;
  builder.add("jsonrpc", notification.jsonrpc);
  builder.add("method", notification.method);
  if (notification.params.has_value()) {
    builder.add("params", notification.params.value());
  }
  return builder.build();
}

jsonrpc::Notification JsonDeserializeTraits<jsonrpc::Notification>::deserialize(
    const JsonValue& json) {
  requireObject(json, "Notification");
  jsonrpc::Notification notification(json.at("method").getString());
  notification.jsonrpc = json.at("jsonrpc").getString();
  if (json.contains("params") && !json["params"].isNull()) {
    notification.params = make_optional(json["params"]);
  }
  return notification;
}

}  // namespace json
}  // namespace deepresearch
