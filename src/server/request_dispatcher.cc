#define DEEPRESEARCH_LOG_COMPONENT "server"

#include "deepresearch/server/request_dispatcher.h"

#include "deepresearch/errors.h"
#include "deepresearch/json/json_serialization.h"
#include "deepresearch/logging/log_macros.h"
#include "deepresearch/prompt/deep_research_prompt.h"

namespace deepresearch {
namespace server {

namespace {

std::string requireStringParam(const optional<Metadata>& params,
                               const std::string& key) {
  if (!params.has_value() || !params->isObject()) {
    throw InvalidParamsError("Missing params: expected object with '" + key +
                             "'");
  }
  const auto value = (*params)[key];
  if (!value.isString()) {
    throw InvalidParamsError("Missing or invalid '" + key +
                             "': expected string");
  }
  return value.getString();
}

prompt::PromptArguments promptArguments(const optional<Metadata>& params) {
  prompt::PromptArguments args;
  if (!params.has_value() || !params->contains("arguments")) {
    return args;
  }
  const auto arguments = (*params)["arguments"];
  if (arguments.isNull()) {
    return args;
  }
  if (!arguments.isObject()) {
    throw InvalidParamsError("Invalid 'arguments': expected object");
  }
  for (const auto& kv : arguments.items()) {
    if (!kv.second.isString()) {
      throw InvalidParamsError("Prompt argument '" + kv.first +
                               "' must be a string");
    }
    args[kv.first] = kv.second.getString();
  }
  return args;
}

}  // namespace

RequestDispatcher::RequestDispatcher(research::SessionState& state)
    : state_(state), engine_(registry_) {
  engine_.registerTemplate(prompt::kDeepResearchPromptId,
                           prompt::deepResearchTemplate());
}

std::vector<Resource> RequestDispatcher::listResources() {
  DEEPRESEARCH_LOG(Debug, "Handling list_resources request");
  return registry_.listResources();
}

ReadResourceResult RequestDispatcher::readResource(const std::string& uri) {
  DEEPRESEARCH_LOG(Debug, "Handling read_resource request for URI: {}", uri);
  const Resource& resource = registry_.resolveResource(uri);

  TextResourceContents contents;
  contents.uri = resource.uri;
  contents.mimeType = resource.mimeType;
  if (resource.uri == kNotesResourceUri) {
    contents.text = state_.notesAsText();
  } else {
    contents.text = state_.snapshotJson();
  }

  ReadResourceResult result;
  result.contents.push_back(std::move(contents));
  return result;
}

std::vector<Prompt> RequestDispatcher::listPrompts() {
  DEEPRESEARCH_LOG(Debug, "Handling list_prompts request");
  return registry_.listPrompts();
}

GetPromptResult RequestDispatcher::getPrompt(
    const std::string& id, const prompt::PromptArguments& args) {
  DEEPRESEARCH_LOG(Debug, "Handling get_prompt request for {} with {} args",
                   id, args.size());

  // Render first: it validates id and arguments before any state changes
  std::string text = engine_.render(id, args);

  const std::string& question = args.at(prompt::kResearchQuestionArgument);
  state_.setQuestion(question);
  state_.appendNote("Research initiated on question: " + question);

  DEEPRESEARCH_LOG(Debug,
                   "Generated prompt template for research_question: {}",
                   question);

  GetPromptResult result;
  result.description = "Deep research template for: " + question;
  result.messages.push_back(make_user_message(text));
  return result;
}

std::vector<Tool> RequestDispatcher::listTools() {
  DEEPRESEARCH_LOG(Debug, "Handling list_tools request");
  return registry_.listTools();
}

bool RequestDispatcher::handles(const std::string& method) const {
  return method == kMethodListResources || method == kMethodReadResource ||
         method == kMethodListPrompts || method == kMethodGetPrompt ||
         method == kMethodListTools;
}

json::JsonValue RequestDispatcher::dispatch(const std::string& method,
                                            const optional<Metadata>& params) {
  using json::to_json;

  if (method == kMethodListResources) {
    return json::JsonObjectBuilder()
        .add("resources", to_json(listResources()))
        .build();
  }
  if (method == kMethodReadResource) {
    return to_json(readResource(requireStringParam(params, "uri")));
  }
  if (method == kMethodListPrompts) {
    return json::JsonObjectBuilder()
        .add("prompts", to_json(listPrompts()))
        .build();
  }
  if (method == kMethodGetPrompt) {
    auto name = requireStringParam(params, "name");
    return to_json(getPrompt(name, promptArguments(params)));
  }
  if (method == kMethodListTools) {
    return json::JsonObjectBuilder()
        .add("tools", to_json(listTools()))
        .build();
  }
  throw ResearchError(jsonrpc::METHOD_NOT_FOUND,
                      "Method not found: " + method);
}

}  // namespace server
}  // namespace deepresearch
