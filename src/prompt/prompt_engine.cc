#define DEEPRESEARCH_LOG_COMPONENT "prompt"

#include "deepresearch/prompt/prompt_engine.h"

#include "deepresearch/errors.h"
#include "deepresearch/logging/log_macros.h"
#include "deepresearch/server/capability_registry.h"

namespace deepresearch {
namespace prompt {

std::string trimWhitespace(const std::string& text) {
  static const char* const kWhitespace = " \t\n\r\f\v";
  auto begin = text.find_first_not_of(kWhitespace);
  if (begin == std::string::npos) {
    return std::string();
  }
  auto end = text.find_last_not_of(kWhitespace);
  return text.substr(begin, end - begin + 1);
}

PromptTemplate::PromptTemplate(const std::string& placeholder,
                               const std::string& body)
    : placeholder_(placeholder), body_(body) {}

std::string PromptTemplate::render(const std::string& value) const {
  const std::string token = "{" + placeholder_ + "}";
  std::string text = body_;
  auto pos = text.find(token);
  if (pos != std::string::npos) {
    text.replace(pos, token.size(), value);
  }
  return trimWhitespace(text);
}

PromptEngine::PromptEngine(const server::CapabilityRegistry& registry)
    : registry_(registry) {}

void PromptEngine::registerTemplate(const std::string& prompt_id,
                                    PromptTemplate tmpl) {
  templates_.erase(prompt_id);
  templates_.emplace(prompt_id, std::move(tmpl));
}

std::string PromptEngine::render(const std::string& prompt_id,
                                 const PromptArguments& arguments) const {
  const Prompt& descriptor = registry_.resolvePrompt(prompt_id);

  for (const auto& arg : descriptor.arguments) {
    if (arg.required && arguments.find(arg.name) == arguments.end()) {
      throw MissingArgumentError(arg.name);
    }
  }

  auto it = templates_.find(prompt_id);
  if (it == templates_.end()) {
    DEEPRESEARCH_LOG(Error, "Prompt '{}' is registered without a template",
                     prompt_id);
    throw UnknownPromptError(prompt_id);
  }

  const PromptTemplate& tmpl = it->second;
  auto value = arguments.find(tmpl.placeholder());
  return tmpl.render(value != arguments.end() ? value->second
                                              : std::string());
}

}  // namespace prompt
}  // namespace deepresearch
