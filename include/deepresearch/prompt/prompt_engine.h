#ifndef DEEPRESEARCH_PROMPT_PROMPT_ENGINE_H
#define DEEPRESEARCH_PROMPT_PROMPT_ENGINE_H

#include <map>
#include <string>

namespace deepresearch {

namespace server {
class CapabilityRegistry;
}  // namespace server

namespace prompt {

using PromptArguments = std::map<std::string, std::string>;

// Strips leading and trailing ASCII whitespace
std::string trimWhitespace(const std::string& text);

/**
 * A template body with exactly one named placeholder, written "{name}".
 *
 * Rendering is literal replacement of the first occurrence followed by a
 * whitespace trim. There are no loops, conditionals or escapes; braces that
 * do not form the placeholder are copied through unchanged.
 */
class PromptTemplate {
 public:
  PromptTemplate(const std::string& placeholder, const std::string& body);

  const std::string& placeholder() const { return placeholder_; }
  const std::string& body() const { return body_; }

  std::string render(const std::string& value) const;

 private:
  std::string placeholder_;
  std::string body_;
};

/**
 * Renders registered prompts after checking their declared arguments.
 */
class PromptEngine {
 public:
  explicit PromptEngine(const server::CapabilityRegistry& registry);

  void registerTemplate(const std::string& prompt_id, PromptTemplate tmpl);

  /**
   * @throws UnknownPromptError if prompt_id is not in the registry or has no
   *         template
   * @throws MissingArgumentError naming the first required argument absent
   *         from arguments
   *
   * Arguments the prompt does not declare are ignored.
   */
  std::string render(const std::string& prompt_id,
                     const PromptArguments& arguments) const;

 private:
  const server::CapabilityRegistry& registry_;
  std::map<std::string, PromptTemplate> templates_;
};

}  // namespace prompt
}  // namespace deepresearch

#endif  // DEEPRESEARCH_PROMPT_PROMPT_ENGINE_H
