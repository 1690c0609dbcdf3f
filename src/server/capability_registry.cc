#include "deepresearch/server/capability_registry.h"

#include "deepresearch/errors.h"
#include "deepresearch/prompt/deep_research_prompt.h"

namespace deepresearch {
namespace server {

CapabilityRegistry::CapabilityRegistry() {
  resources_.push_back(
      build_resource(kNotesResourceUri, "Research Process Notes")
          .description("Notes generated during the research process")
          .mimeType("text/plain")
          .build());
  resources_.push_back(
      build_resource(kDataResourceUri, "Research Data")
          .description("Structured data collected during the research process")
          .mimeType("application/json")
          .build());

  prompts_.push_back(prompt::deepResearchPrompt());
}

const Prompt& CapabilityRegistry::resolvePrompt(const std::string& id) const {
  for (const auto& prompt : prompts_) {
    if (prompt.name == id) {
      return prompt;
    }
  }
  throw UnknownPromptError(id);
}

const Resource& CapabilityRegistry::resolveResource(
    const std::string& uri) const {
  for (const auto& resource : resources_) {
    if (resource.uri == uri) {
      return resource;
    }
  }
  throw UnknownResourceError(uri);
}

}  // namespace server
}  // namespace deepresearch
