#ifndef DEEPRESEARCH_SERVER_CAPABILITY_REGISTRY_H
#define DEEPRESEARCH_SERVER_CAPABILITY_REGISTRY_H

#include <string>
#include <vector>

#include "deepresearch/types.h"

namespace deepresearch {
namespace server {

constexpr const char* kNotesResourceUri = "research://notes";
constexpr const char* kDataResourceUri = "research://data";

/**
 * Static description of the resources, prompts and tools this server
 * exposes. Built once and never modified; descriptors are handed out by
 * const reference.
 */
class CapabilityRegistry {
 public:
  CapabilityRegistry();

  // Always {research://notes, research://data}, in that order
  const std::vector<Resource>& listResources() const { return resources_; }

  // Always the single deep-research prompt
  const std::vector<Prompt>& listPrompts() const { return prompts_; }

  // Tools are declared but unsupported: always empty
  const std::vector<Tool>& listTools() const { return tools_; }

  // @throws UnknownPromptError
  const Prompt& resolvePrompt(const std::string& id) const;

  // @throws UnknownResourceError
  const Resource& resolveResource(const std::string& uri) const;

 private:
  std::vector<Resource> resources_;
  std::vector<Prompt> prompts_;
  std::vector<Tool> tools_;
};

}  // namespace server
}  // namespace deepresearch

#endif  // DEEPRESEARCH_SERVER_CAPABILITY_REGISTRY_H
