#ifndef DEEPRESEARCH_SERVER_REQUEST_DISPATCHER_H
#define DEEPRESEARCH_SERVER_REQUEST_DISPATCHER_H

#include <string>
#include <vector>

#include "deepresearch/prompt/prompt_engine.h"
#include "deepresearch/research/session_state.h"
#include "deepresearch/server/capability_registry.h"
#include "deepresearch/types.h"

namespace deepresearch {
namespace server {

// MCP method names served by the capability handlers
constexpr const char* kMethodListResources = "resources/list";
constexpr const char* kMethodReadResource = "resources/read";
constexpr const char* kMethodListPrompts = "prompts/list";
constexpr const char* kMethodGetPrompt = "prompts/get";
constexpr const char* kMethodListTools = "tools/list";

/**
 * One method per capability request. Failures are reported by throwing a
 * ResearchError subclass.
 */
class CapabilityHandler {
 public:
  virtual ~CapabilityHandler() = default;

  virtual std::vector<Resource> listResources() = 0;
  virtual ReadResourceResult readResource(const std::string& uri) = 0;
  virtual std::vector<Prompt> listPrompts() = 0;
  virtual GetPromptResult getPrompt(const std::string& id,
                                    const prompt::PromptArguments& args) = 0;
  virtual std::vector<Tool> listTools() = 0;
};

/**
 * Serves the five capability requests from the registry, the prompt engine
 * and the session state.
 *
 * getPrompt is the only handler with a side effect: after rendering it sets
 * the question and appends "Research initiated on question: <q>", so a
 * later read of research://data reflects the question. A request that fails
 * leaves the session state untouched.
 */
class RequestDispatcher : public CapabilityHandler {
 public:
  explicit RequestDispatcher(research::SessionState& state);

  std::vector<Resource> listResources() override;
  ReadResourceResult readResource(const std::string& uri) override;
  std::vector<Prompt> listPrompts() override;
  GetPromptResult getPrompt(const std::string& id,
                            const prompt::PromptArguments& args) override;
  std::vector<Tool> listTools() override;

  // True for the five capability method names
  bool handles(const std::string& method) const;

  /**
   * Decode params, call the matching handler and encode its result.
   *
   * @throws InvalidParamsError when params lack a required member or have
   *         the wrong shape
   * @throws ResearchError from the handler
   */
  json::JsonValue dispatch(const std::string& method,
                           const optional<Metadata>& params);

  const CapabilityRegistry& registry() const { return registry_; }

 private:
  research::SessionState& state_;
  CapabilityRegistry registry_;
  prompt::PromptEngine engine_;
};

}  // namespace server
}  // namespace deepresearch

#endif  // DEEPRESEARCH_SERVER_REQUEST_DISPATCHER_H
