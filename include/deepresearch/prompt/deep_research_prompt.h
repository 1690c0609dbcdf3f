#ifndef DEEPRESEARCH_PROMPT_DEEP_RESEARCH_PROMPT_H
#define DEEPRESEARCH_PROMPT_DEEP_RESEARCH_PROMPT_H

#include "deepresearch/prompt/prompt_engine.h"
#include "deepresearch/types.h"

namespace deepresearch {
namespace prompt {

constexpr const char* kDeepResearchPromptId = "deep-research";
constexpr const char* kResearchQuestionArgument = "research_question";

// Template whose placeholder is {research_question}
PromptTemplate deepResearchTemplate();

// Descriptor advertised by prompts/list
Prompt deepResearchPrompt();

}  // namespace prompt
}  // namespace deepresearch

#endif  // DEEPRESEARCH_PROMPT_DEEP_RESEARCH_PROMPT_H
