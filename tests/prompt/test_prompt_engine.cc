#include <gtest/gtest.h>

#include "deepresearch/errors.h"
#include "deepresearch/prompt/deep_research_prompt.h"
#include "deepresearch/prompt/prompt_engine.h"
#include "deepresearch/server/capability_registry.h"

using namespace deepresearch;
using namespace deepresearch::prompt;

TEST(PromptTemplateTest, ReplacesPlaceholderAndTrims) {
  PromptTemplate tmpl("topic", "\n\n  Study {topic} carefully.  \n");
  EXPECT_EQ(tmpl.render("tides"), "Study tides carefully.");
}

TEST(PromptTemplateTest, ValueIsInsertedVerbatim) {
  PromptTemplate tmpl("q", "Q: {q}");
  EXPECT_EQ(tmpl.render("{q} and {other}"), "Q: {q} and {other}");
}

TEST(PromptTemplateTest, OnlyFirstOccurrenceIsReplaced) {
  PromptTemplate tmpl("q", "{q} / {q}");
  EXPECT_EQ(tmpl.render("x"), "x / {q}");
}

TEST(PromptTemplateTest, OtherBracesAreCopiedThrough) {
  PromptTemplate tmpl("q", "{ \"json\": {q} }");
  EXPECT_EQ(tmpl.render("1"), "{ \"json\": 1 }");
}

TEST(PromptTemplateTest, EmptyValueStillTrims) {
  PromptTemplate tmpl("q", "   {q}   ");
  EXPECT_EQ(tmpl.render(""), "");
}

TEST(TrimWhitespaceTest, StripsBothEnds) {
  EXPECT_EQ(trimWhitespace("\t a b \r\n"), "a b");
  EXPECT_EQ(trimWhitespace("   "), "");
  EXPECT_EQ(trimWhitespace(""), "");
}

class PromptEngineTest : public ::testing::Test {
 protected:
  PromptEngineTest() : engine_(registry_) {
    engine_.registerTemplate(kDeepResearchPromptId, deepResearchTemplate());
  }

  server::CapabilityRegistry registry_;
  PromptEngine engine_;
};

TEST_F(PromptEngineTest, RendersDeepResearchPrompt) {
  auto text = engine_.render(kDeepResearchPromptId,
                             {{"research_question", "What causes tides?"}});

  EXPECT_EQ(text.find("You are a researcher exploring: What causes tides?"),
            0u);
  EXPECT_EQ(text.find("{research_question}"), std::string::npos);
  EXPECT_EQ(text.back(), '.');
  EXPECT_NE(text.find("Begin. Follow threads."), std::string::npos);
}

TEST_F(PromptEngineTest, RenderingIsDeterministic) {
  PromptArguments args = {{"research_question", "Q"}};
  EXPECT_EQ(engine_.render(kDeepResearchPromptId, args),
            engine_.render(kDeepResearchPromptId, args));
}

TEST_F(PromptEngineTest, EmptyQuestionIsAccepted) {
  auto text = engine_.render(kDeepResearchPromptId, {{"research_question", ""}});
  EXPECT_EQ(text.find("You are a researcher exploring: \n"), 0u);
}

TEST_F(PromptEngineTest, MissingRequiredArgument) {
  try {
    engine_.render(kDeepResearchPromptId, {{"other", "x"}});
    FAIL() << "Expected MissingArgumentError";
  } catch (const MissingArgumentError& e) {
    EXPECT_EQ(e.argument(), "research_question");
    EXPECT_STREQ(e.what(), "Missing required argument: research_question");
    EXPECT_EQ(e.code(), jsonrpc::INVALID_PARAMS);
  }
}

TEST_F(PromptEngineTest, UnknownPrompt) {
  try {
    engine_.render("shallow-research", {{"research_question", "x"}});
    FAIL() << "Expected UnknownPromptError";
  } catch (const UnknownPromptError& e) {
    EXPECT_STREQ(e.what(), "Unknown prompt: shallow-research");
    EXPECT_EQ(e.promptId(), "shallow-research");
  }
}

TEST_F(PromptEngineTest, UnknownPromptIsReportedBeforeMissingArgument) {
  EXPECT_THROW(engine_.render("nope", {}), UnknownPromptError);
}

TEST_F(PromptEngineTest, ExtraArgumentsAreIgnored) {
  auto with_extra = engine_.render(
      kDeepResearchPromptId, {{"research_question", "Q"}, {"depth", "9"}});
  auto without = engine_.render(kDeepResearchPromptId,
                                {{"research_question", "Q"}});
  EXPECT_EQ(with_extra, without);
}

TEST(PromptEngineWithoutTemplateTest, RegisteredPromptNeedsTemplate) {
  server::CapabilityRegistry registry;
  PromptEngine engine(registry);
  EXPECT_THROW(engine.render(kDeepResearchPromptId, {{"research_question", "Q"}}),
               UnknownPromptError);
}

TEST(DeepResearchPromptTest, Descriptor) {
  auto prompt = deepResearchPrompt();
  EXPECT_EQ(prompt.name, "deep-research");
  EXPECT_EQ(prompt.description.value(),
            "A prompt to conduct deep research on a question");
  ASSERT_EQ(prompt.arguments.size(), 1u);
  EXPECT_EQ(prompt.arguments[0].name, "research_question");
  EXPECT_EQ(prompt.arguments[0].description.value(),
            "The research question to investigate");
  EXPECT_TRUE(prompt.arguments[0].required);
}
