#include <gtest/gtest.h>

#include "deepresearch/errors.h"
#include "deepresearch/json/json_serialization.h"
#include "deepresearch/research/session_state.h"
#include "deepresearch/server/request_dispatcher.h"

namespace deepresearch {
namespace test {

using json::JsonValue;
using server::RequestDispatcher;

class RequestDispatcherTest : public ::testing::Test {
 protected:
  RequestDispatcherTest() : dispatcher_(state_) {}

  JsonValue dispatch(const std::string& method, const std::string& params) {
    return dispatcher_.dispatch(method, make_optional(JsonValue::parse(params)));
  }

  ReadResourceResult readResource(const std::string& uri) {
    return dispatcher_.readResource(uri);
  }

  research::SessionState state_;
  RequestDispatcher dispatcher_;
};

TEST_F(RequestDispatcherTest, HandlesCapabilityMethodsOnly) {
  EXPECT_TRUE(dispatcher_.handles("resources/list"));
  EXPECT_TRUE(dispatcher_.handles("resources/read"));
  EXPECT_TRUE(dispatcher_.handles("prompts/list"));
  EXPECT_TRUE(dispatcher_.handles("prompts/get"));
  EXPECT_TRUE(dispatcher_.handles("tools/list"));
  EXPECT_FALSE(dispatcher_.handles("tools/call"));
  EXPECT_FALSE(dispatcher_.handles("initialize"));
}

TEST_F(RequestDispatcherTest, ListResourcesWireShape) {
  auto result = dispatcher_.dispatch("resources/list", nullopt);
  ASSERT_TRUE(result["resources"].isArray());
  ASSERT_EQ(result["resources"].size(), 2u);
  EXPECT_EQ(result["resources"][0]["uri"].getString(), "research://notes");
  EXPECT_EQ(result["resources"][1]["mimeType"].getString(),
            "application/json");
}

TEST_F(RequestDispatcherTest, ListPromptsWireShape) {
  auto result = dispatcher_.dispatch("prompts/list", nullopt);
  ASSERT_EQ(result["prompts"].size(), 1u);
  auto prompt = result["prompts"][0];
  EXPECT_EQ(prompt["name"].getString(), "deep-research");
  EXPECT_TRUE(prompt["arguments"][0]["required"].getBool());
}

TEST_F(RequestDispatcherTest, ListToolsIsEmpty) {
  auto result = dispatcher_.dispatch("tools/list", nullopt);
  EXPECT_EQ(result.toString(), R"({"tools":[]})");
}

TEST_F(RequestDispatcherTest, ReadNotesInitiallyEmpty) {
  auto result = readResource("research://notes");
  ASSERT_EQ(result.contents.size(), 1u);
  EXPECT_EQ(result.contents[0].uri, "research://notes");
  EXPECT_EQ(result.contents[0].mimeType.value(), "text/plain");
  EXPECT_EQ(result.contents[0].text, "");
}

TEST_F(RequestDispatcherTest, ReadDataInitiallyEmptyDocument) {
  auto result = readResource("research://data");
  auto doc = JsonValue::parse(result.contents[0].text);
  EXPECT_EQ(result.contents[0].mimeType.value(), "application/json");
  EXPECT_EQ(doc["question"].getString(), "");
  EXPECT_TRUE(doc["subquestions"].empty());
  EXPECT_EQ(result.contents[0].text, state_.snapshotJson());
}

TEST_F(RequestDispatcherTest, ReadUnknownResource) {
  try {
    dispatch("resources/read", R"({"uri": "research://secrets"})");
    FAIL() << "Expected UnknownResourceError";
  } catch (const UnknownResourceError& e) {
    EXPECT_STREQ(e.what(), "Unknown resource: research://secrets");
    EXPECT_EQ(e.code(), jsonrpc::INVALID_PARAMS);
  }
}

TEST_F(RequestDispatcherTest, ReadRequiresUri) {
  EXPECT_THROW(dispatcher_.dispatch("resources/read", nullopt),
               InvalidParamsError);
  EXPECT_THROW(dispatch("resources/read", "{}"), InvalidParamsError);
  EXPECT_THROW(dispatch("resources/read", R"({"uri": 5})"),
               InvalidParamsError);
}

TEST_F(RequestDispatcherTest, GetPromptRendersAndRecordsQuestion) {
  auto result = dispatch(
      "prompts/get",
      R"({"name": "deep-research", "arguments": {"research_question": "Why?"}})");

  EXPECT_EQ(result["description"].getString(),
            "Deep research template for: Why?");
  ASSERT_EQ(result["messages"].size(), 1u);
  auto message = result["messages"][0];
  EXPECT_EQ(message["role"].getString(), "user");
  EXPECT_EQ(message["content"]["type"].getString(), "text");
  EXPECT_EQ(message["content"]["text"].getString().find(
                "You are a researcher exploring: Why?"),
            0u);

  EXPECT_EQ(state_.notesAsText(),
            "Updated research data: question\n"
            "Research initiated on question: Why?");
  EXPECT_EQ(state_.snapshot().question, "Why?");
}

TEST_F(RequestDispatcherTest, DataReflectsPromptQuestion) {
  dispatch("prompts/get",
           R"({"name": "deep-research", "arguments": {"research_question": "Q"}})");

  auto result = readResource("research://data");
  EXPECT_EQ(JsonValue::parse(result.contents[0].text)["question"].getString(),
            "Q");
}

TEST_F(RequestDispatcherTest, GetPromptTwiceAccumulatesNotes) {
  const char* params =
      R"({"name": "deep-research", "arguments": {"research_question": "Q"}})";
  auto first = dispatch("prompts/get", params);
  auto second = dispatch("prompts/get", params);

  EXPECT_EQ(first, second);
  EXPECT_EQ(state_.noteCount(), 4u);
}

TEST_F(RequestDispatcherTest, GetPromptMissingArgumentLeavesStateUntouched) {
  try {
    dispatch("prompts/get", R"({"name": "deep-research", "arguments": {}})");
    FAIL() << "Expected MissingArgumentError";
  } catch (const MissingArgumentError& e) {
    EXPECT_STREQ(e.what(), "Missing required argument: research_question");
  }
  EXPECT_THROW(dispatch("prompts/get", R"({"name": "deep-research"})"),
               MissingArgumentError);
  EXPECT_EQ(state_.noteCount(), 0u);
}

TEST_F(RequestDispatcherTest, GetUnknownPromptLeavesStateUntouched) {
  try {
    dispatch("prompts/get",
             R"({"name": "other", "arguments": {"research_question": "Q"}})");
    FAIL() << "Expected UnknownPromptError";
  } catch (const UnknownPromptError& e) {
    EXPECT_STREQ(e.what(), "Unknown prompt: other");
  }
  EXPECT_EQ(state_.noteCount(), 0u);
}

TEST_F(RequestDispatcherTest, GetPromptRejectsMalformedArguments) {
  EXPECT_THROW(dispatch("prompts/get", R"({"arguments": {}})"),
               InvalidParamsError);
  EXPECT_THROW(
      dispatch("prompts/get", R"({"name": "deep-research", "arguments": []})"),
      InvalidParamsError);
  EXPECT_THROW(dispatch("prompts/get",
                        R"({"name": "deep-research",)"
                        R"( "arguments": {"research_question": 3}})"),
               InvalidParamsError);
  EXPECT_EQ(state_.noteCount(), 0u);
}

TEST_F(RequestDispatcherTest, GetPromptWithNullArgumentsIsMissingArgument) {
  EXPECT_THROW(dispatch("prompts/get",
                        R"({"name": "deep-research", "arguments": null})"),
               MissingArgumentError);
}

TEST_F(RequestDispatcherTest, UnknownMethod) {
  try {
    dispatcher_.dispatch("tools/call", nullopt);
    FAIL() << "Expected ResearchError";
  } catch (const ResearchError& e) {
    EXPECT_EQ(e.code(), jsonrpc::METHOD_NOT_FOUND);
  }
}

}  // namespace test
}  // namespace deepresearch
