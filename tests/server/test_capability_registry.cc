#include <gtest/gtest.h>

#include "deepresearch/errors.h"
#include "deepresearch/server/capability_registry.h"

using namespace deepresearch;
using namespace deepresearch::server;

TEST(CapabilityRegistryTest, ListsBothResourcesInOrder) {
  CapabilityRegistry registry;
  const auto& resources = registry.listResources();

  ASSERT_EQ(resources.size(), 2u);
  EXPECT_EQ(resources[0].uri, "research://notes");
  EXPECT_EQ(resources[0].name, "Research Process Notes");
  EXPECT_EQ(resources[0].description.value(),
            "Notes generated during the research process");
  EXPECT_EQ(resources[0].mimeType.value(), "text/plain");

  EXPECT_EQ(resources[1].uri, "research://data");
  EXPECT_EQ(resources[1].name, "Research Data");
  EXPECT_EQ(resources[1].description.value(),
            "Structured data collected during the research process");
  EXPECT_EQ(resources[1].mimeType.value(), "application/json");
}

TEST(CapabilityRegistryTest, ListsSinglePrompt) {
  CapabilityRegistry registry;
  ASSERT_EQ(registry.listPrompts().size(), 1u);
  EXPECT_EQ(registry.listPrompts()[0].name, "deep-research");
}

TEST(CapabilityRegistryTest, NoTools) {
  CapabilityRegistry registry;
  EXPECT_TRUE(registry.listTools().empty());
}

TEST(CapabilityRegistryTest, ListingIsStable) {
  CapabilityRegistry registry;
  EXPECT_EQ(&registry.listResources(), &registry.listResources());
  EXPECT_EQ(registry.listResources().size(), 2u);
}

TEST(CapabilityRegistryTest, ResolveResource) {
  CapabilityRegistry registry;
  EXPECT_EQ(registry.resolveResource(kDataResourceUri).name, "Research Data");

  try {
    registry.resolveResource("research://other");
    FAIL() << "Expected UnknownResourceError";
  } catch (const UnknownResourceError& e) {
    EXPECT_STREQ(e.what(), "Unknown resource: research://other");
    EXPECT_EQ(e.uri(), "research://other");
  }
}

TEST(CapabilityRegistryTest, ResolveIsExactMatch) {
  CapabilityRegistry registry;
  EXPECT_THROW(registry.resolveResource("research://notes/"),
               UnknownResourceError);
  EXPECT_THROW(registry.resolveResource("RESEARCH://NOTES"),
               UnknownResourceError);
  EXPECT_THROW(registry.resolvePrompt("Deep-Research"), UnknownPromptError);
}
