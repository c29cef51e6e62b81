#include <gtest/gtest.h>

#include "comparator_registry.h"

TEST(ComparatorRegistryTest, NormaliseTrimsAndLowercases) {
  EXPECT_EQ(ComparatorRegistry::normalise("  Hello World \t\r\n"),
            "hello world");
  EXPECT_EQ(ComparatorRegistry::normalise("   "), "");
  EXPECT_EQ(ComparatorRegistry::normalise(""), "");
}

TEST(ComparatorRegistryTest, DefaultRuleIgnoresCaseAndSurroundingSpace) {
  ComparatorRegistry registry;
  EXPECT_TRUE(registry.compare(0, "Nature ", "nature"));
  EXPECT_TRUE(registry.compare(7, " 10.1000/XYZ", "10.1000/xyz "));
  EXPECT_FALSE(registry.compare(0, "Nature", "Science"));
  // inner whitespace is significant
  EXPECT_FALSE(registry.compare(0, "a b", "a  b"));
}

TEST(ComparatorRegistryTest, PrefixStrippingIdentifierRule) {
  CellComparator pmcid = ComparatorRegistry::prefix_stripping("PMC");
  EXPECT_TRUE(pmcid("PMC12345", "pmc12345"));
  EXPECT_TRUE(pmcid("PMC12345", "12345"));
  EXPECT_TRUE(pmcid("12345", "pmc12345"));
  EXPECT_TRUE(pmcid(" PMC12345 ", "12345"));
  EXPECT_FALSE(pmcid("PMC12345", "PMC99999"));
  EXPECT_FALSE(pmcid("PMC12345", ""));
  // the prefix is stripped once, only at the start
  EXPECT_FALSE(pmcid("12345PMC", "12345"));
}

TEST(ComparatorRegistryTest, OverrideAppliesOnlyToItsColumn) {
  ComparatorRegistry registry;
  registry.register_override(2, ComparatorRegistry::prefix_stripping("pmc"));
  EXPECT_TRUE(registry.has_override(2));
  EXPECT_FALSE(registry.has_override(1));
  EXPECT_TRUE(registry.compare(2, "PMC1", "1"));
  EXPECT_FALSE(registry.compare(1, "PMC1", "1"));
}

TEST(ComparatorRegistryTest, LastRegistrationWins) {
  ComparatorRegistry registry;
  registry.register_override(
      0, [](const std::string&, const std::string&) { return false; });
  registry.register_override(
      0, [](const std::string&, const std::string&) { return true; });
  EXPECT_TRUE(registry.compare(0, "x", "y"));
}
