#include <gtest/gtest.h>
#include "policy_config.hpp"

using namespace slack_cleaner;

TEST(PolicyConfig, NormalizesDomains) {
    auto policy = PolicyConfig::create({"ACME.com", "@Contractor.IO", "acme.com"}, std::nullopt, false);
    EXPECT_EQ(policy.target_domains(), (std::set<std::string>{"acme.com", "contractor.io"}));
    EXPECT_FALSE(policy.inactivity_threshold().has_value());
    EXPECT_FALSE(policy.live());
}

TEST(PolicyConfig, ConvertsDaysToThreshold) {
    auto policy = PolicyConfig::create({}, 30, true);
    ASSERT_TRUE(policy.inactivity_threshold().has_value());
    EXPECT_EQ(policy.inactivity_threshold()->count(), 30 * 86400);
    EXPECT_EQ(policy.inactivity_days(), std::optional<int>(30));
    EXPECT_TRUE(policy.live());
    EXPECT_TRUE(policy.target_domains().empty());
}

TEST(PolicyConfig, ZeroDaysIsAllowed) {
    auto policy = PolicyConfig::create({}, 0, false);
    EXPECT_EQ(policy.inactivity_threshold()->count(), 0);
}

TEST(PolicyConfig, RejectsInvalidInput) {
    EXPECT_THROW(PolicyConfig::create({}, -1, false), std::invalid_argument);
    EXPECT_THROW(PolicyConfig::create({""}, std::nullopt, false), std::invalid_argument);
    EXPECT_THROW(PolicyConfig::create({"@"}, std::nullopt, false), std::invalid_argument);
    EXPECT_THROW(PolicyConfig::create({"*"}, std::nullopt, false), std::invalid_argument);
    EXPECT_THROW(PolicyConfig::create({"*.acme.com"}, std::nullopt, false), std::invalid_argument);
    EXPECT_THROW(PolicyConfig::create({"acme .com"}, std::nullopt, false), std::invalid_argument);
    EXPECT_THROW(PolicyConfig::create({"user@acme.com"}, std::nullopt, false), std::invalid_argument);
}
