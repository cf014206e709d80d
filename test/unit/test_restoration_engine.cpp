// test/unit/test_restoration_engine.cpp
// -----------------------------------------------------------
// RestorationEngine: resolution, hallucinated and malformed tokens,
// single-pass substitution.

#include <gtest/gtest.h>
#include <string>

#include "core/placeholder_allocator.hpp"
#include "core/redaction_map.hpp"
#include "core/restoration_engine.hpp"

namespace {

using keystone::core::AnomalyReason;
using keystone::core::EntityCategory;
using keystone::core::PlaceholderAllocator;
using keystone::core::RedactionMap;
using keystone::core::RestorationEngine;
using keystone::core::RestorationResult;

class RestorationEngineTest : public ::testing::Test {
  protected:
    void SetUp() override {
        PlaceholderAllocator allocator(map_);
        allocator.Allocate(EntityCategory::Kind::PERSON, "Jane Doe");
        allocator.Allocate(EntityCategory::Kind::DATE, "March 3");
        map_.Seal();
    }

    RedactionMap map_;
};

TEST_F(RestorationEngineTest, ResolvesIssuedTokens) {
    RestorationResult result =
        RestorationEngine().Restore("[PERSON_A] will arrive on [DATE_A].", map_);
    EXPECT_EQ(result.restoredText, "Jane Doe will arrive on March 3.");
    EXPECT_TRUE(result.Clean());
    EXPECT_EQ(result.stats.resolved, (size_t)2);
}

TEST_F(RestorationEngineTest, HallucinatedPlaceholderIsLeftAndReported) {
    RestorationResult result =
        RestorationEngine().Restore("[PERSON_Z] said hi to [PERSON_A]", map_);

    EXPECT_EQ(result.restoredText, "[PERSON_Z] said hi to Jane Doe");
    ASSERT_EQ(result.anomalies.size(), (size_t)1);
    EXPECT_EQ(result.anomalies[0].token, "[PERSON_Z]");
    EXPECT_EQ(result.anomalies[0].reason, AnomalyReason::UnmappedPlaceholder);
    EXPECT_EQ(result.anomalies[0].offset, (size_t)0);
    EXPECT_EQ(result.stats.unmapped, (size_t)1);
    EXPECT_EQ(result.stats.resolved, (size_t)1);
}

TEST_F(RestorationEngineTest, BuiltInCategoryAbsentFromMapIsUnmapped) {
    RestorationResult result = RestorationEngine().Restore("Reach [EMAIL_A].", map_);
    EXPECT_EQ(result.restoredText, "Reach [EMAIL_A].");
    ASSERT_EQ(result.anomalies.size(), (size_t)1);
    EXPECT_EQ(result.anomalies[0].reason, AnomalyReason::UnmappedPlaceholder);
    EXPECT_EQ(result.anomalies[0].offset, (size_t)6);
}

TEST_F(RestorationEngineTest, MalformedTokensAreNeverResolved) {
    const std::string text = "[person_a] [PERSON_1] [FOO_A] [PERSON_A is here";
    RestorationResult result = RestorationEngine().Restore(text, map_);

    EXPECT_EQ(result.restoredText, text);
    ASSERT_EQ(result.anomalies.size(), (size_t)4);
    EXPECT_EQ(result.anomalies[0].token, "[person_a]");
    EXPECT_EQ(result.anomalies[1].token, "[PERSON_1]");
    EXPECT_EQ(result.anomalies[2].token, "[FOO_A]");
    EXPECT_EQ(result.anomalies[3].token, "[PERSON_A");
    for (const auto &anomaly : result.anomalies) {
        EXPECT_EQ(anomaly.reason, AnomalyReason::MalformedToken) << anomaly.token;
    }
    EXPECT_EQ(result.anomalies[1].offset, (size_t)11);
    EXPECT_EQ(result.stats.malformed, (size_t)4);
    EXPECT_EQ(result.stats.resolved, (size_t)0);
}

TEST_F(RestorationEngineTest, ExtraCategoriesAreWellFormed) {
    RestorationResult strict = RestorationEngine().Restore("[GPE_A]", map_);
    ASSERT_EQ(strict.anomalies.size(), (size_t)1);
    EXPECT_EQ(strict.anomalies[0].reason, AnomalyReason::MalformedToken);

    RestorationResult lenient = RestorationEngine({"GPE"}).Restore("[GPE_A]", map_);
    ASSERT_EQ(lenient.anomalies.size(), (size_t)1);
    EXPECT_EQ(lenient.anomalies[0].reason, AnomalyReason::UnmappedPlaceholder);
}

TEST_F(RestorationEngineTest, OrdinaryBracketsAreUntouched) {
    const std::string text = "See [citation needed] and [1] or [NOTE].";
    RestorationResult result = RestorationEngine().Restore(text, map_);
    EXPECT_EQ(result.restoredText, text);
    EXPECT_TRUE(result.Clean());
}

TEST_F(RestorationEngineTest, AdjacentAndNestedTokens) {
    RestorationResult result = RestorationEngine().Restore("[PERSON_A][DATE_A] [[PERSON_A]]", map_);
    EXPECT_EQ(result.restoredText, "Jane DoeMarch 3 [Jane Doe]");
    EXPECT_TRUE(result.Clean());
}

TEST_F(RestorationEngineTest, RestoringPlainTextIsANoOp) {
    RestorationEngine engine;
    RestorationResult once = engine.Restore("[PERSON_A] signed.", map_);
    RestorationResult twice = engine.Restore(once.restoredText, map_);
    EXPECT_EQ(twice.restoredText, once.restoredText);
    EXPECT_TRUE(twice.Clean());
    EXPECT_EQ(twice.stats.resolved, (size_t)0);
}

TEST_F(RestorationEngineTest, VeryLongMalformedRunIsReportedOnce) {
    const std::string run = "[LOG_" + std::string(2 * 1024 * 1024, 'a') + "]";
    RestorationResult result = RestorationEngine().Restore("Hi [PERSON_A], see " + run, map_);

    EXPECT_EQ(result.restoredText, "Hi Jane Doe, see " + run);
    EXPECT_EQ(result.stats.resolved, (size_t)1);
    ASSERT_EQ(result.anomalies.size(), (size_t)1);
    EXPECT_EQ(result.anomalies[0].reason, AnomalyReason::MalformedToken);
    EXPECT_EQ(result.anomalies[0].offset, (size_t)19);
    EXPECT_EQ(result.anomalies[0].token.size(), run.size());
}

TEST_F(RestorationEngineTest, ManyOpenBracketsWithoutTokens) {
    const std::string text = std::string(500000, '[') + "[PERSON_A]";
    RestorationResult result = RestorationEngine().Restore(text, map_);
    EXPECT_EQ(result.restoredText, std::string(500000, '[') + "Jane Doe");
    EXPECT_TRUE(result.Clean());
}

TEST(RestorationEngineSinglePassTest, SubstitutedValuesAreNotRescanned) {
    RedactionMap map;
    PlaceholderAllocator allocator(map);
    allocator.Allocate(EntityCategory::Kind::PERSON, "x [ORG_A] y");
    allocator.Allocate(EntityCategory::Kind::ORG, "Acme");
    map.Seal();

    RestorationResult result = RestorationEngine().Restore("[PERSON_A]", map);
    EXPECT_EQ(result.restoredText, "x [ORG_A] y");
    EXPECT_EQ(result.stats.resolved, (size_t)1);
    EXPECT_TRUE(result.Clean());
}

TEST(RestorationEngineSinglePassTest, CustomCategoryFromMapResolves) {
    RedactionMap map;
    PlaceholderAllocator allocator(map);
    allocator.Allocate(EntityCategory::Custom("CREDIT_CARD"), "4111 1111 1111 1111");
    map.Seal();

    RestorationResult result =
        RestorationEngine().Restore("Card [CREDIT_CARD_A], not [CREDIT_CARD_B].", map);
    EXPECT_EQ(result.restoredText, "Card 4111 1111 1111 1111, not [CREDIT_CARD_B].");
    ASSERT_EQ(result.anomalies.size(), (size_t)1);
    EXPECT_EQ(result.anomalies[0].reason, AnomalyReason::UnmappedPlaceholder);
}

TEST(RestorationEngineSinglePassTest, EmptyMapReportsEveryToken) {
    RedactionMap map;
    map.Seal();
    RestorationResult result = RestorationEngine().Restore("[PERSON_A] and [DATE_B]", map);
    EXPECT_EQ(result.restoredText, "[PERSON_A] and [DATE_B]");
    EXPECT_EQ(result.stats.unmapped, (size_t)2);
}

} // anonymous namespace
