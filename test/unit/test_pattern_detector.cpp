// test/unit/test_pattern_detector.cpp
// -----------------------------------------------------------
// PatternDetector: structured PII kinds and their offsets.

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "core/redaction_engine.hpp"
#include "detection/pattern_detector.hpp"

namespace {

using keystone::core::EntityCategory;
using keystone::core::EntitySpan;
using keystone::detection::PatternDetector;

std::vector<std::string> valuesOf(const std::string &text, const std::vector<EntitySpan> &spans,
                                  EntityCategory::Kind kind)
{
    std::vector<std::string> out;
    for (const auto &span : spans) {
        if (span.category.GetKind() == kind) {
            out.push_back(text.substr(span.start, span.end - span.start));
        }
    }
    return out;
}

TEST(PatternDetectorTest, FindsEmailAddresses) {
    const std::string text = "Write to e.reed@science-corp.net or ops+alerts@example.co.uk.";
    auto spans = PatternDetector().Detect(text);

    auto emails = valuesOf(text, spans, EntityCategory::Kind::EMAIL);
    ASSERT_EQ(emails.size(), (size_t)2);
    EXPECT_EQ(emails[0], "e.reed@science-corp.net");
    EXPECT_EQ(emails[1], "ops+alerts@example.co.uk");
}

TEST(PatternDetectorTest, FindsPhoneNumbers) {
    const std::string text = "Call (555) 123-4567 or 555-987-6543 today.";
    auto spans = PatternDetector().Detect(text);

    auto phones = valuesOf(text, spans, EntityCategory::Kind::PHONE);
    ASSERT_EQ(phones.size(), (size_t)2);
    EXPECT_EQ(phones[0], "(555) 123-4567");
    EXPECT_EQ(phones[1], "555-987-6543");
    EXPECT_TRUE(valuesOf(text, spans, EntityCategory::Kind::ID).empty());
}

TEST(PatternDetectorTest, FindsSocialSecurityNumbers) {
    const std::string text = "SSN 123-45-6789 on file.";
    auto spans = PatternDetector().Detect(text);

    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].category.GetKind(), EntityCategory::Kind::ID);
    EXPECT_EQ(spans[0].start, (size_t)4);
    EXPECT_EQ(spans[0].end, (size_t)15);
    EXPECT_EQ(spans[0].text, "123-45-6789");
    EXPECT_DOUBLE_EQ(spans[0].confidence, 1.0);
}

TEST(PatternDetectorTest, FindsDollarAmounts) {
    const std::string text = "Budget $750, stretch $1,250.00, coffee $0.99.";
    auto spans = PatternDetector().Detect(text);

    auto amounts = valuesOf(text, spans, EntityCategory::Kind::MONEY);
    ASSERT_EQ(amounts.size(), (size_t)3);
    EXPECT_EQ(amounts[0], "$750");
    EXPECT_EQ(amounts[1], "$1,250.00");
    EXPECT_EQ(amounts[2], "$0.99");
}

TEST(PatternDetectorTest, VeryLongWordsDoNotExhaustTheStack) {
    const std::string longLocal = "contact " + std::string(200000, 'a') + "@example.com";
    auto spans = PatternDetector().Detect(longLocal);
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].category.GetKind(), EntityCategory::Kind::EMAIL);
    EXPECT_EQ(spans[0].end, longLocal.size());
    EXPECT_EQ(spans[0].text, std::string(64, 'a') + "@example.com");

    const std::string longDomain = "x@" + std::string(200000, 'b') + ".com";
    EXPECT_TRUE(PatternDetector().Detect(longDomain).empty());
}

TEST(PatternDetectorTest, PlainProseYieldsNothing) {
    EXPECT_TRUE(PatternDetector().Detect("The meeting moved to the afternoon.").empty());
}

TEST(PatternDetectorTest, SpansFeedTheRedactionEngine) {
    const std::string text = "Her contact email is e.reed@science-corp.net. The budget is $750.";
    auto spans = PatternDetector().Detect(text);

    auto result = keystone::core::RedactionEngine().Redact(text, spans);
    EXPECT_EQ(result.redactedText, "Her contact email is [EMAIL_A]. The budget is [MONEY_A].");
}

} // anonymous namespace
