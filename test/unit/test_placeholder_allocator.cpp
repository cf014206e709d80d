// test/unit/test_placeholder_allocator.cpp
// -----------------------------------------------------------
// PlaceholderAllocator and RedactionMap: dedup, slot order, exhaustion,
// reservation, reset and sealing.

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#include "core/errors.hpp"
#include "core/placeholder_allocator.hpp"
#include "core/redaction_map.hpp"

namespace {

using keystone::core::AllocationExhaustedError;
using keystone::core::EntityCategory;
using keystone::core::Placeholder;
using keystone::core::PlaceholderAllocator;
using keystone::core::RedactionMap;

const EntityCategory kPerson(EntityCategory::Kind::PERSON);
const EntityCategory kLocation(EntityCategory::Kind::LOCATION);

TEST(PlaceholderAllocatorTest, SameValueSamePlaceholder) {
    RedactionMap map;
    PlaceholderAllocator allocator(map);

    Placeholder first = allocator.Allocate(kPerson, "Evelyn Reed");
    Placeholder again = allocator.Allocate(kPerson, "Evelyn Reed");

    EXPECT_EQ(first.Render(), "[PERSON_A]");
    EXPECT_TRUE(first == again);
    EXPECT_EQ(map.Size(), (size_t)1);
}

TEST(PlaceholderAllocatorTest, DistinctValuesGetSuccessiveSlots) {
    RedactionMap map;
    PlaceholderAllocator allocator(map);

    EXPECT_EQ(allocator.Allocate(kPerson, "Alice").Render(), "[PERSON_A]");
    EXPECT_EQ(allocator.Allocate(kPerson, "Bob").Render(), "[PERSON_B]");
    EXPECT_EQ(allocator.Allocate(kPerson, "Carol").Render(), "[PERSON_C]");
    EXPECT_EQ(allocator.Allocate(kLocation, "Berlin").Render(), "[LOCATION_A]");
    EXPECT_EQ(allocator.NextOrdinal("PERSON"), (uint64_t)3);
    EXPECT_EQ(allocator.NextOrdinal("EMAIL"), (uint64_t)0);
}

TEST(PlaceholderAllocatorTest, MatchingIsExactAndPerCategory) {
    RedactionMap map;
    PlaceholderAllocator allocator(map);

    EXPECT_EQ(allocator.Allocate(kPerson, "Jordan").Render(), "[PERSON_A]");
    EXPECT_EQ(allocator.Allocate(kLocation, "Jordan").Render(), "[LOCATION_A]");
    EXPECT_EQ(allocator.Allocate(kPerson, "jordan").Render(), "[PERSON_B]");
    EXPECT_EQ(allocator.Allocate(kPerson, "Jordan ").Render(), "[PERSON_C]");
    EXPECT_EQ(map.Size(), (size_t)4);
}

TEST(PlaceholderAllocatorTest, ContinuesPastZIntoTwoLetterSlots) {
    RedactionMap map;
    PlaceholderAllocator allocator(map);

    std::string last;
    for (int i = 0; i < 28; ++i) {
        last = allocator.Allocate(kPerson, "person-" + std::to_string(i)).Render();
    }
    EXPECT_EQ(last, "[PERSON_AB]");
    EXPECT_NE(map.FindByToken("[PERSON_Z]"), nullptr);
    EXPECT_NE(map.FindByToken("[PERSON_AA]"), nullptr);
}

TEST(PlaceholderAllocatorTest, ExhaustionThrowsInsteadOfColliding) {
    RedactionMap map;
    PlaceholderAllocator allocator(map, 2);

    allocator.Allocate(kPerson, "Alice");
    allocator.Allocate(kPerson, "Bob");
    // an existing value still resolves
    EXPECT_EQ(allocator.Allocate(kPerson, "Alice").Render(), "[PERSON_A]");

    try {
        allocator.Allocate(kPerson, "Carol");
        FAIL() << "expected AllocationExhaustedError";
    } catch (const AllocationExhaustedError& ex) {
        EXPECT_EQ(ex.Category(), "PERSON");
        EXPECT_EQ(ex.Limit(), (uint64_t)2);
    }
    // other categories are unaffected
    EXPECT_EQ(allocator.Allocate(kLocation, "Berlin").Render(), "[LOCATION_A]");
}

TEST(PlaceholderAllocatorTest, ReservedSlotsAreSkipped) {
    RedactionMap map;
    PlaceholderAllocator allocator(map);
    allocator.Reserve("PERSON", 0);
    allocator.Reserve("PERSON", 2);

    EXPECT_EQ(allocator.Allocate(kPerson, "Alice").Render(), "[PERSON_B]");
    EXPECT_EQ(allocator.Allocate(kPerson, "Bob").Render(), "[PERSON_D]");
    EXPECT_EQ(allocator.Allocate(kLocation, "Berlin").Render(), "[LOCATION_A]");
}

TEST(PlaceholderAllocatorTest, ResetStartsOverOnAFreshMap) {
    RedactionMap first;
    PlaceholderAllocator allocator(first);
    allocator.Allocate(kPerson, "Alice");
    allocator.Allocate(kPerson, "Bob");
    allocator.Reserve("PERSON", 5);

    EXPECT_THROW(allocator.Reset(first), std::logic_error);

    RedactionMap second;
    allocator.Reset(second);
    EXPECT_EQ(allocator.NextOrdinal("PERSON"), (uint64_t)0);
    EXPECT_EQ(allocator.Allocate(kPerson, "Bob").Render(), "[PERSON_A]");
    EXPECT_EQ(second.Size(), (size_t)1);
    EXPECT_EQ(first.Size(), (size_t)2);
}

TEST(PlaceholderAllocatorTest, ZeroSlotBudgetIsRejected) {
    RedactionMap map;
    EXPECT_THROW(PlaceholderAllocator(map, 0), std::invalid_argument);
}

TEST(RedactionMapTest, ForwardAndReverseLookups) {
    RedactionMap map;
    PlaceholderAllocator allocator(map);
    allocator.Allocate(kPerson, "Jane Doe");

    std::string value;
    ASSERT_TRUE(map.Lookup("[PERSON_A]", value));
    EXPECT_EQ(value, "Jane Doe");
    EXPECT_FALSE(map.Lookup("[PERSON_B]", value));

    ASSERT_NE(map.FindByValue(kPerson, "Jane Doe"), nullptr);
    EXPECT_EQ(map.FindByValue(kPerson, "Jane Doe")->token, "[PERSON_A]");
    EXPECT_EQ(map.FindByValue(kLocation, "Jane Doe"), nullptr);
    EXPECT_TRUE(map.HasCategory("PERSON"));
    EXPECT_FALSE(map.HasCategory("DATE"));
}

TEST(RedactionMapTest, SealedMapRejectsInserts) {
    RedactionMap map;
    PlaceholderAllocator allocator(map);
    allocator.Allocate(kPerson, "Jane Doe");
    map.Seal();

    EXPECT_TRUE(map.IsSealed());
    EXPECT_THROW(allocator.Allocate(kPerson, "John Roe"), std::logic_error);
    // lookups of existing values still work
    EXPECT_EQ(allocator.Allocate(kPerson, "Jane Doe").Render(), "[PERSON_A]");
}

TEST(RedactionMapTest, DuplicateTokenIsALogicError) {
    RedactionMap map;
    map.Insert(Placeholder(kPerson, 0), "Alice");
    EXPECT_THROW(map.Insert(Placeholder(kPerson, 0), "Bob"), std::logic_error);
    EXPECT_THROW(map.Insert(Placeholder(kPerson, 1), "Alice"), std::logic_error);
}

} // anonymous namespace
