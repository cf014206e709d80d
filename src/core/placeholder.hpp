#ifndef KEYSTONE_CORE_PLACEHOLDER_HPP
#define KEYSTONE_CORE_PLACEHOLDER_HPP

#include <cstdint>
#include <string>
#include "core/entity.hpp"

/**
 * @file placeholder.hpp
 * @brief Placeholder value type and the token grammar shared by rendering
 *        and parsing.
 *
 * Token grammar (the only format this build emits or resolves):
 *
 *     "[" CATEGORY "_" SLOT "]"
 *     CATEGORY = [A-Z][A-Z0-9]*(_[A-Z0-9]+)*
 *     SLOT     = [A-Z]+
 *
 * SLOT is the bijective base-26 spelling of a zero-based ordinal:
 * 0 -> A, 25 -> Z, 26 -> AA, 701 -> ZZ, 702 -> AAA.
 * A token is split at its last underscore, so custom tags containing
 * underscores (CREDIT_CARD) stay unambiguous.
 */

namespace keystone {
namespace core {

namespace slot {

// Longest slot that still decodes into 64 bits.
constexpr size_t kMaxSlotLetters = 13;

inline std::string Encode(uint64_t ordinal)
{
    std::string out;
    uint64_t n = ordinal + 1;
    while (n > 0) {
        --n;
        out.insert(out.begin(), static_cast<char>('A' + (n % 26)));
        n /= 26;
    }
    return out;
}

inline bool Decode(const std::string &letters, uint64_t &ordinalOut)
{
    if (letters.empty() || letters.size() > kMaxSlotLetters) {
        return false;
    }
    uint64_t value = 0;
    for (char c : letters) {
        if (c < 'A' || c > 'Z') {
            return false;
        }
        value = value * 26 + static_cast<uint64_t>(c - 'A' + 1);
    }
    ordinalOut = value - 1;
    return true;
}

} // namespace slot

/*
  Placeholder
  --------------------------------
  (category, ordinal) pair issued by PlaceholderAllocator. Rendered as the
  bracketed token, e.g. {PERSON, 0} -> "[PERSON_A]".
*/
struct Placeholder
{
    Placeholder(const EntityCategory &cat, uint64_t ord)
        : category(cat), ordinal(ord)
    {
    }

    EntityCategory category;
    uint64_t ordinal;

    std::string Slot() const { return slot::Encode(ordinal); }

    std::string Render() const
    {
        return "[" + category.Name() + "_" + Slot() + "]";
    }

    bool operator==(const Placeholder &other) const
    {
        return category == other.category && ordinal == other.ordinal;
    }
};

/*
  ParsedToken
  --------------------------------
  Result of a strict parse. The category is kept as a name: whether that name
  is acceptable in a given restoration is decided by the caller.
*/
struct ParsedToken
{
    std::string categoryName;
    std::string slotLetters;
};

/**
 * @brief Strictly parse a whole token such as "[PERSON_A]".
 * @return true only if the token matches the grammar exactly.
 */
inline bool ParseToken(const std::string &token, ParsedToken &out)
{
    if (token.size() < 5 || token.front() != '[' || token.back() != ']') {
        return false;
    }
    const std::string inner = token.substr(1, token.size() - 2);
    const size_t split = inner.rfind('_');
    if (split == std::string::npos || split == 0 || split + 1 >= inner.size()) {
        return false;
    }
    const std::string category = inner.substr(0, split);
    const std::string letters = inner.substr(split + 1);
    if (!EntityCategory::IsValidTag(category)) {
        return false;
    }
    for (char c : letters) {
        if (c < 'A' || c > 'Z') {
            return false;
        }
    }
    out.categoryName = category;
    out.slotLetters = letters;
    return true;
}

} // namespace core
} // namespace keystone

#endif // KEYSTONE_CORE_PLACEHOLDER_HPP
