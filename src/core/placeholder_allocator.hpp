#ifndef KEYSTONE_CORE_PLACEHOLDER_ALLOCATOR_HPP
#define KEYSTONE_CORE_PLACEHOLDER_ALLOCATOR_HPP

#include <cstdint>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include "core/entity.hpp"
#include "core/errors.hpp"
#include "core/placeholder.hpp"
#include "core/redaction_map.hpp"

namespace keystone {
namespace core {

/*
  PlaceholderAllocator
  --------------------------------
  Issues placeholders for one session and records them in that session's
  RedactionMap.

  - Allocate(category, value) is idempotent per (category, value).
  - A new value receives the next free ordinal of its category: A, B, ...,
    Z, AA, ... Ordinals are never reused and never skipped except for
    reserved ones.
  - Reserve(category, ordinal) marks a slot already spelled out in the raw
    input, so the allocator never issues a token identical to literal text.
  - Past maxSlotsPerCategory, Allocate throws AllocationExhaustedError.

  All counters live in the instance. A host that pools allocators must call
  Reset() with a fresh map before reusing one for another session.
  Not thread-safe; a session is used by one thread at a time.
*/
class PlaceholderAllocator
{
public:
    static constexpr uint64_t kDefaultMaxSlots = 18278;  // A .. ZZZ

    explicit PlaceholderAllocator(RedactionMap &map, uint64_t maxSlotsPerCategory = kDefaultMaxSlots)
        : m_map(&map), m_maxSlots(maxSlotsPerCategory)
    {
        if (m_maxSlots == 0) {
            throw std::invalid_argument("PlaceholderAllocator: maxSlotsPerCategory must be positive");
        }
    }

    Placeholder Allocate(const EntityCategory &category, const std::string &value)
    {
        if (const MapEntry *existing = m_map->FindByValue(category, value)) {
            return existing->placeholder;
        }

        uint64_t &next = m_nextOrdinal[category.Name()];
        while (next < m_maxSlots && isReserved(category.Name(), next)) {
            ++next;
        }
        if (next >= m_maxSlots) {
            throw AllocationExhaustedError(category.Name(), m_maxSlots);
        }

        Placeholder placeholder(category, next);
        m_map->Insert(placeholder, value);
        ++next;
        return placeholder;
    }

    void Reserve(const std::string &categoryName, uint64_t ordinal)
    {
        m_reserved[categoryName].insert(ordinal);
    }

    // Clears counters and reservations and binds to a new, empty map.
    void Reset(RedactionMap &freshMap)
    {
        if (!freshMap.Empty()) {
            throw std::logic_error("PlaceholderAllocator: Reset requires an empty map");
        }
        m_map = &freshMap;
        m_nextOrdinal.clear();
        m_reserved.clear();
    }

    // Next ordinal that would be considered for the category (0 if unused).
    uint64_t NextOrdinal(const std::string &categoryName) const
    {
        auto it = m_nextOrdinal.find(categoryName);
        return it == m_nextOrdinal.end() ? 0 : it->second;
    }

    uint64_t MaxSlots() const { return m_maxSlots; }

private:
    bool isReserved(const std::string &categoryName, uint64_t ordinal) const
    {
        auto it = m_reserved.find(categoryName);
        return it != m_reserved.end() && it->second.count(ordinal) != 0;
    }

    RedactionMap *m_map;
    uint64_t m_maxSlots;
    std::map<std::string, uint64_t> m_nextOrdinal;
    std::map<std::string, std::set<uint64_t>> m_reserved;
};

} // namespace core
} // namespace keystone

#endif // KEYSTONE_CORE_PLACEHOLDER_ALLOCATOR_HPP
