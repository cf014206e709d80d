#ifndef KEYSTONE_CORE_REDACTION_ENGINE_HPP
#define KEYSTONE_CORE_REDACTION_ENGINE_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "core/entity.hpp"
#include "core/errors.hpp"
#include "core/placeholder_allocator.hpp"
#include "core/redaction_map.hpp"

namespace keystone {
namespace core {

struct RedactionOptions
{
    // Spans below this confidence are left alone.
    double minConfidence = 0.0;

    uint64_t maxSlotsPerCategory = PlaceholderAllocator::kDefaultMaxSlots;

    // Category names to redact; empty means all.
    std::vector<std::string> labelsToRedact;
};

struct RedactionStats
{
    std::map<std::string, size_t> placedPerCategory;  // spans replaced, by category
    size_t discardedOverlaps = 0;
    size_t filteredSpans = 0;      // category filter or confidence threshold
    size_t textMismatches = 0;     // span.text disagreed with the source
    size_t propagated = 0;         // extra occurrences replaced by the repeat sweep
    size_t reservedTokens = 0;     // placeholder-shaped literals found in the input
    std::vector<SpanError> invalidSpans;

    size_t TotalPlaced() const
    {
        size_t total = 0;
        for (const auto &kv : placedPerCategory) {
            total += kv.second;
        }
        return total;
    }
};

struct RedactionResult
{
    std::string redactedText;
    RedactionMap map;     // sealed
    RedactionStats stats;
};

/*
  RedactionEngine
  --------------------------------
  Replaces detected spans with placeholders and builds the session map.

  Overlap policy. Spans are ordered by
      start ascending, length descending, confidence descending,
      then detector order,
  and walked left to right. A span that starts before the end of the last
  placed span is discarded. Earlier, then longer, then more confident spans
  win; a full tie keeps whichever the detector reported first.

  Guarantees:
  - text outside replaced spans is copied byte for byte;
  - identical (category, value) pairs share one placeholder;
  - no redacted value survives in the output outside a placeholder token.
    Occurrences the detector missed are replaced by a repeat sweep, and the
    finished output is verified; a failed check throws LeakDetectedError.

  Span problems (out of bounds, empty) are recorded as SpanError and skipped.
  AllocationExhaustedError and LeakDetectedError abort the pass; no partial
  output is returned.

  Stateless: each call gets a fresh map and allocator. Safe to share one
  engine between threads.
*/
class RedactionEngine
{
public:
    RedactionEngine() = default;
    explicit RedactionEngine(const RedactionOptions &options) : m_options(options) {}

    RedactionResult Redact(const std::string &text, const std::vector<EntitySpan> &spans) const;

    const RedactionOptions& GetOptions() const { return m_options; }

private:
    bool passesFilters(const EntitySpan &span) const;

    RedactionOptions m_options;
};

} // namespace core
} // namespace keystone

#endif // KEYSTONE_CORE_REDACTION_ENGINE_HPP
