#ifndef KEYSTONE_CORE_RESTORATION_ENGINE_HPP
#define KEYSTONE_CORE_RESTORATION_ENGINE_HPP

#include <cstddef>
#include <set>
#include <string>
#include <vector>
#include "core/redaction_map.hpp"

namespace keystone {
namespace core {

enum class AnomalyReason
{
    UnmappedPlaceholder,  // well-formed token the map never issued
    MalformedToken        // token-like text that breaks the grammar
};

inline std::string ToString(AnomalyReason reason)
{
    return reason == AnomalyReason::UnmappedPlaceholder ? "UnmappedPlaceholder" : "MalformedToken";
}

struct Anomaly
{
    std::string token;
    AnomalyReason reason;
    size_t offset;   // byte offset in the restoration input
};

struct RestorationStats
{
    size_t resolved = 0;
    size_t unmapped = 0;
    size_t malformed = 0;
};

struct RestorationResult
{
    std::string restoredText;
    std::vector<Anomaly> anomalies;
    RestorationStats stats;

    bool Clean() const { return anomalies.empty(); }
};

/*
  RestorationEngine
  --------------------------------
  Puts original values back into text returned by the generation service.

  The input is scanned once, left to right, for anything that looks like a
  placeholder: '[', an identifier containing at least one '_', and an
  optional ']'. Each such candidate is
    - replaced by its value when the exact token is in the map;
    - left as is and reported UnmappedPlaceholder when it is a well-formed
      token of a known category that the map never issued;
    - left as is and reported MalformedToken otherwise (lowercase, digits in
      the slot, unknown category, missing ']').

  Known categories are the built-ins, every category present in the map and
  the extra tags given at construction.

  Nothing is ever substituted for a token the map does not contain, and
  substituted values are not rescanned. Restoration never throws on its input.
*/
class RestorationEngine
{
public:
    RestorationEngine() = default;
    explicit RestorationEngine(const std::vector<std::string> &extraCategories)
        : m_extraCategories(extraCategories.begin(), extraCategories.end())
    {
    }

    RestorationResult Restore(const std::string &text, const RedactionMap &map) const;

private:
    bool isKnownCategory(const std::string &name, const RedactionMap &map) const;

    std::set<std::string> m_extraCategories;
};

} // namespace core
} // namespace keystone

#endif // KEYSTONE_CORE_RESTORATION_ENGINE_HPP
