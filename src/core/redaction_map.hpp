#ifndef KEYSTONE_CORE_REDACTION_MAP_HPP
#define KEYSTONE_CORE_REDACTION_MAP_HPP

#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "core/entity.hpp"
#include "core/placeholder.hpp"

namespace keystone {
namespace core {

struct MapEntry
{
    Placeholder placeholder;
    std::string token;   // rendered placeholder
    std::string value;   // original text
};

/*
  RedactionMap
  --------------------------------
  Bidirectional association between placeholders and original values for one
  session.

    forward  token -> entry            one token resolves to exactly one value
    reverse  (category, value) -> token   identical values share a token

  Entries are only added through PlaceholderAllocator. Once the redaction pass
  completes the map is sealed and every further Insert throws.

  The map is move-only. A copy would be a second place the original values
  live, and maps are never shared between sessions.
*/
class RedactionMap
{
public:
    RedactionMap() : m_sealed(false) {}

    RedactionMap(const RedactionMap&) = delete;
    RedactionMap& operator=(const RedactionMap&) = delete;
    RedactionMap(RedactionMap&&) = default;
    RedactionMap& operator=(RedactionMap&&) = default;

    // Throws std::logic_error when sealed, or when the token or the
    // (category, value) pair is already present.
    const MapEntry& Insert(const Placeholder &placeholder, const std::string &value)
    {
        if (m_sealed) {
            throw std::logic_error("RedactionMap: insert into a sealed map");
        }
        const std::string token = placeholder.Render();
        const auto reverseKey = std::make_pair(placeholder.category.Name(), value);
        if (m_byToken.count(token) != 0) {
            throw std::logic_error("RedactionMap: token " + token + " already issued");
        }
        if (m_byValue.count(reverseKey) != 0) {
            throw std::logic_error("RedactionMap: value already mapped to " + m_byValue[reverseKey]);
        }

        auto inserted = m_byToken.emplace(token, MapEntry{placeholder, token, value});
        m_byValue.emplace(reverseKey, token);
        m_categories.insert(placeholder.category.Name());
        return inserted.first->second;
    }

    const MapEntry* FindByToken(const std::string &token) const
    {
        auto it = m_byToken.find(token);
        return it == m_byToken.end() ? nullptr : &it->second;
    }

    const MapEntry* FindByValue(const EntityCategory &category, const std::string &value) const
    {
        auto it = m_byValue.find(std::make_pair(category.Name(), value));
        if (it == m_byValue.end()) {
            return nullptr;
        }
        return FindByToken(it->second);
    }

    // Forward lookup by exact rendered token.
    bool Lookup(const std::string &token, std::string &valueOut) const
    {
        const MapEntry *entry = FindByToken(token);
        if (!entry) {
            return false;
        }
        valueOut = entry->value;
        return true;
    }

    bool HasCategory(const std::string &categoryName) const
    {
        return m_categories.count(categoryName) != 0;
    }

    // Entries ordered by token.
    std::vector<const MapEntry*> Entries() const
    {
        std::vector<const MapEntry*> out;
        out.reserve(m_byToken.size());
        for (const auto &kv : m_byToken) {
            out.push_back(&kv.second);
        }
        return out;
    }

    void Seal() { m_sealed = true; }
    bool IsSealed() const { return m_sealed; }

    size_t Size() const { return m_byToken.size(); }
    bool Empty() const { return m_byToken.empty(); }

private:
    std::map<std::string, MapEntry> m_byToken;
    std::map<std::pair<std::string, std::string>, std::string> m_byValue;
    std::set<std::string> m_categories;
    bool m_sealed;
};

} // namespace core
} // namespace keystone

#endif // KEYSTONE_CORE_REDACTION_MAP_HPP
