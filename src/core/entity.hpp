#ifndef KEYSTONE_CORE_ENTITY_HPP
#define KEYSTONE_CORE_ENTITY_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace keystone {
namespace core {

/*
  EntityCategory
  --------------------------------
  The kind of a detected entity: one of the built-in kinds or a custom kind
  identified by an uppercase tag.

  A category's name is what appears inside a placeholder token, so every name
  must match the token grammar's category part:
      [A-Z][A-Z0-9]*(_[A-Z0-9]+)*
  Two categories are equal when their names are equal; Custom("PERSON") is the
  built-in PERSON.
*/
class EntityCategory
{
public:
    enum class Kind
    {
        PERSON,
        EMAIL,
        DATE,
        LOCATION,
        MONEY,
        PHONE,
        ID,
        ORG,
        CUSTOM
    };

    // Built-in kinds only; use Custom() for a tag.
    EntityCategory(Kind kind)
        : m_kind(kind), m_name(builtInName(kind))
    {
        if (kind == Kind::CUSTOM) {
            throw std::invalid_argument("EntityCategory: CUSTOM requires a tag, use EntityCategory::Custom");
        }
    }

    static EntityCategory Custom(const std::string &tag)
    {
        return FromName(tag);
    }

    // Maps a built-in name to its kind, anything else to a custom category.
    static EntityCategory FromName(const std::string &name)
    {
        for (Kind k : builtInKinds()) {
            if (name == builtInName(k)) {
                return EntityCategory(k);
            }
        }
        if (!IsValidTag(name)) {
            throw std::invalid_argument("EntityCategory: invalid category tag '" + name + "'");
        }
        EntityCategory c(Kind::PERSON);
        c.m_kind = Kind::CUSTOM;
        c.m_name = name;
        return c;
    }

    static bool IsValidTag(const std::string &tag)
    {
        if (tag.empty() || tag[0] < 'A' || tag[0] > 'Z') {
            return false;
        }
        bool prevUnderscore = false;
        for (char c : tag) {
            if (c == '_') {
                if (prevUnderscore) {
                    return false;
                }
                prevUnderscore = true;
            } else if ((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
                prevUnderscore = false;
            } else {
                return false;
            }
        }
        return !prevUnderscore;
    }

    static bool IsBuiltInName(const std::string &name)
    {
        for (Kind k : builtInKinds()) {
            if (name == builtInName(k)) {
                return true;
            }
        }
        return false;
    }

    static const std::vector<Kind>& builtInKinds()
    {
        static const std::vector<Kind> kinds = {
            Kind::PERSON, Kind::EMAIL, Kind::DATE, Kind::LOCATION,
            Kind::MONEY, Kind::PHONE, Kind::ID, Kind::ORG
        };
        return kinds;
    }

    Kind GetKind() const { return m_kind; }
    const std::string& Name() const { return m_name; }
    bool IsCustom() const { return m_kind == Kind::CUSTOM; }

    bool operator==(const EntityCategory &other) const { return m_name == other.m_name; }
    bool operator!=(const EntityCategory &other) const { return m_name != other.m_name; }
    bool operator<(const EntityCategory &other) const { return m_name < other.m_name; }

private:
    static std::string builtInName(Kind kind)
    {
        switch (kind) {
        case Kind::PERSON:   return "PERSON";
        case Kind::EMAIL:    return "EMAIL";
        case Kind::DATE:     return "DATE";
        case Kind::LOCATION: return "LOCATION";
        case Kind::MONEY:    return "MONEY";
        case Kind::PHONE:    return "PHONE";
        case Kind::ID:       return "ID";
        case Kind::ORG:      return "ORG";
        case Kind::CUSTOM:   break;
        }
        return std::string();
    }

    Kind m_kind;
    std::string m_name;
};

/*
  EntitySpan
  --------------------------------
  One detection reported by an external detector. Offsets are byte offsets
  into the UTF-8 source text, half open: [start, end).
  Spans from one detection pass may be unsorted and may overlap.
*/
struct EntitySpan
{
    EntitySpan(const EntityCategory &cat,
               size_t startOffset,
               size_t endOffset,
               const std::string &spanText = std::string(),
               double conf = 1.0)
        : category(cat), start(startOffset), end(endOffset), text(spanText), confidence(conf)
    {
    }

    EntityCategory category;
    size_t start;
    size_t end;
    std::string text;   // may be empty; the source substring is authoritative
    double confidence;

    size_t Length() const { return end > start ? end - start : 0; }
};

} // namespace core
} // namespace keystone

#endif // KEYSTONE_CORE_ENTITY_HPP
