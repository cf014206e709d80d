#include "core/restoration_engine.hpp"

#include "core/entity.hpp"
#include "core/placeholder.hpp"
#include "util/logger.hpp"

namespace keystone {
namespace core {

namespace {

// Tokens are quoted in log lines up to this many characters.
const size_t kMaxLoggedToken = 40;

bool isTokenChar(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
}

// Length of the placeholder-shaped candidate starting at text[open] == '[',
// or 0 if there is none: a letter, a run of [A-Za-z0-9_] containing at
// least one '_', and an optional ']'. Strictness is checked afterwards with
// ParseToken so renderer and parser share one definition.
size_t candidateLength(const std::string &text, size_t open)
{
    size_t pos = open + 1;
    if (pos >= text.size() || !((text[pos] >= 'A' && text[pos] <= 'Z') ||
                                (text[pos] >= 'a' && text[pos] <= 'z'))) {
        return 0;
    }
    bool underscore = false;
    while (pos < text.size() && isTokenChar(text[pos])) {
        underscore = underscore || text[pos] == '_';
        ++pos;
    }
    if (!underscore) {
        return 0;
    }
    if (pos < text.size() && text[pos] == ']') {
        ++pos;
    }
    return pos - open;
}

std::string loggable(const std::string &token)
{
    if (token.size() <= kMaxLoggedToken) {
        return token;
    }
    return token.substr(0, kMaxLoggedToken) + "... (" + std::to_string(token.size()) + " bytes)";
}

} // namespace

bool RestorationEngine::isKnownCategory(const std::string &name, const RedactionMap &map) const
{
    return EntityCategory::IsBuiltInName(name) || map.HasCategory(name) ||
           m_extraCategories.count(name) != 0;
}

RestorationResult RestorationEngine::Restore(const std::string &text, const RedactionMap &map) const
{
    using keystone::util::logger::Logger;
    Logger &logger = Logger::getInstance();

    RestorationResult result;
    result.restoredText.reserve(text.size());

    size_t cursor = 0;
    size_t open = text.find('[');
    while (open != std::string::npos) {
        const size_t length = candidateLength(text, open);
        if (length == 0) {
            open = text.find('[', open + 1);
            continue;
        }
        const size_t offset = open;
        const std::string token = text.substr(offset, length);

        result.restoredText.append(text, cursor, offset - cursor);
        cursor = offset + length;
        open = text.find('[', cursor);

        ParsedToken parsed;
        const bool wellFormed = token.back() == ']' && ParseToken(token, parsed) &&
                                isKnownCategory(parsed.categoryName, map);
        if (!wellFormed) {
            result.restoredText += token;
            result.anomalies.push_back(Anomaly{token, AnomalyReason::MalformedToken, offset});
            ++result.stats.malformed;
            logger.warn("[RestorationEngine] MalformedToken " + loggable(token) + " at offset " +
                        std::to_string(offset));
            continue;
        }

        const MapEntry *entry = map.FindByToken(token);
        if (!entry) {
            result.restoredText += token;
            result.anomalies.push_back(Anomaly{token, AnomalyReason::UnmappedPlaceholder, offset});
            ++result.stats.unmapped;
            logger.warn("[RestorationEngine] UnmappedPlaceholder " + loggable(token) + " at offset " +
                        std::to_string(offset));
            continue;
        }

        result.restoredText += entry->value;
        ++result.stats.resolved;
    }
    result.restoredText.append(text, cursor, std::string::npos);

    logger.info("[RestorationEngine] Resolved " + std::to_string(result.stats.resolved) +
                " tokens, " + std::to_string(result.stats.unmapped) + " unmapped, " +
                std::to_string(result.stats.malformed) + " malformed");
    return result;
}

} // namespace core
} // namespace keystone
