#include "core/redaction_engine.hpp"

#include <algorithm>
#include <utility>
#include "core/placeholder.hpp"
#include "util/logger.hpp"

namespace keystone {
namespace core {

namespace {

// Tokens longer than this are not looked at when reserving literal slots.
const size_t kMaxTokenScan = 96;

struct Piece
{
    bool isToken;
    std::string text;
};

// Reserve every placeholder-shaped literal already present in the input.
size_t reserveLiteralTokens(const std::string &text, PlaceholderAllocator &allocator)
{
    size_t reserved = 0;
    size_t open = text.find('[');
    size_t close = 0;
    while (open != std::string::npos) {
        // the last ']' found is reused while it is still ahead of this '['
        if (close <= open) {
            close = text.find(']', open + 1);
            if (close == std::string::npos) {
                break;
            }
        }
        size_t nextOpen = text.find('[', open + 1);
        if (close - open + 1 <= kMaxTokenScan && (nextOpen == std::string::npos || nextOpen > close)) {
            ParsedToken parsed;
            uint64_t ordinal = 0;
            if (ParseToken(text.substr(open, close - open + 1), parsed) &&
                slot::Decode(parsed.slotLetters, ordinal)) {
                allocator.Reserve(parsed.categoryName, ordinal);
                ++reserved;
            }
        }
        open = nextOpen;
    }
    return reserved;
}

// Copy a verbatim segment into pieces, replacing any further occurrence of
// an already redacted value. Values are tried longest first.
void sweepSegment(const std::string &segment,
                  const std::vector<const MapEntry*> &byLength,
                  std::vector<Piece> &out,
                  size_t &propagated)
{
    std::string pending;
    size_t i = 0;
    while (i < segment.size()) {
        const MapEntry *hit = nullptr;
        for (const MapEntry *entry : byLength) {
            if (segment.compare(i, entry->value.size(), entry->value) == 0) {
                hit = entry;
                break;
            }
        }
        if (hit) {
            if (!pending.empty()) {
                out.push_back(Piece{false, pending});
                pending.clear();
            }
            out.push_back(Piece{true, hit->token});
            i += hit->value.size();
            ++propagated;
        } else {
            pending.push_back(segment[i]);
            ++i;
        }
    }
    if (!pending.empty()) {
        out.push_back(Piece{false, pending});
    }
}

// Every occurrence of a value must lie inside an emitted token.
void verifyNoLeak(const std::string &output,
                  const std::vector<std::pair<size_t, size_t>> &tokenRanges,
                  const RedactionMap &map)
{
    for (const MapEntry *entry : map.Entries()) {
        const std::string &value = entry->value;
        size_t pos = output.find(value);
        while (pos != std::string::npos) {
            auto it = std::upper_bound(tokenRanges.begin(), tokenRanges.end(),
                                       std::make_pair(pos, static_cast<size_t>(-1)));
            bool covered = false;
            if (it != tokenRanges.begin()) {
                --it;
                covered = it->first <= pos && pos + value.size() <= it->second;
            }
            if (!covered) {
                throw LeakDetectedError(entry->token, pos);
            }
            pos = output.find(value, pos + 1);
        }
    }
}

} // namespace

bool RedactionEngine::passesFilters(const EntitySpan &span) const
{
    if (span.confidence < m_options.minConfidence) {
        return false;
    }
    if (m_options.labelsToRedact.empty()) {
        return true;
    }
    return std::find(m_options.labelsToRedact.begin(), m_options.labelsToRedact.end(),
                     span.category.Name()) != m_options.labelsToRedact.end();
}

RedactionResult RedactionEngine::Redact(const std::string &text,
                                        const std::vector<EntitySpan> &spans) const
{
    using keystone::util::logger::Logger;
    Logger &logger = Logger::getInstance();

    RedactionResult result;
    RedactionStats &stats = result.stats;
    PlaceholderAllocator allocator(result.map, m_options.maxSlotsPerCategory);

    // 1) validate and filter
    std::vector<size_t> candidates;
    candidates.reserve(spans.size());
    for (size_t i = 0; i < spans.size(); ++i) {
        const EntitySpan &span = spans[i];
        std::string reason;
        if (span.start >= span.end) {
            reason = "empty or inverted range [" + std::to_string(span.start) + ", " +
                     std::to_string(span.end) + ")";
        } else if (span.end > text.size()) {
            reason = "end offset " + std::to_string(span.end) + " beyond text length " +
                     std::to_string(text.size());
        }
        if (!reason.empty()) {
            logger.warn("[RedactionEngine] InvalidSpan #" + std::to_string(i) + " (" +
                        span.category.Name() + "): " + reason);
            stats.invalidSpans.push_back(SpanError{i, reason});
            continue;
        }
        if (!passesFilters(span)) {
            ++stats.filteredSpans;
            continue;
        }
        candidates.push_back(i);
    }

    // 2) order: start asc, length desc, confidence desc, detector order
    std::stable_sort(candidates.begin(), candidates.end(), [&spans](size_t a, size_t b) {
        const EntitySpan &sa = spans[a];
        const EntitySpan &sb = spans[b];
        if (sa.start != sb.start) {
            return sa.start < sb.start;
        }
        if (sa.Length() != sb.Length()) {
            return sa.Length() > sb.Length();
        }
        return sa.confidence > sb.confidence;
    });

    // 3) drop spans that start inside an already accepted one
    std::vector<size_t> accepted;
    size_t lastEnd = 0;
    for (size_t idx : candidates) {
        if (!accepted.empty() && spans[idx].start < lastEnd) {
            ++stats.discardedOverlaps;
            logger.debug("[RedactionEngine] Discarded overlapping span #" + std::to_string(idx) +
                         " (" + spans[idx].category.Name() + ")");
            continue;
        }
        accepted.push_back(idx);
        lastEnd = spans[idx].end;
    }

    // 4) keep literal tokens in the input from colliding with issued ones
    stats.reservedTokens = reserveLiteralTokens(text, allocator);

    // 5) allocate and splice, left to right
    std::vector<Piece> pieces;
    size_t cursor = 0;
    for (size_t idx : accepted) {
        const EntitySpan &span = spans[idx];
        const std::string value = text.substr(span.start, span.Length());
        if (!span.text.empty() && span.text != value) {
            ++stats.textMismatches;
            logger.warn("[RedactionEngine] Span #" + std::to_string(idx) +
                        " text differs from source; redacting by offsets");
        }

        Placeholder placeholder = allocator.Allocate(span.category, value);

        if (span.start > cursor) {
            pieces.push_back(Piece{false, text.substr(cursor, span.start - cursor)});
        }
        pieces.push_back(Piece{true, placeholder.Render()});
        ++stats.placedPerCategory[span.category.Name()];
        cursor = span.end;
    }
    if (cursor < text.size()) {
        pieces.push_back(Piece{false, text.substr(cursor)});
    }

    // 6) repeat sweep over the verbatim pieces
    std::vector<const MapEntry*> byLength = result.map.Entries();
    std::stable_sort(byLength.begin(), byLength.end(), [](const MapEntry *a, const MapEntry *b) {
        return a->value.size() > b->value.size();
    });

    std::vector<Piece> swept;
    swept.reserve(pieces.size());
    for (const Piece &piece : pieces) {
        if (piece.isToken || byLength.empty()) {
            swept.push_back(piece);
        } else {
            sweepSegment(piece.text, byLength, swept, stats.propagated);
        }
    }

    // 7) assemble and verify
    std::vector<std::pair<size_t, size_t>> tokenRanges;
    for (const Piece &piece : swept) {
        if (piece.isToken) {
            tokenRanges.emplace_back(result.redactedText.size(),
                                     result.redactedText.size() + piece.text.size());
        }
        result.redactedText += piece.text;
    }
    verifyNoLeak(result.redactedText, tokenRanges, result.map);

    result.map.Seal();

    logger.info("[RedactionEngine] Placed " + std::to_string(stats.TotalPlaced()) +
                " spans, " + std::to_string(result.map.Size()) + " placeholders, " +
                std::to_string(stats.discardedOverlaps) + " overlaps discarded, " +
                std::to_string(stats.invalidSpans.size()) + " invalid spans, " +
                std::to_string(stats.propagated) + " repeats propagated");
    return result;
}

} // namespace core
} // namespace keystone
