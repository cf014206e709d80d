#ifndef KEYSTONE_DETECTION_PATTERN_DETECTOR_HPP
#define KEYSTONE_DETECTION_PATTERN_DETECTOR_HPP

#include <regex>
#include <string>
#include <vector>
#include "core/entity.hpp"
#include "util/logger.hpp"

/**
 * @file pattern_detector.hpp
 * @brief Regex-based entity detector for the structured kinds of PII.
 *
 * DESIGN GOALS:
 *   - Find emails, US phone numbers, US SSNs and dollar amounts.
 *   - Report every match as an EntitySpan with confidence 1.0; overlaps
 *     (an SSN-shaped run inside a phone-shaped one) are left for the
 *     redaction engine's overlap policy.
 *   - Names, dates, organisations and places need a statistical model and
 *     are out of scope here. Spans from such a model can be appended to the
 *     result before redaction.
 *
 * USAGE EXAMPLE:
 *   @code
 *   keystone::detection::PatternDetector detector;
 *   std::vector<keystone::core::EntitySpan> spans = detector.Detect(text);
 *   @endcode
 */

namespace keystone {
namespace detection {

class PatternDetector
{
public:
    PatternDetector() = default;

    std::vector<core::EntitySpan> Detect(const std::string &text) const
    {
        using core::EntityCategory;

        std::vector<core::EntitySpan> spans;
        collect(text, emailPattern(), EntityCategory::Kind::EMAIL, spans);
        collect(text, phonePattern(), EntityCategory::Kind::PHONE, spans);
        collect(text, ssnPattern(), EntityCategory::Kind::ID, spans);
        collect(text, moneyPattern(), EntityCategory::Kind::MONEY, spans);

        keystone::util::logger::debug("[PatternDetector] Found " + std::to_string(spans.size()) +
                                      " pattern spans");
        return spans;
    }

private:
    static void collect(const std::string &text,
                        const std::regex &pattern,
                        core::EntityCategory::Kind kind,
                        std::vector<core::EntitySpan> &out)
    {
        auto begin = std::sregex_iterator(text.begin(), text.end(), pattern);
        auto end = std::sregex_iterator();
        for (auto it = begin; it != end; ++it) {
            const size_t start = static_cast<size_t>(it->position(0));
            const size_t length = static_cast<size_t>(it->length(0));
            out.emplace_back(core::EntityCategory(kind), start, start + length, it->str(0), 1.0);
        }
    }

    // Quantifiers stay bounded: the regex executor recurses per matched
    // character, so an unbounded run overflows the stack on long words.
    static const std::regex& emailPattern()
    {
        static const std::regex r(R"([A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,253}\.[A-Za-z]{2,63})");
        return r;
    }

    // (###) ###-#### or ###-###-####
    static const std::regex& phonePattern()
    {
        static const std::regex r(R"(\(\d{3}\)\s?\d{3}-\d{4}|\b\d{3}-\d{3}-\d{4}\b)");
        return r;
    }

    static const std::regex& ssnPattern()
    {
        static const std::regex r(R"(\b\d{3}-\d{2}-\d{4}\b)");
        return r;
    }

    // $750, $1,250.00, $0.99
    static const std::regex& moneyPattern()
    {
        static const std::regex r(R"(\$\d{1,3}(?:,\d{3})+(?:\.\d{2})?|\$\d+(?:\.\d{2})?)");
        return r;
    }
};

} // namespace detection
} // namespace keystone

#endif // KEYSTONE_DETECTION_PATTERN_DETECTOR_HPP
