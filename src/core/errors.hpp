#ifndef KEYSTONE_CORE_ERRORS_HPP
#define KEYSTONE_CORE_ERRORS_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace keystone {
namespace core {

// Base for errors that abort a whole redaction pass. When one is thrown no
// redacted text exists, so nothing can reach the generation service.
class RedactionError : public std::runtime_error
{
public:
    explicit RedactionError(const std::string &what) : std::runtime_error(what) {}
};

// The slot space of one category is used up.
class AllocationExhaustedError : public RedactionError
{
public:
    AllocationExhaustedError(const std::string &category, uint64_t limit)
        : RedactionError("AllocationExhausted: category " + category + " has used all " +
                         std::to_string(limit) + " placeholder slots"),
          m_category(category), m_limit(limit)
    {
    }

    const std::string& Category() const { return m_category; }
    uint64_t Limit() const { return m_limit; }

private:
    std::string m_category;
    uint64_t m_limit;
};

// A redacted value is still visible in the output outside a placeholder.
// The message names the placeholder and offset, never the value.
class LeakDetectedError : public RedactionError
{
public:
    LeakDetectedError(const std::string &token, size_t offset)
        : RedactionError("LeakDetected: value of " + token + " still present at offset " +
                         std::to_string(offset)),
          m_token(token), m_offset(offset)
    {
    }

    const std::string& Token() const { return m_token; }
    size_t Offset() const { return m_offset; }

private:
    std::string m_token;
    size_t m_offset;
};

/*
  SpanError
  --------------------------------
  An InvalidSpan condition: one detector span could not be applied. It is
  recorded in the pass statistics and the span is skipped; the pass goes on.
*/
struct SpanError
{
    size_t spanIndex;     // position in the detector's span sequence
    std::string reason;
};

} // namespace core
} // namespace keystone

#endif // KEYSTONE_CORE_ERRORS_HPP
