#ifndef KEYSTONE_CORE_AUDIT_SINK_HPP
#define KEYSTONE_CORE_AUDIT_SINK_HPP

#include <cstddef>
#include <map>
#include <string>

namespace keystone {
namespace core {

// One record per redaction pass. Carries statistics and redacted text only.
struct RedactionAuditRecord
{
    std::string sessionId;
    std::map<std::string, size_t> placedPerCategory;
    size_t discardedOverlaps = 0;
    size_t invalidSpans = 0;
    size_t filteredSpans = 0;
    size_t propagated = 0;
    std::string redactedText;
};

// One record per restoration pass.
struct RestorationAuditRecord
{
    std::string sessionId;
    size_t resolved = 0;
    size_t unmapped = 0;
    size_t malformed = 0;
};

/*
  AuditSink
  --------------------------------
  Write-only destination for pass records. Implementations may throw; the
  session logs the failure and carries on, an audit problem never changes a
  redaction or restoration result.
*/
class AuditSink
{
public:
    virtual ~AuditSink() = default;

    virtual void RecordRedaction(const RedactionAuditRecord &record) = 0;
    virtual void RecordRestoration(const RestorationAuditRecord &record) = 0;
};

} // namespace core
} // namespace keystone

#endif // KEYSTONE_CORE_AUDIT_SINK_HPP
