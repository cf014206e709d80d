#ifndef KEYSTONE_CORE_REDACTION_SESSION_HPP
#define KEYSTONE_CORE_REDACTION_SESSION_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/audit_sink.hpp"
#include "core/entity.hpp"
#include "core/errors.hpp"
#include "core/redaction_engine.hpp"
#include "core/restoration_engine.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

namespace keystone {
namespace core {

/*
  RedactionSession
  --------------------------------
  One detect -> redact -> generate -> restore cycle over one input text.

  The session owns the input and the one RedactionMap produced for it. The
  map never leaves the session: callers get a const reference for
  inspection, Restore() always uses this session's map, and the map dies
  with the session.

  Lifecycle:
    RedactionSession session(text, options);
    session.Redact(spans);                // exactly once
    std::string prompt = session.GetRedactedText();
    ... external generation call ...
    RestorationResult r = session.Restore(modelOutput);   // any number of times

  Errors:
    - Redact() rethrows RedactionError subclasses (AllocationExhausted,
      LeakDetected); the session then holds no redacted text.
    - Redact() twice, or Restore()/GetRedactedText() before Redact(), throw
      std::logic_error.
    - Audit failures are logged at ERROR and never change results.

  Not copyable. Not internally synchronised.
*/
class RedactionSession
{
public:
    explicit RedactionSession(const std::string &inputText,
                              const RedactionOptions &options = RedactionOptions(),
                              const std::vector<std::string> &extraCategories = std::vector<std::string>())
        : m_inputText(inputText),
          m_sessionId(keystone::util::hashing::randomHex(16)),
          m_redactor(options),
          m_restorer(extraCategories),
          m_audit(nullptr)
    {
    }

    RedactionSession(const RedactionSession&) = delete;
    RedactionSession& operator=(const RedactionSession&) = delete;

    void SetAuditSink(AuditSink *sink) { m_audit = sink; }

    const RedactionResult& Redact(const std::vector<EntitySpan> &spans)
    {
        using keystone::util::logger::Logger;
        if (m_result) {
            throw std::logic_error("RedactionSession: session " + m_sessionId + " already redacted");
        }

        try {
            m_result = std::make_unique<RedactionResult>(m_redactor.Redact(m_inputText, spans));
        } catch (const RedactionError &ex) {
            Logger::getInstance().error("[RedactionSession] " + m_sessionId +
                                        " redaction aborted: " + ex.what());
            throw;
        }

        if (m_audit) {
            RedactionAuditRecord record;
            record.sessionId = m_sessionId;
            record.placedPerCategory = m_result->stats.placedPerCategory;
            record.discardedOverlaps = m_result->stats.discardedOverlaps;
            record.invalidSpans = m_result->stats.invalidSpans.size();
            record.filteredSpans = m_result->stats.filteredSpans;
            record.propagated = m_result->stats.propagated;
            record.redactedText = m_result->redactedText;
            try {
                m_audit->RecordRedaction(record);
            } catch (const std::exception &ex) {
                Logger::getInstance().error("[RedactionSession] " + m_sessionId +
                                            " audit write failed: " + ex.what());
            }
        }
        return *m_result;
    }

    RestorationResult Restore(const std::string &modelOutput) const
    {
        using keystone::util::logger::Logger;
        requireRedacted("Restore");

        RestorationResult restored = m_restorer.Restore(modelOutput, m_result->map);

        if (m_audit) {
            RestorationAuditRecord record;
            record.sessionId = m_sessionId;
            record.resolved = restored.stats.resolved;
            record.unmapped = restored.stats.unmapped;
            record.malformed = restored.stats.malformed;
            try {
                m_audit->RecordRestoration(record);
            } catch (const std::exception &ex) {
                Logger::getInstance().error("[RedactionSession] " + m_sessionId +
                                            " audit write failed: " + ex.what());
            }
        }
        return restored;
    }

    bool IsRedacted() const { return static_cast<bool>(m_result); }

    const std::string& GetSessionId() const { return m_sessionId; }
    const std::string& GetInputText() const { return m_inputText; }

    const std::string& GetRedactedText() const
    {
        requireRedacted("GetRedactedText");
        return m_result->redactedText;
    }

    const RedactionMap& GetMap() const
    {
        requireRedacted("GetMap");
        return m_result->map;
    }

    const RedactionStats& GetStats() const
    {
        requireRedacted("GetStats");
        return m_result->stats;
    }

private:
    void requireRedacted(const char *operation) const
    {
        if (!m_result) {
            throw std::logic_error(std::string("RedactionSession: ") + operation +
                                   " called before Redact");
        }
    }

    std::string m_inputText;
    std::string m_sessionId;
    RedactionEngine m_redactor;
    RestorationEngine m_restorer;
    AuditSink *m_audit;
    std::unique_ptr<RedactionResult> m_result;
};

} // namespace core
} // namespace keystone

#endif // KEYSTONE_CORE_REDACTION_SESSION_HPP
