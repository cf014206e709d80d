#ifndef KEYSTONE_AUDIT_AUDIT_LOG_HPP
#define KEYSTONE_AUDIT_AUDIT_LOG_HPP

#include <mutex>
#include <sqlite3.h>
#include <stdexcept>
#include <string>
#include "core/audit_sink.hpp"

namespace keystone {
namespace audit {

class AuditError : public std::runtime_error {
  public:
    explicit AuditError(const std::string& what) : std::runtime_error(what) {}
};

/*
  AuditLog
  --------------------------------------------------------
  SQLite-backed AuditSink. Two tables:

    redaction_passes    one row per Redact(): session id, per-category counts
                        ("DATE=1;PERSON=2"), discarded overlaps, invalid and
                        filtered spans, propagated repeats, SHA-256 of the
                        redacted text and the redacted text itself, zlib
                        compressed.
    restoration_passes  one row per Restore(): session id and the resolved,
                        unmapped and malformed counts.

  Original values and maps are never written. The connection is opened in
  the constructor and closed in the destructor; writes from concurrent
  sessions are serialised by a mutex. Every SQLite or zlib failure throws
  AuditError.
*/
class AuditLog : public core::AuditSink {
  public:
    explicit AuditLog(const std::string& dbFilePath);
    ~AuditLog() override;

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    void RecordRedaction(const core::RedactionAuditRecord& record) override;
    void RecordRestoration(const core::RestorationAuditRecord& record) override;

    int CountRedactionRecords();
    int CountRestorationRecords();

    // Decompresses the redacted text stored for a session. Returns false if
    // the session has no redaction record.
    bool ReadRedactedText(const std::string& sessionId, std::string& textOut);

    const std::string& GetPath() const { return m_dbFilePath; }

  private:
    void initDatabaseSchema();
    int countRows(const char* sql);

    static std::string formatCounts(const core::RedactionAuditRecord& record);

    std::string m_dbFilePath;
    sqlite3* m_db;
    std::mutex m_mutex;
};

} // namespace audit
} // namespace keystone

#endif // KEYSTONE_AUDIT_AUDIT_LOG_HPP
