#include "audit/audit_log.hpp"

#include <vector>
#include <zlib.h>
#include "util/hashing.hpp"
#include "util/logger.hpp"

namespace keystone {
namespace audit {

namespace {

std::vector<unsigned char> compressText(const std::string& text) {
    uLongf outSize = compressBound(static_cast<uLong>(text.size()));
    std::vector<unsigned char> compressed(outSize);
    if (compress2(compressed.data(), &outSize, reinterpret_cast<const Bytef*>(text.data()),
                  static_cast<uLong>(text.size()), Z_BEST_COMPRESSION) != Z_OK) {
        throw AuditError("[AuditLog] zlib compress2 failed");
    }
    compressed.resize(outSize);
    return compressed;
}

std::string decompressText(const unsigned char* data, size_t size, size_t originalSize) {
    std::vector<unsigned char> out(originalSize > 0 ? originalSize : 1);
    uLongf outSize = static_cast<uLongf>(out.size());
    if (uncompress(out.data(), &outSize, data, static_cast<uLong>(size)) != Z_OK) {
        throw AuditError("[AuditLog] zlib uncompress failed");
    }
    return std::string(reinterpret_cast<const char*>(out.data()), outSize);
}

// Finalizes the statement on every exit path.
class Statement {
  public:
    Statement(sqlite3* db, const char* sql) : m_stmt(nullptr) {
        if (sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr) != SQLITE_OK || !m_stmt) {
            throw AuditError(std::string("[AuditLog] prepare failed: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(m_stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() { return m_stmt; }

  private:
    sqlite3_stmt* m_stmt;
};

void check(sqlite3* db, int rc, const char* what) {
    if (rc != SQLITE_OK) {
        throw AuditError(std::string("[AuditLog] ") + what + ": " + sqlite3_errmsg(db));
    }
}

} // namespace

AuditLog::AuditLog(const std::string& dbFilePath) : m_dbFilePath(dbFilePath), m_db(nullptr) {
    int rc = sqlite3_open(m_dbFilePath.c_str(), &m_db);
    if (rc != SQLITE_OK || !m_db) {
        std::string msg = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        sqlite3_close(m_db);
        m_db = nullptr;
        throw AuditError("[AuditLog] Could not open database " + m_dbFilePath + ": " + msg);
    }
    try {
        initDatabaseSchema();
    } catch (const AuditError&) {
        sqlite3_close(m_db);
        m_db = nullptr;
        throw;
    }
    keystone::util::logger::info("[AuditLog] Writing audit records to " + m_dbFilePath);
}

AuditLog::~AuditLog() {
    if (m_db) {
        sqlite3_close(m_db);
    }
}

void AuditLog::initDatabaseSchema() {
    const char* ddl = "CREATE TABLE IF NOT EXISTS redaction_passes ("
                      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
                      " session_id TEXT NOT NULL,"
                      " total_placed INTEGER,"
                      " per_category TEXT,"
                      " discarded_overlaps INTEGER,"
                      " invalid_spans INTEGER,"
                      " filtered_spans INTEGER,"
                      " propagated INTEGER,"
                      " redacted_sha256 TEXT,"
                      " redacted_size INTEGER,"
                      " redacted_text BLOB,"
                      " created_at DATETIME DEFAULT CURRENT_TIMESTAMP"
                      ");"
                      "CREATE TABLE IF NOT EXISTS restoration_passes ("
                      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
                      " session_id TEXT NOT NULL,"
                      " resolved INTEGER,"
                      " unmapped INTEGER,"
                      " malformed INTEGER,"
                      " created_at DATETIME DEFAULT CURRENT_TIMESTAMP"
                      ");";

    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, ddl, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string msg = errMsg ? errMsg : "unknown error";
        sqlite3_free(errMsg);
        throw AuditError("[AuditLog] initDatabaseSchema error: " + msg);
    }
}

std::string AuditLog::formatCounts(const core::RedactionAuditRecord& record) {
    std::string out;
    for (const auto& kv : record.placedPerCategory) {
        if (!out.empty())
            out += ";";
        out += kv.first + "=" + std::to_string(kv.second);
    }
    return out;
}

void AuditLog::RecordRedaction(const core::RedactionAuditRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);

    size_t total = 0;
    for (const auto& kv : record.placedPerCategory)
        total += kv.second;
    const std::string counts = formatCounts(record);
    const std::string digest = keystone::util::hashing::sha256(record.redactedText);
    const std::vector<unsigned char> compressed = compressText(record.redactedText);

    Statement stmt(m_db, "INSERT INTO redaction_passes (session_id, total_placed, per_category,"
                         " discarded_overlaps, invalid_spans, filtered_spans, propagated,"
                         " redacted_sha256, redacted_size, redacted_text)"
                         " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    sqlite3_stmt* s = stmt.get();
    check(m_db, sqlite3_bind_text(s, 1, record.sessionId.c_str(), -1, SQLITE_TRANSIENT), "bind");
    check(m_db, sqlite3_bind_int64(s, 2, static_cast<sqlite3_int64>(total)), "bind");
    check(m_db, sqlite3_bind_text(s, 3, counts.c_str(), -1, SQLITE_TRANSIENT), "bind");
    check(m_db, sqlite3_bind_int64(s, 4, static_cast<sqlite3_int64>(record.discardedOverlaps)), "bind");
    check(m_db, sqlite3_bind_int64(s, 5, static_cast<sqlite3_int64>(record.invalidSpans)), "bind");
    check(m_db, sqlite3_bind_int64(s, 6, static_cast<sqlite3_int64>(record.filteredSpans)), "bind");
    check(m_db, sqlite3_bind_int64(s, 7, static_cast<sqlite3_int64>(record.propagated)), "bind");
    check(m_db, sqlite3_bind_text(s, 8, digest.c_str(), -1, SQLITE_TRANSIENT), "bind");
    check(m_db, sqlite3_bind_int64(s, 9, static_cast<sqlite3_int64>(record.redactedText.size())), "bind");
    check(m_db, sqlite3_bind_blob(s, 10, compressed.data(), static_cast<int>(compressed.size()),
                                  SQLITE_TRANSIENT), "bind");

    if (sqlite3_step(s) != SQLITE_DONE) {
        throw AuditError(std::string("[AuditLog] insert redaction record failed: ") +
                         sqlite3_errmsg(m_db));
    }
    keystone::util::logger::debug("[AuditLog] Redaction record written for session " +
                                  record.sessionId);
}

void AuditLog::RecordRestoration(const core::RestorationAuditRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);

    Statement stmt(m_db, "INSERT INTO restoration_passes (session_id, resolved, unmapped, malformed)"
                         " VALUES (?, ?, ?, ?);");
    sqlite3_stmt* s = stmt.get();
    check(m_db, sqlite3_bind_text(s, 1, record.sessionId.c_str(), -1, SQLITE_TRANSIENT), "bind");
    check(m_db, sqlite3_bind_int64(s, 2, static_cast<sqlite3_int64>(record.resolved)), "bind");
    check(m_db, sqlite3_bind_int64(s, 3, static_cast<sqlite3_int64>(record.unmapped)), "bind");
    check(m_db, sqlite3_bind_int64(s, 4, static_cast<sqlite3_int64>(record.malformed)), "bind");

    if (sqlite3_step(s) != SQLITE_DONE) {
        throw AuditError(std::string("[AuditLog] insert restoration record failed: ") +
                         sqlite3_errmsg(m_db));
    }
    keystone::util::logger::debug("[AuditLog] Restoration record written for session " +
                                  record.sessionId);
}

int AuditLog::countRows(const char* sql) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db, sql);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw AuditError(std::string("[AuditLog] count failed: ") + sqlite3_errmsg(m_db));
    }
    return sqlite3_column_int(stmt.get(), 0);
}

int AuditLog::CountRedactionRecords() {
    return countRows("SELECT COUNT(*) FROM redaction_passes");
}

int AuditLog::CountRestorationRecords() {
    return countRows("SELECT COUNT(*) FROM restoration_passes");
}

bool AuditLog::ReadRedactedText(const std::string& sessionId, std::string& textOut) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db, "SELECT redacted_text, redacted_size FROM redaction_passes"
                         " WHERE session_id = ? ORDER BY id DESC LIMIT 1");
    check(m_db, sqlite3_bind_text(stmt.get(), 1, sessionId.c_str(), -1, SQLITE_TRANSIENT), "bind");

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE)
        return false;
    if (rc != SQLITE_ROW) {
        throw AuditError(std::string("[AuditLog] read failed: ") + sqlite3_errmsg(m_db));
    }

    const void* blob = sqlite3_column_blob(stmt.get(), 0);
    int blobSize = sqlite3_column_bytes(stmt.get(), 0);
    sqlite3_int64 originalSize = sqlite3_column_int64(stmt.get(), 1);
    if (originalSize == 0) {
        textOut.clear();
        return true;
    }
    textOut = decompressText(reinterpret_cast<const unsigned char*>(blob),
                             static_cast<size_t>(blobSize), static_cast<size_t>(originalSize));
    return true;
}

} // namespace audit
} // namespace keystone
