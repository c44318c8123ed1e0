/*
 * ctxformat C++ - Redaction Log
 *
 * Audit trail of every masked span written by a SecureWriter. The log is
 * owned by the caller; writers only hold a pointer to it. Entries never
 * hold the raw value, only its masked preview and a SHA-256 prefix.
 */
#ifndef ctxformat_SECURITY_REDACTION_LOG_HPP
#define ctxformat_SECURITY_REDACTION_LOG_HPP

#include <ctxformat/core/json.hpp>
#include <string>
#include <vector>
#include <map>

namespace ctxformat {

struct RedactionEntry {
    std::string file;           // target file name
    std::string field;          // record field, e.g. "content"
    std::string type;           // detection type(s), comma-joined when merged
    std::string timestamp;      // ISO 8601, time of the write
    std::string masked;
    std::string fingerprint;    // first 12 hex chars of SHA-256(value)
    size_t offset;              // byte offset of the span within the field

    RedactionEntry() : offset(0) {}
};

class RedactionLog {
public:
    RedactionLog() {}

    void record(const RedactionEntry& entry);

    const std::vector<RedactionEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear();

    std::map<std::string, size_t> counts_by_type() const;
    std::vector<RedactionEntry> entries_for_file(const std::string& file) const;

    Json to_json() const;

    // Append every entry as one JSON object per line. With `clear_after`,
    // entries are dropped once they have been written.
    bool flush_to(const std::string& path, bool clear_after = true);

    const std::string& last_error() const { return last_error_; }

private:
    std::vector<RedactionEntry> entries_;
    std::string last_error_;
};

Json redaction_entry_to_json(const RedactionEntry& entry);

} // namespace ctxformat

#endif // ctxformat_SECURITY_REDACTION_LOG_HPP
