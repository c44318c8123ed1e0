/*
 * ctxformat C++ - Redaction Log Implementation
 */
#include <ctxformat/security/redaction_log.hpp>
#include <ctxformat/core/utils.hpp>
#include <ctxformat/core/logger.hpp>

#include <fstream>

namespace ctxformat {

Json redaction_entry_to_json(const RedactionEntry& entry) {
    Json j;
    j["file"] = entry.file;
    j["field"] = entry.field;
    j["type"] = entry.type;
    j["timestamp"] = entry.timestamp;
    j["masked"] = entry.masked;
    j["fingerprint"] = entry.fingerprint;
    j["offset"] = entry.offset;
    return j;
}

void RedactionLog::record(const RedactionEntry& entry) {
    entries_.push_back(entry);
    LOG_DEBUG("[RedactionLog] %s in %s.%s -> %s (%s)",
              entry.type.c_str(), entry.file.c_str(), entry.field.c_str(),
              entry.masked.c_str(), entry.fingerprint.c_str());
}

void RedactionLog::clear() {
    entries_.clear();
}

std::map<std::string, size_t> RedactionLog::counts_by_type() const {
    std::map<std::string, size_t> counts;
    for (const auto& e : entries_) {
        counts[e.type]++;
    }
    return counts;
}

std::vector<RedactionEntry> RedactionLog::entries_for_file(const std::string& file) const {
    std::vector<RedactionEntry> result;
    for (const auto& e : entries_) {
        if (e.file == file) result.push_back(e);
    }
    return result;
}

Json RedactionLog::to_json() const {
    Json arr = Json::array();
    for (const auto& e : entries_) {
        arr.push_back(redaction_entry_to_json(e));
    }
    return arr;
}

bool RedactionLog::flush_to(const std::string& path, bool clear_after) {
    if (entries_.empty()) return true;

    if (!create_parent_directory(path)) {
        last_error_ = "Cannot create directory for: " + path;
        LOG_ERROR("[RedactionLog] %s", last_error_.c_str());
        return false;
    }

    std::ofstream file(path.c_str(), std::ios::out | std::ios::app);
    if (!file.is_open()) {
        last_error_ = "Cannot open redaction log: " + path;
        LOG_ERROR("[RedactionLog] %s", last_error_.c_str());
        return false;
    }

    for (const auto& e : entries_) {
        file << redaction_entry_to_json(e).dump() << "\n";
    }
    file.flush();
    if (!file) {
        last_error_ = "Write failed: " + path;
        LOG_ERROR("[RedactionLog] %s", last_error_.c_str());
        return false;
    }

    LOG_INFO("[RedactionLog] Flushed %zu entries to %s", entries_.size(), path.c_str());
    if (clear_after) {
        entries_.clear();
    }
    return true;
}

} // namespace ctxformat
