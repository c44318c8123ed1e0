/*
 * ctxformat C++ - Secure Writer Implementation
 */
#include <ctxformat/security/secure_writer.hpp>
#include <ctxformat/format/compiler.hpp>
#include <ctxformat/format/sanitizer.hpp>
#include <ctxformat/core/config.hpp>
#include <ctxformat/core/utils.hpp>
#include <ctxformat/core/logger.hpp>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ctxformat {

namespace {

DetectorOptions detector_options(const WriterConfig& config) {
    DetectorOptions opts;
    opts.secrets = true;
    opts.pii = config.detect_pii;
    return opts;
}

const char kReservedFileChars[] = "/\\<>:\"|?*";

} // namespace

const char* to_string(WriteErrorKind kind) {
    switch (kind) {
        case WriteErrorKind::None:            return "none";
        case WriteErrorKind::SecretsDetected: return "secrets_detected";
        case WriteErrorKind::InvalidRecord:   return "invalid_record";
        case WriteErrorKind::InvalidPath:     return "invalid_path";
        case WriteErrorKind::Io:              return "io";
    }
    return "";
}

WriterConfig WriterConfig::from_config(const Config& cfg) {
    WriterConfig c;
    c.base_dir = cfg.get_string("writer.base_dir", c.base_dir);
    c.enable_secret_redaction = cfg.get_bool("writer.enable_secret_redaction", c.enable_secret_redaction);
    c.throw_on_secrets = cfg.get_bool("writer.throw_on_secrets", c.throw_on_secrets);
    c.log_redactions = cfg.get_bool("writer.log_redactions", c.log_redactions);
    c.detect_pii = cfg.get_bool("writer.detect_pii", c.detect_pii);
    c.fill_defaults = cfg.get_bool("writer.fill_defaults", c.fill_defaults);
    c.sync = cfg.get_bool("writer.fsync", c.sync);
    c.redaction_log_path = cfg.get_string("writer.redaction_log_path", c.redaction_log_path);
    return c;
}

bool is_valid_file_name(const std::string& name) {
    if (name.empty() || name.find("..") != std::string::npos) {
        return false;
    }
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f) return false;
        if (std::strchr(kReservedFileChars, c) != nullptr) return false;
    }
    return name != ".";
}

// ============================================================================
// SecureWriter
// ============================================================================

SecureWriter::SecureWriter(const WriterConfig& config, RedactionLog* log)
    : config_(config)
    , detector_(detector_options(config))
    , log_(log) {
    LOG_DEBUG("[SecureWriter] base_dir=%s redaction=%s throw_on_secrets=%s pii=%s",
              config_.base_dir.c_str(),
              config_.enable_secret_redaction ? "on" : "off",
              config_.throw_on_secrets ? "on" : "off",
              config_.detect_pii ? "on" : "off");
}

std::string SecureWriter::path_for(const std::string& file) const {
    return join_path(config_.base_dir, file);
}

WriteResult SecureWriter::write_conversation(const std::string& file, const Conversation& rec) {
    Document doc;
    doc.conversations.push_back(rec);
    return write_document(file, doc);
}

WriteResult SecureWriter::write_memory(const std::string& file, const MemoryRecord& rec) {
    Document doc;
    doc.memories.push_back(rec);
    return write_document(file, doc);
}

WriteResult SecureWriter::write_state(const std::string& file, const StateEntry& rec) {
    Document doc;
    doc.states.push_back(rec);
    return write_document(file, doc);
}

WriteResult SecureWriter::write_insight(const std::string& file, const Insight& rec) {
    Document doc;
    doc.insights.push_back(rec);
    return write_document(file, doc);
}

WriteResult SecureWriter::write_decision(const std::string& file, const Decision& rec) {
    Document doc;
    doc.decisions.push_back(rec);
    return write_document(file, doc);
}

WriteResult SecureWriter::write_work(const std::string& file, const WorkItem& rec) {
    Document doc;
    doc.work.push_back(rec);
    return write_document(file, doc);
}

WriteResult SecureWriter::write_link(const std::string& file, const Link& rec) {
    Document doc;
    doc.links.push_back(rec);
    return write_document(file, doc);
}

WriteResult SecureWriter::write_session(const std::string& file, const Session& rec) {
    Document doc;
    doc.sessions.push_back(rec);
    return write_document(file, doc);
}

WriteResult SecureWriter::write_metadata(const std::string& file, const Metadata& rec) {
    if (!is_valid_file_name(file)) {
        return finish(file, WriteResult::fail(WriteErrorKind::InvalidPath, "Invalid file name: " + file));
    }
    if (file_size(path_for(file)) > 0) {
        LOG_DEBUG("[SecureWriter] %s already initialized", file.c_str());
        return WriteResult::ok(0);
    }

    Document doc;
    doc.has_metadata = true;
    doc.metadata = rec;
    return write_document(file, doc);
}

WriteResult SecureWriter::initialize(const std::string& file) {
    return write_metadata(file, Metadata());
}

WriteResult SecureWriter::write_document(const std::string& file, const Document& doc) {
    if (!is_valid_file_name(file)) {
        return finish(file, WriteResult::fail(WriteErrorKind::InvalidPath, "Invalid file name: " + file));
    }

    Document d = doc;
    if (config_.fill_defaults) {
        fill_defaults(d);
    }

    std::string error;
    if (!validate(d, error)) {
        return finish(file, WriteResult::fail(WriteErrorKind::InvalidRecord, error));
    }

    std::vector<ExtraBlock> extras;
    FieldList fields;
    collect_fields(d, extras, fields);

    std::vector<RedactionEntry> pending;
    WriteResult screened;
    if (!screen(file, fields, pending, screened)) {
        return finish(file, screened);
    }
    rebuild_extras(extras);

    std::string text = compile(d);
    if (text.empty()) {
        return WriteResult::ok(0);
    }

    WriteResult r = append_raw(file, text, true);
    if (!r.success) {
        return finish(file, r);
    }

    r.redactions = screened.redactions;
    commit(pending);
    LOG_DEBUG("[SecureWriter] Appended %zu records (%zu bytes) to %s",
              d.record_count(), r.bytes_written, file.c_str());
    return r;
}

WriteResult SecureWriter::append_line(const std::string& file, const std::string& line) {
    if (!is_valid_file_name(file)) {
        return finish(file, WriteResult::fail(WriteErrorKind::InvalidPath, "Invalid file name: " + file));
    }

    std::string value = line;
    FieldList fields;
    fields.push_back(Field("line", &value));

    std::vector<RedactionEntry> pending;
    WriteResult screened;
    if (!screen(file, fields, pending, screened)) {
        return finish(file, screened);
    }

    WriteResult r = append_raw(file, escape_line_breaks(value) + "\n", false);
    if (!r.success) {
        return finish(file, r);
    }

    r.redactions = screened.redactions;
    commit(pending);
    return r;
}

void SecureWriter::clear_redaction_log() {
    if (log_) {
        log_->clear();
    }
}

bool SecureWriter::flush_redaction_log() {
    if (!log_) {
        return true;
    }
    if (config_.redaction_log_path.empty()) {
        last_error_ = "No redaction log path configured";
        return false;
    }
    if (!log_->flush_to(config_.redaction_log_path)) {
        last_error_ = log_->last_error();
        return false;
    }
    return true;
}

// ============================================================================
// Pipeline steps
// ============================================================================

void SecureWriter::fill_defaults(Document& doc) const {
    std::string now = now_iso8601();

    if (doc.has_metadata) {
        Metadata& m = doc.metadata;
        if (m.format_version.empty()) m.format_version = kFormatVersion;
        if (m.created_at.empty()) m.created_at = now;
        if (m.updated_at.empty()) m.updated_at = now;
    }

    for (Session& s : doc.sessions) {
        if (s.session_id.empty()) s.session_id = generate_uuid();
        if (s.created_at.empty()) s.created_at = now;
        if (s.updated_at.empty()) s.updated_at = now;
    }

    for (Conversation& c : doc.conversations) {
        if (c.id.empty()) c.id = generate_uuid();
        if (c.timestamp.empty()) c.timestamp = now;
    }

    for (MemoryRecord& m : doc.memories) {
        if (m.timestamp.empty()) m.timestamp = now;
    }

    for (Decision& d : doc.decisions) {
        if (d.timestamp.empty()) d.timestamp = now;
    }
}

bool SecureWriter::validate(const Document& doc, std::string& error) const {
    for (const Session& s : doc.sessions) {
        if (s.session_id.empty()) {
            error = "session_id is required";
            return false;
        }
        if (*to_string(s.status) == '\0') {
            error = "invalid session status";
            return false;
        }
        if (s.event_count < 0 || s.token_count < 0) {
            error = "session counters must not be negative";
            return false;
        }
    }

    for (const Conversation& c : doc.conversations) {
        if (*to_string(c.role) == '\0') {
            error = "invalid conversation role";
            return false;
        }
    }

    for (const MemoryRecord& m : doc.memories) {
        if (*to_string(m.type) == '\0') {
            error = "invalid memory type";
            return false;
        }
    }

    for (const StateEntry& s : doc.states) {
        if (*to_string(s.scope) == '\0') {
            error = "invalid state scope";
            return false;
        }
        if (s.key.empty()) {
            error = "state key is required";
            return false;
        }
        if (s.ttl < 0) {
            error = "state ttl must not be negative";
            return false;
        }
    }

    for (const Insight& i : doc.insights) {
        if (!std::isfinite(i.confidence)) {
            error = "insight confidence must be a finite number";
            return false;
        }
    }

    for (const WorkItem& w : doc.work) {
        if (w.id.empty()) {
            error = "work id is required";
            return false;
        }
        if (*to_string(w.status) == '\0') {
            error = "invalid work status";
            return false;
        }
    }

    for (const Link& l : doc.links) {
        if (l.has_strength && !std::isfinite(l.strength)) {
            error = "link strength must be a finite number";
            return false;
        }
    }

    return true;
}

void SecureWriter::collect_fields(Document& doc, std::vector<ExtraBlock>& extras, FieldList& fields) const {
    // Fields point into the blocks' items; no reallocation after this
    extras.reserve(doc.sessions.size() + 1);

    // Each key is screened before the value it names
    auto add_extras = [&](std::map<std::string, std::string>& extra) {
        extras.push_back(ExtraBlock());
        ExtraBlock& block = extras.back();
        block.target = &extra;
        block.items.assign(extra.begin(), extra.end());
        for (auto& item : block.items) {
            fields.push_back(Field("key", &item.first));
            Field value("value", &item.second);
            value.name_from = &item.first;
            fields.push_back(value);
        }
    };

    if (doc.has_metadata) {
        Metadata& m = doc.metadata;
        fields.push_back(Field("format_version", &m.format_version));
        fields.push_back(Field("created_at", &m.created_at));
        fields.push_back(Field("updated_at", &m.updated_at));
        add_extras(m.extra);
    }

    for (Session& s : doc.sessions) {
        fields.push_back(Field("session_id", &s.session_id));
        fields.push_back(Field("app_name", &s.app_name));
        fields.push_back(Field("user_id", &s.user_id));
        fields.push_back(Field("created_at", &s.created_at));
        fields.push_back(Field("updated_at", &s.updated_at));
        add_extras(s.extra);
    }

    for (Conversation& c : doc.conversations) {
        fields.push_back(Field("id", &c.id));
        fields.push_back(Field("timestamp", &c.timestamp));
        fields.push_back(Field("content", &c.content));
    }

    for (MemoryRecord& m : doc.memories) {
        fields.push_back(Field("timestamp", &m.timestamp));
        fields.push_back(Field("content", &m.content));
        fields.push_back(Field("importance", &m.importance));
    }

    for (StateEntry& s : doc.states) {
        fields.push_back(Field("key", &s.key));
        fields.push_back(Field("value", &s.value));
        fields.push_back(Field("type", &s.type));
    }

    for (Insight& i : doc.insights) {
        fields.push_back(Field("content", &i.content));
        fields.push_back(Field("category", &i.category));
        fields.push_back(Field("priority", &i.priority));
    }

    for (Decision& d : doc.decisions) {
        fields.push_back(Field("decision", &d.decision));
        fields.push_back(Field("rationale", &d.rationale));
        fields.push_back(Field("timestamp", &d.timestamp));
        fields.push_back(Field("impact", &d.impact));
    }

    for (WorkItem& w : doc.work) {
        fields.push_back(Field("id", &w.id));
        fields.push_back(Field("description", &w.description));
    }

    for (Link& l : doc.links) {
        fields.push_back(Field("type", &l.type));
        fields.push_back(Field("source", &l.source));
        fields.push_back(Field("target", &l.target));
    }

    for (OpaqueSection& os : doc.opaque) {
        for (std::string& line : os.lines) {
            fields.push_back(Field(os.name, &line));
        }
    }
}

void SecureWriter::rebuild_extras(std::vector<ExtraBlock>& extras) const {
    for (ExtraBlock& block : extras) {
        block.target->clear();
        for (const auto& item : block.items) {
            if (!block.target->insert(item).second) {
                LOG_WARN("[SecureWriter] Redacted key %s collides with another key; keeping the later value",
                         item.first.c_str());
                (*block.target)[item.first] = item.second;
            }
        }
    }
}

bool SecureWriter::screen(const std::string& file, FieldList& fields,
                          std::vector<RedactionEntry>& pending, WriteResult& result) {
    result = WriteResult::ok(0);
    if (!config_.enable_secret_redaction && !config_.throw_on_secrets) {
        return true;
    }

    if (config_.throw_on_secrets) {
        std::vector<std::string> types;
        std::vector<std::string> names;
        for (const auto& f : fields) {
            for (const Detection& d : detector_.detect(*f.value)) {
                if (d.category != DetectionCategory::Secret) continue;
                if (std::find(types.begin(), types.end(), d.type) == types.end()) {
                    types.push_back(d.type);
                }
                if (std::find(names.begin(), names.end(), f.name) == names.end()) {
                    names.push_back(f.name);
                }
            }
        }
        if (!types.empty()) {
            result = WriteResult::fail(WriteErrorKind::SecretsDetected,
                                       "Secrets detected: " + join(types, ", ") +
                                       " (fields: " + join(names, ", ") + ")");
            result.secret_types = types;
            return false;
        }
    }

    if (!config_.enable_secret_redaction) {
        return true;
    }

    std::string now = now_iso8601();
    for (auto& f : fields) {
        RedactionOutcome outcome = detector_.redact(*f.value);
        if (outcome.spans.empty()) continue;

        *f.value = outcome.text;
        const std::string& field = f.name_from ? *f.name_from : f.name;
        result.redactions += outcome.spans.size();

        for (const RedactedSpan& span : outcome.spans) {
            RedactionEntry e;
            e.file = file;
            e.field = field;
            e.type = join(span.types, ",");
            e.timestamp = now;
            e.masked = span.masked;
            e.fingerprint = span.fingerprint;
            e.offset = span.start;
            pending.push_back(e);

            LOG_WARN("[SecureWriter] Redacted %s in %s.%s (%s)",
                     e.type.c_str(), file.c_str(), e.field.c_str(), e.masked.c_str());
        }
    }
    return true;
}

void SecureWriter::commit(const std::vector<RedactionEntry>& pending) {
    if (!config_.log_redactions || !log_) {
        return;
    }
    for (const RedactionEntry& e : pending) {
        log_->record(e);
    }
}

namespace {

// Puts a file back to its bytes before a failed append: `keep` bytes
// followed by the torn tail that was cut
void restore_tail(int fd, off_t keep, const std::string& torn, const std::string& path) {
    if (::ftruncate(fd, keep) != 0) {
        LOG_ERROR("[SecureWriter] Cannot roll back %s: %s", path.c_str(), std::strerror(errno));
        return;
    }
    size_t done = 0;
    while (done < torn.size()) {
        ssize_t n = ::write(fd, torn.data() + done, torn.size() - done);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            LOG_ERROR("[SecureWriter] Cannot restore torn tail of %s: %s",
                      path.c_str(), n < 0 ? std::strerror(errno) : "short write");
            return;
        }
        done += static_cast<size_t>(n);
    }
}

} // namespace

WriteResult SecureWriter::append_raw(const std::string& file, const std::string& data, bool separate_block) {
    if (!create_directories(config_.base_dir)) {
        return WriteResult::fail(WriteErrorKind::Io, "Cannot create directory: " + config_.base_dir);
    }

    std::string path = path_for(file);
    int fd = ::open(path.c_str(), O_RDWR | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return WriteResult::fail(WriteErrorKind::Io,
                                 "Cannot open " + path + ": " + std::strerror(errno));
    }

    struct stat st;
    if (::fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        return WriteResult::fail(WriteErrorKind::Io, "Cannot stat " + path + ": " + std::strerror(err));
    }
    off_t original = st.st_size;

    // Bytes after the last newline are a torn append. They are cut before
    // writing so they can never become the start of a new record.
    off_t keep = 0;
    std::string torn;
    if (original > 0) {
        char chunk[4096];
        off_t end = original;
        bool found = false;
        while (end > 0 && !found) {
            off_t from = end > static_cast<off_t>(sizeof(chunk)) ? end - static_cast<off_t>(sizeof(chunk)) : 0;
            size_t want = static_cast<size_t>(end - from);
            ssize_t got = ::pread(fd, chunk, want, from);
            if (got != static_cast<ssize_t>(want)) {
                int err = got < 0 ? errno : EIO;
                ::close(fd);
                return WriteResult::fail(WriteErrorKind::Io, "Cannot read " + path + ": " + std::strerror(err));
            }
            size_t i = want;
            while (i > 0 && chunk[i - 1] != '\n') --i;
            if (i > 0) {
                found = true;
                keep = from + static_cast<off_t>(i);
                torn.insert(0, chunk + i, want - i);
            } else {
                torn.insert(0, chunk, want);
            }
            end = from;
        }
    }

    if (keep < original) {
        if (::ftruncate(fd, keep) != 0) {
            int err = errno;
            ::close(fd);
            return WriteResult::fail(WriteErrorKind::Io,
                                     "Cannot discard torn tail of " + path + ": " + std::strerror(err));
        }
        LOG_WARN("[SecureWriter] Discarded %zu byte(s) of unterminated trailing line in %s",
                 torn.size(), path.c_str());
    }

    // Between blocks, a blank line separates existing content from `data`
    std::string buffer;
    if (separate_block && keep >= 2) {
        char prev = 0;
        ssize_t got = ::pread(fd, &prev, 1, keep - 2);
        if (got != 1) {
            int err = got < 0 ? errno : EIO;
            restore_tail(fd, keep, torn, path);
            ::close(fd);
            return WriteResult::fail(WriteErrorKind::Io, "Cannot read " + path + ": " + std::strerror(err));
        }
        if (prev != '\n') {
            buffer = "\n";
        }
    }
    buffer += data;

    size_t written = 0;
    int err = 0;
    while (written < buffer.size()) {
        ssize_t n = ::write(fd, buffer.data() + written, buffer.size() - written);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            err = n < 0 ? errno : EIO;
            break;
        }
        written += static_cast<size_t>(n);
    }

    if (err == 0 && config_.sync && ::fsync(fd) != 0) {
        err = errno;
    }

    if (err != 0) {
        restore_tail(fd, keep, torn, path);
        ::close(fd);
        return WriteResult::fail(WriteErrorKind::Io, "Write failed for " + path + ": " + std::strerror(err));
    }

    if (::close(fd) != 0) {
        LOG_WARN("[SecureWriter] close(%s): %s", path.c_str(), std::strerror(errno));
    }
    return WriteResult::ok(buffer.size());
}

WriteResult SecureWriter::finish(const std::string& file, WriteResult r) {
    if (!r.success) {
        last_error_ = r.error;
        if (r.kind == WriteErrorKind::SecretsDetected) {
            LOG_WARN("[SecureWriter] Rejected write to %s: %s", file.c_str(), r.error.c_str());
        } else {
            LOG_ERROR("[SecureWriter] Write to %s failed (%s): %s",
                      file.c_str(), to_string(r.kind), r.error.c_str());
        }
    }
    return r;
}

} // namespace ctxformat
