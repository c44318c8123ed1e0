/*
 * ctxformat C++ - Compiler Implementation
 */
#include <ctxformat/format/compiler.hpp>
#include <ctxformat/format/sanitizer.hpp>
#include <ctxformat/format/parser.hpp>
#include <ctxformat/core/utils.hpp>

#include <vector>

namespace ctxformat {

namespace {

// Joins sanitized fields with '|'
class LineBuilder {
public:
    LineBuilder& field(const std::string& value) {
        if (!first_) line_ += kFieldDelimiter;
        line_ += sanitize(value);
        first_ = false;
        return *this;
    }

    const std::string& str() const { return line_; }

private:
    std::string line_;
    bool first_ = true;
};

void append_kv(std::string& out, const std::string& key, const std::string& value) {
    out += sanitize_key(key);
    out += kKeyValueSeparator;
    out += sanitize(value);
    out += '\n';
}

bool is_reserved_metadata_key(const std::string& key) {
    return key == "format_version" || key == "created_at" || key == "updated_at";
}

bool is_reserved_session_key(const std::string& key) {
    return key == "session_id" || key == "app_name" || key == "user_id" ||
           key == "created_at" || key == "updated_at" || key == "status" ||
           key == "event_count" || key == "token_count";
}

template <typename Record>
void append_section(std::string& out, SectionKind kind, const std::vector<Record>& records) {
    if (records.empty()) return;
    if (!out.empty()) out += '\n';
    out += section_header(kind);
    out += '\n';
    for (const Record& r : records) {
        out += compile_record(r);
        out += '\n';
    }
}

} // namespace

std::string section_header(SectionKind kind) {
    return std::string("@") + section_name(kind) + ":";
}

// ============================================================================
// Records
// ============================================================================

std::string compile_record(const Conversation& c) {
    return LineBuilder()
        .field(c.id)
        .field(c.timestamp)
        .field(to_string(c.role))
        .field(c.content)
        .str();
}

std::string compile_record(const MemoryRecord& m) {
    LineBuilder b;
    b.field(to_string(m.type)).field(m.timestamp).field(m.content);
    if (!m.importance.empty()) {
        b.field(m.importance);
    }
    return b.str();
}

std::string compile_record(const StateEntry& s) {
    LineBuilder b;
    b.field(to_string(s.scope)).field(s.key).field(s.value);
    if (s.ttl > 0) {
        b.field(s.type).field(std::to_string(s.ttl));
    } else if (!s.type.empty()) {
        b.field(s.type);
    }
    return b.str();
}

std::string compile_record(const Insight& i) {
    return LineBuilder()
        .field(i.content)
        .field(i.category)
        .field(i.priority)
        .field(format_double(i.confidence))
        .str();
}

std::string compile_record(const Decision& d) {
    LineBuilder b;
    b.field(d.decision).field(d.rationale);
    if (!d.impact.empty()) {
        b.field(d.timestamp).field(d.impact);
    } else if (!d.timestamp.empty()) {
        b.field(d.timestamp);
    }
    return b.str();
}

std::string compile_record(const WorkItem& w) {
    LineBuilder b;
    b.field(w.id).field(to_string(w.status));
    if (!w.description.empty()) {
        b.field(w.description);
    }
    return b.str();
}

std::string compile_record(const Link& l) {
    LineBuilder b;
    b.field(l.type).field(l.source).field(l.target);
    if (l.has_strength) {
        b.field(format_double(l.strength));
    }
    return b.str();
}

// ============================================================================
// Key/value blocks
// ============================================================================

std::string compile_metadata_body(const Metadata& m) {
    std::string out;
    if (!m.format_version.empty()) append_kv(out, "format_version", m.format_version);
    if (!m.created_at.empty()) append_kv(out, "created_at", m.created_at);
    if (!m.updated_at.empty()) append_kv(out, "updated_at", m.updated_at);
    for (std::map<std::string, std::string>::const_iterator it = m.extra.begin(); it != m.extra.end(); ++it) {
        if (is_reserved_metadata_key(it->first) || it->first.empty()) continue;
        append_kv(out, it->first, it->second);
    }
    return out;
}

std::string compile_session_body(const Session& s) {
    std::string out;
    append_kv(out, "session_id", s.session_id);
    if (!s.app_name.empty()) append_kv(out, "app_name", s.app_name);
    if (!s.user_id.empty()) append_kv(out, "user_id", s.user_id);
    if (!s.created_at.empty()) append_kv(out, "created_at", s.created_at);
    if (!s.updated_at.empty()) append_kv(out, "updated_at", s.updated_at);
    append_kv(out, "status", to_string(s.status));
    append_kv(out, "event_count", std::to_string(s.event_count));
    append_kv(out, "token_count", std::to_string(s.token_count));
    for (std::map<std::string, std::string>::const_iterator it = s.extra.begin(); it != s.extra.end(); ++it) {
        if (is_reserved_session_key(it->first) || it->first.empty()) continue;
        append_kv(out, it->first, it->second);
    }
    return out;
}

// ============================================================================
// Document
// ============================================================================

std::string compile(const Document& doc) {
    std::string out;

    if (doc.has_metadata) {
        std::string body = compile_metadata_body(doc.metadata);
        if (!body.empty()) {
            out += section_header(SectionKind::Metadata);
            out += '\n';
            out += body;
        }
    }

    // Sessions form an append-only log: one block per session record
    for (const Session& s : doc.sessions) {
        if (!out.empty()) out += '\n';
        out += section_header(SectionKind::Session);
        out += '\n';
        out += compile_session_body(s);
    }

    append_section(out, SectionKind::Conversation, doc.conversations);
    append_section(out, SectionKind::Memory, doc.memories);
    append_section(out, SectionKind::State, doc.states);
    append_section(out, SectionKind::Insights, doc.insights);
    append_section(out, SectionKind::Decisions, doc.decisions);
    append_section(out, SectionKind::Work, doc.work);
    append_section(out, SectionKind::Links, doc.links);

    for (const OpaqueSection& os : doc.opaque) {
        if (os.lines.empty()) continue;
        if (!out.empty()) out += '\n';
        out += "@" + os.name + ":";
        if (!os.identifier.empty()) out += os.identifier;
        out += '\n';
        for (const std::string& line : os.lines) {
            // Opaque lines are kept verbatim but may never split or open a section
            std::string name;
            std::string identifier;
            if (parse_section_header(line, name, identifier)) {
                out += kEscapeChar;
            }
            out += escape_line_breaks(line);
            out += '\n';
        }
    }

    return out;
}

} // namespace ctxformat
