/*
 * ctxformat C++ - Parser Implementation
 */
#include <ctxformat/format/parser.hpp>
#include <ctxformat/format/sanitizer.hpp>
#include <ctxformat/security/detector.hpp>
#include <ctxformat/core/logger.hpp>
#include <ctxformat/core/utils.hpp>

#include <sstream>

namespace ctxformat {

// ============================================================================
// Header grammar
// ============================================================================

static bool is_header_lead(char c) {
    return c >= 'A' && c <= 'Z';
}

static bool is_header_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

// Field values echoed in warnings are masked; warnings reach logs and callers
static std::string quoted(const std::string& value) {
    return "'" + (value.size() <= 6 ? value : smart_mask(value)) + "'";
}

bool parse_section_header(const std::string& line, std::string& name, std::string& identifier) {
    if (line.size() < 2 || line[0] != '@' || !is_header_lead(line[1])) {
        return false;
    }

    size_t i = 2;
    while (i < line.size() && is_header_char(line[i])) {
        ++i;
    }

    if (i == line.size()) {
        name = line.substr(1);
        identifier.clear();
        return true;
    }
    if (line[i] != ':') {
        return false;
    }

    name = line.substr(1, i - 1);
    identifier = trim(line.substr(i + 1));
    return true;
}

// ============================================================================
// Parser
// ============================================================================

Parser::Parser() : line_no_(0), opaque_index_(0) {}

ParseResult Parser::parse(const std::string& text) {
    doc_ = Document();
    warnings_.clear();
    section_ = Section();
    line_no_ = 0;
    opaque_index_ = 0;

    // Only newline-terminated lines are checked; an unterminated tail is a
    // torn append and is discarded below whatever its bytes are
    size_t last_nl = text.rfind('\n');
    size_t checked = last_nl == std::string::npos ? 0 : last_nl + 1;
    size_t bad_offset = 0;
    if (!is_valid_utf8(text.substr(0, checked), &bad_offset)) {
        std::ostringstream oss;
        oss << "invalid UTF-8 sequence at byte offset " << bad_offset;
        LOG_ERROR("[Parser] %s", oss.str().c_str());
        return ParseResult::fail(ParseErrorKind::Encoding, oss.str());
    }

    size_t pos = 0;
    while (pos < text.size()) {
        size_t nl = text.find('\n', pos);
        bool terminated = nl != std::string::npos;
        std::string line = terminated ? text.substr(pos, nl - pos) : text.substr(pos);
        pos = terminated ? nl + 1 : text.size();
        ++line_no_;

        if (!line.empty() && line[line.size() - 1] == '\r') {
            line.erase(line.size() - 1);
        }

        bool blank = line.find_first_not_of(" \t") == std::string::npos;
        if (blank) {
            continue;
        }
        if (!terminated) {
            warn("unterminated trailing line discarded");
            break;
        }

        std::string name;
        std::string identifier;
        if (parse_section_header(line, name, identifier)) {
            open_section(name, identifier);
            continue;
        }

        decode_line(line);
    }
    close_section();

    if (!warnings_.empty()) {
        LOG_WARN("[Parser] Skipped %zu malformed line(s)", warnings_.size());
    }

    ParseResult result;
    result.success = true;
    result.document = doc_;
    result.warnings = warnings_;
    return result;
}

void Parser::open_section(const std::string& name, const std::string& identifier) {
    close_section();

    section_.kind = section_kind_from_name(name);
    section_.name = name;
    section_.identifier = identifier;
    section_.open = true;

    switch (section_.kind) {
        case SectionKind::Metadata:
            doc_.has_metadata = true;
            break;

        case SectionKind::Session: {
            // Every SESSION header starts a new session record
            Session s;
            s.session_id = identifier;
            doc_.sessions.push_back(s);
            break;
        }

        case SectionKind::Unknown: {
            // Repeated headers with the same name and identifier continue one section
            for (size_t i = 0; i < doc_.opaque.size(); ++i) {
                if (doc_.opaque[i].name == name && doc_.opaque[i].identifier == identifier) {
                    opaque_index_ = i;
                    return;
                }
            }
            OpaqueSection os;
            os.name = name;
            os.identifier = identifier;
            doc_.opaque.push_back(os);
            opaque_index_ = doc_.opaque.size() - 1;
            LOG_DEBUG("[Parser] Keeping unknown section @%s as opaque", name.c_str());
            break;
        }

        default:
            if (!identifier.empty()) {
                LOG_DEBUG("[Parser] Ignoring identifier %s on @%s", quoted(identifier).c_str(), name.c_str());
            }
            break;
    }
}

void Parser::close_section() {
    if (!section_.open) return;

    if (section_.kind == SectionKind::Session && !doc_.sessions.empty() &&
        doc_.sessions.back().session_id.empty()) {
        warn("session without session_id discarded");
        doc_.sessions.pop_back();
    }

    if (section_.kind == SectionKind::Unknown && opaque_index_ == doc_.opaque.size() - 1 &&
        doc_.opaque.back().lines.empty()) {
        doc_.opaque.pop_back();
    }

    section_ = Section();
}

void Parser::decode_line(const std::string& line) {
    if (!section_.open) {
        warn("record line outside of any section");
        return;
    }

    switch (section_.kind) {
        case SectionKind::Metadata:
            decode_metadata(line);
            return;
        case SectionKind::Session:
            decode_session(line);
            return;
        case SectionKind::Unknown:
            doc_.opaque[opaque_index_].lines.push_back(line);
            return;
        default:
            break;
    }

    std::vector<std::string> fields = split_fields(line);
    for (size_t i = 0; i < fields.size(); ++i) {
        fields[i] = unsanitize(fields[i]);
    }

    switch (section_.kind) {
        case SectionKind::Conversation: decode_conversation(fields); break;
        case SectionKind::Memory:       decode_memory(fields); break;
        case SectionKind::State:        decode_state(fields); break;
        case SectionKind::Insights:     decode_insight(fields); break;
        case SectionKind::Decisions:    decode_decision(fields); break;
        case SectionKind::Work:         decode_work(fields); break;
        case SectionKind::Links:        decode_link(fields); break;
        default: break;
    }
}

// ============================================================================
// Key/value sections
// ============================================================================

void Parser::decode_metadata(const std::string& line) {
    std::string raw_key;
    std::string raw_value;
    if (!split_key_value(line, raw_key, raw_value)) {
        warn("expected key=value");
        return;
    }
    std::string key = unsanitize(raw_key);
    std::string value = unsanitize(raw_value);
    if (key.empty()) {
        warn("empty metadata key");
        return;
    }

    // Later values shadow earlier ones
    Metadata& m = doc_.metadata;
    if (key == "format_version") m.format_version = value;
    else if (key == "created_at") m.created_at = value;
    else if (key == "updated_at") m.updated_at = value;
    else m.extra[key] = value;
}

void Parser::decode_session(const std::string& line) {
    std::string raw_key;
    std::string raw_value;
    if (!split_key_value(line, raw_key, raw_value)) {
        warn("expected key=value");
        return;
    }
    std::string key = unsanitize(raw_key);
    std::string value = unsanitize(raw_value);
    if (key.empty()) {
        warn("empty session key");
        return;
    }

    Session& s = doc_.sessions.back();
    if (key == "session_id") {
        s.session_id = value;
    } else if (key == "app_name") {
        s.app_name = value;
    } else if (key == "user_id") {
        s.user_id = value;
    } else if (key == "created_at") {
        s.created_at = value;
    } else if (key == "updated_at") {
        s.updated_at = value;
    } else if (key == "status") {
        if (!parse_session_status(value, s.status)) {
            warn("invalid session status " + quoted(value));
        }
    } else if (key == "event_count" || key == "token_count") {
        int64_t n = 0;
        if (!parse_int64(value, n) || n < 0) {
            warn("invalid " + key + " " + quoted(value));
            return;
        }
        if (key == "event_count") s.event_count = n;
        else s.token_count = n;
    } else {
        s.extra[key] = value;
    }
}

// ============================================================================
// Tabular sections
// ============================================================================

bool Parser::check_arity(const std::vector<std::string>& fields, size_t min_fields, size_t max_fields) {
    if (fields.size() >= min_fields && fields.size() <= max_fields) {
        return true;
    }
    std::ostringstream oss;
    oss << "expected ";
    if (min_fields == max_fields) oss << min_fields;
    else oss << min_fields << "-" << max_fields;
    oss << " fields, got " << fields.size();
    warn(oss.str());
    return false;
}

void Parser::decode_conversation(const std::vector<std::string>& fields) {
    if (!check_arity(fields, 4, 4)) return;

    Conversation c;
    if (!parse_role(fields[2], c.role)) {
        warn("invalid role " + quoted(fields[2]));
        return;
    }
    c.id = fields[0];
    c.timestamp = fields[1];
    c.content = fields[3];
    doc_.conversations.push_back(c);
}

void Parser::decode_memory(const std::vector<std::string>& fields) {
    if (!check_arity(fields, 3, 4)) return;

    MemoryRecord m;
    if (!parse_memory_type(fields[0], m.type)) {
        warn("invalid memory type " + quoted(fields[0]));
        return;
    }
    m.timestamp = fields[1];
    m.content = fields[2];
    if (fields.size() > 3) m.importance = fields[3];
    doc_.memories.push_back(m);
}

void Parser::decode_state(const std::vector<std::string>& fields) {
    if (!check_arity(fields, 3, 5)) return;

    StateEntry s;
    if (!parse_state_scope(fields[0], s.scope)) {
        warn("invalid state scope " + quoted(fields[0]));
        return;
    }
    s.key = fields[1];
    s.value = fields[2];
    if (fields.size() > 3) s.type = fields[3];
    if (fields.size() > 4 && !fields[4].empty()) {
        if (!parse_int64(fields[4], s.ttl) || s.ttl < 0) {
            warn("invalid ttl " + quoted(fields[4]));
            return;
        }
    }
    doc_.states.push_back(s);
}

void Parser::decode_insight(const std::vector<std::string>& fields) {
    if (!check_arity(fields, 3, 4)) return;

    Insight i;
    i.content = fields[0];
    i.category = fields[1];
    i.priority = fields[2];
    if (fields.size() > 3 && !fields[3].empty()) {
        if (!parse_double(fields[3], i.confidence)) {
            warn("invalid confidence " + quoted(fields[3]));
            return;
        }
    }
    doc_.insights.push_back(i);
}

void Parser::decode_decision(const std::vector<std::string>& fields) {
    if (!check_arity(fields, 2, 4)) return;

    Decision d;
    d.decision = fields[0];
    d.rationale = fields[1];
    if (fields.size() > 2) d.timestamp = fields[2];
    if (fields.size() > 3) d.impact = fields[3];
    doc_.decisions.push_back(d);
}

void Parser::decode_work(const std::vector<std::string>& fields) {
    if (!check_arity(fields, 2, 3)) return;

    WorkItem w;
    if (!parse_work_status(fields[1], w.status)) {
        warn("invalid work status " + quoted(fields[1]));
        return;
    }
    w.id = fields[0];
    if (fields.size() > 2) w.description = fields[2];
    doc_.work.push_back(w);
}

void Parser::decode_link(const std::vector<std::string>& fields) {
    if (!check_arity(fields, 3, 4)) return;

    Link l;
    l.type = fields[0];
    l.source = fields[1];
    l.target = fields[2];
    if (fields.size() > 3 && !fields[3].empty()) {
        if (!parse_double(fields[3], l.strength)) {
            warn("invalid link strength " + quoted(fields[3]));
            return;
        }
        l.has_strength = true;
    }
    doc_.links.push_back(l);
}

void Parser::warn(const std::string& message) {
    LOG_DEBUG("[Parser] line %zu: %s", line_no_, message.c_str());
    warnings_.push_back(ParseWarning(line_no_, section_.name, message));
}

// ============================================================================
// Entry points
// ============================================================================

ParseResult parse(const std::string& text) {
    Parser parser;
    return parser.parse(text);
}

ParseResult parse_file(const std::string& path) {
    std::string text;
    std::string error;
    if (!read_file(path, text, error)) {
        LOG_ERROR("[Parser] %s", error.c_str());
        return ParseResult::fail(ParseErrorKind::Io, error);
    }
    LOG_DEBUG("[Parser] Read %zu bytes from %s", text.size(), path.c_str());
    return parse(text);
}

ValidationResult validate(const std::string& text) {
    ValidationResult v;
    ParseResult r = parse(text);
    if (!r.success) {
        v.success = false;
        v.error = r.error;
        return v;
    }

    v.success = true;
    if (!r.document.has_metadata) {
        v.problems.push_back("missing @METADATA section");
    }
    for (const ParseWarning& w : r.warnings) {
        std::ostringstream oss;
        oss << "line " << w.line;
        if (!w.section.empty()) oss << " (@" << w.section << ")";
        oss << ": " << w.message;
        v.problems.push_back(oss.str());
    }
    v.valid = v.problems.empty();
    return v;
}

} // namespace ctxformat
