/*
 * ctxformat C++ - Record Types
 *
 * Typed records for every section kind of a context file. Closed
 * enumerations (role, memory type, state scope, session status, work
 * status) are parsed from and rendered to their wire spelling here.
 */
#ifndef ctxformat_FORMAT_TYPES_HPP
#define ctxformat_FORMAT_TYPES_HPP

#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace ctxformat {

// Written into @METADATA by SecureWriter::initialize()
extern const char* const kFormatVersion;

// ============================================================================
// Enumerations
// ============================================================================

enum class SectionKind {
    Metadata,
    Session,
    Conversation,
    Memory,
    State,
    Insights,
    Decisions,
    Work,
    Links,
    Unknown
};

enum class Role { User, Assistant, System };

enum class MemoryType { Episodic, Semantic, Procedural };

enum class StateScope { Session, User, App, Temp };

enum class SessionStatus { Active, Completed, Archived };

enum class WorkStatus { NotStarted, InProgress, Completed, Blocked };

// Header name without '@' and ':' ("CONVERSATION"); "" for Unknown
const char* section_name(SectionKind kind);
SectionKind section_kind_from_name(const std::string& name);

// to_string() returns "" for values outside the enumeration
const char* to_string(Role role);
const char* to_string(MemoryType type);
const char* to_string(StateScope scope);
const char* to_string(SessionStatus status);
const char* to_string(WorkStatus status);

bool parse_role(const std::string& s, Role& out);
bool parse_memory_type(const std::string& s, MemoryType& out);
bool parse_state_scope(const std::string& s, StateScope& out);
bool parse_session_status(const std::string& s, SessionStatus& out);
bool parse_work_status(const std::string& s, WorkStatus& out);

// ============================================================================
// Records
// ============================================================================

struct Metadata {
    std::string format_version;
    std::string created_at;
    std::string updated_at;
    std::map<std::string, std::string> extra;   // free-form key/value pairs

    bool operator==(const Metadata& o) const {
        return format_version == o.format_version && created_at == o.created_at &&
               updated_at == o.updated_at && extra == o.extra;
    }
};

struct Session {
    std::string session_id;
    std::string app_name;
    std::string user_id;
    std::string created_at;
    std::string updated_at;
    SessionStatus status;
    int64_t event_count;
    int64_t token_count;
    std::map<std::string, std::string> extra;

    Session() : status(SessionStatus::Active), event_count(0), token_count(0) {}

    bool operator==(const Session& o) const {
        return session_id == o.session_id && app_name == o.app_name && user_id == o.user_id &&
               created_at == o.created_at && updated_at == o.updated_at && status == o.status &&
               event_count == o.event_count && token_count == o.token_count && extra == o.extra;
    }
};

struct Conversation {
    std::string id;
    std::string timestamp;
    Role role;
    std::string content;

    Conversation() : role(Role::User) {}
    Conversation(const std::string& i, const std::string& ts, Role r, const std::string& c)
        : id(i), timestamp(ts), role(r), content(c) {}

    bool operator==(const Conversation& o) const {
        return id == o.id && timestamp == o.timestamp && role == o.role && content == o.content;
    }
};

struct MemoryRecord {
    MemoryType type;
    std::string timestamp;
    std::string content;
    std::string importance;     // optional: "low", "medium", "high", "critical"

    MemoryRecord() : type(MemoryType::Episodic) {}

    bool operator==(const MemoryRecord& o) const {
        return type == o.type && timestamp == o.timestamp && content == o.content &&
               importance == o.importance;
    }
};

struct StateEntry {
    StateScope scope;
    std::string key;
    std::string value;
    std::string type;           // optional: "string", "json", "number", "boolean"
    int64_t ttl;                // seconds, 0 = none; advisory only

    StateEntry() : scope(StateScope::Session), ttl(0) {}
    StateEntry(StateScope s, const std::string& k, const std::string& v)
        : scope(s), key(k), value(v), ttl(0) {}

    bool operator==(const StateEntry& o) const {
        return scope == o.scope && key == o.key && value == o.value && type == o.type && ttl == o.ttl;
    }
};

struct Insight {
    std::string content;
    std::string category;
    std::string priority;       // "low", "medium", "high", "critical"
    double confidence;

    Insight() : confidence(0.0) {}

    bool operator==(const Insight& o) const {
        return content == o.content && category == o.category && priority == o.priority &&
               confidence == o.confidence;
    }
};

struct Decision {
    std::string decision;
    std::string rationale;
    std::string timestamp;      // optional
    std::string impact;         // optional

    bool operator==(const Decision& o) const {
        return decision == o.decision && rationale == o.rationale && timestamp == o.timestamp &&
               impact == o.impact;
    }
};

struct WorkItem {
    std::string id;
    WorkStatus status;
    std::string description;    // optional

    WorkItem() : status(WorkStatus::NotStarted) {}

    bool operator==(const WorkItem& o) const {
        return id == o.id && status == o.status && description == o.description;
    }
};

struct Link {
    std::string type;           // "reference", "dependency", "semantic_cluster", ...
    std::string source;
    std::string target;
    bool has_strength;
    double strength;

    Link() : has_strength(false), strength(0.0) {}

    bool operator==(const Link& o) const {
        return type == o.type && source == o.source && target == o.target &&
               has_strength == o.has_strength && (!has_strength || strength == o.strength);
    }
};

// A section whose name is not known to this version; lines are kept verbatim
struct OpaqueSection {
    std::string name;
    std::string identifier;
    std::vector<std::string> lines;

    bool operator==(const OpaqueSection& o) const {
        return name == o.name && identifier == o.identifier && lines == o.lines;
    }
};

} // namespace ctxformat

#endif // ctxformat_FORMAT_TYPES_HPP
