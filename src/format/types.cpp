#include <ctxformat/format/types.hpp>

namespace ctxformat {

const char* const kFormatVersion = "1.0";

namespace {

struct SectionEntry {
    SectionKind kind;
    const char* name;
};

const SectionEntry kSections[] = {
    { SectionKind::Metadata,     "METADATA" },
    { SectionKind::Session,      "SESSION" },
    { SectionKind::Conversation, "CONVERSATION" },
    { SectionKind::Memory,       "MEMORY" },
    { SectionKind::State,        "STATE" },
    { SectionKind::Insights,     "INSIGHTS" },
    { SectionKind::Decisions,    "DECISIONS" },
    { SectionKind::Work,         "WORK" },
    { SectionKind::Links,        "LINKS" },
};

} // namespace

const char* section_name(SectionKind kind) {
    for (const SectionEntry& e : kSections) {
        if (e.kind == kind) return e.name;
    }
    return "";
}

SectionKind section_kind_from_name(const std::string& name) {
    for (const SectionEntry& e : kSections) {
        if (name == e.name) return e.kind;
    }
    return SectionKind::Unknown;
}

const char* to_string(Role role) {
    switch (role) {
        case Role::User:      return "user";
        case Role::Assistant: return "assistant";
        case Role::System:    return "system";
    }
    return "";
}

const char* to_string(MemoryType type) {
    switch (type) {
        case MemoryType::Episodic:   return "episodic";
        case MemoryType::Semantic:   return "semantic";
        case MemoryType::Procedural: return "procedural";
    }
    return "";
}

const char* to_string(StateScope scope) {
    switch (scope) {
        case StateScope::Session: return "session";
        case StateScope::User:    return "user";
        case StateScope::App:     return "app";
        case StateScope::Temp:    return "temp";
    }
    return "";
}

const char* to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Active:    return "active";
        case SessionStatus::Completed: return "completed";
        case SessionStatus::Archived:  return "archived";
    }
    return "";
}

const char* to_string(WorkStatus status) {
    switch (status) {
        case WorkStatus::NotStarted: return "not_started";
        case WorkStatus::InProgress: return "in_progress";
        case WorkStatus::Completed:  return "completed";
        case WorkStatus::Blocked:    return "blocked";
    }
    return "";
}

bool parse_role(const std::string& s, Role& out) {
    if (s == "user")      { out = Role::User; return true; }
    if (s == "assistant") { out = Role::Assistant; return true; }
    if (s == "system")    { out = Role::System; return true; }
    return false;
}

bool parse_memory_type(const std::string& s, MemoryType& out) {
    if (s == "episodic")   { out = MemoryType::Episodic; return true; }
    if (s == "semantic")   { out = MemoryType::Semantic; return true; }
    if (s == "procedural") { out = MemoryType::Procedural; return true; }
    return false;
}

bool parse_state_scope(const std::string& s, StateScope& out) {
    if (s == "session") { out = StateScope::Session; return true; }
    if (s == "user")    { out = StateScope::User; return true; }
    if (s == "app")     { out = StateScope::App; return true; }
    if (s == "temp")    { out = StateScope::Temp; return true; }
    return false;
}

bool parse_session_status(const std::string& s, SessionStatus& out) {
    if (s == "active")    { out = SessionStatus::Active; return true; }
    if (s == "completed") { out = SessionStatus::Completed; return true; }
    if (s == "archived")  { out = SessionStatus::Archived; return true; }
    return false;
}

bool parse_work_status(const std::string& s, WorkStatus& out) {
    if (s == "not_started") { out = WorkStatus::NotStarted; return true; }
    if (s == "in_progress") { out = WorkStatus::InProgress; return true; }
    if (s == "completed")   { out = WorkStatus::Completed; return true; }
    if (s == "blocked")     { out = WorkStatus::Blocked; return true; }
    return false;
}

} // namespace ctxformat
