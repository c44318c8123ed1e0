#include <ctxformat/format/document.hpp>

namespace ctxformat {

size_t Document::record_count() const {
    return (has_metadata ? 1 : 0) + sessions.size() + conversations.size() +
           memories.size() + states.size() + insights.size() + decisions.size() +
           work.size() + links.size() + opaque.size();
}

const Session* Document::current_session() const {
    if (sessions.empty()) return nullptr;
    return &sessions.back();
}

const StateEntry* Document::find_state(StateScope scope, const std::string& key) const {
    for (std::vector<StateEntry>::const_reverse_iterator it = states.rbegin(); it != states.rend(); ++it) {
        if (it->scope == scope && it->key == key) {
            return &(*it);
        }
    }
    return nullptr;
}

std::map<std::string, std::string> Document::state_snapshot(StateScope scope) const {
    std::map<std::string, std::string> snapshot;
    for (const StateEntry& s : states) {
        if (s.scope == scope) {
            snapshot[s.key] = s.value;
        }
    }
    return snapshot;
}

std::vector<Conversation> Document::last_conversations(size_t count) const {
    if (count >= conversations.size()) {
        return conversations;
    }
    return std::vector<Conversation>(conversations.end() - count, conversations.end());
}

const WorkItem* Document::find_work(const std::string& id) const {
    for (std::vector<WorkItem>::const_reverse_iterator it = work.rbegin(); it != work.rend(); ++it) {
        if (it->id == id) {
            return &(*it);
        }
    }
    return nullptr;
}

const WorkItem* Document::current_work() const {
    if (work.empty()) return nullptr;
    return &work.back();
}

std::string Document::metadata_value(const std::string& key, const std::string& default_val) const {
    if (!has_metadata) return default_val;
    if (key == "format_version") return metadata.format_version;
    if (key == "created_at") return metadata.created_at;
    if (key == "updated_at") return metadata.updated_at;
    std::map<std::string, std::string>::const_iterator it = metadata.extra.find(key);
    return it != metadata.extra.end() ? it->second : default_val;
}

bool Document::operator==(const Document& o) const {
    if (has_metadata != o.has_metadata) return false;
    if (has_metadata && !(metadata == o.metadata)) return false;
    return sessions == o.sessions && conversations == o.conversations &&
           memories == o.memories && states == o.states && insights == o.insights &&
           decisions == o.decisions && work == o.work && links == o.links &&
           opaque == o.opaque;
}

} // namespace ctxformat
