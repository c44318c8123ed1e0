/*
 * ctxformat C++ - Document
 *
 * In-memory form of one context file. Records keep their append order;
 * "updates" are later records, reconciled by the accessors below:
 *   - metadata: later keys shadow earlier ones (done while parsing)
 *   - sessions: the last session is the current one
 *   - state:    the last record for a scope+key wins
 *   - work:     the last record for an id wins
 */
#ifndef ctxformat_FORMAT_DOCUMENT_HPP
#define ctxformat_FORMAT_DOCUMENT_HPP

#include "types.hpp"
#include <string>
#include <vector>
#include <map>

namespace ctxformat {

struct Document {
    bool has_metadata;
    Metadata metadata;
    std::vector<Session> sessions;
    std::vector<Conversation> conversations;
    std::vector<MemoryRecord> memories;
    std::vector<StateEntry> states;
    std::vector<Insight> insights;
    std::vector<Decision> decisions;
    std::vector<WorkItem> work;
    std::vector<Link> links;
    std::vector<OpaqueSection> opaque;

    Document() : has_metadata(false) {}

    // Total number of records, metadata counted as one
    size_t record_count() const;
    bool empty() const { return record_count() == 0; }

    // nullptr if no session was recorded
    const Session* current_session() const;

    // Last state record for scope+key, nullptr if none
    const StateEntry* find_state(StateScope scope, const std::string& key) const;

    // Reconciled key -> value view of one scope
    std::map<std::string, std::string> state_snapshot(StateScope scope) const;

    // Up to `count` most recent conversation records, oldest first
    std::vector<Conversation> last_conversations(size_t count) const;

    const WorkItem* find_work(const std::string& id) const;
    const WorkItem* current_work() const;

    std::string metadata_value(const std::string& key, const std::string& default_val = "") const;

    bool operator==(const Document& o) const;
    bool operator!=(const Document& o) const { return !(*this == o); }
};

} // namespace ctxformat

#endif // ctxformat_FORMAT_DOCUMENT_HPP
