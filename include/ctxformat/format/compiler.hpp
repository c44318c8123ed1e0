/*
 * ctxformat C++ - Compiler
 *
 * Renders a Document as context-file text. Output is deterministic:
 * sections in canonical order (METADATA, SESSION, CONVERSATION, MEMORY,
 * STATE, INSIGHTS, DECISIONS, WORK, LINKS, then opaque sections in read
 * order), fixed field order per record, a blank line between sections,
 * empty sections omitted, and a trailing newline.
 *
 * Every value goes through sanitize(), so no record can produce a line
 * that splits into extra fields or breaks into two lines.
 */
#ifndef ctxformat_FORMAT_COMPILER_HPP
#define ctxformat_FORMAT_COMPILER_HPP

#include "document.hpp"
#include <string>

namespace ctxformat {

std::string compile(const Document& doc);

// "@NAME:" header line, no newline
std::string section_header(SectionKind kind);

// Single record lines, no newline
std::string compile_record(const Conversation& c);
std::string compile_record(const MemoryRecord& m);
std::string compile_record(const StateEntry& s);
std::string compile_record(const Insight& i);
std::string compile_record(const Decision& d);
std::string compile_record(const WorkItem& w);
std::string compile_record(const Link& l);

// key=value blocks, one line per key, each line newline-terminated
std::string compile_metadata_body(const Metadata& m);
std::string compile_session_body(const Session& s);

} // namespace ctxformat

#endif // ctxformat_FORMAT_COMPILER_HPP
