/*
 * ctxformat C++ - Parser
 *
 * Single linear pass over the text, one line at a time:
 *
 *   @NAME / @NAME:identifier   opens a section (closing the previous one)
 *   blank line                 ignored
 *   anything else              a record line of the current section
 *
 * Tabular sections split on unescaped '|'; METADATA and SESSION are
 * key=value. A line that does not decode (wrong field count, value outside
 * a closed enumeration, bad number) is skipped and reported as a
 * ParseWarning; parsing always continues. A final line with no newline
 * is a torn append and is dropped with a warning.
 *
 * Only stream-level problems (invalid UTF-8, unreadable file) fail the
 * parse as a whole.
 */
#ifndef ctxformat_FORMAT_PARSER_HPP
#define ctxformat_FORMAT_PARSER_HPP

#include "document.hpp"
#include <string>
#include <vector>

namespace ctxformat {

struct ParseWarning {
    size_t line;                // 1-based
    std::string section;        // header name, "" before the first header
    std::string message;

    ParseWarning() : line(0) {}
    ParseWarning(size_t l, const std::string& s, const std::string& m)
        : line(l), section(s), message(m) {}
};

enum class ParseErrorKind {
    None,
    Encoding,       // input is not valid UTF-8
    Io              // file could not be read
};

struct ParseResult {
    bool success;
    Document document;
    std::vector<ParseWarning> warnings;
    ParseErrorKind error_kind;
    std::string error;

    ParseResult() : success(false), error_kind(ParseErrorKind::None) {}

    static ParseResult fail(ParseErrorKind kind, const std::string& err) {
        ParseResult r;
        r.success = false;
        r.error_kind = kind;
        r.error = err;
        return r;
    }
};

struct ValidationResult {
    bool success;               // false only on stream-level failure
    bool valid;                 // metadata present and no warnings
    std::vector<std::string> problems;
    std::string error;

    ValidationResult() : success(false), valid(false) {}
};

// Recognizes "@NAME" and "@NAME:identifier" with NAME = [A-Z][A-Z0-9_]*
bool parse_section_header(const std::string& line, std::string& name, std::string& identifier);

class Parser {
public:
    Parser();

    ParseResult parse(const std::string& text);

private:
    struct Section {
        SectionKind kind;
        std::string name;
        std::string identifier;
        bool open;

        Section() : kind(SectionKind::Unknown), open(false) {}
    };

    void open_section(const std::string& name, const std::string& identifier);
    void close_section();
    void decode_line(const std::string& line);

    void decode_metadata(const std::string& line);
    void decode_session(const std::string& line);
    void decode_conversation(const std::vector<std::string>& fields);
    void decode_memory(const std::vector<std::string>& fields);
    void decode_state(const std::vector<std::string>& fields);
    void decode_insight(const std::vector<std::string>& fields);
    void decode_decision(const std::vector<std::string>& fields);
    void decode_work(const std::vector<std::string>& fields);
    void decode_link(const std::vector<std::string>& fields);

    bool check_arity(const std::vector<std::string>& fields, size_t min_fields, size_t max_fields);
    void warn(const std::string& message);

    Document doc_;
    std::vector<ParseWarning> warnings_;
    Section section_;
    size_t line_no_;
    size_t opaque_index_;
};

// Parse context-file text
ParseResult parse(const std::string& text);

// Read and parse a file
ParseResult parse_file(const std::string& path);

// Strict check: parses, requires @METADATA and zero warnings
ValidationResult validate(const std::string& text);

} // namespace ctxformat

#endif // ctxformat_FORMAT_PARSER_HPP
