/*
 * ctxformat C++ - Field Sanitizer
 *
 * Reversible backslash escaping for field values:
 *
 *   \   ->  \\          |   ->  \|
 *   LF  ->  \n          CR  ->  \r
 *   @   ->  \@   (first character of a value only)
 *   =   ->  \=   (keys of key=value sections only, see sanitize_key)
 *
 * unsanitize(sanitize(x)) == x for every input, and sanitize() is
 * injective. A sanitized value never contains a raw delimiter or line
 * terminator and never starts a line that looks like a section header.
 */
#ifndef ctxformat_FORMAT_SANITIZER_HPP
#define ctxformat_FORMAT_SANITIZER_HPP

#include <string>
#include <vector>

namespace ctxformat {

const char kFieldDelimiter = '|';
const char kKeyValueSeparator = '=';
const char kEscapeChar = '\\';

std::string sanitize(const std::string& value);

// sanitize() plus escaping of '=' so the key/value split stays unambiguous
std::string sanitize_key(const std::string& key);

// Inverse of sanitize() and sanitize_key(). Unknown escapes and a trailing
// lone backslash are kept literally.
std::string unsanitize(const std::string& value);

// Split a record line on unescaped '|'. Fields are returned still escaped.
std::vector<std::string> split_fields(const std::string& line);

// Split on the first unescaped '='. Returns false if there is none.
bool split_key_value(const std::string& line, std::string& key, std::string& value);

// Escape only CR and LF. Used for raw lines that are already in wire form.
std::string escape_line_breaks(const std::string& line);

} // namespace ctxformat

#endif // ctxformat_FORMAT_SANITIZER_HPP
