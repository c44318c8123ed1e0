#include <ctxformat/format/sanitizer.hpp>

namespace ctxformat {

namespace {

std::string escape(const std::string& value, bool escape_separator) {
    std::string out;
    out.reserve(value.size() + 8);

    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        switch (c) {
            case kEscapeChar:     out += "\\\\"; break;
            case kFieldDelimiter: out += "\\|"; break;
            case '\n':            out += "\\n"; break;
            case '\r':            out += "\\r"; break;
            case '@':
                if (i == 0) out += "\\@";
                else out += c;
                break;
            case kKeyValueSeparator:
                if (escape_separator) out += "\\=";
                else out += c;
                break;
            default:
                out += c;
        }
    }
    return out;
}

} // namespace

std::string sanitize(const std::string& value) {
    return escape(value, false);
}

std::string sanitize_key(const std::string& key) {
    return escape(key, true);
}

std::string unsanitize(const std::string& value) {
    std::string out;
    out.reserve(value.size());

    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c != kEscapeChar || i + 1 >= value.size()) {
            out += c;
            continue;
        }
        char next = value[i + 1];
        switch (next) {
            case kEscapeChar:         out += kEscapeChar; ++i; break;
            case kFieldDelimiter:     out += kFieldDelimiter; ++i; break;
            case 'n':                 out += '\n'; ++i; break;
            case 'r':                 out += '\r'; ++i; break;
            case '@':                 out += '@'; ++i; break;
            case kKeyValueSeparator:  out += kKeyValueSeparator; ++i; break;
            default:
                // Not produced by sanitize(); hand-edited text
                out += c;
        }
    }
    return out;
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == kEscapeChar && i + 1 < line.size()) {
            current += c;
            current += line[++i];
        } else if (c == kFieldDelimiter) {
            fields.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    fields.push_back(current);
    return fields;
}

bool split_key_value(const std::string& line, std::string& key, std::string& value) {
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == kEscapeChar) {
            ++i;
        } else if (line[i] == kKeyValueSeparator) {
            key = line.substr(0, i);
            value = line.substr(i + 1);
            return true;
        }
    }
    return false;
}

std::string escape_line_breaks(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '\n') out += "\\n";
        else if (line[i] == '\r') out += "\\r";
        else out += line[i];
    }
    return out;
}

} // namespace ctxformat
