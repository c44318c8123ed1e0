#include <ctxformat/core/utils.hpp>
#include <algorithm>
#include <numeric>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <sstream>
#include <iomanip>
#include <fstream>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace ctxformat {

// ============ Time utilities ============

int64_t current_timestamp() {
    return static_cast<int64_t>(std::time(NULL));
}

int64_t current_timestamp_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

std::string format_timestamp(int64_t timestamp) {
    time_t t = static_cast<time_t>(timestamp);
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return std::string(buf);
}

std::string now_iso8601() {
    return format_timestamp(current_timestamp());
}

// ============ String utilities ============

std::string trim(const std::string& s) {
    return rtrim(ltrim(s));
}

std::string ltrim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    return s.substr(start);
}

std::string rtrim(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\n\r");
    if (end == std::string::npos) return "";
    return s.substr(0, end + 1);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), s.begin());
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    if (parts.empty()) return "";
    return std::accumulate(
        std::next(parts.begin()), parts.end(), parts[0],
        [&](const std::string& a, const std::string& b) {
            return a + delimiter + b;
        });
}

bool parse_int64(const std::string& s, int64_t& out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long v = strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) return false;
    out = static_cast<int64_t>(v);
    return true;
}

bool parse_double(const std::string& s, double& out) {
    if (s.empty() || std::isspace(static_cast<unsigned char>(s[0]))) return false;
    errno = 0;
    char* end = nullptr;
    double v = strtod(s.c_str(), &end);
    if (errno != 0 || end != s.c_str() + s.size()) return false;
    out = v;
    return true;
}

std::string format_double(double value) {
    char buf[64];
    for (int precision = 15; precision < 17; ++precision) {
        snprintf(buf, sizeof(buf), "%.*g", precision, value);
        if (strtod(buf, nullptr) == value) {
            return std::string(buf);
        }
    }
    // 17 significant digits always read back to the same double
    snprintf(buf, sizeof(buf), "%.17g", value);
    return std::string(buf);
}

bool is_valid_utf8(const std::string& s, size_t* bad_offset) {
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        int expected = 0;
        uint32_t cp = 0;

        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            expected = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            expected = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            expected = 4;
            cp = c & 0x07;
        } else {
            if (bad_offset) *bad_offset = i;
            return false;
        }

        if (i + expected > s.size()) {
            if (bad_offset) *bad_offset = i;
            return false;
        }
        for (int j = 1; j < expected; ++j) {
            unsigned char cc = static_cast<unsigned char>(s[i + j]);
            if ((cc & 0xC0) != 0x80) {
                if (bad_offset) *bad_offset = i;
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        bool overlong = (expected == 2 && cp < 0x80) ||
                        (expected == 3 && cp < 0x800) ||
                        (expected == 4 && cp < 0x10000);
        if (overlong || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            if (bad_offset) *bad_offset = i;
            return false;
        }
        i += expected;
    }
    return true;
}

// ============ Path utilities ============

std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;

    bool a_ends_slash = a.back() == '/';
    bool b_starts_slash = b[0] == '/';

    if (a_ends_slash && b_starts_slash) {
        return a + b.substr(1);
    }
    if (!a_ends_slash && !b_starts_slash) {
        return a + "/" + b;
    }
    return a + b;
}

bool create_directories(const std::string& dir) {
    if (dir.empty()) return true;

    std::string current;
    for (size_t i = 0; i < dir.size(); ++i) {
        current += dir[i];
        if (dir[i] == '/' || i == dir.size() - 1) {
            struct stat st;
            if (stat(current.c_str(), &st) != 0) {
                if (mkdir(current.c_str(), 0755) != 0 && errno != EEXIST) {
                    return false;
                }
            }
        }
    }
    return true;
}

bool create_parent_directory(const std::string& filepath) {
    size_t pos = filepath.rfind('/');
    if (pos == std::string::npos || pos == 0) return true;
    return create_directories(filepath.substr(0, pos));
}

bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

int64_t file_size(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return -1;
    }
    return static_cast<int64_t>(st.st_size);
}

bool read_file(const std::string& path, std::string& out, std::string& error) {
    std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
    if (!in) {
        error = "cannot open '" + path + "': " + strerror(errno);
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        error = "read error on '" + path + "'";
        return false;
    }
    out = ss.str();
    return true;
}

// ============ UUID utilities ============

std::string generate_uuid() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, 16) != 1) {
        // RAND_bytes only fails when the CSPRNG cannot be seeded
        for (int i = 0; i < 16; ++i) {
            bytes[i] = static_cast<unsigned char>(current_timestamp_ms() >> ((i % 8) * 8)) ^
                       static_cast<unsigned char>(getpid() + i * 31);
        }
    }

    // Set version 4
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    // Set variant
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }

    return oss.str();
}

// ============ Hashing utilities ============

std::string sha256_hex(const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

} // namespace ctxformat
