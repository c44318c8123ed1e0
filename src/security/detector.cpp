/*
 * ctxformat C++ - Secret/PII Detector Implementation
 */
#include <ctxformat/security/detector.hpp>
#include <ctxformat/core/utils.hpp>
#include <ctxformat/core/logger.hpp>

#include <algorithm>
#include <cctype>
#include <set>

namespace ctxformat {

const char* to_string(DetectionCategory category) {
    switch (category) {
        case DetectionCategory::Secret: return "secret";
        case DetectionCategory::Pii:    return "pii";
    }
    return "";
}

// ============================================================================
// Masking and validators
// ============================================================================

std::string smart_mask(const std::string& value) {
    if (value.size() <= 8) {
        return "********";
    }
    return value.substr(0, 4) + "****" + value.substr(value.size() - 4);
}

bool luhn_valid(const std::string& number) {
    std::string digits;
    for (char c : number) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
        } else if (c != ' ' && c != '-') {
            return false;
        }
    }
    if (digits.size() < 13 || digits.size() > 19) return false;

    int sum = 0;
    bool dbl = false;
    for (size_t i = digits.size(); i-- > 0;) {
        int d = digits[i] - '0';
        if (dbl) {
            d *= 2;
            if (d > 9) d -= 9;
        }
        sum += d;
        dbl = !dbl;
    }
    return sum % 10 == 0;
}

bool ssn_valid(const std::string& ssn) {
    // NNN-NN-NNNN
    if (ssn.size() != 11 || ssn[3] != '-' || ssn[6] != '-') return false;
    std::string area = ssn.substr(0, 3);
    std::string group = ssn.substr(4, 2);
    std::string serial = ssn.substr(7, 4);
    if (area == "000" || area == "666" || area[0] == '9') return false;
    if (group == "00") return false;
    if (serial == "0000") return false;
    return true;
}

namespace {

// Luhn plus one separator style throughout, so that digit runs inside
// identifiers such as "9012-345678901234" are not taken for card numbers
bool card_number_valid(const std::string& number) {
    char sep = '\0';
    size_t separators = 0;
    for (char c : number) {
        if (c != ' ' && c != '-') continue;
        if (sep != '\0' && c != sep) return false;
        sep = c;
        ++separators;
    }
    if (separators != 0 && separators != 3) return false;
    return luhn_valid(number);
}

} // namespace

// ============================================================================
// RegexMatcher
// ============================================================================

namespace {

const std::string kAlnum =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // namespace

RegexMatcher::RegexMatcher(const std::string& type,
                           DetectionCategory category,
                           const std::string& pattern,
                           std::regex::flag_type flags,
                           size_t group,
                           MatchValidator validator)
    : type_(type)
    , category_(category)
    , pattern_(pattern, flags)
    , group_(group)
    , validator_(validator)
    , reach_(0)
    , anchor_icase_(false) {}

void RegexMatcher::set_anchor_literals(const std::vector<std::string>& literals, size_t reach,
                                       bool ignore_case) {
    anchor_literals_.clear();
    for (const std::string& lit : literals) {
        if (lit.empty()) continue;
        anchor_literals_.push_back(ignore_case ? to_lower(lit) : lit);
    }
    anchor_icase_ = ignore_case;
    reach_ = reach;
}

void RegexMatcher::set_anchor_chars(const std::string& chars, size_t reach) {
    anchor_chars_ = chars;
    reach_ = reach;
}

std::vector<RegexMatcher::Window> RegexMatcher::windows(const std::string& text) const {
    const size_t n = text.size();
    std::vector<Window> raw;

    // Hits of one anchor arrive in order, so most merging happens here
    auto add = [&](size_t at, size_t len) {
        size_t a = at > reach_ ? at - reach_ : 0;
        size_t b = std::min(n, at + len + reach_);
        if (!raw.empty() && a >= raw.back().first && a <= raw.back().second) {
            raw.back().second = std::max(raw.back().second, b);
        } else {
            raw.push_back(Window(a, b));
        }
    };

    if (!anchor_literals_.empty()) {
        std::string lowered;
        if (anchor_icase_) lowered = to_lower(text);
        const std::string& haystack = anchor_icase_ ? lowered : text;

        for (const std::string& lit : anchor_literals_) {
            size_t pos = 0;
            while ((pos = haystack.find(lit, pos)) != std::string::npos) {
                add(pos, lit.size());
                pos += lit.size();
            }
        }
    }
    if (!anchor_chars_.empty()) {
        size_t pos = 0;
        while ((pos = text.find_first_of(anchor_chars_, pos)) != std::string::npos) {
            add(pos, 1);
            ++pos;
        }
    }

    std::sort(raw.begin(), raw.end());
    std::vector<Window> merged;
    for (const Window& w : raw) {
        if (!merged.empty() && w.first <= merged.back().second) {
            merged.back().second = std::max(merged.back().second, w.second);
        } else {
            merged.push_back(w);
        }
    }
    return merged;
}

void RegexMatcher::scan(const std::string& text, std::vector<Detection>& out) const {
    if (anchor_literals_.empty() && anchor_chars_.empty()) {
        scan_range(text, 0, text.size(), out);
        return;
    }
    for (const Window& w : windows(text)) {
        scan_range(text, w.first, w.second, out);
    }
}

void RegexMatcher::scan_range(const std::string& text, size_t begin, size_t end,
                              std::vector<Detection>& out) const {
    // The regex sees the byte before the window, and a window that ends
    // inside a word does not end a word
    std::regex_constants::match_flag_type flags = std::regex_constants::match_default;
    if (begin > 0) {
        flags |= std::regex_constants::match_prev_avail;
    }
    if (end < text.size() && is_word_char(text[end])) {
        flags |= std::regex_constants::match_not_eow;
    }

    std::sregex_iterator it(text.begin() + begin, text.begin() + end, pattern_, flags);
    std::sregex_iterator last;

    for (; it != last; ++it) {
        const std::smatch& m = *it;
        if (group_ >= m.size() || !m[group_].matched) continue;

        std::string value = m[group_].str();
        if (value.empty()) continue;
        if (validator_ && !validator_(value)) continue;

        size_t start = static_cast<size_t>(m[group_].first - text.begin());
        size_t stop = static_cast<size_t>(m[group_].second - text.begin());
        if (!tail_chars_.empty() && m[group_].second == m[0].second) {
            while (stop < text.size() && tail_chars_.find(text[stop]) != std::string::npos) {
                ++stop;
            }
        }

        Detection d;
        d.type = type_;
        d.category = category_;
        d.start = start;
        d.length = stop - start;
        d.masked = smart_mask(text.substr(start, stop - start));
        out.push_back(d);
    }
}

// ============================================================================
// PemBlockMatcher
// ============================================================================

namespace {

const size_t kMaxPemLabel = 64;

bool is_pem_body_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) ||
           c == '+' || c == '/' || c == '=' || c == '\r' || c == '\n';
}

} // namespace

PemBlockMatcher::PemBlockMatcher() : type_("privateKey") {}

void PemBlockMatcher::scan(const std::string& text, std::vector<Detection>& out) const {
    static const std::string kBegin = "-----BEGIN ";
    static const std::string kDashes = "-----";
    static const std::string kSuffix = "PRIVATE KEY";

    // Labels already searched for without a footer
    std::set<std::string> unterminated;

    size_t pos = 0;
    while ((pos = text.find(kBegin, pos)) != std::string::npos) {
        size_t label_start = pos + kBegin.size();
        size_t i = label_start;
        while (i < text.size() && i - label_start < kMaxPemLabel &&
               ((text[i] >= 'A' && text[i] <= 'Z') || text[i] == ' ')) {
            ++i;
        }
        std::string label = text.substr(label_start, i - label_start);
        if (label.size() < kSuffix.size() ||
            label.compare(label.size() - kSuffix.size(), kSuffix.size(), kSuffix) != 0 ||
            text.compare(i, kDashes.size(), kDashes) != 0) {
            pos = label_start;
            continue;
        }

        size_t body = i + kDashes.size();
        size_t stop = std::string::npos;
        if (unterminated.count(label) == 0) {
            std::string footer = "-----END " + label + kDashes;
            size_t f = text.find(footer, body);
            if (f != std::string::npos) {
                stop = f + footer.size();
            } else {
                unterminated.insert(label);
            }
        }
        if (stop == std::string::npos) {
            stop = body;
            while (stop < text.size() && is_pem_body_char(text[stop])) ++stop;
        }

        Detection d;
        d.type = type_;
        d.category = DetectionCategory::Secret;
        d.start = pos;
        d.length = stop - pos;
        d.masked = smart_mask(text.substr(pos, stop - pos));
        out.push_back(d);
        pos = stop;
    }
}

// ============================================================================
// Pattern tables
// ============================================================================

// Every repeat is bounded; std::regex recursion grows with match length.
// Tokens longer than a bound are still covered by their tail characters.

std::vector<std::unique_ptr<SecretMatcher> > default_secret_matchers() {
    std::vector<std::unique_ptr<SecretMatcher> > m;
    const DetectionCategory S = DetectionCategory::Secret;

    std::unique_ptr<RegexMatcher> anthropic(new RegexMatcher("anthropicKey", S,
        "\\bsk-ant-[A-Za-z0-9_-]{95,256}"));
    anthropic->set_anchor_literals({ "sk-ant-" }, 264);
    anthropic->set_tail_chars(kAlnum + "_-");
    m.push_back(std::move(anthropic));

    std::unique_ptr<RegexMatcher> openai(new RegexMatcher("openaiKey", S,
        "\\bsk-(?!ant-)(?:proj-)?[A-Za-z0-9_-]{32,256}"));
    openai->set_anchor_literals({ "sk-" }, 272);
    openai->set_tail_chars(kAlnum + "_-");
    m.push_back(std::move(openai));

    std::unique_ptr<RegexMatcher> github(new RegexMatcher("githubToken", S,
        "\\b(?:gh[pousr]_[A-Za-z0-9]{36,255}|github_pat_[A-Za-z0-9]{22}_[A-Za-z0-9]{59,255})"));
    github->set_anchor_literals({ "ghp_", "gho_", "ghu_", "ghs_", "ghr_", "github_pat_" }, 288);
    github->set_tail_chars(kAlnum + "_");
    m.push_back(std::move(github));

    std::unique_ptr<RegexMatcher> aws(new RegexMatcher("awsKey", S,
        "\\b(?:AKIA|ASIA)[0-9A-Z]{16}\\b"));
    aws->set_anchor_literals({ "AKIA", "ASIA" }, 24);
    m.push_back(std::move(aws));

    std::unique_ptr<RegexMatcher> slack(new RegexMatcher("slackToken", S,
        "\\bxox[abprs]-[A-Za-z0-9-]{10,256}"));
    slack->set_anchor_literals({ "xox" }, 264);
    slack->set_tail_chars(kAlnum + "-");
    m.push_back(std::move(slack));

    m.push_back(std::unique_ptr<SecretMatcher>(new PemBlockMatcher()));

    // Generic "password: value" / "api_key=value" assignments; only the value is masked
    std::unique_ptr<RegexMatcher> assignment(new RegexMatcher("apiKey", S,
        "\\b(?:api[_-]?key|access[_-]?token|auth[_-]?token|token|secret|password|passwd|bearer)\\b"
        "[\"']?[\\s:=]{1,16}[\"']?([A-Za-z0-9_.-]{20,256})",
        std::regex::ECMAScript | std::regex::icase, 1));
    assignment->set_anchor_literals({ "key", "token", "secret", "passw", "bearer" }, 288, true);
    assignment->set_tail_chars(kAlnum + "_.-");
    m.push_back(std::move(assignment));

    return m;
}

std::vector<std::unique_ptr<SecretMatcher> > default_pii_matchers() {
    std::vector<std::unique_ptr<SecretMatcher> > m;
    const DetectionCategory P = DetectionCategory::Pii;
    const std::string digits = "0123456789";

    std::unique_ptr<RegexMatcher> email(new RegexMatcher("email", P,
        "\\b[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,253}\\.[A-Za-z]{2,24}\\b"));
    email->set_anchor_literals({ "@" }, 288);
    m.push_back(std::move(email));

    std::unique_ptr<RegexMatcher> ssn(new RegexMatcher("ssn", P,
        "\\b[0-9]{3}-[0-9]{2}-[0-9]{4}\\b",
        std::regex::ECMAScript, 0, ssn_valid));
    ssn->set_anchor_literals({ "-" }, 12);
    m.push_back(std::move(ssn));

    std::unique_ptr<RegexMatcher> card(new RegexMatcher("creditCard", P,
        "\\b(?:[0-9]{4}[- ]?){3}[0-9]{4}\\b",
        std::regex::ECMAScript, 0, card_number_valid));
    card->set_anchor_chars(digits, 20);
    m.push_back(std::move(card));

    // Separators are required so that plain digit runs (ids, counters) are not flagged
    std::unique_ptr<RegexMatcher> phone(new RegexMatcher("phone", P,
        "(?:\\+1[-. ]?)?(?:\\([0-9]{3}\\) ?|\\b[0-9]{3}[-. ])[0-9]{3}[-. ][0-9]{4}\\b"));
    phone->set_anchor_chars(digits, 20);
    m.push_back(std::move(phone));

    std::unique_ptr<RegexMatcher> ip(new RegexMatcher("ipAddress", P,
        "\\b(?:(?:25[0-5]|2[0-4][0-9]|1[0-9]{2}|[1-9]?[0-9])\\.){3}"
        "(?:25[0-5]|2[0-4][0-9]|1[0-9]{2}|[1-9]?[0-9])\\b"));
    ip->set_anchor_literals({ "." }, 16);
    m.push_back(std::move(ip));

    std::unique_ptr<RegexMatcher> birth(new RegexMatcher("dateOfBirth", P,
        "\\b(?:0[1-9]|1[0-2])/(?:0[1-9]|[12][0-9]|3[01])/(?:19|20)[0-9]{2}\\b"));
    birth->set_anchor_literals({ "/" }, 11);
    m.push_back(std::move(birth));

    return m;
}

// ============================================================================
// Detector
// ============================================================================

Detector::Detector() : Detector(DetectorOptions()) {}

Detector::Detector(const DetectorOptions& options) {
    if (options.secrets) {
        for (auto& m : default_secret_matchers()) matchers_.push_back(std::move(m));
    }
    if (options.pii) {
        for (auto& m : default_pii_matchers()) matchers_.push_back(std::move(m));
    }
    LOG_DEBUG("[Detector] %zu matchers (secrets=%s, pii=%s)",
              matchers_.size(), options.secrets ? "on" : "off", options.pii ? "on" : "off");
}

void Detector::add_matcher(std::unique_ptr<SecretMatcher> matcher) {
    if (matcher) {
        matchers_.push_back(std::move(matcher));
    }
}

std::vector<std::string> Detector::types() const {
    std::vector<std::string> result;
    for (const auto& m : matchers_) {
        result.push_back(m->type());
    }
    return result;
}

std::vector<Detection> Detector::detect(const std::string& text) const {
    std::vector<Detection> found;
    if (text.empty()) return found;

    for (const auto& m : matchers_) {
        m->scan(text, found);
    }

    std::stable_sort(found.begin(), found.end(), [](const Detection& a, const Detection& b) {
        if (a.start != b.start) return a.start < b.start;
        return a.length > b.length;
    });
    return found;
}

bool Detector::contains_sensitive(const std::string& text) const {
    return !detect(text).empty();
}

RedactionOutcome Detector::redact(const std::string& text) const {
    RedactionOutcome outcome;
    std::vector<Detection> found = detect(text);
    if (found.empty()) {
        outcome.text = text;
        return outcome;
    }

    // Merge overlapping findings; `found` is ordered by start
    std::vector<RedactedSpan> spans;
    for (const Detection& d : found) {
        size_t end = d.start + d.length;
        if (!spans.empty() && d.start < spans.back().start + spans.back().length) {
            RedactedSpan& cur = spans.back();
            size_t cur_end = cur.start + cur.length;
            if (end > cur_end) cur.length = end - cur.start;
            if (std::find(cur.types.begin(), cur.types.end(), d.type) == cur.types.end()) {
                cur.types.push_back(d.type);
            }
            continue;
        }
        RedactedSpan span;
        span.start = d.start;
        span.length = d.length;
        span.types.push_back(d.type);
        spans.push_back(span);
    }

    size_t pos = 0;
    for (RedactedSpan& span : spans) {
        std::string original = text.substr(span.start, span.length);
        span.masked = smart_mask(original);
        span.fingerprint = sha256_hex(original).substr(0, 12);

        outcome.text.append(text, pos, span.start - pos);
        outcome.text += span.masked;
        pos = span.start + span.length;
    }
    outcome.text.append(text, pos, std::string::npos);
    outcome.spans = spans;
    return outcome;
}

std::vector<Detection> detect(const std::string& text) {
    static const Detector detector;
    return detector.detect(text);
}

} // namespace ctxformat
