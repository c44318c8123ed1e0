/*
 * ctxformat C++ - Secret/PII Detector
 *
 * A table of independent matchers, each scanning text and reporting typed
 * findings (type tag, category, byte offset, length, masked preview).
 * Matchers are compiled once, when the Detector is constructed.
 *
 * Detection is best-effort pattern matching. Formats the table does not
 * know about are not found; treat this as a mitigation layer only.
 */
#ifndef ctxformat_SECURITY_DETECTOR_HPP
#define ctxformat_SECURITY_DETECTOR_HPP

#include <string>
#include <vector>
#include <memory>
#include <regex>
#include <functional>
#include <utility>

namespace ctxformat {

enum class DetectionCategory {
    Secret,     // credentials, API keys, tokens
    Pii         // personal data
};

const char* to_string(DetectionCategory category);

struct Detection {
    std::string type;           // "anthropicKey", "email", ...
    DetectionCategory category;
    size_t start;               // byte offset into the scanned text
    size_t length;
    std::string masked;         // smart_mask() of the matched span

    Detection() : category(DetectionCategory::Secret), start(0), length(0) {}
};

// One merged, masked region of a redacted text
struct RedactedSpan {
    size_t start;               // offset in the original text
    size_t length;              // length in the original text
    std::vector<std::string> types;
    std::string masked;
    std::string fingerprint;    // first 12 hex chars of SHA-256(original span)

    RedactedSpan() : start(0), length(0) {}
};

struct RedactionOutcome {
    std::string text;
    std::vector<RedactedSpan> spans;
};

// Values longer than 8 characters keep their first and last 4 characters
// around a fixed "****"; shorter values become a fixed "********".
std::string smart_mask(const std::string& value);

// Luhn checksum over the digits of `number` (separators ignored)
bool luhn_valid(const std::string& number);

// Rejects area 000/666/9xx, group 00 and serial 0000
bool ssn_valid(const std::string& ssn);

// ============================================================================
// Matchers
// ============================================================================

class SecretMatcher {
public:
    virtual ~SecretMatcher() {}

    virtual const std::string& type() const = 0;
    virtual DetectionCategory category() const = 0;

    // Append findings for `text` to `out`
    virtual void scan(const std::string& text, std::vector<Detection>& out) const = 0;
};

typedef std::function<bool(const std::string& match)> MatchValidator;

class RegexMatcher : public SecretMatcher {
public:
    // `group` selects the capture reported as the finding (0 = whole match);
    // `validator`, if set, must accept the reported text.
    RegexMatcher(const std::string& type,
                 DetectionCategory category,
                 const std::string& pattern,
                 std::regex::flag_type flags = std::regex::ECMAScript,
                 size_t group = 0,
                 MatchValidator validator = MatchValidator());

    const std::string& type() const override { return type_; }
    DetectionCategory category() const override { return category_; }
    void scan(const std::string& text, std::vector<Detection>& out) const override;

    // Run the regex only on windows of `reach` bytes around each occurrence
    // of an anchor. Every match must contain an anchor and lie within reach
    // of it. Without anchors the whole text is scanned.
    void set_anchor_literals(const std::vector<std::string>& literals, size_t reach,
                             bool ignore_case = false);
    void set_anchor_chars(const std::string& chars, size_t reach);

    // A finding that ends where its match ends is extended over these
    // characters, so tokens longer than the pattern's bound are covered whole
    void set_tail_chars(const std::string& chars) { tail_chars_ = chars; }

private:
    typedef std::pair<size_t, size_t> Window;

    std::vector<Window> windows(const std::string& text) const;
    void scan_range(const std::string& text, size_t begin, size_t end,
                    std::vector<Detection>& out) const;

    std::string type_;
    DetectionCategory category_;
    std::regex pattern_;
    size_t group_;
    MatchValidator validator_;

    std::vector<std::string> anchor_literals_;
    std::string anchor_chars_;
    size_t reach_;
    bool anchor_icase_;
    std::string tail_chars_;
};

// PEM private key blocks, "-----BEGIN <label>PRIVATE KEY-----" up to the
// matching END line. A block with no END line runs to the end of its
// base64 body.
class PemBlockMatcher : public SecretMatcher {
public:
    PemBlockMatcher();

    const std::string& type() const override { return type_; }
    DetectionCategory category() const override { return DetectionCategory::Secret; }
    void scan(const std::string& text, std::vector<Detection>& out) const override;

private:
    std::string type_;
};

std::vector<std::unique_ptr<SecretMatcher> > default_secret_matchers();
std::vector<std::unique_ptr<SecretMatcher> > default_pii_matchers();

// ============================================================================
// Detector
// ============================================================================

struct DetectorOptions {
    bool secrets;
    bool pii;

    DetectorOptions() : secrets(true), pii(true) {}
};

class Detector {
public:
    Detector();
    explicit Detector(const DetectorOptions& options);

    // Findings ordered by start offset, then longest first
    std::vector<Detection> detect(const std::string& text) const;

    bool contains_sensitive(const std::string& text) const;

    // Replace every finding with its mask. Overlapping findings are merged
    // into one span, masked as a whole.
    RedactionOutcome redact(const std::string& text) const;

    void add_matcher(std::unique_ptr<SecretMatcher> matcher);
    size_t matcher_count() const { return matchers_.size(); }
    std::vector<std::string> types() const;

private:
    Detector(const Detector&);
    Detector& operator=(const Detector&);

    std::vector<std::unique_ptr<SecretMatcher> > matchers_;
};

// Scan with the shared default table (secrets + PII)
std::vector<Detection> detect(const std::string& text);

} // namespace ctxformat

#endif // ctxformat_SECURITY_DETECTOR_HPP
