/*
 * ctxformat C++ - Secure Writer
 *
 * The only component that touches context files on the write side.
 * Every write goes through the same pipeline:
 *
 *   fill defaults -> validate -> scan every field -> reject or redact
 *     -> compile -> append (O_APPEND, truncated back on failure)
 *
 * A write either appends the whole block or leaves the file as it was.
 * Files are append-only and single-writer; no locking is done.
 */
#ifndef ctxformat_SECURITY_SECURE_WRITER_HPP
#define ctxformat_SECURITY_SECURE_WRITER_HPP

#include <ctxformat/format/document.hpp>
#include <ctxformat/security/detector.hpp>
#include <ctxformat/security/redaction_log.hpp>
#include <map>
#include <string>
#include <vector>
#include <utility>

namespace ctxformat {

class Config;

struct WriterConfig {
    std::string base_dir;
    bool enable_secret_redaction;   // scan and mask before writing
    bool throw_on_secrets;          // reject the write instead of masking secrets
    bool log_redactions;            // record masked spans in the redaction log
    bool detect_pii;                // include the PII matchers
    bool fill_defaults;             // generate missing ids and timestamps
    bool sync;                      // fsync after every append
    std::string redaction_log_path; // target of flush_redaction_log(), "" = none

    WriterConfig()
        : base_dir(".ctx")
        , enable_secret_redaction(true)
        , throw_on_secrets(false)
        , log_redactions(true)
        , detect_pii(true)
        , fill_defaults(true)
        , sync(false) {}

    // Reads the "writer.*" keys; missing keys keep their defaults
    static WriterConfig from_config(const Config& cfg);
};

enum class WriteErrorKind {
    None,
    SecretsDetected,    // throw_on_secrets and the record contains secrets
    InvalidRecord,      // value outside a closed enumeration, bad number
    InvalidPath,        // target is not a plain file name
    Io
};

const char* to_string(WriteErrorKind kind);

struct WriteResult {
    bool success;
    WriteErrorKind kind;
    std::string error;
    std::vector<std::string> secret_types;  // set for SecretsDetected
    size_t bytes_written;
    size_t redactions;                      // spans masked in this write

    WriteResult() : success(false), kind(WriteErrorKind::None), bytes_written(0), redactions(0) {}

    static WriteResult ok(size_t bytes) {
        WriteResult r;
        r.success = true;
        r.bytes_written = bytes;
        return r;
    }

    static WriteResult fail(WriteErrorKind kind, const std::string& err) {
        WriteResult r;
        r.success = false;
        r.kind = kind;
        r.error = err;
        return r;
    }
};

// Plain file name: non-empty, no path separators, no "..", no control or
// reserved characters
bool is_valid_file_name(const std::string& name);

class SecureWriter {
public:
    explicit SecureWriter(const WriterConfig& config, RedactionLog* log = nullptr);

    WriteResult write_conversation(const std::string& file, const Conversation& rec);
    WriteResult write_memory(const std::string& file, const MemoryRecord& rec);
    WriteResult write_state(const std::string& file, const StateEntry& rec);
    WriteResult write_insight(const std::string& file, const Insight& rec);
    WriteResult write_decision(const std::string& file, const Decision& rec);
    WriteResult write_work(const std::string& file, const WorkItem& rec);
    WriteResult write_link(const std::string& file, const Link& rec);
    WriteResult write_session(const std::string& file, const Session& rec);

    // Writes a METADATA block only if the target is missing or empty;
    // otherwise succeeds with nothing written
    WriteResult write_metadata(const std::string& file, const Metadata& rec);
    WriteResult initialize(const std::string& file);

    // Appends every section of `doc` as one block
    WriteResult write_document(const std::string& file, const Document& doc);

    // Raw line appended at the end of the file (the last open section)
    WriteResult append_line(const std::string& file, const std::string& line);

    std::string path_for(const std::string& file) const;

    // Redaction log
    void set_redaction_log(RedactionLog* log) { log_ = log; }
    RedactionLog* redaction_log() const { return log_; }
    void clear_redaction_log();
    bool flush_redaction_log();

    const WriterConfig& config() const { return config_; }
    const std::string& last_error() const { return last_error_; }

private:
    SecureWriter(const SecureWriter&);
    SecureWriter& operator=(const SecureWriter&);

    // One screened text. An extras value is logged under its key, read
    // through `name_from` after the key itself has been screened.
    struct Field {
        std::string name;
        const std::string* name_from;
        std::string* value;

        Field(const std::string& n, std::string* v) : name(n), name_from(nullptr), value(v) {}
    };
    typedef std::vector<Field> FieldList;

    // An extras map flattened for screening; the map is rebuilt from
    // `items` so that redacted keys replace the originals
    struct ExtraBlock {
        std::map<std::string, std::string>* target;
        std::vector<std::pair<std::string, std::string> > items;

        ExtraBlock() : target(nullptr) {}
    };

    void fill_defaults(Document& doc) const;
    bool validate(const Document& doc, std::string& error) const;
    void collect_fields(Document& doc, std::vector<ExtraBlock>& extras, FieldList& fields) const;
    void rebuild_extras(std::vector<ExtraBlock>& extras) const;

    // Applies throw_on_secrets / redaction to every field in place. Log
    // entries are collected in `pending` and recorded only once the append
    // has succeeded.
    bool screen(const std::string& file, FieldList& fields,
                std::vector<RedactionEntry>& pending, WriteResult& result);
    void commit(const std::vector<RedactionEntry>& pending);

    // Appends `data` with one O_APPEND write. An unterminated trailing line
    // is cut first and logged; on failure the file gets its previous bytes
    // back. With `separate_block`, a blank line is ensured between existing
    // content and `data`.
    WriteResult append_raw(const std::string& file, const std::string& data, bool separate_block);

    WriteResult finish(const std::string& file, WriteResult r);

    WriterConfig config_;
    Detector detector_;
    RedactionLog* log_;
    std::string last_error_;
};

} // namespace ctxformat

#endif // ctxformat_SECURITY_SECURE_WRITER_HPP
