#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <ctxformat/security/secure_writer.hpp>
#include <ctxformat/format/parser.hpp>
#include <ctxformat/core/utils.hpp>
#include "test_helpers.hpp"

using namespace ctxformat;

namespace {

const char* const kFile = "session.ctx";

std::string anthropic_key() {
    return "sk-ant-api03-" + std::string(95, 'a');
}

} // namespace

class SecureWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.base_dir = dir_.file("ctx");
    }

    std::string path() const { return dir_.file("ctx/") + kFile; }
    std::string contents() const { return test::read_all(path()); }

    Document reparse() const {
        ParseResult r = parse_file(path());
        EXPECT_TRUE(r.success) << r.error;
        EXPECT_TRUE(r.warnings.empty()) << r.warnings[0].message;
        return r.document;
    }

    test::TempDir dir_;
    WriterConfig config_;
    RedactionLog log_;
};

TEST_F(SecureWriterTest, PipeInContentReadsBackExactly) {
    SecureWriter writer(config_, &log_);
    WriteResult r = writer.write_conversation(kFile,
        Conversation("c1", "2026-01-01T00:00:00Z", Role::User, "hello|world"));
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_GT(r.bytes_written, 0u);

    EXPECT_NE(std::string::npos, contents().find("c1|2026-01-01T00:00:00Z|user|hello\\|world\n"));

    Document doc = reparse();
    ASSERT_EQ(1u, doc.conversations.size());
    EXPECT_EQ("hello|world", doc.conversations[0].content);
    EXPECT_TRUE(log_.empty());
}

TEST_F(SecureWriterTest, InjectedNewlineCannotForgeRecords) {
    SecureWriter writer(config_, &log_);
    std::string hostile = "a|b\nc\n@STATE:\nuser|admin|true";
    ASSERT_TRUE(writer.write_conversation(kFile, Conversation("c1", "t", Role::User, hostile)).success);

    Document doc = reparse();
    ASSERT_EQ(1u, doc.conversations.size());
    EXPECT_EQ(hostile, doc.conversations[0].content);
    EXPECT_TRUE(doc.states.empty());
    EXPECT_EQ(2u, test::count_lines(contents()));
}

TEST_F(SecureWriterTest, MasksSecretsBeforeWriting) {
    SecureWriter writer(config_, &log_);
    std::string key = anthropic_key();
    WriteResult r = writer.write_conversation(kFile,
        Conversation("c1", "2026-01-01T00:00:00Z", Role::User, "my key is " + key));
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ(1u, r.redactions);

    std::string text = contents();
    for (size_t i = 0; i + 20 <= key.size(); ++i) {
        ASSERT_EQ(std::string::npos, text.find(key.substr(i, 20))) << "offset " << i;
    }

    Document doc = reparse();
    ASSERT_EQ(1u, doc.conversations.size());
    EXPECT_EQ("my key is sk-a****aaaa", doc.conversations[0].content);

    ASSERT_EQ(1u, log_.size());
    const RedactionEntry& e = log_.entries()[0];
    EXPECT_EQ(kFile, e.file);
    EXPECT_EQ("content", e.field);
    EXPECT_EQ("anthropicKey", e.type);
    EXPECT_EQ("sk-a****aaaa", e.masked);
    EXPECT_EQ(sha256_hex(key).substr(0, 12), e.fingerprint);
    EXPECT_EQ(10u, e.offset);
    EXPECT_FALSE(e.timestamp.empty());
}

TEST_F(SecureWriterTest, ThrowOnSecretsLeavesFileUntouched) {
    config_.throw_on_secrets = true;
    SecureWriter writer(config_, &log_);
    ASSERT_TRUE(writer.write_conversation(kFile, Conversation("c1", "t", Role::User, "clean")).success);
    std::string before = contents();

    Decision d;
    d.decision = "rotate credentials";
    d.rationale = "leaked " + anthropic_key();
    WriteResult r = writer.write_decision(kFile, d);

    EXPECT_FALSE(r.success);
    EXPECT_EQ(WriteErrorKind::SecretsDetected, r.kind);
    ASSERT_EQ(1u, r.secret_types.size());
    EXPECT_EQ("anthropicKey", r.secret_types[0]);
    EXPECT_NE(std::string::npos, r.error.find("anthropicKey"));
    EXPECT_EQ(r.error, writer.last_error());

    EXPECT_EQ(before, contents());
    EXPECT_TRUE(log_.empty());
}

TEST_F(SecureWriterTest, MasksSecretUsedAsExtraKey) {
    SecureWriter writer(config_, &log_);
    std::string key = anthropic_key();
    Session s;
    s.session_id = "s1";
    s.extra[key] = "v";
    s.extra["plan"] = "pro";
    WriteResult r = writer.write_session(kFile, s);
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ(1u, r.redactions);
    EXPECT_EQ(std::string::npos, contents().find(key));

    ASSERT_EQ(1u, log_.size());
    EXPECT_EQ("key", log_.entries()[0].field);
    EXPECT_EQ("anthropicKey", log_.entries()[0].type);

    Document doc = reparse();
    ASSERT_EQ(1u, doc.sessions.size());
    EXPECT_EQ("v", doc.sessions[0].extra[smart_mask(key)]);
    EXPECT_EQ("pro", doc.sessions[0].extra["plan"]);
}

TEST_F(SecureWriterTest, ExtraValueIsLoggedUnderItsScreenedKey) {
    SecureWriter writer(config_, &log_);
    Metadata m;
    m.extra["owner"] = "alice@example.com";
    m.extra[anthropic_key()] = anthropic_key();
    ASSERT_TRUE(writer.write_metadata(kFile, m).success);

    ASSERT_EQ(3u, log_.size());
    for (const RedactionEntry& e : log_.entries()) {
        EXPECT_EQ(std::string::npos, e.field.find(anthropic_key()));
    }
    EXPECT_EQ(std::string::npos, contents().find(anthropic_key()));
}

TEST_F(SecureWriterTest, ThrowOnSecretsRejectsSecretExtraKey) {
    config_.throw_on_secrets = true;
    SecureWriter writer(config_, &log_);
    Session s;
    s.session_id = "s1";
    s.extra[anthropic_key()] = "v";
    WriteResult r = writer.write_session(kFile, s);

    EXPECT_FALSE(r.success);
    EXPECT_EQ(WriteErrorKind::SecretsDetected, r.kind);
    EXPECT_NE(std::string::npos, r.error.find("fields: key"));
    EXPECT_EQ(std::string::npos, r.error.find(anthropic_key()));
    EXPECT_FALSE(file_exists(path()));
    EXPECT_TRUE(log_.empty());
}

TEST_F(SecureWriterTest, ThrowOnSecretsDoesNotCreateMissingFile) {
    config_.throw_on_secrets = true;
    SecureWriter writer(config_, &log_);
    WriteResult r = writer.append_line(kFile, "token: " + anthropic_key());
    EXPECT_FALSE(r.success);
    EXPECT_FALSE(file_exists(path()));
}

TEST_F(SecureWriterTest, ThrowOnSecretsStillMasksPii) {
    config_.throw_on_secrets = true;
    SecureWriter writer(config_, &log_);
    WriteResult r = writer.write_conversation(kFile,
        Conversation("c1", "t", Role::User, "reach me at alice@example.com"));
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ(1u, r.redactions);
    EXPECT_EQ(std::string::npos, contents().find("alice@example.com"));
}

TEST_F(SecureWriterTest, RedactionCanBeDisabled) {
    config_.enable_secret_redaction = false;
    SecureWriter writer(config_, &log_);
    std::string key = anthropic_key();
    ASSERT_TRUE(writer.write_conversation(kFile, Conversation("c1", "t", Role::User, key)).success);
    EXPECT_NE(std::string::npos, contents().find(key));
    EXPECT_TRUE(log_.empty());
}

TEST_F(SecureWriterTest, PiiDetectionCanBeDisabled) {
    config_.detect_pii = false;
    SecureWriter writer(config_, &log_);
    ASSERT_TRUE(writer.write_conversation(kFile,
        Conversation("c1", "t", Role::User, "alice@example.com")).success);
    EXPECT_NE(std::string::npos, contents().find("alice@example.com"));
}

TEST_F(SecureWriterTest, RedactionLoggingCanBeDisabled) {
    config_.log_redactions = false;
    SecureWriter writer(config_, &log_);
    WriteResult r = writer.write_conversation(kFile, Conversation("c1", "t", Role::User, anthropic_key()));
    ASSERT_TRUE(r.success);
    EXPECT_EQ(1u, r.redactions);
    EXPECT_TRUE(log_.empty());
    EXPECT_EQ(std::string::npos, contents().find(anthropic_key()));
}

TEST_F(SecureWriterTest, WorksWithoutRedactionLog) {
    SecureWriter writer(config_);
    WriteResult r = writer.write_conversation(kFile, Conversation("c1", "t", Role::User, anthropic_key()));
    ASSERT_TRUE(r.success);
    EXPECT_EQ(1u, r.redactions);
    EXPECT_EQ(nullptr, writer.redaction_log());
}

TEST_F(SecureWriterTest, LastStateWriteWins) {
    SecureWriter writer(config_, &log_);
    ASSERT_TRUE(writer.write_state(kFile, StateEntry(StateScope::User, "lang", "en")).success);
    ASSERT_TRUE(writer.write_state(kFile, StateEntry(StateScope::User, "lang", "de")).success);

    Document doc = reparse();
    const StateEntry* lang = doc.find_state(StateScope::User, "lang");
    ASSERT_NE(nullptr, lang);
    EXPECT_EQ("de", lang->value);
}

TEST_F(SecureWriterTest, SeparatesBlocksWithBlankLine) {
    SecureWriter writer(config_, &log_);
    ASSERT_TRUE(writer.write_conversation(kFile, Conversation("c1", "t", Role::User, "one")).success);
    ASSERT_TRUE(writer.write_conversation(kFile, Conversation("c2", "t", Role::User, "two")).success);

    EXPECT_EQ("@CONVERSATION:\nc1|t|user|one\n\n@CONVERSATION:\nc2|t|user|two\n", contents());
}

TEST_F(SecureWriterTest, FillsMissingIdsAndTimestamps) {
    SecureWriter writer(config_, &log_);
    Conversation c;
    c.role = Role::Assistant;
    c.content = "hi";
    ASSERT_TRUE(writer.write_conversation(kFile, c).success);

    Session s;
    s.app_name = "demo";
    ASSERT_TRUE(writer.write_session(kFile, s).success);

    Document doc = reparse();
    ASSERT_EQ(1u, doc.conversations.size());
    EXPECT_EQ(36u, doc.conversations[0].id.size());
    EXPECT_EQ(20u, doc.conversations[0].timestamp.size());

    const Session* session = doc.current_session();
    ASSERT_NE(nullptr, session);
    EXPECT_EQ(36u, session->session_id.size());
    EXPECT_FALSE(session->created_at.empty());
    EXPECT_EQ("demo", session->app_name);
}

TEST_F(SecureWriterTest, KeepsEmptyFieldsWhenDefaultsAreOff) {
    config_.fill_defaults = false;
    SecureWriter writer(config_, &log_);
    Conversation c;
    c.content = "bare";
    ASSERT_TRUE(writer.write_conversation(kFile, c).success);

    Document doc = reparse();
    ASSERT_EQ(1u, doc.conversations.size());
    EXPECT_EQ("", doc.conversations[0].id);
    EXPECT_EQ("", doc.conversations[0].timestamp);
}

TEST_F(SecureWriterTest, RejectsUnsafeFileNames) {
    SecureWriter writer(config_, &log_);
    const char* bad[] = {"", ".", "..", "../escape.ctx", "a/b.ctx", "a\\b", "x|y", "tab\there"};
    for (const char* name : bad) {
        WriteResult r = writer.write_conversation(name, Conversation("c1", "t", Role::User, "x"));
        EXPECT_FALSE(r.success) << name;
        EXPECT_EQ(WriteErrorKind::InvalidPath, r.kind) << name;
    }
    EXPECT_FALSE(file_exists(dir_.file("escape.ctx")));

    EXPECT_TRUE(is_valid_file_name("notes.v2.ctx"));
    EXPECT_TRUE(is_valid_file_name(".hidden"));
}

TEST_F(SecureWriterTest, RejectsInvalidRecords) {
    SecureWriter writer(config_, &log_);

    Conversation c("c1", "t", static_cast<Role>(42), "x");
    EXPECT_EQ(WriteErrorKind::InvalidRecord, writer.write_conversation(kFile, c).kind);

    EXPECT_EQ(WriteErrorKind::InvalidRecord,
              writer.write_state(kFile, StateEntry(StateScope::User, "", "v")).kind);

    WorkItem w;
    EXPECT_EQ(WriteErrorKind::InvalidRecord, writer.write_work(kFile, w).kind);

    Session s;
    s.event_count = -1;
    EXPECT_EQ(WriteErrorKind::InvalidRecord, writer.write_session(kFile, s).kind);

    EXPECT_FALSE(file_exists(path()));
}

TEST_F(SecureWriterTest, MetadataIsWrittenOnlyOnce) {
    SecureWriter writer(config_, &log_);
    WriteResult first = writer.initialize(kFile);
    ASSERT_TRUE(first.success) << first.error;
    EXPECT_GT(first.bytes_written, 0u);

    Metadata m;
    m.extra["owner"] = "someone else";
    WriteResult second = writer.write_metadata(kFile, m);
    ASSERT_TRUE(second.success);
    EXPECT_EQ(0u, second.bytes_written);

    Document doc = reparse();
    EXPECT_TRUE(doc.has_metadata);
    EXPECT_EQ(kFormatVersion, doc.metadata.format_version);
    EXPECT_EQ("", doc.metadata_value("owner"));
}

TEST_F(SecureWriterTest, SuccessiveWritesFormAValidDocument) {
    SecureWriter writer(config_, &log_);
    ASSERT_TRUE(writer.initialize(kFile).success);

    Session s;
    s.session_id = "s-1";
    ASSERT_TRUE(writer.write_session(kFile, s).success);
    ASSERT_TRUE(writer.write_conversation(kFile, Conversation("", "", Role::User, "hi")).success);

    MemoryRecord m;
    m.type = MemoryType::Semantic;
    m.content = "prefers metric units";
    m.importance = "medium";
    ASSERT_TRUE(writer.write_memory(kFile, m).success);

    Insight ins;
    ins.content = "users skim";
    ins.category = "ux";
    ins.priority = "low";
    ins.confidence = 0.6;
    ASSERT_TRUE(writer.write_insight(kFile, ins).success);

    Decision d;
    d.decision = "ship";
    d.rationale = "tests pass";
    ASSERT_TRUE(writer.write_decision(kFile, d).success);

    WorkItem w;
    w.id = "w1";
    w.status = WorkStatus::InProgress;
    ASSERT_TRUE(writer.write_work(kFile, w).success);

    Link l;
    l.type = "dependency";
    l.source = "w1";
    l.target = "s-1";
    ASSERT_TRUE(writer.write_link(kFile, l).success);

    std::string text = contents();
    ValidationResult v = validate(text);
    ASSERT_TRUE(v.success);
    EXPECT_TRUE(v.valid) << (v.problems.empty() ? "" : v.problems[0]);

    Document doc = reparse();
    EXPECT_EQ(1u, doc.sessions.size());
    EXPECT_EQ(1u, doc.conversations.size());
    EXPECT_EQ(1u, doc.memories.size());
    EXPECT_EQ(1u, doc.insights.size());
    EXPECT_EQ(1u, doc.decisions.size());
    EXPECT_FALSE(doc.decisions[0].timestamp.empty());
    EXPECT_EQ(1u, doc.work.size());
    EXPECT_EQ(1u, doc.links.size());
}

TEST_F(SecureWriterTest, WriteDocumentAppendsAllSections) {
    SecureWriter writer(config_, &log_);
    Document doc;
    doc.states.push_back(StateEntry(StateScope::App, "theme", "dark"));
    doc.conversations.push_back(Conversation("c1", "t", Role::User, "hi"));
    OpaqueSection os;
    os.name = "PLUGIN";
    os.lines.push_back("key " + anthropic_key());
    doc.opaque.push_back(os);

    WriteResult r = writer.write_document(kFile, doc);
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ(1u, r.redactions);

    Document back = reparse();
    EXPECT_EQ(1u, back.states.size());
    EXPECT_EQ(1u, back.conversations.size());
    ASSERT_EQ(1u, back.opaque.size());
    EXPECT_EQ("key sk-a****aaaa", back.opaque[0].lines[0]);
    EXPECT_EQ("PLUGIN", log_.entries()[0].field);
}

TEST_F(SecureWriterTest, AppendLineGoesToLastSection) {
    SecureWriter writer(config_, &log_);
    ASSERT_TRUE(writer.write_conversation(kFile, Conversation("c1", "t", Role::User, "first")).success);
    ASSERT_TRUE(writer.append_line(kFile, "c2|t|assistant|raw\nline").success);

    Document doc = reparse();
    ASSERT_EQ(2u, doc.conversations.size());
    EXPECT_EQ("raw\nline", doc.conversations[1].content);
}

TEST_F(SecureWriterTest, AppendLineRedactsSecrets) {
    SecureWriter writer(config_, &log_);
    ASSERT_TRUE(writer.write_conversation(kFile, Conversation("c1", "t", Role::User, "first")).success);
    WriteResult r = writer.append_line(kFile, "c2|t|user|" + anthropic_key());
    ASSERT_TRUE(r.success);
    EXPECT_EQ(1u, r.redactions);
    ASSERT_EQ(1u, log_.size());
    EXPECT_EQ("line", log_.entries()[0].field);
    EXPECT_EQ(std::string::npos, contents().find(anthropic_key()));
}

TEST_F(SecureWriterTest, AppendDropsTornTail) {
    ASSERT_TRUE(create_directories(config_.base_dir));
    test::write_all(path(), "@WORK:\nw1|in_progress");

    SecureWriter writer(config_, &log_);
    ASSERT_TRUE(writer.append_line(kFile, "w2|blocked").success);
    EXPECT_EQ("@WORK:\nw2|blocked\n", contents());

    Document doc = reparse();
    ASSERT_EQ(1u, doc.work.size());
    EXPECT_EQ("w2", doc.work[0].id);
}

TEST_F(SecureWriterTest, TornRecordDoesNotComeBackAfterNextWrite) {
    ASSERT_TRUE(create_directories(config_.base_dir));
    test::write_all(path(), "@CONVERSATION:\nc1|t|user|hello\nc2|t|user|I will transf");

    SecureWriter writer(config_, &log_);
    ASSERT_TRUE(writer.write_conversation(kFile, Conversation("c3", "t", Role::User, "three")).success);
    EXPECT_EQ("@CONVERSATION:\nc1|t|user|hello\n\n@CONVERSATION:\nc3|t|user|three\n", contents());

    Document doc = reparse();
    ASSERT_EQ(2u, doc.conversations.size());
    EXPECT_EQ("c1", doc.conversations[0].id);
    EXPECT_EQ("c3", doc.conversations[1].id);
}

TEST_F(SecureWriterTest, FileWithoutNewlineIsReplaced) {
    ASSERT_TRUE(create_directories(config_.base_dir));
    test::write_all(path(), "@CONVERSATION:");

    SecureWriter writer(config_, &log_);
    ASSERT_TRUE(writer.write_conversation(kFile, Conversation("c1", "t", Role::User, "hi")).success);
    EXPECT_EQ("@CONVERSATION:\nc1|t|user|hi\n", contents());
}

TEST_F(SecureWriterTest, ReportsIoFailure) {
    test::write_all(dir_.file("blocker"), "not a directory");
    config_.base_dir = dir_.file("blocker/ctx");
    SecureWriter writer(config_, &log_);

    WriteResult r = writer.write_conversation(kFile, Conversation("c1", "t", Role::User, anthropic_key()));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(WriteErrorKind::Io, r.kind);
    EXPECT_TRUE(log_.empty());
}

TEST_F(SecureWriterTest, ClearAndFlushRedactionLog) {
    config_.redaction_log_path = dir_.file("audit.jsonl");
    SecureWriter writer(config_, &log_);
    ASSERT_TRUE(writer.write_conversation(kFile, Conversation("c1", "t", Role::User, anthropic_key())).success);
    ASSERT_EQ(1u, log_.size());

    ASSERT_TRUE(writer.flush_redaction_log()) << writer.last_error();
    EXPECT_TRUE(log_.empty());
    std::string audit = test::read_all(config_.redaction_log_path);
    EXPECT_NE(std::string::npos, audit.find("anthropicKey"));
    EXPECT_EQ(std::string::npos, audit.find(anthropic_key()));

    ASSERT_TRUE(writer.write_conversation(kFile, Conversation("c2", "t", Role::User, anthropic_key())).success);
    writer.clear_redaction_log();
    EXPECT_TRUE(log_.empty());
}
