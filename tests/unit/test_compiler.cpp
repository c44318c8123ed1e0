#include <gtest/gtest.h>

#include <string>

#include <ctxformat/format/compiler.hpp>
#include <ctxformat/format/parser.hpp>
#include "test_helpers.hpp"

using namespace ctxformat;

namespace {

Document full_document() {
    Document doc;
    doc.has_metadata = true;
    doc.metadata.format_version = "1.0";
    doc.metadata.created_at = "2026-01-01T00:00:00Z";
    doc.metadata.updated_at = "2026-01-02T00:00:00Z";
    doc.metadata.extra["project"] = "demo=1|x";
    doc.metadata.extra["odd=key"] = "@value";

    Session s;
    s.session_id = "s-1";
    s.app_name = "assistant";
    s.user_id = "u-9";
    s.created_at = "2026-01-01T00:00:00Z";
    s.status = SessionStatus::Archived;
    s.event_count = 3;
    s.token_count = 120;
    s.extra["model"] = "m|1";
    doc.sessions.push_back(s);

    Session second;
    second.session_id = "s-2";
    doc.sessions.push_back(second);

    doc.conversations.push_back(Conversation("c1", "2026-01-01T00:00:01Z", Role::User, "hello|world"));
    doc.conversations.push_back(Conversation("c2", "2026-01-01T00:00:02Z", Role::Assistant, "a|b\nc"));
    doc.conversations.push_back(Conversation("@CONVERSATION:", "", Role::System, "path\\to\\"));

    MemoryRecord m;
    m.type = MemoryType::Procedural;
    m.timestamp = "2026-01-01T00:00:03Z";
    m.content = "run tests before commit";
    m.importance = "critical";
    doc.memories.push_back(m);

    MemoryRecord m2;
    m2.content = "no importance";
    doc.memories.push_back(m2);

    StateEntry st(StateScope::User, "lang", "de");
    doc.states.push_back(st);
    StateEntry ttl(StateScope::Temp, "draft", "x=y");
    ttl.ttl = 60;
    doc.states.push_back(ttl);
    StateEntry typed(StateScope::App, "theme", "dark");
    typed.type = "string";
    doc.states.push_back(typed);

    Insight ins;
    ins.content = "parser is the bottleneck";
    ins.category = "performance";
    ins.priority = "high";
    ins.confidence = 0.85;
    doc.insights.push_back(ins);

    Decision d;
    d.decision = "keep append-only";
    d.rationale = "no rewrite races";
    d.impact = "high";
    doc.decisions.push_back(d);

    WorkItem w;
    w.id = "w1";
    w.status = WorkStatus::Blocked;
    w.description = "waiting on review";
    doc.work.push_back(w);

    Link l1;
    l1.type = "reference";
    l1.source = "c1";
    l1.target = "c2";
    doc.links.push_back(l1);
    Link l2;
    l2.type = "semantic_cluster";
    l2.source = "c2";
    l2.target = "w1";
    l2.has_strength = true;
    l2.strength = 0.125;
    doc.links.push_back(l2);

    OpaqueSection os;
    os.name = "CUSTOM";
    os.identifier = "ext";
    os.lines.push_back("anything|goes");
    os.lines.push_back("k=v");
    doc.opaque.push_back(os);

    return doc;
}

} // namespace

TEST(CompilerTest, ProducesCanonicalLayout) {
    Document doc;
    doc.has_metadata = true;
    doc.metadata.format_version = "1.0";
    doc.metadata.created_at = "2026-01-01T00:00:00Z";
    doc.states.push_back(StateEntry(StateScope::User, "lang", "de"));
    doc.conversations.push_back(Conversation("c1", "2026-01-01T00:00:00Z", Role::User, "hello|world"));

    std::string expected =
        "@METADATA:\n"
        "format_version=1.0\n"
        "created_at=2026-01-01T00:00:00Z\n"
        "\n"
        "@CONVERSATION:\n"
        "c1|2026-01-01T00:00:00Z|user|hello\\|world\n"
        "\n"
        "@STATE:\n"
        "user|lang|de\n";

    EXPECT_EQ(expected, compile(doc));
}

TEST(CompilerTest, EmptyDocumentCompilesToNothing) {
    EXPECT_EQ("", compile(Document()));
}

TEST(CompilerTest, RoundTripsEveryRecordKind) {
    Document doc = full_document();
    std::string text = compile(doc);

    ParseResult r = parse(text);
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_TRUE(r.warnings.empty()) << r.warnings[0].message;
    EXPECT_TRUE(r.document == doc) << text;
}

TEST(CompilerTest, OutputIsDeterministic) {
    Document doc = full_document();
    EXPECT_EQ(compile(doc), compile(doc));

    std::string once = compile(doc);
    ParseResult r = parse(once);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(once, compile(r.document));
}

TEST(CompilerTest, InjectedDelimitersStayInsideOneRecord) {
    Document doc;
    doc.conversations.push_back(Conversation("c1", "t", Role::User, "a|b\nc"));

    std::string text = compile(doc);
    EXPECT_EQ(2u, test::count_lines(text));

    ParseResult r = parse(text);
    ASSERT_TRUE(r.success);
    ASSERT_EQ(1u, r.document.conversations.size());
    EXPECT_EQ("a|b\nc", r.document.conversations[0].content);
}

TEST(CompilerTest, HeaderLookalikeValuesDoNotOpenSections) {
    Document doc;
    doc.conversations.push_back(Conversation("@METADATA:", "t", Role::User, "x"));
    doc.opaque.push_back(OpaqueSection());
    doc.opaque[0].name = "NOTES";
    doc.opaque[0].lines.push_back("@WORK:");

    ParseResult r = parse(compile(doc));
    ASSERT_TRUE(r.success);
    EXPECT_FALSE(r.document.has_metadata);
    EXPECT_TRUE(r.document.work.empty());
    ASSERT_EQ(1u, r.document.conversations.size());
    EXPECT_EQ("@METADATA:", r.document.conversations[0].id);
    ASSERT_EQ(1u, r.document.opaque.size());
    ASSERT_EQ(1u, r.document.opaque[0].lines.size());
}

TEST(CompilerTest, OptionalTrailingFieldsAreOmitted) {
    MemoryRecord m;
    m.type = MemoryType::Episodic;
    m.timestamp = "t";
    m.content = "c";
    EXPECT_EQ("episodic|t|c", compile_record(m));

    StateEntry s(StateScope::Session, "k", "v");
    EXPECT_EQ("session|k|v", compile_record(s));
    s.ttl = 30;
    EXPECT_EQ("session|k|v||30", compile_record(s));

    Decision d;
    d.decision = "d";
    d.rationale = "r";
    EXPECT_EQ("d|r", compile_record(d));
    d.impact = "low";
    EXPECT_EQ("d|r||low", compile_record(d));

    WorkItem w;
    w.id = "w";
    EXPECT_EQ("w|not_started", compile_record(w));

    Link l;
    l.type = "dependency";
    l.source = "a";
    l.target = "b";
    EXPECT_EQ("dependency|a|b", compile_record(l));
    l.has_strength = true;
    l.strength = 1.0;
    EXPECT_EQ("dependency|a|b|1", compile_record(l));
}

TEST(CompilerTest, InsightConfidenceUsesShortestForm) {
    Insight i;
    i.content = "c";
    i.category = "general";
    i.priority = "low";
    i.confidence = 0.1;
    EXPECT_EQ("c|general|low|0.1", compile_record(i));
    i.confidence = 0.85;
    EXPECT_EQ("c|general|low|0.85", compile_record(i));
}

TEST(CompilerTest, NumericFieldsReadBackExactly) {
    Document doc;
    Insight i;
    i.content = "c";
    i.category = "general";
    i.priority = "low";
    i.confidence = 0.1 + 0.2;
    doc.insights.push_back(i);

    Link l;
    l.type = "related";
    l.source = "a";
    l.target = "b";
    l.has_strength = true;
    l.strength = 2.0 / 3.0;
    doc.links.push_back(l);

    ParseResult r = parse(compile(doc));
    ASSERT_TRUE(r.success);
    ASSERT_EQ(1u, r.document.insights.size());
    ASSERT_EQ(1u, r.document.links.size());
    EXPECT_EQ(i.confidence, r.document.insights[0].confidence);
    EXPECT_EQ(l.strength, r.document.links[0].strength);
}

TEST(CompilerTest, SessionBlockCarriesCountersAndStatus) {
    Session s;
    s.session_id = "abc";
    std::string body = compile_session_body(s);
    EXPECT_EQ("session_id=abc\nstatus=active\nevent_count=0\ntoken_count=0\n", body);
}

TEST(CompilerTest, MetadataExtrasAreSortedAndEscaped) {
    Metadata m;
    m.format_version = "1.0";
    m.extra["zeta"] = "1";
    m.extra["alpha"] = "line\nbreak";
    m.extra["a=b"] = "c";
    EXPECT_EQ("format_version=1.0\na\\=b=c\nalpha=line\\nbreak\nzeta=1\n", compile_metadata_body(m));
}
