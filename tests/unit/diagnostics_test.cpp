#include <taml/core/diagnostics.h>
#include <taml/parser/parser.h>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace taml::core;

// ---------------------------------------------------------------------------
// Emitter
// ---------------------------------------------------------------------------

TEST(Diagnostics, SeverityNames) {
    EXPECT_STREQ(severity_name(Severity::Info), "info");
    EXPECT_STREQ(severity_name(Severity::Warning), "warning");
    EXPECT_STREQ(severity_name(Severity::Error), "error");
}

TEST(Diagnostics, EmitRecordsAllFields) {
    DiagnosticEmitter emitter;
    emitter.emit_at(Severity::Error, "parser", "build", "boom", 3, 7);

    ASSERT_EQ(emitter.size(), 1u);
    const auto& e = emitter.events()[0];
    EXPECT_EQ(e.severity, Severity::Error);
    EXPECT_EQ(e.module, "parser");
    EXPECT_EQ(e.stage, "build");
    EXPECT_EQ(e.message, "boom");
    EXPECT_EQ(e.line, 3u);
    EXPECT_EQ(e.column, 7u);
    EXPECT_NE(e.timestamp, std::chrono::steady_clock::time_point{});
}

TEST(Diagnostics, FormatWithAndWithoutLocation) {
    DiagnosticEvent event;
    event.severity = Severity::Warning;
    event.module = "validator";
    event.stage = "validate";
    event.message = "unclosed";
    EXPECT_EQ(format_diagnostic(event), "[warning] validator/validate: unclosed");

    event.line = 2;
    event.column = 5;
    EXPECT_EQ(format_diagnostic(event), "[warning] validator/validate @2:5: unclosed");
}

TEST(Diagnostics, MinSeverityFilters) {
    DiagnosticEmitter emitter;
    emitter.set_min_severity(Severity::Warning);
    emitter.emit(Severity::Info, "tokenizer", "scan", "dropped");
    emitter.emit(Severity::Warning, "validator", "validate", "kept");
    ASSERT_EQ(emitter.size(), 1u);
    EXPECT_EQ(emitter.events()[0].message, "kept");
}

TEST(Diagnostics, ObserversSeeEveryEvent) {
    DiagnosticEmitter emitter;
    std::vector<std::string> seen;
    emitter.add_observer([&seen](const DiagnosticEvent& e) { seen.push_back(e.message); });
    emitter.emit(Severity::Info, "a", "b", "one");
    emitter.emit(Severity::Error, "a", "b", "two");
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[1], "two");
}

TEST(Diagnostics, QueryBySeverityAndModule) {
    DiagnosticEmitter emitter;
    emitter.emit(Severity::Info, "tokenizer", "scan", "x");
    emitter.emit(Severity::Error, "parser", "build", "y");
    emitter.emit(Severity::Error, "tokenizer", "scan", "z");
    EXPECT_EQ(emitter.events_by_severity(Severity::Error).size(), 2u);
    EXPECT_EQ(emitter.events_by_module("tokenizer").size(), 2u);
    emitter.clear();
    EXPECT_EQ(emitter.size(), 0u);
}

// ---------------------------------------------------------------------------
// Wiring into the parser
// ---------------------------------------------------------------------------

TEST(Diagnostics, SuccessfulParseLogsTokenizerAndParser) {
    DiagnosticEmitter emitter;
    taml::parser::ParseOptions options;
    options.diagnostics = &emitter;

    auto doc = taml::parser::parse("<red>Hello</red>", options);
    ASSERT_NE(doc, nullptr);

    auto tokenizer_events = emitter.events_by_module("tokenizer");
    ASSERT_EQ(tokenizer_events.size(), 1u);
    EXPECT_EQ(tokenizer_events[0].message, "4 tokens from 16 bytes");

    auto parser_events = emitter.events_by_module("parser");
    ASSERT_EQ(parser_events.size(), 1u);
    EXPECT_EQ(parser_events[0].message, "3 nodes, depth 1");
    EXPECT_TRUE(emitter.events_by_severity(Severity::Error).empty());
}

TEST(Diagnostics, FailedParseLogsErrorWithLocation) {
    DiagnosticEmitter emitter;
    taml::parser::ParseOptions options;
    options.diagnostics = &emitter;

    EXPECT_THROW(taml::parser::parse("line1\n<red>x</blue>", options),
                 taml::parser::MismatchedTagError);

    auto errors = emitter.events_by_severity(Severity::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].module, "parser");
    EXPECT_EQ(errors[0].line, 2u);
    EXPECT_EQ(errors[0].column, 7u);
}

TEST(Diagnostics, LexicalFaultLoggedByTokenizer) {
    DiagnosticEmitter emitter;
    taml::parser::ParseOptions options;
    options.diagnostics = &emitter;

    EXPECT_THROW(taml::parser::parse("<purple>x</purple>", options),
                 taml::parser::InvalidTagError);

    auto errors = emitter.events_by_severity(Severity::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].module, "tokenizer");
}

TEST(Diagnostics, ValidatorLogsOneWarningPerProblem) {
    DiagnosticEmitter emitter;
    taml::parser::Validator validator("<red>text</blue>", &emitter);
    auto result = validator.validate();

    EXPECT_FALSE(result.valid);
    EXPECT_EQ(emitter.events_by_severity(Severity::Warning).size(), result.errors.size());
}
