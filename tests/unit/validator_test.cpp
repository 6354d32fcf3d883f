#include <taml/parser/validator.h>
#include <taml/parser/errors.h>
#include <taml/core/diagnostics.h>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace taml::parser;

namespace {

Token open_tag(const std::string& name, std::size_t start) {
    Token token;
    token.type = Token::OpenTag;
    token.tag_name = name;
    token.value = "<" + name + ">";
    token.start = start;
    token.end = start + token.value.size();
    token.column = start + 1;
    return token;
}

Token close_tag(const std::string& name, std::size_t start) {
    Token token;
    token.type = Token::CloseTag;
    token.tag_name = name;
    token.value = "</" + name + ">";
    token.start = start;
    token.end = start + token.value.size();
    token.column = start + 1;
    return token;
}

Token end_token(std::size_t at) {
    Token token;
    token.start = at;
    token.end = at;
    token.column = at + 1;
    return token;
}

} // namespace

// ============================================================================
// Validator over tokenized source
// ============================================================================

TEST(Validator, WellFormedSourceIsValid) {
    const std::string source = "<bold>Hi <red>there</red></bold>!";
    auto result = validate_tokens(tokenize(source), source);
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST(Validator, EmptyTokenListIsValid) {
    auto result = validate_tokens({});
    EXPECT_TRUE(result.valid);
}

TEST(Validator, MismatchKeepsOpenTagAndReportsItUnclosed) {
    const std::string source = "<red>text</blue>";
    auto result = validate_tokens(tokenize(source), source);
    EXPECT_FALSE(result.valid);
    ASSERT_EQ(result.errors.size(), 2u);

    EXPECT_EQ(result.errors[0].kind(), ErrorKind::MismatchedTag);
    EXPECT_EQ(result.errors[0].expected(), "red");
    EXPECT_EQ(result.errors[0].actual(), "blue");
    EXPECT_EQ(result.errors[0].position(), 9u);

    EXPECT_EQ(result.errors[1].kind(), ErrorKind::UnclosedTag);
    EXPECT_EQ(result.errors[1].tag_name(), "red");
    EXPECT_EQ(result.errors[1].position(), 0u);
    EXPECT_EQ(result.errors[1].source(), source);
}

TEST(Validator, EveryUnclosedTagInnermostFirst) {
    auto result = validate_tokens(tokenize("<bold><red><dim>x"));
    ASSERT_EQ(result.errors.size(), 3u);
    EXPECT_EQ(result.errors[0].tag_name(), "dim");
    EXPECT_EQ(result.errors[1].tag_name(), "red");
    EXPECT_EQ(result.errors[2].tag_name(), "bold");
    for (const auto& error : result.errors) {
        EXPECT_EQ(error.kind(), ErrorKind::UnclosedTag);
    }
}

TEST(Validator, ExtraClosingTag) {
    auto result = validate_tokens(tokenize("<red>a</red></red>"));
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind(), ErrorKind::MismatchedTag);
    EXPECT_EQ(result.errors[0].expected(), "(none)");
    EXPECT_EQ(result.errors[0].actual(), "red");
    EXPECT_EQ(result.errors[0].position(), 12u);
}

TEST(Validator, CollectsProblemsAcrossTheWholeInput) {
    auto result = validate_tokens(tokenize("</bold>x<red>y</green>z"));
    ASSERT_EQ(result.errors.size(), 3u);
    EXPECT_EQ(result.errors[0].expected(), "(none)");
    EXPECT_EQ(result.errors[1].expected(), "red");
    EXPECT_EQ(result.errors[1].actual(), "green");
    EXPECT_EQ(result.errors[2].kind(), ErrorKind::UnclosedTag);
}

TEST(Validator, ErrorsShareOneSourceCopy) {
    std::string source;
    for (int i = 0; i < 500; ++i) source += "</red>";
    source += "<bold><dim>";

    auto result = validate_tokens(tokenize(source), source);
    ASSERT_EQ(result.errors.size(), 502u);
    const char* shared = result.errors.front().source().data();
    EXPECT_NE(shared, source.data());
    for (const auto& error : result.errors) {
        EXPECT_EQ(error.source().data(), shared);
        EXPECT_EQ(error.source().size(), source.size());
    }
}

TEST(Validator, NoSourceCopyWithoutErrors) {
    const std::string source = "<red>x</red>";
    Validator validator(source);
    auto result = validator.validate();
    EXPECT_TRUE(result.valid);

    auto bad = validate_tokens(tokenize("<red>"));
    ASSERT_EQ(bad.errors.size(), 1u);
    EXPECT_EQ(bad.errors[0].shared_source(), nullptr);
}

TEST(Validator, UnclosedPositionsSurviveTokenLifetime) {
    Validator validator("ab\n  <bold>x");
    auto result = validator.validate();
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].position(), 5u);
    EXPECT_EQ(result.errors[0].line(), 2u);
    EXPECT_EQ(result.errors[0].column(), 3u);

    // The token list is gone; the stack snapshot still reads fine
    auto info = validator.debug_info();
    ASSERT_EQ(info.tag_stack.size(), 1u);
    EXPECT_EQ(info.tag_stack[0], "bold");
}

TEST(Validator, UnknownNamesInHandBuiltTokens) {
    std::vector<Token> tokens = {
        open_tag("purple", 0), close_tag("purple", 8), open_tag("red", 17),
        close_tag("red", 22), end_token(28),
    };
    auto result = validate_tokens(tokens);
    ASSERT_EQ(result.errors.size(), 2u);
    EXPECT_EQ(result.errors[0].kind(), ErrorKind::InvalidTag);
    EXPECT_EQ(result.errors[0].tag_name(), "purple");
    EXPECT_EQ(result.errors[0].position(), 0u);
    EXPECT_EQ(result.errors[1].kind(), ErrorKind::InvalidTag);
    EXPECT_EQ(result.errors[1].position(), 8u);
    EXPECT_FALSE(result.errors[0].has_source());
}

TEST(Validator, StopsAtEndToken) {
    std::vector<Token> tokens = {end_token(0), open_tag("red", 0)};
    EXPECT_TRUE(validate_tokens(tokens).valid);
}

TEST(Validator, ValidateTokenizesFirst) {
    Validator ok("<italic>x</italic>");
    EXPECT_TRUE(ok.validate().valid);

    Validator bad("<italic>x");
    auto result = bad.validate();
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind(), ErrorKind::UnclosedTag);
}

TEST(Validator, LexicalFaultsPropagateFromValidate) {
    Validator unknown("<invalidTag>x</invalidTag>");
    EXPECT_THROW(unknown.validate(), InvalidTagError);
    Validator malformed("<>");
    EXPECT_THROW(malformed.validate(), MalformedTagError);
}

TEST(Validator, DebugInfo) {
    Validator validator("<bold><red>x</red>");
    validator.validate();
    auto info = validator.debug_info();
    ASSERT_EQ(info.tag_stack.size(), 1u);
    EXPECT_EQ(info.tag_stack[0], "bold");
    EXPECT_EQ(info.error_count, 1u);
    EXPECT_EQ(info.position, 4u);
}

TEST(Validator, EmitsWarningPerProblem) {
    taml::core::DiagnosticEmitter diagnostics;
    Validator validator("<red>text</blue>", &diagnostics);
    validator.validate();
    auto warnings = diagnostics.events_by_severity(taml::core::Severity::Warning);
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(warnings[0].module, "validator");
    EXPECT_EQ(warnings[0].line, 1u);
    EXPECT_EQ(warnings[0].column, 10u);
    auto summary = diagnostics.events_by_module("validator");
    EXPECT_EQ(summary.back().severity, taml::core::Severity::Info);
}

TEST(Validator, TagNameCheck) {
    EXPECT_TRUE(validate_tag_name("bgBrightMagenta"));
    EXPECT_FALSE(validate_tag_name("bgbrightmagenta"));
    EXPECT_FALSE(validate_tag_name(""));
}

// ============================================================================
// Lightweight views
// ============================================================================

TEST(Nesting, ValidInput) {
    auto report = validate_nesting(tokenize("<red><bold>x</bold></red>"));
    EXPECT_TRUE(report.valid);
    EXPECT_TRUE(report.unclosed_tags.empty());
    EXPECT_TRUE(report.mismatched_tags.empty());
}

TEST(Nesting, UnclosedOutermostFirst) {
    auto report = validate_nesting(tokenize("<bold><red>x"));
    EXPECT_FALSE(report.valid);
    std::vector<std::string> expected = {"bold", "red"};
    EXPECT_EQ(report.unclosed_tags, expected);
}

TEST(Nesting, MismatchesAndExtras) {
    auto report = validate_nesting(tokenize("</dim><red>x</blue>"));
    ASSERT_EQ(report.mismatched_tags.size(), 2u);
    EXPECT_EQ(report.mismatched_tags[0].expected, "(none)");
    EXPECT_EQ(report.mismatched_tags[0].actual, "dim");
    EXPECT_EQ(report.mismatched_tags[1].expected, "red");
    EXPECT_EQ(report.mismatched_tags[1].actual, "blue");
    ASSERT_EQ(report.unclosed_tags.size(), 1u);
}

TEST(Nesting, UnknownNamesIgnored) {
    std::vector<Token> tokens = {open_tag("purple", 0), end_token(8)};
    EXPECT_TRUE(validate_nesting(tokens).valid);
}

TEST(Closure, IssueKinds) {
    auto report = validate_tag_closure(tokenize("</dim><bold><red>x</blue>"));
    EXPECT_FALSE(report.valid);
    ASSERT_EQ(report.issues.size(), 4u);
    EXPECT_EQ(report.issues[0].kind, ClosureIssue::Extra);
    EXPECT_EQ(report.issues[0].tag_name, "dim");
    EXPECT_EQ(report.issues[0].position, 0u);
    EXPECT_EQ(report.issues[1].kind, ClosureIssue::Mismatched);
    EXPECT_EQ(report.issues[1].tag_name, "blue");
    EXPECT_EQ(report.issues[1].position, 18u);
    EXPECT_EQ(report.issues[2].kind, ClosureIssue::Unclosed);
    EXPECT_EQ(report.issues[2].tag_name, "bold");
    EXPECT_EQ(report.issues[2].position, 6u);
    EXPECT_EQ(report.issues[3].tag_name, "red");
    EXPECT_EQ(report.issues[3].position, 12u);
}

TEST(Closure, KindNames) {
    EXPECT_STREQ(closure_issue_kind_name(ClosureIssue::Unclosed), "unclosed");
    EXPECT_STREQ(closure_issue_kind_name(ClosureIssue::Extra), "extra");
    EXPECT_STREQ(closure_issue_kind_name(ClosureIssue::Mismatched), "mismatched");
}
