#include <gtest/gtest.h>
#include <naming/template_engine.hpp>

static PatternContext sample_context() {
    PatternContext ctx;
    ctx.project = "my-project";
    ctx.branch = "feature-auth";
    ctx.worktree = "feature-auth-0102-143045";
    ctx.timestamp = "20240102-143045";
    ctx.user_name = "jane-doe";
    ctx.prefix = "main";
    ctx.suffix = "dev";
    return ctx;
}

static std::string resolve_ok(const std::string& tmpl) {
    auto r = resolve_template(tmpl, sample_context());
    EXPECT_TRUE(r.is_ok()) << tmpl << ": " << r.error;
    return r.value;
}

static ErrorKind resolve_kind(const std::string& tmpl) {
    auto r = resolve_template(tmpl, sample_context());
    EXPECT_TRUE(r.is_err()) << tmpl << " unexpectedly gave " << r.value;
    return r.kind;
}

TEST(TemplateEngine, Variables) {
    EXPECT_EQ(resolve_ok("{{.Project}}-{{.Branch}}"), "my-project-feature-auth");
    EXPECT_EQ(resolve_ok("{{ .UserName }}/{{.Timestamp}}"), "jane-doe/20240102-143045");
    EXPECT_EQ(resolve_ok("{{.Prefix}}-{{.Worktree}}-{{.Suffix}}"), "main-feature-auth-0102-143045-dev");
}

TEST(TemplateEngine, LiteralOnly) {
    EXPECT_EQ(resolve_ok("plain"), "plain");
    EXPECT_EQ(resolve_ok(""), "");
    EXPECT_EQ(resolve_ok("a } b"), "a } b");
}

TEST(TemplateEngine, Pipelines) {
    EXPECT_EQ(resolve_ok("{{.Branch | upper}}"), "FEATURE-AUTH");
    EXPECT_EQ(resolve_ok("{{.Branch | title}}"), "Feature-Auth");
    EXPECT_EQ(resolve_ok("{{.Branch | replace \"-\" \"_\"}}"), "feature_auth");
    EXPECT_EQ(resolve_ok("{{.Project | truncate 5}}"), "my...");
    EXPECT_EQ(resolve_ok("{{.Branch | upper | lower}}"), "feature-auth");
}

TEST(TemplateEngine, FunctionCallForm) {
    EXPECT_EQ(resolve_ok("{{upper .Project}}"), "MY-PROJECT");
    EXPECT_EQ(resolve_ok("{{truncate 4 .Project}}"), "m...");
    EXPECT_EQ(resolve_ok("{{replace \"my\" \"our\" .Project}}"), "our-project");
}

TEST(TemplateEngine, StringLiterals) {
    EXPECT_EQ(resolve_ok("{{\"  padded  \" | trim}}"), "padded");
    EXPECT_EQ(resolve_ok("{{\"Some Name/X\" | sanitize}}"), "some-name-x");
    EXPECT_EQ(resolve_ok(R"({{"say \"hi\""}})"), "say \"hi\"");
    EXPECT_EQ(resolve_ok(R"({{`raw\n`}})"), "raw\\n");
    EXPECT_EQ(resolve_ok("{{\"a}}b\"}}"), "a}}b");
}

TEST(TemplateEngine, UnknownVariable) {
    EXPECT_EQ(resolve_kind("{{.Nope}}"), ErrorKind::UnknownVariable);
    EXPECT_EQ(resolve_kind("{{.Branch | replace .Missing \"x\"}}"), ErrorKind::UnknownVariable);
}

TEST(TemplateEngine, SyntaxErrors) {
    EXPECT_EQ(resolve_kind("{{.Project"), ErrorKind::TemplateSyntax);
    EXPECT_EQ(resolve_kind("{{}}"), ErrorKind::TemplateSyntax);
    EXPECT_EQ(resolve_kind("{{   }}"), ErrorKind::TemplateSyntax);
    EXPECT_EQ(resolve_kind("{{.Project}-{{.Branch}}"), ErrorKind::TemplateSyntax);
    EXPECT_EQ(resolve_kind("{{.}}"), ErrorKind::TemplateSyntax);
    EXPECT_EQ(resolve_kind("{{.Branch | nosuch}}"), ErrorKind::TemplateSyntax);
    EXPECT_EQ(resolve_kind("{{.Branch | truncate}}"), ErrorKind::TemplateSyntax);
    EXPECT_EQ(resolve_kind("{{.Branch | truncate \"x\"}}"), ErrorKind::TemplateSyntax);
    EXPECT_EQ(resolve_kind("{{.Branch | replace \"a\"}}"), ErrorKind::TemplateSyntax);
    EXPECT_EQ(resolve_kind("{{.Branch .Project}}"), ErrorKind::TemplateSyntax);
    EXPECT_EQ(resolve_kind("{{\"unterminated}}"), ErrorKind::TemplateSyntax);
    EXPECT_EQ(resolve_kind("{{.Branch |}}"), ErrorKind::TemplateSyntax);
    EXPECT_EQ(resolve_kind("{{| upper}}"), ErrorKind::TemplateSyntax);
    EXPECT_EQ(resolve_kind("{{.Branch | .Project}}"), ErrorKind::TemplateSyntax);
    EXPECT_EQ(resolve_kind("{{- .Branch}}"), ErrorKind::TemplateSyntax);
}

TEST(TemplateEngine, ErrorsAreTemplateFamily) {
    auto r = resolve_template("{{.Project", sample_context());
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.is_template_error());
    EXPECT_NE(r.error.find("unclosed action"), std::string::npos);
}

TEST(TemplateEngine, ParsedVariables) {
    auto parsed = parse_template("{{.Project}}/{{.Branch | upper}}/{{.Project}}-{{\"x\"}}");
    ASSERT_TRUE(parsed.is_ok()) << parsed.error;
    std::vector<std::string> expected = {"Project", "Branch"};
    EXPECT_EQ(parsed.value.variables(), expected);
    EXPECT_EQ(parsed.value.nodes.size(), 7u);
}

TEST(TemplateEngine, ParseAcceptsAnyFieldName) {
    // Names are checked against the context only when executing
    auto parsed = parse_template("{{.Whatever}}");
    ASSERT_TRUE(parsed.is_ok());
    auto run = execute_template(parsed.value, sample_context());
    EXPECT_EQ(run.kind, ErrorKind::UnknownVariable);
}

TEST(TemplateEngine, FunctionTable) {
    EXPECT_EQ(template_functions().size(), 7u);
    EXPECT_EQ(pattern_variable_names().size(), 7u);
}
