#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Values available to directory, base-directory and session templates.
// Built fresh for every resolution and never modified afterwards.
struct PatternContext {
    std::string project;
    std::string branch;
    std::string worktree;
    std::string timestamp;
    std::string user_name;
    std::string prefix;
    std::string suffix;
};

// Template variable names without the leading dot, in documentation order.
const std::vector<std::string>& pattern_variable_names();

// Look up `name` (without dot). Returns false for names outside the set.
bool context_value(const PatternContext& ctx, const std::string& name, std::string& out);

// ── Parsed form ─────────────────────────────────────────────
//
// Template text is literal text with actions {{ pipeline }}:
//   pipeline := command ('|' command)*
//   command  := argument | function argument*
//   argument := .Name | "string" | `raw string` | integer
// Every command after the first receives the previous value as its last
// argument.

struct TemplateArg {
    enum class Kind { Variable, String, Number };
    Kind kind = Kind::String;
    std::string text;      // variable name (no dot), string contents or digits
    int number = 0;
};

struct TemplateCommand {
    std::string function;              // empty: the single arg is the value
    std::vector<TemplateArg> args;
};

struct TemplateNode {
    bool is_action = false;
    std::string text;                  // literal text when !is_action
    std::vector<TemplateCommand> pipeline;
};

struct ParsedTemplate {
    std::vector<TemplateNode> nodes;

    // Distinct variable names referenced, in order of first use.
    std::vector<std::string> variables() const;
};

struct TemplateFunction {
    const char* name;
    const char* signature;     // one char per argument: 's' string, 'n' integer
    const char* description;
};

const std::vector<TemplateFunction>& template_functions();

// Errors: TemplateSyntax for malformed markup, unknown functions or bad
// argument counts/types.
Result<ParsedTemplate> parse_template(const std::string& text);

// Errors: UnknownVariable for names outside pattern_variable_names().
Result<std::string> execute_template(const ParsedTemplate& tmpl, const PatternContext& ctx);

// parse_template + execute_template
Result<std::string> resolve_template(const std::string& text, const PatternContext& ctx);
