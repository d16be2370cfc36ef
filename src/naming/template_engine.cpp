#include "template_engine.hpp"
#include "sanitize.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cctype>
#include <cstring>

const std::vector<std::string>& pattern_variable_names() {
    static const std::vector<std::string> names = {
        "Project", "Branch", "Worktree", "Timestamp", "UserName", "Prefix", "Suffix",
    };
    return names;
}

bool context_value(const PatternContext& ctx, const std::string& name, std::string& out) {
    if (name == "Project")   { out = ctx.project;   return true; }
    if (name == "Branch")    { out = ctx.branch;    return true; }
    if (name == "Worktree")  { out = ctx.worktree;  return true; }
    if (name == "Timestamp") { out = ctx.timestamp; return true; }
    if (name == "UserName")  { out = ctx.user_name; return true; }
    if (name == "Prefix")    { out = ctx.prefix;    return true; }
    if (name == "Suffix")    { out = ctx.suffix;    return true; }
    return false;
}

const std::vector<TemplateFunction>& template_functions() {
    static const std::vector<TemplateFunction> functions = {
        {"lower",    "s",   "convert to lowercase"},
        {"upper",    "s",   "convert to uppercase"},
        {"title",    "s",   "capitalize the first letter of each word"},
        {"replace",  "sss", "replace OLD NEW: replace every OLD with NEW"},
        {"trim",     "s",   "strip surrounding whitespace"},
        {"sanitize", "s",   "make filesystem safe"},
        {"truncate", "ns",  "truncate N: shorten to at most N characters"},
    };
    return functions;
}

static const TemplateFunction* find_function(const std::string& name) {
    for (const auto& f : template_functions()) {
        if (name == f.name) return &f;
    }
    return nullptr;
}

std::vector<std::string> ParsedTemplate::variables() const {
    std::vector<std::string> names;
    for (const auto& node : nodes) {
        for (const auto& cmd : node.pipeline) {
            for (const auto& arg : cmd.args) {
                if (arg.kind != TemplateArg::Kind::Variable) continue;
                bool seen = false;
                for (const auto& n : names) {
                    if (n == arg.text) { seen = true; break; }
                }
                if (!seen) names.push_back(arg.text);
            }
        }
    }
    return names;
}

// ── Parsing ───────────────────────────────────────────────────

static Result<void> syntax_error(size_t offset, const std::string& msg) {
    return Result<void>::Err(ErrorKind::TemplateSyntax,
                             fmt::format("template: {} at offset {}", msg, offset));
}

static bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

static bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static std::string read_ident(const std::string& text, size_t& pos) {
    size_t start = pos;
    if (pos < text.size() && is_ident_start(text[pos])) {
        while (pos < text.size() && is_ident_char(text[pos])) pos++;
    }
    return text.substr(start, pos - start);
}

static bool command_empty(const TemplateCommand& cmd) {
    return cmd.function.empty() && cmd.args.empty();
}

// Arity and argument kinds. `index` is the position in the pipeline; every
// command but the first gets the piped value as an extra trailing string.
static std::string check_command(const TemplateCommand& cmd, size_t index) {
    if (cmd.function.empty()) {
        if (index > 0) return "a value cannot follow '|'";
        if (cmd.args.size() != 1) return "unexpected argument after value";
        return "";
    }

    const TemplateFunction* fn = find_function(cmd.function);
    if (!fn) return fmt::format("function \"{}\" not defined", cmd.function);

    size_t expected = std::strlen(fn->signature);
    size_t provided = cmd.args.size() + (index > 0 ? 1 : 0);
    if (provided != expected) {
        return fmt::format("wrong number of args for {}: want {} got {}",
                           cmd.function, expected, provided);
    }
    for (size_t i = 0; i < cmd.args.size(); i++) {
        bool want_number = fn->signature[i] == 'n';
        bool is_number = cmd.args[i].kind == TemplateArg::Kind::Number;
        if (want_number != is_number) {
            return fmt::format("wrong type for argument {} of {}: expected {}",
                               i + 1, cmd.function, want_number ? "integer" : "string");
        }
    }
    return "";
}

// Parses one action starting just after "{{"; leaves pos after "}}".
static Result<void> parse_action(const std::string& text, size_t& pos, TemplateNode& node) {
    const size_t action_start = pos - 2;
    TemplateCommand cmd;

    while (true) {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) pos++;
        if (pos >= text.size()) {
            return syntax_error(action_start, "unclosed action");
        }

        char c = text[pos];
        if (c == '}') {
            if (pos + 1 < text.size() && text[pos + 1] == '}') {
                pos += 2;
                break;
            }
            return syntax_error(pos, "unexpected \"}\" in action");
        }

        if (c == '|') {
            if (command_empty(cmd)) return syntax_error(pos, "missing value for command");
            node.pipeline.push_back(cmd);
            cmd = TemplateCommand();
            pos++;
            continue;
        }

        TemplateArg arg;
        if (c == '.') {
            size_t at = pos++;
            arg.kind = TemplateArg::Kind::Variable;
            arg.text = read_ident(text, pos);
            if (arg.text.empty()) return syntax_error(at, "expected variable name after '.'");
        } else if (c == '"') {
            size_t at = pos++;
            arg.kind = TemplateArg::Kind::String;
            bool closed = false;
            while (pos < text.size()) {
                char s = text[pos++];
                if (s == '"') { closed = true; break; }
                if (s == '\n') break;
                if (s == '\\') {
                    if (pos >= text.size()) break;
                    char e = text[pos++];
                    switch (e) {
                        case '"':  arg.text += '"';  break;
                        case '\\': arg.text += '\\'; break;
                        case 'n':  arg.text += '\n'; break;
                        case 't':  arg.text += '\t'; break;
                        default:
                            return syntax_error(pos - 2, fmt::format("unknown escape \\{}", e));
                    }
                } else {
                    arg.text += s;
                }
            }
            if (!closed) return syntax_error(at, "unterminated quoted string");
        } else if (c == '`') {
            size_t at = pos++;
            arg.kind = TemplateArg::Kind::String;
            size_t close = text.find('`', pos);
            if (close == std::string::npos) return syntax_error(at, "unterminated raw string");
            arg.text = text.substr(pos, close - pos);
            pos = close + 1;
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            size_t at = pos;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) pos++;
            if (pos < text.size() && is_ident_char(text[pos])) {
                return syntax_error(at, "bad number syntax");
            }
            arg.kind = TemplateArg::Kind::Number;
            arg.text = text.substr(at, pos - at);
            if (arg.text.size() > 9) return syntax_error(at, "number out of range");
            arg.number = safe_stoi(arg.text, 0);
        } else if (is_ident_start(c)) {
            size_t at = pos;
            std::string ident = read_ident(text, pos);
            if (!command_empty(cmd)) {
                return syntax_error(at, fmt::format("unexpected identifier \"{}\"", ident));
            }
            cmd.function = ident;
            continue;
        } else {
            return syntax_error(pos, fmt::format("unexpected \"{}\" in action", c));
        }
        cmd.args.push_back(arg);
    }

    if (command_empty(cmd)) {
        return syntax_error(action_start, node.pipeline.empty() ? "empty action" : "missing command after '|'");
    }
    node.pipeline.push_back(cmd);

    for (size_t i = 0; i < node.pipeline.size(); i++) {
        std::string err = check_command(node.pipeline[i], i);
        if (!err.empty()) return syntax_error(action_start, err);
    }
    return Result<void>::Ok();
}

Result<ParsedTemplate> parse_template(const std::string& text) {
    ParsedTemplate tmpl;
    size_t pos = 0;

    while (pos < text.size()) {
        size_t open = text.find("{{", pos);
        if (open == std::string::npos) {
            TemplateNode lit;
            lit.text = text.substr(pos);
            tmpl.nodes.push_back(lit);
            break;
        }
        if (open > pos) {
            TemplateNode lit;
            lit.text = text.substr(pos, open - pos);
            tmpl.nodes.push_back(lit);
        }

        pos = open + 2;
        TemplateNode action;
        action.is_action = true;
        auto r = parse_action(text, pos, action);
        if (r.is_err()) return Result<ParsedTemplate>::Wrap(r, "");
        tmpl.nodes.push_back(action);
    }
    return Result<ParsedTemplate>::Ok(tmpl);
}

// ── Execution ─────────────────────────────────────────────────

static std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

static std::string call_function(const std::string& name, const std::vector<std::string>& args) {
    if (name == "lower")    return to_lower(args[0]);
    if (name == "upper")    return to_upper(args[0]);
    if (name == "title")    return title_case(args[0]);
    if (name == "replace")  return replace_all(args[2], args[0], args[1]);
    if (name == "sanitize") return sanitize_path(args[0]);
    if (name == "truncate") return truncate_string(args[1], safe_stoi(args[0], 0));
    if (name == "trim") {
        std::string s = args[0];
        trim(s);
        return s;
    }
    return args.empty() ? "" : args.back();
}

Result<std::string> execute_template(const ParsedTemplate& tmpl, const PatternContext& ctx) {
    std::string out;
    for (const auto& node : tmpl.nodes) {
        if (!node.is_action) {
            out += node.text;
            continue;
        }

        std::string value;
        for (size_t i = 0; i < node.pipeline.size(); i++) {
            const auto& cmd = node.pipeline[i];
            std::vector<std::string> args;
            for (const auto& arg : cmd.args) {
                if (arg.kind == TemplateArg::Kind::Variable) {
                    std::string v;
                    if (!context_value(ctx, arg.text, v)) {
                        return Result<std::string>::Err(
                            ErrorKind::UnknownVariable,
                            fmt::format("template: unknown variable .{}", arg.text));
                    }
                    args.push_back(v);
                } else {
                    args.push_back(arg.text);
                }
            }
            if (i > 0) args.push_back(value);

            value = cmd.function.empty() ? args[0] : call_function(cmd.function, args);
        }
        out += value;
    }
    return Result<std::string>::Ok(out);
}

Result<std::string> resolve_template(const std::string& text, const PatternContext& ctx) {
    auto parsed = parse_template(text);
    if (parsed.is_err()) return Result<std::string>::Wrap(parsed, "");
    return execute_template(parsed.value, ctx);
}
