#include "tutorgate/gateway/policy_validator.hpp"
#include "tutorgate/gateway/result_converter.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <initializer_list>
#include <set>
#include <utility>
#include <vector>

namespace tutorgate {
namespace gateway {

namespace {

enum class TokenKind {
    word,
    string,
    punct,
    separator
};

struct Token {
    TokenKind kind;
    std::string text;
};

using Tokens = std::vector<Token>;

bool is_ident_start(char c) {
    auto u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || u >= 0x80;
}

bool is_ident_char(char c) {
    return is_ident_start(c) || std::isdigit(static_cast<unsigned char>(c));
}

bool is_word(const Tokens& t, size_t k, const char* text) {
    return k < t.size() && t[k].kind == TokenKind::word && t[k].text == text;
}

bool is_punct(const Tokens& t, size_t k, const char* text) {
    return k < t.size() && t[k].kind == TokenKind::punct && t[k].text == text;
}

bool is_string(const Tokens& t, size_t k) {
    return k < t.size() && t[k].kind == TokenKind::string;
}

void push_separator(Tokens& tokens) {
    if (!tokens.empty() && tokens.back().kind != TokenKind::separator) {
        tokens.push_back({TokenKind::separator, ""});
    }
}

// Unicode code points, not bytes
size_t source_length(const std::string& source) {
    size_t count = 0;
    for (char c : source) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

class ViolationCollector {
public:
    explicit ViolationCollector(const PolicyRule& rule) : rule_(rule) {}

    // A module import or a command name
    void reference(const std::string& symbol) {
        if (symbol.empty()) {
            return;
        }
        auto it = rule_.denied.find(symbol);
        if (it != rule_.denied.end()) {
            add(it->second, symbol);
            return;
        }
        if (!rule_.allowed.empty() && rule_.allowed.count(symbol) == 0) {
            add(kNotAllowed, symbol);
        }
    }

    // A bare function call; only process-control names apply
    void call(const std::string& symbol) {
        auto it = rule_.denied.find(symbol);
        if (it != rule_.denied.end() && it->second == kProcessControl) {
            add(it->second, symbol);
        }
    }

    void add(const std::string& category, const std::string& symbol) {
        if (seen_.insert({category, symbol}).second) {
            violations_.push_back({category, symbol});
        }
    }

    std::vector<PolicyViolation> take() { return std::move(violations_); }

private:
    const PolicyRule& rule_;
    std::set<std::pair<std::string, std::string>> seen_;
    std::vector<PolicyViolation> violations_;
};

// ---------------------------------------------------------------- Python

Tokens lex_python(const std::string& src) {
    Tokens tokens;
    const size_t n = src.size();
    size_t i = 0;
    int depth = 0;  // newlines inside brackets do not end a statement

    while (i < n) {
        char c = src[i];
        if (c == '#') {
            while (i < n && src[i] != '\n') ++i;
            continue;
        }
        if (c == '\\' && i + 1 < n && src[i + 1] == '\n') {
            i += 2;
            continue;
        }
        if (c == '\n') {
            if (depth == 0) push_separator(tokens);
            ++i;
            continue;
        }
        if (c == ';') {
            push_separator(tokens);
            ++i;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }
        if (c == '\'' || c == '"') {
            std::string text;
            if (i + 2 < n && src[i + 1] == c && src[i + 2] == c) {
                size_t end = src.find(std::string(3, c), i + 3);
                size_t stop = end == std::string::npos ? n : end;
                text = src.substr(i + 3, stop - (i + 3));
                i = end == std::string::npos ? n : end + 3;
            } else {
                ++i;
                while (i < n && src[i] != c && src[i] != '\n') {
                    if (src[i] == '\\' && i + 1 < n) {
                        text += src[i + 1];
                        i += 2;
                        continue;
                    }
                    text += src[i++];
                }
                if (i < n && src[i] == c) ++i;
            }
            tokens.push_back({TokenKind::string, text});
            continue;
        }
        if (is_ident_start(c)) {
            size_t start = i;
            while (i < n && is_ident_char(src[i])) ++i;
            tokens.push_back({TokenKind::word, src.substr(start, i - start)});
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c))) {
            while (i < n && (std::isalnum(static_cast<unsigned char>(src[i])) || src[i] == '.' || src[i] == '_')) ++i;
            continue;
        }
        if (c == '(' || c == '[' || c == '{') ++depth;
        if ((c == ')' || c == ']' || c == '}') && depth > 0) --depth;
        tokens.push_back({TokenKind::punct, std::string(1, c)});
        ++i;
    }
    return tokens;
}

// Reads `a.b.c` starting at k; returns the index after it
size_t read_dotted(const Tokens& t, size_t k, std::string& name) {
    name.clear();
    if (k >= t.size() || t[k].kind != TokenKind::word) {
        return k;
    }
    name = t[k].text;
    ++k;
    while (is_punct(t, k, ".") && k + 1 < t.size() && t[k + 1].kind == TokenKind::word) {
        name += "." + t[k + 1].text;
        k += 2;
    }
    return k;
}

std::string root_module(const std::string& dotted) {
    return dotted.substr(0, dotted.find('.'));
}

bool is_builtins_name(const std::string& name) {
    return name == "builtins" || name == "__builtins__";
}

// True when the expression ending at k is the builtins namespace:
// `builtins`, `__builtins__`, `globals()`, `vars()`, `locals()` or
// `<expr>["__builtins__"]`
bool is_builtins_receiver(const Tokens& t, size_t k) {
    if (k >= t.size()) {
        return false;
    }
    if (t[k].kind == TokenKind::word) {
        return is_builtins_name(t[k].text);
    }
    if (is_punct(t, k, ")") && k >= 2 && is_punct(t, k - 1, "(")) {
        return is_word(t, k - 2, "globals") || is_word(t, k - 2, "vars") || is_word(t, k - 2, "locals");
    }
    if (is_punct(t, k, "]") && k >= 2 && is_string(t, k - 1) && is_punct(t, k - 2, "[")) {
        return is_builtins_name(t[k - 1].text);
    }
    return false;
}

void scan_python(const Tokens& t, ViolationCollector& out) {
    for (size_t i = 0; i < t.size(); ++i) {
        // builtins["exec"], globals()["eval"]
        if (is_string(t, i) && i >= 2 && is_punct(t, i - 1, "[") && is_builtins_receiver(t, i - 2)) {
            out.call(t[i].text);
            continue;
        }
        if (t[i].kind != TokenKind::word) continue;
        const std::string& w = t[i].text;

        // getattr(builtins, "exec")
        if (w == "getattr" && is_punct(t, i + 1, "(") && is_builtins_receiver(t, i + 2) &&
            is_punct(t, i + 3, ",") && is_string(t, i + 4)) {
            out.call(t[i + 4].text);
        }

        // Loader calls, also reached through a module (importlib.import_module)
        if ((w == "__import__" || w == "import_module") && is_punct(t, i + 1, "(")) {
            if (is_string(t, i + 2)) {
                out.reference(root_module(t[i + 2].text));
            } else {
                out.add(kProcessControl, w);
            }
            continue;
        }

        if (i > 0 && is_punct(t, i - 1, ".")) {
            // builtins.exec(...), globals()["__builtins__"].eval(...)
            if (i >= 2 && is_builtins_receiver(t, i - 2)) {
                out.call(w);
            }
            continue;
        }

        if (w == "import") {
            size_t j = i + 1;
            while (true) {
                std::string name;
                j = read_dotted(t, j, name);
                if (name.empty()) break;
                out.reference(root_module(name));
                if (is_word(t, j, "as")) j += 2;
                if (!is_punct(t, j, ",")) break;
                ++j;
            }
            i = j > i ? j - 1 : i;
        } else if (w == "from") {
            if (is_punct(t, i + 1, ".")) continue;  // relative import
            std::string name;
            size_t j = read_dotted(t, i + 1, name);
            if (!name.empty() && is_word(t, j, "import")) {
                out.reference(root_module(name));
                i = j;  // imported names are attributes, not modules
            }
        } else if (is_punct(t, i + 1, "(") && !(i > 0 && is_word(t, i - 1, "def"))) {
            out.call(w);
        }
    }
}

// ------------------------------------------------------------ JavaScript

Tokens lex_javascript(const std::string& src) {
    Tokens tokens;
    const size_t n = src.size();
    size_t i = 0;

    while (i < n) {
        char c = src[i];
        if (c == '/' && i + 1 < n && src[i + 1] == '/') {
            while (i < n && src[i] != '\n') ++i;
            continue;
        }
        if (c == '/' && i + 1 < n && src[i + 1] == '*') {
            size_t end = src.find("*/", i + 2);
            i = end == std::string::npos ? n : end + 2;
            continue;
        }
        if (c == ';') {
            push_separator(tokens);
            ++i;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }
        if (c == '\'' || c == '"' || c == '`') {
            std::string text;
            ++i;
            while (i < n && src[i] != c) {
                if (src[i] == '\\' && i + 1 < n) {
                    text += src[i + 1];
                    i += 2;
                    continue;
                }
                if (c != '`' && src[i] == '\n') break;
                // Template substitutions are code
                if (c == '`' && src[i] == '$' && i + 1 < n && src[i + 1] == '{') {
                    size_t k = i + 2;
                    int braces = 1;
                    while (k < n && braces > 0) {
                        if (src[k] == '{') ++braces;
                        if (src[k] == '}') --braces;
                        ++k;
                    }
                    size_t inner_end = braces == 0 ? k - 1 : k;
                    Tokens inner = lex_javascript(src.substr(i + 2, inner_end - (i + 2)));
                    push_separator(tokens);
                    tokens.insert(tokens.end(), inner.begin(), inner.end());
                    push_separator(tokens);
                    i = k;
                    continue;
                }
                text += src[i++];
            }
            if (i < n && src[i] == c) ++i;
            tokens.push_back({TokenKind::string, text});
            continue;
        }
        if (is_ident_start(c) || c == '$') {
            size_t start = i;
            while (i < n && (is_ident_char(src[i]) || src[i] == '$')) ++i;
            tokens.push_back({TokenKind::word, src.substr(start, i - start)});
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c))) {
            while (i < n && (std::isalnum(static_cast<unsigned char>(src[i])) || src[i] == '.' || src[i] == '_')) ++i;
            continue;
        }
        tokens.push_back({TokenKind::punct, std::string(1, c)});
        ++i;
    }
    return tokens;
}

// "node:fs/promises" -> "fs", "@scope/pkg/sub" -> "@scope/pkg", "./local" -> ""
std::string js_module_root(std::string specifier) {
    if (specifier.compare(0, 5, "node:") == 0) {
        specifier = specifier.substr(5);
    }
    if (specifier.empty() || specifier[0] == '.' || specifier[0] == '/') {
        return "";
    }
    size_t slash = specifier.find('/');
    if (specifier[0] == '@' && slash != std::string::npos) {
        slash = specifier.find('/', slash + 1);
    }
    return specifier.substr(0, slash);
}

void scan_javascript(const Tokens& t, ViolationCollector& out) {
    const size_t kMaxStatementTokens = 512;

    for (size_t i = 0; i < t.size(); ++i) {
        if (t[i].kind != TokenKind::word) continue;
        const std::string& w = t[i].text;
        bool member = i > 0 && is_punct(t, i - 1, ".");
        // module.require and process.mainModule.require load modules too
        if (member && w != "require") continue;

        if (w == "require" && is_punct(t, i + 1, "(")) {
            if (is_string(t, i + 2) && is_punct(t, i + 3, ")")) {
                out.reference(js_module_root(t[i + 2].text));
            } else {
                out.add(kProcessControl, "require");
            }
        } else if (w == "import") {
            if (is_punct(t, i + 1, "(")) {
                if (is_string(t, i + 2) && is_punct(t, i + 3, ")")) {
                    out.reference(js_module_root(t[i + 2].text));
                } else {
                    out.add(kProcessControl, "import()");
                }
            } else if (is_punct(t, i + 1, ".")) {
                continue;  // import.meta
            } else if (is_string(t, i + 1)) {
                out.reference(js_module_root(t[i + 1].text));
            } else {
                for (size_t j = i + 1; j < t.size() && j < i + kMaxStatementTokens; ++j) {
                    if (t[j].kind == TokenKind::separator || is_word(t, j, "import")) break;
                    if (is_word(t, j, "from") && is_string(t, j + 1)) {
                        out.reference(js_module_root(t[j + 1].text));
                        break;
                    }
                }
            }
        } else if (w == "export") {
            size_t j = i + 1;
            if (is_punct(t, j, "*")) {
                ++j;
                if (is_word(t, j, "as")) j += 2;
            } else if (is_punct(t, j, "{")) {
                while (j < t.size() && !is_punct(t, j, "}")) ++j;
                ++j;
            } else {
                continue;
            }
            if (is_word(t, j, "from") && is_string(t, j + 1)) {
                out.reference(js_module_root(t[j + 1].text));
            }
        } else if (is_punct(t, i + 1, "(") && !(i > 0 && is_word(t, i - 1, "function"))) {
            out.call(w);
        }
    }
}

// ------------------------------------------------------------------ Bash

struct ShellWord {
    std::string text;
    bool quoted = false;
    bool pattern = false;  // unquoted glob or brace expansion
};

using ShellCommand = std::vector<ShellWord>;

struct PendingHeredoc {
    std::string delimiter;
    bool strip_tabs;
};

bool is_shell_meta(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == ';' || c == '&' ||
           c == '|' || c == '(' || c == ')' || c == '<' || c == '>' || c == '`';
}

// Index just past the `)` matching the `(` that precedes `start`
size_t matching_paren(const std::string& src, size_t start) {
    int parens = 1;
    size_t k = start;
    while (k < src.size() && parens > 0) {
        if (src[k] == '(') ++parens;
        if (src[k] == ')') --parens;
        ++k;
    }
    return k;
}

void split_shell(const std::string& src, std::vector<ShellCommand>& commands);

// Reads one shell word at i. Command substitutions found inside it are split
// into `commands` as well.
ShellWord read_shell_word(const std::string& src, size_t& i, std::vector<ShellCommand>& commands) {
    ShellWord word;
    const size_t n = src.size();

    auto substitution = [&](size_t open) {
        // open points at '(' of "$("
        if (open + 1 < n && src[open + 1] == '(') {
            size_t end = src.find("))", open + 2);
            return end == std::string::npos ? n : end + 2;
        }
        size_t end = matching_paren(src, open + 1);
        size_t inner_end = end > 0 && end <= n && src[end - 1] == ')' ? end - 1 : end;
        split_shell(src.substr(open + 1, inner_end - (open + 1)), commands);
        return end;
    };

    while (i < n && !is_shell_meta(src[i])) {
        char c = src[i];
        if (c == '\'') {
            word.quoted = true;
            size_t end = src.find('\'', i + 1);
            size_t stop = end == std::string::npos ? n : end;
            word.text += src.substr(i + 1, stop - (i + 1));
            i = end == std::string::npos ? n : end + 1;
        } else if (c == '"') {
            word.quoted = true;
            ++i;
            while (i < n && src[i] != '"') {
                if (src[i] == '\\' && i + 1 < n) {
                    word.text += src[i + 1];
                    i += 2;
                } else if (src[i] == '$' && i + 1 < n && src[i + 1] == '(') {
                    i = substitution(i + 1);
                    word.text += "$()";
                } else if (src[i] == '`') {
                    size_t end = src.find('`', i + 1);
                    size_t stop = end == std::string::npos ? n : end;
                    split_shell(src.substr(i + 1, stop - (i + 1)), commands);
                    i = end == std::string::npos ? n : end + 1;
                } else {
                    word.text += src[i++];
                }
            }
            if (i < n) ++i;
        } else if (c == '\\' && i + 1 < n) {
            if (src[i + 1] != '\n') word.text += src[i + 1];
            i += 2;
        } else if (c == '$' && i + 1 < n && src[i + 1] == '(') {
            i = substitution(i + 1);
            word.text += "$()";
        } else if (c == '$' && i + 1 < n && src[i + 1] == '{') {
            size_t end = src.find('}', i + 2);
            size_t stop = end == std::string::npos ? n : end + 1;
            word.text += src.substr(i, stop - i);
            i = stop;
        } else {
            if (c == '*' || c == '?' || c == '[' || c == '{') {
                word.pattern = true;
            }
            word.text += c;
            ++i;
        }
    }
    return word;
}

void split_shell(const std::string& src, std::vector<ShellCommand>& commands) {
    const size_t n = src.size();
    size_t i = 0;
    ShellCommand current;
    std::vector<PendingHeredoc> heredocs;
    bool redirect_target = false;

    auto end_command = [&]() {
        if (!current.empty()) {
            commands.push_back(std::move(current));
            current.clear();
        }
        redirect_target = false;
    };

    while (i < n) {
        char c = src[i];
        if (c == '\\' && i + 1 < n && src[i + 1] == '\n') {
            i += 2;
            continue;
        }
        if (c == '\n') {
            end_command();
            ++i;
            // Heredoc bodies are data
            for (const auto& heredoc : heredocs) {
                while (i < n) {
                    size_t eol = src.find('\n', i);
                    size_t stop = eol == std::string::npos ? n : eol;
                    std::string line = src.substr(i, stop - i);
                    i = eol == std::string::npos ? n : eol + 1;
                    if (heredoc.strip_tabs) {
                        line.erase(0, line.find_first_not_of('\t') == std::string::npos
                                          ? line.size() : line.find_first_not_of('\t'));
                    }
                    if (!line.empty() && line.back() == '\r') line.pop_back();
                    if (line == heredoc.delimiter) break;
                }
            }
            heredocs.clear();
            continue;
        }
        if (c == ' ' || c == '\t' || c == '\r') {
            ++i;
            continue;
        }
        if (c == '#') {
            while (i < n && src[i] != '\n') ++i;
            continue;
        }
        if (c == '(') {
            // name() { ... } declares a function; the name is not a command
            size_t k = i + 1;
            while (k < n && (src[k] == ' ' || src[k] == '\t')) ++k;
            if (k < n && src[k] == ')') {
                current.clear();
                i = k + 1;
                continue;
            }
        }
        if (c == ';' || c == '&' || c == '|' || c == '(' || c == ')' || c == '`') {
            end_command();
            ++i;
            continue;
        }
        if (c == '<' || c == '>') {
            if (c == '<' && i + 2 < n && src[i + 1] == '<' && src[i + 2] != '<') {
                i += 2;
                bool strip_tabs = false;
                if (i < n && src[i] == '-') {
                    strip_tabs = true;
                    ++i;
                }
                while (i < n && (src[i] == ' ' || src[i] == '\t')) ++i;
                std::vector<ShellCommand> ignored;
                ShellWord delimiter = read_shell_word(src, i, ignored);
                heredocs.push_back({delimiter.text, strip_tabs});
                continue;
            }
            while (i < n && (src[i] == '<' || src[i] == '>' || src[i] == '&' || src[i] == '|')) ++i;
            redirect_target = true;
            continue;
        }

        ShellWord word = read_shell_word(src, i, commands);
        if (redirect_target) {
            redirect_target = false;
            continue;
        }
        current.push_back(std::move(word));
    }
    end_command();
}

bool is_assignment(const std::string& text) {
    size_t eq = text.find('=');
    if (eq == std::string::npos || eq == 0) return false;
    if (!(std::isalpha(static_cast<unsigned char>(text[0])) || text[0] == '_')) return false;
    for (size_t k = 1; k < eq; ++k) {
        char c = text[k];
        if (c == '+' && k + 1 == eq) continue;  // a+=b
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
    }
    return true;
}

const std::set<std::string>& shell_keywords() {
    static const std::set<std::string> keywords = {
        "if", "then", "else", "elif", "fi", "do", "done", "while", "until",
        "!", "{", "}", "in", "esac", "coproc", "]]"
    };
    return keywords;
}

// Words after these are not commands for the rest of the simple command
const std::set<std::string>& shell_declarations() {
    static const std::set<std::string> declarations = {
        "for", "case", "select", "function"
    };
    return declarations;
}

// Commands that run the command named by a later word
const std::set<std::string>& shell_wrappers() {
    static const std::set<std::string> wrappers = {
        "env", "nohup", "nice", "time", "command", "builtin", "xargs", "timeout",
        "exec", "sudo", "stdbuf", "setsid", "ionice", "chrt", "watch"
    };
    return wrappers;
}

const std::set<std::string>& shell_interpreters() {
    static const std::set<std::string> interpreters = {
        "sh", "bash", "dash", "zsh", "ksh"
    };
    return interpreters;
}

void scan_shell_command(const ShellCommand& words, ViolationCollector& out, int depth);

void scan_shell_source(const std::string& src, ViolationCollector& out, int depth) {
    std::vector<ShellCommand> commands;
    split_shell(src, commands);
    for (const auto& command : commands) {
        scan_shell_command(command, out, depth);
    }
}

void scan_shell_command(const ShellCommand& words, ViolationCollector& out, int depth) {
    const int kMaxNesting = 4;
    size_t k = 0;

    while (k < words.size()) {
        const ShellWord& w = words[k];
        if (!w.quoted && is_assignment(w.text)) {
            ++k;
            continue;
        }
        if (!w.quoted && shell_keywords().count(w.text)) {
            ++k;
            continue;
        }
        if (!w.quoted && shell_declarations().count(w.text)) {
            return;
        }
        if (w.text == "[" || w.text == "[[") {
            return;
        }
        // $cmd, /usr/bin/wg[e]t and c?rl name their command only at run time
        if ((!w.text.empty() && w.text[0] == '$') || w.pattern) {
            out.add(kProcessControl, "dynamic_command");
            return;
        }

        std::string name = w.text.substr(w.text.find_last_of('/') == std::string::npos
                                             ? 0 : w.text.find_last_of('/') + 1);
        if (name.empty()) {
            return;
        }
        out.reference(name);

        if (name == "eval" && depth < kMaxNesting) {
            std::string joined;
            for (size_t r = k + 1; r < words.size(); ++r) {
                joined += words[r].text + " ";
            }
            scan_shell_source(joined, out, depth + 1);
            return;
        }

        if (shell_interpreters().count(name) && depth < kMaxNesting) {
            for (size_t r = k + 1; r + 1 < words.size(); ++r) {
                if (words[r].text == "-c") {
                    scan_shell_source(words[r + 1].text, out, depth + 1);
                    break;
                }
            }
            return;
        }

        if (shell_wrappers().count(name)) {
            ++k;
            // Options and durations ("-n", "5s") precede the wrapped command
            while (k < words.size() && !words[k].text.empty() &&
                   (words[k].text[0] == '-' || std::isdigit(static_cast<unsigned char>(words[k].text[0])))) {
                ++k;
            }
            continue;
        }
        return;
    }
}

void deny(PolicyRule& rule, const char* category, std::initializer_list<const char*> symbols) {
    for (const char* symbol : symbols) {
        rule.denied[symbol] = category;
    }
}

caf::expected<PolicyRule> parse_rule(const nlohmann::json& section, size_t default_max_chars) {
    if (!section.is_object()) {
        return caf::make_error(caf::sec::invalid_argument, "policy section must be an object");
    }

    PolicyRule rule;
    rule.max_source_chars = default_max_chars;

    if (section.contains("max_source_chars")) {
        const auto& max_chars = section["max_source_chars"];
        if (!max_chars.is_number_integer() || max_chars.get<int64_t>() <= 0) {
            return caf::make_error(caf::sec::invalid_argument, "max_source_chars must be a positive integer");
        }
        rule.max_source_chars = static_cast<size_t>(max_chars.get<int64_t>());
    }

    if (section.contains("deny")) {
        const auto& denied = section["deny"];
        if (!denied.is_object()) {
            return caf::make_error(caf::sec::invalid_argument, "deny must map categories to symbol lists");
        }
        for (auto it = denied.begin(); it != denied.end(); ++it) {
            if (!it.value().is_array()) {
                return caf::make_error(caf::sec::invalid_argument, "deny." + it.key() + " must be an array");
            }
            for (const auto& symbol : it.value()) {
                if (!symbol.is_string()) {
                    return caf::make_error(caf::sec::invalid_argument, "deny." + it.key() + " entries must be strings");
                }
                rule.denied[symbol.get<std::string>()] = it.key();
            }
        }
    }

    if (section.contains("allow")) {
        const auto& allowed = section["allow"];
        if (!allowed.is_array()) {
            return caf::make_error(caf::sec::invalid_argument, "allow must be an array");
        }
        for (const auto& symbol : allowed) {
            if (!symbol.is_string()) {
                return caf::make_error(caf::sec::invalid_argument, "allow entries must be strings");
            }
            rule.allowed.insert(symbol.get<std::string>());
        }
    }

    return rule;
}

} // namespace

PolicyRuleSet PolicyRuleSet::defaults(size_t max_source_chars, bool strict_allowlist) {
    PolicyRuleSet set;

    PolicyRule python;
    python.max_source_chars = max_source_chars;
    deny(python, kFilesystemEscape, {"os", "subprocess", "shutil", "pty", "ctypes", "multiprocessing", "signal"});
    deny(python, kNetworking, {"socket", "http", "urllib", "urllib3", "requests", "ftplib", "smtplib",
                               "telnetlib", "ssl", "asyncio", "socketserver", "xmlrpc"});
    deny(python, kProcessControl, {"exec", "eval", "compile", "fork"});

    PolicyRule javascript;
    javascript.max_source_chars = max_source_chars;
    deny(javascript, kFilesystemEscape, {"fs", "child_process", "worker_threads", "vm", "cluster", "os", "v8"});
    deny(javascript, kNetworking, {"net", "http", "https", "http2", "dgram", "dns", "tls"});
    deny(javascript, kProcessControl, {"exec", "eval", "fork", "spawn", "execSync", "spawnSync", "Function"});

    PolicyRule bash;
    bash.max_source_chars = max_source_chars;
    deny(bash, kFilesystemEscape, {"chroot", "mount", "umount", "dd", "mkfs", "chown", "chmod"});
    deny(bash, kNetworking, {"curl", "wget", "nc", "ncat", "netcat", "ssh", "scp", "sftp",
                             "telnet", "ftp", "socat", "rsync"});
    deny(bash, kProcessControl, {"exec", "eval", "fork", "sudo", "su", "kill", "pkill",
                                 "killall", "nohup", "setsid", "disown"});
    if (strict_allowlist) {
        bash.allowed = {"echo", "printf", "date", "cal", "bc", "wc", "sort", "uniq", "grep", "sed",
                        "awk", "cat", "head", "tail", "tr", "cut", "seq", "sleep", "true", "false",
                        "test", "read", "expr", "rev", "tee", "let", "local", "return", "declare",
                        "export", "shift", "set", "unset"};
    }

    set.rules_[Language::python] = std::move(python);
    set.rules_[Language::javascript] = std::move(javascript);
    set.rules_[Language::bash] = std::move(bash);
    return set;
}

caf::expected<PolicyRuleSet> PolicyRuleSet::from_json(const nlohmann::json& document, const PolicyRuleSet& base) {
    if (!document.is_object()) {
        return caf::make_error(caf::sec::invalid_argument, "policy document must be a JSON object");
    }

    PolicyRuleSet set = base;
    for (auto it = document.begin(); it != document.end(); ++it) {
        auto language = ResultConverter::string_to_language(it.key());
        if (!language) {
            return language.error();
        }
        auto rule = parse_rule(it.value(), base.rule_for(*language).max_source_chars);
        if (!rule) {
            return rule.error();
        }
        set.rules_[*language] = std::move(*rule);
    }
    return set;
}

caf::expected<PolicyRuleSet> PolicyRuleSet::load_file(const std::string& path, const PolicyRuleSet& base) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return caf::make_error(caf::sec::invalid_argument, "cannot open policy file: " + path);
    }
    auto document = nlohmann::json::parse(file, nullptr, false);
    if (document.is_discarded()) {
        return caf::make_error(caf::sec::invalid_argument, "policy file is not valid JSON: " + path);
    }
    return from_json(document, base);
}

const PolicyRule& PolicyRuleSet::rule_for(Language language) const {
    return rules_.at(language);
}

PolicyValidator::PolicyValidator(std::shared_ptr<const PolicyRuleSet> rules)
    : rules_(std::move(rules)) {}

PolicyVerdict PolicyValidator::validate(Language language, const std::string& source) const {
    const PolicyRule& rule = rules_->rule_for(language);
    ViolationCollector collector(rule);

    if (source.find_first_not_of(" \t\r\n") == std::string::npos) {
        collector.add(kEmptySource, "");
    }

    size_t length = source_length(source);
    if (length > rule.max_source_chars) {
        collector.add(kTooLarge, std::to_string(length));
    }

    switch (language) {
        case Language::python:
            scan_python(lex_python(source), collector);
            break;
        case Language::javascript:
            scan_javascript(lex_javascript(source), collector);
            break;
        case Language::bash:
            scan_shell_source(source, collector, 0);
            break;
    }

    PolicyVerdict verdict;
    verdict.violations = collector.take();
    verdict.allowed = verdict.violations.empty();
    return verdict;
}

} // namespace gateway
} // namespace tutorgate
