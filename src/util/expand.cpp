#include <envcast/expand.hpp>
#include <algorithm>

namespace envcast {

struct Token {
    size_t length = 0;   // bytes covered, including '$' and braces
    std::string name;
};

// Recognize a placeholder starting at text[pos] == '$'.
// Returns a zero-length token when there is none.
static Token scan_token(const std::string& text, size_t pos) {
    Token tok;
    size_t i = pos + 1;
    if (i >= text.size()) return tok;

    if (text[i] == '{') {
        size_t start = i + 1;
        if (start >= text.size() || !is_identifier_start(text[start])) return tok;
        size_t end = start + 1;
        while (end < text.size() && is_identifier_char(text[end])) end++;
        if (end >= text.size() || text[end] != '}') return tok;
        tok.name = text.substr(start, end - start);
        tok.length = end + 1 - pos;
        return tok;
    }

    if (!is_identifier_start(text[i])) return tok;
    size_t end = i + 1;
    while (end < text.size() && is_identifier_char(text[end])) end++;
    tok.name = text.substr(i, end - i);
    tok.length = end - pos;
    return tok;
}

// Build a hint listing available variable names
static std::string available_vars_hint(const EnvSnapshot& env) {
    if (env.empty()) return "no variables are available for substitution";
    std::string hint = "available variables: ";
    bool first = true;
    for (const auto& name : env.names()) {
        if (!first) hint += ", ";
        hint += name;
        first = false;
    }
    return hint;
}

ExpandResult expand_placeholders(const std::string& text, const EnvSnapshot& env) {
    ExpandResult res;
    res.text.reserve(text.size());
    size_t i = 0;

    while (i < text.size()) {
        size_t dollar = text.find('$', i);
        if (dollar == std::string::npos) {
            res.text.append(text, i, std::string::npos);
            break;
        }
        res.text.append(text, i, dollar - i);

        Token tok = scan_token(text, dollar);
        if (tok.length == 0) {
            res.text.push_back('$');
            i = dollar + 1;
            continue;
        }

        if (const std::string* value = env.find(tok.name)) {
            res.text += *value;
            res.substitutions++;
        } else {
            res.text.append(text, dollar, tok.length);
            if (std::find(res.unresolved.begin(), res.unresolved.end(), tok.name)
                    == res.unresolved.end()) {
                res.unresolved.push_back(tok.name);
            }
        }
        i = dollar + tok.length;
    }

    return res;
}

Result<std::string> expand_placeholders_strict(const std::string& text,
                                               const EnvSnapshot& env) {
    auto res = expand_placeholders(text, env);
    if (!res.unresolved.empty()) {
        return EnvcastError(EnvcastError::NotFound,
            "undefined variable '" + res.unresolved.front() + "' in placeholder",
            available_vars_hint(env));
    }
    return Result<std::string>::ok(std::move(res.text));
}

} // namespace envcast
