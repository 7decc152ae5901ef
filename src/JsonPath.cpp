#include "JsonPath.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>

namespace wsb {

static bool parseLong(const std::string& text, long& out) {
    size_t b = text.find_first_not_of(" \t");
    size_t e = text.find_last_not_of(" \t");
    if (b == std::string::npos) return false;
    std::string t = text.substr(b, e - b + 1);
    errno = 0;
    char* endp = nullptr;
    long v = std::strtol(t.c_str(), &endp, 10);
    if (errno != 0 || endp != t.c_str() + t.size()) return false;
    out = v;
    return true;
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

// Parses "[...]" starting at expr[i] == '['; leaves i after the closing ']'.
bool JsonPath::parseBracket(const std::string& expr, size_t& i, Selector& sel, std::string& err) {
    ++i; // '['
    struct Token { bool quoted; std::string text; };
    std::vector<Token> tokens;
    std::string raw;
    bool sawQuoted = false;
    while (true) {
        if (i >= expr.size()) { err = "unterminated '['"; return false; }
        char c = expr[i];
        if (c == '\'' || c == '"') {
            if (!trim(raw).empty()) { err = "unexpected text before quote"; return false; }
            char quote = c;
            std::string name;
            ++i;
            while (i < expr.size() && expr[i] != quote) {
                if (expr[i] == '\\' && i + 1 < expr.size()) ++i;
                name.push_back(expr[i++]);
            }
            if (i >= expr.size()) { err = "unterminated quoted name"; return false; }
            ++i; // closing quote
            tokens.push_back({true, name});
            sawQuoted = true;
            raw.clear();
            // Only whitespace may follow a quoted name before ',' or ']'.
            while (i < expr.size() && (expr[i] == ' ' || expr[i] == '\t')) ++i;
            if (i < expr.size() && expr[i] != ',' && expr[i] != ']') {
                err = "expected ',' or ']' after quoted name";
                return false;
            }
            continue;
        }
        if (c == ',' || c == ']') {
            if (!sawQuoted) {
                std::string t = trim(raw);
                if (t.empty()) { err = "empty bracket element"; return false; }
                tokens.push_back({false, t});
            }
            sawQuoted = false;
            raw.clear();
            ++i;
            if (c == ']') break;
            continue;
        }
        raw.push_back(c);
        ++i;
    }

    if (tokens.size() == 1 && !tokens[0].quoted && tokens[0].text == "*") {
        sel.kind = Selector::Kind::Wildcard;
        return true;
    }

    if (tokens.size() == 1 && !tokens[0].quoted && tokens[0].text.find(':') != std::string::npos) {
        const std::string& t = tokens[0].text;
        std::vector<std::string> parts;
        size_t start = 0;
        while (true) {
            size_t colon = t.find(':', start);
            parts.push_back(t.substr(start, colon == std::string::npos ? std::string::npos : colon - start));
            if (colon == std::string::npos) break;
            start = colon + 1;
        }
        if (parts.size() > 3) { err = "slice has too many ':'"; return false; }
        sel.kind = Selector::Kind::Slice;
        long v = 0;
        if (!trim(parts[0]).empty()) {
            if (!parseLong(parts[0], v)) { err = "bad slice start '" + parts[0] + "'"; return false; }
            sel.start = v;
        }
        if (!trim(parts[1]).empty()) {
            if (!parseLong(parts[1], v)) { err = "bad slice end '" + parts[1] + "'"; return false; }
            sel.end = v;
        }
        if (parts.size() == 3 && !trim(parts[2]).empty()) {
            if (!parseLong(parts[2], v)) { err = "bad slice step '" + parts[2] + "'"; return false; }
            if (v == 0) { err = "slice step cannot be zero"; return false; }
            sel.step = v;
        }
        return true;
    }

    sel.kind = Selector::Kind::Keys;
    for (auto& t : tokens) {
        Key k;
        if (t.quoted) {
            k.name = t.text;
        } else if (parseLong(t.text, k.index)) {
            k.isIndex = true;
        } else {
            err = "bad bracket element '" + t.text + "'";
            return false;
        }
        sel.keys.push_back(std::move(k));
    }
    return true;
}

std::optional<JsonPath> JsonPath::compile(const std::string& expr, std::string& err) {
    JsonPath path;
    path.m_expr = expr;
    const size_t n = expr.size();
    size_t i = 0;

    auto readName = [&](size_t& pos) {
        size_t b = pos;
        while (pos < n && expr[pos] != '.' && expr[pos] != '[') ++pos;
        return expr.substr(b, pos - b);
    };

    if (n > 0 && expr[0] == '$') {
        i = 1;
    } else if (n > 0 && expr[0] != '.' && expr[0] != '[') {
        Selector sel;
        std::string name = readName(i);
        if (name == "*") {
            sel.kind = Selector::Kind::Wildcard;
        } else {
            sel.keys.push_back(Key{false, name, 0});
        }
        path.m_selectors.push_back(std::move(sel));
    } else if (n == 0) {
        err = "empty path expression";
        return std::nullopt;
    }

    while (i < n) {
        Selector sel;
        if (expr[i] == '.') {
            sel.recursive = (i + 1 < n && expr[i + 1] == '.');
            i += sel.recursive ? 2 : 1;
            if (i >= n) { err = "path ends after '.'"; return std::nullopt; }
            if (expr[i] == '[') {
                if (!parseBracket(expr, i, sel, err)) return std::nullopt;
            } else if (expr[i] == '*') {
                sel.kind = Selector::Kind::Wildcard;
                ++i;
                if (i < n && expr[i] != '.' && expr[i] != '[') {
                    err = "unexpected character after '*'";
                    return std::nullopt;
                }
            } else {
                std::string name = readName(i);
                if (name.empty()) { err = "empty member name"; return std::nullopt; }
                sel.keys.push_back(Key{false, name, 0});
            }
        } else if (expr[i] == '[') {
            if (!parseBracket(expr, i, sel, err)) return std::nullopt;
        } else {
            err = std::string("unexpected character '") + expr[i] + "' at offset " + std::to_string(i);
            return std::nullopt;
        }
        path.m_selectors.push_back(std::move(sel));
    }
    return path;
}

void JsonPath::apply(const Selector& sel, const Json& node, std::vector<const Json*>& out) {
    switch (sel.kind) {
    case Selector::Kind::Wildcard:
        if (node.is_array() || node.is_object()) {
            for (const auto& child : node) out.push_back(&child);
        }
        break;
    case Selector::Kind::Keys:
        for (const auto& k : sel.keys) {
            if (k.isIndex) {
                if (!node.is_array()) continue;
                long size = static_cast<long>(node.size());
                long idx = k.index < 0 ? k.index + size : k.index;
                if (idx >= 0 && idx < size) out.push_back(&node[static_cast<size_t>(idx)]);
            } else if (node.is_object()) {
                auto it = node.find(k.name);
                if (it != node.end()) out.push_back(&*it);
            }
        }
        break;
    case Selector::Kind::Slice: {
        if (!node.is_array()) break;
        long size = static_cast<long>(node.size());
        auto norm = [size](long v) { return v < 0 ? v + size : v; };
        if (sel.step > 0) {
            long b = sel.start ? norm(*sel.start) : 0;
            long e = sel.end ? norm(*sel.end) : size;
            b = std::min(std::max(b, 0L), size);
            e = std::min(std::max(e, 0L), size);
            for (long i = b; i < e; i += sel.step) {
                out.push_back(&node[static_cast<size_t>(i)]);
                if (sel.step >= e - i) break; // next index would overflow or pass the end
            }
        } else {
            long b = sel.start ? norm(*sel.start) : size - 1;
            long e = sel.end ? norm(*sel.end) : -1;
            b = std::min(std::max(b, -1L), size - 1);
            e = std::min(std::max(e, -1L), size - 1);
            for (long i = b; i > e; i += sel.step) {
                out.push_back(&node[static_cast<size_t>(i)]);
                if (sel.step <= e - i) break;
            }
        }
        break;
    }
    }
}

std::vector<const Json*> JsonPath::evaluate(const Json& root) const {
    std::vector<const Json*> current{&root};
    for (const auto& sel : m_selectors) {
        std::vector<const Json*> next;
        for (const Json* node : current) {
            if (!sel.recursive) {
                apply(sel, *node, next);
                continue;
            }
            // Explicit stack: frames can nest deeper than the call stack allows.
            // Children go on in reverse so they pop in document order.
            std::vector<const Json*> pending{node};
            while (!pending.empty()) {
                const Json* n = pending.back();
                pending.pop_back();
                apply(sel, *n, next);
                if (n->is_array() || n->is_object()) {
                    for (auto it = n->crbegin(); it != n->crend(); ++it) pending.push_back(&*it);
                }
            }
        }
        current.swap(next);
        if (current.empty()) break;
    }
    return current;
}

const Json* JsonPath::first(const Json& root) const {
    auto matches = evaluate(root);
    return matches.empty() ? nullptr : matches.front();
}

} // namespace wsb
