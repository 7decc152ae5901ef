#pragma once
#include "JsonFormatter.hpp"
#include <optional>
#include <string>
#include <vector>

namespace wsb {

// Compiled JSON-path expression.
//
// Supported: optional leading '$', .name, ['name'], [index] (negative counts
// from the end), [start:end:step], unions [a,b], wildcards .* and [*], and
// recursive descent (..name, ..*, ..[...]). A leading bare name is relative
// to the root. Matches come back in traversal order: object members in
// document order, array elements by index, recursive descent pre-order
// (a node before its descendants).
class JsonPath {
public:
    static std::optional<JsonPath> compile(const std::string& expr, std::string& err);

    std::vector<const Json*> evaluate(const Json& root) const;

    // First match in traversal order, nullptr when nothing matches.
    const Json* first(const Json& root) const;

    const std::string& expression() const { return m_expr; }

private:
    struct Key {
        bool isIndex{false};
        std::string name;
        long index{0};
    };

    struct Selector {
        enum class Kind { Keys, Slice, Wildcard };
        Kind kind{Kind::Keys};
        bool recursive{false};
        std::vector<Key> keys;
        std::optional<long> start;
        std::optional<long> end;
        long step{1};
    };

    static bool parseBracket(const std::string& expr, size_t& i, Selector& sel, std::string& err);
    static void apply(const Selector& sel, const Json& node, std::vector<const Json*>& out);

    std::string m_expr;
    std::vector<Selector> m_selectors;
};

} // namespace wsb
