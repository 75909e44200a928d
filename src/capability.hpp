#ifndef FASTPUT_CAPABILITY_HPP
#define FASTPUT_CAPABILITY_HPP

#include <unordered_map>
#include <variant>
#include <string>
#include <vector>

namespace fastput::cap {
    // Bytes written as-is. Arguments are never consulted.
    struct ConstantRule {
        std::string bytes;
    };

    enum class Transform {
        Verbatim, 
        AddOne
    };

    // prefix ARG [separator ARG] suffix
    struct TemplateRule {
        std::string prefix;
        std::string separator;
        std::string suffix;
        std::size_t arity;
        Transform transform;
    };

    using Rule = std::variant<ConstantRule, TemplateRule>;
    using Table = std::unordered_map<std::string, Rule>;

    const Table &table();
    
    // Exact match only. Returns `nullptr` for names the table does not know.
    const Rule *find(const std::string &);
    
    // Arguments exclude the capability name. Missing arguments render as empty 
    // (verbatim slots) or as 0 (shifted slots).
    std::string render(const Rule &, const std::vector<std::string> &);
    
    // Leading optionally signed decimal integer, 0 when there is none.
    long long leadingInteger(const std::string &);
}

#endif
