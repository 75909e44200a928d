#include <system_error>
#include <charconv>
#include <cctype>

#include "constants.hpp"
#include "capability.hpp"

namespace fastput {

using constants::ESC;

static cap::Rule constant(const std::string &bytes) {
    return cap::ConstantRule {bytes};
}

static cap::Rule verbatim(const std::string &prefix, const std::string &suffix) {
    return cap::TemplateRule {prefix, "", suffix, 1, cap::Transform::Verbatim};
}

static const cap::Table capabilities {
    {"bel", constant("\007")}, 
    {"sgr0", constant(ESC + "[0m")}, 
    {"me", constant(ESC + "[0m")}, 
    {"bold", constant(ESC + "[1m")}, 
    {"dim", constant(ESC + "[2m")}, 
    {"rev", constant(ESC + "[7m")}, 
    {"blink", constant(ESC + "[5m")}, 
    {"setaf", verbatim(ESC + "[38;5;", "m")}, 
    {"AF", verbatim(ESC + "[38;5;", "m")}, 
    {"setab", verbatim(ESC + "[48;5;", "m")}, 
    {"AB", verbatim(ESC + "[48;5;", "m")}, 
    // Not DECSC/DECRC. Existing scripts depend on these exact bytes.
    {"sc", constant(ESC + "[7")}, 
    {"rc", constant(ESC + "[8")}, 
    {"cnorm", constant(ESC + "[?25h")}, 
    {"civis", constant(ESC + "[?25l")}, 
    {"smcup", constant(ESC + "[?1049h")}, 
    {"rmcup", constant(ESC + "[?1049l")}, 
    {"clear", constant(ESC + "[H" + ESC + "[2J")}, 
    {"home", constant(ESC + "[H")}, 
    {"cuu", verbatim(ESC + "[", "A")}, 
    {"cud", verbatim(ESC + "[", "B")}, 
    {"cuf", verbatim(ESC + "[", "C")}, 
    {"cub", verbatim(ESC + "[", "D")}, 
    // Callers count rows and columns from 0, the terminal from 1.
    {"cup", cap::TemplateRule {ESC + "[", ";", "H", 2, cap::Transform::AddOne}}
};

const cap::Table &cap::table() {
    return capabilities;
}

const cap::Rule *cap::find(const std::string &name) {
    auto it {capabilities.find(name)};
    if (it == capabilities.end()) {
        return nullptr;
    }
    return &it->second;
}

long long cap::leadingInteger(const std::string &text) {
    std::size_t idx {};
    while (idx < text.size() && std::isspace(static_cast<unsigned char>(text[idx]))) {
        ++idx;
    }
    // from_chars takes `-` but not `+`.
    if (idx < text.size() && text[idx] == '+') {
        ++idx;
    }
    
    long long value {};
    const char *first {text.data() + idx};
    const char *last {text.data() + text.size()};
    auto [ptr, ec] {std::from_chars(first, last, value)};
    if (ec != std::errc {} || ptr == first) {
        return 0;
    }
    return value;
}

static std::string substitute(const std::string &arg, cap::Transform transform) {
    if (transform == cap::Transform::Verbatim) {
        return arg;
    }
    // Wraps like shell arithmetic instead of overflowing.
    unsigned long long shifted {static_cast<unsigned long long>(cap::leadingInteger(arg)) + 1};
    return std::to_string(static_cast<long long>(shifted));
}

std::string cap::render(const Rule &rule, const std::vector<std::string> &args) {
    if (const ConstantRule *constantRule {std::get_if<ConstantRule>(&rule)}) {
        return constantRule->bytes;
    }
    
    const TemplateRule &templateRule {std::get<TemplateRule>(rule)};
    std::string out {templateRule.prefix};
    for (std::size_t i {}; i < templateRule.arity; ++i) {
        if (i > 0) {
            out += templateRule.separator;
        }
        const std::string arg {i < args.size() ? args[i] : std::string {}};
        out += substitute(arg, templateRule.transform);
    }
    out += templateRule.suffix;
    return out;
}

}
