#include "color.hpp"

#include <fmt/format.h>

using namespace checkfiles;

// clang-format off
const TermColor TermColor::kNone = TermColor { TermColor::Kind::Ignore,    0 };
const TermColor TermColor::kRed  = TermColor { TermColor::Kind::Color4bit, 31 };
// clang-format on

std::string
TermStyle::to_ansi() const {
    std::string params;
    auto add = [&params](int value) {
        if (!params.empty()) {
            params += ";";
        }
        params += fmt::format("{}", value);
    };

    if (attr == Attribute::Bold) {
        add(1);
    }
    if (fg.kind != TermColor::Kind::Ignore) {
        add(fg.code);
    }

    if (params.empty()) {
        return "";
    }
    return fmt::format("\033[{}m", params);
}

std::string
TermStyle::apply(const std::string& text) const {
    auto prefix = to_ansi();
    if (prefix.empty()) {
        return text;
    }
    return prefix + text + "\033[0m";
}
