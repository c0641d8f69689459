#pragma once

#include <cstdint>
#include <string>

namespace checkfiles {

// 4 bit SGR palette; `code` is the foreground SGR parameter.
struct TermColor {
    enum class Kind : uint8_t {
        Color4bit = 0,
        Ignore,
    };

    Kind kind;
    uint8_t code;

    bool
    operator==(const TermColor& other) const {
        return other.kind == kind && other.code == code;
    }

    static const TermColor kNone;
    static const TermColor kRed;
};

struct TermStyle {
    enum class Attribute : uint16_t {
        None = 0,
        Bold = 1 << 0,
    };

    TermColor fg = TermColor::kNone;
    Attribute attr = Attribute::None;

    // Escape sequence that enables this style; empty for an unstyled style.
    std::string
    to_ansi() const;

    // Wrap `text` in this style and a trailing reset.
    std::string
    apply(const std::string& text) const;
};

}  // namespace checkfiles
