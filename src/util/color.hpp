#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace patchy {

struct TermColor {
    enum class Kind : uint8_t {
        Color4bit = 0,
        DefaultColor,
        Ignore,
        Reset
    };

    Kind kind;

    // SGR codes for fore- and background
    uint8_t fg_code;
    uint8_t bg_code;

    TermColor() {
        *this = TermColor::kDefault;
    }

    TermColor(Kind kind, uint8_t fg_code, uint8_t bg_code) : kind(kind), fg_code(fg_code), bg_code(bg_code) {
    }

    bool
    operator==(const TermColor& other) const {
        return other.kind == kind && other.fg_code == fg_code && other.bg_code == bg_code;
    }

    // Palette name; i.e "green", "light_red", "none"
    static std::optional<TermColor>
    from_name(const std::string& name);

    static TermColor kNone;
    static TermColor kReset;
    static TermColor kDefault;

    // Colors (standard 4 bit palette)
    static TermColor kBlack;
    static TermColor kRed;
    static TermColor kGreen;
    static TermColor kYellow;
    static TermColor kBlue;
    static TermColor kMagenta;
    static TermColor kCyan;
    static TermColor kLightGray;
    static TermColor kDarkGray;
    static TermColor kLightRed;
    static TermColor kLightGreen;
    static TermColor kLightYellow;
    static TermColor kLightBlue;
    static TermColor kLightMagenta;
    static TermColor kLightCyan;
    static TermColor kWhite;
};

std::string
repr(const TermColor& color);

struct TermStyle {
    enum class Attribute : uint16_t {
        None = 0,
        Bold = 1 << 0,
        Dim = 1 << 1,
        Italic = 1 << 2,
        Underline = 1 << 4,
        Blink = 1 << 5,
        Inverse = 1 << 6,
        Hidden = 1 << 7,
        Strikethrough = 1 << 8,
    };

    TermColor fg;
    TermColor bg;
    Attribute attr;

    TermStyle() : TermStyle(TermColor::kNone, TermColor::kNone) {
    }

    explicit TermStyle(TermColor fg, TermColor bg, Attribute attr) : fg(fg), bg(bg), attr(attr) {
    }

    explicit TermStyle(TermColor fg, TermColor bg) : TermStyle(fg, bg, Attribute::None) {
    }

    // Escape sequence that switches to this style. Empty for a style that
    // changes nothing.
    std::string
    to_ansi() const;

    // Space separated words; the first color is the foreground, a color
    // prefixed with "on_" the background, and the rest are attributes:
    //   "bold light_red", "black on_green"
    static std::optional<TermStyle>
    parse_string(const std::string& description);

    // Inverse of parse_string
    std::string
    to_string() const;
};

TermStyle::Attribute
operator|(TermStyle::Attribute a, TermStyle::Attribute b);

TermStyle::Attribute
operator&(TermStyle::Attribute a, TermStyle::Attribute b);

// Escape sequence that resets colors and attributes.
const std::string&
term_reset();

}  // namespace patchy
