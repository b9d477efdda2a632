#include "color.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <array>
#include <sstream>
#include <tuple>
#include <unordered_map>
#include <vector>

using namespace patchy;

// clang-format off
const std::array<std::tuple<const TermStyle::Attribute, const std::string, int>, 8> kAttributes {{
    { TermStyle::Attribute::Bold,          "bold",          1 },
    { TermStyle::Attribute::Dim,           "dim",           2 },
    { TermStyle::Attribute::Italic,        "italic",        3 },
    { TermStyle::Attribute::Underline,     "underline",     4 },
    { TermStyle::Attribute::Blink,         "blink",         5 },
    { TermStyle::Attribute::Inverse,       "inverse",       7 },
    { TermStyle::Attribute::Hidden,        "hidden",        8 },
    { TermStyle::Attribute::Strikethrough, "strikethrough", 9 }
}};

TermColor TermColor::kNone    = TermColor { TermColor::Kind::Ignore, 0, 0 };
TermColor TermColor::kReset   = TermColor { TermColor::Kind::Reset, 0, 0 };
TermColor TermColor::kDefault = TermColor { TermColor::Kind::DefaultColor, 39, 49 };

TermColor TermColor::kBlack        = TermColor { TermColor::Kind::Color4bit, 30,  40 };
TermColor TermColor::kRed          = TermColor { TermColor::Kind::Color4bit, 31,  41 };
TermColor TermColor::kGreen        = TermColor { TermColor::Kind::Color4bit, 32,  42 };
TermColor TermColor::kYellow       = TermColor { TermColor::Kind::Color4bit, 33,  43 };
TermColor TermColor::kBlue         = TermColor { TermColor::Kind::Color4bit, 34,  44 };
TermColor TermColor::kMagenta      = TermColor { TermColor::Kind::Color4bit, 35,  45 };
TermColor TermColor::kCyan         = TermColor { TermColor::Kind::Color4bit, 36,  46 };
TermColor TermColor::kLightGray    = TermColor { TermColor::Kind::Color4bit, 37,  47 };
TermColor TermColor::kDarkGray     = TermColor { TermColor::Kind::Color4bit, 90, 100 };
TermColor TermColor::kLightRed     = TermColor { TermColor::Kind::Color4bit, 91, 101 };
TermColor TermColor::kLightGreen   = TermColor { TermColor::Kind::Color4bit, 92, 102 };
TermColor TermColor::kLightYellow  = TermColor { TermColor::Kind::Color4bit, 93, 103 };
TermColor TermColor::kLightBlue    = TermColor { TermColor::Kind::Color4bit, 94, 104 };
TermColor TermColor::kLightMagenta = TermColor { TermColor::Kind::Color4bit, 95, 105 };
TermColor TermColor::kLightCyan    = TermColor { TermColor::Kind::Color4bit, 96, 106 };
TermColor TermColor::kWhite        = TermColor { TermColor::Kind::Color4bit, 97, 107 };

const std::vector<std::pair<std::string, TermColor>> kPalette = {
    { "none",          TermColor::kNone },
    { "reset",         TermColor::kReset },
    { "default",       TermColor::kDefault },
    { "black",         TermColor::kBlack },
    { "red",           TermColor::kRed },
    { "green",         TermColor::kGreen },
    { "yellow",        TermColor::kYellow },
    { "blue",          TermColor::kBlue },
    { "magenta",       TermColor::kMagenta },
    { "cyan",          TermColor::kCyan },
    { "light_gray",    TermColor::kLightGray },
    { "dark_gray",     TermColor::kDarkGray },
    { "light_red",     TermColor::kLightRed },
    { "light_green",   TermColor::kLightGreen },
    { "light_yellow",  TermColor::kLightYellow },
    { "light_blue",    TermColor::kLightBlue },
    { "light_magenta", TermColor::kLightMagenta },
    { "light_cyan",    TermColor::kLightCyan },
    { "white",         TermColor::kWhite }
};
// clang-format on

TermStyle::Attribute
patchy::operator|(TermStyle::Attribute a, TermStyle::Attribute b) {
    return static_cast<TermStyle::Attribute>(static_cast<uint16_t>(a) | static_cast<uint16_t>(b));
}

TermStyle::Attribute
patchy::operator&(TermStyle::Attribute a, TermStyle::Attribute b) {
    return static_cast<TermStyle::Attribute>(static_cast<uint16_t>(a) & static_cast<uint16_t>(b));
}

std::optional<TermColor>
TermColor::from_name(const std::string& name) {
    for (const auto& [color_name, color] : kPalette) {
        if (color_name == name) {
            return color;
        }
    }
    return std::nullopt;
}

std::string
patchy::repr(const TermColor& color) {
    for (const auto& [color_name, palette_color] : kPalette) {
        if (palette_color == color) {
            return color_name;
        }
    }
    return fmt::format("TermColor({}, {})", color.fg_code, color.bg_code);
}

std::string
TermStyle::to_ansi() const {
    std::vector<std::string> codes;

    if (fg.kind == TermColor::Kind::Reset || bg.kind == TermColor::Kind::Reset) {
        codes.push_back("0");
    }

    for (const auto& [attribute, name, code] : kAttributes) {
        if ((attr & attribute) != Attribute::None) {
            codes.push_back(std::to_string(code));
        }
    }

    if (fg.kind == TermColor::Kind::Color4bit || fg.kind == TermColor::Kind::DefaultColor) {
        codes.push_back(std::to_string(fg.fg_code));
    }
    if (bg.kind == TermColor::Kind::Color4bit || bg.kind == TermColor::Kind::DefaultColor) {
        codes.push_back(std::to_string(bg.bg_code));
    }

    if (codes.empty()) {
        return "";
    }
    return fmt::format("\033[{}m", fmt::join(codes, ";"));
}

std::optional<TermStyle>
TermStyle::parse_string(const std::string& description) {
    TermStyle style;
    bool have_fg = false;

    std::istringstream words(description);
    std::string word;
    while (words >> word) {
        if (word.rfind("on_", 0) == 0) {
            auto color = TermColor::from_name(word.substr(3));
            if (!color) {
                return std::nullopt;
            }
            style.bg = *color;
            continue;
        }

        if (auto color = TermColor::from_name(word); color && !have_fg) {
            style.fg = *color;
            have_fg = true;
            continue;
        }

        bool found = false;
        for (const auto& [attribute, name, code] : kAttributes) {
            if (name == word) {
                style.attr = style.attr | attribute;
                found = true;
                break;
            }
        }
        if (!found) {
            return std::nullopt;
        }
    }
    return style;
}

std::string
TermStyle::to_string() const {
    std::vector<std::string> words;
    for (const auto& [attribute, name, code] : kAttributes) {
        if ((attr & attribute) != Attribute::None) {
            words.push_back(name);
        }
    }
    if (!(fg == TermColor::kNone)) {
        words.push_back(repr(fg));
    }
    if (!(bg == TermColor::kNone)) {
        words.push_back("on_" + repr(bg));
    }
    return fmt::format("{}", fmt::join(words, " "));
}

const std::string&
patchy::term_reset() {
    static const std::string reset = "\033[0m";
    return reset;
}
