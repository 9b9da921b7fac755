//
//  ass_color.cpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "ass_color.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace {

// Note: ASS stores colors blue-green-red.
constexpr std::array<std::pair<std::string_view, std::string_view>, 12> kNamedColors = {{
    {"white", "&HFFFFFF&"},
    {"yellow", "&H00FFFF&"},
    {"red", "&H0000FF&"},
    {"blue", "&HFF0000&"},
    {"green", "&H00FF00&"},
    {"purple", "&H800080&"},
    {"black", "&H000000&"},
    {"cyan", "&HFFFF00&"},
    {"magenta", "&HFF00FF&"},
    {"orange", "&H00A5FF&"},
    {"gray", "&H808080&"},
    {"grey", "&H808080&"},
}};

static bool is_hex(std::string_view s) {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

static std::string upper(std::string_view s) {
    std::string out(s);
    for (auto &c : out) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

static std::string lower(std::string_view s) {
    std::string out(s);
    for (auto &c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

}  // namespace

namespace captionforge {

std::optional<std::string> color_to_ass(std::string_view color) {
    while (!color.empty() && color.front() == ' ') {
        color.remove_prefix(1);
    }
    while (!color.empty() && color.back() == ' ') {
        color.remove_suffix(1);
    }
    if (color.empty()) {
        return std::nullopt;
    }
    const std::string name = lower(color);
    for (const auto &[key, code] : kNamedColors) {
        if (name == key) {
            return std::string(code);
        }
    }
    if (color.front() == '#' && color.size() == 7 && is_hex(color.substr(1))) {
        const std::string rgb = upper(color.substr(1));
        return "&H" + rgb.substr(4, 2) + rgb.substr(2, 2) + rgb.substr(0, 2) + "&";
    }
    if (name.size() > 2 && name[0] == '&' && name[1] == 'h') {
        std::string_view digits = color.substr(2);
        if (!digits.empty() && digits.back() == '&') {
            digits.remove_suffix(1);
        }
        // BBGGRR or AABBGGRR.
        if ((digits.size() == 6 || digits.size() == 8) && is_hex(digits)) {
            return "&H" + upper(digits) + "&";
        }
    }
    return std::nullopt;
}

bool same_color(std::string_view a, std::string_view b) {
    auto ca = color_to_ass(a);
    auto cb = color_to_ass(b);
    if (ca && cb) {
        return *ca == *cb;
    }
    return lower(a) == lower(b);
}

}  // namespace captionforge
