//
//  font_catalog.cpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "font_catalog.hpp"

#include <array>
#include <string_view>
#include <utility>

#include "logging.hpp"

namespace {

// Display name -> font file shipped with the renderer setup.
constexpr std::array<std::pair<std::string_view, std::string_view>, 7> kBundledFonts = {{
    {"CheGuevara Barry", "CheGuevaraBarry-Brown.ttf"},
    {"Fira Sans Condensed", "FiraSansCondensed-ExtraBoldItalic.ttf"},
    {"Gabarito", "Gabarito-Black.ttf"},
    {"Komika Axis", "KOMIKAX_.ttf"},
    {"Montserrat", "Montserrat-Bold.ttf"},
    {"Proxima Nova", "Proxima-Nova-Semibold.ttf"},
    {"Rubik", "Rubik-ExtraBold.ttf"},
}};

}  // namespace

namespace captionforge {

FontCatalog FontCatalog::bundled() {
    FontCatalog catalog;
    for (const auto &[name, file] : kBundledFonts) {
        catalog.add(std::string(name), std::string(file));
    }
    return catalog;
}

void FontCatalog::add(const std::string &display_name, const std::string &resource) {
    CF_LOG("debug", "font catalog: " << display_name << " -> "
                                     << (resource.empty() ? "(name only)" : resource));
    fonts_[display_name] = resource;
}

bool FontCatalog::contains(const std::string &display_name) const {
    return fonts_.find(display_name) != fonts_.end();
}

std::optional<std::string> FontCatalog::resource_for(const std::string &display_name) const {
    auto it = fonts_.find(display_name);
    if (it == fonts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> FontCatalog::names() const {
    std::vector<std::string> out;
    out.reserve(fonts_.size());
    for (const auto &entry : fonts_) {
        out.push_back(entry.first);
    }
    return out;
}

}  // namespace captionforge
