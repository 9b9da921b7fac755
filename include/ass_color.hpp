//
//  ass_color.hpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace captionforge {

// Convert a color value to an ASS color code ("&HBBGGRR&").
// Accepts names ("white", "Yellow"), ASS codes ("&H00FFFF&", "&H0000FFFF") and "#RRGGBB".
// Returns nullopt for anything else.
std::optional<std::string> color_to_ass(std::string_view color);

// True when both values resolve to the same ASS code.
bool same_color(std::string_view a, std::string_view b);

}  // namespace captionforge
