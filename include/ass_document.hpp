//
//  ass_document.hpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "caption_config.hpp"
#include "caption_status.hpp"
#include "style_compiler.hpp"

namespace captionforge {

/// Render canvas (PlayResX/PlayResY).
struct CanvasSize {
    uint32_t width = 1080;
    uint32_t height = 1920;
};

inline constexpr const char *kDefaultStyleName = "Default";

// "H:MM:SS.cc" (centiseconds, truncated).
std::string format_ass_time(uint32_t ms);

// "Style: Default,<font>,<size>,..." with MarginV = int(height * position).
std::string build_style_line(const StyleConfig &style, const CanvasSize &canvas);

// "Dialogue: 0,<start>,<end>,Default,,0,0,0,,<overrides><text>".
std::string build_event_line(const StyledCue &cue);

// Complete document: [Script Info], [V4+ Styles], [Events]. Deterministic for equal inputs.
std::string assemble_document(const CanvasSize &canvas, const StyleConfig &style,
                              const std::vector<StyledCue> &events);

// Write via a temporary sibling that is renamed into place; nothing is left behind on failure.
CaptionStatus write_text_file_atomic(const std::string &path, const std::string &content);

}  // namespace captionforge
