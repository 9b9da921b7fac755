//
//  cue.hpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace captionforge {

/// @ingroup api
/// One timed subtitle cue as read from SRT (or converted from a transcript).
struct Cue {
    uint32_t index = 0;                        ///< 1-based position in the source
    uint32_t start_ms = 0;                     ///< Absolute start time in ms
    uint32_t end_ms = 0;                       ///< Absolute end time in ms
    std::vector<std::string> lines;            ///< UTF-8 text lines, source line breaks kept
    std::optional<std::string> speaker;        ///< Extracted label, e.g. "Speaker 1"
    std::optional<std::string> color_override; ///< Color from inline <font color="..."> markup

    uint32_t duration_ms() const { return end_ms > start_ms ? end_ms - start_ms : 0; }
};

/// Error classes reported for cues that did not make it into the output.
enum class CueErrorKind { Parse, Validation };

/// A cue (or SRT block) dropped from the output, with the reason.
struct CueIssue {
    uint32_t index = 0;  ///< Cue index, or the block ordinal when the index did not parse
    CueErrorKind kind = CueErrorKind::Parse;
    std::string reason;
};

inline const char *to_string(CueErrorKind kind) {
    return kind == CueErrorKind::Parse ? "parse" : "validation";
}

}  // namespace captionforge
