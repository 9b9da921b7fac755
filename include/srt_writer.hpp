//
//  srt_writer.hpp
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
#include "cue.hpp"

namespace captionforge {

// "HH:MM:SS,mmm".
std::string format_srt_timestamp(uint32_t ms);

// Serialize cues as SRT blocks (index, timing, text lines, blank separator).
std::string format_srt(const std::vector<Cue> &cues);

// Wrap every labelled cue in <font color="..."> using the palette in first-seen speaker order.
// Cues without a speaker label are passed through unchanged.
std::vector<Cue> style_srt_cues(const std::vector<Cue> &cues, const DiarizationConfig &diarization);

}  // namespace captionforge
