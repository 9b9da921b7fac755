//
//  srt_parser.hpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cue.hpp"

namespace captionforge {

// Parsed SRT: well-formed cues in source order plus the blocks that were skipped.
struct SrtParseResult {
    std::vector<Cue> cues;
    std::vector<CueIssue> issues;  // one ParseError entry per skipped block.
};

// Parse "HH:MM:SS,mmm" (a '.' before the milliseconds is accepted too) into milliseconds.
std::optional<uint32_t> parse_srt_timestamp(std::string_view text);

// Main parsing entry point. Malformed blocks are logged and skipped; empty input yields no cues.
SrtParseResult parse_srt(std::string_view content);

// Read and parse an SRT file. Returns nullopt only when the file cannot be read.
std::optional<SrtParseResult> load_srt_file(const std::string &path);

}  // namespace captionforge
