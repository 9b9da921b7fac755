//
//  text_processor.hpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "caption_config.hpp"
#include "cue.hpp"

namespace captionforge {

inline constexpr double kAutoScaleFullChars = 5;      // up to this many chars -> 100%
inline constexpr double kAutoScaleStepPercent = 1.5;  // lost per char beyond that
inline constexpr double kAutoScaleFloorPercent = 70;

// Text with all <...> tags and {...} override blocks removed.
struct MarkupResult {
    std::string text;                   // '\n' line breaks preserved
    std::optional<std::string> color;   // first <font color="..."> value seen
};

struct SpeakerSplit {
    std::optional<std::string> speaker;
    std::string text;  // remainder (or the input unchanged when no label was found)
};

// Normalized cue text, ready for styling.
struct ProcessedText {
    std::vector<std::string> lines;  // display lines (regrouped when max_words_per_line is set)
    std::optional<std::string> speaker;
    std::optional<std::string> color_override;
    size_t char_count = 0;           // code points of the stripped text, line breaks excluded
    double scale_percent = 100.0;    // auto-scale baseline; 100 when disabled
};

// Tokenizer over plain text / <tag> / {override} states. Unterminated markup stays literal.
MarkupResult strip_markup(std::string_view text);

// "Speaker 2" or a single name token ("Alice", "HOST").
bool is_speaker_label(std::string_view label);

// Split "<label>: <remainder>"; a line holding only "<label>:" yields an empty remainder.
SpeakerSplit extract_speaker(std::string_view line);

// Pack words into lines of at most `max_words_per_line` words (<= 0 acts as 1); a line also
// ends after a word with terminal punctuation (. ! ? : ;).
std::vector<std::string> group_words(const std::vector<std::string> &lines,
                                     int max_words_per_line);

// UTF-8 code points, '\n' not counted.
size_t count_display_chars(std::string_view text);

// 100 for <= 5 chars, then -1.5 per extra char, floored at 70.
double auto_scale_percent(size_t char_count);

// Full normalization of one cue: markup, speaker label, grouping, auto-scale.
ProcessedText process_cue_text(const Cue &cue, const StyleConfig &style);

}  // namespace captionforge
