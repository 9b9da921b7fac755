//
//  caption_config.hpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "caption_status.hpp"

namespace captionforge {

enum class AnimationKind { None, Bounce };

// Scale profile used by the bounce animation.
enum class BounceCurve {
    Monotonic,  ///< 100% shrinking towards an 80% floor over the cue.
    Symmetric,  ///< 100% -> 80% at mid-cue -> back to 100%.
};

/// @ingroup api
/// Base caption look. All members are populated; only `font` is checked lazily (FontCatalog).
struct StyleConfig {
    std::string font = "Montserrat";
    int font_size = 140;                    ///< Pixels
    std::string color = "white";            ///< Primary color (name, &H code or #RRGGBB)
    std::string outline_color = "black";
    int outline_thickness = 2;              ///< Pixels
    double position = 0.7;                  ///< Vertical position, fraction from the top (0-1)
    bool auto_scale_font = false;           ///< Shrink long cues (see auto_scale_percent)
    std::optional<int> max_words_per_line;  ///< Regroup words when set; <= 0 acts as 1
};

/// @ingroup api
struct AnimationConfig {
    bool enabled = true;
    AnimationKind kind = AnimationKind::Bounce;
    int keyframes = 10;  ///< Must be >= 2
    BounceCurve curve = BounceCurve::Monotonic;
};

/// @ingroup api
struct DiarizationConfig {
    bool enabled = true;
    std::vector<std::string> colors{"white", "yellow", "blue"};  ///< Palette, first-seen order
    int max_speakers = 3;
    bool keep_speaker_labels = false;
};

/// @ingroup api
struct CaptionConfig {
    StyleConfig style;
    AnimationConfig animation;
    DiarizationConfig diarization;
    std::map<std::string, std::string> fonts;  ///< Extra FontCatalog entries (name -> resource)
};

struct ConfigLoadResult {
    CaptionStatus status;
    CaptionConfig config;
};

std::optional<AnimationKind> parse_animation_kind(std::string_view name);
std::optional<BounceCurve> parse_bounce_curve(std::string_view name);
const char *to_string(AnimationKind kind);
const char *to_string(BounceCurve curve);

// Construction-time validation (everything except the font name).
CaptionStatus validate_style_config(const StyleConfig &style);
CaptionStatus validate_animation_config(const AnimationConfig &animation);
CaptionStatus validate_diarization_config(const DiarizationConfig &diarization);
CaptionStatus validate_caption_config(const CaptionConfig &config);

// JSON configuration; missing keys keep their defaults, the result is validated.
ConfigLoadResult parse_caption_config_json(std::string_view json_text);
ConfigLoadResult load_caption_config_json(const std::string &path);

}  // namespace captionforge
