//
//  style_compiler.hpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "animation.hpp"
#include "caption_config.hpp"
#include "cue.hpp"
#include "font_catalog.hpp"
#include "speaker_colors.hpp"

namespace captionforge {

/// One compiled event: override tokens followed by the display text ("\N" line breaks).
struct StyledCue {
    uint32_t index = 0;
    uint32_t start_ms = 0;
    uint32_t end_ms = 0;
    std::string overrides;
    std::string text;
};

/// Per-cue outcome: styled, or dropped with a ValidationError reason.
using CueResult = std::variant<StyledCue, CueIssue>;

struct CompileResult {
    std::vector<CueResult> results;  // one per input cue, input order
    size_t emitted = 0;
    size_t skipped = 0;

    std::vector<StyledCue> styled() const;
    std::vector<CueIssue> issues() const;
};

// Inline color override "{\c&HBBGGRR&}".
std::string render_color_token(const std::string &ass_color);

class StyleCompiler {
public:
    StyleCompiler(CaptionConfig config, FontCatalog catalog);
    StyleCompiler(CaptionConfig config, FontCatalog catalog, AnimationEngine engine);

    // Style a whole cue list. Each call uses a fresh speaker table, so repeated runs over the
    // same input give identical results.
    CompileResult compile(const std::vector<Cue> &cues) const;

    // Style a single cue against an existing speaker table (cues must be fed in order).
    CueResult style_cue(const Cue &cue, SpeakerColorAssigner &speakers) const;

    const CaptionConfig &config() const { return config_; }

private:
    CueIssue reject(const Cue &cue, std::string reason) const;

    CaptionConfig config_;
    FontCatalog catalog_;
    AnimationEngine engine_;
};

}  // namespace captionforge
