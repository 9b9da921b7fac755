//
//  style_compiler.cpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "style_compiler.hpp"

#include <utility>

#include "ass_color.hpp"
#include "logging.hpp"
#include "text_processor.hpp"

namespace captionforge {

std::vector<StyledCue> CompileResult::styled() const {
    std::vector<StyledCue> out;
    out.reserve(emitted);
    for (const auto &r : results) {
        if (const auto *cue = std::get_if<StyledCue>(&r)) {
            out.push_back(*cue);
        }
    }
    return out;
}

std::vector<CueIssue> CompileResult::issues() const {
    std::vector<CueIssue> out;
    out.reserve(skipped);
    for (const auto &r : results) {
        if (const auto *issue = std::get_if<CueIssue>(&r)) {
            out.push_back(*issue);
        }
    }
    return out;
}

std::string render_color_token(const std::string &ass_color) {
    return "{\\c" + ass_color + "}";
}

StyleCompiler::StyleCompiler(CaptionConfig config, FontCatalog catalog)
    : config_(std::move(config)), catalog_(std::move(catalog)), engine_(config_.animation) {}

StyleCompiler::StyleCompiler(CaptionConfig config, FontCatalog catalog, AnimationEngine engine)
    : config_(std::move(config)), catalog_(std::move(catalog)), engine_(std::move(engine)) {}

CueIssue StyleCompiler::reject(const Cue &cue, std::string reason) const {
    CF_LOG("warn", "style: skipping cue " << cue.index << ": " << reason);
    return CueIssue{cue.index, CueErrorKind::Validation, std::move(reason)};
}

CueResult StyleCompiler::style_cue(const Cue &cue, SpeakerColorAssigner &speakers) const {
    if (!catalog_.contains(config_.style.font)) {
        return reject(cue, "unknown font '" + config_.style.font + "'");
    }
    if (cue.end_ms <= cue.start_ms) {
        return reject(cue, "non-positive duration (" + std::to_string(cue.start_ms) + " -> " +
                               std::to_string(cue.end_ms) + " ms)");
    }

    const auto text = process_cue_text(cue, config_.style);
    const auto &diarization = config_.diarization;

    // 1) color: an explicit override wins over the speaker's palette color.
    std::string color_token;
    std::optional<std::string> palette_color;
    if (diarization.enabled && text.speaker) {
        const bool was_known = speakers.knows(*text.speaker);
        palette_color = speakers.assign(*text.speaker);
        if (!was_known && speakers.speaker_count() ==
                              static_cast<size_t>(diarization.max_speakers) + 1) {
            CF_LOG("warn", "style: more speakers than max_speakers=" << diarization.max_speakers
                                                                     << " (cue " << cue.index
                                                                     << "), palette wraps");
        }
    }
    bool explicit_used = false;
    if (text.color_override) {
        auto code = color_to_ass(*text.color_override);
        if (!code) {
            CF_LOG("warn", "style: cue " << cue.index << " ignoring unknown color '"
                                         << *text.color_override << "'");
        } else {
            explicit_used = true;
            if (!same_color(*text.color_override, config_.style.color)) {
                color_token = render_color_token(*code);
            }
        }
    }
    if (!explicit_used && palette_color) {
        auto code = color_to_ass(*palette_color);
        if (code) {
            color_token = render_color_token(*code);
        }
    }

    // 2) auto-scale on its own, 3) animation (which composes the auto-scale baseline).
    std::string overrides = color_token;
    if (engine_.active()) {
        auto animation = engine_.render(cue.duration_ms(), text.scale_percent);
        if (!animation) {
            return reject(cue, "invalid animation (keyframes=" +
                                   std::to_string(config_.animation.keyframes) + ")");
        }
        overrides += *animation;
    } else if (text.scale_percent < 100.0) {
        overrides += render_scale_token(text.scale_percent);
    }

    StyledCue styled{};
    styled.index = cue.index;
    styled.start_ms = cue.start_ms;
    styled.end_ms = cue.end_ms;
    styled.overrides = std::move(overrides);
    if (diarization.enabled && diarization.keep_speaker_labels && text.speaker) {
        styled.text = *text.speaker + ": ";
    }
    for (size_t i = 0; i < text.lines.size(); ++i) {
        if (i > 0) {
            styled.text += "\\N";
        }
        styled.text += text.lines[i];
    }
    return styled;
}

CompileResult StyleCompiler::compile(const std::vector<Cue> &cues) const {
    CompileResult result;
    result.results.reserve(cues.size());
    SpeakerColorAssigner speakers(config_.diarization.colors);
    for (const auto &cue : cues) {
        auto r = style_cue(cue, speakers);
        if (std::holds_alternative<StyledCue>(r)) {
            ++result.emitted;
        } else {
            ++result.skipped;
        }
        result.results.push_back(std::move(r));
    }
    CF_LOG("debug", "style: emitted=" << result.emitted << " skipped=" << result.skipped
                                      << " speakers=" << speakers.speaker_count());
    return result;
}

}  // namespace captionforge
