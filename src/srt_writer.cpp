//
//  srt_writer.cpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "srt_writer.hpp"

#include <cstdio>
#include <sstream>

#include "logging.hpp"
#include "speaker_colors.hpp"
#include "text_processor.hpp"

namespace captionforge {

std::string format_srt_timestamp(uint32_t ms) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02u:%02u:%02u,%03u", ms / 3600000, (ms / 60000) % 60,
                  (ms / 1000) % 60, ms % 1000);
    return buf;
}

std::string format_srt(const std::vector<Cue> &cues) {
    std::ostringstream oss;
    for (size_t i = 0; i < cues.size(); ++i) {
        const auto &cue = cues[i];
        oss << (cue.index ? cue.index : static_cast<uint32_t>(i + 1)) << "\n"
            << format_srt_timestamp(cue.start_ms) << " --> " << format_srt_timestamp(cue.end_ms)
            << "\n";
        for (const auto &line : cue.lines) {
            oss << line << "\n";
        }
        oss << "\n";
    }
    return oss.str();
}

std::vector<Cue> style_srt_cues(const std::vector<Cue> &cues,
                                const DiarizationConfig &diarization) {
    std::vector<Cue> styled;
    styled.reserve(cues.size());
    SpeakerColorAssigner speakers(diarization.colors);
    for (const auto &cue : cues) {
        Cue out = cue;
        if (cue.lines.empty()) {
            styled.push_back(std::move(out));
            continue;
        }
        auto split = extract_speaker(cue.lines.front());
        std::optional<std::string> speaker = cue.speaker ? cue.speaker : split.speaker;
        if (!speaker) {
            styled.push_back(std::move(out));
            continue;
        }
        const auto &color = speakers.assign(*speaker);
        const bool labelled = split.speaker == speaker;
        std::string first = labelled ? cue.lines.front() : *speaker + ": " + cue.lines.front();
        out.lines.front() = "<font color=\"" + color + "\">" + first;
        out.lines.back() += "</font>";
        out.speaker = speaker;
        out.color_override = color;
        styled.push_back(std::move(out));
    }
    CF_LOG("debug", "styled srt: cues=" << styled.size()
                                        << " speakers=" << speakers.speaker_count());
    return styled;
}

}  // namespace captionforge
