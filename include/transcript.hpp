//
//  transcript.hpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "caption_status.hpp"
#include "cue.hpp"

namespace captionforge {

struct TranscriptWord {
    std::string text;
    uint32_t start_ms = 0;
    uint32_t end_ms = 0;
};

// A diarized stretch of speech, as delivered by the transcription service.
struct Utterance {
    std::string speaker;  ///< Normalized label, e.g. "Speaker A"
    std::vector<TranscriptWord> words;
    uint32_t start_ms = 0;
    uint32_t end_ms = 0;
};

struct TranscriptLoadResult {
    CaptionStatus status;
    std::vector<Utterance> utterances;
};

// "A" -> "Speaker A"; labels already starting with "Speaker " are kept.
std::string normalize_speaker_label(std::string_view raw);

// {"utterances":[{"speaker":"A","start":0,"end":900,"words":[{"text":..,"start":..,"end":..}]}]}
TranscriptLoadResult parse_transcript_json(std::string_view json_text);
TranscriptLoadResult load_transcript_json(const std::string &path);

// One cue per word carrying its utterance speaker, indices numbered from 1.
std::vector<Cue> cues_from_utterances(const std::vector<Utterance> &utterances);

}  // namespace captionforge
