//
//  transcript.cpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "transcript.hpp"

#include <cerrno>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <system_error>

#include "logging.hpp"

using json = nlohmann::json;

namespace {

constexpr std::string_view kSpeakerPrefix = "Speaker ";

}  // namespace

namespace captionforge {

std::string normalize_speaker_label(std::string_view raw) {
    if (raw.substr(0, kSpeakerPrefix.size()) == kSpeakerPrefix) {
        return std::string(raw);
    }
    return std::string(kSpeakerPrefix) + std::string(raw);
}

TranscriptLoadResult parse_transcript_json(std::string_view json_text) {
    TranscriptLoadResult result;
    try {
        json j = json::parse(json_text.begin(), json_text.end());
        if (!j.is_object() || !j.contains("utterances") || !j["utterances"].is_array()) {
            result.status = make_status(false, "transcript has no 'utterances' array");
            return result;
        }
        for (const auto &u : j["utterances"]) {
            Utterance utt{};
            // Speaker ids arrive as letters ("A") or numbers (0).
            if (u.contains("speaker") && u["speaker"].is_number_integer()) {
                utt.speaker = normalize_speaker_label(std::to_string(u["speaker"].get<int>()));
            } else {
                utt.speaker = normalize_speaker_label(u.value("speaker", std::string("?")));
            }
            if (u.contains("words")) {
                for (const auto &w : u["words"]) {
                    TranscriptWord word{};
                    word.text = w.value("text", "");
                    word.start_ms = w.value("start", 0u);
                    word.end_ms = w.value("end", 0u);
                    utt.words.push_back(std::move(word));
                }
            }
            const uint32_t first_start = utt.words.empty() ? 0 : utt.words.front().start_ms;
            const uint32_t last_end = utt.words.empty() ? 0 : utt.words.back().end_ms;
            utt.start_ms = u.value("start", first_start);
            utt.end_ms = u.value("end", last_end);
            result.utterances.push_back(std::move(utt));
        }
    } catch (const json::exception &e) {
        result.status = make_status(false, std::string("transcript JSON error: ") + e.what());
        result.utterances.clear();
        return result;
    }
    CF_LOG("debug", "transcript: utterances=" << result.utterances.size());
    result.status = make_status(true);
    return result;
}

TranscriptLoadResult load_transcript_json(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        CF_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        TranscriptLoadResult result;
        result.status = make_status(false, "Failed to open transcript: " + path);
        return result;
    }
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return parse_transcript_json(content);
}

std::vector<Cue> cues_from_utterances(const std::vector<Utterance> &utterances) {
    std::vector<Cue> cues;
    uint32_t index = 1;
    for (const auto &utt : utterances) {
        for (const auto &word : utt.words) {
            if (word.text.empty()) {
                continue;
            }
            Cue cue{};
            cue.index = index++;
            cue.start_ms = word.start_ms;
            cue.end_ms = word.end_ms;
            cue.lines.push_back(word.text);
            cue.speaker = utt.speaker;
            cues.push_back(std::move(cue));
        }
    }
    return cues;
}

}  // namespace captionforge
