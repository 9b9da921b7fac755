// Transcript JSON input: speaker labels, word timings and the per-word cue conversion.
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "captionforge.hpp"
#include "logging.hpp"
#include "test_utils.hpp"
#include "transcript.hpp"

#ifndef TESTDATA_DIR
#error "TESTDATA_DIR must be defined"
#endif

using namespace captionforge;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[transcript_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool test_labels() {
    bool ok = check(normalize_speaker_label("A") == "Speaker A", "letter id prefixed");
    ok &= check(normalize_speaker_label("3") == "Speaker 3", "numeric id prefixed");
    ok &= check(normalize_speaker_label("Speaker 1") == "Speaker 1", "full label kept");
    return ok;
}

bool test_load_file() {
    auto loaded = load_transcript_json(std::string(TESTDATA_DIR) + "/transcript.json");
    bool ok = check(loaded.status.ok, "transcript loads: " + loaded.status.message);
    if (!ok || !check(loaded.utterances.size() == 3, "three utterances")) {
        return false;
    }
    const auto &u = loaded.utterances;
    ok &= check(u[0].speaker == "Speaker A" && u[1].speaker == "Speaker B" &&
                    u[2].speaker == "Speaker 2",
                "string and numeric speakers normalized");
    ok &= check(u[0].start_ms == 0 && u[0].end_ms == 900, "utterance span from its words");
    ok &= check(u[1].start_ms == 1000 && u[1].end_ms == 1600, "explicit utterance span");
    ok &= check(u[0].words.size() == 2 && u[0].words[1].text == "morning" &&
                    u[0].words[1].start_ms == 400 && u[0].words[1].end_ms == 900,
                "word timings");

    auto cues = cues_from_utterances(loaded.utterances);
    ok &= check(cues.size() == 4, "one cue per non-empty word");
    if (cues.size() == 4) {
        ok &= check(cues[0].index == 1 && cues[3].index == 4, "indices numbered from 1");
        ok &= check(cues[0].lines == std::vector<std::string>{"Good"} &&
                        cues[0].speaker == std::string("Speaker A"),
                    "word text with the utterance speaker");
        ok &= check(cues[2].lines[0] == "Hi!" && cues[2].speaker == std::string("Speaker B") &&
                        cues[2].start_ms == 1000 &&
                        cues[2].end_ms == 1600,
                    "cue timing from the word");
        ok &= check(cues[3].lines[0] == "Bye" && cues[3].speaker == std::string("Speaker 2"),
                    "empty word skipped");
    }
    return ok;
}

bool test_errors() {
    bool ok = check(!parse_transcript_json(R"({"words": []})").status.ok, "no utterances");
    auto broken = parse_transcript_json(R"({"utterances": [)");
    ok &= check(!broken.status.ok && broken.status.message.find("JSON") != std::string::npos,
                "malformed JSON reported");
    ok &= check(broken.utterances.empty(), "nothing returned on error");
    TranscriptLoadResult missing;
    test_utils::capture_stderr([&]() { missing = load_transcript_json("/nonexistent/t.json"); });
    ok &= check(!missing.status.ok, "missing file");
    auto empty = parse_transcript_json(R"({"utterances": []})");
    ok &= check(empty.status.ok && cues_from_utterances(empty.utterances).empty(),
                "empty transcript, no cues");
    return ok;
}

bool test_compile_transcript() {
    std::vector<Cue> cues;
    std::vector<CueIssue> issues;
    auto status = load_cues(std::string(TESTDATA_DIR) + "/transcript.json", cues, issues);
    bool ok = check(status.ok && cues.size() == 4 && issues.empty(), "load_cues picks JSON");

    CaptionConfig config;
    config.animation.enabled = false;
    auto report = compile_cues_to_ass(cues, config, FontCatalog::bundled());
    ok &= check(report.status.ok && report.emitted == 4, "transcript compiles");
    const auto &doc = report.document;
    ok &= check(doc.find("0:00:00.00,0:00:00.40,Default,,0,0,0,,{\\c&HFFFFFF&}Good\n") !=
                    std::string::npos,
                "speaker A white");
    ok &= check(doc.find("0:00:01.00,0:00:01.60,Default,,0,0,0,,{\\c&H00FFFF&}Hi!\n") !=
                    std::string::npos,
                "speaker B yellow");
    ok &= check(doc.find("{\\c&HFF0000&}Bye\n") != std::string::npos, "third speaker blue");
    return ok;
}

bool test_input_extension() {
    namespace fs = std::filesystem;
    const auto dir = test_utils::scratch_dir("transcript_unit_ext");
    const auto upper = dir / "words.JSON";
    std::error_code ec;
    fs::copy_file(std::string(TESTDATA_DIR) + "/transcript.json", upper,
                  fs::copy_options::overwrite_existing, ec);
    bool ok = check(!ec, "copy transcript");

    std::vector<Cue> cues;
    std::vector<CueIssue> issues;
    auto status = load_cues(upper.string(), cues, issues);
    ok &= check(status.ok && cues.size() == 4, "upper-case extension loads as transcript");

    // Bytes above 0x7F in the extension are not a transcript and must not trip case folding.
    const auto accented = dir / "words.\xC3\x89SRT";
    ok &= check(test_utils::write_text_file(accented, "1\n00:00:00,000 --> 00:00:01,000\nHi\n"),
                "write accented input");
    cues.clear();
    status = load_cues(accented.string(), cues, issues);
    ok &= check(status.ok && cues.size() == 1 && cues[0].lines.front() == "Hi",
                "non-ASCII extension parsed as SRT");

    fs::remove_all(dir, ec);
    return ok;
}

bool test_unusual_speaker_ids() {
    auto loaded = parse_transcript_json(R"({"utterances": [
        {"words": [{"text": "hello", "start": 0, "end": 500}]},
        {"speaker": "spk_0", "words": [{"text": "there", "start": 500, "end": 900}]},
        {"speaker": "A", "words": [{"text": "follows:", "start": 900, "end": 1400}]}
    ]})");
    bool ok = check(loaded.status.ok && loaded.utterances.size() == 3, "transcript parses");
    if (!ok) {
        return false;
    }
    ok &= check(loaded.utterances[0].speaker == "Speaker ?", "missing speaker placeholder");
    ok &= check(loaded.utterances[1].speaker == "Speaker spk_0", "diarizer id kept");

    CaptionConfig config;
    config.animation.enabled = false;
    auto report = compile_cues_to_ass(cues_from_utterances(loaded.utterances), config,
                                      FontCatalog::bundled());
    ok &= check(report.status.ok && report.emitted == 3, "all words styled");
    const auto &doc = report.document;
    ok &= check(doc.find(",,{\\c&HFFFFFF&}hello\n") != std::string::npos,
                "placeholder speaker colored, label not shown");
    ok &= check(doc.find(",,{\\c&H00FFFF&}there\n") != std::string::npos,
                "spk_0 colored, label not shown");
    ok &= check(doc.find(",,{\\c&HFF0000&}follows:\n") != std::string::npos,
                "word ending in ':' is displayed");
    ok &= check(doc.find("Speaker ") == std::string::npos, "no label leaks into events");

    config.diarization.keep_speaker_labels = true;
    auto labelled = compile_cues_to_ass(cues_from_utterances(loaded.utterances), config,
                                        FontCatalog::bundled());
    ok &= check(labelled.document.find("Speaker spk_0: there\n") != std::string::npos,
                "labels shown when kept");
    return ok;
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= test_labels();
    ok &= test_load_file();
    ok &= test_errors();
    ok &= test_compile_transcript();
    ok &= test_input_extension();
    ok &= test_unusual_speaker_ids();
    return ok ? 0 : 1;
}
