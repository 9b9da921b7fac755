//
//  captionforge.cpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "captionforge.hpp"

#include <cctype>
#include <chrono>
#include <filesystem>
#include <utility>

#include "captionforge_version.hpp"
#include "logging.hpp"
#include "srt_parser.hpp"
#include "srt_writer.hpp"
#include "style_compiler.hpp"
#include "transcript.hpp"

namespace captionforge {

std::string version_string() { return CAPTIONFORGE_VERSION_DISPLAY; }

}  // namespace captionforge

namespace {

using captionforge::CompileReport;

static bool is_transcript_path(const std::string &path) {
    auto ext = std::filesystem::path(path).extension().string();
    for (auto &c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext == ".json";
}

static CompileReport fail(std::string msg) {
    CF_LOG("error", msg);
    CompileReport report;
    report.status = captionforge::make_status(false, std::move(msg));
    return report;
}

static void log_report(const CompileReport &report) {
    if (report.skipped.empty()) {
        CF_LOG("info", "compiled " << report.emitted << " of " << report.input_cues << " cues");
        return;
    }
    CF_LOG("warn", "compiled " << report.emitted << " cues, skipped " << report.skipped.size());
    for (const auto &issue : report.skipped) {
        CF_LOG("info", "  cue " << issue.index << " (" << to_string(issue.kind)
                                << "): " << issue.reason);
    }
}

}  // namespace

namespace captionforge {

FontCatalog make_font_catalog(const CaptionConfig &config) {
    auto catalog = FontCatalog::bundled();
    for (const auto &[name, resource] : config.fonts) {
        catalog.add(name, resource);
    }
    return catalog;
}

CompileReport compile_cues_to_ass(const std::vector<Cue> &cues, const CaptionConfig &config,
                                  const FontCatalog &catalog, const CanvasSize &canvas) {
    const auto t0 = std::chrono::steady_clock::now();
    auto valid = validate_caption_config(config);
    if (!valid.ok) {
        return fail("Invalid configuration: " + valid.message);
    }
    if (canvas.width == 0 || canvas.height == 0) {
        return fail("Invalid canvas size " + std::to_string(canvas.width) + "x" +
                    std::to_string(canvas.height));
    }
    StyleCompiler compiler(config, catalog);
    auto compiled = compiler.compile(cues);

    CompileReport report;
    report.input_cues = cues.size();
    report.emitted = compiled.emitted;
    report.skipped = compiled.issues();
    report.document = assemble_document(canvas, config.style, compiled.styled());
    report.status = make_status(true);
    const auto t1 = std::chrono::steady_clock::now();
    CF_LOG("debug", "compile_cues_to_ass cues=" << cues.size() << " canvas=" << canvas.width
                                                << "x" << canvas.height << " bytes="
                                                << report.document.size() << " ms="
                                                << std::chrono::duration_cast<
                                                       std::chrono::milliseconds>(t1 - t0)
                                                       .count());
    return report;
}

CompileReport compile_srt_to_ass(std::string_view srt_content, const CaptionConfig &config,
                                 const FontCatalog &catalog, const CanvasSize &canvas) {
    auto parsed = parse_srt(srt_content);
    auto report = compile_cues_to_ass(parsed.cues, config, catalog, canvas);
    // Parse errors come first; they precede styling.
    report.skipped.insert(report.skipped.begin(), parsed.issues.begin(), parsed.issues.end());
    return report;
}

CompileReport compile_srt_to_ass(std::string_view srt_content, const CaptionConfig &config,
                                 const CanvasSize &canvas) {
    return compile_srt_to_ass(srt_content, config, make_font_catalog(config), canvas);
}

CaptionStatus load_cues(const std::string &input_path, std::vector<Cue> &cues,
                        std::vector<CueIssue> &issues) {
    if (is_transcript_path(input_path)) {
        auto transcript = load_transcript_json(input_path);
        if (!transcript.status.ok) {
            return transcript.status;
        }
        cues = cues_from_utterances(transcript.utterances);
        return make_status(true);
    }
    auto parsed = load_srt_file(input_path);
    if (!parsed) {
        return make_status(false, "Failed to read subtitles from " + input_path);
    }
    cues = std::move(parsed->cues);
    issues = std::move(parsed->issues);
    return make_status(true);
}

CompileReport compile_file_to_ass(const std::string &input_path, const std::string &output_path,
                                  const CaptionConfig &config, const CanvasSize &canvas) {
    CF_LOG("debug", "compile_file_to_ass input=" << input_path << " output=" << output_path);
    std::vector<Cue> cues;
    std::vector<CueIssue> parse_issues;
    auto loaded = load_cues(input_path, cues, parse_issues);
    if (!loaded.ok) {
        return fail(loaded.message);
    }
    auto report = compile_cues_to_ass(cues, config, make_font_catalog(config), canvas);
    if (!report.status.ok) {
        return report;
    }
    report.skipped.insert(report.skipped.begin(), parse_issues.begin(), parse_issues.end());
    report.status = write_text_file_atomic(output_path, report.document);
    log_report(report);
    return report;
}

CompileReport compile_file_to_ass(const std::string &input_path, const std::string &output_path,
                                  const CaptionConfig &config, const std::string &video_path,
                                  VideoInspector &inspector) {
    auto canvas = inspector.inspect(video_path);
    if (!canvas) {
        return fail("Failed to inspect video " + video_path);
    }
    return compile_file_to_ass(input_path, output_path, config, *canvas);
}

CaptionStatus write_styled_srt(const std::string &input_path, const std::string &output_path,
                               const CaptionConfig &config) {
    auto valid = validate_diarization_config(config.diarization);
    if (!valid.ok) {
        return make_status(false, "Invalid configuration: " + valid.message);
    }
    std::vector<Cue> cues;
    std::vector<CueIssue> issues;
    auto loaded = load_cues(input_path, cues, issues);
    if (!loaded.ok) {
        CF_LOG("error", loaded.message);
        return loaded;
    }
    if (!issues.empty()) {
        CF_LOG("warn", "styled srt: skipped " << issues.size() << " malformed blocks");
    }
    return write_text_file_atomic(output_path,
                                  format_srt(style_srt_cues(cues, config.diarization)));
}

CompileReport caption_video(const std::string &video_path, const std::string &input_path,
                            const std::string &output_video_path, const CaptionConfig &config,
                            VideoInspector &inspector, VideoRenderer &renderer) {
    const auto ass_path =
        std::filesystem::path(output_video_path).replace_extension(".ass").string();
    return caption_video(video_path, input_path, output_video_path, ass_path, config, inspector,
                         renderer);
}

CompileReport caption_video(const std::string &video_path, const std::string &input_path,
                            const std::string &output_video_path,
                            const std::string &document_path, const CaptionConfig &config,
                            VideoInspector &inspector, VideoRenderer &renderer) {
    auto report = compile_file_to_ass(input_path, document_path, config, video_path, inspector);
    if (!report.status.ok) {
        return report;
    }
    auto rendered = renderer.render(video_path, document_path, output_video_path);
    if (!rendered.ok) {
        report.status = rendered;
        return report;
    }
    CF_LOG("info", "captioned video written to " << output_video_path);
    return report;
}

}  // namespace captionforge
