//
//  main.cpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <cctype>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "captionforge.hpp"
#include "captionforge_version.hpp"
#include "logging.hpp"

namespace {

std::optional<captionforge::CanvasSize> parse_canvas(const std::string &s) {
    auto size = captionforge::parse_video_dimensions(s);
    if (!size) {
        std::cerr << "Invalid canvas '" << s << "', expected WIDTHxHEIGHT\n";
    }
    return size;
}

std::string lower_extension(const std::string &path) {
    auto ext = std::filesystem::path(path).extension().string();
    for (auto &c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext;
}

void print_usage() {
    std::cerr << "CaptionForge " << CAPTIONFORGE_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2025 Till Toenshoff\n\n"
              << "usage:\n"
              << "  captionforge <input.srt|transcript.json> <output.ass|output.srt> "
              << "[--config FILE] [--video FILE | --canvas WxH] [--burn OUTPUT_VIDEO] "
              << "[--log-level error|warn|info|debug]\n"
              << "Options:\n"
              << "  --config FILE       JSON style/animation/diarization configuration.\n"
              << "  --video FILE        Take the canvas size from this video (via ffprobe).\n"
              << "  --canvas WxH        Canvas size when no video is given (default: 1080x1920).\n"
              << "  --burn OUTPUT       Render the captions into --video with ffmpeg.\n"
              << "  --log-level LEVEL   Set logging verbosity (default: info).\n"
              << "An output ending in .srt receives a speaker-colored SRT instead of ASS.\n";
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "CaptionForge " << CAPTIONFORGE_VERSION_DISPLAY << "\n";
        return 0;
    }

    // Gather positional arguments (non-option).
    std::vector<std::string> positional;
    std::string config_path;
    std::string video_path;
    std::string burn_path;
    std::optional<captionforge::CanvasSize> canvas;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log-level" && i + 1 < argc) {
            captionforge::set_log_verbosity(captionforge::parse_log_verbosity(argv[++i]));
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--video" && i + 1 < argc) {
            video_path = argv[++i];
        } else if (arg == "--burn" && i + 1 < argc) {
            burn_path = argv[++i];
        } else if (arg == "--canvas" && i + 1 < argc) {
            canvas = parse_canvas(argv[++i]);
            if (!canvas) {
                return 2;
            }
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.size() != 2) {
        print_usage();
        return 2;
    }
    if (!burn_path.empty() && video_path.empty()) {
        std::cerr << "--burn requires --video\n";
        return 2;
    }
    if (canvas && !video_path.empty()) {
        std::cerr << "--canvas and --video are mutually exclusive\n";
        return 2;
    }
    const std::string input_path = positional[0];
    const std::string output_path = positional[1];
    const bool srt_output = lower_extension(output_path) == ".srt";
    if (srt_output && (!video_path.empty() || !burn_path.empty() || canvas)) {
        std::cerr << "--video, --burn and --canvas need an .ass output\n";
        return 2;
    }

    captionforge::CaptionConfig config;
    if (!config_path.empty()) {
        auto loaded = captionforge::load_caption_config_json(config_path);
        if (!loaded.status.ok) {
            CF_LOG("error", "captionforge: " << loaded.status.message);
            return 1;
        }
        config = std::move(loaded.config);
    }

    if (srt_output) {
        auto status = captionforge::write_styled_srt(input_path, output_path, config);
        if (!status.ok) {
            CF_LOG("error", "captionforge: failed to write srt: " << status.message);
            return 1;
        }
        std::cout << "Wrote: " << output_path << "\n";
        return 0;
    }

    captionforge::CompileReport report;
    if (!burn_path.empty()) {
        captionforge::FfprobeVideoInspector inspector;
        captionforge::FfmpegRenderer renderer;
        report = captionforge::caption_video(video_path, input_path, burn_path, output_path, config,
                                             inspector, renderer);
    } else if (!video_path.empty()) {
        captionforge::FfprobeVideoInspector inspector;
        report = captionforge::compile_file_to_ass(input_path, output_path, config, video_path,
                                                   inspector);
    } else {
        report = captionforge::compile_file_to_ass(input_path, output_path, config,
                                                   canvas.value_or(captionforge::CanvasSize{}));
    }
    if (!report.status.ok) {
        CF_LOG("error", "captionforge: failed to caption: " << report.status.message);
        return 1;
    }
    std::cout << "Wrote: " << output_path << " (" << report.emitted << " events, "
              << report.skipped.size() << " skipped)\n";
    if (!burn_path.empty()) {
        std::cout << "Wrote: " << burn_path << "\n";
    }
    return 0;
}
