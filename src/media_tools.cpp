//
//  media_tools.cpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "media_tools.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/wait.h>
#include <utility>

#include "logging.hpp"

namespace {

struct CommandOutput {
    bool started = false;
    int exit_code = -1;
    std::string output;
};

// Run a shell command and capture stdout.
static CommandOutput run_command(const std::string &command) {
    CommandOutput res;
    CF_LOG("debug", "exec: " << command);
    FILE *pipe = popen(command.c_str(), "r");
    if (!pipe) {
        CF_LOG("error", "popen failed for '" << command << "': " << std::strerror(errno));
        return res;
    }
    res.started = true;
    char buffer[2048];
    while (std::fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        res.output += buffer;
    }
    const int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status)) {
        res.exit_code = WEXITSTATUS(status);
    } else {
        CF_LOG("warn", "command did not terminate normally: " << command);
    }
    return res;
}

static std::optional<uint32_t> parse_dimension(std::string_view s) {
    if (s.empty() || s.size() > 6) {
        return std::nullopt;
    }
    uint32_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        v = v * 10 + static_cast<uint32_t>(c - '0');
    }
    if (v == 0) {
        return std::nullopt;
    }
    return v;
}

}  // namespace

namespace captionforge {

std::optional<CanvasSize> parse_video_dimensions(std::string_view output) {
    while (!output.empty() && (output.back() == '\n' || output.back() == '\r' ||
                               output.back() == ' ')) {
        output.remove_suffix(1);
    }
    const size_t x = output.find('x');
    if (x == std::string_view::npos) {
        return std::nullopt;
    }
    auto w = parse_dimension(output.substr(0, x));
    auto h = parse_dimension(output.substr(x + 1));
    if (!w || !h) {
        return std::nullopt;
    }
    return CanvasSize{*w, *h};
}

std::string shell_quote(std::string_view arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

std::string filter_escape(std::string_view path) {
    std::string out;
    for (char c : path) {
        if (c == '\\' || c == ':' || c == '\'' || c == ',' || c == '[' || c == ']' ||
            c == ';') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

FfprobeVideoInspector::FfprobeVideoInspector(std::string ffprobe) : ffprobe_(std::move(ffprobe)) {}

std::optional<CanvasSize> FfprobeVideoInspector::inspect(const std::string &video_path) {
    const std::string cmd = ffprobe_ +
                            " -v error -select_streams v:0 -show_entries stream=width,height"
                            " -of csv=s=x:p=0 " +
                            shell_quote(video_path);
    auto res = run_command(cmd);
    if (!res.started || res.exit_code != 0) {
        CF_LOG("error", "ffprobe failed for " << video_path << " (exit " << res.exit_code << ")");
        return std::nullopt;
    }
    auto size = parse_video_dimensions(res.output);
    if (!size) {
        CF_LOG("error", "unexpected ffprobe output for " << video_path << ": '"
                                                          << text_preview(res.output) << "'");
        return std::nullopt;
    }
    CF_LOG("debug", "inspected " << video_path << " -> " << size->width << "x" << size->height);
    return size;
}

FfmpegRenderer::FfmpegRenderer(std::string ffmpeg) : ffmpeg_(std::move(ffmpeg)) {}

CaptionStatus FfmpegRenderer::render(const std::string &video_path,
                                     const std::string &document_path,
                                     const std::string &output_path) {
    const std::string cmd = ffmpeg_ + " -v error -i " + shell_quote(video_path) + " -vf " +
                            shell_quote("ass=" + filter_escape(document_path)) +
                            " -c:a copy -preset medium -movflags +faststart -y " +
                            shell_quote(output_path) + " 2>&1";
    auto res = run_command(cmd);
    if (!res.started || res.exit_code != 0) {
        std::string msg = "ffmpeg failed (exit " + std::to_string(res.exit_code) + ") for " +
                          output_path;
        CF_LOG("error", msg << ": " << text_preview(res.output, 200));
        return make_status(false, msg);
    }
    return make_status(true);
}

}  // namespace captionforge
