//
//  media_tools.hpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "ass_document.hpp"
#include "caption_status.hpp"

namespace captionforge {

// Supplies the canvas size of a video resource.
class VideoInspector {
public:
    virtual ~VideoInspector() = default;
    // nullopt when the resource cannot be inspected.
    virtual std::optional<CanvasSize> inspect(const std::string &video_path) = 0;
};

// Burns a styled document into a video.
class VideoRenderer {
public:
    virtual ~VideoRenderer() = default;
    virtual CaptionStatus render(const std::string &video_path, const std::string &document_path,
                                 const std::string &output_path) = 0;
};

// Runs `ffprobe` on the first video stream.
class FfprobeVideoInspector : public VideoInspector {
public:
    explicit FfprobeVideoInspector(std::string ffprobe = "ffprobe");
    std::optional<CanvasSize> inspect(const std::string &video_path) override;

private:
    std::string ffprobe_;
};

// Runs `ffmpeg -vf ass=<document>`, audio copied; success is the tool's exit status.
class FfmpegRenderer : public VideoRenderer {
public:
    explicit FfmpegRenderer(std::string ffmpeg = "ffmpeg");
    CaptionStatus render(const std::string &video_path, const std::string &document_path,
                         const std::string &output_path) override;

private:
    std::string ffmpeg_;
};

// Parse ffprobe's "WIDTHxHEIGHT" output (trailing whitespace ignored).
std::optional<CanvasSize> parse_video_dimensions(std::string_view output);

// Single-quote for /bin/sh.
std::string shell_quote(std::string_view arg);

// Escape a path for use inside an ffmpeg filter argument (ass=...).
std::string filter_escape(std::string_view path);

}  // namespace captionforge
