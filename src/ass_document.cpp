//
//  ass_document.cpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "ass_document.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "ass_color.hpp"
#include "logging.hpp"

namespace {

constexpr const char *kStyleFormat =
    "Format: Name, Fontname, Fontsize, PrimaryColour, SecondaryColour, OutlineColour, "
    "BackColour, Bold, Italic, Underline, StrikeOut, ScaleX, ScaleY, Spacing, Angle, "
    "BorderStyle, Outline, Shadow, Alignment, MarginL, MarginR, MarginV, Encoding";
constexpr const char *kEventFormat =
    "Format: Layer, Start, End, Style, Name, MarginL, MarginR, MarginV, Effect, Text";
constexpr const char *kSecondaryColor = "&H000000FF";
constexpr const char *kBackColor = "&H00000000";
constexpr const char *kFallbackPrimary = "&HFFFFFF&";
constexpr const char *kFallbackOutline = "&H000000&";
constexpr int kAlignmentBottomCenter = 2;
constexpr int kHorizontalMargin = 10;

}  // namespace

namespace captionforge {

std::string format_ass_time(uint32_t ms) {
    const uint32_t hours = ms / 3600000;
    const uint32_t minutes = (ms / 60000) % 60;
    const uint32_t seconds = (ms / 1000) % 60;
    const uint32_t centis = (ms % 1000) / 10;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%u:%02u:%02u.%02u", hours, minutes, seconds, centis);
    return buf;
}

std::string build_style_line(const StyleConfig &style, const CanvasSize &canvas) {
    const auto margin_v =
        static_cast<uint32_t>(static_cast<double>(canvas.height) * style.position);
    std::ostringstream oss;
    oss << "Style: " << kDefaultStyleName << "," << style.font << "," << style.font_size << ","
        << color_to_ass(style.color).value_or(kFallbackPrimary) << "," << kSecondaryColor << ","
        << color_to_ass(style.outline_color).value_or(kFallbackOutline) << "," << kBackColor
        << ","
        << "0,0,0,0,"        // bold, italic, underline, strikeout
        << "100,100,0,0,1,"  // scale x/y, spacing, angle, border style
        << style.outline_thickness << ",0," << kAlignmentBottomCenter << ","
        << kHorizontalMargin << "," << kHorizontalMargin << "," << margin_v << ",1";
    return oss.str();
}

std::string build_event_line(const StyledCue &cue) {
    return "Dialogue: 0," + format_ass_time(cue.start_ms) + "," + format_ass_time(cue.end_ms) +
           "," + kDefaultStyleName + ",,0,0,0,," + cue.overrides + cue.text;
}

std::string assemble_document(const CanvasSize &canvas, const StyleConfig &style,
                              const std::vector<StyledCue> &events) {
    std::ostringstream oss;
    oss << "[Script Info]\n"
        << "ScriptType: v4.00+\n"
        << "PlayResX: " << canvas.width << "\n"
        << "PlayResY: " << canvas.height << "\n"
        << "ScaledBorderAndShadow: yes\n"
        << "\n"
        << "[V4+ Styles]\n"
        << kStyleFormat << "\n"
        << build_style_line(style, canvas) << "\n"
        << "\n"
        << "[Events]\n"
        << kEventFormat << "\n";
    for (const auto &ev : events) {
        oss << build_event_line(ev) << "\n";
    }
    return oss.str();
}

CaptionStatus write_text_file_atomic(const std::string &path, const std::string &content) {
    namespace fs = std::filesystem;
    const fs::path target(path);
    fs::path tmp = target;
    tmp += ".part";
    std::error_code ec;
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            CF_LOG("error", "Failed to open output for write: " << tmp.string());
            return make_status(false, "Failed to open output for write: " + path);
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        out.close();
        if (out.fail()) {
            fs::remove(tmp, ec);
            CF_LOG("error", "Failed writing " << content.size() << " bytes to " << tmp.string());
            return make_status(false, "Failed to write output: " + path);
        }
    }
    fs::rename(tmp, target, ec);
    if (ec) {
        CF_LOG("error", "rename " << tmp.string() << " -> " << path << " failed: "
                                  << ec.message());
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return make_status(false, "Failed to move output into place: " + path);
    }
    CF_LOG("debug", "wrote " << content.size() << " bytes to " << path);
    return make_status(true);
}

}  // namespace captionforge
