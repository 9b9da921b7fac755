//
//  caption_config.cpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "caption_config.hpp"

#include <cerrno>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <system_error>

#include "ass_color.hpp"
#include "logging.hpp"

using json = nlohmann::json;

namespace {

constexpr int kMaxFontSize = 1000;
constexpr int kMaxOutlineThickness = 100;

static captionforge::CaptionStatus check_color(const std::string &what,
                                               const std::string &value) {
    if (!captionforge::color_to_ass(value)) {
        return captionforge::make_status(false, "unknown " + what + " '" + value + "'");
    }
    return captionforge::make_status(true);
}

static void parse_style(const json &j, captionforge::StyleConfig &style) {
    style.font = j.value("font", style.font);
    style.font_size = j.value("font_size", style.font_size);
    style.color = j.value("color", style.color);
    style.outline_color = j.value("outline_color", style.outline_color);
    style.outline_thickness = j.value("outline_thickness", style.outline_thickness);
    style.position = j.value("position", style.position);
    style.auto_scale_font = j.value("auto_scale_font", style.auto_scale_font);
    if (j.contains("max_words_per_line") && !j["max_words_per_line"].is_null()) {
        style.max_words_per_line = j["max_words_per_line"].get<int>();
    }
}

// Returns an error message for unknown enum names, empty on success.
static std::string parse_animation(const json &j, captionforge::AnimationConfig &animation) {
    animation.enabled = j.value("enabled", animation.enabled);
    animation.keyframes = j.value("keyframes", animation.keyframes);
    if (j.contains("type")) {
        const auto type = j["type"].get<std::string>();
        auto kind = captionforge::parse_animation_kind(type);
        if (!kind) {
            return "invalid animation type '" + type + "'";
        }
        animation.kind = *kind;
    }
    if (j.contains("curve")) {
        const auto name = j["curve"].get<std::string>();
        auto curve = captionforge::parse_bounce_curve(name);
        if (!curve) {
            return "invalid animation curve '" + name + "'";
        }
        animation.curve = *curve;
    }
    return {};
}

static void parse_diarization(const json &j, captionforge::DiarizationConfig &diarization) {
    diarization.enabled = j.value("enabled", diarization.enabled);
    if (j.contains("colors")) {
        diarization.colors = j["colors"].get<std::vector<std::string>>();
    }
    diarization.max_speakers = j.value("max_speakers", diarization.max_speakers);
    diarization.keep_speaker_labels =
        j.value("keep_speaker_labels", diarization.keep_speaker_labels);
}

}  // namespace

namespace captionforge {

std::optional<AnimationKind> parse_animation_kind(std::string_view name) {
    if (name == "none") return AnimationKind::None;
    if (name == "bounce") return AnimationKind::Bounce;
    return std::nullopt;
}

std::optional<BounceCurve> parse_bounce_curve(std::string_view name) {
    if (name == "monotonic") return BounceCurve::Monotonic;
    if (name == "symmetric") return BounceCurve::Symmetric;
    return std::nullopt;
}

const char *to_string(AnimationKind kind) {
    return kind == AnimationKind::Bounce ? "bounce" : "none";
}

const char *to_string(BounceCurve curve) {
    return curve == BounceCurve::Symmetric ? "symmetric" : "monotonic";
}

CaptionStatus validate_style_config(const StyleConfig &style) {
    if (style.font.empty()) {
        return make_status(false, "font name is empty");
    }
    if (style.font_size <= 0 || style.font_size > kMaxFontSize) {
        return make_status(false, "font_size out of range: " + std::to_string(style.font_size));
    }
    if (style.outline_thickness < 0 || style.outline_thickness > kMaxOutlineThickness) {
        return make_status(false, "outline_thickness out of range: " +
                                      std::to_string(style.outline_thickness));
    }
    if (!(style.position >= 0.0 && style.position <= 1.0)) {
        return make_status(false, "position must be within [0, 1]");
    }
    auto status = check_color("color", style.color);
    if (!status.ok) {
        return status;
    }
    return check_color("outline_color", style.outline_color);
}

CaptionStatus validate_animation_config(const AnimationConfig &animation) {
    if (animation.keyframes < 2) {
        return make_status(false,
                           "keyframes must be >= 2, got " + std::to_string(animation.keyframes));
    }
    return make_status(true);
}

CaptionStatus validate_diarization_config(const DiarizationConfig &diarization) {
    if (diarization.colors.empty()) {
        return make_status(false, "diarization palette is empty");
    }
    for (const auto &c : diarization.colors) {
        auto status = check_color("palette color", c);
        if (!status.ok) {
            return status;
        }
    }
    if (diarization.max_speakers < 1) {
        return make_status(false, "max_speakers must be >= 1");
    }
    return make_status(true);
}

CaptionStatus validate_caption_config(const CaptionConfig &config) {
    auto status = validate_style_config(config.style);
    if (!status.ok) {
        return status;
    }
    status = validate_animation_config(config.animation);
    if (!status.ok) {
        return status;
    }
    return validate_diarization_config(config.diarization);
}

ConfigLoadResult parse_caption_config_json(std::string_view json_text) {
    ConfigLoadResult result;
    try {
        json j = json::parse(json_text.begin(), json_text.end());
        if (!j.is_object()) {
            result.status = make_status(false, "config root must be an object");
            return result;
        }
        if (j.contains("style")) {
            parse_style(j["style"], result.config.style);
        }
        if (j.contains("animation")) {
            auto err = parse_animation(j["animation"], result.config.animation);
            if (!err.empty()) {
                result.status = make_status(false, err);
                return result;
            }
        }
        if (j.contains("diarization")) {
            parse_diarization(j["diarization"], result.config.diarization);
        }
        if (j.contains("fonts")) {
            result.config.fonts = j["fonts"].get<std::map<std::string, std::string>>();
        }
    } catch (const json::exception &e) {
        result.status = make_status(false, std::string("config JSON error: ") + e.what());
        return result;
    }
    result.status = validate_caption_config(result.config);
    if (result.status.ok) {
        CF_LOG("debug", "config: font=" << result.config.style.font
                                        << " size=" << result.config.style.font_size
                                        << " animation=" << to_string(result.config.animation.kind)
                                        << "/" << result.config.animation.keyframes
                                        << " diarization=" << result.config.diarization.enabled
                                        << " palette=" << result.config.diarization.colors.size());
    }
    return result;
}

ConfigLoadResult load_caption_config_json(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        CF_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        ConfigLoadResult result;
        result.status = make_status(false, "Failed to open config: " + path);
        return result;
    }
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    auto result = parse_caption_config_json(content);
    if (!result.status.ok) {
        result.status.message = path + ": " + result.status.message;
    }
    return result;
}

}  // namespace captionforge
