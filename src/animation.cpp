//
//  animation.cpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "animation.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

#include "logging.hpp"

namespace captionforge {

double monotonic_bounce_scale(double t_ms, double duration_ms) {
    if (duration_ms <= 0) {
        return kBounceMaxScale;
    }
    return std::max(kBounceMinScale, kBounceMaxScale - kBounceSlope * (t_ms / duration_ms));
}

double symmetric_bounce_scale(double t_ms, double duration_ms) {
    if (duration_ms <= 0) {
        return kBounceMaxScale;
    }
    const double half = duration_ms / 2.0;
    const double range = kBounceMaxScale - kBounceMinScale;
    if (t_ms < half) {
        return kBounceMaxScale - range * (t_ms / half);
    }
    return kBounceMinScale + range * std::min(1.0, (t_ms - half) / half);
}

ScaleCurve scale_curve_for(BounceCurve curve) {
    if (curve == BounceCurve::Symmetric) {
        return symmetric_bounce_scale;
    }
    return monotonic_bounce_scale;
}

std::optional<std::vector<AnimationKeyframe>> compute_keyframes(uint32_t duration_ms,
                                                                int keyframe_count,
                                                                const ScaleCurve &curve,
                                                                double baseline_percent) {
    if (duration_ms == 0 || keyframe_count < 2 || !curve) {
        return std::nullopt;
    }
    const double d = static_cast<double>(duration_ms);
    const double factor = baseline_percent / 100.0;
    std::vector<AnimationKeyframe> frames;
    frames.reserve(static_cast<size_t>(keyframe_count));
    for (int j = 0; j < keyframe_count; ++j) {
        // j == K-1 lands exactly on D.
        const double t = static_cast<double>(j) * d / static_cast<double>(keyframe_count - 1);
        const double scale = curve(t, d) * factor;
        frames.push_back(AnimationKeyframe{t, scale, scale});
    }
    return frames;
}

std::string render_keyframes(const std::vector<AnimationKeyframe> &keyframes) {
    std::ostringstream oss;
    for (const auto &kf : keyframes) {
        const long t = std::lround(kf.time_ms);
        oss << "{\\t(" << t << "," << t << ",\\fscx" << std::lround(kf.scale_x) << "\\fscy"
            << std::lround(kf.scale_y) << ")}";
    }
    return oss.str();
}

std::string render_scale_token(double percent) {
    const long s = std::lround(percent);
    return "{\\fscx" + std::to_string(s) + "\\fscy" + std::to_string(s) + "}";
}

AnimationEngine::AnimationEngine(const AnimationConfig &config)
    : config_(config), curve_(scale_curve_for(config.curve)) {}

AnimationEngine::AnimationEngine(const AnimationConfig &config, ScaleCurve curve)
    : config_(config), curve_(std::move(curve)) {}

bool AnimationEngine::active() const {
    return config_.enabled && config_.kind != AnimationKind::None;
}

std::optional<std::vector<AnimationKeyframe>> AnimationEngine::keyframes(
    uint32_t duration_ms, double baseline_percent) const {
    return compute_keyframes(duration_ms, config_.keyframes, curve_, baseline_percent);
}

std::optional<std::string> AnimationEngine::render(uint32_t duration_ms,
                                                   double baseline_percent) const {
    if (!active()) {
        return std::string();
    }
    auto frames = keyframes(duration_ms, baseline_percent);
    if (!frames) {
        CF_LOG("debug", "animation: no keyframes for duration=" << duration_ms
                                                                << " keyframes="
                                                                << config_.keyframes);
        return std::nullopt;
    }
    return render_keyframes(*frames);
}

}  // namespace captionforge
