//
//  animation.hpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "caption_config.hpp"

namespace captionforge {

inline constexpr double kBounceMaxScale = 100.0;
inline constexpr double kBounceMinScale = 80.0;
inline constexpr double kBounceSlope = 90.0;  // percent lost over the full cue (monotonic)

struct AnimationKeyframe {
    double time_ms = 0;     // offset from the cue start
    double scale_x = 100;   // percent
    double scale_y = 100;   // percent
};

// Scale (percent) at offset `t_ms` of a cue lasting `duration_ms`.
using ScaleCurve = std::function<double(double t_ms, double duration_ms)>;

// max(80, 100 - 90 * t/D): shrinks from 100% and settles on the 80% floor.
double monotonic_bounce_scale(double t_ms, double duration_ms);

// 100% -> 80% at D/2 -> 100% at D.
double symmetric_bounce_scale(double t_ms, double duration_ms);

ScaleCurve scale_curve_for(BounceCurve curve);

// K keyframes at t_j = j * D / (K - 1), each scale multiplied by baseline_percent / 100.
// Returns nullopt for D == 0 or K < 2.
std::optional<std::vector<AnimationKeyframe>> compute_keyframes(uint32_t duration_ms,
                                                                int keyframe_count,
                                                                const ScaleCurve &curve,
                                                                double baseline_percent = 100.0);

// "{\t(T,T,\fscxS\fscyS)}" per keyframe, T in ms relative to the event start.
std::string render_keyframes(const std::vector<AnimationKeyframe> &keyframes);

// Standalone scale override "{\fscxS\fscyS}".
std::string render_scale_token(double percent);

/**
 * @brief Produces the animation override tokens for one cue.
 *
 * The scale curve is a replaceable strategy; by default it follows `AnimationConfig::curve`.
 */
class AnimationEngine {
public:
    explicit AnimationEngine(const AnimationConfig &config);
    AnimationEngine(const AnimationConfig &config, ScaleCurve curve);

    bool active() const;

    std::optional<std::vector<AnimationKeyframe>> keyframes(uint32_t duration_ms,
                                                            double baseline_percent = 100.0) const;

    // Empty string when the engine is inactive; nullopt when the duration is not positive.
    std::optional<std::string> render(uint32_t duration_ms, double baseline_percent = 100.0) const;

private:
    AnimationConfig config_;
    ScaleCurve curve_;
};

}  // namespace captionforge
