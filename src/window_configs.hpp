#pragma once
#include <cmath>
#include <cstddef>
#include "configs.hpp"

// second-based parameters converted to sample counts for one analysis pass
// (recomputed every pass from the current sampling-rate estimate)
struct window_samples_t {
    std::size_t pre_samples;
    std::size_t post_samples;
    std::size_t min_separation;
    std::size_t search_radius;
};

// round-to-nearest, never negative, saturating (NaN -> 0, huge or +inf -> SECONDS_TO_SAMPLES_MAX)
inline constexpr std::size_t SECONDS_TO_SAMPLES_MAX = std::size_t(1) << 32;

inline std::size_t seconds_to_samples(double seconds, double rate_hz) {
    const double n = std::round(seconds * rate_hz);
    if (!(n > 0.0)) {
        return 0;
    }
    if (n >= static_cast<double>(SECONDS_TO_SAMPLES_MAX)) {
        return SECONDS_TO_SAMPLES_MAX;
    }
    return static_cast<std::size_t>(n);
}

inline window_samples_t make_window_samples(const engine_config_t& cfg, double rate_hz) {
    window_samples_t w{};
    w.pre_samples    = seconds_to_samples(cfg.pre_window_s, rate_hz);
    w.post_samples   = seconds_to_samples(cfg.post_window_s, rate_hz);
    w.min_separation = seconds_to_samples(cfg.min_peak_separation_s, rate_hz);
    w.search_radius  = seconds_to_samples(cfg.search_radius_s, rate_hz);
    return w;
}
