#pragma once
#include <cerrno>
#include <cmath>
#include <cstddef>
#include <string>

// central place for the defaults used across the engine
// detection tuning (calibrated at ~100 Hz)
inline constexpr std::size_t RING_BUFFER_CAPACITY    = 1000; // ~10 s of history @ 100 Hz
inline constexpr std::size_t ANALYSIS_WINDOW_SAMPLES = 200;  // last 2 s analysed per pass
inline constexpr std::size_t MIN_NEW_SAMPLES         = 20;   // re-analyse every 200 ms
inline constexpr std::size_t MIN_REFINED_SAMPLES     = 10;   // shortest window worth validating
inline constexpr double NOMINAL_RATE_HZ              = 100.0;
inline constexpr double PRE_WINDOW_SEC               = 0.50;
inline constexpr double POST_WINDOW_SEC              = 0.50;
inline constexpr double MIN_PEAK_SEPARATION_SEC      = 0.50;
inline constexpr double SEARCH_RADIUS_SEC            = 0.15;
inline constexpr double THRESH_STD_MULT              = 1.0;
inline constexpr double MIC_PER_GYRO_THRESHOLD       = 35.0; // ratio cancels FFT scaling
inline constexpr double POWER_RATIO_EPS              = 1e-9;
inline constexpr double MIN_SWING_INTERVAL_SEC       = 0.50;
inline constexpr std::size_t PERF_LOG_EVERY          = 20;   // passes between timing reports

// physical constants; changing any of these needs recalibration against ground truth
inline constexpr double MOUNT_TO_TIP_M          = 0.39;
inline constexpr double EFFECTIVE_TIP_MASS_KG   = 0.15;
inline constexpr double RACKET_SENSOR_MASS_KG   = 0.10;  // racket ~90 g + sensor ~10 g
inline constexpr double SHUTTLE_MASS_KG         = 0.0053;
inline constexpr double SHUTTLE_VS_TIP_RATIO    = 1.5;
inline constexpr double CONTACT_DURATION_S      = 0.002;
inline constexpr double INCOMING_SPEED_STD_MS   = 15.0;
inline constexpr double G_TO_MS2                = 9.81;
inline constexpr double DEG_TO_RAD              = 3.14159265358979323846 / 180.0;

struct physical_constants_t {
    double lever_arm_m          = MOUNT_TO_TIP_M;
    double effective_tip_mass   = EFFECTIVE_TIP_MASS_KG;
    double racket_sensor_mass   = RACKET_SENSOR_MASS_KG;
    double shuttle_mass         = SHUTTLE_MASS_KG;
    double shuttle_vs_tip_ratio = SHUTTLE_VS_TIP_RATIO;
    double contact_duration_s   = CONTACT_DURATION_S;
    double incoming_speed_std   = INCOMING_SPEED_STD_MS;
};

// copied into the engine at construction and never modified afterwards
struct engine_config_t {
    std::size_t buffer_capacity         = RING_BUFFER_CAPACITY;
    std::size_t analysis_window_samples = ANALYSIS_WINDOW_SAMPLES;
    std::size_t min_new_samples         = MIN_NEW_SAMPLES;
    std::size_t min_refined_samples     = MIN_REFINED_SAMPLES;
    double nominal_rate_hz              = NOMINAL_RATE_HZ;
    double pre_window_s                 = PRE_WINDOW_SEC;
    double post_window_s                = POST_WINDOW_SEC;
    double min_peak_separation_s        = MIN_PEAK_SEPARATION_SEC;
    double search_radius_s              = SEARCH_RADIUS_SEC;
    double threshold_std_mult           = THRESH_STD_MULT;
    double power_ratio_threshold        = MIC_PER_GYRO_THRESHOLD;
    double min_swing_interval_s         = MIN_SWING_INTERVAL_SEC;
    std::size_t perf_log_every          = PERF_LOG_EVERY; // 0 disables
    physical_constants_t physics{};
};

// returns 0 if usable, -EINVAL otherwise with the offending field in *why (if given)
inline int validate_engine_config(const engine_config_t& cfg, std::string* why = nullptr) {
    auto fail = [why](const char* field) {
        if (why) {
            *why = std::string("invalid ") + field;
        }
        return -EINVAL;
    };

    // isfinite first: NaN and +/-inf never reach a comparison
    auto positive = [](double x) { return std::isfinite(x) && x > 0.0; };
    auto non_negative = [](double x) { return std::isfinite(x) && x >= 0.0; };
    // a second-based span must fit in the history at the nominal rate
    auto fits = [&cfg](double sec) { return sec * cfg.nominal_rate_hz <= static_cast<double>(cfg.buffer_capacity); };

    if (!positive(cfg.nominal_rate_hz))          return fail("nominal_rate_hz");
    if (cfg.analysis_window_samples < 3)         return fail("analysis_window_samples");
    if (cfg.buffer_capacity < cfg.analysis_window_samples) return fail("buffer_capacity");
    if (cfg.min_new_samples == 0)                return fail("min_new_samples");
    if (cfg.min_refined_samples < 5)             return fail("min_refined_samples");
    if (!non_negative(cfg.pre_window_s) || !fits(cfg.pre_window_s))   return fail("pre_window_s");
    if (!non_negative(cfg.post_window_s) || !fits(cfg.post_window_s)) return fail("post_window_s");
    if (!(cfg.pre_window_s + cfg.post_window_s > 0.0)) return fail("pre_window_s + post_window_s");
    if (!non_negative(cfg.min_peak_separation_s) || !fits(cfg.min_peak_separation_s)) return fail("min_peak_separation_s");
    if (!non_negative(cfg.search_radius_s) || !fits(cfg.search_radius_s)) return fail("search_radius_s");
    if (!non_negative(cfg.threshold_std_mult))    return fail("threshold_std_mult");
    if (!non_negative(cfg.power_ratio_threshold)) return fail("power_ratio_threshold");
    if (!non_negative(cfg.min_swing_interval_s))  return fail("min_swing_interval_s");

    const physical_constants_t& p = cfg.physics;
    if (!positive(p.lever_arm_m))          return fail("physics.lever_arm_m");
    if (!positive(p.effective_tip_mass))   return fail("physics.effective_tip_mass");
    if (!positive(p.racket_sensor_mass))   return fail("physics.racket_sensor_mass");
    if (!positive(p.shuttle_mass))         return fail("physics.shuttle_mass");
    if (!positive(p.shuttle_vs_tip_ratio)) return fail("physics.shuttle_vs_tip_ratio");
    if (!positive(p.contact_duration_s))   return fail("physics.contact_duration_s");
    if (!non_negative(p.incoming_speed_std)) return fail("physics.incoming_speed_std");
    return 0;
}
