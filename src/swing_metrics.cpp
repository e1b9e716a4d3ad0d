#include "swing_metrics.hpp"
#include <cmath>
#include "utils.hpp"

namespace {
// quality gate limits
constexpr double QG_MIN_OMEGA_RAD_S = 3.0;
constexpr double QG_MAX_TIP_SPEED   = 50.0;
constexpr double QG_MAX_FORCE_N     = 1000.0;
constexpr double QG_MIN_DURATION_MS = 100.0;
constexpr double QG_MAX_DURATION_MS = 1500.0;
} // namespace

int compute_swing_metrics(const analysis_window_t& window,
                          const std::vector<double>& accel_window,
                          const std::vector<double>& gyro_window,
                          const validation_result_t& validation,
                          double sample_rate_hz,
                          const physical_constants_t& physics,
                          swing_event_t* dest) {
    if (dest == nullptr || window.end_idx < window.start_idx
        || accel_window.size() != window.length() || gyro_window.size() != window.length()) {
        return ANALYSIS_OUT_OF_RANGE;
    }
    if (window.length() == 0) {
        return ANALYSIS_INSUFFICIENT_DATA;
    }
    if (!series_all_finite(accel_window) || !series_all_finite(gyro_window)
        || !(sample_rate_hz > 0.0) || !std::isfinite(sample_rate_hz)) {
        return ANALYSIS_DEGENERATE_SIGNAL;
    }

    // 1) swing speed from the gyro peak
    double max_gyro_deg = 0.0;
    for (double g : gyro_window) {
        const double a = std::fabs(g);
        if (a > max_gyro_deg) {
            max_gyro_deg = a;
        }
    }
    const double omega = max_gyro_deg * DEG_TO_RAD;
    const double tip_speed = omega * physics.lever_arm_m;

    // 2) impact acceleration, DC removed, g -> m/s^2
    const double acc_mean = series_mean(accel_window);
    double max_dev_g = 0.0;
    for (double a : accel_window) {
        const double d = std::fabs(a - acc_mean);
        if (d > max_dev_g) {
            max_dev_g = d;
        }
    }
    const double accel_ms2 = max_dev_g * G_TO_MS2;

    // 3) forces
    const double shuttle_out = physics.shuttle_vs_tip_ratio * tip_speed;

    swing_event_t ev{};
    ev.timestamp_s = window.impact_time_s;
    ev.peak_angular_velocity = omega;
    ev.peak_tip_speed = tip_speed;
    ev.peak_acceleration = accel_ms2;
    ev.impact_force = physics.effective_tip_mass * accel_ms2;
    ev.swing_force = physics.racket_sensor_mass * accel_ms2;
    ev.shuttle_speed_out = shuttle_out;
    ev.shuttle_force_actual = physics.shuttle_mass * shuttle_out / physics.contact_duration_s;
    ev.shuttle_force_std = physics.shuttle_mass * (shuttle_out + physics.incoming_speed_std) / physics.contact_duration_s;
    ev.duration_ms = static_cast<double>(window.length()) / sample_rate_hz * 1000.0;
    ev.power_ratio = validation.ratio;
    ev.is_valid = validation.is_valid;
    ev.hit_index = 0;

    if (!std::isfinite(ev.shuttle_force_std) || !std::isfinite(ev.impact_force) || !std::isfinite(ev.power_ratio)) {
        return ANALYSIS_DEGENERATE_SIGNAL;
    }
    *dest = ev;
    return ANALYSIS_OK;
}

bool is_valid_swing(const swing_event_t& ev) {
    return ev.is_valid
        && ev.peak_tip_speed > 0.0
        && ev.peak_acceleration > 0.0
        && ev.impact_force > 0.0;
}

bool passes_quality_gates(const swing_event_t& ev) {
    return ev.peak_angular_velocity >= QG_MIN_OMEGA_RAD_S
        && ev.peak_tip_speed < QG_MAX_TIP_SPEED
        && ev.impact_force < QG_MAX_FORCE_N
        && ev.duration_ms >= QG_MIN_DURATION_MS
        && ev.duration_ms <= QG_MAX_DURATION_MS;
}
