#pragma once
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

// status codes returned by the analysis stages (0 = ok, negative = no result)
enum analysis_status_e {
    ANALYSIS_OK = 0,
    ANALYSIS_INSUFFICIENT_DATA = -1, // window/buffer shorter than the required minimum
    ANALYSIS_DEGENERATE_SIGNAL = -2, // zero variance or NaN/Inf in a channel
    ANALYSIS_OUT_OF_RANGE = -3,      // index outside the series it refers to
};

inline const char* status_to_string(int status) {
    switch (status) {
        case ANALYSIS_OK:                return "ok";
        case ANALYSIS_INSUFFICIENT_DATA: return "insufficient data";
        case ANALYSIS_DEGENERATE_SIGNAL: return "degenerate signal";
        case ANALYSIS_OUT_OF_RANGE:      return "out of range";
        default:                         return "unknown";
    }
}

// one record from the racket sensor, as delivered by the transport layer
struct sensor_sample_t {
    double timestamp_s; // monotonic, non-decreasing
    double ax;          // g
    double ay;
    double az;
    double gx;          // deg/s
    double gy;
    double gz;
    double mic_rms;     // raw scalar

    double accel_magnitude() const { return std::sqrt(ax * ax + ay * ay + az * az); }
    double gyro_magnitude() const { return std::sqrt(gx * gx + gy * gy + gz * gz); }
};

// indices are relative to the series the window was carved from; end is exclusive
struct analysis_window_t {
    size_t start_idx;
    size_t end_idx;
    size_t center_idx;
    double impact_time_s;

    size_t length() const { return end_idx - start_idx; }
};

// one-sided spectrum of a single channel over one window
struct spectral_features_t {
    std::vector<double> frequencies; // Hz, k * fs / N
    std::vector<double> magnitudes;
    std::vector<double> power;       // magnitude^2
    double total_power = 0.0;
};

struct validation_result_t {
    double mic_power = 0.0;
    double gyro_power = 0.0;
    double ratio = 0.0;   // mic_power / (gyro_power + eps)
    bool is_valid = false;
};

// the engine's only durable output; handed to the caller by value
struct swing_event_t {
    double timestamp_s;           // impact time of the refined window
    double peak_angular_velocity; // rad/s
    double peak_tip_speed;        // m/s
    double peak_acceleration;     // m/s^2, DC removed
    double impact_force;          // N, effective tip mass
    double swing_force;           // N, racket + sensor mass
    double shuttle_speed_out;     // m/s
    double shuttle_force_actual;  // N
    double shuttle_force_std;     // N, with the standard incoming speed
    double duration_ms;
    double power_ratio;           // mic / gyro spectral power
    bool is_valid;                // power_ratio > threshold
    uint32_t hit_index;           // 1-based within the session, 0 until emitted
};
