#pragma once
#include <vector>
#include "configs.hpp"
#include "types.hpp"

// Turns one validated window into physical quantities.
// accel_window: |accel| in g, gyro_window: |gyro| in deg/s, both window.length() long.
// Returns ANALYSIS_OUT_OF_RANGE on a size mismatch, ANALYSIS_INSUFFICIENT_DATA for an empty
// window, ANALYSIS_DEGENERATE_SIGNAL if any input or result is non-finite.
int compute_swing_metrics(const analysis_window_t& window,
                          const std::vector<double>& accel_window,
                          const std::vector<double>& gyro_window,
                          const validation_result_t& validation,
                          double sample_rate_hz,
                          const physical_constants_t& physics,
                          swing_event_t* dest);

// flag set and all headline metrics positive; the emission gate only admits these
bool is_valid_swing(const swing_event_t& ev);

// plausibility ranges for a real stroke; advisory only, never used to drop an event
bool passes_quality_gates(const swing_event_t& ev);

inline double tip_speed_kmh(const swing_event_t& ev) { return ev.peak_tip_speed * 3.6; }
