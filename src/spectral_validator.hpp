/*
* SPECTRAL VALIDATOR (IMPACT VS PRACTICE SWING)
per channel: remove DC -> Hann window -> real transform -> power = |X[k]|^2 -> total power
ratio = mic_power / (gyro_power + eps); valid when ratio > threshold
- a shuttle impact is a sharp broadband acoustic transient, large against the smooth
  rotational energy of the same window; a practice swing has no such spike
- windows of <= 4 samples are ANALYSIS_INSUFFICIENT_DATA
- a channel with NaN/Inf or zero variance is ANALYSIS_DEGENERATE_SIGNAL (checked before the transform)
*/
#pragma once
#include <vector>
#include "types.hpp"
#include "spectral_transform.hpp"

inline constexpr size_t SPECTRAL_MIN_SAMPLES = 5;

// Hann weight for index i of an n-point window (symmetric, zero at both ends)
double hann_weight(size_t i, size_t n);

int compute_spectral_features(const std::vector<double>& signal,
                              double sample_rate_hz,
                              const spectral_transform_i& transform,
                              spectral_features_t* dest);

// frequency of the highest-power bin; 0 for an empty spectrum
double peak_frequency_hz(const spectral_features_t& features);

int validate_swing_window(const std::vector<double>& mic_window,
                          const std::vector<double>& gyro_window,
                          double sample_rate_hz,
                          double ratio_threshold,
                          const spectral_transform_i& transform,
                          validation_result_t* dest);
