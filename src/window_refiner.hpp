#pragma once
#include <cstddef>
#include <vector>
#include "types.hpp"
#include "window_configs.hpp"

// Snaps a candidate to the largest |gyro| within +/- search_radius samples, then carves
// [center - pre_samples, center + post_samples) clamped to the series (never wrapped).
// Returns ANALYSIS_OK and fills *dest, ANALYSIS_INSUFFICIENT_DATA if the clamped window is
// shorter than min_samples, or ANALYSIS_OUT_OF_RANGE for a candidate outside the series.
int refine_window(size_t candidate_idx,
                  const std::vector<double>& gyro_magnitude,
                  const std::vector<double>& timestamps_s,
                  const window_samples_t& samples,
                  size_t min_samples,
                  analysis_window_t* dest);
