#pragma once
#include <vector>

// effective sample rate from the timestamp span: (count - 1) / (t_last - t_first)
// falls back to nominal_rate_hz for fewer than 2 timestamps or a non-positive/non-finite span
double estimate_sample_rate(const std::vector<double>& timestamps_s, double nominal_rate_hz);
