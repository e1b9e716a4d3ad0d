/*
* STROKE CANDIDATE DETECTOR
- adaptive threshold on |d/dt accel magnitude|: threshold = mean + k * population stddev
- a sample i is a candidate when |x[i] - x[i-1]| exceeds the threshold, is >= both derivative
  neighbours and lies at least min_separation samples after the previous candidate
- candidates are provisional; they still need refinement and spectral validation
*/
#pragma once
#include <cstddef>
#include <vector>

// absolute backward difference aligned to the later sample: out[i-1] = |x[i] - x[i-1]|, size n-1
std::vector<double> abs_first_difference(const std::vector<double>& series);

// returns candidate sample indices into accel_magnitude, ascending
// fewer than 3 samples -> no candidates; *threshold_out (optional) receives the threshold used
std::vector<size_t> find_candidates(const std::vector<double>& accel_magnitude,
                                    double threshold_std_mult,
                                    size_t min_separation,
                                    double* threshold_out = nullptr);
