#include "window_refiner.hpp"
#include <cmath>

int refine_window(size_t candidate_idx,
                  const std::vector<double>& gyro_magnitude,
                  const std::vector<double>& timestamps_s,
                  const window_samples_t& samples,
                  size_t min_samples,
                  analysis_window_t* dest) {
    const size_t n = gyro_magnitude.size();
    if(dest == nullptr || candidate_idx >= n || timestamps_s.size() != n) {
        return ANALYSIS_OUT_OF_RANGE;
    }

    // search range [s0, s1], inclusive; a zero radius keeps the candidate as is
    const size_t s0 = candidate_idx > samples.search_radius ? candidate_idx - samples.search_radius : 0;
    const size_t s1 = (n - 1 - candidate_idx) > samples.search_radius ? candidate_idx + samples.search_radius : n - 1;

    // first occurrence of the maximum wins
    size_t center = s0;
    double best = std::fabs(gyro_magnitude[s0]);
    for(size_t i = s0 + 1; i <= s1; i++) {
        const double v = std::fabs(gyro_magnitude[i]);
        if(v > best) {
            best = v;
            center = i;
        }
    }

    const size_t start = center > samples.pre_samples ? center - samples.pre_samples : 0;
    const size_t end = (n - center) > samples.post_samples ? center + samples.post_samples : n;
    if(end <= start || end - start < min_samples) {
        return ANALYSIS_INSUFFICIENT_DATA;
    }

    dest->start_idx = start;
    dest->end_idx = end;
    dest->center_idx = center;
    dest->impact_time_s = timestamps_s[center];
    return ANALYSIS_OK;
}
