#include "candidate_detector.hpp"
#include <cmath>
#include "utils.hpp"

std::vector<double> abs_first_difference(const std::vector<double>& series) {
    std::vector<double> out;
    if(series.size() < 2) {
        return out;
    }
    out.reserve(series.size() - 1);
    for(size_t i = 1; i < series.size(); i++) {
        out.push_back(std::fabs(series[i] - series[i - 1]));
    }
    return out;
}

std::vector<size_t> find_candidates(const std::vector<double>& accel_magnitude,
                                    double threshold_std_mult,
                                    size_t min_separation,
                                    double* threshold_out) {
    std::vector<size_t> peaks;
    if(accel_magnitude.size() < 3) {
        if(threshold_out) {
            *threshold_out = 0.0;
        }
        return peaks;
    }

    const std::vector<double> dacc = abs_first_difference(accel_magnitude);
    const double mean = series_mean(dacc);
    const double threshold = mean + threshold_std_mult * series_pstddev(dacc, mean);
    if(threshold_out) {
        *threshold_out = threshold;
    }

    // interior derivative points only, both neighbours must exist
    for(size_t j = 1; j + 1 < dacc.size(); j++) {
        if(!(dacc[j] > threshold) || dacc[j] < dacc[j - 1] || dacc[j] < dacc[j + 1]) {
            continue;
        }
        const size_t sample_idx = j + 1; // dacc[j] is the step into sample j+1
        if(!peaks.empty() && sample_idx - peaks.back() < min_separation) {
            continue;
        }
        peaks.push_back(sample_idx);
    }
    return peaks;
}
