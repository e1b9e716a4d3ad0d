#include "rate_estimator.hpp"
#include <cmath>

double estimate_sample_rate(const std::vector<double>& timestamps_s, double nominal_rate_hz) {
    if(timestamps_s.size() <= 1) {
        return nominal_rate_hz;
    }
    const double duration = timestamps_s.back() - timestamps_s.front();
    if(!(duration > 0.0) || !std::isfinite(duration)) {
        return nominal_rate_hz;
    }
    return static_cast<double>(timestamps_s.size() - 1) / duration;
}
