#include "spectral_validator.hpp"
#include <cmath>
#include <complex>
#include "configs.hpp"
#include "utils.hpp"

namespace {
constexpr double PI = 3.14159265358979323846;

// stddev this small against the signal level means the channel carries no information
bool is_flat(const std::vector<double>& signal, double mean) {
    const double sd = series_pstddev(signal, mean);
    const double scale = std::fabs(mean) > 1.0 ? std::fabs(mean) : 1.0;
    return sd <= 1e-12 * scale;
}
} // namespace

double hann_weight(size_t i, size_t n) {
    if (n < 2) {
        return 1.0;
    }
    return 0.5 * (1.0 - std::cos(2.0 * PI * static_cast<double>(i) / static_cast<double>(n - 1)));
}

int compute_spectral_features(const std::vector<double>& signal,
                              double sample_rate_hz,
                              const spectral_transform_i& transform,
                              spectral_features_t* dest) {
    if (dest == nullptr) {
        return ANALYSIS_OUT_OF_RANGE;
    }
    const size_t n = signal.size();
    if (n < SPECTRAL_MIN_SAMPLES) {
        return ANALYSIS_INSUFFICIENT_DATA;
    }
    if (!series_all_finite(signal) || !(sample_rate_hz > 0.0) || !std::isfinite(sample_rate_hz)) {
        return ANALYSIS_DEGENERATE_SIGNAL;
    }
    const double mean = series_mean(signal);
    if (is_flat(signal, mean)) {
        return ANALYSIS_DEGENERATE_SIGNAL;
    }

    std::vector<double> windowed(n);
    for (size_t i = 0; i < n; i++) {
        windowed[i] = (signal[i] - mean) * hann_weight(i, n);
    }

    std::vector<std::complex<double>> bins;
    const int rc = transform.forward_real(windowed, &bins);
    if (rc != 0) {
        return rc;
    }

    dest->frequencies.clear();
    dest->magnitudes.clear();
    dest->power.clear();
    dest->frequencies.reserve(bins.size());
    dest->magnitudes.reserve(bins.size());
    dest->power.reserve(bins.size());
    dest->total_power = 0.0;
    for (size_t k = 0; k < bins.size(); k++) {
        const double mag = std::abs(bins[k]);
        dest->frequencies.push_back(static_cast<double>(k) * sample_rate_hz / static_cast<double>(n));
        dest->magnitudes.push_back(mag);
        dest->power.push_back(mag * mag);
        dest->total_power += mag * mag;
    }

    if (!std::isfinite(dest->total_power)) {
        return ANALYSIS_DEGENERATE_SIGNAL;
    }
    return ANALYSIS_OK;
}

double peak_frequency_hz(const spectral_features_t& features) {
    if (features.power.empty() || features.power.size() != features.frequencies.size()) {
        return 0.0;
    }
    size_t best = 0;
    for (size_t k = 1; k < features.power.size(); k++) {
        if (features.power[k] > features.power[best]) {
            best = k;
        }
    }
    return features.frequencies[best];
}

int validate_swing_window(const std::vector<double>& mic_window,
                          const std::vector<double>& gyro_window,
                          double sample_rate_hz,
                          double ratio_threshold,
                          const spectral_transform_i& transform,
                          validation_result_t* dest) {
    if (dest == nullptr) {
        return ANALYSIS_OUT_OF_RANGE;
    }
    *dest = validation_result_t{};
    if (mic_window.size() != gyro_window.size()) {
        return ANALYSIS_OUT_OF_RANGE;
    }

    spectral_features_t mic{};
    spectral_features_t gyro{};
    int rc = compute_spectral_features(mic_window, sample_rate_hz, transform, &mic);
    if (rc != ANALYSIS_OK) {
        return rc;
    }
    rc = compute_spectral_features(gyro_window, sample_rate_hz, transform, &gyro);
    if (rc != ANALYSIS_OK) {
        return rc;
    }

    dest->mic_power = mic.total_power;
    dest->gyro_power = gyro.total_power;
    dest->ratio = mic.total_power / (gyro.total_power + POWER_RATIO_EPS);
    dest->is_valid = dest->ratio > ratio_threshold;
    return ANALYSIS_OK;
}
