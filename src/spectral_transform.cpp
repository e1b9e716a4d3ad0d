#include "spectral_transform.hpp"
#include "types.hpp"

kissfft_transform::~kissfft_transform() {
    for (auto& entry : real_plans_) {
        if (entry.second) {
            kiss_fftr_free(entry.second);
        }
    }
    for (auto& entry : complex_plans_) {
        if (entry.second) {
            kiss_fft_free(entry.second);
        }
    }
}

kiss_fftr_cfg kissfft_transform::real_plan(size_t n) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = real_plans_.emplace(n, nullptr);
    if (inserted || it->second == nullptr) {
        it->second = kiss_fftr_alloc(static_cast<int>(n), 0, nullptr, nullptr);
    }
    return it->second;
}

kiss_fft_cfg kissfft_transform::complex_plan(size_t n) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = complex_plans_.emplace(n, nullptr);
    if (inserted || it->second == nullptr) {
        it->second = kiss_fft_alloc(static_cast<int>(n), 0, nullptr, nullptr);
    }
    return it->second;
}

int kissfft_transform::forward_real(const std::vector<double>& in, std::vector<std::complex<double>>* out) const {
    const size_t n = in.size();
    if (out == nullptr || n == 0) {
        return ANALYSIS_INSUFFICIENT_DATA;
    }
    const size_t bins = n / 2 + 1;

    std::vector<kiss_fft_cpx> spectrum(n % 2 == 0 ? bins : n);
    if (n % 2 == 0) {
        kiss_fftr_cfg cfg = real_plan(n);
        if (cfg == nullptr) {
            return ANALYSIS_OUT_OF_RANGE;
        }
        std::vector<kiss_fft_scalar> buf(n);
        for (size_t t = 0; t < n; t++) {
            buf[t] = static_cast<kiss_fft_scalar>(in[t]);
        }
        kiss_fftr(cfg, buf.data(), spectrum.data());
    } else {
        // kiss_fftr only takes even lengths; clamped windows can be odd
        kiss_fft_cfg cfg = complex_plan(n);
        if (cfg == nullptr) {
            return ANALYSIS_OUT_OF_RANGE;
        }
        std::vector<kiss_fft_cpx> buf(n);
        for (size_t t = 0; t < n; t++) {
            buf[t].r = static_cast<kiss_fft_scalar>(in[t]);
            buf[t].i = 0;
        }
        kiss_fft(cfg, buf.data(), spectrum.data());
    }

    out->resize(bins);
    for (size_t k = 0; k < bins; k++) {
        (*out)[k] = std::complex<double>(spectrum[k].r, spectrum[k].i);
    }
    return 0;
}

const spectral_transform_i& default_spectral_transform() {
    static const kissfft_transform instance;
    return instance;
}
