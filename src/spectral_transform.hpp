/*
* REAL-INPUT SPECTRAL TRANSFORM
- forward_real() writes the N/2 + 1 non-negative-frequency bins of the unnormalised DFT
  X[k] = sum_n x[n] * exp(-2*pi*i*k*n/N); bin k sits at k * fs / N (no zero padding)
- any implementation may scale its output by a constant: the validator only compares two
  channels transformed by the same instance, so the constant cancels in the ratio
*/
#pragma once
#include <complex>
#include <cstddef>
#include <mutex>
#include <unordered_map>
#include <vector>
#include <kiss_fft.h>
#include <kiss_fftr.h>

class spectral_transform_i {
public:
    virtual ~spectral_transform_i() = default;
    // returns 0 on success, negative on failure (empty input, plan allocation)
    virtual int forward_real(const std::vector<double>& in, std::vector<std::complex<double>>* out) const = 0;
};

// KissFFT backed: kiss_fftr for even lengths, complex kiss_fft (zero imaginary part) for odd ones.
// Plans are allocated once per length and kept; forward_real() is safe to call from several threads.
class kissfft_transform : public spectral_transform_i {
public:
    kissfft_transform() = default;
    ~kissfft_transform() override;
    kissfft_transform(const kissfft_transform&) = delete;
    kissfft_transform& operator=(const kissfft_transform&) = delete;

    int forward_real(const std::vector<double>& in, std::vector<std::complex<double>>* out) const override;

private:
    kiss_fftr_cfg real_plan(size_t n) const;
    kiss_fft_cfg complex_plan(size_t n) const;

    mutable std::mutex mutex_;
    mutable std::unordered_map<size_t, kiss_fftr_cfg> real_plans_;
    mutable std::unordered_map<size_t, kiss_fft_cfg> complex_plans_;
};

// process-wide default instance
const spectral_transform_i& default_spectral_transform();
