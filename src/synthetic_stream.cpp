#include "synthetic_stream.hpp"
#include <cmath>
#include <utility>

namespace {
constexpr double PI = 3.14159265358979323846;
constexpr double GYRO_HALF_WIDTH_SEC = 0.15;
constexpr int64_t BUMP_HALF_WIDTH = 2; // samples either side of the centre
} // namespace

synthetic_stream::synthetic_stream(double rate_hz, std::vector<synthetic_swing_t> swings,
                                   synthetic_noise_t noise, uint32_t seed)
: rate_hz_(rate_hz > 0.0 ? rate_hz : 100.0),
  swings_(std::move(swings)),
  noise_sigma_(noise),
  rng_(seed) {}

sensor_sample_t synthetic_stream::next() {
    const int64_t i = static_cast<int64_t>(index_);
    sensor_sample_t s{};
    s.timestamp_s = static_cast<double>(i) / rate_hz_;
    s.az = 1.0;

    const int64_t half = static_cast<int64_t>(std::llround(GYRO_HALF_WIDTH_SEC * rate_hz_));
    for (const synthetic_swing_t& sw : swings_) {
        const int64_t c = static_cast<int64_t>(std::llround(sw.center_s * rate_hz_));
        const int64_t off = i - c;

        if (half > 0 && off >= -half && off <= half) {
            const double phase = PI * static_cast<double>(off + half) / static_cast<double>(2 * half);
            // exact peak at the centre rather than sin(pi/2) rounding
            s.gx += (off == 0) ? sw.gyro_peak_dps : sw.gyro_peak_dps * std::sin(phase);
        }
        if (off >= -BUMP_HALF_WIDTH && off <= BUMP_HALF_WIDTH) {
            const double shape = 1.0 - static_cast<double>(off < 0 ? -off : off) / static_cast<double>(BUMP_HALF_WIDTH + 1);
            s.az += sw.accel_peak_g * shape;
            s.mic_rms += sw.mic_peak * shape;
        }
    }

    if (noise_sigma_.accel_g > 0.0) {
        s.ax += noise_sigma_.accel_g * noise_(rng_);
        s.ay += noise_sigma_.accel_g * noise_(rng_);
        s.az += noise_sigma_.accel_g * noise_(rng_);
    }
    if (noise_sigma_.gyro_dps > 0.0) {
        s.gx += noise_sigma_.gyro_dps * noise_(rng_);
        s.gy += noise_sigma_.gyro_dps * noise_(rng_);
        s.gz += noise_sigma_.gyro_dps * noise_(rng_);
    }
    if (noise_sigma_.mic > 0.0) {
        s.mic_rms += noise_sigma_.mic * std::fabs(noise_(rng_));
    }
    index_++;
    return s;
}

std::vector<sensor_sample_t> make_synthetic_session(double rate_hz, size_t n,
                                                    const std::vector<synthetic_swing_t>& swings,
                                                    synthetic_noise_t noise, uint32_t seed) {
    synthetic_stream stream(rate_hz, swings, noise, seed);
    std::vector<sensor_sample_t> out;
    out.reserve(n);
    for (size_t k = 0; k < n; k++) {
        out.push_back(stream.next());
    }
    return out;
}
