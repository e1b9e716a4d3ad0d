/*
* DETERMINISTIC SYNTHETIC SENSOR STREAM (MOCK PRODUCER / TESTS)
baseline: still racket, az = 1 g, gyro = 0, mic = 0, plus optional sensor noise:
* accel/gyro -> gaussian per axis; mic -> |gaussian| (an rms level is never negative)
each swing centred on sample c = round(center_s * rate):
* gyro  -> gx half-sine over [c - H, c + H], H = round(0.15 s * rate); gx(c) == gyro_peak_dps exactly
* accel -> az triangle bump over c-2..c+2 peaking at +accel_peak_g
* mic   -> triangle transient over c-2..c+2 peaking at mic_peak (0 = practice swing, no impact)
*/
#pragma once
#include <cstdint>
#include <random>
#include <vector>
#include "types.hpp"

struct synthetic_swing_t {
    double center_s;
    double gyro_peak_dps = 300.0;
    double accel_peak_g = 6.0;
    double mic_peak = 100000.0;
};

// per-sample noise sigmas; 0 disables a channel
struct synthetic_noise_t {
    double accel_g = 0.0;
    double gyro_dps = 0.0;
    double mic = 0.0;
};

class synthetic_stream {
public:
    synthetic_stream(double rate_hz, std::vector<synthetic_swing_t> swings,
                     synthetic_noise_t noise = {}, uint32_t seed = 1);

    // sample i of the stream; noise is drawn in call order, so call with increasing i
    sensor_sample_t next();
    uint64_t position() const { return index_; }
    double rate_hz() const { return rate_hz_; }

private:
    double const rate_hz_;
    std::vector<synthetic_swing_t> swings_;
    synthetic_noise_t const noise_sigma_;
    std::mt19937 rng_;
    std::normal_distribution<double> noise_{0.0, 1.0};
    uint64_t index_ = 0;
};

// convenience: the first n samples of a stream
std::vector<sensor_sample_t> make_synthetic_session(double rate_hz, size_t n,
                                                    const std::vector<synthetic_swing_t>& swings,
                                                    synthetic_noise_t noise = {}, uint32_t seed = 1);
