#include "swing_engine.hpp"
#include <cassert>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>
#include "candidate_detector.hpp"
#include "rate_estimator.hpp"
#include "spectral_validator.hpp"
#include "swing_metrics.hpp"
#include "window_configs.hpp"
#include "window_refiner.hpp"

namespace {
const engine_config_t& checked(const engine_config_t& cfg) {
    std::string why;
    if (validate_engine_config(cfg, &why) != 0) {
        throw std::invalid_argument("swing_engine: " + why);
    }
    return cfg;
}

// marks a pass in progress; clears the flag and the pass timer even when the pass throws
class pass_scope {
public:
    pass_scope(bool& in_pass, sw_timer_t& timer) : in_pass_(in_pass), timer_(timer) {
        in_pass_ = true;
    }
    ~pass_scope() {
        timer_.stop_timer();
        in_pass_ = false;
    }
    pass_scope(const pass_scope&) = delete;
    pass_scope& operator=(const pass_scope&) = delete;

private:
    bool& in_pass_;
    sw_timer_t& timer_;
};

std::vector<double> slice(const std::vector<double>& v, const analysis_window_t& w) {
    return std::vector<double>(v.begin() + static_cast<std::ptrdiff_t>(w.start_idx),
                               v.begin() + static_cast<std::ptrdiff_t>(w.end_idx));
}
} // namespace

swing_engine::swing_engine(const engine_config_t& cfg, event_sink_i* sink, const spectral_transform_i* transform)
: cfg_(checked(cfg)),
  sink_(sink),
  transform_(transform ? transform : &default_spectral_transform()),
  history_(cfg.buffer_capacity),
  gate_(cfg.min_swing_interval_s) {
    recent_.reserve(cfg_.analysis_window_samples);
    timestamps_.reserve(cfg_.analysis_window_samples);
    accel_mag_.reserve(cfg_.analysis_window_samples);
    gyro_mag_.reserve(cfg_.analysis_window_samples);
    mic_.reserve(cfg_.analysis_window_samples);
}

std::optional<swing_event_t> swing_engine::ingest(const sensor_sample_t& sample) {
    history_.push(sample);
    gate_.advance(sample.timestamp_s);

    if (history_.size() < cfg_.analysis_window_samples) {
        return std::nullopt;
    }
    assert(last_analyzed_seq_ <= history_.next_seq());
    if (history_.next_seq() - last_analyzed_seq_ < cfg_.min_new_samples) {
        return std::nullopt;
    }

    assert(!in_pass_);
    // these samples are consumed even if a sink throws out of the pass
    last_analyzed_seq_ = history_.next_seq();
    pass_scope scope(in_pass_, pass_timer_);
    return run_pass();
}

std::optional<swing_event_t> swing_engine::run_pass() {
    pass_timer_.start_timer();

    history_.copy_recent(cfg_.analysis_window_samples, &recent_);
    timestamps_.clear();
    accel_mag_.clear();
    gyro_mag_.clear();
    mic_.clear();
    for (const sensor_sample_t& s : recent_) {
        timestamps_.push_back(s.timestamp_s);
        accel_mag_.push_back(s.accel_magnitude());
        gyro_mag_.push_back(s.gyro_magnitude());
        mic_.push_back(s.mic_rms);
    }

    // all second-based parameters follow this pass's rate estimate
    const double fs = estimate_sample_rate(timestamps_, cfg_.nominal_rate_hz);
    const window_samples_t ws = make_window_samples(cfg_, fs);

    double threshold = 0.0;
    const std::vector<size_t> candidates = find_candidates(accel_mag_, cfg_.threshold_std_mult, ws.min_separation, &threshold);
    stats_.total_candidates += candidates.size();
    if (!candidates.empty()) {
        std::ostringstream d;
        d << "threshold=" << threshold << " fs=" << fs;
        emit(DIAG_CANDIDATES_FOUND, timestamps_.back(), static_cast<double>(candidates.size()), d.str());
    }

    std::optional<swing_event_t> result;
    for (size_t c : candidates) {
        analysis_window_t win{};
        if (refine_window(c, gyro_mag_, timestamps_, ws, cfg_.min_refined_samples, &win) != ANALYSIS_OK) {
            continue; // too short near the edge of the pass, not a swing (yet)
        }

        const std::vector<double> win_acc = slice(accel_mag_, win);
        const std::vector<double> win_gyro = slice(gyro_mag_, win);
        const std::vector<double> win_mic = slice(mic_, win);

        validation_result_t vr{};
        int rc = validate_swing_window(win_mic, win_gyro, fs, cfg_.power_ratio_threshold, *transform_, &vr);
        swing_event_t ev{};
        if (rc == ANALYSIS_OK) {
            rc = compute_swing_metrics(win, win_acc, win_gyro, vr, fs, cfg_.physics, &ev);
        }
        if (rc == ANALYSIS_DEGENERATE_SIGNAL) {
            stats_.total_degenerate++;
            emit(DIAG_DEGENERATE_WINDOW, win.impact_time_s, static_cast<double>(rc), status_to_string(rc));
            continue;
        }
        if (rc != ANALYSIS_OK) {
            continue;
        }

        if (!vr.is_valid) {
            stats_.total_rejected++;
            std::ostringstream d;
            d << "mic_power=" << vr.mic_power << " gyro_power=" << vr.gyro_power
              << " threshold=" << cfg_.power_ratio_threshold;
            emit(DIAG_WINDOW_REJECTED, win.impact_time_s, vr.ratio, d.str());
            continue;
        }

        gate_decision_e decision = gate_decision_e::DroppedInvalid;
        std::optional<swing_event_t> admitted = gate_.admit(ev, &decision);
        if (!admitted) {
            if (decision == gate_decision_e::DroppedCooldown) {
                stats_.total_duplicates++;
                emit(DIAG_DUPLICATE_SUPPRESSED, ev.timestamp_s, gate_.seconds_since_accepted(ev.timestamp_s));
            } else {
                stats_.total_rejected++;
                emit(DIAG_WINDOW_REJECTED, ev.timestamp_s, vr.ratio, "non-positive metrics");
            }
            continue;
        }

        stats_.hit_count++;
        admitted->hit_index = stats_.hit_count;
        std::ostringstream d;
        d << std::fixed << std::setprecision(2)
          << "hit #" << admitted->hit_index
          << " mic/gyro=" << admitted->power_ratio
          << " a_max=" << std::setprecision(1) << admitted->peak_acceleration << " m/s^2"
          << " F_impact=" << admitted->impact_force << " N"
          << " F_shuttle=" << admitted->shuttle_force_actual << " N"
          << " F_std=" << admitted->shuttle_force_std << " N";
        emit(DIAG_SWING_ACCEPTED, admitted->timestamp_s, admitted->peak_tip_speed, d.str());

        // one event per ingest; anything later in this pass is seen again next pass
        result = admitted;
        break;
    }

    stats_.total_passes++;
    const auto took = pass_timer_.stop_timer();
    if (cfg_.perf_log_every > 0 && stats_.total_passes % cfg_.perf_log_every == 0) {
        std::ostringstream d;
        d << "pass #" << stats_.total_passes << " detections=" << stats_.hit_count << " buffer=" << history_.size();
        emit(DIAG_PASS_COMPLETED, timestamps_.back(), static_cast<double>(took.count()) / 1000.0, d.str());
    }
    return result;
}

void swing_engine::emit(diag_kind_e kind, double t, double value, std::string detail) {
    if (sink_ == nullptr) {
        return;
    }
    sink_->on_event(diag_event_t{kind, t, value, std::move(detail)});
}

void swing_engine::reset() {
    history_.clear();
    gate_.reset();
    last_analyzed_seq_ = 0;
    stats_ = engine_stats_t{};
}

engine_stats_t swing_engine::stats() const {
    engine_stats_t s = stats_;
    s.buffer_size = history_.size();
    return s;
}

size_t swing_engine::analyzed_offset() const {
    const uint64_t oldest = history_.oldest_seq();
    if (last_analyzed_seq_ <= oldest) {
        return 0;
    }
    const uint64_t off = last_analyzed_seq_ - oldest;
    assert(off <= history_.size());
    return static_cast<size_t>(off);
}
