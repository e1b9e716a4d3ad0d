/*
* REAL-TIME SWING ENGINE
sample -> history -> (every min_new_samples) -> candidates -> refined windows
       -> {spectral validation, metrics} -> emission gate -> zero or one swing_event_t
usage:
* construct with an engine_config_t (throws std::invalid_argument on a bad config)
* call ingest() for every sample, in timestamp order, from ONE thread
* an event comes back from the same ingest() call that triggered the analysis pass
notes:
- not thread-safe and not re-entrant; with several producers put a queue in front
  (ringBuffer_C) and let a single consumer thread own the engine
- the analysis cursor is a logical sequence id, so evictions never shift it
- diagnostics go to the injected event_sink_i (non-owning, may be nullptr)
*/
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "configs.hpp"
#include "emission_gate.hpp"
#include "event_sink.hpp"
#include "sample_history.hpp"
#include "spectral_transform.hpp"
#include "types.hpp"
#include "utils.hpp"

struct engine_stats_t {
    uint32_t hit_count = 0;          // swings emitted
    uint64_t total_passes = 0;
    uint64_t total_candidates = 0;
    uint64_t total_rejected = 0;     // spectral ratio at or below threshold
    uint64_t total_duplicates = 0;   // dropped by the gate's cooldown
    uint64_t total_degenerate = 0;   // flat or non-finite windows
    size_t buffer_size = 0;
};

class swing_engine {
public:
    explicit swing_engine(const engine_config_t& cfg = engine_config_t{},
                          event_sink_i* sink = nullptr,
                          const spectral_transform_i* transform = nullptr);

    std::optional<swing_event_t> ingest(const sensor_sample_t& sample);

    // back to the freshly constructed state (config, sink and transform are kept)
    void reset();

    engine_stats_t stats() const;
    const engine_config_t& config() const { return cfg_; }
    const sample_history& history() const { return history_; }
    gate_state_e gate_state() const { return gate_.state(); }

    // sequence id one past the newest sample the last pass covered (0 before any pass)
    uint64_t last_analyzed_seq() const { return last_analyzed_seq_; }
    // the same cursor as an offset into history(), floored at 0 and capped at size()
    size_t analyzed_offset() const;

private:
    std::optional<swing_event_t> run_pass();
    void emit(diag_kind_e kind, double t, double value, std::string detail = {});

    engine_config_t const cfg_;
    event_sink_i* sink_;
    const spectral_transform_i* transform_;
    sample_history history_;
    emission_gate gate_;
    uint64_t last_analyzed_seq_ = 0;
    bool in_pass_ = false;
    engine_stats_t stats_;
    sw_timer_t pass_timer_;

    // per-pass scratch, reused to avoid reallocating every 200 ms
    std::vector<sensor_sample_t> recent_;
    std::vector<double> timestamps_;
    std::vector<double> accel_mag_;
    std::vector<double> gyro_mag_;
    std::vector<double> mic_;
};
