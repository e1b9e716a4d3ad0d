#pragma once
#include <string>

enum diag_kind_e {
    DIAG_PASS_COMPLETED,       // value = pass duration (ms), every perf_log_every passes
    DIAG_CANDIDATES_FOUND,     // value = candidate count in this pass
    DIAG_WINDOW_REJECTED,      // value = power ratio below threshold
    DIAG_DEGENERATE_WINDOW,    // value = status code; window skipped
    DIAG_DUPLICATE_SUPPRESSED, // value = seconds since the last accepted swing
    DIAG_SWING_ACCEPTED,       // value = peak tip speed (m/s)
};

const char* diag_kind_to_string(diag_kind_e kind);

struct diag_event_t {
    diag_kind_e kind;
    double timestamp_s; // sample time the event refers to
    double value;
    std::string detail;
};

// receives the engine's diagnostics; called synchronously from ingest(), must not call back into the engine
class event_sink_i {
public:
    virtual ~event_sink_i() = default;
    virtual void on_event(const diag_event_t& ev) = 0;
};

class null_event_sink : public event_sink_i {
public:
    void on_event(const diag_event_t&) override {}
};

// accepted swings via LOG_ALWAYS, everything else via LOG_DBG (VERBOSE=1 to see it)
class log_event_sink : public event_sink_i {
public:
    void on_event(const diag_event_t& ev) override;
};
