/*
* EMISSION GATE (DUPLICATE SUPPRESSOR)
states:
* Idle     -> no accepted swing within min_interval_s
* Cooldown -> within min_interval_s of the last ACCEPTED swing
- a valid candidate is admitted only if its impact time is at least min_interval_s after the
  last accepted one; admission moves Idle -> Cooldown and restarts the clock
- candidates dropped during Cooldown do not touch the clock: they are re-detections of the
  accepted swing from overlapping passes, and must not extend the suppression
- time is sample time (timestamps of the stream), never wall-clock
*/
#pragma once
#include <optional>
#include "types.hpp"

enum class gate_state_e {
    Idle,
    Cooldown,
};

enum class gate_decision_e {
    Accepted,
    DroppedInvalid,  // failed is_valid_swing()
    DroppedCooldown, // too close to the last accepted swing
};

class emission_gate {
public:
    explicit emission_gate(double min_interval_s);

    // Cooldown -> Idle once now_s is min_interval_s past the last accepted swing
    void advance(double now_s);

    std::optional<swing_event_t> admit(const swing_event_t& candidate, gate_decision_e* decision = nullptr);

    void reset();

    gate_state_e state() const { return state_; }
    bool has_accepted() const { return has_accepted_; }
    double last_accepted_time() const { return last_accepted_s_; }
    // seconds from the last accepted swing to t (negative if t is older); 0 before any acceptance
    double seconds_since_accepted(double t) const { return has_accepted_ ? t - last_accepted_s_ : 0.0; }

private:
    double const min_interval_s_;
    gate_state_e state_ = gate_state_e::Idle;
    bool has_accepted_ = false;
    double last_accepted_s_ = 0.0;
};
