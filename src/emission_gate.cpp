#include "emission_gate.hpp"
#include "swing_metrics.hpp"

emission_gate::emission_gate(double min_interval_s)
: min_interval_s_(min_interval_s) {}

void emission_gate::advance(double now_s) {
    if(state_ == gate_state_e::Cooldown && now_s - last_accepted_s_ >= min_interval_s_) {
        state_ = gate_state_e::Idle;
    }
}

std::optional<swing_event_t> emission_gate::admit(const swing_event_t& candidate, gate_decision_e* decision) {
    advance(candidate.timestamp_s);

    if(!is_valid_swing(candidate)) {
        if(decision) *decision = gate_decision_e::DroppedInvalid;
        return std::nullopt;
    }

    // checked against the last accepted time rather than state_ alone, so an older
    // re-detection arriving after the clock moved on is still dropped
    if(has_accepted_ && candidate.timestamp_s - last_accepted_s_ < min_interval_s_) {
        if(decision) *decision = gate_decision_e::DroppedCooldown;
        return std::nullopt;
    }

    has_accepted_ = true;
    last_accepted_s_ = candidate.timestamp_s;
    state_ = gate_state_e::Cooldown;
    if(decision) *decision = gate_decision_e::Accepted;
    return candidate;
}

void emission_gate::reset() {
    state_ = gate_state_e::Idle;
    has_accepted_ = false;
    last_accepted_s_ = 0.0;
}
