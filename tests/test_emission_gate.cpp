#include <gtest/gtest.h>
#include <optional>
#include "emission_gate.hpp"

namespace {
swing_event_t swing_at(double t, bool valid = true) {
    swing_event_t ev{};
    ev.timestamp_s = t;
    ev.is_valid = valid;
    ev.peak_angular_velocity = 5.0;
    ev.peak_tip_speed = 2.0;
    ev.peak_acceleration = 40.0;
    ev.impact_force = 6.0;
    ev.duration_ms = 600.0;
    return ev;
}
} // namespace

TEST(EmissionGate, StartsIdle) {
    emission_gate g(0.5);
    EXPECT_EQ(g.state(), gate_state_e::Idle);
    EXPECT_FALSE(g.has_accepted());
    EXPECT_DOUBLE_EQ(g.seconds_since_accepted(3.0), 0.0);
}

TEST(EmissionGate, AcceptMovesToCooldownAndAdvanceReleases) {
    emission_gate g(0.5);
    gate_decision_e d = gate_decision_e::DroppedInvalid;
    std::optional<swing_event_t> ev = g.admit(swing_at(2.0), &d);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(d, gate_decision_e::Accepted);
    EXPECT_DOUBLE_EQ(ev->timestamp_s, 2.0);
    EXPECT_EQ(g.state(), gate_state_e::Cooldown);
    EXPECT_DOUBLE_EQ(g.last_accepted_time(), 2.0);

    g.advance(2.3);
    EXPECT_EQ(g.state(), gate_state_e::Cooldown);
    g.advance(2.5);
    EXPECT_EQ(g.state(), gate_state_e::Idle);
}

TEST(EmissionGate, ReDetectionIsSuppressed) {
    emission_gate g(0.5);
    ASSERT_TRUE(g.admit(swing_at(2.0)).has_value());
    gate_decision_e d = gate_decision_e::Accepted;
    EXPECT_FALSE(g.admit(swing_at(2.0), &d).has_value());
    EXPECT_EQ(d, gate_decision_e::DroppedCooldown);
    EXPECT_FALSE(g.admit(swing_at(2.3), &d).has_value());
    EXPECT_EQ(d, gate_decision_e::DroppedCooldown);
    EXPECT_NEAR(g.seconds_since_accepted(2.3), 0.3, 1e-12);
}

TEST(EmissionGate, DroppedCandidatesDoNotExtendCooldown) {
    emission_gate g(0.5);
    ASSERT_TRUE(g.admit(swing_at(2.0)).has_value());
    EXPECT_FALSE(g.admit(swing_at(2.4)).has_value());
    // measured from 2.0, not from the dropped 2.4
    EXPECT_TRUE(g.admit(swing_at(2.5)).has_value());
    EXPECT_DOUBLE_EQ(g.last_accepted_time(), 2.5);
}

TEST(EmissionGate, OlderRedetectionAfterIdleIsStillDropped) {
    emission_gate g(0.5);
    ASSERT_TRUE(g.admit(swing_at(2.0)).has_value());
    g.advance(3.0);
    EXPECT_EQ(g.state(), gate_state_e::Idle);
    gate_decision_e d = gate_decision_e::Accepted;
    EXPECT_FALSE(g.admit(swing_at(2.1), &d).has_value());
    EXPECT_EQ(d, gate_decision_e::DroppedCooldown);
}

TEST(EmissionGate, InvalidCandidateNeverAccepted) {
    emission_gate g(0.5);
    gate_decision_e d = gate_decision_e::Accepted;
    EXPECT_FALSE(g.admit(swing_at(1.0, false), &d).has_value());
    EXPECT_EQ(d, gate_decision_e::DroppedInvalid);

    swing_event_t still = swing_at(1.0);
    still.peak_acceleration = 0.0;
    still.impact_force = 0.0;
    EXPECT_FALSE(g.admit(still, &d).has_value());
    EXPECT_EQ(d, gate_decision_e::DroppedInvalid);

    EXPECT_FALSE(g.has_accepted());
    EXPECT_EQ(g.state(), gate_state_e::Idle);
    EXPECT_TRUE(g.admit(swing_at(1.1)).has_value());
}

TEST(EmissionGate, ZeroIntervalAcceptsEveryValidSwing) {
    emission_gate g(0.0);
    EXPECT_TRUE(g.admit(swing_at(1.0)).has_value());
    EXPECT_TRUE(g.admit(swing_at(1.0)).has_value());
}

TEST(EmissionGate, ResetForgetsHistory) {
    emission_gate g(0.5);
    ASSERT_TRUE(g.admit(swing_at(2.0)).has_value());
    g.reset();
    EXPECT_EQ(g.state(), gate_state_e::Idle);
    EXPECT_FALSE(g.has_accepted());
    EXPECT_TRUE(g.admit(swing_at(2.1)).has_value());
}
