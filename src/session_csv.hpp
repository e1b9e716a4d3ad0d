/*
* CSV I/O FOR THE REPLAY CLI
input rows : timestamp,ax,ay,az,gx,gy,gz,mic   (seconds, g, deg/s, raw mic rms; header optional)
output rows: one accepted swing per row, see SWING_CSV_HEADER
*/
#pragma once
#include <ostream>
#include <string>
#include "types.hpp"

inline constexpr const char* SWING_CSV_HEADER =
    "hit,timestamp_s,peak_omega_rad_s,peak_tip_speed_m_s,peak_accel_m_s2,impact_force_n,"
    "swing_force_n,shuttle_speed_out_m_s,shuttle_force_actual_n,shuttle_force_std_n,"
    "duration_ms,power_ratio,valid,quality_passed";

// 0 on success, -EINVAL for a malformed row (wrong field count, non-numeric field)
int parse_sample_row(const std::string& line, sensor_sample_t* dest);

// true for a row that should be skipped without complaint (blank, comment, header)
bool is_skippable_row(const std::string& line);

void write_swing_row(std::ostream& os, const swing_event_t& ev);
