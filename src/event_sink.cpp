#include "event_sink.hpp"
#include <iomanip>
#include <sstream>
#include "logger.hpp"

const char* diag_kind_to_string(diag_kind_e kind) {
    switch (kind) {
        case DIAG_PASS_COMPLETED:       return "PERF";
        case DIAG_CANDIDATES_FOUND:     return "CANDIDATES";
        case DIAG_WINDOW_REJECTED:      return "REJECTED";
        case DIAG_DEGENERATE_WINDOW:    return "DEGENERATE";
        case DIAG_DUPLICATE_SUPPRESSED: return "DUPLICATE";
        case DIAG_SWING_ACCEPTED:       return "SWING";
        default:                        return "UNKNOWN";
    }
}

void log_event_sink::on_event(const diag_event_t& ev) {
    // formatted locally so std::cout's float flags are left alone
    std::ostringstream line;
    line << "[" << diag_kind_to_string(ev.kind) << "] t=" << std::fixed << std::setprecision(3) << ev.timestamp_s << "s ";
    if (ev.kind == DIAG_SWING_ACCEPTED) {
        line << "v_tip=" << std::setprecision(2) << ev.value << " m/s";
    } else {
        line << "value=" << ev.value;
    }
    if (!ev.detail.empty()) {
        line << " | " << ev.detail;
    }

    if (ev.kind == DIAG_SWING_ACCEPTED) {
        LOG_ALWAYS(line.str());
    } else {
        LOG_DBG(line.str());
    }
}
