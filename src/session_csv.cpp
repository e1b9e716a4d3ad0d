#include "session_csv.hpp"
#include <cerrno>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <vector>
#include "swing_metrics.hpp"

namespace {
constexpr size_t SAMPLE_FIELDS = 8;

// strtod over the whole field (surrounding spaces allowed)
bool to_double(const std::string& field, double* out) {
    const char* begin = field.c_str();
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(begin, &end);
    if (end == begin || errno == ERANGE) {
        return false;
    }
    while (*end != '\0') {
        if (!std::isspace(static_cast<unsigned char>(*end))) {
            return false;
        }
        end++;
    }
    *out = v;
    return true;
}
} // namespace

bool is_skippable_row(const std::string& line) {
    size_t i = 0;
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) {
        i++;
    }
    if (i == line.size() || line[i] == '#') {
        return true;
    }
    // header: first field starts with a letter
    return std::isalpha(static_cast<unsigned char>(line[i])) != 0;
}

int parse_sample_row(const std::string& line, sensor_sample_t* dest) {
    if (dest == nullptr) {
        return -EINVAL;
    }
    std::vector<std::string> fields;
    std::string cur;
    for (char ch : line) {
        if (ch == ',') {
            fields.push_back(cur);
            cur.clear();
        } else if (ch != '\r') {
            cur.push_back(ch);
        }
    }
    fields.push_back(cur);
    if (fields.size() != SAMPLE_FIELDS) {
        return -EINVAL;
    }

    double v[SAMPLE_FIELDS];
    for (size_t k = 0; k < SAMPLE_FIELDS; k++) {
        if (!to_double(fields[k], &v[k])) {
            return -EINVAL;
        }
    }
    *dest = sensor_sample_t{v[0], v[1], v[2], v[3], v[4], v[5], v[6], v[7]};
    return 0;
}

void write_swing_row(std::ostream& os, const swing_event_t& ev) {
    os << ev.hit_index << ','
       << std::fixed << std::setprecision(3) << ev.timestamp_s << ','
       << std::setprecision(4)
       << ev.peak_angular_velocity << ','
       << ev.peak_tip_speed << ','
       << ev.peak_acceleration << ','
       << ev.impact_force << ','
       << ev.swing_force << ','
       << ev.shuttle_speed_out << ','
       << ev.shuttle_force_actual << ','
       << ev.shuttle_force_std << ','
       << std::setprecision(1) << ev.duration_ms << ','
       << std::setprecision(3) << ev.power_ratio << ','
       << (ev.is_valid ? 1 : 0) << ','
       << (passes_quality_gates(ev) ? 1 : 0) << '\n'
       << std::defaultfloat << std::setprecision(6);
}
