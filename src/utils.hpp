// 'stopwatch' counting timer (start, read, stop)
// plus the small series statistics shared by the analysis stages

#pragma once
#include <chrono>
#include <cmath>
#include <vector>

class sw_timer_t {
public:
	using clock_t = std::chrono::steady_clock;
	using timepoint_t = clock_t::time_point;

	// start timer; false if already running
	bool start_timer() {
		if (is_started == true) {
			return false;
		}
		timer_start_time = clock_t::now();
		is_started = true;
		return true;
	}

	// stop (reset) timer and get elapsed time
	std::chrono::microseconds stop_timer() {
		auto ended_at = get_timer_value_us();
		is_started = false;
		return ended_at;
	}

	// get current value of timer (elapsed time in us)
	std::chrono::microseconds get_timer_value_us() const {
		if(is_started==false) {
			return std::chrono::microseconds{0};
		}
		return std::chrono::duration_cast<std::chrono::microseconds>(clock_t::now() - timer_start_time);
	}

private:
	bool is_started = false;
	timepoint_t timer_start_time {};
};

// 0 for an empty series
inline double series_mean(const std::vector<double>& data) {
	if (data.empty()) {
		return 0.0;
	}
	double acc = 0.0;
	for (double x : data) {
		acc += x;
	}
	return acc / static_cast<double>(data.size());
}

// population standard deviation (divides by N), 0 for fewer than 2 values
inline double series_pstddev(const std::vector<double>& data, double mean) {
	if (data.size() < 2) {
		return 0.0;
	}
	double acc = 0.0;
	for (double x : data) {
		const double d = x - mean;
		acc += d * d;
	}
	return std::sqrt(acc / static_cast<double>(data.size()));
}

inline bool series_all_finite(const std::vector<double>& data) {
	for (double x : data) {
		if (!std::isfinite(x)) {
			return false;
		}
	}
	return true;
}
