// minimal stdout logger shared by the engine sinks, the CLI and the tests
// LOG_ALWAYS -> always printed; LOG_DBG -> printed only when VERBOSE is set (and not "0")
// LOG_ERR -> same format as LOG_ALWAYS but on stderr

#pragma once
#include <chrono>
#include <iostream>
#include <cstdint>
#include <string_view>
#include <cstdlib>   // getenv
#include <iomanip>
#include <string>

namespace logger {
using clock_t = std::chrono::steady_clock;
inline const auto g_t0 = clock_t::now();

inline uint64_t ms_since_start() {
    return (uint64_t)std::chrono::duration_cast<std::chrono::milliseconds>(clock_t::now() - g_t0).count();
}

// read once; VERBOSE is not expected to change while running
inline bool verbose() {
    static const bool v = [] {
        const char* env = std::getenv("VERBOSE");
        return env && *env && std::string_view(env) != "0";
    }();
    return v;
}

inline thread_local const char* tlabel = "main";  // set per-thread
} // namespace logger

#define LOG_ALWAYS(msg) do { \
    std::cout << "[" << std::setw(6) << logger::ms_since_start() << " ms] " \
              << logger::tlabel << ": " << msg << std::endl; \
} while(0)

#define LOG_ERR(msg) do { \
    std::cerr << "[" << std::setw(6) << logger::ms_since_start() << " ms] " \
              << logger::tlabel << ": ERROR " << msg << std::endl; \
} while(0)

#define LOG_DBG(msg) do { if (logger::verbose()) LOG_ALWAYS(msg); } while(0)
