// Two threads:
// 1 - Producer: replays a session CSV (or a synthetic mock stream) and pushes samples to the ring buffer
// 2 - Consumer: the swing engine's single writer; pops every sample, ingests it, reports/records swings
// usage: swingsense [session.csv|-] [swings_out.csv]     (no/"-" input -> mock stream at 100 Hz)
// VERBOSE=1 shows per-pass diagnostics

#include <thread>
#include <chrono>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "ringBuffer.hpp"
#include "types.hpp"
#include "configs.hpp"
#include "logger.hpp"
#include "event_sink.hpp"
#include "session_csv.hpp"
#include "swing_engine.hpp"
#include "swing_metrics.hpp"
#include "synthetic_stream.hpp"

// Global "please stop" flag set by Ctrl+C (SIGINT) to shut down cleanly
static std::atomic<bool> g_stop{false};

static constexpr size_t HANDOFF_CAPACITY = 256;   // producer -> consumer queue depth
static constexpr double MOCK_SESSION_SEC = 30.0;  // mock stream length
static constexpr double MOCK_SWING_PERIOD_SEC = 2.5;
// a still racket still reads ~10 dps of gyro jitter; without it quiet windows pass the mic/gyro ratio
static constexpr synthetic_noise_t MOCK_NOISE{0.02, 10.0, 20.0};

void handle_sigint(int) {
    g_stop.store(true, std::memory_order_relaxed);
}

// every third mock swing is a practice swing (no shuttle contact -> no mic transient)
static std::vector<synthetic_swing_t> mock_swings() {
    std::vector<synthetic_swing_t> swings;
    int k = 0;
    for(double t = 2.0; t < MOCK_SESSION_SEC - 1.0; t += MOCK_SWING_PERIOD_SEC, k++) {
        synthetic_swing_t sw{t};
        sw.gyro_peak_dps = 600.0 + 150.0 * (k % 4);
        sw.mic_peak = (k % 3 == 2) ? 0.0 : 100000.0;
        swings.push_back(sw);
    }
    return swings;
}

void producer_thread_fn(ringBuffer_C<sensor_sample_t>& rb, std::string input_path, std::atomic<int>& status){
    using namespace std::chrono_literals;
    logger::tlabel = "producer";

    if(input_path.empty()) {
        LOG_ALWAYS("producer start (PATH=MOCK)");
        synthetic_stream stream(NOMINAL_RATE_HZ, mock_swings(), MOCK_NOISE);
        const uint64_t total = static_cast<uint64_t>(MOCK_SESSION_SEC * NOMINAL_RATE_HZ);
        while(!g_stop.load(std::memory_order_relaxed) && stream.position() < total) {
            if(!rb.push(stream.next())) {
                break;
            }
            // pace like the sensor does (10 ms @ 100 Hz)
            std::this_thread::sleep_for(10ms);
        }
    } else {
        LOG_ALWAYS("producer start (PATH=" << input_path << ")");
        std::ifstream in(input_path);
        if(!in) {
            LOG_ERR("cannot open " << input_path << ": " << std::strerror(errno));
            status.store(1, std::memory_order_relaxed);
            rb.close();
            return;
        }
        std::string line;
        size_t line_no = 0;
        size_t skipped = 0;
        while(!g_stop.load(std::memory_order_relaxed) && std::getline(in, line)) {
            line_no++;
            if(is_skippable_row(line)) {
                continue;
            }
            sensor_sample_t sample{};
            if(parse_sample_row(line, &sample) != 0) {
                LOG_ERR(input_path << ":" << line_no << ": malformed row skipped");
                skipped++;
                continue;
            }
            // blocking push; false only once the queue is closed
            if(!rb.push(sample)) {
                break;
            }
        }
        LOG_ALWAYS("replayed " << line_no << " lines (" << skipped << " skipped)");
    }
    // closing unblocks the consumer once it has drained what is left
    rb.close();
}

void consumer_thread_fn(ringBuffer_C<sensor_sample_t>& rb, swing_engine& engine, std::ostream* swings_out){
    logger::tlabel = "consumer";
    LOG_ALWAYS("consumer start");
    if(swings_out) {
        *swings_out << SWING_CSV_HEADER << '\n';
    }

    sensor_sample_t sample{};
    size_t rows_written = 0;
    while(rb.pop(&sample)) {
        std::optional<swing_event_t> swing = engine.ingest(sample);
        if(!swing) {
            continue;
        }
        LOG_ALWAYS("hit #" << swing->hit_index << " v_tip=" << swing->peak_tip_speed << " m/s ("
                   << tip_speed_kmh(*swing) << " km/h) quality=" << (passes_quality_gates(*swing) ? "ok" : "suspect"));
        if(swings_out) {
            write_swing_row(*swings_out, *swing);
            rows_written++;
            if(rows_written % 50 == 0) { swings_out->flush(); }
        }
    }
    if(swings_out) {
        swings_out->flush();
    }
}

int main(int argc, char** argv) {
    LOG_ALWAYS("start (VERBOSE=" << logger::verbose() << ")");

    std::string input_path = (argc > 1 && std::string(argv[1]) != "-") ? argv[1] : "";
    std::ofstream swings_csv;
    if(argc > 2) {
        swings_csv.open(argv[2]);
        if(!swings_csv) {
            LOG_ERR("cannot open " << argv[2] << " for writing");
            return 1;
        }
    }

    log_event_sink sink;
    engine_config_t cfg{};
    std::unique_ptr<swing_engine> engine;
    try {
        engine = std::make_unique<swing_engine>(cfg, &sink);
    } catch(const std::invalid_argument& e) {
        LOG_ERR(e.what());
        return 2;
    }

    ringBuffer_C<sensor_sample_t> ringBuf(HANDOFF_CAPACITY);
    std::atomic<int> producer_status{0};

    // interrupt caused by SIGINT -> 'handle_sigint' acts like ISR (callback handle)
    std::signal(SIGINT, handle_sigint);

    std::thread prod(producer_thread_fn, std::ref(ringBuf), input_path, std::ref(producer_status));
    std::thread cons(consumer_thread_fn, std::ref(ringBuf), std::ref(*engine),
                     swings_csv.is_open() ? static_cast<std::ostream*>(&swings_csv) : nullptr);

    prod.join();
    if(g_stop.load(std::memory_order_relaxed)) {
        ringBuf.close();
    }
    cons.join();

    const engine_stats_t st = engine->stats();
    LOG_ALWAYS("done: hits=" << st.hit_count << " passes=" << st.total_passes
               << " candidates=" << st.total_candidates << " rejected=" << st.total_rejected
               << " duplicates=" << st.total_duplicates << " degenerate=" << st.total_degenerate
               << " buffer=" << st.buffer_size);
    return producer_status.load(std::memory_order_relaxed);
}
