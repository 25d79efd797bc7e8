#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace mfs {

enum class ProgressPhase { Uploading, Completing, Processing };

struct ProgressEvent {
    ProgressPhase phase{ProgressPhase::Uploading};
    int      current_part{0};
    int      total_parts{0};
    uint64_t uploaded_bytes{0};
    uint64_t total_bytes{0};
    double   bytes_per_sec{0.0};
    double   percent{0.0};
};

class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void on_progress(const ProgressEvent& ev) = 0;
};

// Average upload rate since start().
class ThroughputMeter {
public:
    using Clock = std::chrono::steady_clock;

    void start() { t0_ = Clock::now(); started_ = true; }
    double rate(uint64_t bytes) const;

private:
    Clock::time_point t0_{};
    bool started_{false};
};

// Simulated progress for the synchronous backend call: linear from 50% to
// 90% over 3 ticks per transaction (chunks + index).
class ProgressEstimator {
public:
    static constexpr double kStart = 50.0;
    static constexpr double kCeiling = 90.0;
    static constexpr int kTicksPerTx = 3;

    explicit ProgressEstimator(uint64_t chunk_number);

    double at(int elapsed_ticks) const;
    int ticks_to_ceiling() const;

private:
    int total_ticks_;
};

// Background thread feeding ProgressEstimator values to a sink once per
// tick until stop() or the ceiling. The destructor stops and joins.
class ProgressTicker {
public:
    ProgressTicker(const ProgressEstimator& est, ProgressSink* sink,
                   std::chrono::milliseconds tick = std::chrono::milliseconds(1000));
    ~ProgressTicker();

    ProgressTicker(const ProgressTicker&) = delete;
    ProgressTicker& operator=(const ProgressTicker&) = delete;

    void stop();
    int ticks() const { return ticks_.load(); }
    double last_percent() const { return last_.load(); }

private:
    ProgressEstimator est_;
    ProgressSink* sink_;
    std::chrono::milliseconds tick_;
    std::mutex mu_;
    std::condition_variable cv_;
    bool stop_{false};
    std::atomic<int> ticks_{0};
    std::atomic<double> last_{ProgressEstimator::kStart};
    std::thread th_;

    void run();
};

}
