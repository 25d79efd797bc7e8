#include "progress.h"

#include <algorithm>

namespace mfs {

double ThroughputMeter::rate(uint64_t bytes) const {
    if (!started_) return 0.0;
    const double secs = std::chrono::duration<double>(Clock::now() - t0_).count();
    if (secs <= 0.0) return 0.0;
    return (double)bytes / secs;
}

ProgressEstimator::ProgressEstimator(uint64_t chunk_number)
    : total_ticks_((int)std::min<uint64_t>(chunk_number + 1, 1000000) * kTicksPerTx) {}

double ProgressEstimator::at(int elapsed_ticks) const {
    if (elapsed_ticks <= 0) return kStart;
    const double p = kStart + (kCeiling - kStart) * (double)elapsed_ticks / (double)total_ticks_;
    return std::min(p, kCeiling);
}

int ProgressEstimator::ticks_to_ceiling() const { return total_ticks_; }

ProgressTicker::ProgressTicker(const ProgressEstimator& est, ProgressSink* sink,
                               std::chrono::milliseconds tick)
    : est_(est), sink_(sink), tick_(tick) {
    th_ = std::thread([this]{ run(); });
}

ProgressTicker::~ProgressTicker() { stop(); }

void ProgressTicker::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_ = true;
    }
    cv_.notify_all();
    if (th_.joinable()) th_.join();
}

void ProgressTicker::run() {
    std::unique_lock<std::mutex> lk(mu_);
    for (;;) {
        if (cv_.wait_for(lk, tick_, [this]{ return stop_; })) return;
        const int n = ++ticks_;
        const double p = est_.at(n);
        last_.store(p);
        if (sink_) {
            ProgressEvent ev;
            ev.phase = ProgressPhase::Processing;
            ev.percent = p;
            lk.unlock();
            sink_->on_progress(ev);
            lk.lock();
        }
        if (p >= ProgressEstimator::kCeiling) return;
    }
}

}
