// Simulated processing progress and its background ticker.
#include "test_support.h"
#include "progress.h"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <mutex>
#include <thread>

using namespace mfs;

struct Collect : ProgressSink {
    std::mutex mu;
    std::vector<double> seen;
    void on_progress(const ProgressEvent& ev) override {
        std::lock_guard<std::mutex> lk(mu);
        seen.push_back(ev.percent);
    }
};

int main() {
    log_init(LogLevel::WARN);

    {
        ProgressEstimator est(3);   // 3 chunks + index = 4 transactions, 12 ticks
        TEST_CHECK(est.ticks_to_ceiling() == 12, "three ticks per transaction");
        TEST_CHECK(est.at(0) == 50.0, "starts at 50");
        TEST_CHECK(std::fabs(est.at(3) - 60.0) < 1e-9, "quarter of the way");
        TEST_CHECK(std::fabs(est.at(6) - 70.0) < 1e-9, "half way");
        TEST_CHECK(est.at(12) == 90.0, "ceiling");
        TEST_CHECK(est.at(100) == 90.0, "never past the ceiling");
        ProgressEstimator zero(0);
        TEST_CHECK(zero.ticks_to_ceiling() == 3, "index transaction alone");
        TEST_PASS("estimator");
    }

    {
        Collect sink;
        ProgressEstimator est(1);
        ProgressTicker t(est, &sink, std::chrono::milliseconds(1));
        // 6 ticks to the ceiling; the thread ends on its own
        for (int i = 0; i < 2000 && t.last_percent() < 90.0; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        t.stop();
        TEST_CHECK(t.ticks() == 6, "stopped at the ceiling");
        TEST_CHECK(t.last_percent() == 90.0, "last value is the ceiling");
        std::lock_guard<std::mutex> lk(sink.mu);
        TEST_CHECK(sink.seen.size() == 6, "one event per tick");
        for (size_t i = 1; i < sink.seen.size(); ++i) {
            TEST_CHECK(sink.seen[i] > sink.seen[i - 1], "monotonic");
        }
        TEST_PASS("ticker to ceiling");
    }

    {
        Collect sink;
        ProgressEstimator est(50);
        auto t0 = std::chrono::steady_clock::now();
        {
            ProgressTicker t(est, &sink, std::chrono::milliseconds(10000));
            t.stop();
            TEST_CHECK(t.ticks() == 0, "stop before the first tick");
        }
        auto waited = std::chrono::steady_clock::now() - t0;
        TEST_CHECK(waited < std::chrono::seconds(5), "stop does not wait for the tick");
        TEST_CHECK(sink.seen.empty(), "no events");

        { ProgressTicker t(est, nullptr, std::chrono::milliseconds(1)); }
        TEST_PASS("ticker stop");
    }

    std::printf("All progress tests passed!\n");
    return 0;
}
