#pragma once

#include "tubeq/tube.hpp"
#include "tubeq/tube_registry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace tubeq {

/**
 * ExpirySweeper - Background service moving jobs whose deadlines passed
 *
 * Each cycle visits every tube of the registry:
 * - DELAYED jobs whose delay elapsed become READY
 * - RESERVED jobs whose TTR elapsed become READY (timeout)
 * and hands newly ready jobs to waiting consumers.
 *
 * A failing tube is logged and skipped; the cycle continues with the next.
 */
class ExpirySweeper {
private:
    std::shared_ptr<TubeRegistry> registry_;
    int sweep_interval_ms_;

    std::atomic<bool> running_{false};
    std::thread sweep_thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    std::atomic<std::uint64_t> cycles_{0};

public:
    ExpirySweeper(std::shared_ptr<TubeRegistry> registry, int sweep_interval_ms);

    ~ExpirySweeper();

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    void start();
    void stop();

    bool is_running() const { return running_; }
    std::uint64_t cycles() const { return cycles_; }

    /**
     * Sweep every tube once, synchronously
     */
    SweepResult run_once();

private:
    void sweep_loop();
};

} // namespace tubeq
