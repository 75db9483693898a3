#include "tubeq/expiry_sweeper.hpp"
#include <spdlog/spdlog.h>

namespace tubeq {

ExpirySweeper::ExpirySweeper(std::shared_ptr<TubeRegistry> registry, int sweep_interval_ms)
    : registry_(std::move(registry)),
      sweep_interval_ms_(sweep_interval_ms > 0 ? sweep_interval_ms : 1000) {
}

ExpirySweeper::~ExpirySweeper() {
    stop();
}

void ExpirySweeper::start() {
    if (running_) {
        spdlog::warn("ExpirySweeper already running");
        return;
    }

    running_ = true;
    sweep_thread_ = std::thread(&ExpirySweeper::sweep_loop, this);

    spdlog::info("ExpirySweeper started: interval={}ms", sweep_interval_ms_);
}

void ExpirySweeper::stop() {
    if (!running_) return;

    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        running_ = false;
    }
    wake_cv_.notify_all();

    if (sweep_thread_.joinable()) {
        sweep_thread_.join();
    }

    spdlog::info("ExpirySweeper stopped after {} cycles", cycles_.load());
}

SweepResult ExpirySweeper::run_once() {
    SweepResult total;

    for (const auto& tube : registry_->tubes()) {
        try {
            SweepResult result = tube->sweep();
            total.promoted += result.promoted;
            total.timed_out += result.timed_out;
            total.skipped += result.skipped;
        } catch (const std::exception& e) {
            spdlog::error("ExpirySweeper: sweep of tube '{}' failed: {}", tube->name(), e.what());
        }
    }

    cycles_++;

    // Only log if something moved
    if (total.promoted > 0 || total.timed_out > 0 || total.skipped > 0) {
        spdlog::debug("ExpirySweeper: promoted={}, timed_out={}, skipped={}",
                      total.promoted, total.timed_out, total.skipped);
    }
    return total;
}

void ExpirySweeper::sweep_loop() {
    spdlog::debug("ExpirySweeper: sweep thread started");

    while (running_) {
        auto cycle_start = std::chrono::steady_clock::now();

        run_once();

        auto cycle_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - cycle_start);
        auto sleep_time = std::chrono::milliseconds(sweep_interval_ms_) - cycle_duration;
        if (sleep_time.count() < 0) sleep_time = std::chrono::milliseconds(0);

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, sleep_time, [this] { return !running_; });
    }

    spdlog::debug("ExpirySweeper: sweep thread stopped");
}

} // namespace tubeq
