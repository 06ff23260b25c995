/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "../dual_index_store.h"
#include "config.h"
#include "persistence_controller.h"

namespace duodb {
namespace persist {

struct AutosaveConfig {
    std::chrono::milliseconds interval{autosave::kDefaultIntervalMs};
    std::chrono::milliseconds stop_grace{autosave::kStopGraceMs};     // wait for an in-flight save
    uint32_t failure_alert_threshold = autosave::kFailureAlertThreshold;
};

/**
 * AutosavePolicy - saves a store on a fixed period from one background thread.
 *
 * Ticks are scheduled on a fixed-rate grid. Saves run on the background
 * thread only, so they never overlap; ticks that come due while a save is
 * still running are counted as skipped and dropped, not queued.
 *
 * A failed save is logged and reported through the error callback, and the
 * schedule continues. Once `failure_alert_threshold` saves in a row have
 * failed a SEVERE alert is logged; the count resets on the next success.
 *
 * start() and stop() are idempotent. stop() waits up to `stop_grace` for an
 * in-flight save, then cancels it and joins the thread.
 */
class AutosavePolicy {
public:
    struct Stats {
        uint64_t ticks = 0;
        uint64_t saves_written = 0;
        uint64_t save_failures = 0;
        uint64_t skipped_ticks = 0;
        uint32_t consecutive_failures = 0;
        std::chrono::milliseconds last_save_ms{0};
        bool running = false;
    };

    using ErrorCallback = std::function<void(const std::string& error)>;
    using MetricsCallback = std::function<void(const Stats& stats)>;

    AutosavePolicy(const DualIndexStore& store,
                   PersistenceController& controller,
                   const AutosaveConfig& config = AutosaveConfig{});

    ~AutosavePolicy();

    AutosavePolicy(const AutosavePolicy&) = delete;
    AutosavePolicy& operator=(const AutosavePolicy&) = delete;

    // Stopped -> Running; no-op when already running
    void start(const std::string& path);
    // Running -> Stopped; no-op when already stopped
    void stop();

    bool is_running() const { return running_.load(std::memory_order_acquire); }
    std::string path() const;

    // Save at the next opportunity instead of waiting for the tick
    void request_save();

    // Safe to call while running; the next report uses the new callback
    void set_error_callback(ErrorCallback cb) {
        std::lock_guard<std::mutex> lk(callback_mu_);
        error_callback_ = std::move(cb);
    }

    void set_metrics_callback(MetricsCallback cb) {
        std::lock_guard<std::mutex> lk(callback_mu_);
        metrics_callback_ = std::move(cb);
    }

    Stats stats() const;

    const AutosaveConfig& config() const { return config_; }

private:
    void loop();
    void do_save();
    void note_failure(const std::string& what);

    // Callbacks run outside callback_mu_ so they may call back into the policy
    void report_error(const std::string& error) {
        ErrorCallback cb;
        {
            std::lock_guard<std::mutex> lk(callback_mu_);
            cb = error_callback_;
        }
        if (cb) cb(error);
    }

    void report_metrics() {
        MetricsCallback cb;
        {
            std::lock_guard<std::mutex> lk(callback_mu_);
            cb = metrics_callback_;
        }
        if (cb) cb(stats());
    }

private:
    const DualIndexStore& store_;
    PersistenceController& controller_;
    AutosaveConfig config_;

    // start/stop serialization
    mutable std::mutex lifecycle_mu_;
    std::string path_;

    // bg thread
    std::atomic<bool> running_{false};
    std::atomic<bool> cancel_{false};
    std::thread th_;
    std::mutex mu_;
    std::condition_variable cv_;
    std::atomic<bool> save_requested_{false};

    // loop exit handshake, guarded by mu_
    std::condition_variable exit_cv_;
    bool loop_exited_ = false;

    // stats
    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> saves_written_{0};
    std::atomic<uint64_t> save_failures_{0};
    std::atomic<uint64_t> skipped_ticks_{0};
    std::atomic<uint32_t> consecutive_failures_{0};
    std::atomic<int64_t>  last_save_ms_{0};

    // callbacks, guarded by callback_mu_
    std::mutex callback_mu_;
    ErrorCallback error_callback_;
    MetricsCallback metrics_callback_;
};

} // namespace persist
} // namespace duodb
