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

#include "autosave_policy.h"
#include "../util/log.h"
#include <stdexcept>
#include <system_error>

namespace duodb {
namespace persist {

AutosavePolicy::AutosavePolicy(const DualIndexStore& store,
                               PersistenceController& controller,
                               const AutosaveConfig& config)
  : store_(store), controller_(controller), config_(config) {
    if (config_.interval.count() <= 0) {
        throw std::invalid_argument("Autosave interval must be positive");
    }
    if (config_.stop_grace.count() < 0) {
        throw std::invalid_argument("Autosave stop grace must not be negative");
    }
}

AutosavePolicy::~AutosavePolicy() {
    stop();
}

void AutosavePolicy::start(const std::string& path) {
    std::lock_guard<std::mutex> life(lifecycle_mu_);
    if (running_.load(std::memory_order_acquire)) return;
    if (path.empty()) {
        throw std::invalid_argument("Autosave path must not be empty");
    }

    path_ = path;
    cancel_.store(false, std::memory_order_release);
    save_requested_.store(false, std::memory_order_release);
    consecutive_failures_.store(0, std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lk(mu_);
        loop_exited_ = false;
    }

    running_.store(true, std::memory_order_release);
    th_ = std::thread([this]{ loop(); });
    info() << "Autosave started for " << path_ << " every "
           << config_.interval.count() << "ms";
}

void AutosavePolicy::stop() {
    std::lock_guard<std::mutex> life(lifecycle_mu_);
    if (!running_.exchange(false)) return;

    // Wake the loop so it sees running_ = false
    {
        std::lock_guard<std::mutex> lk(mu_);
    }
    cv_.notify_all();

    {
        std::unique_lock<std::mutex> lk(mu_);
        if (!exit_cv_.wait_for(lk, config_.stop_grace, [this]{ return loop_exited_; })) {
            warning() << "Autosave still saving after " << config_.stop_grace.count()
                      << "ms, cancelling";
            cancel_.store(true, std::memory_order_release);
        }
    }

    if (th_.joinable()) {
        th_.join();
    }
    info() << "Autosave stopped for " << path_;
}

std::string AutosavePolicy::path() const {
    std::lock_guard<std::mutex> life(lifecycle_mu_);
    return path_;
}

void AutosavePolicy::request_save() {
    save_requested_.store(true, std::memory_order_release);
    cv_.notify_all();
}

AutosavePolicy::Stats AutosavePolicy::stats() const {
    Stats s;
    s.ticks = ticks_.load(std::memory_order_relaxed);
    s.saves_written = saves_written_.load(std::memory_order_relaxed);
    s.save_failures = save_failures_.load(std::memory_order_relaxed);
    s.skipped_ticks = skipped_ticks_.load(std::memory_order_relaxed);
    s.consecutive_failures = consecutive_failures_.load(std::memory_order_relaxed);
    s.last_save_ms = std::chrono::milliseconds(last_save_ms_.load(std::memory_order_relaxed));
    s.running = running_.load(std::memory_order_relaxed);
    return s;
}

void AutosavePolicy::loop() {
    using clock = std::chrono::steady_clock;
    Logger::get().setThreadName("autosave");

    auto next_tick = clock::now() + config_.interval;

    std::unique_lock<std::mutex> lk(mu_);
    while (running_.load(std::memory_order_acquire)) {
        cv_.wait_until(lk, next_tick, [this]{
            return !running_.load(std::memory_order_acquire) ||
                   save_requested_.load(std::memory_order_acquire);
        });
        if (!running_.load(std::memory_order_acquire)) break;

        const bool requested = save_requested_.exchange(false, std::memory_order_acq_rel);
        auto now = clock::now();
        if (now >= next_tick) {
            ticks_.fetch_add(1, std::memory_order_relaxed);
            next_tick += config_.interval;
        } else if (!requested) {
            continue;  // spurious wakeup
        }

        lk.unlock();
        do_save();
        lk.lock();

        // Ticks that came due during the save are dropped
        now = clock::now();
        while (next_tick <= now) {
            next_tick += config_.interval;
            skipped_ticks_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    loop_exited_ = true;
    exit_cv_.notify_all();
}

void AutosavePolicy::do_save() {
    const auto t0 = std::chrono::steady_clock::now();
    try {
        controller_.save(store_, path_, &cancel_);

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0);
        last_save_ms_.store(elapsed.count(), std::memory_order_relaxed);
        saves_written_.fetch_add(1, std::memory_order_relaxed);

        const uint32_t prior = consecutive_failures_.exchange(0, std::memory_order_relaxed);
        if (prior >= config_.failure_alert_threshold) {
            info() << "Autosave recovered after " << prior << " failed attempts";
        }
    } catch (const std::system_error& e) {
        if (e.code() == std::errc::operation_canceled) {
            warning() << "Autosave of " << path_ << " cancelled: " << e.what();
        } else {
            note_failure(e.what());
        }
    } catch (const std::exception& e) {
        note_failure(e.what());
    }
    report_metrics();
}

void AutosavePolicy::note_failure(const std::string& what) {
    save_failures_.fetch_add(1, std::memory_order_relaxed);
    const uint32_t n = consecutive_failures_.fetch_add(1, std::memory_order_relaxed) + 1;
    error() << "Autosave of " << path_ << " failed: " << what;
    report_error(what);
    if (n == config_.failure_alert_threshold) {
        severe() << "Autosave of " << path_ << " has failed " << n << " times in a row";
    }
}

} // namespace persist
} // namespace duodb
