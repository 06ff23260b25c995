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
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <signal.h>

#include "../dual_index_store.h"
#include "config.h"
#include "persistence_controller.h"

namespace duodb {
namespace persist {

/**
 * LifecycleGuard - one last save when the process ends.
 *
 * Once installed the guard saves its store to its path when:
 *   - the process calls exit() or returns from main (atexit hook),
 *   - SIGTERM, SIGINT or SIGHUP arrives; the signal is then re-raised with
 *     its default action so the process still terminates,
 *   - a thread dies with an uncaught exception (std::terminate hook, which
 *     then chains to the previous handler),
 *   - a unit of work wrapped by run_guarded()/spawn_guarded() throws.
 *
 * The termination save happens at most once per install() and only for a
 * non-empty store.
 * Save errors are logged, never propagated. Every save is bounded by
 * `final_save_timeout` so a busy controller cannot hang shutdown.
 *
 * Only one guard can be installed per process. install() is idempotent for
 * the same guard and throws std::logic_error for a second one.
 */
class LifecycleGuard {
public:
    struct Stats {
        uint64_t final_saves = 0;
        uint64_t failed_saves = 0;
        uint64_t failures_handled = 0;
        uint64_t signals_handled = 0;
    };

    LifecycleGuard(const DualIndexStore& store,
                   PersistenceController& controller,
                   std::string path,
                   std::chrono::milliseconds final_save_timeout =
                       std::chrono::milliseconds(lifecycle::kFinalSaveTimeoutMs));

    // Uninstalls; does not save
    ~LifecycleGuard();

    LifecycleGuard(const LifecycleGuard&) = delete;
    LifecycleGuard& operator=(const LifecycleGuard&) = delete;

    void install();
    void uninstall();
    bool installed() const { return installed_.load(std::memory_order_acquire); }

    // Termination save; true if this call wrote the file
    bool on_termination();

    // Best-effort save after `error` killed the work unit `where`
    void on_failure(const std::string& where, std::exception_ptr error);

    // Runs fn; a thrown std::exception goes to on_failure() and yields false
    template <typename Fn>
    bool run_guarded(const std::string& name, Fn&& fn) {
        try {
            std::forward<Fn>(fn)();
            return true;
        } catch (const std::exception&) {
            on_failure(name, std::current_exception());
            return false;
        }
    }

    // New thread named `name` running fn under run_guarded()
    std::thread spawn_guarded(const std::string& name, std::function<void()> fn);

    const std::string& path() const { return path_; }

    Stats stats() const;

    // Installed guard of this process, or nullptr
    static LifecycleGuard* active() { return active_.load(std::memory_order_acquire); }

private:
    static void atexit_trampoline();
    static void terminate_handler();
    static void signal_handler(int sig);

    static std::string describe(std::exception_ptr error);

    bool final_save(const std::string& reason);
    void install_signal_handlers();
    void restore_signal_handlers();
    void watch_signals();

private:
    const DualIndexStore& store_;
    PersistenceController& controller_;
    std::string path_;
    std::chrono::milliseconds final_save_timeout_;

    std::mutex install_mu_;
    std::atomic<bool> installed_{false};
    std::atomic<bool> terminated_{false};
    std::terminate_handler previous_terminate_ = nullptr;

    static constexpr int kSignals[] = {SIGTERM, SIGINT, SIGHUP};
    struct sigaction previous_actions_[sizeof(kSignals) / sizeof(kSignals[0])];

    // signal watcher
    std::thread watcher_;
    std::mutex watch_mu_;
    std::condition_variable watch_cv_;
    bool watch_stop_ = false;

    // stats
    std::atomic<uint64_t> final_saves_{0};
    std::atomic<uint64_t> failed_saves_{0};
    std::atomic<uint64_t> failures_handled_{0};
    std::atomic<uint64_t> signals_handled_{0};

    static std::atomic<LifecycleGuard*> active_;
    // Written by the signal handler on any thread, drained by the watcher
    static std::atomic<int> pending_signal_;
    static std::once_flag atexit_once_;
};

} // namespace persist
} // namespace duodb
