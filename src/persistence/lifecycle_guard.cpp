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

#include "lifecycle_guard.h"
#include "../util/log.h"
#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace duodb {
namespace persist {

std::atomic<LifecycleGuard*> LifecycleGuard::active_{nullptr};
std::atomic<int> LifecycleGuard::pending_signal_{0};

static_assert(std::atomic<int>::is_always_lock_free,
              "signal handler requires a lock-free flag");
std::once_flag LifecycleGuard::atexit_once_;

LifecycleGuard::LifecycleGuard(const DualIndexStore& store,
                               PersistenceController& controller,
                               std::string path,
                               std::chrono::milliseconds final_save_timeout)
  : store_(store), controller_(controller), path_(std::move(path)),
    final_save_timeout_(final_save_timeout) {
    if (path_.empty()) {
        throw std::invalid_argument("LifecycleGuard path must not be empty");
    }
    std::memset(previous_actions_, 0, sizeof(previous_actions_));
}

LifecycleGuard::~LifecycleGuard() {
    uninstall();
}

void LifecycleGuard::install() {
    std::lock_guard<std::mutex> lk(install_mu_);
    if (installed_.load(std::memory_order_acquire)) return;

    LifecycleGuard* expected = nullptr;
    if (!active_.compare_exchange_strong(expected, this)) {
        throw std::logic_error("Another LifecycleGuard is already installed");
    }

    // atexit handlers cannot be removed; the trampoline checks active_
    std::call_once(atexit_once_, []{
        if (std::atexit(&LifecycleGuard::atexit_trampoline) != 0) {
            warning() << "Failed to register atexit hook, exit() will not save";
        }
    });

    terminated_.store(false);
    previous_terminate_ = std::set_terminate(&LifecycleGuard::terminate_handler);
    install_signal_handlers();

    {
        std::lock_guard<std::mutex> wl(watch_mu_);
        watch_stop_ = false;
    }
    watcher_ = std::thread([this]{ watch_signals(); });

    installed_.store(true, std::memory_order_release);
    info() << "Lifecycle hooks installed for " << path_;
}

void LifecycleGuard::uninstall() {
    std::lock_guard<std::mutex> lk(install_mu_);
    if (!installed_.load(std::memory_order_acquire)) return;

    {
        std::lock_guard<std::mutex> wl(watch_mu_);
        watch_stop_ = true;
    }
    watch_cv_.notify_all();
    if (watcher_.joinable()) {
        watcher_.join();
    }

    restore_signal_handlers();
    std::set_terminate(previous_terminate_);
    previous_terminate_ = nullptr;

    active_.store(nullptr, std::memory_order_release);
    installed_.store(false, std::memory_order_release);
    debug() << "Lifecycle hooks removed for " << path_;
}

bool LifecycleGuard::on_termination() {
    if (terminated_.exchange(true)) return false;

    if (store_.empty()) {
        info() << "No records to save on termination";
        return false;
    }
    return final_save("termination");
}

void LifecycleGuard::on_failure(const std::string& where, std::exception_ptr error) {
    failures_handled_.fetch_add(1, std::memory_order_relaxed);
    duodb::error() << "Unhandled failure in " << where << ": " << describe(error);
    final_save("failure in " + where);
}

std::thread LifecycleGuard::spawn_guarded(const std::string& name, std::function<void()> fn) {
    return std::thread([this, name, fn = std::move(fn)]{
        Logger::get().setThreadName(name);
        run_guarded(name, fn);
    });
}

LifecycleGuard::Stats LifecycleGuard::stats() const {
    Stats s;
    s.final_saves = final_saves_.load(std::memory_order_relaxed);
    s.failed_saves = failed_saves_.load(std::memory_order_relaxed);
    s.failures_handled = failures_handled_.load(std::memory_order_relaxed);
    s.signals_handled = signals_handled_.load(std::memory_order_relaxed);
    return s;
}

bool LifecycleGuard::final_save(const std::string& reason) {
    try {
        if (!controller_.try_save_for(store_, path_, final_save_timeout_)) {
            failed_saves_.fetch_add(1, std::memory_order_relaxed);
            error() << "Final save to " << path_ << " (" << reason << ") timed out after "
                    << final_save_timeout_.count() << "ms";
            return false;
        }
        final_saves_.fetch_add(1, std::memory_order_relaxed);
        info() << "Final save to " << path_ << " completed (" << reason << ")";
        return true;
    } catch (const std::exception& e) {
        failed_saves_.fetch_add(1, std::memory_order_relaxed);
        error() << "Final save to " << path_ << " (" << reason << ") failed: " << e.what();
        return false;
    }
}

std::string LifecycleGuard::describe(std::exception_ptr error) {
    if (!error) {
        return "no active exception";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "exception of unknown type";
    }
}

void LifecycleGuard::atexit_trampoline() {
    if (LifecycleGuard* g = active()) {
        g->on_termination();
    }
}

void LifecycleGuard::terminate_handler() {
    std::terminate_handler next = nullptr;
    if (LifecycleGuard* g = active()) {
        next = g->previous_terminate_;
        g->on_failure(Logger::get().getThreadName(), std::current_exception());
    }
    if (next && next != &LifecycleGuard::terminate_handler) {
        next();
    }
    std::abort();
}

void LifecycleGuard::signal_handler(int sig) {
    // Only async-signal-safe work here, the watcher thread does the save
    pending_signal_.store(sig);
}

void LifecycleGuard::install_signal_handlers() {
    struct sigaction act;
    std::memset(&act, 0, sizeof(act));
    act.sa_handler = &LifecycleGuard::signal_handler;
    sigemptyset(&act.sa_mask);
    act.sa_flags = SA_RESTART;

    for (size_t i = 0; i < sizeof(kSignals) / sizeof(kSignals[0]); i++) {
        if (::sigaction(kSignals[i], &act, &previous_actions_[i]) != 0) {
            warning() << "Failed to install handler for signal " << kSignals[i]
                      << ": " << errnoWithDescription();
        }
    }
}

void LifecycleGuard::restore_signal_handlers() {
    for (size_t i = 0; i < sizeof(kSignals) / sizeof(kSignals[0]); i++) {
        if (::sigaction(kSignals[i], &previous_actions_[i], nullptr) != 0) {
            warning() << "Failed to restore handler for signal " << kSignals[i]
                      << ": " << errnoWithDescription();
        }
    }
}

void LifecycleGuard::watch_signals() {
    Logger::get().setThreadName("lifecycle");

    std::unique_lock<std::mutex> lk(watch_mu_);
    while (!watch_stop_) {
        watch_cv_.wait_for(lk, std::chrono::milliseconds(lifecycle::kWatcherPollMs),
                           [this]{ return watch_stop_; });
        if (watch_stop_) break;

        const int sig = pending_signal_.exchange(0);
        if (sig == 0) continue;

        lk.unlock();
        signals_handled_.fetch_add(1, std::memory_order_relaxed);
        warning() << "Received signal " << sig << " (" << strsignal(sig) << "), saving before exit";
        on_termination();

        // Default action terminates the process with the original signal
        struct sigaction dfl;
        std::memset(&dfl, 0, sizeof(dfl));
        dfl.sa_handler = SIG_DFL;
        sigemptyset(&dfl.sa_mask);
        if (::sigaction(sig, &dfl, nullptr) != 0 || ::raise(sig) != 0) {
            severe() << "Failed to re-raise signal " << sig << ": " << errnoWithDescription();
            std::exit(128 + sig);
        }
        lk.lock();
    }
}

} // namespace persist
} // namespace duodb
