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
#include <memory>
#include <string>

#include "../dual_index_store.h"
#include "../util/logmanager.h"
#include "autosave_policy.h"
#include "lifecycle_guard.h"
#include "persistence_controller.h"
#include "store_config.h"

namespace duodb {
namespace persist {

/**
 * StoreRuntime - one store wired to its data file.
 *
 * open() loads the data file (a missing file starts an empty store), then
 * installs the lifecycle hooks and starts autosave as configured. close()
 * stops autosave and performs the termination save; the destructor calls it.
 * A non-empty log_dir routes the logger into <log_dir>/duodb.log until the
 * runtime is destroyed.
 */
class StoreRuntime {
public:
    // Throws std::invalid_argument for an invalid config, std::runtime_error
    // for an unusable log_dir and whatever PersistenceController::load throws
    // for an unreadable data file
    static std::unique_ptr<StoreRuntime> open(const StoreConfig& config);

    ~StoreRuntime();

    StoreRuntime(const StoreRuntime&) = delete;
    StoreRuntime& operator=(const StoreRuntime&) = delete;

    inline DualIndexStore&        store()      { return store_; }
    inline PersistenceController& controller() { return *controller_; }
    inline AutosavePolicy&        autosave()   { return *autosave_; }
    inline LifecycleGuard&        guard()      { return *guard_; }

    const StoreConfig& config() const { return config_; }
    const std::string& data_file() const { return config_.data_file; }

    // Synchronous save to the data file
    void save();

    // Idempotent
    void close();
    bool is_closed() const { return closed_.load(std::memory_order_acquire); }

private:
    explicit StoreRuntime(const StoreConfig& config);
    void start();

private:
    StoreConfig config_;
    // Declared first so it outlives everything that logs
    std::unique_ptr<LogManager> log_manager_;
    DualIndexStore store_;
    std::unique_ptr<PersistenceController> controller_;
    std::unique_ptr<AutosavePolicy>        autosave_;
    std::unique_ptr<LifecycleGuard>        guard_;
    std::atomic<bool> closed_{false};
};

} // namespace persist
} // namespace duodb
