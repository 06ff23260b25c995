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

#include "store_runtime.h"
#include "platform_fs.h"
#include "../util/log.h"

#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace duodb {
    namespace persist {

        std::unique_ptr<StoreRuntime> StoreRuntime::open(const StoreConfig& config) {
            if (!config.validate()) {
                throw std::invalid_argument("Invalid StoreConfig for " + config.data_file);
            }

            auto rt = std::unique_ptr<StoreRuntime>(new StoreRuntime(config));

            // Recovery: a missing data file is a fresh store
            if (config.load_on_open) {
                FSResult st = PlatformFS::file_size(config.data_file).first;
                if (st.ok) {
                    rt->controller_->load(rt->store_, config.data_file);
                } else if (st.err == ENOENT) {
                    info() << "No data file at " << config.data_file << ", starting empty";
                } else {
                    throw std::system_error(st.err, std::generic_category(),
                                            "Failed to stat " + config.data_file);
                }
            }

            rt->start();
            return rt;
        }

        StoreRuntime::StoreRuntime(const StoreConfig& config)
        : config_(config) {
            if (!config_.log_dir.empty()) {
                log_manager_ = std::make_unique<LogManager>(config_.log_dir);
                info() << "Logging to " << log_manager_->path();
            }
            controller_ = std::make_unique<PersistenceController>();
            autosave_   = std::make_unique<AutosavePolicy>(store_, *controller_, config_.autosave_config());
            guard_      = std::make_unique<LifecycleGuard>(store_, *controller_, config_.data_file,
                                                           config_.final_save_timeout);
        }

        StoreRuntime::~StoreRuntime() {
            close();
        }

        void StoreRuntime::start() {
            if (config_.install_lifecycle_hooks) {
                guard_->install();
            }
            if (config_.autosave_enabled) {
                autosave_->start(config_.data_file);
            }
        }

        void StoreRuntime::save() {
            if (is_closed()) {
                throw std::logic_error("StoreRuntime for " + config_.data_file + " is closed");
            }
            controller_->save(store_, config_.data_file);
        }

        void StoreRuntime::close() {
            if (closed_.exchange(true)) return;

            autosave_->stop();
            guard_->on_termination();
            guard_->uninstall();
            info() << "Store runtime for " << config_.data_file << " closed, "
                   << store_.size() << " records";
        }

    } // namespace persist
} // namespace duodb
