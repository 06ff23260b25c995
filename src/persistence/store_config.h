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
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>
#include "config.h"  // For defaults
#include "autosave_policy.h"

namespace duodb {
namespace persist {

/**
 * Runtime configuration for a StoreRuntime
 * Defaults come from config.h and can be overridden from the environment
 */
struct StoreConfig {
    // Data file
    std::string data_file      = files::kDefaultDataFile;
    bool load_on_open          = true;                     // read data_file if it exists

    // Autosave
    bool autosave_enabled      = true;
    std::chrono::milliseconds autosave_interval{autosave::kDefaultIntervalMs};
    std::chrono::milliseconds stop_grace{autosave::kStopGraceMs};
    uint32_t failure_alert_threshold = autosave::kFailureAlertThreshold;

    // Lifecycle hooks (signals, atexit, std::terminate)
    bool install_lifecycle_hooks = true;
    std::chrono::milliseconds final_save_timeout{lifecycle::kFinalSaveTimeoutMs};

    // Logging; empty keeps output on stderr
    std::string log_dir;

    /**
     * Create config with defaults, optionally reading from environment
     */
    static StoreConfig defaults() {
        StoreConfig cfg;

        if (const char* env = std::getenv("DUODB_DATA_FILE")) {
            cfg.data_file = env;
        }

        if (const char* env = std::getenv("DUODB_AUTOSAVE_ENABLED")) {
            cfg.autosave_enabled = (std::string(env) != "0");
        }

        if (const char* env = std::getenv("DUODB_AUTOSAVE_INTERVAL_MS")) {
            cfg.autosave_interval = std::chrono::milliseconds(std::stoll(env));
        }

        if (const char* env = std::getenv("DUODB_STOP_GRACE_MS")) {
            cfg.stop_grace = std::chrono::milliseconds(std::stoll(env));
        }

        if (const char* env = std::getenv("DUODB_FAILURE_ALERT_THRESHOLD")) {
            cfg.failure_alert_threshold = static_cast<uint32_t>(std::stoul(env));
        }

        if (const char* env = std::getenv("DUODB_INSTALL_HOOKS")) {
            cfg.install_lifecycle_hooks = (std::string(env) != "0");
        }

        if (const char* env = std::getenv("DUODB_LOG_DIR")) {
            cfg.log_dir = env;
        }

        return cfg;
    }

    /**
     * Configuration for tests and tools: nothing runs in the background
     */
    static StoreConfig manual(const std::string& data_file) {
        StoreConfig cfg;
        cfg.data_file = data_file;
        cfg.autosave_enabled = false;
        cfg.install_lifecycle_hooks = false;
        return cfg;
    }

    /**
     * Validate configuration
     */
    bool validate() const {
        if (data_file.empty()) {
            return false;
        }
        if (autosave_interval.count() <= 0 || stop_grace.count() < 0) {
            return false;
        }
        if (failure_alert_threshold == 0) {
            return false;
        }
        if (final_save_timeout.count() <= 0) {
            return false;
        }
        return true;
    }

    AutosaveConfig autosave_config() const {
        AutosaveConfig ac;
        ac.interval = autosave_interval;
        ac.stop_grace = stop_grace;
        ac.failure_alert_threshold = failure_alert_threshold;
        return ac;
    }
};

} // namespace persist
} // namespace duodb
