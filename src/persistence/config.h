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
#include <cstdint>
#include <cstddef>

namespace duodb {
namespace persist {

// Data file configuration
namespace files {
    constexpr const char* kDefaultDataFile = "data/records.json";
    constexpr const char* kTempSuffix = ".tmp";               // sibling file used for atomic replace
    constexpr const char* kDefaultDir = ".";                  // parent used when a path has none
    constexpr int kJsonIndent = 2;
}

// Autosave configuration
namespace autosave {
    constexpr int64_t kDefaultIntervalMs = 1000;              // one save per second
    constexpr int64_t kStopGraceMs = 5000;                    // wait this long for an in-flight save
    constexpr uint32_t kFailureAlertThreshold = 5;            // consecutive failures before SEVERE alert
}

// Lifecycle hook configuration
namespace lifecycle {
    constexpr int64_t kFinalSaveTimeoutMs = 2000;             // never hang shutdown longer than this
    constexpr int64_t kWatcherPollMs = 100;                   // signal watcher poll period
}

} // namespace persist
} // namespace duodb
