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
#include <cstdint>
#include <mutex>
#include <string>

#include "../dual_index_store.h"
#include "platform_fs.h"

namespace duodb {
namespace persist {

/**
 * PersistenceController - writes a DualIndexStore to a JSON data file and
 * rebuilds a store from one.
 *
 * save() only touches the store to take a snapshot; encoding and I/O run
 * without any store lock. The new content goes to "<path>.tmp", is synced,
 * and is renamed over the target, so a reader of the target sees either the
 * old file or the new one.
 *
 * Saves and loads through one controller are serialized by an internal
 * timed mutex. try_save_for() uses it to give up instead of blocking forever,
 * which is what the shutdown and crash paths need.
 *
 * Errors:
 *   std::invalid_argument  empty path
 *   std::system_error      I/O failure (errno), ENOENT on load of a missing
 *                          file, ECANCELED when a save is cancelled
 *   std::runtime_error     malformed JSON
 */
class PersistenceController {
public:
    struct Stats {
        uint64_t saves = 0;
        uint64_t loads = 0;
        uint64_t failures = 0;
        size_t   last_save_bytes = 0;
        size_t   last_save_records = 0;
        size_t   last_load_records = 0;
    };

    PersistenceController() = default;
    virtual ~PersistenceController() = default;

    PersistenceController(const PersistenceController&) = delete;
    PersistenceController& operator=(const PersistenceController&) = delete;

    /**
     * Replace the file at `path` with the store's current content. When
     * `cancel` is set the save is abandoned before the rename, the previous
     * file stays as it was and std::system_error(ECANCELED) is thrown.
     */
    virtual void save(const DualIndexStore& store, const std::string& path,
                      const std::atomic<bool>* cancel);

    void save(const DualIndexStore& store, const std::string& path) {
        save(store, path, nullptr);
    }

    // Rebuild `store` from the file. The store is untouched if anything fails.
    virtual void load(DualIndexStore& store, const std::string& path);

    // false when another save or load held the controller for longer than `timeout`
    bool try_save_for(const DualIndexStore& store, const std::string& path,
                      std::chrono::milliseconds timeout);

    // Single record as a bare JSON object
    void export_record(const Record& record, const std::string& path);
    RecordPtr import_record(const std::string& path);

    // true if there was a file to delete
    static bool remove_file(const std::string& path);

    // Idempotent, return the normalized absolute path
    static std::string ensure_directory(const std::string& dir);
    static std::string ensure_file(const std::string& path);

    Stats stats() const;

protected:
    // Write `content` next to `path` and atomically rename it into place
    void write_atomically(const std::string& path, const std::string& content,
                          const std::atomic<bool>* cancel);
    std::string read_file(const std::string& path) const;

    void save_locked(const DualIndexStore& store, const std::string& path,
                     const std::atomic<bool>* cancel);

private:
    static void throw_if_failed(const FSResult& r, const std::string& what);
    static void require_path(const std::string& path);

    std::timed_mutex io_mu_;

    std::atomic<uint64_t> saves_{0};
    std::atomic<uint64_t> loads_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<size_t>   last_save_bytes_{0};
    std::atomic<size_t>   last_save_records_{0};
    std::atomic<size_t>   last_load_records_{0};
};

} // namespace persist
} // namespace duodb
