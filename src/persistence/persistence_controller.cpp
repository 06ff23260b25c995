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

#include "persistence_controller.h"
#include "record_codec.h"
#include "config.h"
#include "../util/log.h"
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace duodb {
namespace persist {

namespace fs = std::filesystem;

namespace {

std::string parent_dir_of(const std::string& path) {
    std::string parent = fs::path(path).parent_path().string();
    return parent.empty() ? std::string(files::kDefaultDir) : parent;
}

void check_cancel(const std::atomic<bool>* cancel, const std::string& path) {
    if (cancel && cancel->load(std::memory_order_acquire)) {
        throw std::system_error(ECANCELED, std::generic_category(),
                                "save of " + path + " cancelled");
    }
}

} // namespace

void PersistenceController::require_path(const std::string& path) {
    if (path.empty()) {
        throw std::invalid_argument("Data file path must not be empty");
    }
}

void PersistenceController::throw_if_failed(const FSResult& r, const std::string& what) {
    if (!r.ok) {
        throw std::system_error(r.err ? r.err : EIO, std::generic_category(), what);
    }
}

void PersistenceController::save(const DualIndexStore& store, const std::string& path,
                                 const std::atomic<bool>* cancel) {
    require_path(path);
    std::lock_guard<std::timed_mutex> lk(io_mu_);
    save_locked(store, path, cancel);
}

bool PersistenceController::try_save_for(const DualIndexStore& store, const std::string& path,
                                         std::chrono::milliseconds timeout) {
    require_path(path);
    std::unique_lock<std::timed_mutex> lk(io_mu_, std::defer_lock);
    if (!lk.try_lock_for(timeout)) {
        warning() << "Save of " << path << " skipped, controller busy for "
                  << timeout.count() << "ms";
        return false;
    }
    save_locked(store, path, nullptr);
    return true;
}

void PersistenceController::save_locked(const DualIndexStore& store, const std::string& path,
                                        const std::atomic<bool>* cancel) {
    try {
        // The snapshot is the only point where the store is consulted
        std::vector<RecordPtr> records = store.snapshot_all();
        std::string content = RecordCodec::encode(records);
        check_cancel(cancel, path);

        write_atomically(path, content, cancel);

        saves_.fetch_add(1, std::memory_order_relaxed);
        last_save_bytes_.store(content.size(), std::memory_order_relaxed);
        last_save_records_.store(records.size(), std::memory_order_relaxed);
        info() << "Saved " << records.size() << " records to " << path;
    } catch (const std::exception&) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        throw;
    }
}

void PersistenceController::write_atomically(const std::string& path, const std::string& content,
                                             const std::atomic<bool>* cancel) {
    // The rename creates the target, an empty placeholder would be visible to readers
    ensure_directory(parent_dir_of(path));

    const std::string tmp = path + files::kTempSuffix;
    {
        errno = 0;
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::system_error(errno ? errno : EIO, std::generic_category(),
                                    "Failed to open " + tmp);
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            int e = errno ? errno : EIO;
            PlatformFS::remove_file(tmp);
            throw std::system_error(e, std::generic_category(), "Failed to write " + tmp);
        }
    }

    FSResult r = PlatformFS::fsync_file(tmp);
    if (!r.ok) {
        PlatformFS::remove_file(tmp);
        throw_if_failed(r, "Failed to sync " + tmp);
    }

    // Last point where a cancel leaves the old file in place
    if (cancel && cancel->load(std::memory_order_acquire)) {
        PlatformFS::remove_file(tmp);
        check_cancel(cancel, path);
    }

    r = PlatformFS::atomic_replace(tmp, path);
    if (!r.ok) {
        PlatformFS::remove_file(tmp);
        throw_if_failed(r, "Failed to replace " + path);
    }
}

std::string PersistenceController::read_file(const std::string& path) const {
    auto [st, size] = PlatformFS::file_size(path);
    if (!st.ok) {
        if (st.err == ENOENT) {
            throw std::system_error(ENOENT, std::generic_category(),
                                    "Data file not found: " + path);
        }
        throw_if_failed(st, "Failed to stat " + path);
    }
    if (size == 0) {
        return std::string();
    }

    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::system_error(errno ? errno : EIO, std::generic_category(),
                                "Failed to open " + path);
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) {
        throw std::system_error(EIO, std::generic_category(), "Failed to read " + path);
    }
    return oss.str();
}

void PersistenceController::load(DualIndexStore& store, const std::string& path) {
    require_path(path);
    std::lock_guard<std::timed_mutex> lk(io_mu_);
    try {
        std::string content = read_file(path);

        std::vector<RecordPtr> records;
        if (content.empty()) {
            warning() << "Data file " << path << " is empty, loading no records";
        } else {
            records = RecordCodec::decode(content);
        }

        // Duplicate ids fail here, before the store changes
        store.replace_all(records);

        loads_.fetch_add(1, std::memory_order_relaxed);
        last_load_records_.store(records.size(), std::memory_order_relaxed);
        info() << "Loaded " << records.size() << " records from " << path;
    } catch (const std::exception& e) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        error() << "Failed to load " << path << ": " << e.what();
        throw;
    }
}

void PersistenceController::export_record(const Record& record, const std::string& path) {
    require_path(path);
    std::lock_guard<std::timed_mutex> lk(io_mu_);
    write_atomically(path, RecordCodec::encode_one(record), nullptr);
    info() << "Exported record " << to_string(record.id()) << " to " << path;
}

RecordPtr PersistenceController::import_record(const std::string& path) {
    require_path(path);
    std::lock_guard<std::timed_mutex> lk(io_mu_);
    std::string content = read_file(path);
    if (content.empty()) {
        throw std::runtime_error("Record file " + path + " is empty");
    }
    return RecordCodec::decode_one(content);
}

bool PersistenceController::remove_file(const std::string& path) {
    require_path(path);
    FSResult r = PlatformFS::remove_file(path);
    throw_if_failed(r, "Failed to remove " + path);
    return r.err != ENOENT;
}

std::string PersistenceController::ensure_directory(const std::string& dir) {
    require_path(dir);
    const std::string normalized = fs::absolute(dir).lexically_normal().string();
    FSResult r = PlatformFS::ensure_directory(normalized);
    throw_if_failed(r, "Failed to create directory " + normalized);
    return normalized;
}

std::string PersistenceController::ensure_file(const std::string& path) {
    require_path(path);
    const std::string normalized = fs::absolute(path).lexically_normal().string();
    ensure_directory(parent_dir_of(normalized));
    FSResult r = PlatformFS::ensure_file(normalized);
    throw_if_failed(r, "Failed to create file " + normalized);
    return normalized;
}

PersistenceController::Stats PersistenceController::stats() const {
    Stats s;
    s.saves = saves_.load(std::memory_order_relaxed);
    s.loads = loads_.load(std::memory_order_relaxed);
    s.failures = failures_.load(std::memory_order_relaxed);
    s.last_save_bytes = last_save_bytes_.load(std::memory_order_relaxed);
    s.last_save_records = last_save_records_.load(std::memory_order_relaxed);
    s.last_load_records = last_load_records_.load(std::memory_order_relaxed);
    return s;
}

} // namespace persist
} // namespace duodb
