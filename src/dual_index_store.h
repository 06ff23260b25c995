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

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "record.h"

namespace duodb {

/**
 * In-memory record store indexed both by identifier and by display name.
 *
 * Key design decisions:
 * - Both indexes live in one Indexes value that is edited in place, so each
 *   add or remove costs O(log n).
 * - Structural mutations (add, remove, clear, replace_all) hold the exclusive
 *   side of one shared_mutex for the whole logical operation, so a reader sees
 *   either all of it or none of it.
 * - Lookups hold the shared side only for the map lookup. snapshot_all copies
 *   the record pointers under the shared side and never blocks during I/O.
 *
 * Display names are assumed unique. That is a caller contract: a record
 * whose name is already indexed takes over the name slot (a warning is
 * logged) and stays reachable by id.
 */
class DualIndexStore {
public:
    struct Indexes {
        std::map<RecordId, RecordPtr> by_id;
        std::map<std::string, RecordPtr> by_name;
    };

    // Point-in-time copy of both indexes
    typedef std::shared_ptr<const Indexes> Snapshot;

    DualIndexStore();

    DualIndexStore(const DualIndexStore&) = delete;
    DualIndexStore& operator=(const DualIndexStore&) = delete;

    /**
     * Insert records into both indexes. The batch is all-or-nothing: a null
     * record, a nil id, an id already stored or an id repeated inside the
     * batch rejects every record with std::invalid_argument.
     */
    void add(RecordPtr record);
    void add(const std::vector<RecordPtr>& records);

    // nullptr when absent
    RecordPtr get_by_id(const RecordId& id) const;
    RecordPtr get_by_name(const std::string& name) const;

    // true if at least one record was removed; missing keys are skipped
    bool remove_by_id(const RecordId& id);
    bool remove_by_id(const std::vector<RecordId>& ids);
    bool remove_by_name(const std::string& name);
    bool remove_by_name(const std::vector<std::string>& names);

    void clear();

    /**
     * Replace the whole content with `records`. Validation happens against an
     * empty staging index before anything is published, so on failure the
     * current content is left untouched.
     */
    void replace_all(const std::vector<RecordPtr>& records);

    // Records in identifier order, as of the call
    std::vector<RecordPtr> snapshot_all() const;

    // Copies both maps, O(n); meant for diagnostics and tests
    Snapshot snapshot() const;

    size_t size() const;
    bool empty() const { return size() == 0; }

    // Printable form of a lookup, or a "No record found" line
    std::string describe(const RecordId& id) const;
    std::string describe(const std::string& name) const;

private:
    // Throws std::invalid_argument, `base` is not modified
    static void validate_batch(const Indexes& base, const std::vector<RecordPtr>& records);
    static void insert_unchecked(Indexes& target, const RecordPtr& record);
    static bool erase_by_id(Indexes& target, const RecordId& id);
    static bool erase_by_name(Indexes& target, const std::string& name);

    mutable std::shared_mutex structure_mutex_;
    Indexes state_;
};

} // namespace duodb
