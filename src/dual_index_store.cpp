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

#include "dual_index_store.h"

#include <set>
#include <stdexcept>
#include <utility>

#include "util/log.h"

namespace duodb {

DualIndexStore::DualIndexStore() {}

void DualIndexStore::validate_batch(const Indexes& base, const std::vector<RecordPtr>& records) {
    std::set<RecordId> batch_ids;
    for (const auto& r : records) {
        if (!r) {
            throw std::invalid_argument("Record cannot be null");
        }
        if (r->id().is_nil()) {
            throw std::invalid_argument("Record id cannot be nil");
        }
        if (base.by_id.count(r->id())) {
            throw std::invalid_argument("Record with id " + to_string(r->id()) + " already exists");
        }
        if (!batch_ids.insert(r->id()).second) {
            throw std::invalid_argument("Record id " + to_string(r->id()) + " appears twice in the batch");
        }
    }
}

void DualIndexStore::insert_unchecked(Indexes& target, const RecordPtr& record) {
    target.by_id[record->id()] = record;

    auto it = target.by_name.find(record->name());
    if (it != target.by_name.end()) {
        warn() << "Duplicate record name '" << record->name() << "': "
               << to_string(it->second->id()) << " is now only reachable by id";
        it->second = record;
    } else {
        target.by_name.emplace(record->name(), record);
    }
}

bool DualIndexStore::erase_by_id(Indexes& target, const RecordId& id) {
    auto it = target.by_id.find(id);
    if (it == target.by_id.end()) return false;

    // The name slot may belong to a newer record with the same name
    auto name_it = target.by_name.find(it->second->name());
    if (name_it != target.by_name.end() && name_it->second == it->second) {
        target.by_name.erase(name_it);
    }
    target.by_id.erase(it);
    return true;
}

bool DualIndexStore::erase_by_name(Indexes& target, const std::string& name) {
    auto it = target.by_name.find(name);
    if (it == target.by_name.end()) return false;

    target.by_id.erase(it->second->id());
    target.by_name.erase(it);
    return true;
}

void DualIndexStore::add(RecordPtr record) {
    add(std::vector<RecordPtr>{std::move(record)});
}

void DualIndexStore::add(const std::vector<RecordPtr>& records) {
    std::unique_lock<std::shared_mutex> lock(structure_mutex_);
    validate_batch(state_, records);
    if (records.empty()) return;

    for (const auto& r : records) {
        insert_unchecked(state_, r);
    }
    trace() << "Added " << records.size() << " record(s), size=" << state_.by_id.size();
}

RecordPtr DualIndexStore::get_by_id(const RecordId& id) const {
    std::shared_lock<std::shared_mutex> lock(structure_mutex_);
    auto it = state_.by_id.find(id);
    return it == state_.by_id.end() ? nullptr : it->second;
}

RecordPtr DualIndexStore::get_by_name(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(structure_mutex_);
    auto it = state_.by_name.find(name);
    return it == state_.by_name.end() ? nullptr : it->second;
}

bool DualIndexStore::remove_by_id(const RecordId& id) {
    std::unique_lock<std::shared_mutex> lock(structure_mutex_);
    return erase_by_id(state_, id);
}

bool DualIndexStore::remove_by_id(const std::vector<RecordId>& ids) {
    std::unique_lock<std::shared_mutex> lock(structure_mutex_);
    bool removed = false;
    for (const auto& id : ids) {
        removed |= erase_by_id(state_, id);
    }
    return removed;
}

bool DualIndexStore::remove_by_name(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(structure_mutex_);
    return erase_by_name(state_, name);
}

bool DualIndexStore::remove_by_name(const std::vector<std::string>& names) {
    std::unique_lock<std::shared_mutex> lock(structure_mutex_);
    bool removed = false;
    for (const auto& name : names) {
        removed |= erase_by_name(state_, name);
    }
    return removed;
}

void DualIndexStore::clear() {
    Indexes old;
    {
        std::unique_lock<std::shared_mutex> lock(structure_mutex_);
        std::swap(state_, old);
    }
    // `old` releases its records here, outside the lock
}

void DualIndexStore::replace_all(const std::vector<RecordPtr>& records) {
    // Stage outside the lock, the store is not touched until the swap
    Indexes staged;
    validate_batch(staged, records);
    for (const auto& r : records) {
        insert_unchecked(staged, r);
    }

    {
        std::unique_lock<std::shared_mutex> lock(structure_mutex_);
        std::swap(state_, staged);
    }
}

std::vector<RecordPtr> DualIndexStore::snapshot_all() const {
    std::shared_lock<std::shared_mutex> lock(structure_mutex_);
    std::vector<RecordPtr> out;
    out.reserve(state_.by_id.size());
    for (const auto& kv : state_.by_id) {
        out.push_back(kv.second);
    }
    return out;
}

DualIndexStore::Snapshot DualIndexStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(structure_mutex_);
    return std::make_shared<const Indexes>(state_);
}

size_t DualIndexStore::size() const {
    std::shared_lock<std::shared_mutex> lock(structure_mutex_);
    return state_.by_id.size();
}

std::string DualIndexStore::describe(const RecordId& id) const {
    RecordPtr r = get_by_id(id);
    return r ? r->describe() : "No record found with ID: " + to_string(id) + "\n";
}

std::string DualIndexStore::describe(const std::string& name) const {
    RecordPtr r = get_by_name(name);
    return r ? r->describe() : "No record found with Name: " + name + "\n";
}

} // namespace duodb
