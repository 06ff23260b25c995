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

#include <memory>
#include <ostream>
#include <string>

#include "uniqueid.h"

namespace duodb {

/**
 * A stored entry: immutable identity plus display fields.
 *
 * The identifier and creation time are fixed at construction. Name and age
 * can be edited on a Record the caller still owns; once a Record is handed to
 * a DualIndexStore it is shared as RecordPtr (pointer to const) and must be
 * removed and re-added to change its name, since the name is an index key.
 */
class Record {
public:
    // Creation timestamp layout, local time, second precision
    static constexpr const char* kTimestampFormat = "%Y-%m-%d %H:%M:%S";

    // New record: fresh random id, created_at stamped now
    Record(std::string name, int age);

    // Rebuild a record read back from storage
    Record(const RecordId& id, std::string name, int age, std::string created_at);

    const RecordId& id() const { return id_; }
    const std::string& name() const { return name_; }
    int age() const { return age_; }
    const std::string& created_at() const { return created_at_; }

    void set_name(std::string name) { name_ = std::move(name); }
    void set_age(int age) { age_ = age; }

    // "ID: ...\nName: ...\nAge: ...\n"
    std::string describe() const;

    bool operator==(const Record& other) const;
    bool operator!=(const Record& other) const { return !(*this == other); }

    // Current local time rendered with kTimestampFormat
    static std::string now_timestamp();

private:
    RecordId id_;
    std::string name_;
    int age_;
    std::string created_at_;
};

typedef std::shared_ptr<const Record> RecordPtr;

RecordPtr make_record(std::string name, int age);

std::ostream& operator<<(std::ostream& os, const Record& r);

} // namespace duodb
