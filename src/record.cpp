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

#include "record.h"

#include <ctime>
#include <sstream>

namespace duodb {

Record::Record(std::string name, int age)
    : id_(generate_record_id()), name_(std::move(name)), age_(age),
      created_at_(now_timestamp()) {}

Record::Record(const RecordId& id, std::string name, int age, std::string created_at)
    : id_(id), name_(std::move(name)), age_(age), created_at_(std::move(created_at)) {}

std::string Record::describe() const {
    std::ostringstream oss;
    oss << "ID: " << to_string(id_) << "\n"
        << "Name: " << name_ << "\n"
        << "Age: " << age_ << "\n";
    return oss.str();
}

bool Record::operator==(const Record& other) const {
    return id_ == other.id_ && name_ == other.name_ && age_ == other.age_ &&
           created_at_ == other.created_at_;
}

std::string Record::now_timestamp() {
    std::time_t t = std::time(nullptr);
    struct tm tmv;
    localtime_r(&t, &tmv);
    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), kTimestampFormat, &tmv);
    return std::string(buf, n);
}

RecordPtr make_record(std::string name, int age) {
    return std::make_shared<const Record>(std::move(name), age);
}

std::ostream& operator<<(std::ostream& os, const Record& r) {
    return os << "Record{id=" << to_string(r.id()) << ", name=" << r.name()
              << ", age=" << r.age() << ", created=" << r.created_at() << "}";
}

} // namespace duodb
