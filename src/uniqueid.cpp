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

#include "uniqueid.h"

#include <stdexcept>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace duodb {

RecordId generate_record_id() {
    // random_generator is not safe to share between threads
    thread_local boost::uuids::random_generator gen;
    return gen();
}

std::string to_string(const RecordId& id) {
    return boost::uuids::to_string(id);
}

std::optional<RecordId> parse_record_id(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        boost::uuids::string_generator gen;
        return gen(text);
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

} // namespace duodb
