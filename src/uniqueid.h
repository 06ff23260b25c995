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

#include <optional>
#include <string>

#include <boost/uuid/uuid.hpp>

namespace duodb {

    /**
     * Records are identified by a random (version 4) 128 bit UUID that is
     * assigned once at construction and never changes afterwards.
     */
    typedef boost::uuids::uuid RecordId;

    // thread safe, each thread owns its own generator
    RecordId generate_record_id();

    std::string to_string(const RecordId& id);

    // nullopt when the text is not a valid UUID
    std::optional<RecordId> parse_record_id(const std::string& text);

} // namespace duodb
