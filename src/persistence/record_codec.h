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
#include <string>
#include <vector>

#include "../record.h"

namespace duodb {
namespace persist {

/**
 * RecordCodec - JSON layout of persisted records
 *
 * A data file is one array, no header and no version:
 *
 *   [
 *     {
 *       "Name": "Alice",
 *       "Age": 31,
 *       "ID": "1b4e28ba-2fa1-11d2-883f-0016d3cca427",
 *       "Time Created": "2025-11-16 09:30:00"
 *     }
 *   ]
 *
 * Decoding throws std::runtime_error naming the offending offset or element.
 */
class RecordCodec {
public:
    static constexpr const char* kName = "Name";
    static constexpr const char* kAge = "Age";
    static constexpr const char* kId = "ID";
    static constexpr const char* kTimeCreated = "Time Created";

    static std::string encode(const std::vector<RecordPtr>& records, bool pretty = true);
    static std::vector<RecordPtr> decode(const std::string& json);

    // Single record as a bare JSON object
    static std::string encode_one(const Record& record, bool pretty = true);
    static RecordPtr decode_one(const std::string& json);
};

} // namespace persist
} // namespace duodb
