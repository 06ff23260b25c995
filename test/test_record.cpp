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

#include <gtest/gtest.h>
#include <regex>
#include <set>
#include <sstream>

#include "../src/record.h"
#include "../src/uniqueid.h"

using namespace duodb;

TEST(RecordTest, NewRecordGetsFreshIdAndTimestamp) {
    Record a("Alice", 31);
    Record b("Alice", 31);

    EXPECT_FALSE(a.id().is_nil());
    EXPECT_NE(a.id(), b.id());
    EXPECT_EQ(a.name(), "Alice");
    EXPECT_EQ(a.age(), 31);

    std::regex ts("\\d{4}-\\d{2}-\\d{2} \\d{2}:\\d{2}:\\d{2}");
    EXPECT_TRUE(std::regex_match(a.created_at(), ts)) << a.created_at();
}

TEST(RecordTest, RebuiltRecordKeepsStoredFields) {
    auto id = parse_record_id("1b4e28ba-2fa1-11d2-883f-0016d3cca427");
    ASSERT_TRUE(id.has_value());

    Record r(*id, "Bob", 50, "2024-01-02 03:04:05");
    EXPECT_EQ(r.id(), *id);
    EXPECT_EQ(r.created_at(), "2024-01-02 03:04:05");
    EXPECT_EQ(to_string(r.id()), "1b4e28ba-2fa1-11d2-883f-0016d3cca427");
}

TEST(RecordTest, SettersChangeOnlyDisplayFields) {
    Record r("Carol", 22);
    RecordId id = r.id();
    std::string created = r.created_at();

    r.set_name("Caroline");
    r.set_age(23);

    EXPECT_EQ(r.name(), "Caroline");
    EXPECT_EQ(r.age(), 23);
    EXPECT_EQ(r.id(), id);
    EXPECT_EQ(r.created_at(), created);
}

TEST(RecordTest, Describe) {
    auto id = parse_record_id("00000000-0000-4000-8000-000000000001");
    ASSERT_TRUE(id.has_value());
    Record r(*id, "Dave", 40, "2024-01-01 00:00:00");

    EXPECT_EQ(r.describe(),
              "ID: 00000000-0000-4000-8000-000000000001\nName: Dave\nAge: 40\n");

    std::ostringstream oss;
    oss << r;
    EXPECT_NE(oss.str().find("name=Dave"), std::string::npos);
}

TEST(RecordTest, EqualityComparesAllFields) {
    auto id = generate_record_id();
    Record a(id, "Eve", 30, "2024-01-01 00:00:00");
    Record b(id, "Eve", 30, "2024-01-01 00:00:00");
    Record c(id, "Eve", 31, "2024-01-01 00:00:00");

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(UniqueIdTest, GeneratedIdsAreVersion4AndDistinct) {
    std::set<RecordId> seen;
    for (int i = 0; i < 1000; i++) {
        RecordId id = generate_record_id();
        EXPECT_EQ(id.version(), boost::uuids::uuid::version_random_number_based);
        EXPECT_TRUE(seen.insert(id).second);
    }
}

TEST(UniqueIdTest, ParseRejectsGarbage) {
    EXPECT_FALSE(parse_record_id("").has_value());
    EXPECT_FALSE(parse_record_id("not-a-uuid").has_value());
    EXPECT_FALSE(parse_record_id("1b4e28ba-2fa1-11d2-883f").has_value());

    RecordId id = generate_record_id();
    auto parsed = parse_record_id(to_string(id));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, id);
}
