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
#include <atomic>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <system_error>
#include <thread>

#include "../../src/persistence/persistence_controller.h"
#include "../../src/persistence/record_codec.h"
#include "test_helpers.h"

using namespace duodb;
using namespace duodb::persist;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class PersistenceControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = test::create_temp_dir("duodb_controller");
        data_file_ = (fs::path(test_dir_) / "data" / "records.json").string();
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    std::string test_dir_;
    std::string data_file_;
    PersistenceController controller_;
};

TEST_F(PersistenceControllerTest, SaveCreatesDirectoryAndFile) {
    DualIndexStore store;
    store.add(test::sample_records());

    controller_.save(store, data_file_);

    ASSERT_TRUE(fs::exists(data_file_));
    EXPECT_FALSE(fs::exists(data_file_ + ".tmp"));
    EXPECT_EQ(RecordCodec::decode(test::read_file(data_file_)).size(), 3u);

    auto s = controller_.stats();
    EXPECT_EQ(s.saves, 1u);
    EXPECT_EQ(s.last_save_records, 3u);
    EXPECT_GT(s.last_save_bytes, 0u);
}

TEST_F(PersistenceControllerTest, RoundTripIntoFreshStore) {
    DualIndexStore store;
    auto records = test::sample_records();
    store.add(records);
    controller_.save(store, data_file_);

    DualIndexStore restored;
    controller_.load(restored, data_file_);

    ASSERT_EQ(restored.size(), records.size());
    for (const auto& r : records) {
        RecordPtr back = restored.get_by_id(r->id());
        ASSERT_NE(back, nullptr);
        EXPECT_EQ(*back, *r);
        EXPECT_EQ(restored.get_by_name(r->name()), back);
    }
}

TEST_F(PersistenceControllerTest, EmptyStoreSavesEmptyArray) {
    DualIndexStore store;
    controller_.save(store, data_file_);
    EXPECT_EQ(test::read_file(data_file_), "[]");

    DualIndexStore restored;
    restored.add(make_record("Stale", 1));
    controller_.load(restored, data_file_);
    EXPECT_EQ(restored.size(), 0u);
}

TEST_F(PersistenceControllerTest, SaveReplacesPriorContent) {
    DualIndexStore store;
    store.add(test::sample_records());
    controller_.save(store, data_file_);

    store.remove_by_name("Bob");
    controller_.save(store, data_file_);

    DualIndexStore restored;
    controller_.load(restored, data_file_);
    EXPECT_EQ(restored.size(), 2u);
    EXPECT_EQ(restored.get_by_name("Bob"), nullptr);
}

TEST_F(PersistenceControllerTest, LoadReplacesExistingContent) {
    DualIndexStore source;
    source.add(test::sample_records());
    controller_.save(source, data_file_);

    DualIndexStore target;
    target.add(make_record("Zed", 99));
    controller_.load(target, data_file_);

    EXPECT_EQ(target.size(), 3u);
    EXPECT_EQ(target.get_by_name("Zed"), nullptr);
}

TEST_F(PersistenceControllerTest, LoadMissingFileIsNotFound) {
    DualIndexStore store;
    try {
        controller_.load(store, data_file_);
        FAIL() << "expected std::system_error";
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code(), std::errc::no_such_file_or_directory);
    }
    EXPECT_EQ(controller_.stats().failures, 1u);
}

TEST_F(PersistenceControllerTest, EmptyPathIsInvalid) {
    DualIndexStore store;
    EXPECT_THROW(controller_.save(store, ""), std::invalid_argument);
    EXPECT_THROW(controller_.load(store, ""), std::invalid_argument);
}

TEST_F(PersistenceControllerTest, ZeroLengthFileLoadsNothing) {
    fs::create_directories(fs::path(data_file_).parent_path());
    test::write_file(data_file_, "");

    DualIndexStore store;
    store.add(make_record("Stale", 1));
    controller_.load(store, data_file_);
    EXPECT_TRUE(store.empty());
}

TEST_F(PersistenceControllerTest, DuplicateIdsInFileFailWholeLoad) {
    const std::string dup = R"([
      {"Name": "A", "Age": 1, "ID": "00000000-0000-4000-8000-000000000001", "Time Created": "2024-01-01 00:00:00"},
      {"Name": "B", "Age": 2, "ID": "00000000-0000-4000-8000-000000000001", "Time Created": "2024-01-01 00:00:00"}
    ])";
    fs::create_directories(fs::path(data_file_).parent_path());
    test::write_file(data_file_, dup);

    DualIndexStore store;
    auto keep = make_record("Keep", 5);
    store.add(keep);

    EXPECT_THROW(controller_.load(store, data_file_), std::invalid_argument);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.get_by_name("Keep"), keep);
}

TEST_F(PersistenceControllerTest, MalformedFileLeavesStoreUntouched) {
    fs::create_directories(fs::path(data_file_).parent_path());
    test::write_file(data_file_, "[{\"Name\": \"A\",");

    DualIndexStore store;
    store.add(make_record("Keep", 5));
    EXPECT_THROW(controller_.load(store, data_file_), std::runtime_error);
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(PersistenceControllerTest, CancelledSaveKeepsPreviousFile) {
    DualIndexStore store;
    store.add(test::sample_records());
    controller_.save(store, data_file_);
    const std::string before = test::read_file(data_file_);

    store.add(make_record("Dave", 40));
    std::atomic<bool> cancel{true};
    try {
        controller_.save(store, data_file_, &cancel);
        FAIL() << "expected std::system_error";
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code(), std::errc::operation_canceled);
    }

    EXPECT_EQ(test::read_file(data_file_), before);
    EXPECT_FALSE(fs::exists(data_file_ + ".tmp"));
}

TEST_F(PersistenceControllerTest, SaveIntoUnwritableLocationThrows) {
    // A regular file where the parent directory should be
    std::string blocker = (fs::path(test_dir_) / "blocker").string();
    test::write_file(blocker, "x");

    DualIndexStore store;
    store.add(make_record("A", 1));
    EXPECT_THROW(controller_.save(store, blocker + "/records.json"), std::system_error);
    EXPECT_EQ(controller_.stats().failures, 1u);
}

TEST_F(PersistenceControllerTest, TrySaveForSucceedsWhenIdle) {
    DualIndexStore store;
    store.add(make_record("A", 1));
    EXPECT_TRUE(controller_.try_save_for(store, data_file_, 100ms));
    EXPECT_TRUE(fs::exists(data_file_));
}

TEST_F(PersistenceControllerTest, ConcurrentSavesNeverTearTheFile) {
    DualIndexStore store;
    store.add(test::sample_records());

    std::atomic<bool> done{false};
    std::thread writer([&]{
        for (int i = 0; i < 50; i++) {
            store.add(make_record("w" + std::to_string(i), i));
        }
        done = true;
    });

    std::vector<std::thread> savers;
    for (int t = 0; t < 3; t++) {
        savers.emplace_back([&]{
            while (!done.load()) {
                controller_.save(store, data_file_);
            }
        });
    }
    writer.join();
    for (auto& t : savers) t.join();
    controller_.save(store, data_file_);

    // Always a complete, decodable array
    auto records = RecordCodec::decode(test::read_file(data_file_));
    EXPECT_EQ(records.size(), store.size());
}

TEST_F(PersistenceControllerTest, ExportImportSingleRecord) {
    auto r = make_record("Solo", 42);
    std::string path = (fs::path(test_dir_) / "export" / "solo.json").string();

    controller_.export_record(*r, path);
    RecordPtr back = controller_.import_record(path);

    ASSERT_NE(back, nullptr);
    EXPECT_EQ(*back, *r);
    EXPECT_THROW(controller_.import_record(path + ".missing"), std::system_error);
}

TEST_F(PersistenceControllerTest, EnsureHelpersAreIdempotentAndNormalize) {
    std::string dir = test_dir_ + "/x/../y";
    std::string ensured = PersistenceController::ensure_directory(dir);
    EXPECT_EQ(ensured, (fs::path(test_dir_) / "y").lexically_normal().string());
    EXPECT_EQ(PersistenceController::ensure_directory(dir), ensured);

    std::string file = PersistenceController::ensure_file(ensured + "/sub/data.json");
    EXPECT_TRUE(fs::exists(file));
    test::write_file(file, "[]");
    EXPECT_EQ(PersistenceController::ensure_file(file), file);
    EXPECT_EQ(test::read_file(file), "[]");
}

TEST_F(PersistenceControllerTest, RemoveFileReportsWhetherItExisted) {
    DualIndexStore store;
    controller_.save(store, data_file_);

    EXPECT_TRUE(PersistenceController::remove_file(data_file_));
    EXPECT_FALSE(fs::exists(data_file_));
    EXPECT_FALSE(PersistenceController::remove_file(data_file_));
}
