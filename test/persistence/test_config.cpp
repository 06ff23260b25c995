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
#include <chrono>
#include <cstdlib>

#include "../../src/persistence/config.h"
#include "../../src/persistence/store_config.h"

using namespace duodb::persist;
using namespace std::chrono_literals;

class StoreConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("DUODB_DATA_FILE");
        unsetenv("DUODB_AUTOSAVE_ENABLED");
        unsetenv("DUODB_AUTOSAVE_INTERVAL_MS");
        unsetenv("DUODB_STOP_GRACE_MS");
        unsetenv("DUODB_FAILURE_ALERT_THRESHOLD");
        unsetenv("DUODB_INSTALL_HOOKS");
        unsetenv("DUODB_LOG_DIR");
    }
};

TEST_F(StoreConfigTest, CompiledDefaults) {
    StoreConfig cfg;
    EXPECT_EQ(cfg.data_file, files::kDefaultDataFile);
    EXPECT_TRUE(cfg.autosave_enabled);
    EXPECT_EQ(cfg.autosave_interval, 1000ms);
    EXPECT_EQ(cfg.stop_grace, std::chrono::milliseconds(autosave::kStopGraceMs));
    EXPECT_EQ(cfg.failure_alert_threshold, autosave::kFailureAlertThreshold);
    EXPECT_TRUE(cfg.install_lifecycle_hooks);
    EXPECT_TRUE(cfg.log_dir.empty());
    EXPECT_TRUE(cfg.validate());
}

TEST_F(StoreConfigTest, EnvironmentOverrides) {
    setenv("DUODB_DATA_FILE", "/tmp/other.json", 1);
    setenv("DUODB_AUTOSAVE_ENABLED", "0", 1);
    setenv("DUODB_AUTOSAVE_INTERVAL_MS", "250", 1);
    setenv("DUODB_STOP_GRACE_MS", "100", 1);
    setenv("DUODB_FAILURE_ALERT_THRESHOLD", "9", 1);
    setenv("DUODB_INSTALL_HOOKS", "0", 1);
    setenv("DUODB_LOG_DIR", "/tmp/duodb-logs", 1);

    StoreConfig cfg = StoreConfig::defaults();
    EXPECT_EQ(cfg.data_file, "/tmp/other.json");
    EXPECT_FALSE(cfg.autosave_enabled);
    EXPECT_EQ(cfg.autosave_interval, 250ms);
    EXPECT_EQ(cfg.stop_grace, 100ms);
    EXPECT_EQ(cfg.failure_alert_threshold, 9u);
    EXPECT_FALSE(cfg.install_lifecycle_hooks);
    EXPECT_EQ(cfg.log_dir, "/tmp/duodb-logs");
    EXPECT_TRUE(cfg.validate());
}

TEST_F(StoreConfigTest, ValidateRejectsBadValues) {
    StoreConfig cfg;
    cfg.data_file = "";
    EXPECT_FALSE(cfg.validate());

    cfg = StoreConfig();
    cfg.autosave_interval = 0ms;
    EXPECT_FALSE(cfg.validate());

    cfg = StoreConfig();
    cfg.failure_alert_threshold = 0;
    EXPECT_FALSE(cfg.validate());

    cfg = StoreConfig();
    cfg.final_save_timeout = 0ms;
    EXPECT_FALSE(cfg.validate());
}

TEST_F(StoreConfigTest, ManualDisablesBackgroundWork) {
    StoreConfig cfg = StoreConfig::manual("x.json");
    EXPECT_EQ(cfg.data_file, "x.json");
    EXPECT_FALSE(cfg.autosave_enabled);
    EXPECT_FALSE(cfg.install_lifecycle_hooks);
}

TEST_F(StoreConfigTest, AutosaveConfigCarriesSchedule) {
    StoreConfig cfg;
    cfg.autosave_interval = 300ms;
    cfg.stop_grace = 40ms;
    cfg.failure_alert_threshold = 2;

    AutosaveConfig ac = cfg.autosave_config();
    EXPECT_EQ(ac.interval, 300ms);
    EXPECT_EQ(ac.stop_grace, 40ms);
    EXPECT_EQ(ac.failure_alert_threshold, 2u);
}
