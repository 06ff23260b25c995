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

/*
 * Example: a store that keeps growing until it is interrupted
 *
 * Seeds three records, then adds a randomly named record every few
 * milliseconds. Autosave writes the data file once a second; Ctrl-C or
 * SIGTERM triggers a final save before the process exits.
 *
 * Usage: record_generator [data_file] [delay_ms] [max_records]
 *        max_records 0 runs until interrupted
 *        DUODB_LOG_DIR=<dir> writes the log to <dir>/duodb.log
 */

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "../src/dual_index_store.h"
#include "../src/persistence/store_runtime.h"
#include "../src/util/log.h"

using namespace duodb;
using namespace duodb::persist;
using namespace std;

static const vector<string> kNames = {"Alice", "Bob", "Charlie", "David", "Eve", "Fay", "George", "Hannah"};

int main(int argc, char** argv) {
    initLoggingFromEnv();

    StoreConfig config = StoreConfig::defaults();
    if (argc > 1) config.data_file = argv[1];
    const long delay_ms = argc > 2 ? std::strtol(argv[2], nullptr, 10) : 5;
    const long max_records = argc > 3 ? std::strtol(argv[3], nullptr, 10) : 0;

    std::unique_ptr<StoreRuntime> rt;
    try {
        rt = StoreRuntime::open(config);
    } catch (const std::exception& e) {
        cerr << "Cannot open " << config.data_file << ": " << e.what() << "\n";
        return 1;
    }

    DualIndexStore& store = rt->store();
    cout << "Opened " << config.data_file << " with " << store.size() << " records\n";

    store.clear();
    store.add(std::vector<RecordPtr>{make_record("Jason", 19), make_record("Bob", 50), make_record("Sarah", 22)});

    bool ok = rt->guard().run_guarded("generator", [&]{
        std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<size_t> pick(0, kNames.size() - 1);
        std::uniform_int_distribution<int> suffix(0, 999);
        std::uniform_int_distribution<int> age(10, 98);

        for (long n = 0; max_records == 0 || n < max_records; n++) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));

            RecordPtr r = make_record(kNames[pick(gen)] + "-" + std::to_string(suffix(gen)), age(gen));
            store.add(r);
            cout << "Added new record: " << r->name() << ", Age: " << r->age()
                 << ", ID: " << to_string(r->id()) << ", Size: " << store.size() << "\n";
        }
    });

    rt->close();
    cout << "Saved " << store.size() << " records to " << config.data_file << "\n";
    return ok ? 0 : 1;
}
