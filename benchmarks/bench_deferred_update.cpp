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
#include <iostream>
#include <random>
#include "bulk_load.h"
#include "deferred_update.h"
#include "record_set.h"
#include "persistence/memory_storage_adapter.h"
#include "util/log.h"

using namespace recset;
using recset::persist::MemoryStorageAdapter;

class DeferredUpdateBenchmark : public ::testing::Test {
protected:
    void SetUp() override {
        original_level_ = logLevel.load(std::memory_order_relaxed);
        logLevel.store(LOG_WARNING, std::memory_order_relaxed);
    }

    void TearDown() override {
        logLevel.store(original_level_, std::memory_order_relaxed);
    }

    // value -> records, each record carrying one of kValues values
    static constexpr int kValues = 16;
    static constexpr RecordNumber kRecords = 200000;

    static std::string value_of(RecordNumber r) {
        return "v" + std::to_string((r * 7919) % kValues);
    }

    int original_level_;
};

TEST_F(DeferredUpdateBenchmark, DeferredVersusDirect) {
    SegmentSize cfg;

    // Direct: read-modify-write the segment for every entry
    MemoryStorageAdapter direct_store;
    auto start = std::chrono::high_resolution_clock::now();
    for (RecordNumber r = 0; r < kRecords; ++r) {
        const std::string value = value_of(r);
        const SegmentNumber number = cfg.segment_of(r);
        Segment segment(cfg);
        if (auto bytes = direct_store.get(value, number)) {
            segment = Segment::decode_framed(cfg, *bytes);
        }
        segment.insert(cfg.offset_of(r));
        direct_store.put(value, number, segment.encode_framed());
    }
    auto direct_time = std::chrono::high_resolution_clock::now() - start;

    // Deferred: buffer everything, one read and write per segment
    MemoryStorageAdapter deferred_store;
    start = std::chrono::high_resolution_clock::now();
    DeferredUpdate du(cfg);
    for (RecordNumber r = 0; r < kRecords; ++r) {
        du.add(value_of(r), r);
    }
    FlushStats stats = du.flush(deferred_store);
    auto deferred_time = std::chrono::high_resolution_clock::now() - start;

    auto direct_ms = std::chrono::duration_cast<std::chrono::milliseconds>(direct_time).count();
    auto deferred_ms = std::chrono::duration_cast<std::chrono::milliseconds>(deferred_time).count();

    std::cout << "\nDeferred update vs direct (" << kRecords << " records, "
              << kValues << " values):\n";
    std::cout << "  Direct:    " << direct_ms << " ms, "
              << direct_store.stats().puts << " segment writes\n";
    std::cout << "  Deferred:  " << deferred_ms << " ms, "
              << stats.segments_written << " segment writes\n";
    std::cout << "  Speedup:   " << (double)direct_ms / std::max<int64_t>(deferred_ms, 1) << "x\n";

    EXPECT_EQ(direct_store.entries(), deferred_store.entries());
    EXPECT_LT(stats.segments_written, direct_store.stats().puts);
}

TEST_F(DeferredUpdateBenchmark, BulkLoadThroughput) {
    SegmentSize cfg;
    MemoryStorageAdapter adapter;

    auto start = std::chrono::high_resolution_clock::now();
    BulkLoad load(adapter, cfg, {"value"});
    for (RecordNumber r = 0; r < kRecords; ++r) {
        load.add_record(r, {{"value", {value_of(r)}}});
    }
    FlushStats totals = load.finish();
    auto elapsed = std::chrono::high_resolution_clock::now() - start;

    auto total_us = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count();
    std::cout << "\nBulk load (" << kRecords << " records):\n";
    std::cout << "  Total time:  " << total_us << " us\n";
    std::cout << "  Flushes:     " << load.flush_count() << "\n";
    std::cout << "  Writes:      " << totals.segments_written << "\n";
    std::cout << "  Skipped reads: " << totals.reads_skipped << "\n";
    std::cout << "  Throughput:  " << (kRecords * 1000000.0 / std::max<int64_t>(total_us, 1))
              << " records/sec\n";

    EXPECT_EQ(load.existence().count(), static_cast<size_t>(kRecords));
}
