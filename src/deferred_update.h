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

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "config.h"
#include "segment_size.h"
#include "persistence/sorted_run.h"

namespace recset {

    namespace persist {
        class StorageAdapter;
    }

    /**
     * Memory limit for a deferred update buffer, and where a full buffer
     * spills sorted runs
     */
    struct DeferredUpdateConfig {
        size_t max_buffer_bytes = RECSET_DEFERRED_MAX_BYTES;   // Default 64MB
        // Empty: a full buffer refuses further changes
        std::string dump_directory;

        /**
         * Create config with defaults, optionally reading from environment
         */
        static DeferredUpdateConfig defaults();

        /**
         * Create config for memory-constrained systems
         */
        static DeferredUpdateConfig low_memory() {
            DeferredUpdateConfig cfg;
            cfg.max_buffer_bytes = 4 * 1024 * 1024;
            return cfg;
        }

        static DeferredUpdateConfig with_limit(size_t bytes) {
            DeferredUpdateConfig cfg;
            cfg.max_buffer_bytes = bytes;
            return cfg;
        }

        static DeferredUpdateConfig spilling_to(const std::string& dir,
                                                size_t bytes = RECSET_DEFERRED_MAX_BYTES) {
            DeferredUpdateConfig cfg;
            cfg.max_buffer_bytes = bytes;
            cfg.dump_directory = dir;
            return cfg;
        }

        // Throws ConfigError
        void validate() const;
    };

    struct FlushOptions {
        // Segments numbered at or above this have nothing stored; their
        // read is skipped
        std::optional<SegmentNumber> fresh_from;
    };

    struct FlushStats {
        size_t keys = 0;
        size_t segments_read = 0;
        size_t reads_skipped = 0;
        size_t segments_written = 0;
        size_t segments_removed = 0;
        size_t offsets_added = 0;
        size_t offsets_removed = 0;
        size_t runs_merged = 0;

        FlushStats& operator+=(const FlushStats& other);
    };

    /**
     * Caller-owned accumulator of index changes for a bulk load.
     *
     * add() and remove() only record the change against its
     * (index value, segment) key. flush() merges every key into storage in
     * ascending key order, each touched segment read and written once,
     * inside one transaction. A failed flush rolls back and keeps the
     * buffers, so calling flush() again is safe; re-applying changes that
     * already reached storage changes nothing.
     *
     * With a dump directory configured, a full buffer is written out as a
     * sorted run and emptied instead of refusing the change. flush() then
     * merges the runs and the buffer in one ascending pass and deletes the
     * runs once the transaction commits.
     *
     * Within one key the last change recorded for an offset wins, across
     * runs as well.
     */
    class DeferredUpdate {
    public:
        explicit DeferredUpdate(const SegmentSize& config,
                                const DeferredUpdateConfig& limits = DeferredUpdateConfig::defaults());
        // Deletes runs that were never flushed
        ~DeferredUpdate();

        DeferredUpdate(const DeferredUpdate&) = delete;
        DeferredUpdate& operator=(const DeferredUpdate&) = delete;

        // Throw RangeError for a negative record number and
        // ResourceExhausted, recording nothing, when the buffer is full
        void add(const std::string& index_value, RecordNumber r);
        void remove(const std::string& index_value, RecordNumber r);

        // Records r under every value, or under none of them when the
        // batch does not fit
        void add_all(const std::vector<std::string>& index_values, RecordNumber r);

        // Writes the buffer to a new sorted run and empties it. Throws
        // ConfigError without a dump directory and StorageError, keeping
        // the buffer, when the run cannot be written.
        void spill();

        FlushStats flush(persist::StorageAdapter& adapter, const FlushOptions& options = FlushOptions());

        // Drops buffered changes and deletes the runs
        void clear();
        bool empty() const { return buffers_.empty() && runs_.empty(); }
        size_t pending_keys() const { return buffers_.size(); }
        size_t pending_bytes() const { return bytes_; }
        size_t spilled_runs() const { return runs_.size(); }
        const std::vector<std::string>& run_paths() const { return runs_; }
        bool needs_flush() const { return exhausted_ || bytes_ >= limits_.max_buffer_bytes; }

        const SegmentSize& config() const { return config_; }
        const DeferredUpdateConfig& limits() const { return limits_; }

    private:
        using PendingOp = persist::RunOp;
        using Key = std::pair<std::string, SegmentNumber>;
        using Buffer = std::vector<PendingOp>;

        void record(const std::string* values, size_t count, RecordNumber r, bool insert);
        size_t cost_of(const std::string* values, size_t count, SegmentNumber segment) const;
        FlushStats merge_runs(persist::StorageAdapter& adapter, const FlushOptions& options);
        FlushStats apply(persist::StorageAdapter& adapter, const Key& key, Buffer& ops,
                         const FlushOptions& options) const;
        std::string next_run_path();
        void remove_runs();

        SegmentSize config_;
        DeferredUpdateConfig limits_;
        std::map<Key, Buffer> buffers_;
        size_t bytes_;
        bool exhausted_;
        // Oldest first
        std::vector<std::string> runs_;
        uint64_t instance_;
        uint64_t run_sequence_;
    };

} // namespace recset
