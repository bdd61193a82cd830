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
#include <set>
#include <string>
#include <vector>
#include "config.h"
#include "deferred_update.h"
#include "record_set.h"
#include "segment_size.h"

namespace recset {

    namespace persist {
        class StorageAdapter;
    }

    /**
     * Bulk load session for one file of records.
     *
     * Records arrive in ascending record number order above every record
     * already in the file. Their index entries are buffered in a
     * DeferredUpdate and flushed at the deferred update points of the
     * geometry, when the buffer fills, and in finish(). The existence
     * bitmap of the file is kept in the same storage under existence_key().
     *
     * Entries of an index are stored under index_key(index, value).
     */
    class BulkLoad {
    public:
        // index name -> values of that index for one record
        using IndexValues = std::map<std::string, std::vector<std::string>>;

        BulkLoad(persist::StorageAdapter& adapter, const SegmentSize& config,
                 const std::vector<std::string>& index_names,
                 const DeferredUpdateConfig& limits = DeferredUpdateConfig::defaults());

        // Throws RangeError when r is negative, already exists or is not
        // above the last record loaded, ConfigError for an unknown index.
        // A record that throws leaves the session as it was, so it can be
        // offered again: ResourceExhausted when its entries alone exceed
        // the buffer, StorageError from a failed early flush.
        void add_record(RecordNumber r, const IndexValues& values);

        // Flushes pending entries; returns the statistics of this flush
        FlushStats flush();
        // Final flush; returns the statistics of the whole session
        FlushStats finish();

        const RecordSet& existence() const { return existence_; }
        std::optional<RecordNumber> high_record() const { return existence_.last(); }
        size_t records_added() const { return records_added_; }
        size_t flush_count() const { return flush_count_; }
        const FlushStats& totals() const { return totals_; }
        const DeferredUpdate& pending() const { return updates_; }

        static std::string existence_key();
        static std::string index_key(const std::string& index_name, const std::string& value);

    private:
        persist::StorageAdapter& adapter_;
        SegmentSize config_;
        std::set<std::string> index_names_;
        DeferredUpdate updates_;
        RecordSet existence_;
        // Segments at or above this hold nothing in storage yet
        SegmentNumber fresh_from_;
        size_t records_added_;
        size_t flush_count_;
        FlushStats totals_;
    };

} // namespace recset
