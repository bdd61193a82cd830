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
#include "storage_adapter.h"
#include <map>
#include <utility>

namespace recset {
    namespace persist {

        /**
         * In-memory adapter. Writes inside a transaction are staged and
         * become visible to other readers only on commit; reads inside the
         * transaction see them.
         */
        class MemoryStorageAdapter : public StorageAdapter {
        public:
            using Key = std::pair<std::string, SegmentNumber>;

            struct Stats {
                size_t gets = 0;
                size_t puts = 0;
                size_t removes = 0;
                size_t commits = 0;
                size_t rollbacks = 0;
            };

            std::optional<Bytes> get(const std::string& index_value,
                                     SegmentNumber segment) const override;
            void put(const std::string& index_value, SegmentNumber segment,
                     const Bytes& bytes) override;
            void remove(const std::string& index_value, SegmentNumber segment) override;
            std::vector<SegmentNumber> segments(const std::string& index_value) const override;

            void begin() override;
            void commit() override;
            void rollback() override;
            bool in_transaction() const override { return in_txn_; }

            // Committed contents
            const std::map<Key, Bytes>& entries() const { return committed_; }
            size_t size() const { return committed_.size(); }
            const Stats& stats() const { return stats_; }
            void reset_stats() { stats_ = Stats{}; }

        private:
            std::map<Key, Bytes> committed_;
            // Null marks a staged removal
            std::map<Key, std::optional<Bytes>> staged_;
            bool in_txn_ = false;
            mutable Stats stats_;
        };

    } // namespace persist
} // namespace recset
