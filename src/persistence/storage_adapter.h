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
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "../config.h"

namespace recset {
    namespace persist {

        /**
         * Key/value boundary the engine persists segments through.
         *
         * A key is (index value, segment number); a value is a framed
         * segment record (Segment::encode_framed). Implementations report
         * failures by throwing StorageError, which the engine propagates
         * unchanged.
         */
        class StorageAdapter {
        public:
            virtual ~StorageAdapter() = default;

            // 1) Segment records
            virtual std::optional<Bytes> get(const std::string& index_value,
                                             SegmentNumber segment) const = 0;
            virtual void put(const std::string& index_value, SegmentNumber segment,
                             const Bytes& bytes) = 0;
            // Removing an absent key is not an error
            virtual void remove(const std::string& index_value, SegmentNumber segment) = 0;

            // 2) Segment numbers stored for one index value, ascending
            virtual std::vector<SegmentNumber> segments(const std::string& index_value) const = 0;

            // 3) Transaction bracket. Writes outside a transaction apply
            // immediately.
            virtual void begin() = 0;
            virtual void commit() = 0;
            virtual void rollback() = 0;
            virtual bool in_transaction() const = 0;
        };

        /**
         * Opens a transaction unless the caller already holds one, and rolls
         * it back on destruction unless commit() was reached. Joining an
         * open transaction leaves both commit and rollback to its owner.
         */
        class TransactionScope {
        public:
            explicit TransactionScope(StorageAdapter& adapter);
            ~TransactionScope();

            TransactionScope(const TransactionScope&) = delete;
            TransactionScope& operator=(const TransactionScope&) = delete;

            void commit();
            bool owns_transaction() const { return owned_; }

        private:
            StorageAdapter& adapter_;
            bool owned_;
            bool done_;
        };

    } // namespace persist
} // namespace recset
