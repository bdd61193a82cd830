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

#include "memory_storage_adapter.h"
#include "../errors.h"
#include <algorithm>

namespace recset {
    namespace persist {

        std::optional<Bytes> MemoryStorageAdapter::get(const std::string& index_value,
                                                       SegmentNumber segment) const {
            ++stats_.gets;
            const Key key(index_value, segment);
            if (in_txn_) {
                auto staged = staged_.find(key);
                if (staged != staged_.end()) {
                    return staged->second;
                }
            }
            auto it = committed_.find(key);
            if (it == committed_.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        void MemoryStorageAdapter::put(const std::string& index_value, SegmentNumber segment,
                                       const Bytes& bytes) {
            ++stats_.puts;
            Key key(index_value, segment);
            if (in_txn_) {
                staged_[std::move(key)] = bytes;
            } else {
                committed_[std::move(key)] = bytes;
            }
        }

        void MemoryStorageAdapter::remove(const std::string& index_value, SegmentNumber segment) {
            ++stats_.removes;
            Key key(index_value, segment);
            if (in_txn_) {
                staged_[std::move(key)] = std::nullopt;
            } else {
                committed_.erase(key);
            }
        }

        std::vector<SegmentNumber> MemoryStorageAdapter::segments(const std::string& index_value) const {
            std::vector<SegmentNumber> out;
            const Key lo(index_value, 0);
            for (auto it = committed_.lower_bound(lo);
                 it != committed_.end() && it->first.first == index_value; ++it) {
                out.push_back(it->first.second);
            }
            if (in_txn_) {
                for (auto it = staged_.lower_bound(lo);
                     it != staged_.end() && it->first.first == index_value; ++it) {
                    auto pos = std::lower_bound(out.begin(), out.end(), it->first.second);
                    const bool present = pos != out.end() && *pos == it->first.second;
                    if (it->second && !present) {
                        out.insert(pos, it->first.second);
                    } else if (!it->second && present) {
                        out.erase(pos);
                    }
                }
            }
            return out;
        }

        void MemoryStorageAdapter::begin() {
            if (in_txn_) {
                throw StorageError("transaction already active");
            }
            in_txn_ = true;
        }

        void MemoryStorageAdapter::commit() {
            if (!in_txn_) {
                return;
            }
            for (auto& kv : staged_) {
                if (kv.second) {
                    committed_[kv.first] = std::move(*kv.second);
                } else {
                    committed_.erase(kv.first);
                }
            }
            staged_.clear();
            in_txn_ = false;
            ++stats_.commits;
        }

        void MemoryStorageAdapter::rollback() {
            if (!in_txn_) {
                return;
            }
            staged_.clear();
            in_txn_ = false;
            ++stats_.rollbacks;
        }

    } // namespace persist
} // namespace recset
