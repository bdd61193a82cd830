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

#include "bulk_load.h"
#include "errors.h"
#include "persistence/storage_adapter.h"
#include "util/log.h"
#include <algorithm>

namespace recset {

BulkLoad::BulkLoad(persist::StorageAdapter& adapter, const SegmentSize& config,
                   const std::vector<std::string>& index_names,
                   const DeferredUpdateConfig& limits)
    : adapter_(adapter),
      config_(config),
      updates_(config, limits),
      existence_(config),
      fresh_from_(0),
      records_added_(0),
      flush_count_(0) {
    for (const auto& name : index_names) {
        if (name.empty() || name.find('\0') != std::string::npos) {
            throw ConfigError("index name must be non-empty and free of NUL bytes");
        }
        index_names_.insert(name);
    }
    existence_ = RecordSet::load(adapter_, existence_key(), config_);
    if (auto high = existence_.last()) {
        fresh_from_ = config_.segment_of(*high) + 1;
    }
    debug() << "bulk load over " << index_names_.size() << " indexes, "
            << existence_.count() << " existing records";
}

std::string BulkLoad::existence_key() {
    return std::string(1, '\0') + "existence";
}

std::string BulkLoad::index_key(const std::string& index_name, const std::string& value) {
    std::string key;
    key.reserve(index_name.size() + 1 + value.size());
    key.append(index_name);
    key.push_back('\0');
    key.append(value);
    return key;
}

void BulkLoad::add_record(RecordNumber r, const IndexValues& values) {
    if (r < 0) {
        throw RangeError("negative record number " + std::to_string(r));
    }
    if (existence_.contains(r)) {
        throw RangeError("Cannot reuse record number in deferred update: " + std::to_string(r));
    }
    auto high = existence_.last();
    if (high && r < *high) {
        throw RangeError("record number " + std::to_string(r) +
                         " is below the last loaded record " + std::to_string(*high));
    }
    for (const auto& kv : values) {
        if (index_names_.find(kv.first) == index_names_.end()) {
            throw ConfigError("unknown index '" + kv.first + "'");
        }
    }

    std::vector<std::string> keys;
    keys.push_back(existence_key());
    for (const auto& kv : values) {
        for (const auto& value : kv.second) {
            keys.push_back(index_key(kv.first, value));
        }
    }

    // Nothing about r is kept unless every key is buffered
    try {
        updates_.add_all(keys, r);
    } catch (const ResourceExhausted& e) {
        if (updates_.pending_keys() == 0) {
            throw;
        }
        info() << "bulk load flushing early: " << e.what();
        flush();
        updates_.add_all(keys, r);
    }
    existence_.insert(r);
    ++records_added_;

    if (config_.is_deferred_update_point(r)) {
        flush();
    }
}

FlushStats BulkLoad::flush() {
    FlushOptions options;
    options.fresh_from = fresh_from_;
    FlushStats stats = updates_.flush(adapter_, options);
    if (auto high = existence_.last()) {
        fresh_from_ = std::max(fresh_from_, config_.segment_of(*high) + 1);
    }
    ++flush_count_;
    totals_ += stats;
    return stats;
}

FlushStats BulkLoad::finish() {
    flush();
    info() << "bulk load finished: " << records_added_ << " records, "
           << flush_count_ << " flushes, " << totals_.segments_written << " segments written";
    return totals_;
}

} // namespace recset
