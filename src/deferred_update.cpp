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

#include "deferred_update.h"
#include "errors.h"
#include "segment.h"
#include "persistence/platform_fs.h"
#include "persistence/storage_adapter.h"
#include "util/log.h"
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <queue>
#include <unistd.h>

namespace recset {

namespace {
    // Map node, key string header and buffer vector header
    constexpr size_t kKeyOverhead = 96;

    std::atomic<uint64_t> next_instance(0);

    // Current entry of one merge source. Sources are numbered oldest
    // first, the in-memory buffer last.
    struct MergeHead {
        std::string index_value;
        SegmentNumber segment;
        size_t source;
    };

    // Orders the priority queue smallest key first; equal keys come out
    // oldest source first
    struct LaterHead {
        bool operator()(const MergeHead& a, const MergeHead& b) const {
            if (a.index_value != b.index_value) {
                return a.index_value > b.index_value;
            }
            if (a.segment != b.segment) {
                return a.segment > b.segment;
            }
            return a.source > b.source;
        }
    };
}

DeferredUpdateConfig DeferredUpdateConfig::defaults() {
    DeferredUpdateConfig cfg;
    if (const char* env = std::getenv("RECSET_DEFERRED_MAX_BYTES")) {
        try {
            cfg.max_buffer_bytes = std::stoull(env);
        } catch (const std::exception&) {
            throw ConfigError(std::string("invalid value for RECSET_DEFERRED_MAX_BYTES: ") + env);
        }
    }
    if (const char* env = std::getenv("RECSET_DEFERRED_DUMP_DIR")) {
        cfg.dump_directory = env;
    }
    cfg.validate();
    return cfg;
}

void DeferredUpdateConfig::validate() const {
    if (max_buffer_bytes < 1024) {
        throw ConfigError("deferred update buffer limit of " + std::to_string(max_buffer_bytes) +
                          " bytes is below the 1KB minimum");
    }
}

FlushStats& FlushStats::operator+=(const FlushStats& other) {
    keys += other.keys;
    segments_read += other.segments_read;
    reads_skipped += other.reads_skipped;
    segments_written += other.segments_written;
    segments_removed += other.segments_removed;
    offsets_added += other.offsets_added;
    offsets_removed += other.offsets_removed;
    runs_merged += other.runs_merged;
    return *this;
}

DeferredUpdate::DeferredUpdate(const SegmentSize& config, const DeferredUpdateConfig& limits)
    : config_(config),
      limits_(limits),
      bytes_(0),
      exhausted_(false),
      instance_(next_instance++),
      run_sequence_(0) {
    limits_.validate();
}

DeferredUpdate::~DeferredUpdate() {
    if (!runs_.empty()) {
        warning() << "deferred update discarded with " << runs_.size() << " unflushed runs";
    }
    remove_runs();
}

void DeferredUpdate::add(const std::string& index_value, RecordNumber r) {
    record(&index_value, 1, r, true);
}

void DeferredUpdate::remove(const std::string& index_value, RecordNumber r) {
    record(&index_value, 1, r, false);
}

void DeferredUpdate::add_all(const std::vector<std::string>& index_values, RecordNumber r) {
    record(index_values.data(), index_values.size(), r, true);
}

size_t DeferredUpdate::cost_of(const std::string* values, size_t count,
                               SegmentNumber segment) const {
    size_t cost = count * sizeof(PendingOp);
    for (size_t i = 0; i < count; ++i) {
        // A value repeated in the batch creates its key once
        if (std::find(values, values + i, values[i]) != values + i) {
            continue;
        }
        if (buffers_.find(Key(values[i], segment)) == buffers_.end()) {
            cost += values[i].size() + kKeyOverhead;
        }
    }
    return cost;
}

void DeferredUpdate::record(const std::string* values, size_t count, RecordNumber r, bool insert) {
    const SegmentNumber segment = config_.segment_of(r);
    const Offset offset = config_.offset_of(r);

    size_t cost = cost_of(values, count, segment);
    if (bytes_ + cost > limits_.max_buffer_bytes && !buffers_.empty() &&
        !limits_.dump_directory.empty()) {
        spill();
        cost = cost_of(values, count, segment);
    }
    if (bytes_ + cost > limits_.max_buffer_bytes) {
        if (!exhausted_) {
            warning() << "deferred update buffer full at " << bytes_ << " bytes over "
                      << buffers_.size() << " keys";
        }
        exhausted_ = true;
        throw ResourceExhausted("deferred update buffer limit of " +
                                std::to_string(limits_.max_buffer_bytes) + " bytes reached");
    }

    for (size_t i = 0; i < count; ++i) {
        Key key(values[i], segment);
        auto it = buffers_.find(key);
        if (it == buffers_.end()) {
            it = buffers_.emplace(std::move(key), Buffer()).first;
        }
        it->second.push_back(PendingOp{offset, insert});
    }
    bytes_ += cost;
}

void DeferredUpdate::spill() {
    if (limits_.dump_directory.empty()) {
        throw ConfigError("deferred update has no dump directory for sorted runs");
    }
    if (buffers_.empty()) {
        return;
    }
    persist::FSResult dir = persist::PlatformFS::ensure_directory(limits_.dump_directory);
    if (!dir.ok) {
        throw StorageError("can't create dump directory " + limits_.dump_directory + ": " +
                           errnoWithDescription(dir.err));
    }

    const std::string path = next_run_path();
    persist::SortedRunWriter writer(path);
    for (const auto& kv : buffers_) {
        writer.append(kv.first.first, kv.first.second, kv.second);
    }
    writer.commit();
    runs_.push_back(path);

    debug() << "spilled " << buffers_.size() << " deferred keys, " << bytes_
            << " bytes to " << path;
    buffers_.clear();
    bytes_ = 0;
    exhausted_ = false;
}

std::string DeferredUpdate::next_run_path() {
    std::filesystem::path p(limits_.dump_directory);
    p /= "recset-" + std::to_string(::getpid()) + "-" + std::to_string(instance_) + "-" +
         std::to_string(run_sequence_++) + ".run";
    return p.string();
}

FlushStats DeferredUpdate::flush(persist::StorageAdapter& adapter, const FlushOptions& options) {
    FlushStats stats;
    if (empty()) {
        return stats;
    }
    debug() << "flushing " << buffers_.size() << " deferred keys, " << bytes_ << " bytes, "
            << runs_.size() << " runs";

    try {
        persist::TransactionScope txn(adapter);
        if (runs_.empty()) {
            for (auto& kv : buffers_) {
                stats += apply(adapter, kv.first, kv.second, options);
            }
        } else {
            stats += merge_runs(adapter, options);
        }
        txn.commit();
    } catch (const std::exception& e) {
        error() << "deferred update flush failed, keeping " << buffers_.size()
                << " keys and " << runs_.size() << " runs for retry: " << e.what();
        throw;
    }

    stats.runs_merged = runs_.size();
    clear();
    debug() << "flushed " << stats.keys << " keys: " << stats.segments_read << " read, "
            << stats.reads_skipped << " skipped, " << stats.segments_written << " written, "
            << stats.segments_removed << " removed";
    return stats;
}

FlushStats DeferredUpdate::merge_runs(persist::StorageAdapter& adapter, const FlushOptions& options) {
    FlushStats stats;
    const size_t memory = runs_.size();

    std::vector<std::unique_ptr<persist::SortedRunReader>> readers;
    std::vector<persist::RunEntry> current(runs_.size());
    std::priority_queue<MergeHead, std::vector<MergeHead>, LaterHead> heads;

    for (size_t i = 0; i < runs_.size(); ++i) {
        readers.push_back(std::make_unique<persist::SortedRunReader>(runs_[i]));
        if (readers[i]->next(current[i])) {
            heads.push(MergeHead{current[i].index_value, current[i].segment, i});
        }
    }
    auto mem = buffers_.begin();
    if (mem != buffers_.end()) {
        heads.push(MergeHead{mem->first.first, mem->first.second, memory});
    }

    while (!heads.empty()) {
        const Key key(heads.top().index_value, heads.top().segment);
        Buffer ops;
        while (!heads.empty() && heads.top().segment == key.second &&
               heads.top().index_value == key.first) {
            const size_t source = heads.top().source;
            heads.pop();
            if (source == memory) {
                ops.insert(ops.end(), mem->second.begin(), mem->second.end());
                if (++mem != buffers_.end()) {
                    heads.push(MergeHead{mem->first.first, mem->first.second, memory});
                }
            } else {
                ops.insert(ops.end(), current[source].ops.begin(), current[source].ops.end());
                if (readers[source]->next(current[source])) {
                    heads.push(MergeHead{current[source].index_value, current[source].segment,
                                         source});
                }
            }
        }
        stats += apply(adapter, key, ops, options);
    }
    return stats;
}

void DeferredUpdate::clear() {
    buffers_.clear();
    bytes_ = 0;
    exhausted_ = false;
    remove_runs();
}

void DeferredUpdate::remove_runs() {
    for (const auto& path : runs_) {
        if (std::remove(path.c_str()) != 0) {
            warning() << "can't remove run file " << path << ": " << errnoWithDescription();
        }
    }
    runs_.clear();
}

FlushStats DeferredUpdate::apply(persist::StorageAdapter& adapter, const Key& key, Buffer& ops,
                                 const FlushOptions& options) const {
    FlushStats stats;
    stats.keys = 1;

    // Stable, so the last change to an offset stays last
    std::stable_sort(ops.begin(), ops.end(),
                     [](const PendingOp& a, const PendingOp& b) { return a.offset < b.offset; });
    std::vector<Offset> inserts;
    std::vector<Offset> removes;
    for (size_t i = 0; i < ops.size(); ++i) {
        if (i + 1 < ops.size() && ops[i + 1].offset == ops[i].offset) {
            continue;
        }
        (ops[i].insert ? inserts : removes).push_back(ops[i].offset);
    }

    const std::string& index_value = key.first;
    const SegmentNumber number = key.second;

    std::optional<Bytes> stored;
    if (options.fresh_from && number >= *options.fresh_from) {
        ++stats.reads_skipped;
    } else {
        stored = adapter.get(index_value, number);
        ++stats.segments_read;
    }

    Segment segment(config_);
    if (stored) {
        segment = Segment::decode_framed(config_, *stored);
        for (Offset off : inserts) {
            if (segment.insert(off)) ++stats.offsets_added;
        }
        for (Offset off : removes) {
            if (segment.remove(off)) ++stats.offsets_removed;
        }
    } else {
        stats.offsets_added = inserts.size();
        segment = Segment::from_offsets(config_, std::move(inserts));
    }

    if (!segment.empty()) {
        adapter.put(index_value, number, segment.encode_framed());
        ++stats.segments_written;
    } else if (stored) {
        adapter.remove(index_value, number);
        ++stats.segments_removed;
    }
    return stats;
}

} // namespace recset
