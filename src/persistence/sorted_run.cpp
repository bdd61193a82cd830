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

#include "sorted_run.h"
#include "platform_fs.h"
#include "../errors.h"
#include "../util/endian.hpp"
#include "../util/log.h"
#include <algorithm>
#include <cstdio>
#include <limits>
#include <tuple>

namespace recset {
namespace persist {

namespace {
    const uint8_t kMagic[4] = {'R', 'S', 'R', 'N'};
    constexpr size_t kHeaderBytes = 8;
    // u32 value length, u64 segment, u32 op count
    constexpr size_t kEntryFixedBytes = 16;
    constexpr size_t kOpBytes = 5;

    bool sorts_after(const std::string& value, SegmentNumber segment,
                     const std::string& last_value, SegmentNumber last_segment) {
        return std::tie(last_value, last_segment) < std::tie(value, segment);
    }
}

SortedRunWriter::SortedRunWriter(const std::string& path)
    : path_(path),
      temp_path_(path + ".tmp"),
      last_segment_(0),
      entries_(0),
      committed_(false) {
    out_.open(temp_path_, std::ios::trunc | std::ios::binary);
    if (!out_.is_open()) {
        throw StorageError("can't create run file " + temp_path_ + ": " + errnoWithDescription());
    }
    uint8_t header[kHeaderBytes];
    std::copy(kMagic, kMagic + 4, header);
    util::store_be32(header + 4, kVersion);
    try {
        write(header, sizeof(header));
    } catch (const StorageError&) {
        out_.close();
        std::remove(temp_path_.c_str());
        throw;
    }
}

SortedRunWriter::~SortedRunWriter() {
    if (!committed_) {
        out_.close();
        std::remove(temp_path_.c_str());
    }
}

void SortedRunWriter::append(const std::string& index_value, SegmentNumber segment,
                             const std::vector<RunOp>& ops) {
    if (entries_ > 0 && !sorts_after(index_value, segment, last_value_, last_segment_)) {
        throw EncodingError("run entry for segment " + std::to_string(segment) +
                            " does not sort after the previous entry");
    }
    if (index_value.size() > std::numeric_limits<uint32_t>::max() ||
        ops.size() > std::numeric_limits<uint32_t>::max()) {
        throw EncodingError("run entry too large");
    }

    uint8_t fixed[kEntryFixedBytes];
    util::store_be32(fixed, static_cast<uint32_t>(index_value.size()));
    write(fixed, 4);
    write(reinterpret_cast<const uint8_t*>(index_value.data()), index_value.size());
    util::store_be64(fixed + 4, segment);
    util::store_be32(fixed + 12, static_cast<uint32_t>(ops.size()));
    write(fixed + 4, 12);

    std::vector<uint8_t> packed(ops.size() * kOpBytes);
    uint8_t* p = packed.data();
    for (const RunOp& op : ops) {
        util::store_be32(p, op.offset);
        p[4] = op.insert ? 1 : 0;
        p += kOpBytes;
    }
    write(packed.data(), packed.size());

    last_value_ = index_value;
    last_segment_ = segment;
    ++entries_;
}

void SortedRunWriter::commit() {
    out_.flush();
    const bool written = out_.good();
    out_.close();

    if (!written) {
        throw StorageError("can't write run file " + temp_path_ + ": " + errnoWithDescription());
    }
    FSResult synced = PlatformFS::fsync_file(temp_path_);
    if (!synced.ok) {
        throw StorageError("can't sync run file " + temp_path_ + ": " +
                           errnoWithDescription(synced.err));
    }
    FSResult moved = PlatformFS::atomic_replace(temp_path_, path_);
    if (!moved.ok) {
        throw StorageError("can't move run file into place at " + path_ + ": " +
                           errnoWithDescription(moved.err));
    }
    committed_ = true;
    trace() << "run " << path_ << " written with " << entries_ << " entries";
}

void SortedRunWriter::write(const uint8_t* data, size_t len) {
    out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
    if (!out_.good()) {
        throw StorageError("can't write run file " + temp_path_ + ": " + errnoWithDescription());
    }
}

SortedRunReader::SortedRunReader(const std::string& path)
    : path_(path),
      remaining_(0),
      last_segment_(0),
      entries_read_(0) {
    auto size = PlatformFS::file_size(path_);
    if (!size.first.ok) {
        throw StorageError("can't open run file " + path_ + ": " +
                           errnoWithDescription(size.first.err));
    }
    in_.open(path_, std::ios::binary);
    if (!in_.is_open()) {
        throw StorageError("can't open run file " + path_ + ": " + errnoWithDescription());
    }
    remaining_ = size.second;

    uint8_t header[kHeaderBytes];
    read(header, sizeof(header), "header");
    if (!std::equal(kMagic, kMagic + 4, header)) {
        throw EncodingError(path_ + " is not a run file");
    }
    const uint32_t version = util::load_be32(header + 4);
    if (version != SortedRunWriter::kVersion) {
        throw EncodingError("run file " + path_ + " has unsupported version " +
                            std::to_string(version));
    }
}

bool SortedRunReader::next(RunEntry& entry) {
    if (remaining_ == 0) {
        return false;
    }

    uint8_t fixed[kEntryFixedBytes];
    read(fixed, 4, "value length");
    const uint32_t value_len = util::load_be32(fixed);
    if (value_len > remaining_) {
        throw EncodingError("run file " + path_ + " entry value of " +
                            std::to_string(value_len) + " bytes overruns the file");
    }
    entry.index_value.resize(value_len);
    read(reinterpret_cast<uint8_t*>(&entry.index_value[0]), value_len, "value");
    read(fixed + 4, 12, "segment");
    entry.segment = util::load_be64(fixed + 4);
    const uint32_t count = util::load_be32(fixed + 12);
    if (static_cast<uint64_t>(count) * kOpBytes > remaining_) {
        throw EncodingError("run file " + path_ + " entry of " + std::to_string(count) +
                            " changes overruns the file");
    }

    std::vector<uint8_t> packed(static_cast<size_t>(count) * kOpBytes);
    read(packed.data(), packed.size(), "changes");
    entry.ops.clear();
    entry.ops.reserve(count);
    for (const uint8_t* p = packed.data(); p != packed.data() + packed.size(); p += kOpBytes) {
        if (p[4] > 1) {
            throw EncodingError("run file " + path_ + " has a bad change flag " +
                                std::to_string(p[4]));
        }
        entry.ops.push_back(RunOp{util::load_be32(p), p[4] == 1});
    }

    if (entries_read_ > 0 &&
        !sorts_after(entry.index_value, entry.segment, last_value_, last_segment_)) {
        throw EncodingError("run file " + path_ + " entries out of order at entry " +
                            std::to_string(entries_read_));
    }
    last_value_ = entry.index_value;
    last_segment_ = entry.segment;
    ++entries_read_;
    return true;
}

void SortedRunReader::read(uint8_t* data, size_t len, const char* what) {
    if (len > remaining_) {
        throw EncodingError("run file " + path_ + " truncated reading " + what);
    }
    if (len == 0) {
        return;
    }
    in_.read(reinterpret_cast<char*>(data), static_cast<std::streamsize>(len));
    if (static_cast<size_t>(in_.gcount()) != len) {
        throw EncodingError("run file " + path_ + " truncated reading " + what);
    }
    remaining_ -= len;
}

} // namespace persist
} // namespace recset
