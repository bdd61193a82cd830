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
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>
#include "../config.h"

namespace recset {
namespace persist {

// One pending change to an offset of a segment
struct RunOp {
    Offset offset;
    bool insert;
};

struct RunEntry {
    std::string index_value;
    SegmentNumber segment = 0;
    std::vector<RunOp> ops;
};

/**
 * Writes one sorted run: the entries of a deferred update buffer in
 * ascending (index value, segment) order. The run is written to
 * "<path>.tmp" and only appears under its own name after commit().
 *
 * Layout, integers big-endian:
 *   header  magic "RSRN", u32 version
 *   entry   u32 value length, value bytes, u64 segment, u32 op count,
 *           then per op a u32 offset and a flag byte (1 insert, 0 remove)
 */
class SortedRunWriter {
public:
    static constexpr uint32_t kVersion = 1;

    // Throws StorageError when the file cannot be created
    explicit SortedRunWriter(const std::string& path);
    ~SortedRunWriter();

    SortedRunWriter(const SortedRunWriter&) = delete;
    SortedRunWriter& operator=(const SortedRunWriter&) = delete;

    // Throws EncodingError unless the key sorts after the previous entry,
    // StorageError on a write failure
    void append(const std::string& index_value, SegmentNumber segment,
                const std::vector<RunOp>& ops);

    // fsync and rename into place. Throws StorageError.
    void commit();

    const std::string& path() const { return path_; }
    size_t entries() const { return entries_; }

private:
    void write(const uint8_t* data, size_t len);

    std::string path_;
    std::string temp_path_;
    std::ofstream out_;
    std::string last_value_;
    SegmentNumber last_segment_;
    size_t entries_;
    bool committed_;
};

/**
 * Sequential reader of a run written by SortedRunWriter.
 */
class SortedRunReader {
public:
    // Throws StorageError when the run cannot be opened, EncodingError
    // for a bad header
    explicit SortedRunReader(const std::string& path);

    SortedRunReader(const SortedRunReader&) = delete;
    SortedRunReader& operator=(const SortedRunReader&) = delete;

    // Reads the next entry; false at the end of the run. Throws
    // EncodingError for a truncated, malformed or unordered entry.
    bool next(RunEntry& entry);

    const std::string& path() const { return path_; }
    size_t entries_read() const { return entries_read_; }

private:
    void read(uint8_t* data, size_t len, const char* what);

    std::string path_;
    std::ifstream in_;
    size_t remaining_;
    std::string last_value_;
    SegmentNumber last_segment_;
    size_t entries_read_;
};

} // namespace persist
} // namespace recset
