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
#include <string>
#include <vector>
#include <cstdint>
#include <ctime>
#include "../segment_size.h"

namespace recset {
namespace persist {

/**
 * IndexManifest - JSON file describing a dataset
 *
 * Contains:
 * - Segment geometry the dataset was built with
 * - Names of its indexes
 *
 * Written atomically via temp + rename pattern. A geometry cannot change
 * once data exists, so reopening with another one is refused.
 */
class IndexManifest {
public:
    explicit IndexManifest(const std::string& data_dir);
    ~IndexManifest() = default;

    /**
     * Loads the manifest of data_dir, or creates it for config and
     * index_names. Throws ConfigError when the stored geometry differs and
     * StorageError when the manifest cannot be written.
     */
    static IndexManifest open(const std::string& data_dir, const SegmentSize& config,
                              const std::vector<std::string>& index_names = {});

    // Load manifest from disk (returns false if missing/corrupt)
    bool load();

    // Store manifest to disk (atomic write via temp + rename)
    bool store();

    // Throws ConfigError unless config equals the recorded geometry
    void check_compatible(const SegmentSize& config) const;

    // Getters
    const std::string& get_data_dir() const { return data_dir_; }
    uint32_t version() const { return version_; }
    time_t created_unix() const { return created_unix_; }
    const SegmentSize& geometry() const { return geometry_; }
    const std::vector<std::string>& indexes() const { return indexes_; }
    bool has_index(const std::string& name) const;

    void set_geometry(const SegmentSize& geometry) { geometry_ = geometry; }

    // Returns false when the index is already listed
    bool add_index(const std::string& name);

    std::string get_manifest_path() const;

private:
    std::string data_dir_;

    uint32_t version_ = 1;
    time_t created_unix_ = 0;
    SegmentSize geometry_;
    std::vector<std::string> indexes_;

    // JSON serialization helpers
    std::string to_json() const;
    bool from_json(const std::string& json_str);
};

} // namespace persist
} // namespace recset
