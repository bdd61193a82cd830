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

#include "index_manifest.h"
#include "platform_fs.h"
#include "../errors.h"
#include "../util/log.h"
#include "rapidjson/document.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/error/en.h"
#include <fstream>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cstdio>

namespace recset {
namespace persist {

IndexManifest::IndexManifest(const std::string& data_dir)
    : data_dir_(data_dir) {
    created_unix_ = std::time(nullptr);
}

IndexManifest IndexManifest::open(const std::string& data_dir, const SegmentSize& config,
                                  const std::vector<std::string>& index_names) {
    IndexManifest manifest(data_dir);
    bool dirty = false;
    if (manifest.load()) {
        manifest.check_compatible(config);
    } else {
        if (PlatformFS::file_size(manifest.get_manifest_path()).first.ok) {
            throw ConfigError("unreadable manifest " + manifest.get_manifest_path());
        }
        manifest.set_geometry(config);
        dirty = true;
    }
    for (const auto& name : index_names) {
        dirty |= manifest.add_index(name);
    }
    if (dirty && !manifest.store()) {
        throw StorageError("can't write manifest " + manifest.get_manifest_path() +
                           ": " + errnoWithDescription());
    }
    return manifest;
}

std::string IndexManifest::get_manifest_path() const {
    std::filesystem::path p(data_dir_);
    p /= "recset.manifest.json";
    return p.string();
}

bool IndexManifest::has_index(const std::string& name) const {
    return std::find(indexes_.begin(), indexes_.end(), name) != indexes_.end();
}

bool IndexManifest::add_index(const std::string& name) {
    if (has_index(name)) {
        return false;
    }
    indexes_.push_back(name);
    return true;
}

void IndexManifest::check_compatible(const SegmentSize& config) const {
    if (config != geometry_) {
        throw ConfigError("dataset " + data_dir_ + " was built with " + geometry_.describe() +
                          ", not " + config.describe() + "; migration required");
    }
}

bool IndexManifest::load() {
    std::string manifest_path = get_manifest_path();

    std::ifstream file(manifest_path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    std::string json_str = buffer.str();
    if (json_str.empty()) {
        return false;
    }

    return from_json(json_str);
}

bool IndexManifest::store() {
    if (!PlatformFS::ensure_directory(data_dir_).ok) {
        return false;
    }

    std::string manifest_path = get_manifest_path();
    std::string temp_path = manifest_path + ".tmp";

    std::string json_str = to_json();

    std::ofstream file(temp_path, std::ios::trunc | std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    file << json_str;
    file.flush();
    const bool written = file.good();
    file.close();

    if (!written || !PlatformFS::fsync_file(temp_path).ok) {
        std::remove(temp_path.c_str());
        return false;
    }

    // Atomic rename, then the directory entry
    FSResult rename_res = PlatformFS::atomic_replace(temp_path, manifest_path);
    if (!rename_res.ok) {
        std::remove(temp_path.c_str());
        return false;
    }

    return true;
}

std::string IndexManifest::to_json() const {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartObject();

    writer.Key("version");
    writer.Uint(version_);

    writer.Key("created_unix");
    writer.Int64(created_unix_);

    writer.Key("geometry");
    writer.StartObject();
    writer.Key("segment_size");
    writer.Uint64(geometry_.segment_size());
    writer.Key("offset_width");
    writer.Uint64(geometry_.offset_width());
    writer.Key("upper_conversion_limit");
    writer.Uint64(geometry_.upper_conversion_limit());
    writer.Key("lower_conversion_limit");
    writer.Uint64(geometry_.lower_conversion_limit());
    writer.Key("sort_scale");
    writer.Uint64(geometry_.sort_scale());
    writer.EndObject();

    writer.Key("indexes");
    writer.StartArray();
    for (const auto& name : indexes_) {
        writer.String(name.c_str(), static_cast<rapidjson::SizeType>(name.size()));
    }
    writer.EndArray();

    writer.EndObject();

    return buffer.GetString();
}

bool IndexManifest::from_json(const std::string& json_str) {
    rapidjson::Document doc;
    doc.Parse(json_str.c_str());

    if (doc.HasParseError()) {
        error() << "manifest JSON parse error at offset " << doc.GetErrorOffset()
                << ": " << rapidjson::GetParseError_En(doc.GetParseError());
        return false;
    }

    if (!doc.IsObject()) {
        return false;
    }

    if (doc.HasMember("version") && doc["version"].IsUint()) {
        version_ = doc["version"].GetUint();
    }

    if (doc.HasMember("created_unix") && doc["created_unix"].IsInt64()) {
        created_unix_ = doc["created_unix"].GetInt64();
    }

    if (!doc.HasMember("geometry") || !doc["geometry"].IsObject()) {
        error() << "manifest " << get_manifest_path() << " has no geometry";
        return false;
    }
    const auto& geo = doc["geometry"];
    const char* fields[] = {"segment_size", "upper_conversion_limit",
                            "lower_conversion_limit", "sort_scale"};
    for (const char* field : fields) {
        if (!geo.HasMember(field) || !geo[field].IsUint64()) {
            error() << "manifest geometry lacks " << field;
            return false;
        }
    }
    try {
        geometry_ = SegmentSize::from_records(geo["segment_size"].GetUint64(),
                                              geo["upper_conversion_limit"].GetUint64(),
                                              geo["lower_conversion_limit"].GetUint64(),
                                              geo["sort_scale"].GetUint64());
    } catch (const ConfigError& e) {
        error() << "manifest geometry rejected: " << e.what();
        return false;
    }
    if (geo.HasMember("offset_width") && geo["offset_width"].IsUint64() &&
        geo["offset_width"].GetUint64() != geometry_.offset_width()) {
        error() << "manifest offset width " << geo["offset_width"].GetUint64()
                << " does not match segment size " << geometry_.segment_size();
        return false;
    }

    indexes_.clear();
    if (doc.HasMember("indexes") && doc["indexes"].IsArray()) {
        const auto& names = doc["indexes"];
        for (rapidjson::SizeType i = 0; i < names.Size(); i++) {
            if (!names[i].IsString()) continue;
            indexes_.emplace_back(names[i].GetString(), names[i].GetStringLength());
        }
    }

    return true;
}

} // namespace persist
} // namespace recset
