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
#include <stdexcept>
#include <string>

namespace recset {

    // Base of every failure raised by the record set engine.
    class RecsetError : public std::runtime_error {
    public:
        explicit RecsetError(const std::string& what) : std::runtime_error(what) {}
    };

    // Offset outside a segment, negative record number, or a record number
    // a bulk load is not allowed to use.
    class RangeError : public RecsetError {
    public:
        explicit RangeError(const std::string& what) : RecsetError(what) {}
    };

    // Malformed segment bytes: wrong length for the declared type, unknown
    // type tag, unsorted list, offset outside the segment.
    class EncodingError : public RecsetError {
    public:
        explicit EncodingError(const std::string& what) : RecsetError(what) {}
    };

    // Deferred update buffer is at its configured memory limit.
    class ResourceExhausted : public RecsetError {
    public:
        explicit ResourceExhausted(const std::string& what) : RecsetError(what) {}
    };

    // Raised by storage adapters. The engine propagates it unchanged.
    class StorageError : public RecsetError {
    public:
        explicit StorageError(const std::string& what) : RecsetError(what) {}
    };

    // Inconsistent segment geometry, or operands built with different
    // geometries.
    class ConfigError : public RecsetError {
    public:
        explicit ConfigError(const std::string& what) : RecsetError(what) {}
    };

} // namespace recset
