/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of LPD.
 *
 * LPD is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * LPD is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with LPD.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace lpd::stages
{
    // Called after each chunk written, returning false aborts the copy
    using ChunkHandler = std::function<bool(std::uint64_t bytes)>;

    struct FileCopyResult
    {
        bool success{};
        bool aborted{};
        std::string error;
    };

    // The destination is overwritten, and removed if the copy does not complete
    FileCopyResult copyFile(const std::filesystem::path& source, const std::filesystem::path& destination, const ChunkHandler& onChunk);

    bool areFilesIdentical(const std::filesystem::path& fileA, const std::filesystem::path& fileB);

    // "name.ext", then "name_1.ext", "name_2.ext"...
    std::filesystem::path getAvailablePath(const std::filesystem::path& candidate);
} // namespace lpd::stages
