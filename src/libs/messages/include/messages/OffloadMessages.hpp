/*
 * Copyright (C) 2024 Emeric Poupon
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
#include <string>
#include <variant>
#include <vector>

#include "messages/Types.hpp"

namespace lpd::messages
{
    struct ProximityEntry
    {
        std::string uniqueId;
        std::int64_t time{};
    };

    struct ProximityRequest
    {
        std::vector<ProximityEntry> entries;
        std::uint32_t thresholdSeconds{ 3600 };
    };

    struct DeleteSourceFiles
    {
        DeviceId deviceId;
        std::vector<std::filesystem::path> files;
    };

    struct PurgeDirectories
    {
        std::vector<std::filesystem::path> directories;
    };

    using OffloadRequest = std::variant<ProximityRequest, DeleteSourceFiles, PurgeDirectories>;

    struct ProximityGroup
    {
        std::int64_t start{};
        std::int64_t end{};
        std::vector<std::string> uniqueIds;
    };

    struct ProximityGroups
    {
        std::vector<ProximityGroup> groups;
    };

    struct SourceFilesDeleted
    {
        DeviceId deviceId;
        std::uint32_t deletedCount{};
        std::uint32_t failedCount{};
    };

    struct DirectoriesPurged
    {
        std::uint32_t purgedCount{};
        std::uint32_t failedCount{};
    };

    using OffloadResult = std::variant<ProximityGroups, SourceFilesDeleted, DirectoriesPurged>;
} // namespace lpd::messages
