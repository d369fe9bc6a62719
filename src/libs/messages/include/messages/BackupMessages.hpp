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

#include <filesystem>
#include <string>
#include <variant>

#include "messages/Types.hpp"

namespace lpd::messages
{
    // First request sent to a backup worker
    struct BackupArguments
    {
        std::filesystem::path destination;
        BackupLocationType type{ BackupLocationType::PhotosAndVideos };
        bool useIdentifierFolders{}; // files go under <destination>/<identifier>
        std::string photoIdentifier;
        std::string videoIdentifier;
        bool overwrite{};
        bool verify{ true };
    };

    struct BackupFileData
    {
        DeviceId deviceId;
        std::string uniqueId;
        FileType type{ FileType::Photo };
        std::filesystem::path sourcePath;
        std::filesystem::path subfolder;
    };

    using BackupRequest = std::variant<BackupArguments, BackupFileData>;

    struct BackupFileResult
    {
        DeviceId deviceId;
        std::string uniqueId;
        bool success{};
        std::filesystem::path backupPath;
        std::string error;
    };

    using BackupResult = std::variant<BytesProgress, BackupFileResult>;
} // namespace lpd::messages
