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

#include "messages/Types.hpp"

namespace lpd::messages
{
    // Sent once per download cycle, before any file
    struct RenameDownloadStarted
    {
        NamingPreferences naming;
        SequenceState sequences;
    };

    struct RenameFileData
    {
        DeviceId deviceId;
        std::string uniqueId;
        FileType type{ FileType::Photo };
        std::filesystem::path tempPath;
        std::filesystem::path downloadFolder;
        std::string originalName;
        std::int64_t modificationTime{};
        std::uint32_t downloadCount{};
        std::string jobCode;
    };

    // The worker answers with its updated sequence values
    struct RenameDownloadCompleted
    {
    };

    using RenameRequest = std::variant<RenameDownloadStarted, RenameFileData, RenameDownloadCompleted>;

    struct RenameFileResult
    {
        DeviceId deviceId;
        std::string uniqueId;
        bool success{};
        std::filesystem::path finalPath;
        std::filesystem::path subfolder; // relative to the download folder
        std::string error;
    };

    struct RenameSequencesUpdate
    {
        SequenceState sequences;
    };

    using RenameResult = std::variant<RenameFileResult, RenameSequencesUpdate>;
} // namespace lpd::messages
