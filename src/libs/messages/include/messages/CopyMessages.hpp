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
    struct CopyFilesArguments
    {
        DeviceId deviceId;
        std::filesystem::path photoDownloadFolder;
        std::filesystem::path videoDownloadFolder;
        std::vector<MediaFileInfo> files;
        bool verifyFile{ true };
    };

    struct CopyPause
    {
    };

    struct CopyResume
    {
    };

    using CopyRequest = std::variant<CopyFilesArguments, CopyPause, CopyResume>;

    // Temporary directories created for the device, to be purged once done
    struct CopyTempDirs
    {
        std::filesystem::path photoTempDir;
        std::filesystem::path videoTempDir;
    };

    struct CopyFileResult
    {
        std::string uniqueId;
        bool success{};
        std::filesystem::path tempPath;
        std::string error;
        std::uint32_t downloadCount{}; // 1-based position of the file in this download
    };

    using CopyResult = std::variant<BytesProgress, CopyTempDirs, CopyFileResult>;
} // namespace lpd::messages
