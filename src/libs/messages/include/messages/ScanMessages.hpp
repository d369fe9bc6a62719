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
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "messages/Types.hpp"

namespace lpd::messages
{
    struct ScanArguments
    {
        DeviceId deviceId;
        DeviceKind kind{ DeviceKind::Volume };
        std::filesystem::path path;
        std::string cameraModel;
        std::string cameraPort;
        bool ignoreOtherPhotoTypes{};
        std::vector<std::string> ignoredPaths;
    };

    // Retry after a device error
    struct ScanResume
    {
    };

    using ScanRequest = std::variant<ScanArguments, ScanResume>;

    struct ScanDeviceInfo
    {
        std::string displayName;
        std::optional<std::uint64_t> storageCapacity;
        std::optional<std::uint64_t> storageFree;
    };

    struct ScanFilesFound
    {
        std::vector<MediaFileInfo> files;
    };

    // The worker then waits for a ScanResume, or for its stdin to be closed
    struct ScanDeviceError
    {
        CameraErrorCode code{ CameraErrorCode::Inaccessible };
        std::string details;
    };

    using ScanResult = std::variant<ScanDeviceInfo, ScanFilesFound, ScanDeviceError>;
} // namespace lpd::messages
