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
#include <string_view>

#include "core/TaggedType.hpp"

namespace lpd::messages
{
    struct DeviceIdTag;
    // Stable for the whole session of the device
    using DeviceId = core::TaggedType<DeviceIdTag, std::uint32_t>;

    enum class FileType
    {
        Photo,
        Video,
    };

    enum class DeviceKind
    {
        Camera,
        Volume,
        Path, // "this computer"
    };

    enum class BackupLocationType
    {
        Photos,
        Videos,
        PhotosAndVideos,
    };

    enum class CameraErrorCode
    {
        Locked,       // device not configured for transfers
        Inaccessible, // in use by another application
    };

    std::string_view toString(FileType fileType);
    std::string_view toString(DeviceKind kind);
    std::string_view toString(BackupLocationType type);
    std::string_view toString(CameraErrorCode code);

    std::optional<FileType> fileTypeFromString(std::string_view str);
    std::optional<DeviceKind> deviceKindFromString(std::string_view str);
    std::optional<BackupLocationType> backupLocationTypeFromString(std::string_view str);
    std::optional<CameraErrorCode> cameraErrorCodeFromString(std::string_view str);

    bool canBackup(BackupLocationType locationType, FileType fileType);

    // Discovered photo or video, as reported by the scan stage
    struct MediaFileInfo
    {
        std::string uniqueId;
        DeviceId deviceId;
        FileType type{ FileType::Photo };
        std::filesystem::path path;
        std::uint64_t size{};
        std::int64_t modificationTime{}; // seconds since epoch
    };

    // Bytes transferred since the previous chunk, for the file being processed
    struct BytesProgress
    {
        std::uint64_t bytes{};
    };

    struct NamingPreferences
    {
        std::string photoSubfolder;
        std::string videoSubfolder;
        std::string photoRename;
        std::string videoRename;

        bool operator==(const NamingPreferences&) const = default;
    };

    struct SequenceState
    {
        std::uint32_t storedSequenceNo{};
        std::string downloadsTodayDate; // yyyy-MM-dd
        std::uint32_t downloadsTodayCount{};

        bool operator==(const SequenceState&) const = default;
    };
} // namespace lpd::messages
