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

#include "messages/Types.hpp"

#include <array>
#include <utility>

namespace lpd::messages
{
    namespace
    {
        template<typename T, std::size_t N>
        std::optional<T> fromString(const std::array<std::pair<T, std::string_view>, N>& names, std::string_view str)
        {
            for (const auto& [value, name] : names)
            {
                if (name == str)
                    return value;
            }

            return std::nullopt;
        }

        template<typename T, std::size_t N>
        std::string_view toString(const std::array<std::pair<T, std::string_view>, N>& names, T value)
        {
            for (const auto& [entry, name] : names)
            {
                if (entry == value)
                    return name;
            }

            return "";
        }

        constexpr std::array<std::pair<FileType, std::string_view>, 2> fileTypeNames{ {
            { FileType::Photo, "photo" },
            { FileType::Video, "video" },
        } };

        constexpr std::array<std::pair<DeviceKind, std::string_view>, 3> deviceKindNames{ {
            { DeviceKind::Camera, "camera" },
            { DeviceKind::Volume, "volume" },
            { DeviceKind::Path, "path" },
        } };

        constexpr std::array<std::pair<BackupLocationType, std::string_view>, 3> backupLocationTypeNames{ {
            { BackupLocationType::Photos, "photos" },
            { BackupLocationType::Videos, "videos" },
            { BackupLocationType::PhotosAndVideos, "photos_and_videos" },
        } };

        constexpr std::array<std::pair<CameraErrorCode, std::string_view>, 2> cameraErrorCodeNames{ {
            { CameraErrorCode::Locked, "locked" },
            { CameraErrorCode::Inaccessible, "inaccessible" },
        } };
    } // namespace

    std::string_view toString(FileType fileType)
    {
        return toString(fileTypeNames, fileType);
    }

    std::string_view toString(DeviceKind kind)
    {
        return toString(deviceKindNames, kind);
    }

    std::string_view toString(BackupLocationType type)
    {
        return toString(backupLocationTypeNames, type);
    }

    std::string_view toString(CameraErrorCode code)
    {
        return toString(cameraErrorCodeNames, code);
    }

    std::optional<FileType> fileTypeFromString(std::string_view str)
    {
        return fromString(fileTypeNames, str);
    }

    std::optional<DeviceKind> deviceKindFromString(std::string_view str)
    {
        return fromString(deviceKindNames, str);
    }

    std::optional<BackupLocationType> backupLocationTypeFromString(std::string_view str)
    {
        return fromString(backupLocationTypeNames, str);
    }

    std::optional<CameraErrorCode> cameraErrorCodeFromString(std::string_view str)
    {
        return fromString(cameraErrorCodeNames, str);
    }

    bool canBackup(BackupLocationType locationType, FileType fileType)
    {
        switch (locationType)
        {
        case BackupLocationType::Photos:
            return fileType == FileType::Photo;
        case BackupLocationType::Videos:
            return fileType == FileType::Video;
        case BackupLocationType::PhotosAndVideos:
            return true;
        }

        return false;
    }
} // namespace lpd::messages
