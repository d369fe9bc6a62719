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

#include "download/Types.hpp"

#include <array>

namespace lpd::download
{
    namespace
    {
        constexpr std::array deviceStateNames{
            std::string_view{ "registered" },
            std::string_view{ "scanning" },
            std::string_view{ "scanned" },
            std::string_view{ "download_pending" },
            std::string_view{ "downloading" },
            std::string_view{ "completed" },
            std::string_view{ "error" },
            std::string_view{ "removed" },
        };
        static_assert(deviceStateNames.size() == static_cast<std::size_t>(DeviceState::Removed) + 1);

        constexpr std::array fileStatusNames{
            std::string_view{ "discovered" },
            std::string_view{ "thumbnail_pending" },
            std::string_view{ "download_pending" },
            std::string_view{ "copied" },
            std::string_view{ "renamed" },
            std::string_view{ "finished" },
            std::string_view{ "failed" },
        };
        static_assert(fileStatusNames.size() == static_cast<std::size_t>(FileStatus::Failed) + 1);

        constexpr std::array errorSeverityNames{
            std::string_view{ "warning" },
            std::string_view{ "serious error" },
            std::string_view{ "critical error" },
        };
    } // namespace

    std::string_view toString(DeviceState state)
    {
        return deviceStateNames[static_cast<std::size_t>(state)];
    }

    std::string_view toString(FileStatus status)
    {
        return fileStatusNames[static_cast<std::size_t>(status)];
    }

    std::string_view toString(ErrorSeverity severity)
    {
        return errorSeverityNames[static_cast<std::size_t>(severity)];
    }

    void FileCounts::add(FileType type, std::uint64_t size)
    {
        switch (type)
        {
        case FileType::Photo:
            photos += 1;
            photoBytes += size;
            break;
        case FileType::Video:
            videos += 1;
            videoBytes += size;
            break;
        }
    }

    DownloadCounts& DownloadCounts::operator+=(const DownloadCounts& other)
    {
        photosDownloaded += other.photosDownloaded;
        videosDownloaded += other.videosDownloaded;
        photosFailed += other.photosFailed;
        videosFailed += other.videosFailed;
        warnings += other.warnings;

        return *this;
    }

    std::string getFileTypesText(std::size_t photos, std::size_t videos)
    {
        if (photos > 0 && videos > 0)
            return (photos == 1 && videos == 1) ? "photo and video" : "photos and videos";
        if (videos > 0)
            return videos == 1 ? "video" : "videos";

        return photos == 1 ? "photo" : "photos";
    }
} // namespace lpd::download
