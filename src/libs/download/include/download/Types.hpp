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

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "messages/Types.hpp"

namespace lpd::download
{
    using messages::BackupLocationType;
    using messages::CameraErrorCode;
    using messages::DeviceId;
    using messages::DeviceKind;
    using messages::FileType;

    enum class DeviceState
    {
        Registered,
        Scanning,
        Scanned,
        DownloadPending,
        Downloading,
        Completed,
        Error,   // scan failed, waiting for a retry or ignore decision
        Removed, // terminal
    };
    std::string_view toString(DeviceState state);

    enum class FileStatus
    {
        Discovered,
        ThumbnailPending,
        DownloadPending,
        Copied,
        Renamed,
        Finished,
        Failed,
    };
    std::string_view toString(FileStatus status);

    enum class ErrorSeverity
    {
        Warning,
        SeriousError,
        CriticalError,
    };
    std::string_view toString(ErrorSeverity severity);

    struct ErrorReport
    {
        ErrorSeverity severity{ ErrorSeverity::Warning };
        std::string problem;
        std::string details;
    };

    enum class ScanErrorDecision
    {
        Retry,
        Ignore,
    };

    struct CameraDescriptor
    {
        std::string model;
        std::string port;
    };

    struct PartitionDescriptor
    {
        std::filesystem::path path;
        std::string displayName;
        std::string iconName;
        bool ejectable{};
    };

    // Lookup table keyed by file type
    template<typename T>
    class FileTypeMap
    {
    public:
        FileTypeMap() = default;
        FileTypeMap(T photo, T video)
            : _values{ std::move(photo), std::move(video) } {}

        T& operator[](FileType type) { return _values[static_cast<std::size_t>(type)]; }
        const T& operator[](FileType type) const { return _values[static_cast<std::size_t>(type)]; }

    private:
        std::array<T, 2> _values{};
    };

    struct FileCounts
    {
        std::size_t photos{};
        std::size_t videos{};
        std::uint64_t photoBytes{};
        std::uint64_t videoBytes{};

        void add(FileType type, std::uint64_t size);
        std::size_t getCount() const { return photos + videos; }
        std::uint64_t getBytes() const { return photoBytes + videoBytes; }

        bool operator==(const FileCounts&) const = default;
    };

    struct DownloadCounts
    {
        std::size_t photosDownloaded{};
        std::size_t videosDownloaded{};
        std::size_t photosFailed{};
        std::size_t videosFailed{};
        std::size_t warnings{};

        std::size_t getDownloaded() const { return photosDownloaded + videosDownloaded; }
        std::size_t getFailed() const { return photosFailed + videosFailed; }
        bool hasErrorsOrWarnings() const { return getFailed() > 0 || warnings > 0; }

        DownloadCounts& operator+=(const DownloadCounts& other);
        bool operator==(const DownloadCounts&) const = default;
    };

    // "photo", "videos", "photos and videos"...
    std::string getFileTypesText(std::size_t photos, std::size_t videos);
} // namespace lpd::download
