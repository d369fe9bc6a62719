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
#include <map>
#include <string>
#include <unordered_map>

#include "download/Types.hpp"

namespace lpd::download
{
    // Per device and global download accounting
    class DownloadTracker
    {
    public:
        DownloadTracker() = default;
        DownloadTracker(const DownloadTracker&) = delete;
        DownloadTracker& operator=(const DownloadTracker&) = delete;

        // backupDestinations: number of destinations matching each file type
        void initDevice(DeviceId id, const FileCounts& toDownload, const FileTypeMap<std::size_t>& backupDestinations);
        bool contains(DeviceId id) const { return _devices.contains(id); }
        void removeDevice(DeviceId id);

        void addBytesCopied(DeviceId id, std::uint64_t bytes);
        void addBytesBackedUp(DeviceId id, std::uint64_t bytes);
        // The file will not be transferred anymore (copy or rename failure)
        // Returns the number of bytes removed from the device total
        std::uint64_t excludeFile(DeviceId id, FileType type, std::uint64_t size);

        // Terminal state of one file
        void recordFileProcessed(DeviceId id, FileType type, bool success, bool warning);

        // returns true if the file is already settled (no destination)
        bool expectBackups(DeviceId id, const std::string& uniqueId, std::size_t destinationCount);
        struct BackupOutcome
        {
            bool settled{};       // no more result expected for this file
            bool fullyBackedUp{}; // every destination succeeded
        };
        BackupOutcome recordBackupResult(DeviceId id, const std::string& uniqueId, bool success);
        bool hasPendingBackups(DeviceId id) const;
        bool hasPendingBackups() const;

        // every file reached a terminal state and no backup is pending
        bool isDeviceComplete(DeviceId id) const;
        std::size_t getFilesToDownload(DeviceId id) const;
        std::size_t getFilesProcessed(DeviceId id) const;
        const FileCounts& getFileCounts(DeviceId id) const;

        std::uint64_t getBytesToTransfer(DeviceId id) const;
        std::uint64_t getBytesTransferred(DeviceId id) const;
        // in [0, 1]
        float getPercentComplete(DeviceId id) const;
        // weighted by each device byte total
        float getGlobalPercentComplete() const;

        DownloadCounts getCounts(DeviceId id) const;
        // for all the devices since the last reset, including removed ones
        const DownloadCounts& getTotals() const { return _totals; }

        void reset();

    private:
        struct PendingBackup
        {
            std::size_t expected{};
            std::size_t received{};
            bool allSucceeded{ true };
        };

        struct DeviceProgress
        {
            FileCounts toDownload;
            std::uint64_t bytesToCopy{};
            std::uint64_t bytesToBackup{};
            std::uint64_t bytesCopied{};
            std::uint64_t bytesBackedUp{};
            FileTypeMap<std::size_t> backupDestinations;
            std::size_t filesProcessed{};
            DownloadCounts counts;
            std::unordered_map<std::string, PendingBackup> pendingBackups;
        };

        DeviceProgress* find(DeviceId id);
        const DeviceProgress* find(DeviceId id) const;
        static std::uint64_t getTotalBytes(const DeviceProgress& device);
        static std::uint64_t getDoneBytes(const DeviceProgress& device);

        std::map<DeviceId, DeviceProgress> _devices;
        DownloadCounts _totals;
    };
} // namespace lpd::download
