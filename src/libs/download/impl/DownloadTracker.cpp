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

#include "download/DownloadTracker.hpp"

#include <algorithm>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"

namespace lpd::download
{
    void DownloadTracker::initDevice(DeviceId id, const FileCounts& toDownload, const FileTypeMap<std::size_t>& backupDestinations)
    {
        DeviceProgress device;
        device.toDownload = toDownload;
        device.backupDestinations = backupDestinations;
        device.bytesToCopy = toDownload.getBytes();
        device.bytesToBackup = toDownload.photoBytes * backupDestinations[FileType::Photo] + toDownload.videoBytes * backupDestinations[FileType::Video];

        LPD_LOG(PROGRESS, DEBUG, "Device " << id.value() << ": tracking " << toDownload.getCount() << " files, " << device.bytesToCopy << " bytes to copy, " << device.bytesToBackup << " bytes to back up");

        _devices[id] = std::move(device);
    }

    void DownloadTracker::removeDevice(DeviceId id)
    {
        _devices.erase(id);
    }

    void DownloadTracker::addBytesCopied(DeviceId id, std::uint64_t bytes)
    {
        if (DeviceProgress* device{ find(id) })
            device->bytesCopied += bytes;
    }

    void DownloadTracker::addBytesBackedUp(DeviceId id, std::uint64_t bytes)
    {
        if (DeviceProgress* device{ find(id) })
            device->bytesBackedUp += bytes;
    }

    std::uint64_t DownloadTracker::excludeFile(DeviceId id, FileType type, std::uint64_t size)
    {
        DeviceProgress* device{ find(id) };
        if (!device)
            return 0;

        const std::uint64_t copyBytes{ std::min(device->bytesToCopy, size) };
        const std::uint64_t backupBytes{ std::min(device->bytesToBackup, size * device->backupDestinations[type]) };
        device->bytesToCopy -= copyBytes;
        device->bytesToBackup -= backupBytes;

        return copyBytes + backupBytes;
    }

    void DownloadTracker::recordFileProcessed(DeviceId id, FileType type, bool success, bool warning)
    {
        DownloadCounts counts;
        if (success)
        {
            if (type == FileType::Photo)
                counts.photosDownloaded = 1;
            else
                counts.videosDownloaded = 1;
        }
        else
        {
            if (type == FileType::Photo)
                counts.photosFailed = 1;
            else
                counts.videosFailed = 1;
        }
        if (warning)
            counts.warnings = 1;

        _totals += counts;
        if (DeviceProgress* device{ find(id) })
        {
            device->counts += counts;
            device->filesProcessed += 1;
        }
    }

    bool DownloadTracker::expectBackups(DeviceId id, const std::string& uniqueId, std::size_t destinationCount)
    {
        if (destinationCount == 0)
            return true;

        DeviceProgress* device{ find(id) };
        if (!device)
            return true;

        device->pendingBackups[uniqueId] = PendingBackup{ destinationCount, 0, true };
        return false;
    }

    DownloadTracker::BackupOutcome DownloadTracker::recordBackupResult(DeviceId id, const std::string& uniqueId, bool success)
    {
        DeviceProgress* device{ find(id) };
        if (!device)
            return BackupOutcome{};

        auto it{ device->pendingBackups.find(uniqueId) };
        if (it == std::end(device->pendingBackups))
        {
            LPD_LOG(PROGRESS, WARNING, "Device " << id.value() << ": unexpected backup result for file " << uniqueId);
            return BackupOutcome{};
        }

        PendingBackup& pending{ it->second };
        pending.received += 1;
        pending.allSucceeded = pending.allSucceeded && success;

        if (pending.received < pending.expected)
            return BackupOutcome{ false, false };

        const BackupOutcome outcome{ true, pending.allSucceeded };
        device->pendingBackups.erase(it);
        return outcome;
    }

    bool DownloadTracker::hasPendingBackups(DeviceId id) const
    {
        const DeviceProgress* device{ find(id) };
        return device && !device->pendingBackups.empty();
    }

    bool DownloadTracker::hasPendingBackups() const
    {
        return std::any_of(std::cbegin(_devices), std::cend(_devices), [](const auto& entry) { return !entry.second.pendingBackups.empty(); });
    }

    bool DownloadTracker::isDeviceComplete(DeviceId id) const
    {
        const DeviceProgress* device{ find(id) };
        if (!device)
            return false;

        return device->filesProcessed >= device->toDownload.getCount() && device->pendingBackups.empty();
    }

    std::size_t DownloadTracker::getFilesToDownload(DeviceId id) const
    {
        const DeviceProgress* device{ find(id) };
        return device ? device->toDownload.getCount() : 0;
    }

    std::size_t DownloadTracker::getFilesProcessed(DeviceId id) const
    {
        const DeviceProgress* device{ find(id) };
        return device ? device->filesProcessed : 0;
    }

    const FileCounts& DownloadTracker::getFileCounts(DeviceId id) const
    {
        const DeviceProgress* device{ find(id) };
        if (!device)
            throw core::LpdException{ "Device " + std::to_string(id.value()) + " not tracked" };

        return device->toDownload;
    }

    std::uint64_t DownloadTracker::getBytesToTransfer(DeviceId id) const
    {
        const DeviceProgress* device{ find(id) };
        return device ? getTotalBytes(*device) : 0;
    }

    std::uint64_t DownloadTracker::getBytesTransferred(DeviceId id) const
    {
        const DeviceProgress* device{ find(id) };
        return device ? getDoneBytes(*device) : 0;
    }

    float DownloadTracker::getPercentComplete(DeviceId id) const
    {
        const DeviceProgress* device{ find(id) };
        if (!device)
            return 0;

        const std::uint64_t total{ getTotalBytes(*device) };
        if (total == 0)
        {
            const std::size_t fileCount{ device->toDownload.getCount() };
            return fileCount == 0 ? 1 : std::min(1.f, static_cast<float>(device->filesProcessed) / fileCount);
        }

        return static_cast<float>(static_cast<double>(getDoneBytes(*device)) / total);
    }

    float DownloadTracker::getGlobalPercentComplete() const
    {
        std::uint64_t total{};
        std::uint64_t done{};
        for (const auto& [id, device] : _devices)
        {
            total += getTotalBytes(device);
            done += getDoneBytes(device);
        }

        if (total == 0)
            return _devices.empty() ? 0 : 1;

        return static_cast<float>(static_cast<double>(done) / total);
    }

    DownloadCounts DownloadTracker::getCounts(DeviceId id) const
    {
        const DeviceProgress* device{ find(id) };
        return device ? device->counts : DownloadCounts{};
    }

    void DownloadTracker::reset()
    {
        _devices.clear();
        _totals = DownloadCounts{};
    }

    DownloadTracker::DeviceProgress* DownloadTracker::find(DeviceId id)
    {
        auto it{ _devices.find(id) };
        return it != std::end(_devices) ? &it->second : nullptr;
    }

    const DownloadTracker::DeviceProgress* DownloadTracker::find(DeviceId id) const
    {
        auto it{ _devices.find(id) };
        return it != std::cend(_devices) ? &it->second : nullptr;
    }

    std::uint64_t DownloadTracker::getTotalBytes(const DeviceProgress& device)
    {
        return device.bytesToCopy + device.bytesToBackup;
    }

    std::uint64_t DownloadTracker::getDoneBytes(const DeviceProgress& device)
    {
        // chunks of excluded files may have been counted
        return std::min(device.bytesCopied, device.bytesToCopy) + std::min(device.bytesBackedUp, device.bytesToBackup);
    }
} // namespace lpd::download
