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

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "download/DeviceRegistry.hpp"
#include "download/DownloadEvents.hpp"
#include "download/StageChannels.hpp"
#include "download/Types.hpp"

namespace lpd::download
{
    class BackupDestinationResolver;
    class DownloadTracker;
    class IDeviceMonitor;
    class IPreferences;

    struct StartupDevices
    {
        std::vector<PartitionDescriptor> partitions;
        std::vector<CameraDescriptor> cameras;
    };

    // Drives one pipeline per device through the stage workers
    // All the calls must be made from the loop running the worker channels
    class IDownloadOrchestrator
    {
    public:
        virtual ~IDownloadOrchestrator() = default;

        virtual void start(const StartupDevices& devices) = 0;

        virtual void onCameraAdded(const CameraDescriptor& camera) = 0;
        virtual void onCameraRemoved(const CameraDescriptor& camera) = 0;
        virtual void onPartitionMounted(const PartitionDescriptor& partition) = 0;
        virtual void onPartitionUnmounted(const std::filesystem::path& path) = 0;
        virtual std::optional<DeviceId> addPathSource(const std::filesystem::path& path) = 0;
        virtual void removeDevice(DeviceId id) = 0;

        virtual void setFilesMarked(DeviceId id, std::span<const std::string> uniqueIds, bool marked) = 0;
        // all the scanned devices if not set
        virtual void startDownload(std::optional<DeviceId> id = std::nullopt) = 0;
        virtual void pauseDownload() = 0;
        virtual void resumeDownload() = 0;
        virtual bool isDownloadRunning() const = 0;
        virtual bool isPaused() const = 0;

        virtual void provideJobCode(const std::string& code, bool remember) = 0;
        virtual void cancelJobCode() = 0;
        virtual void resolveScanError(DeviceId id, ScanErrorDecision decision) = 0;

        // onReady is called once the pending sequence values are saved and every worker is gone
        virtual void requestShutdown(std::function<void()> onReady) = 0;

        virtual Events& getEvents() = 0;
        virtual const DeviceRegistry& getDeviceRegistry() const = 0;
        virtual const BackupDestinationResolver& getBackupDestinationResolver() const = 0;
        virtual const DownloadTracker& getDownloadTracker() const = 0;
    };

    std::unique_ptr<IDownloadOrchestrator> createDownloadOrchestrator(IPreferences& preferences, IDeviceMonitor& deviceMonitor, StageChannels channels);
} // namespace lpd::download
