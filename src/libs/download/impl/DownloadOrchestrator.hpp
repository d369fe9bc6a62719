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
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <Wt/WDateTime.h>

#include "BackupManager.hpp"
#include "CopyManager.hpp"
#include "OffloadManager.hpp"
#include "RenameManager.hpp"
#include "ScanManager.hpp"
#include "StageEvents.hpp"
#include "download/BackupDestinationResolver.hpp"
#include "download/DeviceRegistry.hpp"
#include "download/DownloadTracker.hpp"
#include "download/IDownloadOrchestrator.hpp"
#include "download/IPreferences.hpp"
#include "download/JobCodeCoordinator.hpp"
#include "download/TimeRemaining.hpp"

namespace lpd::download
{
    class IDeviceMonitor;

    class DownloadOrchestrator : public IDownloadOrchestrator
    {
    public:
        DownloadOrchestrator(IPreferences& preferences, IDeviceMonitor& deviceMonitor, StageChannels channels);
        ~DownloadOrchestrator() override;
        DownloadOrchestrator(const DownloadOrchestrator&) = delete;
        DownloadOrchestrator& operator=(const DownloadOrchestrator&) = delete;

    private:
        void start(const StartupDevices& devices) override;

        void onCameraAdded(const CameraDescriptor& camera) override;
        void onCameraRemoved(const CameraDescriptor& camera) override;
        void onPartitionMounted(const PartitionDescriptor& partition) override;
        void onPartitionUnmounted(const std::filesystem::path& path) override;
        std::optional<DeviceId> addPathSource(const std::filesystem::path& path) override;
        void removeDevice(DeviceId id) override;

        void setFilesMarked(DeviceId id, std::span<const std::string> uniqueIds, bool marked) override;
        void startDownload(std::optional<DeviceId> id) override;
        void pauseDownload() override;
        void resumeDownload() override;
        bool isDownloadRunning() const override { return !_downloadParticipants.empty(); }
        bool isPaused() const override { return _paused; }

        void provideJobCode(const std::string& code, bool remember) override;
        void cancelJobCode() override;
        void resolveScanError(DeviceId id, ScanErrorDecision decision) override;

        void requestShutdown(std::function<void()> onReady) override;

        Events& getEvents() override { return _events; }
        const DeviceRegistry& getDeviceRegistry() const override { return _registry; }
        const BackupDestinationResolver& getBackupDestinationResolver() const override { return _backupResolver; }
        const DownloadTracker& getDownloadTracker() const override { return _tracker; }

        const DownloadPreferences& getPreferences() const { return _preferences.getDownloadPreferences(); }

        // Devices
        DeviceId registerDevice(DeviceDescription description);
        bool isAutoStartEnabled() const;
        bool shouldScanPartition(const PartitionDescriptor& partition) const;
        void startScan(DeviceId id);
        messages::ScanArguments createScanArguments(const DeviceRecord& device) const;
        void processScanUnmountQueue();
        void onCameraUnmountedForScan(DeviceId id, bool success);
        void onScanCompleted(DeviceId id);

        // Backup destinations
        void setupBackupDestinations(const StartupDevices& devices);
        void addBackupDestination(const std::filesystem::path& path, BackupLocationType type);
        void removeBackupDestination(const std::filesystem::path& path);
        void onBackupResult(DeviceId id, const std::string& uniqueId, bool success, std::string_view error);

        // Download
        void proceedWithDownload(std::span<const DeviceId> devices);
        void onCameraUnmountedForDownload(DeviceId id, bool success);
        void startDownloadPhase2();
        bool checkDownloadFolders(const FileCounts& toDownload);
        bool checkBackupDestinations(const FileCounts& toDownload);
        void startDeviceDownload(DeviceId id);
        void fileFailed(DeviceId id, FileRecord& file, std::string_view problem, std::string_view details);
        void fileFinished(DeviceId id, FileRecord& file, bool fullyBackedUp, bool warning);
        void updateProgress(DeviceId id, std::uint64_t bytesTransferred);
        void checkDeviceCompletion(DeviceId id);
        void completeDevice(DeviceId id);
        void checkGlobalCompletion();
        void completeDownloadCycle();
        bool isExitAllowed(const DownloadCounts& totals) const;
        void requestProximityGroups();
        void purgeTempDirs(DeviceId id);

        // Shutdown
        void continueShutdown();
        void checkShutdownComplete();

        // Stage results
        void onStageEvent(stageEvents::StageEvent&& event);
        void onScanDeviceInfo(const stageEvents::ScanDeviceInfo& event);
        void onScanFilesFound(const stageEvents::ScanFilesFound& event);
        void onScanError(const stageEvents::ScanError& event);
        void onScanFinished(const stageEvents::ScanFinished& event);
        void onCopyBytes(const stageEvents::CopyBytes& event);
        void onCopyTempDirs(const stageEvents::CopyTempDirs& event);
        void onFileCopied(const stageEvents::FileCopied& event);
        void onCopyFinished(const stageEvents::CopyFinished& event);
        void onFileRenamed(const stageEvents::FileRenamed& event);
        void onSequencesUpdated(const stageEvents::SequencesUpdated& event);
        void onRenameFinished(const stageEvents::RenameFinished& event);
        void onBackupBytes(const stageEvents::BackupBytes& event);
        void onFileBackedUp(const stageEvents::FileBackedUp& event);
        void onBackupFinished(const stageEvents::BackupFinished& event);
        void onProximityGroups(const stageEvents::ProximityGroups& event);
        void onOffloadFinished(const stageEvents::OffloadFinished& event);

        void setState(DeviceId id, DeviceState state);
        void reportError(ErrorSeverity severity, std::string problem, std::string details);

        IPreferences& _preferences;
        IDeviceMonitor& _deviceMonitor;
        StageChannels _channels;

        Events _events;
        DeviceRegistry _registry;
        BackupDestinationResolver _backupResolver;
        DownloadTracker _tracker;
        TimeRemaining _timeRemaining;
        TimeCheck _timeCheck;
        JobCodeCoordinator _jobCode;

        ScanManager _scanManager;
        CopyManager _copyManager;
        RenameManager _renameManager;
        BackupManager _backupManager;
        OffloadManager _offloadManager;

        bool _started{};
        bool _startingUp{};
        bool _autoStartAllowed{ true };
        bool _paused{};

        // cameras mounted by another process, unmounted one at a time before their scan
        std::deque<DeviceId> _scanUnmountQueue;
        std::optional<DeviceId> _scanUnmountInProgress;

        // devices waiting for camera unmounts before their download can start
        std::vector<DeviceId> _devicesAwaitingDownload;
        std::set<DeviceId> _downloadUnmountsPending;

        // devices that took part in the current download cycle
        std::set<DeviceId> _downloadParticipants;
        Wt::WDateTime _downloadStartTime;
        std::map<DeviceId, std::vector<std::filesystem::path>> _tempDirs;

        bool _shuttingDown{};
        bool _workersStopRequested{};
        std::function<void()> _onShutdownReady;
    };
} // namespace lpd::download
