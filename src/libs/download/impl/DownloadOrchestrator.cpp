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

#include "DownloadOrchestrator.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "core/Utils.hpp"
#include "download/IDeviceMonitor.hpp"

namespace lpd::download
{
    namespace
    {
        BackupResolverSettings createBackupResolverSettings(const DownloadPreferences& preferences)
        {
            BackupResolverSettings settings;
            settings.autodetection = preferences.backupDeviceAutodetection;
            settings.photoIdentifier = preferences.photoBackupIdentifier;
            settings.videoIdentifier = preferences.videoBackupIdentifier;
            settings.photoLocation = preferences.backupPhotoLocation;
            settings.videoLocation = preferences.backupVideoLocation;

            return settings;
        }

        // Memory cards and most cameras store their files under DCIM
        bool hasNonEmptyDcimFolder(const std::filesystem::path& path)
        {
            std::error_code ec;
            const std::filesystem::path dcim{ path / "DCIM" };
            if (!std::filesystem::is_directory(dcim, ec))
                return false;

            std::filesystem::directory_iterator itEntry{ dcim, ec };
            return !ec && itEntry != std::filesystem::directory_iterator{};
        }

        std::string getDeviceDisplayName(const DeviceRecord& device)
        {
            if (!device.description.displayName.empty())
                return device.description.displayName;

            return device.description.path.string();
        }
    } // namespace

    std::unique_ptr<IDownloadOrchestrator> createDownloadOrchestrator(IPreferences& preferences, IDeviceMonitor& deviceMonitor, StageChannels channels)
    {
        return std::make_unique<DownloadOrchestrator>(preferences, deviceMonitor, std::move(channels));
    }

    DownloadOrchestrator::DownloadOrchestrator(IPreferences& preferences, IDeviceMonitor& deviceMonitor, StageChannels channels)
        : _preferences{ preferences }
        , _deviceMonitor{ deviceMonitor }
        , _channels{ std::move(channels) }
        , _backupResolver{ createBackupResolverSettings(preferences.getDownloadPreferences()) }
        , _jobCode{ preferences.getJobCodes() }
        , _scanManager{ *_channels.scan, [this](stageEvents::StageEvent&& event) { onStageEvent(std::move(event)); } }
        , _copyManager{ *_channels.copy, [this](stageEvents::StageEvent&& event) { onStageEvent(std::move(event)); } }
        , _renameManager{ *_channels.rename, [this](stageEvents::StageEvent&& event) { onStageEvent(std::move(event)); } }
        , _backupManager{ *_channels.backup, [this](stageEvents::StageEvent&& event) { onStageEvent(std::move(event)); } }
        , _offloadManager{ *_channels.offload, [this](stageEvents::StageEvent&& event) { onStageEvent(std::move(event)); } }
    {
    }

    DownloadOrchestrator::~DownloadOrchestrator()
    {
        _channels.scan->setEventHandler({});
        _channels.copy->setEventHandler({});
        _channels.rename->setEventHandler({});
        _channels.backup->setEventHandler({});
        _channels.offload->setEventHandler({});

        _channels.scan->forceTerminate();
        _channels.copy->forceTerminate();
        _channels.rename->forceTerminate();
        _channels.backup->forceTerminate();
        _channels.offload->forceTerminate();
    }

    void DownloadOrchestrator::start(const StartupDevices& devices)
    {
        if (_started)
        {
            LPD_LOG(DOWNLOAD, WARNING, "Already started");
            return;
        }
        _started = true;

        const ValidityCheck validity{ _preferences.checkValidity() };
        if (!validity.valid)
        {
            LPD_LOG(DOWNLOAD, ERROR, "Invalid preferences: " << validity.diagnostic);
            _autoStartAllowed = false;
            reportError(ErrorSeverity::CriticalError, "Program preferences are invalid", validity.diagnostic);
        }

        if (!_renameManager.launch())
            LPD_LOG(DOWNLOAD, ERROR, "Cannot start the rename worker");
        if (!_offloadManager.launch())
            LPD_LOG(DOWNLOAD, ERROR, "Cannot start the offload worker");

        _startingUp = true;

        setupBackupDestinations(devices);

        const DownloadPreferences& preferences{ getPreferences() };
        for (const std::filesystem::path& source : preferences.sources)
        {
            PartitionDescriptor partition;
            partition.path = source;
            partition.displayName = source.filename().string();
            onPartitionMounted(partition);
        }

        if (!preferences.thisComputerPath.empty())
            addPathSource(preferences.thisComputerPath);

        for (const PartitionDescriptor& partition : devices.partitions)
            onPartitionMounted(partition);

        for (const CameraDescriptor& camera : devices.cameras)
            onCameraAdded(camera);

        _startingUp = false;
    }

    void DownloadOrchestrator::onCameraAdded(const CameraDescriptor& camera)
    {
        if (_shuttingDown)
            return;

        const DownloadPreferences& preferences{ getPreferences() };
        if (!preferences.deviceAutodetection)
        {
            LPD_LOG(DEVICES, DEBUG, "Ignoring camera " << camera.model << ": device autodetection disabled");
            return;
        }
        if (std::find(std::cbegin(preferences.cameraBlacklist), std::cend(preferences.cameraBlacklist), camera.model) != std::cend(preferences.cameraBlacklist))
        {
            LPD_LOG(DEVICES, DEBUG, "Ignoring blacklisted camera " << camera.model);
            return;
        }
        if (const auto id{ _registry.findCamera(camera.model, camera.port) })
        {
            const bool unmounting{ _scanUnmountInProgress == *id || std::find(std::cbegin(_scanUnmountQueue), std::cend(_scanUnmountQueue), *id) != std::cend(_scanUnmountQueue) };
            LPD_LOG(DEVICES, DEBUG, (unmounting ? "Already unmounting camera " : "Camera is known: ") << camera.model);
            return;
        }

        LPD_LOG(DEVICES, INFO, "Detected camera " << camera.model << " on port " << camera.port);

        DeviceDescription description;
        description.kind = DeviceKind::Camera;
        description.displayName = camera.model;
        description.cameraModel = camera.model;
        description.cameraPort = camera.port;
        description.iconName = "camera-photo";
        const DeviceId id{ registerDevice(std::move(description)) };

        // the camera cannot be accessed as long as another process has it mounted
        if (_deviceMonitor.isCameraMounted(camera.model, camera.port))
        {
            _scanUnmountQueue.push_back(id);
            processScanUnmountQueue();
        }
        else
            startScan(id);
    }

    void DownloadOrchestrator::onCameraRemoved(const CameraDescriptor& camera)
    {
        if (const auto id{ _registry.findCamera(camera.model, camera.port) })
            removeDevice(*id);
    }

    void DownloadOrchestrator::onPartitionMounted(const PartitionDescriptor& partition)
    {
        if (_shuttingDown)
            return;

        const DownloadPreferences& preferences{ getPreferences() };
        if (preferences.backupFiles)
        {
            if (const auto capability{ _backupResolver.checkCapability(partition.path) })
            {
                addBackupDestination(partition.path, *capability);
                return;
            }
        }

        if (!shouldScanPartition(partition))
        {
            LPD_LOG(DEVICES, DEBUG, "Not scanning partition " << partition.path);
            return;
        }

        DeviceDescription description;
        description.kind = DeviceKind::Volume;
        description.displayName = partition.displayName;
        description.path = partition.path;
        description.iconName = partition.iconName;
        description.ejectable = partition.ejectable;
        startScan(registerDevice(std::move(description)));
    }

    void DownloadOrchestrator::onPartitionUnmounted(const std::filesystem::path& path)
    {
        if (_backupResolver.contains(path))
            removeBackupDestination(path);

        if (const auto id{ _registry.findByPath(path, DeviceKind::Volume) })
            removeDevice(*id);
    }

    std::optional<DeviceId> DownloadOrchestrator::addPathSource(const std::filesystem::path& path)
    {
        if (_shuttingDown)
            return std::nullopt;

        if (!core::pathUtils::isReadableDirectory(path))
        {
            reportError(ErrorSeverity::Warning, "Cannot download from this computer", "The folder " + path.string() + " cannot be read");
            return std::nullopt;
        }

        if (const auto id{ _registry.findByPath(path, DeviceKind::Path) })
            return id;

        DeviceDescription description;
        description.kind = DeviceKind::Path;
        description.displayName = path.filename().empty() ? path.string() : path.filename().string();
        description.path = path;
        description.iconName = "computer";

        const DeviceId id{ registerDevice(std::move(description)) };
        startScan(id);

        return id;
    }

    void DownloadOrchestrator::removeDevice(DeviceId id)
    {
        if (!_registry.isActive(id))
        {
            LPD_LOG(DEVICES, DEBUG, "Device " << id.value() << " is not active, nothing to remove");
            return;
        }

        const DeviceRecord& device{ _registry.get(id) };
        LPD_LOG(DEVICES, INFO, "Removing device " << id.value() << " '" << getDeviceDisplayName(device) << "' in state '" << toString(device.state) << "'");

        if (_scanManager.isScanning(id))
            _scanManager.stop(id);
        if (_copyManager.isCopying(id))
            _copyManager.stop(id);

        _jobCode.removeWaitingDevice(id);
        std::erase(_scanUnmountQueue, id);
        std::erase(_devicesAwaitingDownload, id);
        const bool wasAwaitingUnmount{ _downloadUnmountsPending.erase(id) > 0 };

        _registry.remove(id);
        _events.deviceStateChanged.emit(id, DeviceState::Removed);
        _events.deviceRemoved.emit(id);

        purgeTempDirs(id);
        _tracker.removeDevice(id);
        _timeRemaining.removeDevice(id);

        requestProximityGroups();

        if (wasAwaitingUnmount && _downloadUnmountsPending.empty())
            startDownloadPhase2();

        checkGlobalCompletion();
        if (_shuttingDown)
            checkShutdownComplete();
    }

    void DownloadOrchestrator::setFilesMarked(DeviceId id, std::span<const std::string> uniqueIds, bool marked)
    {
        if (!_registry.isActive(id))
            return;

        const std::size_t count{ _registry.setFilesMarked(id, uniqueIds, marked) };
        LPD_LOG(DOWNLOAD, DEBUG, "Device " << id.value() << ": " << count << " files " << (marked ? "marked" : "unmarked"));
    }

    void DownloadOrchestrator::startDownload(std::optional<DeviceId> id)
    {
        if (_shuttingDown)
            return;

        std::vector<DeviceId> candidates{ id ? std::vector<DeviceId>{ *id } : _registry.getDevices(DeviceState::Scanned) };
        std::erase_if(candidates, [this](DeviceId candidate) {
            const DeviceRecord* device{ _registry.find(candidate) };
            if (!device || device->state != DeviceState::Scanned)
                return true;
            if (std::find(std::cbegin(_devicesAwaitingDownload), std::cend(_devicesAwaitingDownload), candidate) != std::cend(_devicesAwaitingDownload))
                return true;

            return _registry.getFilesToDownload(candidate).empty();
        });

        if (candidates.empty())
        {
            LPD_LOG(DOWNLOAD, DEBUG, "No file to download");
            return;
        }

        if (_jobCode.isRequired(getPreferences().naming))
        {
            // devices proceed once the code is provided
            if (_jobCode.request(candidates))
                _events.jobCodeRequested.emit(_jobCode.getPreviousCodes());
            return;
        }

        proceedWithDownload(candidates);
    }

    void DownloadOrchestrator::pauseDownload()
    {
        if (!isDownloadRunning() || _paused)
            return;

        LPD_LOG(DOWNLOAD, INFO, "Pausing download");

        _paused = true;
        _copyManager.pauseAll();
        _timeRemaining.pause();
        _timeCheck.pause();
    }

    void DownloadOrchestrator::resumeDownload()
    {
        if (!_paused)
            return;

        LPD_LOG(DOWNLOAD, INFO, "Resuming download");

        _paused = false;
        const auto now{ TimeRemaining::Clock::now() };
        _timeRemaining.resume(now);
        _timeCheck.setDownloadMark(now);
        _copyManager.resumeAll();
    }

    void DownloadOrchestrator::provideJobCode(const std::string& code, bool remember)
    {
        const std::vector<DeviceId> devices{ _jobCode.provide(code, remember) };
        if (remember)
            _preferences.setJobCodes(_jobCode.getPreviousCodes());

        if (_shuttingDown)
            return;

        proceedWithDownload(devices);
    }

    void DownloadOrchestrator::cancelJobCode()
    {
        const std::vector<DeviceId> devices{ _jobCode.cancel() };
        LPD_LOG(JOBCODE, INFO, "Job code entry cancelled, " << devices.size() << " device(s) not downloaded");
    }

    void DownloadOrchestrator::resolveScanError(DeviceId id, ScanErrorDecision decision)
    {
        const DeviceRecord* device{ _registry.find(id) };
        if (!device || device->state != DeviceState::Error)
        {
            LPD_LOG(SCAN, WARNING, "Device " << id.value() << " is not waiting for a scan error decision");
            return;
        }

        switch (decision)
        {
        case ScanErrorDecision::Retry:
            LPD_LOG(SCAN, INFO, "Retrying scan of device " << id.value());
            setState(id, DeviceState::Scanning);
            if (_scanManager.isScanning(id))
                _scanManager.resume(id);
            else
                _scanManager.startScan(createScanArguments(*device));
            break;

        case ScanErrorDecision::Ignore:
            LPD_LOG(SCAN, INFO, "Ignoring device " << id.value() << " after scan error");
            removeDevice(id);
            break;
        }
    }

    void DownloadOrchestrator::requestShutdown(std::function<void()> onReady)
    {
        if (_shuttingDown)
        {
            LPD_LOG(DOWNLOAD, WARNING, "Shutdown already requested");
            return;
        }

        LPD_LOG(DOWNLOAD, INFO, "Shutdown requested" << (isDownloadRunning() ? " while downloading" : ""));

        _shuttingDown = true;
        _onShutdownReady = std::move(onReady);

        _scanManager.stopAll();
        _copyManager.stopAll();
        _jobCode.cancel();

        // sequence values must be saved before exiting
        if (isDownloadRunning() && !_renameManager.isAwaitingSequences())
            _renameManager.completeDownloadCycle();
        // the worker answers the queued requests before exiting, within the stop grace period
        if (_renameManager.isAwaitingSequences())
            _renameManager.stop();

        continueShutdown();
    }

    DeviceId DownloadOrchestrator::registerDevice(DeviceDescription description)
    {
        description.autoStart = isAutoStartEnabled();

        const DeviceId id{ _registry.add(description) };
        _events.deviceAdded.emit(id);

        return id;
    }

    bool DownloadOrchestrator::isAutoStartEnabled() const
    {
        if (!_autoStartAllowed)
            return false;

        const DownloadPreferences& preferences{ getPreferences() };
        return _startingUp ? preferences.autoDownloadAtStartup : preferences.autoDownloadUponDeviceInsertion;
    }

    bool DownloadOrchestrator::shouldScanPartition(const PartitionDescriptor& partition) const
    {
        if (_registry.findByPath(partition.path, DeviceKind::Volume))
            return false;

        const DownloadPreferences& preferences{ getPreferences() };

        const auto isListed{ [&](const std::vector<std::filesystem::path>& paths) {
            return std::find(std::cbegin(paths), std::cend(paths), partition.path) != std::cend(paths);
        } };

        if (isListed(preferences.pathWhitelist) || isListed(preferences.sources))
            return true;
        if (!preferences.deviceAutodetection)
            return false;

        if (preferences.deviceWithoutDcimAutodetection)
            return !isListed(preferences.pathBlacklist);

        return hasNonEmptyDcimFolder(partition.path);
    }

    messages::ScanArguments DownloadOrchestrator::createScanArguments(const DeviceRecord& device) const
    {
        const DownloadPreferences& preferences{ getPreferences() };

        messages::ScanArguments arguments;
        arguments.deviceId = device.id;
        arguments.kind = device.description.kind;
        arguments.path = device.description.path;
        arguments.cameraModel = device.description.cameraModel;
        arguments.cameraPort = device.description.cameraPort;
        arguments.ignoreOtherPhotoTypes = preferences.ignoreOtherPhotoTypes;
        arguments.ignoredPaths = preferences.ignoredPaths;

        return arguments;
    }

    void DownloadOrchestrator::startScan(DeviceId id)
    {
        if (!_registry.transition(id, DeviceState::Scanning))
            return;

        _events.deviceStateChanged.emit(id, DeviceState::Scanning);
        _scanManager.startScan(createScanArguments(_registry.get(id)));
    }

    void DownloadOrchestrator::processScanUnmountQueue()
    {
        if (_scanUnmountInProgress || _scanUnmountQueue.empty())
            return;

        const DeviceId id{ _scanUnmountQueue.front() };
        _scanUnmountQueue.pop_front();
        _scanUnmountInProgress = id;

        const DeviceRecord& device{ _registry.get(id) };
        LPD_LOG(DEVICES, DEBUG, "Unmounting camera " << device.description.cameraModel << " before scanning it");

        _deviceMonitor.unmountCamera(device.description.cameraModel, device.description.cameraPort, [this, id](bool success) {
            onCameraUnmountedForScan(id, success);
        });
    }

    void DownloadOrchestrator::onCameraUnmountedForScan(DeviceId id, bool success)
    {
        if (_scanUnmountInProgress == id)
            _scanUnmountInProgress.reset();

        if (_registry.isActive(id) && !_shuttingDown)
        {
            if (success)
                startScan(id);
            else
            {
                const DeviceRecord& device{ _registry.get(id) };
                LPD_LOG(DEVICES, WARNING, "Not scanning camera " << device.description.cameraModel << ": cannot unmount it");
                reportError(ErrorSeverity::Warning, "Cannot access camera " + device.description.cameraModel, "The camera could not be unmounted");
                removeDevice(id);
            }
        }

        processScanUnmountQueue();
    }

    void DownloadOrchestrator::onScanCompleted(DeviceId id)
    {
        requestProximityGroups();

        const DeviceRecord& device{ _registry.get(id) };
        LPD_LOG(SCAN, INFO, "Device '" << getDeviceDisplayName(device) << "': found " << device.discovered.photos << " photos and " << device.discovered.videos << " videos");

        if (device.description.autoStart)
        {
            startDownload(id);
            return;
        }

        if (!getPreferences().generateThumbnails)
            return;

        std::vector<std::string> uniqueIds;
        for (FileRecord& file : _registry.get(id).files)
        {
            if (file.status != FileStatus::Discovered)
                continue;

            file.status = FileStatus::ThumbnailPending;
            uniqueIds.push_back(file.info.uniqueId);
        }

        if (!uniqueIds.empty())
            _events.thumbnailsRequested.emit(id, std::move(uniqueIds));
    }

    void DownloadOrchestrator::setupBackupDestinations(const StartupDevices& devices)
    {
        const DownloadPreferences& preferences{ getPreferences() };
        if (!preferences.backupFiles)
            return;

        if (!preferences.backupDeviceAutodetection)
        {
            if (preferences.backupPhotoLocation == preferences.backupVideoLocation)
            {
                if (!preferences.backupPhotoLocation.empty())
                    addBackupDestination(preferences.backupPhotoLocation, BackupLocationType::PhotosAndVideos);
            }
            else
            {
                if (!preferences.backupPhotoLocation.empty())
                    addBackupDestination(preferences.backupPhotoLocation, BackupLocationType::Photos);
                if (!preferences.backupVideoLocation.empty())
                    addBackupDestination(preferences.backupVideoLocation, BackupLocationType::Videos);
            }

            return;
        }

        std::vector<std::filesystem::path> candidates{ preferences.backupDestinations };
        for (const PartitionDescriptor& partition : devices.partitions)
            candidates.push_back(partition.path);

        for (const std::filesystem::path& candidate : candidates)
        {
            if (const auto capability{ _backupResolver.checkCapability(candidate) })
                addBackupDestination(candidate, *capability);
        }
    }

    void DownloadOrchestrator::addBackupDestination(const std::filesystem::path& path, BackupLocationType type)
    {
        if (const BackupDestination* existing{ _backupResolver.find(path) })
        {
            if (existing->type == type)
                return;

            // a new worker is needed to handle the new capability
            removeBackupDestination(path);
        }

        const BackupDestinationResolver::AddResult result{ _backupResolver.add(path, type) };
        if (!result.added)
            return;

        LPD_LOG(BACKUP, INFO, "Using backup destination " << path << " for " << messages::toString(type));

        const DownloadPreferences& preferences{ getPreferences() };

        messages::BackupArguments arguments;
        arguments.destination = path;
        arguments.type = type;
        arguments.useIdentifierFolders = preferences.backupDeviceAutodetection;
        arguments.photoIdentifier = preferences.photoBackupIdentifier;
        arguments.videoIdentifier = preferences.videoBackupIdentifier;
        arguments.overwrite = preferences.backupDuplicateOverwrite;
        arguments.verify = preferences.verifyFile;
        _backupManager.addDestination(result.id, arguments);

        _events.backupDestinationsChanged.emit();
    }

    void DownloadOrchestrator::removeBackupDestination(const std::filesystem::path& path)
    {
        const std::optional<BackupDestination> destination{ _backupResolver.remove(path) };
        if (!destination)
            return;

        LPD_LOG(BACKUP, INFO, "Backup destination " << path << " removed");

        // files waiting for this destination will never be backed up there
        for (const messages::BackupFileData& fileData : _backupManager.removeDestination(destination->id))
            onBackupResult(fileData.deviceId, fileData.uniqueId, false, "backup destination removed");

        _events.backupDestinationsChanged.emit();
    }

    void DownloadOrchestrator::onBackupResult(DeviceId id, const std::string& uniqueId, bool success, std::string_view error)
    {
        if (!success)
        {
            LPD_LOG(BACKUP, WARNING, "Device " << id.value() << ": backup of file " << uniqueId << " failed: " << error);
            if (!_shuttingDown)
                reportError(ErrorSeverity::Warning, "Backup problem", "Could not back up file " + uniqueId + ": " + std::string{ error });
        }

        const DownloadTracker::BackupOutcome outcome{ _tracker.recordBackupResult(id, uniqueId, success) };
        if (!outcome.settled)
            return;

        FileRecord* file{ _registry.findFile(id, uniqueId) };
        if (!file || !_registry.isActive(id))
            return;

        fileFinished(id, *file, outcome.fullyBackedUp, !outcome.fullyBackedUp);
    }

    void DownloadOrchestrator::proceedWithDownload(std::span<const DeviceId> devices)
    {
        bool unmountRequested{};
        for (const DeviceId id : devices)
        {
            const DeviceRecord* device{ _registry.find(id) };
            if (!device || device->state != DeviceState::Scanned)
                continue;
            if (std::find(std::cbegin(_devicesAwaitingDownload), std::cend(_devicesAwaitingDownload), id) != std::cend(_devicesAwaitingDownload))
                continue;

            _devicesAwaitingDownload.push_back(id);

            // the camera may have been mounted again by the system after its scan
            if (device->description.kind == DeviceKind::Camera
                && _deviceMonitor.isCameraMounted(device->description.cameraModel, device->description.cameraPort))
            {
                LPD_LOG(DOWNLOAD, DEBUG, "Camera " << device->description.cameraModel << " must be unmounted before the download begins");
                _downloadUnmountsPending.insert(id);
                unmountRequested = true;
            }
        }

        if (!unmountRequested)
        {
            if (_downloadUnmountsPending.empty())
                startDownloadPhase2();
            return;
        }

        // copy: the callbacks may be invoked right away
        const std::set<DeviceId> unmountsPending{ _downloadUnmountsPending };
        for (const DeviceId id : unmountsPending)
        {
            const DeviceRecord& device{ _registry.get(id) };
            _deviceMonitor.unmountCamera(device.description.cameraModel, device.description.cameraPort, [this, id](bool success) {
                onCameraUnmountedForDownload(id, success);
            });
        }
    }

    void DownloadOrchestrator::onCameraUnmountedForDownload(DeviceId id, bool success)
    {
        if (_downloadUnmountsPending.erase(id) == 0)
            return;

        if (!success)
        {
            const DeviceRecord& device{ _registry.get(id) };
            LPD_LOG(DOWNLOAD, ERROR, "Cannot unmount camera " << device.description.cameraModel << " before downloading");
            reportError(ErrorSeverity::SeriousError, "Cannot download from camera " + device.description.cameraModel, "The camera could not be unmounted");
            std::erase(_devicesAwaitingDownload, id);
        }

        if (_downloadUnmountsPending.empty())
            startDownloadPhase2();
    }

    void DownloadOrchestrator::startDownloadPhase2()
    {
        std::vector<DeviceId> devices{ std::exchange(_devicesAwaitingDownload, {}) };
        std::erase_if(devices, [this](DeviceId id) {
            const DeviceRecord* device{ _registry.find(id) };
            return !device || device->state != DeviceState::Scanned;
        });
        if (devices.empty() || _shuttingDown)
            return;

        FileCounts toDownload;
        for (const DeviceId id : devices)
        {
            for (const FileRecord* file : _registry.getFilesToDownload(id))
                toDownload.add(file->info.type, file->info.size);
        }

        // devices stay in the scanned state, so that the download can be attempted again
        if (!checkDownloadFolders(toDownload) || !checkBackupDestinations(toDownload))
            return;

        if (!isDownloadRunning())
        {
            LPD_LOG(DOWNLOAD, INFO, "Starting download");

            _downloadStartTime = Wt::WDateTime::currentDateTime();
            _timeCheck.setDownloadMark(TimeRemaining::Clock::now());
            _events.preferencesControlsEnabled.emit(false);
            _renameManager.startDownloadCycle(messages::RenameDownloadStarted{ getPreferences().naming, _preferences.getSequenceState() });
            _events.downloadStarted.emit();
        }

        for (const DeviceId id : devices)
            startDeviceDownload(id);
    }

    bool DownloadOrchestrator::checkDownloadFolders(const FileCounts& toDownload)
    {
        const DownloadPreferences& preferences{ getPreferences() };

        std::vector<std::filesystem::path> invalidFolders;
        if (toDownload.photos > 0 && !core::pathUtils::isWritableDirectory(preferences.photoDownloadFolder))
            invalidFolders.push_back(preferences.photoDownloadFolder);
        if (toDownload.videos > 0 && !core::pathUtils::isWritableDirectory(preferences.videoDownloadFolder)
            && std::find(std::cbegin(invalidFolders), std::cend(invalidFolders), preferences.videoDownloadFolder) == std::cend(invalidFolders))
            invalidFolders.push_back(preferences.videoDownloadFolder);

        if (invalidFolders.empty())
            return true;

        std::string details{ invalidFolders.size() > 1 ? "These download folders are invalid:" : "This download folder is invalid:" };
        for (const std::filesystem::path& folder : invalidFolders)
            details += "\n" + folder.string();

        LPD_LOG(DOWNLOAD, ERROR, "Download cannot proceed: invalid download folder(s)");
        reportError(ErrorSeverity::CriticalError, "Download cannot proceed", details);
        return false;
    }

    bool DownloadOrchestrator::checkBackupDestinations(const FileCounts& toDownload)
    {
        if (!getPreferences().backupFiles)
            return true;

        for (const FileType type : { FileType::Photo, FileType::Video })
        {
            const std::size_t count{ type == FileType::Photo ? toDownload.photos : toDownload.videos };
            if (count == 0 || _backupResolver.getDestinationCount(type) > 0)
                continue;

            const std::string fileTypeText{ type == FileType::Photo ? "photos" : "videos" };
            LPD_LOG(DOWNLOAD, WARNING, "No backup device contains a valid folder for backing up " << fileTypeText);
            reportError(ErrorSeverity::SeriousError, "Backup problem", "No backup device contains a valid folder for backing up " + fileTypeText);
            return false;
        }

        return true;
    }

    void DownloadOrchestrator::startDeviceDownload(DeviceId id)
    {
        const DownloadPreferences& preferences{ getPreferences() };

        setState(id, DeviceState::DownloadPending);

        messages::CopyFilesArguments arguments;
        arguments.deviceId = id;
        arguments.photoDownloadFolder = preferences.photoDownloadFolder;
        arguments.videoDownloadFolder = preferences.videoDownloadFolder;
        arguments.verifyFile = preferences.verifyFile;

        FileCounts toDownload;
        for (FileRecord& file : _registry.get(id).files)
        {
            if (!file.marked || (file.status != FileStatus::Discovered && file.status != FileStatus::ThumbnailPending))
                continue;

            file.status = FileStatus::DownloadPending;
            toDownload.add(file.info.type, file.info.size);
            arguments.files.push_back(file.info);
        }

        FileTypeMap<std::size_t> backupDestinations;
        if (preferences.backupFiles)
            backupDestinations = FileTypeMap<std::size_t>{ _backupResolver.getDestinationCount(FileType::Photo), _backupResolver.getDestinationCount(FileType::Video) };

        _tracker.initDevice(id, toDownload, backupDestinations);
        _timeRemaining.addDevice(id, _tracker.getBytesToTransfer(id), TimeRemaining::Clock::now());
        _downloadParticipants.insert(id);

        LPD_LOG(DOWNLOAD, INFO, "Device " << id.value() << ": downloading " << toDownload.getCount() << " " << getFileTypesText(toDownload.photos, toDownload.videos));

        if (!arguments.files.empty())
        {
            _copyManager.startCopy(arguments);
            if (_paused)
                _copyManager.pauseAll();
        }

        setState(id, DeviceState::Downloading);
        updateProgress(id, 0);
        checkDeviceCompletion(id);
    }

    void DownloadOrchestrator::fileFailed(DeviceId id, FileRecord& file, std::string_view problem, std::string_view details)
    {
        LPD_LOG(DOWNLOAD, ERROR, "Device " << id.value() << ": " << problem << " " << file.info.path << ": " << details);

        file.status = FileStatus::Failed;
        file.error = details;

        _timeRemaining.excludeBytes(id, _tracker.excludeFile(id, file.info.type, file.info.size));
        _tracker.recordFileProcessed(id, file.info.type, false, false);
        reportError(ErrorSeverity::SeriousError, std::string{ problem }, file.info.path.string() + ": " + std::string{ details });

        updateProgress(id, 0);
        checkDeviceCompletion(id);
    }

    void DownloadOrchestrator::fileFinished(DeviceId id, FileRecord& file, bool fullyBackedUp, bool warning)
    {
        file.status = FileStatus::Finished;
        file.fullyBackedUp = fullyBackedUp;

        _tracker.recordFileProcessed(id, file.info.type, true, warning);

        updateProgress(id, 0);
        checkDeviceCompletion(id);
    }

    void DownloadOrchestrator::updateProgress(DeviceId id, std::uint64_t bytesTransferred)
    {
        if (!_tracker.contains(id))
            return;

        const FileCounts& counts{ _tracker.getFileCounts(id) };
        std::string text{ std::to_string(_tracker.getFilesProcessed(id)) + " of " + std::to_string(counts.getCount()) + " " + getFileTypesText(counts.photos, counts.videos) };
        _events.deviceProgress.emit(id, _tracker.getPercentComplete(id), std::move(text));
        _events.overallProgress.emit(_tracker.getGlobalPercentComplete());

        if (bytesTransferred == 0)
            return;

        const auto now{ TimeRemaining::Clock::now() };
        _timeRemaining.update(id, bytesTransferred, now);
        _timeCheck.increment(bytesTransferred);

        if (const std::optional<double> speed{ _timeCheck.checkForUpdate(now) })
        {
            _events.downloadSpeed.emit(formatDownloadSpeed(*speed));

            if (const auto remaining{ _timeRemaining.getTimeRemaining() })
                _events.timeRemaining.emit(formatTimeRemaining(*remaining));
        }
    }

    void DownloadOrchestrator::checkDeviceCompletion(DeviceId id)
    {
        const DeviceRecord* device{ _registry.find(id) };
        if (!device || device->state != DeviceState::Downloading)
            return;

        if (_tracker.isDeviceComplete(id))
            completeDevice(id);
    }

    void DownloadOrchestrator::completeDevice(DeviceId id)
    {
        const DownloadPreferences& preferences{ getPreferences() };

        setState(id, DeviceState::Completed);

        const DownloadCounts counts{ _tracker.getCounts(id) };
        LPD_LOG(DOWNLOAD, INFO, "Device " << id.value() << ": download complete, " << counts.getDownloaded() << " downloaded, " << counts.getFailed() << " failed, " << counts.warnings << " warnings");
        _events.deviceDownloadCompleted.emit(id, counts);

        purgeTempDirs(id);
        _timeRemaining.removeDevice(id);

        const DeviceRecord& device{ _registry.get(id) };
        if (preferences.move)
        {
            std::vector<std::filesystem::path> sourceFiles;
            for (const FileRecord& file : device.files)
            {
                if (file.status == FileStatus::Finished)
                    sourceFiles.push_back(file.info.path);
            }
            _offloadManager.deleteSourceFiles(id, std::move(sourceFiles));
        }

        if (preferences.autoUnmount && device.description.kind == DeviceKind::Volume && _registry.getRemainingFileCount(id) == 0)
        {
            LPD_LOG(DEVICES, INFO, "Unmounting " << device.description.path);
            _deviceMonitor.unmountVolume(device.description.path, [path = device.description.path](bool success) {
                LPD_LOG_IF(DEVICES, ERROR, !success, "Cannot unmount " << path);
            });
        }

        checkGlobalCompletion();
    }

    void DownloadOrchestrator::checkGlobalCompletion()
    {
        if (!isDownloadRunning() || _shuttingDown)
            return;

        for (const DeviceId id : _downloadParticipants)
        {
            const DeviceRecord* device{ _registry.find(id) };
            if (device && device->state != DeviceState::Completed && device->state != DeviceState::Removed)
                return;
        }

        if (getPreferences().backupFiles && _tracker.hasPendingBackups())
            return;

        completeDownloadCycle();
    }

    void DownloadOrchestrator::completeDownloadCycle()
    {
        const DownloadCounts totals{ _tracker.getTotals() };
        const std::size_t participantCount{ _downloadParticipants.size() };

        LPD_LOG(DOWNLOAD, INFO, "All downloads complete: " << totals.getDownloaded() << " downloaded, " << totals.getFailed() << " failed, " << totals.warnings << " warnings, took " << _downloadStartTime.secsTo(Wt::WDateTime::currentDateTime()) << " secs");

        _events.preferencesControlsEnabled.emit(true);
        _events.overallProgress.emit(1.f);
        _events.downloadCompleted.emit();
        if (participantCount > 1)
            _events.downloadSummary.emit(totals);

        // the rename worker answers with the sequence values to save
        _renameManager.completeDownloadCycle();

        const bool exitAllowed{ isExitAllowed(totals) };

        _tracker.reset();
        _timeRemaining.clear();
        _jobCode.resetCode();
        _downloadParticipants.clear();
        _downloadStartTime = Wt::WDateTime{};
        _paused = false;

        if (exitAllowed)
        {
            LPD_LOG(DOWNLOAD, INFO, "Exiting after download");
            _events.exitRequested.emit();
        }
    }

    bool DownloadOrchestrator::isExitAllowed(const DownloadCounts& totals) const
    {
        const DownloadPreferences& preferences{ getPreferences() };
        if (!((preferences.autoExit && !totals.hasErrorsOrWarnings()) || preferences.autoExitForce))
            return false;

        for (const DeviceId id : _registry.getActiveDevices())
        {
            if (_registry.getRemainingFileCount(id) > 0)
                return false;
        }

        return true;
    }

    void DownloadOrchestrator::requestProximityGroups()
    {
        if (_shuttingDown)
            return;

        messages::ProximityRequest request;
        request.thresholdSeconds = getPreferences().proximityThresholdSeconds;
        _registry.visitActiveFiles([&](const DeviceRecord&, const FileRecord& file) {
            request.entries.push_back(messages::ProximityEntry{ file.info.uniqueId, file.info.modificationTime });
        });

        if (request.entries.empty())
            return;

        _offloadManager.requestProximityGroups(request);
    }

    void DownloadOrchestrator::purgeTempDirs(DeviceId id)
    {
        auto it{ _tempDirs.find(id) };
        if (it == std::end(_tempDirs))
            return;

        _offloadManager.purgeDirectories(std::move(it->second));
        _tempDirs.erase(it);
    }

    void DownloadOrchestrator::continueShutdown()
    {
        if (_renameManager.isAwaitingSequences())
        {
            LPD_LOG(DOWNLOAD, DEBUG, "Waiting for the sequence values before shutting down");
            return;
        }

        if (!_workersStopRequested)
        {
            _workersStopRequested = true;

            std::vector<std::filesystem::path> tempDirs;
            for (auto& [id, dirs] : _tempDirs)
                tempDirs.insert(std::end(tempDirs), std::begin(dirs), std::end(dirs));
            _tempDirs.clear();
            _offloadManager.purgeDirectories(std::move(tempDirs));

            _scanManager.stopAll();
            _copyManager.stopAll();
            _renameManager.stop();
            _backupManager.stopAll();
            _offloadManager.stop();
        }

        checkShutdownComplete();
    }

    void DownloadOrchestrator::checkShutdownComplete()
    {
        if (!_workersStopRequested)
            return;

        if (!_scanManager.isIdle() || !_copyManager.isIdle() || !_renameManager.isIdle() || !_backupManager.isIdle() || !_offloadManager.isIdle())
            return;

        LPD_LOG(DOWNLOAD, INFO, "All workers stopped");
        if (auto onReady{ std::exchange(_onShutdownReady, {}) })
            onReady();
    }

    void DownloadOrchestrator::onStageEvent(stageEvents::StageEvent&& event)
    {
        if (_shuttingDown)
        {
            // only the sequence values still matter
            std::visit(core::utils::overloads{
                           [this](const stageEvents::SequencesUpdated& sequences) { onSequencesUpdated(sequences); },
                           [this](const stageEvents::RenameFinished& renameFinished) {
                               LPD_LOG_IF(DOWNLOAD, ERROR, renameFinished.sequencesLost, "Rename worker exited before reporting the sequence values");
                               continueShutdown();
                           },
                           [](const auto&) {},
                       },
                       event);

            checkShutdownComplete();
            return;
        }

        std::visit(core::utils::overloads{
                       [this](const stageEvents::ScanDeviceInfo& e) { onScanDeviceInfo(e); },
                       [this](const stageEvents::ScanFilesFound& e) { onScanFilesFound(e); },
                       [this](const stageEvents::ScanError& e) { onScanError(e); },
                       [this](const stageEvents::ScanFinished& e) { onScanFinished(e); },
                       [this](const stageEvents::CopyBytes& e) { onCopyBytes(e); },
                       [this](const stageEvents::CopyTempDirs& e) { onCopyTempDirs(e); },
                       [this](const stageEvents::FileCopied& e) { onFileCopied(e); },
                       [this](const stageEvents::CopyFinished& e) { onCopyFinished(e); },
                       [this](const stageEvents::FileRenamed& e) { onFileRenamed(e); },
                       [this](const stageEvents::SequencesUpdated& e) { onSequencesUpdated(e); },
                       [this](const stageEvents::RenameFinished& e) { onRenameFinished(e); },
                       [this](const stageEvents::BackupBytes& e) { onBackupBytes(e); },
                       [this](const stageEvents::FileBackedUp& e) { onFileBackedUp(e); },
                       [this](const stageEvents::BackupFinished& e) { onBackupFinished(e); },
                       [this](const stageEvents::ProximityGroups& e) { onProximityGroups(e); },
                       [this](const stageEvents::OffloadFinished& e) { onOffloadFinished(e); },
                   },
                   event);
    }

    void DownloadOrchestrator::onScanDeviceInfo(const stageEvents::ScanDeviceInfo& event)
    {
        DeviceRecord* device{ _registry.find(event.deviceId) };
        if (!device || device->state == DeviceState::Removed)
            return;

        if (!event.info.displayName.empty())
            device->description.displayName = event.info.displayName;
        device->storageCapacity = event.info.storageCapacity;
        device->storageFree = event.info.storageFree;

        _events.deviceInfoUpdated.emit(event.deviceId);
    }

    void DownloadOrchestrator::onScanFilesFound(const stageEvents::ScanFilesFound& event)
    {
        if (!_registry.isActive(event.deviceId))
            return;

        const std::size_t added{ _registry.addFiles(event.deviceId, event.files) };
        LPD_LOG(SCAN, DEBUG, "Device " << event.deviceId.value() << ": " << added << " new files");

        _events.scanCountsUpdated.emit(event.deviceId, _registry.get(event.deviceId).discovered);
    }

    void DownloadOrchestrator::onScanError(const stageEvents::ScanError& event)
    {
        DeviceRecord* device{ _registry.find(event.deviceId) };
        if (!device || device->state != DeviceState::Scanning)
            return;

        LPD_LOG(SCAN, WARNING, "Device " << event.deviceId.value() << ": " << messages::toString(event.code) << ": " << event.details);

        setState(event.deviceId, DeviceState::Error);
        device->scanError = event.code;

        _events.scanErrorDecisionRequested.emit(event.deviceId, event.code, event.details);
    }

    void DownloadOrchestrator::onScanFinished(const stageEvents::ScanFinished& event)
    {
        const DeviceRecord* device{ _registry.find(event.deviceId) };
        if (!device)
            return;

        switch (device->state)
        {
        case DeviceState::Scanning:
            if (event.unexpected)
                reportError(ErrorSeverity::SeriousError, "Scan of " + getDeviceDisplayName(*device) + " failed", "The scan process exited unexpectedly, only part of the files may have been found");

            setState(event.deviceId, DeviceState::Scanned);
            onScanCompleted(event.deviceId);
            break;

        case DeviceState::Error:
            // a retry will start a new worker
            LPD_LOG(SCAN, DEBUG, "Scan worker of device " << event.deviceId.value() << " exited while waiting for a decision");
            break;

        default:
            break;
        }
    }

    void DownloadOrchestrator::onCopyBytes(const stageEvents::CopyBytes& event)
    {
        if (!_registry.isActive(event.deviceId))
            return;

        _tracker.addBytesCopied(event.deviceId, event.bytes);
        updateProgress(event.deviceId, event.bytes);
    }

    void DownloadOrchestrator::onCopyTempDirs(const stageEvents::CopyTempDirs& event)
    {
        std::vector<std::filesystem::path>& tempDirs{ _tempDirs[event.deviceId] };
        tempDirs.insert(std::end(tempDirs), std::cbegin(event.directories), std::cend(event.directories));

        // the device went away in the meantime
        if (!_registry.isActive(event.deviceId))
            purgeTempDirs(event.deviceId);
    }

    void DownloadOrchestrator::onFileCopied(const stageEvents::FileCopied& event)
    {
        if (!_registry.isActive(event.deviceId))
            return;

        FileRecord* file{ _registry.findFile(event.deviceId, event.result.uniqueId) };
        if (!file || file->status != FileStatus::DownloadPending)
        {
            LPD_LOG(COPY, WARNING, "Device " << event.deviceId.value() << ": unexpected copy result for file " << event.result.uniqueId);
            return;
        }

        if (!event.result.success)
        {
            fileFailed(event.deviceId, *file, "Could not copy file", event.result.error);
            return;
        }

        const DownloadPreferences& preferences{ getPreferences() };

        file->status = FileStatus::Copied;
        file->tempPath = event.result.tempPath;
        file->downloadCount = event.result.downloadCount;

        messages::RenameFileData fileData;
        fileData.deviceId = event.deviceId;
        fileData.uniqueId = file->info.uniqueId;
        fileData.type = file->info.type;
        fileData.tempPath = file->tempPath;
        fileData.downloadFolder = file->info.type == FileType::Photo ? preferences.photoDownloadFolder : preferences.videoDownloadFolder;
        fileData.originalName = file->info.path.filename().string();
        fileData.modificationTime = file->info.modificationTime;
        fileData.downloadCount = file->downloadCount;
        fileData.jobCode = _jobCode.getCode();
        _renameManager.renameFile(fileData);
    }

    void DownloadOrchestrator::onCopyFinished(const stageEvents::CopyFinished& event)
    {
        if (!_registry.isActive(event.deviceId))
            return;

        if (event.unexpected)
        {
            const DeviceRecord& device{ _registry.get(event.deviceId) };
            reportError(ErrorSeverity::SeriousError, "Download from " + getDeviceDisplayName(device) + " failed", "The copy process exited unexpectedly");
        }

        for (const std::string& uniqueId : event.abandonedFiles)
        {
            if (FileRecord* file{ _registry.findFile(event.deviceId, uniqueId) }; file && file->status == FileStatus::DownloadPending)
                fileFailed(event.deviceId, *file, "Could not copy file", "copy process exited before copying the file");
        }

        checkDeviceCompletion(event.deviceId);
    }

    void DownloadOrchestrator::onFileRenamed(const stageEvents::FileRenamed& event)
    {
        const messages::RenameFileResult& result{ event.result };
        if (!_registry.isActive(result.deviceId))
        {
            LPD_LOG(RENAME, DEBUG, "Ignoring rename result of removed device " << result.deviceId.value());
            return;
        }

        FileRecord* file{ _registry.findFile(result.deviceId, result.uniqueId) };
        if (!file || file->status != FileStatus::Copied)
        {
            LPD_LOG(RENAME, WARNING, "Device " << result.deviceId.value() << ": unexpected rename result for file " << result.uniqueId);
            return;
        }

        if (!result.success)
        {
            fileFailed(result.deviceId, *file, "Could not rename file", result.error);
            return;
        }

        file->status = FileStatus::Renamed;
        file->finalPath = result.finalPath;
        file->subfolder = result.subfolder;

        if (!getPreferences().backupFiles)
        {
            fileFinished(result.deviceId, *file, false, false);
            return;
        }

        const std::vector<BackupDestination> destinations{ _backupResolver.getDestinationsFor(file->info.type) };
        if (_tracker.expectBackups(result.deviceId, file->info.uniqueId, destinations.size()))
        {
            fileFinished(result.deviceId, *file, true, false);
            return;
        }

        for (const BackupDestination& destination : destinations)
        {
            messages::BackupFileData fileData;
            fileData.deviceId = result.deviceId;
            fileData.uniqueId = file->info.uniqueId;
            fileData.type = file->info.type;
            fileData.sourcePath = file->finalPath;
            fileData.subfolder = file->subfolder;
            _backupManager.backupFile(destination.id, fileData);
        }
    }

    void DownloadOrchestrator::onSequencesUpdated(const stageEvents::SequencesUpdated& event)
    {
        LPD_LOG(RENAME, DEBUG, "Saving sequence values, stored sequence no = " << event.sequences.storedSequenceNo);
        _preferences.setSequenceState(event.sequences);

        if (_shuttingDown)
            continueShutdown();
    }

    void DownloadOrchestrator::onRenameFinished(const stageEvents::RenameFinished& event)
    {
        if (event.unexpected)
            reportError(ErrorSeverity::SeriousError, "Rename process failed", "The rename process exited unexpectedly");
        LPD_LOG_IF(RENAME, ERROR, event.sequencesLost, "Sequence values lost");

        for (const messages::RenameFileData& fileData : event.abandonedFiles)
        {
            if (!_registry.isActive(fileData.deviceId))
                continue;

            if (FileRecord* file{ _registry.findFile(fileData.deviceId, fileData.uniqueId) }; file && file->status == FileStatus::Copied)
                fileFailed(fileData.deviceId, *file, "Could not rename file", "rename process exited before renaming the file");
        }
    }

    void DownloadOrchestrator::onBackupBytes(const stageEvents::BackupBytes& event)
    {
        if (!_registry.isActive(event.deviceId))
            return;

        _tracker.addBytesBackedUp(event.deviceId, event.bytes);
        updateProgress(event.deviceId, event.bytes);
    }

    void DownloadOrchestrator::onFileBackedUp(const stageEvents::FileBackedUp& event)
    {
        onBackupResult(event.result.deviceId, event.result.uniqueId, event.result.success, event.result.error);
    }

    void DownloadOrchestrator::onBackupFinished(const stageEvents::BackupFinished& event)
    {
        // no worker anymore to handle this destination
        if (const BackupDestination* destination{ _backupResolver.find(event.destinationId) })
        {
            const std::filesystem::path path{ destination->path };
            if (event.unexpected)
                reportError(ErrorSeverity::SeriousError, "Backup destination " + path.string() + " is no longer usable", "The backup process exited unexpectedly");
            else
                LPD_LOG(BACKUP, WARNING, "Backup worker for " << path << " exited");

            _backupResolver.remove(path);
            _events.backupDestinationsChanged.emit();
        }

        for (const messages::BackupFileData& fileData : event.abandonedFiles)
            onBackupResult(fileData.deviceId, fileData.uniqueId, false, "backup process exited before backing up the file");
    }

    void DownloadOrchestrator::onProximityGroups(const stageEvents::ProximityGroups& event)
    {
        LPD_LOG(OFFLOAD, DEBUG, "Got " << event.groups.groups.size() << " proximity groups");
        _events.proximityGroupsGenerated.emit(event.groups);
    }

    void DownloadOrchestrator::onOffloadFinished(const stageEvents::OffloadFinished& event)
    {
        // restarted on next request
        LPD_LOG_IF(OFFLOAD, ERROR, event.unexpected, "Offload worker exited unexpectedly");
    }

    void DownloadOrchestrator::setState(DeviceId id, DeviceState state)
    {
        if (_registry.transition(id, state))
            _events.deviceStateChanged.emit(id, state);
    }

    void DownloadOrchestrator::reportError(ErrorSeverity severity, std::string problem, std::string details)
    {
        _events.errorReported.emit(ErrorReport{ severity, std::move(problem), std::move(details) });
    }
} // namespace lpd::download
