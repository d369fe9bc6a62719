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

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <thread>

#include "download/BackupDestinationResolver.hpp"
#include "download/DownloadTracker.hpp"
#include "download/IDeviceMonitor.hpp"
#include "download/IDownloadOrchestrator.hpp"
#include "download/IPreferences.hpp"

#include "FakeWorkerChannel.hpp"

namespace lpd::download::tests
{
    namespace
    {
        using FakeScanChannel = FakeWorkerChannel<messages::ScanRequest, messages::ScanResult>;
        using FakeCopyChannel = FakeWorkerChannel<messages::CopyRequest, messages::CopyResult>;
        using FakeRenameChannel = FakeWorkerChannel<messages::RenameRequest, messages::RenameResult>;
        using FakeBackupChannel = FakeWorkerChannel<messages::BackupRequest, messages::BackupResult>;
        using FakeOffloadChannel = FakeWorkerChannel<messages::OffloadRequest, messages::OffloadResult>;

        class FakePreferences : public IPreferences
        {
        public:
            DownloadPreferences preferences;
            messages::SequenceState sequenceState;
            std::size_t sequenceStateSaveCount{};
            std::vector<std::string> jobCodes;

        private:
            const DownloadPreferences& getDownloadPreferences() const override { return preferences; }
            ValidityCheck checkValidity() const override { return download::checkValidity(preferences); }

            messages::SequenceState getSequenceState() const override { return sequenceState; }
            void setSequenceState(const messages::SequenceState& state) override
            {
                sequenceState = state;
                sequenceStateSaveCount++;
            }
            std::vector<std::string> getJobCodes() const override { return jobCodes; }
            void setJobCodes(std::span<const std::string> codes) override { jobCodes.assign(std::cbegin(codes), std::cend(codes)); }
        };

        class FakeDeviceMonitor : public IDeviceMonitor
        {
        public:
            struct CameraUnmount
            {
                std::string model;
                UnmountCallback callback;
            };

            std::set<std::string> mountedCameras;
            std::vector<CameraUnmount> cameraUnmounts;
            std::vector<std::filesystem::path> volumeUnmounts;

            void completeCameraUnmount(std::size_t index, bool success)
            {
                ASSERT_LT(index, cameraUnmounts.size());
                // the callback may request another unmount
                UnmountCallback callback{ std::move(cameraUnmounts[index].callback) };
                if (success)
                    mountedCameras.erase(cameraUnmounts[index].model);
                callback(success);
            }

        private:
            bool isCameraMounted(const std::string& model, const std::string&) override
            {
                return mountedCameras.contains(model);
            }

            void unmountCamera(const std::string& model, const std::string&, UnmountCallback callback) override
            {
                cameraUnmounts.push_back(CameraUnmount{ model, std::move(callback) });
            }

            void unmountVolume(const std::filesystem::path& path, UnmountCallback callback) override
            {
                volumeUnmounts.push_back(path);
                callback(true);
            }
        };

        struct RecordedEvents
        {
            std::vector<ErrorReport> errors;
            std::vector<DeviceId> removedDevices;
            std::vector<float> overallProgress;
            std::vector<std::string> timeRemaining;
            std::size_t downloadStartedCount{};
            std::vector<std::pair<DeviceId, DownloadCounts>> completedDevices;
            std::size_t downloadCompletedCount{};
            std::vector<DownloadCounts> summaries;
            std::vector<std::vector<std::string>> jobCodeRequests;
            std::vector<std::pair<DeviceId, CameraErrorCode>> scanErrorDecisionRequests;
            std::vector<bool> preferencesControlsEnabled;
            std::size_t exitRequestedCount{};

            bool hasError(ErrorSeverity severity, std::string_view problem) const
            {
                return std::any_of(std::cbegin(errors), std::cend(errors), [&](const ErrorReport& error) {
                    return error.severity == severity && error.problem == problem;
                });
            }
        };

        class DownloadOrchestratorTest : public ::testing::Test
        {
        protected:
            void SetUp() override
            {
                _tmpDir = std::filesystem::temp_directory_path() / "lpd-orchestrator-test";
                std::filesystem::remove_all(_tmpDir);
                std::filesystem::create_directories(_tmpDir / "Pictures");
                std::filesystem::create_directories(_tmpDir / "Videos");

                DownloadPreferences& preferences{ _preferences.preferences };
                preferences.photoDownloadFolder = _tmpDir / "Pictures";
                preferences.videoDownloadFolder = _tmpDir / "Videos";
                preferences.generateThumbnails = false;
            }

            void TearDown() override
            {
                _orchestrator.reset();
                std::filesystem::remove_all(_tmpDir);
            }

            void createOrchestrator()
            {
                auto scan{ std::make_unique<FakeScanChannel>() };
                auto copy{ std::make_unique<FakeCopyChannel>() };
                auto rename{ std::make_unique<FakeRenameChannel>(true) };
                auto backup{ std::make_unique<FakeBackupChannel>() };
                auto offload{ std::make_unique<FakeOffloadChannel>(true) };
                _scan = scan.get();
                _copy = copy.get();
                _rename = rename.get();
                _backup = backup.get();
                _offload = offload.get();

                _orchestrator = createDownloadOrchestrator(_preferences, _deviceMonitor, StageChannels{ std::move(scan), std::move(copy), std::move(rename), std::move(backup), std::move(offload) });

                Events& events{ _orchestrator->getEvents() };
                events.errorReported.connect([this](ErrorReport error) { _events.errors.push_back(std::move(error)); });
                events.deviceRemoved.connect([this](DeviceId id) { _events.removedDevices.push_back(id); });
                events.overallProgress.connect([this](float progress) { _events.overallProgress.push_back(progress); });
                events.timeRemaining.connect([this](std::string text) { _events.timeRemaining.push_back(std::move(text)); });
                events.downloadStarted.connect([this] { _events.downloadStartedCount++; });
                events.deviceDownloadCompleted.connect([this](DeviceId id, DownloadCounts counts) { _events.completedDevices.emplace_back(id, counts); });
                events.downloadCompleted.connect([this] { _events.downloadCompletedCount++; });
                events.downloadSummary.connect([this](DownloadCounts counts) { _events.summaries.push_back(counts); });
                events.jobCodeRequested.connect([this](std::vector<std::string> previousCodes) { _events.jobCodeRequests.push_back(std::move(previousCodes)); });
                events.scanErrorDecisionRequested.connect([this](DeviceId id, CameraErrorCode code, std::string) { _events.scanErrorDecisionRequests.emplace_back(id, code); });
                events.preferencesControlsEnabled.connect([this](bool enabled) { _events.preferencesControlsEnabled.push_back(enabled); });
                events.exitRequested.connect([this] { _events.exitRequestedCount++; });

                _orchestrator->start(StartupDevices{});
            }

            std::filesystem::path createSourceFolder(std::string_view name)
            {
                const std::filesystem::path path{ _tmpDir / name };
                std::filesystem::create_directories(path / "DCIM");
                return path;
            }

            messages::MediaFileInfo createFile(DeviceId id, std::string uniqueId, FileType type, std::uint64_t size) const
            {
                messages::MediaFileInfo file;
                file.uniqueId = std::move(uniqueId);
                file.deviceId = id;
                file.type = type;
                file.path = _tmpDir / "source" / "DCIM" / (file.uniqueId + (type == FileType::Photo ? ".jpg" : ".mov"));
                file.size = size;
                file.modificationTime = 1'700'000'000;
                return file;
            }

            // returns a device in the scanned state
            DeviceId addScannedSource(std::string_view name, const std::vector<std::pair<FileType, std::uint64_t>>& files)
            {
                const std::optional<DeviceId> id{ _orchestrator->addPathSource(createSourceFolder(name)) };
                EXPECT_TRUE(id.has_value());

                messages::ScanFilesFound filesFound;
                for (const auto& [type, size] : files)
                    filesFound.files.push_back(createFile(*id, std::string{ name } + "-" + std::to_string(filesFound.files.size()), type, size));

                _scan->emitResult(id->value(), filesFound);
                _scan->finish(id->value());

                EXPECT_EQ(getState(*id), DeviceState::Scanned);
                return *id;
            }

            void copyFile(DeviceId id, const std::string& uniqueId, std::uint32_t downloadCount = 1)
            {
                _copy->emitResult(id.value(), messages::CopyFileResult{ uniqueId, true, _tmpDir / "tmp" / uniqueId, {}, downloadCount });
            }

            void renameFile(DeviceId id, const std::string& uniqueId)
            {
                _rename->emitResult(std::nullopt, messages::RenameFileResult{ id, uniqueId, true, _tmpDir / "Pictures" / uniqueId, "2025/20250101", {} });
            }

            void transferFile(DeviceId id, const std::string& uniqueId)
            {
                copyFile(id, uniqueId);
                renameFile(id, uniqueId);
            }

            DeviceState getState(DeviceId id) const
            {
                return _orchestrator->getDeviceRegistry().get(id).state;
            }

            const FileRecord& getFile(DeviceId id, std::size_t index) const
            {
                return _orchestrator->getDeviceRegistry().get(id).files.at(index);
            }

            std::filesystem::path _tmpDir;
            FakePreferences _preferences;
            FakeDeviceMonitor _deviceMonitor;
            RecordedEvents _events;

            FakeScanChannel* _scan{};
            FakeCopyChannel* _copy{};
            FakeRenameChannel* _rename{};
            FakeBackupChannel* _backup{};
            FakeOffloadChannel* _offload{};
            std::unique_ptr<IDownloadOrchestrator> _orchestrator;
        };
    } // namespace

    TEST_F(DownloadOrchestratorTest, singleDevice)
    {
        createOrchestrator();
        EXPECT_TRUE(_rename->isWorkerRunning());
        EXPECT_TRUE(_offload->isWorkerRunning());

        const DeviceId id{ addScannedSource("card", { { FileType::Photo, 1000 }, { FileType::Video, 3000 } }) };
        {
            const auto scanArguments{ _scan->getRequests<messages::ScanArguments>(id.value()) };
            ASSERT_EQ(scanArguments.size(), 1);
            EXPECT_EQ(scanArguments.front().kind, DeviceKind::Path);
            EXPECT_EQ(scanArguments.front().path, _tmpDir / "card");
        }
        EXPECT_EQ(_offload->getRequests<messages::ProximityRequest>().size(), 1);

        _orchestrator->startDownload();
        EXPECT_TRUE(_orchestrator->isDownloadRunning());
        EXPECT_EQ(getState(id), DeviceState::Downloading);
        EXPECT_EQ(_events.downloadStartedCount, 1);
        EXPECT_EQ(_events.preferencesControlsEnabled, std::vector<bool>{ false });
        EXPECT_EQ(_rename->getRequests<messages::RenameDownloadStarted>().size(), 1);

        const auto copyArguments{ _copy->getRequests<messages::CopyFilesArguments>(id.value()) };
        ASSERT_EQ(copyArguments.size(), 1);
        ASSERT_EQ(copyArguments.front().files.size(), 2);
        EXPECT_EQ(copyArguments.front().photoDownloadFolder, _tmpDir / "Pictures");

        _copy->emitResult(id.value(), messages::CopyTempDirs{ _tmpDir / "Pictures" / ".lpd-tmp", _tmpDir / "Videos" / ".lpd-tmp" });
        _copy->emitResult(id.value(), messages::BytesProgress{ 1000 });
        copyFile(id, "card-0", 1);
        EXPECT_EQ(getFile(id, 0).status, FileStatus::Copied);

        const auto renameRequests{ _rename->getRequests<messages::RenameFileData>() };
        ASSERT_EQ(renameRequests.size(), 1);
        EXPECT_EQ(renameRequests.front().uniqueId, "card-0");
        EXPECT_EQ(renameRequests.front().downloadFolder, _tmpDir / "Pictures");
        EXPECT_EQ(renameRequests.front().originalName, "card-0.jpg");

        renameFile(id, "card-0");
        EXPECT_EQ(getFile(id, 0).status, FileStatus::Finished);
        EXPECT_EQ(getState(id), DeviceState::Downloading);

        _copy->emitResult(id.value(), messages::BytesProgress{ 3000 });
        copyFile(id, "card-1", 2);
        renameFile(id, "card-1");

        EXPECT_EQ(getState(id), DeviceState::Completed);
        ASSERT_EQ(_events.completedDevices.size(), 1);
        EXPECT_EQ(_events.completedDevices.front().second.photosDownloaded, 1);
        EXPECT_EQ(_events.completedDevices.front().second.videosDownloaded, 1);
        EXPECT_EQ(_events.downloadCompletedCount, 1);
        EXPECT_TRUE(_events.summaries.empty());
        EXPECT_EQ(_events.preferencesControlsEnabled, (std::vector<bool>{ false, true }));
        EXPECT_FALSE(_orchestrator->isDownloadRunning());
        EXPECT_TRUE(_events.errors.empty());
        EXPECT_EQ(_events.exitRequestedCount, 0);

        const auto purges{ _offload->getRequests<messages::PurgeDirectories>() };
        ASSERT_EQ(purges.size(), 1);
        EXPECT_EQ(purges.front().directories.size(), 2);

        // sequence values are saved once the rename worker reports them
        EXPECT_EQ(_rename->getRequests<messages::RenameDownloadCompleted>().size(), 1);
        EXPECT_EQ(_preferences.sequenceStateSaveCount, 0);
        const messages::SequenceState sequences{ 12, "2025-01-01", 1 };
        _rename->emitResult(std::nullopt, messages::RenameSequencesUpdate{ sequences });
        EXPECT_EQ(_preferences.sequenceState, sequences);

        _copy->finish(id.value());
        EXPECT_EQ(getState(id), DeviceState::Completed);
        EXPECT_TRUE(_events.errors.empty());
    }

    TEST_F(DownloadOrchestratorTest, overallProgress)
    {
        createOrchestrator();

        const DeviceId first{ addScannedSource("card1", { { FileType::Photo, 1000 } }) };
        const DeviceId second{ addScannedSource("card2", { { FileType::Photo, 1000 } }) };
        _orchestrator->startDownload();
        ASSERT_EQ(getState(first), DeviceState::Downloading);
        ASSERT_EQ(getState(second), DeviceState::Downloading);

        _copy->emitResult(first.value(), messages::BytesProgress{ 1000 });
        ASSERT_FALSE(_events.overallProgress.empty());
        EXPECT_FLOAT_EQ(_events.overallProgress.back(), 0.5f);
        EXPECT_FLOAT_EQ(_orchestrator->getDownloadTracker().getGlobalPercentComplete(), 0.5f);
    }

    TEST_F(DownloadOrchestratorTest, timeRemainingAfterCopyFailure)
    {
        createOrchestrator();

        const DeviceId id{ addScannedSource("card", { { FileType::Photo, 100'000 }, { FileType::Photo, 100'000 } }) };
        _orchestrator->startDownload();

        _copy->emitResult(id.value(), messages::CopyFileResult{ "card-0", false, {}, "read error", 1 });
        _copy->emitResult(id.value(), messages::BytesProgress{ 50'000 });
        std::this_thread::sleep_for(std::chrono::milliseconds{ 1100 });
        _copy->emitResult(id.value(), messages::BytesProgress{ 50'000 });

        // the failed file is not waited for
        EXPECT_EQ(getState(id), DeviceState::Downloading);
        ASSERT_FALSE(_events.timeRemaining.empty());
        EXPECT_EQ(_events.timeRemaining.back(), "");
        EXPECT_FLOAT_EQ(_orchestrator->getDownloadTracker().getPercentComplete(id), 1.f);
    }

    TEST_F(DownloadOrchestratorTest, downloadSummary)
    {
        createOrchestrator();

        const DeviceId first{ addScannedSource("card1", { { FileType::Photo, 1000 } }) };
        const DeviceId second{ addScannedSource("card2", { { FileType::Photo, 2000 } }) };
        _orchestrator->startDownload();

        transferFile(first, "card1-0");
        EXPECT_EQ(getState(first), DeviceState::Completed);
        EXPECT_EQ(_events.downloadCompletedCount, 0);

        transferFile(second, "card2-0");
        EXPECT_EQ(_events.downloadCompletedCount, 1);
        ASSERT_EQ(_events.summaries.size(), 1);
        EXPECT_EQ(_events.summaries.front().photosDownloaded, 2);
        EXPECT_EQ(_events.summaries.front().getFailed(), 0);
    }

    TEST_F(DownloadOrchestratorTest, jobCode)
    {
        _preferences.preferences.naming.photoRename = "{jobcode}-{name}{ext}";
        _preferences.preferences.autoDownloadUponDeviceInsertion = true;
        createOrchestrator();

        const DeviceId first{ addScannedSource("card1", { { FileType::Photo, 1000 } }) };
        const DeviceId second{ addScannedSource("card2", { { FileType::Photo, 1000 } }) };

        // one prompt for both devices
        EXPECT_EQ(_events.jobCodeRequests.size(), 1);
        EXPECT_EQ(getState(first), DeviceState::Scanned);
        EXPECT_EQ(getState(second), DeviceState::Scanned);
        EXPECT_FALSE(_orchestrator->isDownloadRunning());

        _orchestrator->provideJobCode("Wedding", true);
        EXPECT_EQ(_preferences.jobCodes, std::vector<std::string>{ "Wedding" });
        EXPECT_EQ(getState(first), DeviceState::Downloading);
        EXPECT_EQ(getState(second), DeviceState::Downloading);
        EXPECT_EQ(_events.downloadStartedCount, 1);

        copyFile(first, "card1-0");
        const auto renameRequests{ _rename->getRequests<messages::RenameFileData>() };
        ASSERT_EQ(renameRequests.size(), 1);
        EXPECT_EQ(renameRequests.front().jobCode, "Wedding");
    }

    TEST_F(DownloadOrchestratorTest, jobCodeCancelled)
    {
        _preferences.preferences.naming.videoSubfolder = "%Y/{jobcode}";
        createOrchestrator();

        const DeviceId id{ addScannedSource("card", { { FileType::Video, 1000 } }) };
        _orchestrator->startDownload();
        EXPECT_EQ(_events.jobCodeRequests.size(), 1);

        _orchestrator->cancelJobCode();
        EXPECT_EQ(getState(id), DeviceState::Scanned);
        EXPECT_FALSE(_orchestrator->isDownloadRunning());

        // prompted again on the next attempt
        _orchestrator->startDownload();
        EXPECT_EQ(_events.jobCodeRequests.size(), 2);
    }

    TEST_F(DownloadOrchestratorTest, scanErrorRetry)
    {
        createOrchestrator();

        const std::optional<DeviceId> id{ _orchestrator->addPathSource(createSourceFolder("card")) };
        ASSERT_TRUE(id);

        _scan->emitResult(id->value(), messages::ScanFilesFound{ { createFile(*id, "file1", FileType::Photo, 1000) } });
        _scan->emitResult(id->value(), messages::ScanDeviceError{ CameraErrorCode::Locked, "device locked" });
        EXPECT_EQ(getState(*id), DeviceState::Error);
        ASSERT_EQ(_events.scanErrorDecisionRequests.size(), 1);
        EXPECT_EQ(_events.scanErrorDecisionRequests.front().second, CameraErrorCode::Locked);

        _orchestrator->resolveScanError(*id, ScanErrorDecision::Retry);
        EXPECT_EQ(getState(*id), DeviceState::Scanning);
        EXPECT_EQ(_scan->getRequests<messages::ScanResume>(id->value()).size(), 1);

        _scan->emitResult(id->value(), messages::ScanFilesFound{ { createFile(*id, "file2", FileType::Photo, 1000) } });
        _scan->finish(id->value());

        // same device, files found before the error are kept
        EXPECT_EQ(getState(*id), DeviceState::Scanned);
        EXPECT_EQ(_orchestrator->getDeviceRegistry().get(*id).files.size(), 2);
        EXPECT_EQ(_orchestrator->getDeviceRegistry().getActiveDeviceCount(), 1);
    }

    TEST_F(DownloadOrchestratorTest, scanErrorIgnore)
    {
        createOrchestrator();

        const std::optional<DeviceId> id{ _orchestrator->addPathSource(createSourceFolder("card")) };
        ASSERT_TRUE(id);

        _scan->emitResult(id->value(), messages::ScanDeviceError{ CameraErrorCode::Inaccessible, "in use" });
        ASSERT_EQ(getState(*id), DeviceState::Error);

        _orchestrator->resolveScanError(*id, ScanErrorDecision::Ignore);
        EXPECT_EQ(getState(*id), DeviceState::Removed);
        EXPECT_TRUE(_scan->isStopRequested(id->value()));
        EXPECT_EQ(_events.removedDevices, std::vector<DeviceId>{ *id });

        // late exit of the worker
        _scan->finish(id->value());
        EXPECT_EQ(getState(*id), DeviceState::Removed);
    }

    TEST_F(DownloadOrchestratorTest, scanCrashKeepsFiles)
    {
        createOrchestrator();

        const std::optional<DeviceId> id{ _orchestrator->addPathSource(createSourceFolder("card")) };
        ASSERT_TRUE(id);

        _scan->emitResult(id->value(), messages::ScanFilesFound{ { createFile(*id, "file1", FileType::Photo, 1000) } });
        _scan->finish(id->value(), true);

        EXPECT_EQ(getState(*id), DeviceState::Scanned);
        EXPECT_EQ(_orchestrator->getDeviceRegistry().get(*id).files.size(), 1);
        EXPECT_TRUE(_events.hasError(ErrorSeverity::SeriousError, "Scan of card failed"));
    }

    TEST_F(DownloadOrchestratorTest, removeDevice)
    {
        createOrchestrator();

        const DeviceId id{ addScannedSource("card", { { FileType::Photo, 1000 } }) };

        _orchestrator->removeDevice(id);
        _orchestrator->removeDevice(id);

        EXPECT_EQ(getState(id), DeviceState::Removed);
        EXPECT_EQ(_events.removedDevices, std::vector<DeviceId>{ id });
        EXPECT_EQ(_orchestrator->getDeviceRegistry().getActiveDeviceCount(), 0);

        // a new device gets a new id
        const DeviceId other{ addScannedSource("card", { { FileType::Photo, 1000 } }) };
        EXPECT_NE(other, id);
    }

    TEST_F(DownloadOrchestratorTest, removeDeviceWhileDownloading)
    {
        createOrchestrator();

        const DeviceId first{ addScannedSource("card1", { { FileType::Photo, 1000 } }) };
        const DeviceId second{ addScannedSource("card2", { { FileType::Photo, 1000 } }) };
        _orchestrator->startDownload();
        transferFile(first, "card1-0");

        _orchestrator->removeDevice(second);
        EXPECT_TRUE(_copy->isStopRequested(second.value()));
        EXPECT_EQ(_events.downloadCompletedCount, 1);

        // results of the removed device are ignored
        copyFile(second, "card2-0");
        EXPECT_EQ(getFile(second, 0).status, FileStatus::DownloadPending);
        EXPECT_TRUE(_rename->getRequests<messages::RenameFileData>().size() == 1);
    }

    TEST_F(DownloadOrchestratorTest, invalidDownloadFolder)
    {
        _preferences.preferences.photoDownloadFolder = _tmpDir / "missing";
        createOrchestrator();

        const DeviceId id{ addScannedSource("card", { { FileType::Photo, 1000 } }) };
        _orchestrator->startDownload();

        EXPECT_TRUE(_events.hasError(ErrorSeverity::CriticalError, "Download cannot proceed"));
        EXPECT_EQ(getState(id), DeviceState::Scanned);
        EXPECT_FALSE(_orchestrator->isDownloadRunning());
        EXPECT_TRUE(_copy->getRequests<messages::CopyFilesArguments>(id.value()).empty());
    }

    TEST_F(DownloadOrchestratorTest, invalidPreferences)
    {
        _preferences.preferences.naming.photoRename.clear();
        _preferences.preferences.autoDownloadUponDeviceInsertion = true;
        createOrchestrator();

        EXPECT_TRUE(_events.hasError(ErrorSeverity::CriticalError, "Program preferences are invalid"));

        // no automatic download
        const DeviceId id{ addScannedSource("card", { { FileType::Photo, 1000 } }) };
        EXPECT_EQ(getState(id), DeviceState::Scanned);
    }

    TEST_F(DownloadOrchestratorTest, missingBackupDestination)
    {
        _preferences.preferences.backupFiles = true;
        createOrchestrator();

        const DeviceId id{ addScannedSource("card", { { FileType::Photo, 1000 } }) };
        _orchestrator->startDownload();

        EXPECT_TRUE(_events.hasError(ErrorSeverity::SeriousError, "Backup problem"));
        EXPECT_EQ(getState(id), DeviceState::Scanned);
        EXPECT_FALSE(_orchestrator->isDownloadRunning());
    }

    TEST_F(DownloadOrchestratorTest, backup)
    {
        const std::filesystem::path backupPath{ _tmpDir / "backup" };
        std::filesystem::create_directories(backupPath);

        DownloadPreferences& preferences{ _preferences.preferences };
        preferences.backupFiles = true;
        preferences.backupDeviceAutodetection = false;
        preferences.backupPhotoLocation = backupPath;
        preferences.backupVideoLocation = backupPath;
        createOrchestrator();

        const BackupDestination* destination{ _orchestrator->getBackupDestinationResolver().find(backupPath) };
        ASSERT_NE(destination, nullptr);
        EXPECT_EQ(destination->type, BackupLocationType::PhotosAndVideos);
        const BackupDestinationId destinationId{ destination->id };
        {
            const auto arguments{ _backup->getRequests<messages::BackupArguments>(destinationId) };
            ASSERT_EQ(arguments.size(), 1);
            EXPECT_FALSE(arguments.front().useIdentifierFolders);
        }

        const DeviceId id{ addScannedSource("card", { { FileType::Video, 3000 } }) };
        _orchestrator->startDownload();
        transferFile(id, "card-0");

        const auto backupRequests{ _backup->getRequests<messages::BackupFileData>(destinationId) };
        ASSERT_EQ(backupRequests.size(), 1);
        EXPECT_EQ(backupRequests.front().uniqueId, "card-0");
        EXPECT_EQ(backupRequests.front().type, FileType::Video);
        EXPECT_EQ(backupRequests.front().subfolder, "2025/20250101");
        EXPECT_EQ(getState(id), DeviceState::Downloading);

        _backup->emitResult(destinationId, messages::BytesProgress{ 3000 });
        _backup->emitResult(destinationId, messages::BackupFileResult{ id, "card-0", true, backupPath / "card-0.mov", {} });

        EXPECT_EQ(getState(id), DeviceState::Completed);
        EXPECT_TRUE(getFile(id, 0).fullyBackedUp);
        ASSERT_EQ(_events.completedDevices.size(), 1);
        EXPECT_EQ(_events.completedDevices.front().second.videosDownloaded, 1);
        EXPECT_EQ(_events.completedDevices.front().second.warnings, 0);
        EXPECT_EQ(_events.downloadCompletedCount, 1);
    }

    TEST_F(DownloadOrchestratorTest, backupDestinationRemoved)
    {
        const std::filesystem::path backupPath{ _tmpDir / "backup" };
        std::filesystem::create_directories(backupPath);

        DownloadPreferences& preferences{ _preferences.preferences };
        preferences.backupFiles = true;
        preferences.backupDeviceAutodetection = false;
        preferences.backupPhotoLocation = backupPath;
        preferences.backupVideoLocation = backupPath;
        createOrchestrator();

        const BackupDestinationId destinationId{ _orchestrator->getBackupDestinationResolver().find(backupPath)->id };

        const DeviceId id{ addScannedSource("card", { { FileType::Photo, 1000 } }) };
        _orchestrator->startDownload();
        transferFile(id, "card-0");
        ASSERT_EQ(_backup->getRequests<messages::BackupFileData>(destinationId).size(), 1);

        _orchestrator->onPartitionUnmounted(backupPath);
        EXPECT_TRUE(_backup->isStopRequested(destinationId));
        EXPECT_FALSE(_orchestrator->getBackupDestinationResolver().contains(backupPath));

        EXPECT_TRUE(_events.hasError(ErrorSeverity::Warning, "Backup problem"));
        EXPECT_EQ(getState(id), DeviceState::Completed);
        EXPECT_FALSE(getFile(id, 0).fullyBackedUp);
        ASSERT_EQ(_events.completedDevices.size(), 1);
        EXPECT_EQ(_events.completedDevices.front().second.photosDownloaded, 1);
        EXPECT_EQ(_events.completedDevices.front().second.warnings, 1);

        // late exit of the worker
        _backup->finish(destinationId);
        EXPECT_EQ(_events.completedDevices.size(), 1);
    }

    TEST_F(DownloadOrchestratorTest, copyCrash)
    {
        createOrchestrator();

        const DeviceId id{ addScannedSource("card", { { FileType::Photo, 1000 }, { FileType::Video, 2000 } }) };
        _orchestrator->startDownload();

        _copy->finish(id.value(), true);

        EXPECT_TRUE(_events.hasError(ErrorSeverity::SeriousError, "Download from card failed"));
        EXPECT_EQ(getFile(id, 0).status, FileStatus::Failed);
        EXPECT_EQ(getFile(id, 1).status, FileStatus::Failed);
        EXPECT_EQ(getState(id), DeviceState::Completed);
        ASSERT_EQ(_events.completedDevices.size(), 1);
        EXPECT_EQ(_events.completedDevices.front().second.photosFailed, 1);
        EXPECT_EQ(_events.completedDevices.front().second.videosFailed, 1);
        EXPECT_EQ(_events.downloadCompletedCount, 1);
    }

    TEST_F(DownloadOrchestratorTest, backupCrashWhileDownloading)
    {
        const std::filesystem::path backupPath{ _tmpDir / "backup" };
        std::filesystem::create_directories(backupPath);

        DownloadPreferences& preferences{ _preferences.preferences };
        preferences.backupFiles = true;
        preferences.backupDeviceAutodetection = false;
        preferences.backupPhotoLocation = backupPath;
        preferences.backupVideoLocation = backupPath;
        createOrchestrator();

        const BackupDestinationId destinationId{ _orchestrator->getBackupDestinationResolver().find(backupPath)->id };

        const DeviceId id{ addScannedSource("card", { { FileType::Photo, 1000 }, { FileType::Photo, 1000 } }) };
        _orchestrator->startDownload();
        transferFile(id, "card-0");
        ASSERT_EQ(_backup->getRequests<messages::BackupFileData>(destinationId).size(), 1);

        _backup->finish(destinationId, true);

        EXPECT_TRUE(_events.hasError(ErrorSeverity::SeriousError, "Backup destination " + backupPath.string() + " is no longer usable"));
        EXPECT_FALSE(_orchestrator->getBackupDestinationResolver().contains(backupPath));
        EXPECT_EQ(getFile(id, 0).status, FileStatus::Finished);
        EXPECT_FALSE(getFile(id, 0).fullyBackedUp);
        EXPECT_EQ(getState(id), DeviceState::Downloading);

        // no destination left for the remaining file
        transferFile(id, "card-1");
        EXPECT_EQ(_backup->getRequests<messages::BackupFileData>(destinationId).size(), 1);
        EXPECT_EQ(getState(id), DeviceState::Completed);
        ASSERT_EQ(_events.completedDevices.size(), 1);
        EXPECT_EQ(_events.completedDevices.front().second.photosDownloaded, 2);
        EXPECT_EQ(_events.completedDevices.front().second.warnings, 1);
    }

    TEST_F(DownloadOrchestratorTest, renameCrash)
    {
        _preferences.sequenceState = messages::SequenceState{ 41, "2025-01-01", 3 };
        createOrchestrator();
        EXPECT_EQ(_rename->getLaunchCount(), 1);

        const DeviceId id{ addScannedSource("card", { { FileType::Photo, 1000 }, { FileType::Photo, 1000 }, { FileType::Photo, 1000 } }) };
        _orchestrator->startDownload();
        transferFile(id, "card-0");
        copyFile(id, "card-1", 2);
        ASSERT_EQ(getFile(id, 1).status, FileStatus::Copied);

        _rename->finish(std::nullopt, true);

        EXPECT_TRUE(_events.hasError(ErrorSeverity::SeriousError, "Rename process failed"));
        EXPECT_EQ(getFile(id, 1).status, FileStatus::Failed);
        EXPECT_EQ(getState(id), DeviceState::Downloading);

        // restarted on demand, past the sequence numbers already used
        copyFile(id, "card-2", 3);
        EXPECT_EQ(_rename->getLaunchCount(), 2);
        const auto downloadStarted{ _rename->getRequests<messages::RenameDownloadStarted>() };
        ASSERT_EQ(downloadStarted.size(), 2);
        EXPECT_EQ(downloadStarted.front().sequences.storedSequenceNo, 41);
        EXPECT_EQ(downloadStarted.back().sequences.storedSequenceNo, 42);
        EXPECT_EQ(downloadStarted.back().sequences.downloadsTodayCount, 3);

        renameFile(id, "card-2");
        EXPECT_EQ(getState(id), DeviceState::Completed);
        ASSERT_EQ(_events.completedDevices.size(), 1);
        EXPECT_EQ(_events.completedDevices.front().second.photosDownloaded, 2);
        EXPECT_EQ(_events.completedDevices.front().second.photosFailed, 1);
    }

    TEST_F(DownloadOrchestratorTest, copyFailure)
    {
        createOrchestrator();

        const DeviceId id{ addScannedSource("card", { { FileType::Photo, 1000 }, { FileType::Photo, 2000 } }) };
        _orchestrator->startDownload();

        _copy->emitResult(id.value(), messages::CopyFileResult{ "card-0", false, {}, "read error", 1 });
        EXPECT_EQ(getFile(id, 0).status, FileStatus::Failed);
        EXPECT_EQ(getFile(id, 0).error, "read error");
        EXPECT_TRUE(_events.hasError(ErrorSeverity::SeriousError, "Could not copy file"));
        EXPECT_EQ(getState(id), DeviceState::Downloading);

        transferFile(id, "card-1");
        EXPECT_EQ(getState(id), DeviceState::Completed);
        ASSERT_EQ(_events.completedDevices.size(), 1);
        EXPECT_EQ(_events.completedDevices.front().second.photosDownloaded, 1);
        EXPECT_EQ(_events.completedDevices.front().second.photosFailed, 1);
    }

    TEST_F(DownloadOrchestratorTest, pauseResume)
    {
        createOrchestrator();

        const DeviceId id{ addScannedSource("card", { { FileType::Photo, 1000 } }) };

        // nothing to pause
        _orchestrator->pauseDownload();
        EXPECT_FALSE(_orchestrator->isPaused());

        _orchestrator->startDownload();
        _orchestrator->pauseDownload();
        EXPECT_TRUE(_orchestrator->isPaused());
        EXPECT_EQ(_copy->getRequests<messages::CopyPause>(id.value()).size(), 1);

        _orchestrator->resumeDownload();
        EXPECT_FALSE(_orchestrator->isPaused());
        EXPECT_EQ(_copy->getRequests<messages::CopyResume>(id.value()).size(), 1);
    }

    TEST_F(DownloadOrchestratorTest, cameraUnmountBeforeScan)
    {
        createOrchestrator();

        _deviceMonitor.mountedCameras = { "Camera A", "Camera B" };
        _orchestrator->onCameraAdded(CameraDescriptor{ "Camera A", "usb:001,004" });
        _orchestrator->onCameraAdded(CameraDescriptor{ "Camera B", "usb:001,005" });

        // one unmount at a time
        ASSERT_EQ(_deviceMonitor.cameraUnmounts.size(), 1);
        EXPECT_EQ(_deviceMonitor.cameraUnmounts.front().model, "Camera A");

        const std::optional<DeviceId> first{ _orchestrator->getDeviceRegistry().findCamera("Camera A", "usb:001,004") };
        const std::optional<DeviceId> second{ _orchestrator->getDeviceRegistry().findCamera("Camera B", "usb:001,005") };
        ASSERT_TRUE(first);
        ASSERT_TRUE(second);
        EXPECT_EQ(getState(*first), DeviceState::Registered);
        EXPECT_FALSE(_scan->isWorkerRunning(first->value()));

        // already unmounting
        _orchestrator->onCameraAdded(CameraDescriptor{ "Camera A", "usb:001,004" });
        EXPECT_EQ(_deviceMonitor.cameraUnmounts.size(), 1);

        _deviceMonitor.completeCameraUnmount(0, true);
        EXPECT_EQ(getState(*first), DeviceState::Scanning);
        const auto scanArguments{ _scan->getRequests<messages::ScanArguments>(first->value()) };
        ASSERT_EQ(scanArguments.size(), 1);
        EXPECT_EQ(scanArguments.front().kind, DeviceKind::Camera);
        EXPECT_EQ(scanArguments.front().cameraPort, "usb:001,004");

        ASSERT_EQ(_deviceMonitor.cameraUnmounts.size(), 2);
        EXPECT_EQ(_deviceMonitor.cameraUnmounts.back().model, "Camera B");

        _deviceMonitor.completeCameraUnmount(1, false);
        EXPECT_TRUE(_events.hasError(ErrorSeverity::Warning, "Cannot access camera Camera B"));
        EXPECT_EQ(getState(*second), DeviceState::Removed);
    }

    TEST_F(DownloadOrchestratorTest, cameraBlacklist)
    {
        _preferences.preferences.cameraBlacklist = { "Phone" };
        createOrchestrator();

        _orchestrator->onCameraAdded(CameraDescriptor{ "Phone", "usb:001,004" });
        EXPECT_FALSE(_orchestrator->getDeviceRegistry().findCamera("Phone", "usb:001,004"));
        EXPECT_EQ(_orchestrator->getDeviceRegistry().getActiveDeviceCount(), 0);
    }

    TEST_F(DownloadOrchestratorTest, partitionAutodetection)
    {
        createOrchestrator();

        const std::filesystem::path withoutDcim{ _tmpDir / "usb-drive" };
        std::filesystem::create_directories(withoutDcim);
        _orchestrator->onPartitionMounted(PartitionDescriptor{ withoutDcim, "USB drive", "drive-removable-media", true });
        EXPECT_EQ(_orchestrator->getDeviceRegistry().getActiveDeviceCount(), 0);

        const std::filesystem::path card{ createSourceFolder("card") };
        std::ofstream{ card / "DCIM" / "IMG_0001.JPG" } << "data";
        _orchestrator->onPartitionMounted(PartitionDescriptor{ card, "Memory card", "media-flash", true });

        const std::optional<DeviceId> id{ _orchestrator->getDeviceRegistry().findByPath(card, DeviceKind::Volume) };
        ASSERT_TRUE(id);
        EXPECT_EQ(getState(*id), DeviceState::Scanning);

        _orchestrator->onPartitionUnmounted(card);
        EXPECT_EQ(getState(*id), DeviceState::Removed);
    }

    TEST_F(DownloadOrchestratorTest, autoExit)
    {
        _preferences.preferences.autoExit = true;
        _preferences.preferences.autoUnmount = true;
        _preferences.preferences.pathWhitelist = { _tmpDir / "card" };
        createOrchestrator();

        _orchestrator->onPartitionMounted(PartitionDescriptor{ createSourceFolder("card"), "card", "media-flash", true });
        const std::optional<DeviceId> id{ _orchestrator->getDeviceRegistry().findByPath(_tmpDir / "card", DeviceKind::Volume) };
        ASSERT_TRUE(id);
        _scan->emitResult(id->value(), messages::ScanFilesFound{ { createFile(*id, "card-0", FileType::Photo, 1000) } });
        _scan->finish(id->value());

        _orchestrator->startDownload();
        transferFile(*id, "card-0");

        EXPECT_EQ(_deviceMonitor.volumeUnmounts, std::vector<std::filesystem::path>{ _tmpDir / "card" });
        EXPECT_EQ(_events.exitRequestedCount, 1);
    }

    TEST_F(DownloadOrchestratorTest, noAutoExitAfterErrors)
    {
        _preferences.preferences.autoExit = true;
        createOrchestrator();

        const DeviceId id{ addScannedSource("card", { { FileType::Photo, 1000 } }) };
        _orchestrator->startDownload();
        _copy->emitResult(id.value(), messages::CopyFileResult{ "card-0", false, {}, "read error", 1 });

        EXPECT_EQ(_events.downloadCompletedCount, 1);
        EXPECT_EQ(_events.exitRequestedCount, 0);
    }

    TEST_F(DownloadOrchestratorTest, moveDeletesSourceFiles)
    {
        _preferences.preferences.move = true;
        createOrchestrator();

        const DeviceId id{ addScannedSource("card", { { FileType::Photo, 1000 }, { FileType::Photo, 1000 } }) };
        _orchestrator->startDownload();
        transferFile(id, "card-0");
        _copy->emitResult(id.value(), messages::CopyFileResult{ "card-1", false, {}, "read error", 2 });

        const auto deletions{ _offload->getRequests<messages::DeleteSourceFiles>() };
        ASSERT_EQ(deletions.size(), 1);
        EXPECT_EQ(deletions.front().deviceId, id);
        EXPECT_EQ(deletions.front().files, std::vector<std::filesystem::path>{ getFile(id, 0).info.path });
    }

    TEST_F(DownloadOrchestratorTest, shutdownDuringDownload)
    {
        createOrchestrator();

        const DeviceId id{ addScannedSource("card", { { FileType::Photo, 1000 }, { FileType::Photo, 1000 } }) };
        _orchestrator->startDownload();
        _copy->emitResult(id.value(), messages::CopyTempDirs{ _tmpDir / "Pictures" / ".lpd-tmp", {} });
        transferFile(id, "card-0");

        bool ready{};
        _orchestrator->requestShutdown([&] { ready = true; });

        EXPECT_TRUE(_copy->isStopRequested(id.value()));
        EXPECT_EQ(_rename->getRequests<messages::RenameDownloadCompleted>().size(), 1);
        // the rename worker reports the sequence values before exiting
        EXPECT_TRUE(_rename->isStopRequested(std::nullopt));
        EXPECT_FALSE(_offload->isStopRequested(std::nullopt));

        const messages::SequenceState sequences{ 3, "2025-01-01", 2 };
        _rename->emitResult(std::nullopt, messages::RenameSequencesUpdate{ sequences });
        EXPECT_EQ(_preferences.sequenceState, sequences);
        EXPECT_TRUE(_rename->isStopRequested(std::nullopt));
        EXPECT_TRUE(_offload->isStopRequested(std::nullopt));
        EXPECT_EQ(_offload->getRequests<messages::PurgeDirectories>().size(), 1);
        EXPECT_FALSE(ready);

        _copy->finishStopped();
        _rename->finishStopped();
        EXPECT_FALSE(ready);

        _offload->finishStopped();
        EXPECT_TRUE(ready);
    }

    TEST_F(DownloadOrchestratorTest, shutdownWithSilentRenameWorker)
    {
        createOrchestrator();

        const DeviceId id{ addScannedSource("card", { { FileType::Photo, 1000 } }) };
        _orchestrator->startDownload();

        bool ready{};
        _orchestrator->requestShutdown([&] { ready = true; });
        EXPECT_TRUE(_rename->isStopRequested(std::nullopt));

        _copy->finishStopped();
        EXPECT_EQ(_copy->getRequests<messages::CopyFilesArguments>(id.value()).size(), 1);
        EXPECT_FALSE(ready);

        // killed at the end of the grace period, without any answer
        _rename->finishStopped();
        EXPECT_EQ(_preferences.sequenceStateSaveCount, 0);
        EXPECT_TRUE(_offload->isStopRequested(std::nullopt));
        EXPECT_FALSE(ready);

        _offload->finishStopped();
        EXPECT_TRUE(ready);
    }

    TEST_F(DownloadOrchestratorTest, shutdownWhenIdle)
    {
        createOrchestrator();

        bool ready{};
        _orchestrator->requestShutdown([&] { ready = true; });
        EXPECT_TRUE(_rename->getRequests<messages::RenameDownloadCompleted>().empty());
        EXPECT_FALSE(ready);

        _rename->finishStopped();
        _offload->finishStopped();
        EXPECT_TRUE(ready);
    }
} // namespace lpd::download::tests
