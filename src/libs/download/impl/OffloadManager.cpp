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

#include "OffloadManager.hpp"

#include "core/ILogger.hpp"
#include "core/Utils.hpp"

namespace lpd::download
{
    OffloadManager::OffloadManager(OffloadChannel& channel, stageEvents::StageEventHandler eventHandler)
        : _channel{ channel }
        , _eventHandler{ std::move(eventHandler) }
    {
        _channel.setEventHandler([this](const OffloadChannel::Event& event) { onWorkerEvent(event); });
    }

    bool OffloadManager::launch()
    {
        return _channel.launch(std::nullopt);
    }

    void OffloadManager::requestProximityGroups(const messages::ProximityRequest& request)
    {
        LPD_LOG(OFFLOAD, DEBUG, "Requesting proximity groups for " << request.entries.size() << " files");
        _channel.start(std::nullopt, messages::OffloadRequest{ request });
    }

    void OffloadManager::deleteSourceFiles(DeviceId id, std::vector<std::filesystem::path> files)
    {
        if (files.empty())
            return;

        LPD_LOG(OFFLOAD, INFO, "Deleting " << files.size() << " source files from device " << id.value());
        _channel.start(std::nullopt, messages::OffloadRequest{ messages::DeleteSourceFiles{ id, std::move(files) } });
    }

    void OffloadManager::purgeDirectories(std::vector<std::filesystem::path> directories)
    {
        if (directories.empty())
            return;

        LPD_LOG(OFFLOAD, DEBUG, "Purging " << directories.size() << " temporary directories");
        _channel.start(std::nullopt, messages::OffloadRequest{ messages::PurgeDirectories{ std::move(directories) } });
    }

    void OffloadManager::stop()
    {
        _channel.stop(std::nullopt);
    }

    bool OffloadManager::isIdle() const
    {
        return _channel.getRunningCount() == 0;
    }

    void OffloadManager::onWorkerEvent(const OffloadChannel::Event& event)
    {
        std::visit(core::utils::overloads{
                       [&](const messages::OffloadResult& result) {
                           std::visit(core::utils::overloads{
                                          [&](const messages::ProximityGroups& groups) {
                                              _eventHandler(stageEvents::ProximityGroups{ groups });
                                          },
                                          [&](const messages::SourceFilesDeleted& deleted) {
                                              LPD_LOG(OFFLOAD, INFO, "Device " << deleted.deviceId.value() << ": deleted " << deleted.deletedCount << " source files");
                                              LPD_LOG_IF(OFFLOAD, WARNING, deleted.failedCount > 0, "Device " << deleted.deviceId.value() << ": failed to delete " << deleted.failedCount << " source files");
                                          },
                                          [&](const messages::DirectoriesPurged& purged) {
                                              LPD_LOG(OFFLOAD, DEBUG, "Purged " << purged.purgedCount << " temporary directories");
                                              LPD_LOG_IF(OFFLOAD, WARNING, purged.failedCount > 0, "Failed to purge " << purged.failedCount << " temporary directories");
                                          },
                                      },
                                      result);
                       },
                       [&](const worker::WorkerFinished& finished) {
                           _eventHandler(stageEvents::OffloadFinished{ finished.unexpected });
                       },
                   },
                   event.payload);
    }
} // namespace lpd::download
