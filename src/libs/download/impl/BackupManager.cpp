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

#include "BackupManager.hpp"

#include <algorithm>

#include "core/ILogger.hpp"
#include "core/Utils.hpp"

namespace lpd::download
{
    BackupManager::BackupManager(BackupChannel& channel, stageEvents::StageEventHandler eventHandler)
        : _channel{ channel }
        , _eventHandler{ std::move(eventHandler) }
    {
        _channel.setEventHandler([this](const BackupChannel::Event& event) { onWorkerEvent(event); });
    }

    void BackupManager::addDestination(BackupDestinationId id, const messages::BackupArguments& arguments)
    {
        LPD_LOG(BACKUP, INFO, "Starting backup worker for destination " << arguments.destination << " (" << messages::toString(arguments.type) << ")");

        _outstandingFiles.try_emplace(id);
        _channel.start(id, messages::BackupRequest{ arguments });
    }

    std::vector<messages::BackupFileData> BackupManager::removeDestination(BackupDestinationId id)
    {
        std::vector<messages::BackupFileData> res;

        auto it{ _outstandingFiles.find(id) };
        if (it == std::end(_outstandingFiles))
            return res;

        res.assign(std::make_move_iterator(std::begin(it->second)), std::make_move_iterator(std::end(it->second)));
        _outstandingFiles.erase(it);

        _channel.stop(id);
        return res;
    }

    void BackupManager::backupFile(BackupDestinationId id, const messages::BackupFileData& fileData)
    {
        auto it{ _outstandingFiles.find(id) };
        if (it == std::end(_outstandingFiles))
        {
            LPD_LOG(BACKUP, ERROR, "Cannot backup file " << fileData.uniqueId << ": unknown destination " << id);
            return;
        }

        it->second.push_back(fileData);
        _channel.send(id, messages::BackupRequest{ fileData });
    }

    void BackupManager::stopAll()
    {
        _channel.stopAll();
    }

    bool BackupManager::isIdle() const
    {
        return _channel.getRunningCount() == 0;
    }

    void BackupManager::onWorkerEvent(const BackupChannel::Event& event)
    {
        if (!event.key)
        {
            LPD_LOG(BACKUP, ERROR, "Dropping backup event without destination");
            return;
        }

        const BackupDestinationId id{ *event.key };
        auto itDestination{ _outstandingFiles.find(id) };
        if (itDestination == std::end(_outstandingFiles))
        {
            LPD_LOG(BACKUP, DEBUG, "Ignoring event from removed destination " << id);
            return;
        }
        std::deque<messages::BackupFileData>& outstandingFiles{ itDestination->second };

        std::visit(core::utils::overloads{
                       [&](const messages::BackupResult& result) {
                           std::visit(core::utils::overloads{
                                          [&](const messages::BytesProgress& progress) {
                                              if (outstandingFiles.empty())
                                              {
                                                  LPD_LOG(BACKUP, WARNING, "Destination " << id << ": progress reported while no file is being processed");
                                                  return;
                                              }
                                              _eventHandler(stageEvents::BackupBytes{ outstandingFiles.front().deviceId, progress.bytes });
                                          },
                                          [&](const messages::BackupFileResult& fileResult) {
                                              auto it{ std::find_if(std::begin(outstandingFiles), std::end(outstandingFiles), [&](const messages::BackupFileData& fileData) {
                                                  return fileData.deviceId == fileResult.deviceId && fileData.uniqueId == fileResult.uniqueId;
                                              }) };
                                              if (it == std::end(outstandingFiles))
                                              {
                                                  LPD_LOG(BACKUP, WARNING, "Destination " << id << ": unexpected result for file " << fileResult.uniqueId);
                                                  return;
                                              }
                                              outstandingFiles.erase(it);
                                              _eventHandler(stageEvents::FileBackedUp{ id, fileResult });
                                          },
                                      },
                                      result);
                       },
                       [&](const worker::WorkerFinished& finished) {
                           stageEvents::BackupFinished backupFinished{ id, finished.unexpected, {} };
                           backupFinished.abandonedFiles.assign(std::make_move_iterator(std::begin(outstandingFiles)), std::make_move_iterator(std::end(outstandingFiles)));
                           _outstandingFiles.erase(itDestination);

                           LPD_LOG_IF(BACKUP, WARNING, !backupFinished.abandonedFiles.empty(), "Backup worker of destination " << id << " finished with " << backupFinished.abandonedFiles.size() << " files not processed");
                           _eventHandler(std::move(backupFinished));
                       },
                   },
                   event.payload);
    }
} // namespace lpd::download
