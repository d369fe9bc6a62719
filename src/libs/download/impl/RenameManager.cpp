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

#include "RenameManager.hpp"

#include <algorithm>

#include "core/ILogger.hpp"
#include "core/Utils.hpp"

namespace lpd::download
{
    RenameManager::RenameManager(RenameChannel& channel, stageEvents::StageEventHandler eventHandler)
        : _channel{ channel }
        , _eventHandler{ std::move(eventHandler) }
    {
        _channel.setEventHandler([this](const RenameChannel::Event& event) { onWorkerEvent(event); });
    }

    bool RenameManager::launch()
    {
        return _channel.launch(std::nullopt);
    }

    void RenameManager::startDownloadCycle(const messages::RenameDownloadStarted& downloadStarted)
    {
        LPD_LOG(RENAME, DEBUG, "Download cycle started, stored sequence no = " << downloadStarted.sequences.storedSequenceNo);

        _downloadStarted = downloadStarted;
        if (_channel.isRunning(std::nullopt))
            _channel.send(std::nullopt, messages::RenameRequest{ downloadStarted });
        else
            ensureStarted();
    }

    void RenameManager::renameFile(const messages::RenameFileData& fileData)
    {
        if (!ensureStarted())
        {
            // failure reported through the finished event
            _outstandingFiles.push_back(fileData);
            return;
        }

        _outstandingFiles.push_back(fileData);
        _channel.send(std::nullopt, messages::RenameRequest{ fileData });
    }

    void RenameManager::completeDownloadCycle()
    {
        if (!ensureStarted())
            return;

        LPD_LOG(RENAME, DEBUG, "Download cycle completed, requesting sequence values");

        _awaitingSequences = true;
        _downloadStarted.reset();
        _channel.send(std::nullopt, messages::RenameRequest{ messages::RenameDownloadCompleted{} });
    }

    void RenameManager::stop()
    {
        _channel.stop(std::nullopt);
    }

    bool RenameManager::isIdle() const
    {
        return _channel.getRunningCount() == 0;
    }

    bool RenameManager::ensureStarted()
    {
        if (_channel.isRunning(std::nullopt))
            return true;

        LPD_LOG(RENAME, INFO, "Starting rename worker");
        if (!_channel.launch(std::nullopt))
            return false;

        if (_downloadStarted)
            _channel.send(std::nullopt, messages::RenameRequest{ *_downloadStarted });

        return true;
    }

    void RenameManager::onWorkerEvent(const RenameChannel::Event& event)
    {
        std::visit(core::utils::overloads{
                       [&](const messages::RenameResult& result) {
                           std::visit(core::utils::overloads{
                                          [&](const messages::RenameFileResult& fileResult) {
                                              const auto removedCount{ std::erase_if(_outstandingFiles, [&](const messages::RenameFileData& fileData) {
                                                  return fileData.deviceId == fileResult.deviceId && fileData.uniqueId == fileResult.uniqueId;
                                              }) };
                                              if (removedCount == 0)
                                              {
                                                  LPD_LOG(RENAME, WARNING, "Unexpected rename result for file " << fileResult.uniqueId);
                                                  return;
                                              }
                                              // a restarted worker must not hand out the same sequence numbers again
                                              if (fileResult.success && _downloadStarted)
                                                  _downloadStarted->sequences.storedSequenceNo += 1;

                                              _eventHandler(stageEvents::FileRenamed{ fileResult });
                                          },
                                          [&](const messages::RenameSequencesUpdate& update) {
                                              _awaitingSequences = false;
                                              _eventHandler(stageEvents::SequencesUpdated{ update.sequences });
                                          },
                                      },
                                      result);
                       },
                       [&](const worker::WorkerFinished& finished) {
                           stageEvents::RenameFinished renameFinished{ finished.unexpected, std::move(_outstandingFiles), _awaitingSequences };
                           _outstandingFiles.clear();
                           _awaitingSequences = false;

                           _eventHandler(std::move(renameFinished));
                       },
                   },
                   event.payload);
    }
} // namespace lpd::download
