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

#include "CopyManager.hpp"

#include <algorithm>

#include "core/ILogger.hpp"
#include "core/Utils.hpp"

namespace lpd::download
{
    CopyManager::CopyManager(CopyChannel& channel, stageEvents::StageEventHandler eventHandler)
        : _channel{ channel }
        , _eventHandler{ std::move(eventHandler) }
    {
        _channel.setEventHandler([this](const CopyChannel::Event& event) { onWorkerEvent(event); });
    }

    void CopyManager::startCopy(const messages::CopyFilesArguments& arguments)
    {
        std::vector<std::string>& outstandingFiles{ _outstandingFiles[arguments.deviceId] };
        for (const messages::MediaFileInfo& file : arguments.files)
            outstandingFiles.push_back(file.uniqueId);

        LPD_LOG(COPY, DEBUG, "Copying " << arguments.files.size() << " files from device " << arguments.deviceId.value());
        _channel.start(arguments.deviceId.value(), messages::CopyRequest{ arguments });
    }

    void CopyManager::pauseAll()
    {
        for (const auto& [id, files] : _outstandingFiles)
            _channel.send(id.value(), messages::CopyRequest{ messages::CopyPause{} });
    }

    void CopyManager::resumeAll()
    {
        for (const auto& [id, files] : _outstandingFiles)
            _channel.send(id.value(), messages::CopyRequest{ messages::CopyResume{} });
    }

    void CopyManager::stop(DeviceId id)
    {
        _channel.stop(id.value());
    }

    void CopyManager::stopAll()
    {
        _channel.stopAll();
    }

    bool CopyManager::isCopying(DeviceId id) const
    {
        return _channel.isRunning(id.value());
    }

    bool CopyManager::isIdle() const
    {
        return _channel.getRunningCount() == 0;
    }

    void CopyManager::onWorkerEvent(const CopyChannel::Event& event)
    {
        if (!event.key)
        {
            LPD_LOG(COPY, ERROR, "Dropping copy event without device");
            return;
        }

        const DeviceId id{ *event.key };

        std::visit(core::utils::overloads{
                       [&](const messages::CopyResult& result) {
                           std::visit(core::utils::overloads{
                                          [&](const messages::BytesProgress& progress) {
                                              _eventHandler(stageEvents::CopyBytes{ id, progress.bytes });
                                          },
                                          [&](const messages::CopyTempDirs& tempDirs) {
                                              stageEvents::CopyTempDirs dirs{ id, {} };
                                              for (const std::filesystem::path& dir : { tempDirs.photoTempDir, tempDirs.videoTempDir })
                                              {
                                                  if (!dir.empty())
                                                      dirs.directories.push_back(dir);
                                              }
                                              _eventHandler(std::move(dirs));
                                          },
                                          [&](const messages::CopyFileResult& fileResult) {
                                              auto it{ _outstandingFiles.find(id) };
                                              if (it == std::end(_outstandingFiles) || std::erase(it->second, fileResult.uniqueId) == 0)
                                              {
                                                  LPD_LOG(COPY, WARNING, "Device " << id.value() << ": unexpected result for file " << fileResult.uniqueId);
                                                  return;
                                              }
                                              _eventHandler(stageEvents::FileCopied{ id, fileResult });
                                          },
                                      },
                                      result);
                       },
                       [&](const worker::WorkerFinished& finished) {
                           std::vector<std::string> abandonedFiles;
                           if (auto it{ _outstandingFiles.find(id) }; it != std::end(_outstandingFiles))
                           {
                               abandonedFiles = std::move(it->second);
                               _outstandingFiles.erase(it);
                           }

                           LPD_LOG_IF(COPY, WARNING, !abandonedFiles.empty(), "Copy worker of device " << id.value() << " finished with " << abandonedFiles.size() << " files not processed");
                           _eventHandler(stageEvents::CopyFinished{ id, finished.unexpected, std::move(abandonedFiles) });
                       },
                   },
                   event.payload);
    }
} // namespace lpd::download
