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

#include "ScanManager.hpp"

#include "core/ILogger.hpp"
#include "core/Utils.hpp"

namespace lpd::download
{
    ScanManager::ScanManager(ScanChannel& channel, stageEvents::StageEventHandler eventHandler)
        : _channel{ channel }
        , _eventHandler{ std::move(eventHandler) }
    {
        _channel.setEventHandler([this](const ScanChannel::Event& event) { onWorkerEvent(event); });
    }

    void ScanManager::startScan(const messages::ScanArguments& arguments)
    {
        LPD_LOG(SCAN, DEBUG, "Starting scan of device " << arguments.deviceId.value() << " (" << messages::toString(arguments.kind) << ")");
        _channel.start(arguments.deviceId.value(), messages::ScanRequest{ arguments });
    }

    void ScanManager::resume(DeviceId id)
    {
        LPD_LOG(SCAN, DEBUG, "Resuming scan of device " << id.value());
        _channel.send(id.value(), messages::ScanRequest{ messages::ScanResume{} });
    }

    void ScanManager::stop(DeviceId id)
    {
        _channel.stop(id.value());
    }

    void ScanManager::stopAll()
    {
        _channel.stopAll();
    }

    bool ScanManager::isScanning(DeviceId id) const
    {
        return _channel.isRunning(id.value());
    }

    bool ScanManager::isIdle() const
    {
        return _channel.getRunningCount() == 0;
    }

    void ScanManager::onWorkerEvent(const ScanChannel::Event& event)
    {
        if (!event.key)
        {
            LPD_LOG(SCAN, ERROR, "Dropping scan event without device");
            return;
        }

        const DeviceId id{ *event.key };

        std::visit(core::utils::overloads{
                       [&](const messages::ScanResult& result) {
                           std::visit(core::utils::overloads{
                                          [&](const messages::ScanDeviceInfo& info) {
                                              _eventHandler(stageEvents::ScanDeviceInfo{ id, info });
                                          },
                                          [&](const messages::ScanFilesFound& filesFound) {
                                              _eventHandler(stageEvents::ScanFilesFound{ id, filesFound.files });
                                          },
                                          [&](const messages::ScanDeviceError& error) {
                                              _eventHandler(stageEvents::ScanError{ id, error.code, error.details });
                                          },
                                      },
                                      result);
                       },
                       [&](const worker::WorkerFinished& finished) {
                           _eventHandler(stageEvents::ScanFinished{ id, finished.unexpected });
                       },
                   },
                   event.payload);
    }
} // namespace lpd::download
