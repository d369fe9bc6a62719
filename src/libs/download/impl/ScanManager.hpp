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

#include "StageEvents.hpp"
#include "download/StageChannels.hpp"

namespace lpd::download
{
    class ScanManager
    {
    public:
        ScanManager(ScanChannel& channel, stageEvents::StageEventHandler eventHandler);
        ScanManager(const ScanManager&) = delete;
        ScanManager& operator=(const ScanManager&) = delete;

        void startScan(const messages::ScanArguments& arguments);
        // after a device error
        void resume(DeviceId id);
        void stop(DeviceId id);
        void stopAll();

        bool isScanning(DeviceId id) const;
        bool isIdle() const;

    private:
        void onWorkerEvent(const ScanChannel::Event& event);

        ScanChannel& _channel;
        stageEvents::StageEventHandler _eventHandler;
    };
} // namespace lpd::download
