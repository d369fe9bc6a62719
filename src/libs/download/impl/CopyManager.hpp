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

#include <map>
#include <string>
#include <vector>

#include "StageEvents.hpp"
#include "download/StageChannels.hpp"

namespace lpd::download
{
    class CopyManager
    {
    public:
        CopyManager(CopyChannel& channel, stageEvents::StageEventHandler eventHandler);
        CopyManager(const CopyManager&) = delete;
        CopyManager& operator=(const CopyManager&) = delete;

        void startCopy(const messages::CopyFilesArguments& arguments);
        void pauseAll();
        void resumeAll();
        void stop(DeviceId id);
        void stopAll();

        bool isCopying(DeviceId id) const;
        bool isIdle() const;

    private:
        void onWorkerEvent(const CopyChannel::Event& event);

        CopyChannel& _channel;
        stageEvents::StageEventHandler _eventHandler;
        // files sent to each worker, waiting for their result
        std::map<DeviceId, std::vector<std::string>> _outstandingFiles;
    };
} // namespace lpd::download
