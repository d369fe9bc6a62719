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

#include <deque>
#include <map>
#include <vector>

#include "StageEvents.hpp"
#include "download/BackupDestinationResolver.hpp"
#include "download/StageChannels.hpp"

namespace lpd::download
{
    // One backup worker per destination
    class BackupManager
    {
    public:
        BackupManager(BackupChannel& channel, stageEvents::StageEventHandler eventHandler);
        BackupManager(const BackupManager&) = delete;
        BackupManager& operator=(const BackupManager&) = delete;

        void addDestination(BackupDestinationId id, const messages::BackupArguments& arguments);
        // Returns the files that were sent to the worker and have no result yet
        std::vector<messages::BackupFileData> removeDestination(BackupDestinationId id);

        void backupFile(BackupDestinationId id, const messages::BackupFileData& fileData);
        void stopAll();

        bool isIdle() const;

    private:
        void onWorkerEvent(const BackupChannel::Event& event);

        BackupChannel& _channel;
        stageEvents::StageEventHandler _eventHandler;
        // processed in order by each worker
        std::map<BackupDestinationId, std::deque<messages::BackupFileData>> _outstandingFiles;
    };
} // namespace lpd::download
