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

#include <optional>
#include <vector>

#include "StageEvents.hpp"
#include "download/StageChannels.hpp"

namespace lpd::download
{
    // Single rename/move worker shared by all the devices
    // The worker is restarted on demand if it went away, and gets the download cycle parameters again,
    // with the stored sequence number advanced by the files renamed so far
    class RenameManager
    {
    public:
        RenameManager(RenameChannel& channel, stageEvents::StageEventHandler eventHandler);
        RenameManager(const RenameManager&) = delete;
        RenameManager& operator=(const RenameManager&) = delete;

        bool launch();

        void startDownloadCycle(const messages::RenameDownloadStarted& downloadStarted);
        void renameFile(const messages::RenameFileData& fileData);
        // The worker will answer with the updated sequence values
        void completeDownloadCycle();

        bool isDownloadCycleActive() const { return _downloadStarted.has_value(); }
        bool isAwaitingSequences() const { return _awaitingSequences; }
        bool hasOutstandingFiles() const { return !_outstandingFiles.empty(); }

        void stop();
        bool isIdle() const;

    private:
        bool ensureStarted();
        void onWorkerEvent(const RenameChannel::Event& event);

        RenameChannel& _channel;
        stageEvents::StageEventHandler _eventHandler;
        std::optional<messages::RenameDownloadStarted> _downloadStarted;
        std::vector<messages::RenameFileData> _outstandingFiles;
        bool _awaitingSequences{};
    };
} // namespace lpd::download
