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

#include <string>
#include <vector>

#include <Wt/WSignal.h>

#include "download/Types.hpp"
#include "messages/OffloadMessages.hpp"

namespace lpd::download
{
    // Emitted from the supervising loop
    struct Events
    {
        Wt::Signal<DeviceId> deviceAdded;
        Wt::Signal<DeviceId> deviceRemoved;
        Wt::Signal<DeviceId, DeviceState> deviceStateChanged;
        // display name or storage space updated
        Wt::Signal<DeviceId> deviceInfoUpdated;
        Wt::Signal<DeviceId, FileCounts> scanCountsUpdated;

        // percent in [0, 1], status text such as "3 of 205 photos and videos"
        Wt::Signal<DeviceId, float, std::string> deviceProgress;
        Wt::Signal<float> overallProgress;
        Wt::Signal<std::string> timeRemaining;
        Wt::Signal<std::string> downloadSpeed;

        Wt::Signal<> downloadStarted;
        Wt::Signal<DeviceId, DownloadCounts> deviceDownloadCompleted;
        Wt::Signal<> downloadCompleted;
        // only when several devices took part in the download
        Wt::Signal<DownloadCounts> downloadSummary;

        Wt::Signal<ErrorReport> errorReported;
        // previously used codes, most recent first
        Wt::Signal<std::vector<std::string>> jobCodeRequested;
        Wt::Signal<DeviceId, CameraErrorCode, std::string> scanErrorDecisionRequested;

        Wt::Signal<DeviceId, std::vector<std::string>> thumbnailsRequested;
        Wt::Signal<messages::ProximityGroups> proximityGroupsGenerated;
        Wt::Signal<bool> preferencesControlsEnabled;
        Wt::Signal<> backupDestinationsChanged;
        Wt::Signal<> exitRequested;
    };
} // namespace lpd::download
