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

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <variant>
#include <vector>

#include "download/BackupDestinationResolver.hpp"
#include "download/Types.hpp"
#include "messages/BackupMessages.hpp"
#include "messages/CopyMessages.hpp"
#include "messages/OffloadMessages.hpp"
#include "messages/RenameMessages.hpp"
#include "messages/ScanMessages.hpp"

// Stage results, routed to the owning device
namespace lpd::download::stageEvents
{
    struct ScanDeviceInfo
    {
        DeviceId deviceId;
        messages::ScanDeviceInfo info;
    };

    struct ScanFilesFound
    {
        DeviceId deviceId;
        std::vector<messages::MediaFileInfo> files;
    };

    struct ScanError
    {
        DeviceId deviceId;
        CameraErrorCode code;
        std::string details;
    };

    struct ScanFinished
    {
        DeviceId deviceId;
        bool unexpected{};
    };

    struct CopyBytes
    {
        DeviceId deviceId;
        std::uint64_t bytes{};
    };

    struct CopyTempDirs
    {
        DeviceId deviceId;
        std::vector<std::filesystem::path> directories;
    };

    struct FileCopied
    {
        DeviceId deviceId;
        messages::CopyFileResult result;
    };

    // abandonedFiles: files sent to the worker with no result
    struct CopyFinished
    {
        DeviceId deviceId;
        bool unexpected{};
        std::vector<std::string> abandonedFiles;
    };

    struct FileRenamed
    {
        messages::RenameFileResult result;
    };

    struct SequencesUpdated
    {
        messages::SequenceState sequences;
    };

    struct RenameFinished
    {
        bool unexpected{};
        std::vector<messages::RenameFileData> abandonedFiles;
        bool sequencesLost{}; // sequence values were requested and never came
    };

    struct BackupBytes
    {
        DeviceId deviceId;
        std::uint64_t bytes{};
    };

    struct FileBackedUp
    {
        BackupDestinationId destinationId{};
        messages::BackupFileResult result;
    };

    struct BackupFinished
    {
        BackupDestinationId destinationId{};
        bool unexpected{};
        std::vector<messages::BackupFileData> abandonedFiles;
    };

    struct ProximityGroups
    {
        messages::ProximityGroups groups;
    };

    struct OffloadFinished
    {
        bool unexpected{};
    };

    using StageEvent = std::variant<
        ScanDeviceInfo, ScanFilesFound, ScanError, ScanFinished,
        CopyBytes, CopyTempDirs, FileCopied, CopyFinished,
        FileRenamed, SequencesUpdated, RenameFinished,
        BackupBytes, FileBackedUp, BackupFinished,
        ProximityGroups, OffloadFinished>;

    using StageEventHandler = std::function<void(StageEvent&&)>;
} // namespace lpd::download::stageEvents
