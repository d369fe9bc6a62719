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

#include <chrono>
#include <filesystem>
#include <memory>

#include <boost/asio/io_context.hpp>

#include "messages/BackupMessages.hpp"
#include "messages/CopyMessages.hpp"
#include "messages/OffloadMessages.hpp"
#include "messages/RenameMessages.hpp"
#include "messages/ScanMessages.hpp"
#include "worker/IWorkerChannel.hpp"

namespace lpd::core
{
    class IChildProcessManager;
    class IConfig;
} // namespace lpd::core

namespace lpd::download
{
    using ScanChannel = worker::IWorkerChannel<messages::ScanRequest, messages::ScanResult>;
    using CopyChannel = worker::IWorkerChannel<messages::CopyRequest, messages::CopyResult>;
    using RenameChannel = worker::IWorkerChannel<messages::RenameRequest, messages::RenameResult>;
    using BackupChannel = worker::IWorkerChannel<messages::BackupRequest, messages::BackupResult>;
    using OffloadChannel = worker::IWorkerChannel<messages::OffloadRequest, messages::OffloadResult>;

    struct StageChannels
    {
        std::unique_ptr<ScanChannel> scan;       // pooled, one per device
        std::unique_ptr<CopyChannel> copy;       // pooled, one per device
        std::unique_ptr<RenameChannel> rename;   // singleton
        std::unique_ptr<BackupChannel> backup;   // pooled, one per backup destination
        std::unique_ptr<OffloadChannel> offload; // singleton
    };

    struct StageChannelSettings
    {
        std::filesystem::path workerBinary;
        std::chrono::milliseconds scanGracePeriod{ 2000 };
        std::chrono::milliseconds copyGracePeriod{ 1000 };
        std::chrono::milliseconds renameGracePeriod{ 500 };
        std::chrono::milliseconds backupGracePeriod{ 1000 };
        std::chrono::milliseconds offloadGracePeriod{ 500 };
    };

    StageChannelSettings readStageChannelSettings(core::IConfig& config, const std::filesystem::path& defaultWorkerBinary);

    // Channels spawning "<workerBinary> --stage <stage>" processes
    StageChannels createStageChannels(boost::asio::io_context& ioContext, core::IChildProcessManager& childProcessManager, const StageChannelSettings& settings);
} // namespace lpd::download
