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

#include "download/StageChannels.hpp"

#include "core/IConfig.hpp"
#include "messages/Codec.hpp"
#include "worker/WorkerChannel.hpp"

namespace lpd::download
{
    namespace
    {
        worker::WorkerSettings createWorkerSettings(const StageChannelSettings& settings, std::string_view stage, std::chrono::milliseconds gracePeriod)
        {
            return worker::WorkerSettings{
                .name = std::string{ stage },
                .path = settings.workerBinary,
                .args = { "--stage", std::string{ stage } },
                .gracePeriod = gracePeriod,
            };
        }

        template<typename Request, typename Result, Result (*decode)(std::string_view)>
        worker::WorkerCodec<Request, Result> createCodec()
        {
            return worker::WorkerCodec<Request, Result>{
                .encodeRequest = [](const Request& request) { return messages::encode(request); },
                .decodeResult = [](std::string_view line) { return decode(line); },
            };
        }

        std::chrono::milliseconds readGracePeriod(core::IConfig& config, std::string_view setting, std::chrono::milliseconds def)
        {
            return std::chrono::milliseconds{ config.getULong(setting, def.count()) };
        }
    } // namespace

    StageChannelSettings readStageChannelSettings(core::IConfig& config, const std::filesystem::path& defaultWorkerBinary)
    {
        StageChannelSettings settings;

        settings.workerBinary = config.getPath("worker-binary", defaultWorkerBinary);
        settings.scanGracePeriod = readGracePeriod(config, "scan-stop-grace-period-ms", settings.scanGracePeriod);
        settings.copyGracePeriod = readGracePeriod(config, "copy-stop-grace-period-ms", settings.copyGracePeriod);
        settings.renameGracePeriod = readGracePeriod(config, "rename-stop-grace-period-ms", settings.renameGracePeriod);
        settings.backupGracePeriod = readGracePeriod(config, "backup-stop-grace-period-ms", settings.backupGracePeriod);
        settings.offloadGracePeriod = readGracePeriod(config, "offload-stop-grace-period-ms", settings.offloadGracePeriod);

        return settings;
    }

    StageChannels createStageChannels(boost::asio::io_context& ioContext, core::IChildProcessManager& childProcessManager, const StageChannelSettings& settings)
    {
        using namespace messages;

        StageChannels channels;

        channels.scan = worker::createPooledWorkerChannel(ioContext, childProcessManager, createWorkerSettings(settings, "scan", settings.scanGracePeriod), createCodec<ScanRequest, ScanResult, &decodeScanResult>());
        channels.copy = worker::createPooledWorkerChannel(ioContext, childProcessManager, createWorkerSettings(settings, "copy", settings.copyGracePeriod), createCodec<CopyRequest, CopyResult, &decodeCopyResult>());
        channels.rename = worker::createSingletonWorkerChannel(ioContext, childProcessManager, createWorkerSettings(settings, "rename", settings.renameGracePeriod), createCodec<RenameRequest, RenameResult, &decodeRenameResult>());
        channels.backup = worker::createPooledWorkerChannel(ioContext, childProcessManager, createWorkerSettings(settings, "backup", settings.backupGracePeriod), createCodec<BackupRequest, BackupResult, &decodeBackupResult>());
        channels.offload = worker::createSingletonWorkerChannel(ioContext, childProcessManager, createWorkerSettings(settings, "offload", settings.offloadGracePeriod), createCodec<OffloadRequest, OffloadResult, &decodeOffloadResult>());

        return channels;
    }
} // namespace lpd::download
