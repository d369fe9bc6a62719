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

#include <cstdlib>
#include <optional>
#include <variant>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "core/Utils.hpp"

#include "FileCopy.hpp"
#include "StageIO.hpp"
#include "Stages.hpp"

namespace lpd::stages
{
    namespace
    {
        class Backup
        {
        public:
            Backup(StageIO& io, const messages::BackupArguments& arguments)
                : _io{ io }
                , _arguments{ arguments }
            {
            }

            messages::BackupFileResult backupFile(const messages::BackupFileData& fileData)
            {
                messages::BackupFileResult result;
                result.deviceId = fileData.deviceId;
                result.uniqueId = fileData.uniqueId;

                if (!messages::canBackup(_arguments.type, fileData.type))
                {
                    result.error = std::string{ "destination does not accept " } + std::string{ messages::toString(fileData.type) } + " files";
                    return result;
                }

                std::filesystem::path directory{ _arguments.destination };
                if (_arguments.useIdentifierFolders)
                    directory /= fileData.type == messages::FileType::Photo ? _arguments.photoIdentifier : _arguments.videoIdentifier;
                directory /= fileData.subfolder;

                if (!core::pathUtils::ensureDirectory(directory))
                {
                    result.error = "cannot create directory " + directory.string();
                    return result;
                }

                const std::filesystem::path backupPath{ directory / fileData.sourcePath.filename() };
                std::error_code ec;
                if (std::filesystem::exists(backupPath, ec) && !_arguments.overwrite)
                {
                    result.error = "a file named " + backupPath.string() + " already exists";
                    return result;
                }

                const FileCopyResult copyResult{ copyFile(fileData.sourcePath, backupPath, [this](std::uint64_t bytes) {
                    _io.write(messages::BackupResult{ messages::BytesProgress{ bytes } });
                    return true;
                }) };

                if (!copyResult.success)
                {
                    result.error = copyResult.error;
                    return result;
                }

                if (_arguments.verify && !areFilesIdentical(fileData.sourcePath, backupPath))
                {
                    std::filesystem::remove(backupPath, ec);
                    result.error = "verification failed";
                    return result;
                }

                result.success = true;
                result.backupPath = backupPath;
                return result;
            }

        private:
            StageIO& _io;
            const messages::BackupArguments& _arguments;
        };
    } // namespace

    int runBackupStage(StageIO& io)
    {
        const std::optional<std::string> firstLine{ io.readLine() };
        if (!firstLine)
            return EXIT_SUCCESS;

        const messages::BackupRequest request{ messages::decodeBackupRequest(*firstLine) };
        const auto* arguments{ std::get_if<messages::BackupArguments>(&request) };
        if (!arguments)
            throw core::LpdException{ "First backup request must hold the backup arguments" };

        if (!core::pathUtils::isWritableDirectory(arguments->destination))
        {
            LPD_LOG(BACKUP, ERROR, "Cannot write into backup destination " << arguments->destination);
            return EXIT_FAILURE;
        }

        LPD_LOG(BACKUP, INFO, "Backing up " << messages::toString(arguments->type) << " into " << arguments->destination);

        Backup backup{ io, *arguments };
        while (const std::optional<std::string> line{ io.readLine() })
        {
            try
            {
                std::visit(core::utils::overloads{
                               [&](const messages::BackupFileData& fileData) {
                                   const messages::BackupFileResult result{ backup.backupFile(fileData) };
                                   LPD_LOG_IF(BACKUP, ERROR, !result.success, "Cannot back up " << fileData.sourcePath << ": " << result.error);
                                   io.write(messages::BackupResult{ result });
                               },
                               [](const messages::BackupArguments&) {
                                   LPD_LOG(BACKUP, WARNING, "Ignoring extra backup arguments");
                               },
                           },
                           messages::decodeBackupRequest(*line));
            }
            catch (const messages::CodecException& e)
            {
                LPD_LOG(BACKUP, ERROR, "Dropping malformed request: " << e.what());
            }
        }

        return EXIT_SUCCESS;
    }
} // namespace lpd::stages
