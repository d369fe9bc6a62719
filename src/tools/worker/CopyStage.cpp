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

#include <unistd.h>

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
        std::filesystem::path createTempDir(const std::filesystem::path& downloadFolder, messages::DeviceId deviceId)
        {
            const std::filesystem::path tempDir{ downloadFolder / (".lpd-tmp-" + std::to_string(deviceId.value()) + "-" + std::to_string(::getpid())) };
            if (!core::pathUtils::ensureDirectory(tempDir))
            {
                LPD_LOG(COPY, ERROR, "Cannot create temporary directory " << tempDir);
                return {};
            }

            return tempDir;
        }

        // Handles pause / resume requests received while copying
        class CopyControl
        {
        public:
            explicit CopyControl(StageIO& io)
                : _io{ io }
            {
            }

            // false if the copy must be aborted
            bool proceed()
            {
                while (const std::optional<std::string> line{ _io.pollLine() })
                    processRequest(*line);

                while (_paused)
                {
                    const std::optional<std::string> line{ _io.readLine() };
                    if (!line)
                        return false;
                    processRequest(*line);
                }

                return !_io.isInputClosed();
            }

        private:
            void processRequest(const std::string& line)
            {
                try
                {
                    std::visit(core::utils::overloads{
                                   [this](const messages::CopyPause&) {
                                       LPD_LOG(COPY, DEBUG, "Paused");
                                       _paused = true;
                                   },
                                   [this](const messages::CopyResume&) {
                                       LPD_LOG(COPY, DEBUG, "Resumed");
                                       _paused = false;
                                   },
                                   [](const messages::CopyFilesArguments&) {
                                       LPD_LOG(COPY, WARNING, "Ignoring extra copy arguments");
                                   },
                               },
                               messages::decodeCopyRequest(line));
                }
                catch (const messages::CodecException& e)
                {
                    LPD_LOG(COPY, ERROR, "Dropping malformed request: " << e.what());
                }
            }

            StageIO& _io;
            bool _paused{};
        };
    } // namespace

    int runCopyStage(StageIO& io)
    {
        const std::optional<std::string> line{ io.readLine() };
        if (!line)
            return EXIT_SUCCESS;

        const messages::CopyRequest request{ messages::decodeCopyRequest(*line) };
        const auto* arguments{ std::get_if<messages::CopyFilesArguments>(&request) };
        if (!arguments)
            throw core::LpdException{ "First copy request must hold the copy arguments" };

        LPD_LOG(COPY, INFO, "Copying " << arguments->files.size() << " files from device " << arguments->deviceId.value());

        bool hasPhotos{};
        bool hasVideos{};
        for (const messages::MediaFileInfo& file : arguments->files)
            (file.type == messages::FileType::Photo ? hasPhotos : hasVideos) = true;

        messages::CopyTempDirs tempDirs;
        if (hasPhotos)
            tempDirs.photoTempDir = createTempDir(arguments->photoDownloadFolder, arguments->deviceId);
        if (hasVideos)
            tempDirs.videoTempDir = createTempDir(arguments->videoDownloadFolder, arguments->deviceId);
        io.write(messages::CopyResult{ tempDirs });

        CopyControl control{ io };
        std::uint32_t downloadCount{};
        for (const messages::MediaFileInfo& file : arguments->files)
        {
            if (!control.proceed())
            {
                LPD_LOG(COPY, DEBUG, "Copy aborted");
                return EXIT_SUCCESS;
            }

            messages::CopyFileResult result;
            result.uniqueId = file.uniqueId;
            result.downloadCount = ++downloadCount;

            const std::filesystem::path& tempDir{ file.type == messages::FileType::Photo ? tempDirs.photoTempDir : tempDirs.videoTempDir };
            if (tempDir.empty())
            {
                result.error = "cannot create temporary directory";
                io.write(messages::CopyResult{ result });
                continue;
            }

            const std::filesystem::path tempPath{ tempDir / (std::to_string(result.downloadCount) + "_" + file.path.filename().string()) };
            const FileCopyResult copyResult{ copyFile(file.path, tempPath, [&](std::uint64_t bytes) {
                io.write(messages::CopyResult{ messages::BytesProgress{ bytes } });
                return control.proceed();
            }) };

            if (copyResult.aborted)
            {
                LPD_LOG(COPY, DEBUG, "Copy aborted while copying " << file.path);
                return EXIT_SUCCESS;
            }

            if (copyResult.success && arguments->verifyFile && !areFilesIdentical(file.path, tempPath))
            {
                std::error_code ec;
                std::filesystem::remove(tempPath, ec);
                result.error = "verification failed";
            }
            else if (!copyResult.success)
                result.error = copyResult.error;
            else
            {
                result.success = true;
                result.tempPath = tempPath;
            }

            LPD_LOG_IF(COPY, ERROR, !result.success, "Cannot copy " << file.path << ": " << result.error);
            io.write(messages::CopyResult{ result });
        }

        return EXIT_SUCCESS;
    }
} // namespace lpd::stages
