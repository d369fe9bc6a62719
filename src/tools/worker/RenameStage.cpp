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
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <variant>

#include <Wt/WDate.h>

#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "core/String.hpp"
#include "core/Utils.hpp"

#include "FileCopy.hpp"
#include "StageIO.hpp"
#include "Stages.hpp"

namespace lpd::stages
{
    namespace
    {
        std::string formatTime(const std::string& pattern, std::int64_t secondsSinceEpoch)
        {
            if (pattern.empty())
                return {};

            const std::time_t time{ static_cast<std::time_t>(secondsSinceEpoch) };
            std::tm tm{};
            ::localtime_r(&time, &tm);

            std::ostringstream oss;
            oss << std::put_time(&tm, pattern.c_str());
            return oss.str();
        }

        std::string formatSequenceNumber(std::uint32_t value)
        {
            std::ostringstream oss;
            oss << std::setw(4) << std::setfill('0') << value;
            return oss.str();
        }

        bool moveFile(const std::filesystem::path& source, const std::filesystem::path& destination, std::string& error)
        {
            std::error_code ec;
            std::filesystem::rename(source, destination, ec);
            if (!ec)
                return true;

            if (ec != std::errc::cross_device_link)
            {
                error = ec.message();
                return false;
            }

            // different file systems
            const FileCopyResult copyResult{ copyFile(source, destination, {}) };
            if (!copyResult.success)
            {
                error = copyResult.error;
                return false;
            }

            std::filesystem::remove(source, ec);
            LPD_LOG_IF(RENAME, WARNING, ec, "Cannot remove temporary file " << source << ": " << ec.message());
            return true;
        }

        class Renamer
        {
        public:
            explicit Renamer(StageIO& io)
                : _io{ io }
            {
            }

            void processRequest(const messages::RenameRequest& request)
            {
                std::visit(core::utils::overloads{
                               [this](const messages::RenameDownloadStarted& started) { onDownloadStarted(started); },
                               [this](const messages::RenameFileData& fileData) { _io.write(messages::RenameResult{ renameFile(fileData) }); },
                               [this](const messages::RenameDownloadCompleted&) { _io.write(messages::RenameResult{ messages::RenameSequencesUpdate{ _sequences } }); },
                           },
                           request);
            }

        private:
            void onDownloadStarted(const messages::RenameDownloadStarted& started)
            {
                _naming = started.naming;
                _sequences = started.sequences;

                const std::string today{ core::stringUtils::toISO8601String(Wt::WDate::currentDate()) };
                if (_sequences.downloadsTodayDate != today)
                {
                    _sequences.downloadsTodayDate = today;
                    _sequences.downloadsTodayCount = 0;
                }
                _sequences.downloadsTodayCount += 1;

                LPD_LOG(RENAME, DEBUG, "Download started, stored sequence = " << _sequences.storedSequenceNo << ", downloads today = " << _sequences.downloadsTodayCount);
            }

            std::string generateName(const messages::RenameFileData& fileData) const
            {
                const std::string& pattern{ fileData.type == messages::FileType::Photo ? _naming.photoRename : _naming.videoRename };

                const std::filesystem::path originalName{ fileData.originalName };
                std::string name{ formatTime(pattern, fileData.modificationTime) };
                name = core::stringUtils::replaceInString(name, "{name}", originalName.stem().string());
                name = core::stringUtils::replaceInString(name, "{ext}", originalName.extension().string());
                name = core::stringUtils::replaceInString(name, "{sequence}", formatSequenceNumber(_sequences.storedSequenceNo + 1));
                name = core::stringUtils::replaceInString(name, "{downloads_today}", std::to_string(_sequences.downloadsTodayCount));
                name = core::stringUtils::replaceInString(name, "{jobcode}", fileData.jobCode);

                name = core::pathUtils::sanitizeFileStem(name);
                if (name.empty())
                    name = fileData.originalName;

                return name;
            }

            messages::RenameFileResult renameFile(const messages::RenameFileData& fileData)
            {
                messages::RenameFileResult result;
                result.deviceId = fileData.deviceId;
                result.uniqueId = fileData.uniqueId;

                const std::string& subfolderPattern{ fileData.type == messages::FileType::Photo ? _naming.photoSubfolder : _naming.videoSubfolder };
                result.subfolder = formatTime(subfolderPattern, fileData.modificationTime);

                const std::filesystem::path directory{ fileData.downloadFolder / result.subfolder };
                if (!core::pathUtils::ensureDirectory(directory))
                {
                    result.error = "cannot create directory " + directory.string();
                    LPD_LOG(RENAME, ERROR, "Cannot rename " << fileData.tempPath << ": " << result.error);
                    return result;
                }

                const std::filesystem::path finalPath{ getAvailablePath(directory / generateName(fileData)) };
                if (!moveFile(fileData.tempPath, finalPath, result.error))
                {
                    LPD_LOG(RENAME, ERROR, "Cannot move " << fileData.tempPath << " to " << finalPath << ": " << result.error);
                    return result;
                }

                LPD_LOG(RENAME, DEBUG, "Renamed " << fileData.tempPath << " to " << finalPath);

                _sequences.storedSequenceNo += 1;
                result.success = true;
                result.finalPath = finalPath;
                return result;
            }

            StageIO& _io;
            messages::NamingPreferences _naming;
            messages::SequenceState _sequences;
        };
    } // namespace

    int runRenameStage(StageIO& io)
    {
        Renamer renamer{ io };
        while (const std::optional<std::string> line{ io.readLine() })
        {
            try
            {
                renamer.processRequest(messages::decodeRenameRequest(*line));
            }
            catch (const messages::CodecException& e)
            {
                LPD_LOG(RENAME, ERROR, "Dropping malformed request: " << e.what());
            }
        }

        return EXIT_SUCCESS;
    }
} // namespace lpd::stages
