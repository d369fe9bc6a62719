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

#include <algorithm>
#include <cstdlib>
#include <optional>
#include <variant>

#include "core/ILogger.hpp"
#include "core/Utils.hpp"

#include "StageIO.hpp"
#include "Stages.hpp"

namespace lpd::stages
{
    namespace
    {
        messages::ProximityGroups computeProximityGroups(const messages::ProximityRequest& request)
        {
            std::vector<messages::ProximityEntry> entries{ request.entries };
            std::stable_sort(std::begin(entries), std::end(entries), [](const messages::ProximityEntry& lhs, const messages::ProximityEntry& rhs) { return lhs.time < rhs.time; });

            messages::ProximityGroups result;
            for (const messages::ProximityEntry& entry : entries)
            {
                if (result.groups.empty() || entry.time - result.groups.back().end > static_cast<std::int64_t>(request.thresholdSeconds))
                    result.groups.push_back(messages::ProximityGroup{ entry.time, entry.time, {} });

                messages::ProximityGroup& group{ result.groups.back() };
                group.end = entry.time;
                group.uniqueIds.push_back(entry.uniqueId);
            }

            LPD_LOG(OFFLOAD, DEBUG, entries.size() << " files split into " << result.groups.size() << " groups");
            return result;
        }

        messages::SourceFilesDeleted deleteSourceFiles(const messages::DeleteSourceFiles& request)
        {
            messages::SourceFilesDeleted result;
            result.deviceId = request.deviceId;

            for (const std::filesystem::path& file : request.files)
            {
                std::error_code ec;
                if (std::filesystem::remove(file, ec))
                {
                    result.deletedCount += 1;
                    continue;
                }

                LPD_LOG(OFFLOAD, ERROR, "Cannot delete " << file << ": " << (ec ? ec.message() : "file not found"));
                result.failedCount += 1;
            }

            LPD_LOG(OFFLOAD, INFO, "Deleted " << result.deletedCount << " source files from device " << result.deviceId.value() << ", " << result.failedCount << " failures");
            return result;
        }

        messages::DirectoriesPurged purgeDirectories(const messages::PurgeDirectories& request)
        {
            messages::DirectoriesPurged result;

            for (const std::filesystem::path& directory : request.directories)
            {
                std::error_code ec;
                std::filesystem::remove_all(directory, ec);
                if (ec)
                {
                    LPD_LOG(OFFLOAD, ERROR, "Cannot purge " << directory << ": " << ec.message());
                    result.failedCount += 1;
                }
                else
                    result.purgedCount += 1;
            }

            return result;
        }
    } // namespace

    int runOffloadStage(StageIO& io)
    {
        while (const std::optional<std::string> line{ io.readLine() })
        {
            try
            {
                const messages::OffloadResult result{ std::visit(core::utils::overloads{
                                                                     [](const messages::ProximityRequest& request) { return messages::OffloadResult{ computeProximityGroups(request) }; },
                                                                     [](const messages::DeleteSourceFiles& request) { return messages::OffloadResult{ deleteSourceFiles(request) }; },
                                                                     [](const messages::PurgeDirectories& request) { return messages::OffloadResult{ purgeDirectories(request) }; },
                                                                 },
                                                                 messages::decodeOffloadRequest(*line)) };
                io.write(result);
            }
            catch (const messages::CodecException& e)
            {
                LPD_LOG(OFFLOAD, ERROR, "Dropping malformed request: " << e.what());
            }
        }

        return EXIT_SUCCESS;
    }
} // namespace lpd::stages
