/*
 * Copyright (C) 2024 Emeric Poupon
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

#include "messages/Codec.hpp"

#include "JsonUtils.hpp"

namespace lpd::messages
{
    namespace
    {
        Wt::Json::Object toJson(const ProximityRequest& request)
        {
            Wt::Json::Object obj{ json::createObject("proximity") };
            json::set(obj, "threshold_seconds", request.thresholdSeconds);

            Wt::Json::Array entries;
            for (const ProximityEntry& entry : request.entries)
            {
                Wt::Json::Object entryObj;
                json::set(entryObj, "unique_id", entry.uniqueId);
                json::set(entryObj, "time", entry.time);
                entries.push_back(std::move(entryObj));
            }
            obj["entries"] = std::move(entries);

            return obj;
        }

        Wt::Json::Object toJson(const DeleteSourceFiles& request)
        {
            Wt::Json::Object obj{ json::createObject("delete_source_files") };
            json::set(obj, "device_id", request.deviceId);
            json::set(obj, "files", request.files);
            return obj;
        }

        Wt::Json::Object toJson(const PurgeDirectories& request)
        {
            Wt::Json::Object obj{ json::createObject("purge_directories") };
            json::set(obj, "directories", request.directories);
            return obj;
        }

        Wt::Json::Object toJson(const ProximityGroups& result)
        {
            Wt::Json::Object obj{ json::createObject("proximity_groups") };

            Wt::Json::Array groups;
            for (const ProximityGroup& group : result.groups)
            {
                Wt::Json::Object groupObj;
                json::set(groupObj, "start", group.start);
                json::set(groupObj, "end", group.end);
                json::set(groupObj, "unique_ids", group.uniqueIds);
                groups.push_back(std::move(groupObj));
            }
            obj["groups"] = std::move(groups);

            return obj;
        }

        Wt::Json::Object toJson(const SourceFilesDeleted& result)
        {
            Wt::Json::Object obj{ json::createObject("source_files_deleted") };
            json::set(obj, "device_id", result.deviceId);
            json::set(obj, "deleted_count", result.deletedCount);
            json::set(obj, "failed_count", result.failedCount);
            return obj;
        }

        Wt::Json::Object toJson(const DirectoriesPurged& result)
        {
            Wt::Json::Object obj{ json::createObject("directories_purged") };
            json::set(obj, "purged_count", result.purgedCount);
            json::set(obj, "failed_count", result.failedCount);
            return obj;
        }

        ProximityRequest proximityRequestFromJson(const Wt::Json::Object& obj)
        {
            ProximityRequest request;
            request.thresholdSeconds = json::getUInt32(obj, "threshold_seconds");
            for (const Wt::Json::Value& value : json::getArray(obj, "entries"))
            {
                const Wt::Json::Object& entry = value;
                request.entries.push_back(ProximityEntry{ .uniqueId = json::getString(entry, "unique_id"), .time = json::getInt64(entry, "time") });
            }
            return request;
        }

        ProximityGroups proximityGroupsFromJson(const Wt::Json::Object& obj)
        {
            ProximityGroups result;
            for (const Wt::Json::Value& value : json::getArray(obj, "groups"))
            {
                const Wt::Json::Object& group = value;
                result.groups.push_back(ProximityGroup{
                    .start = json::getInt64(group, "start"),
                    .end = json::getInt64(group, "end"),
                    .uniqueIds = json::getStrings(group, "unique_ids"),
                });
            }
            return result;
        }
    } // namespace

    std::string encode(const OffloadRequest& request)
    {
        return std::visit([](const auto& msg) { return json::serialize(toJson(msg)); }, request);
    }

    std::string encode(const OffloadResult& result)
    {
        return std::visit([](const auto& msg) { return json::serialize(toJson(msg)); }, result);
    }

    OffloadRequest decodeOffloadRequest(std::string_view line)
    {
        return json::decodeLine(line, "offload request", [](const Wt::Json::Object& obj, std::string_view type) -> OffloadRequest {
            if (type == "proximity")
                return proximityRequestFromJson(obj);
            if (type == "delete_source_files")
                return DeleteSourceFiles{ .deviceId = json::getDeviceId(obj, "device_id"), .files = json::getPaths(obj, "files") };
            if (type == "purge_directories")
                return PurgeDirectories{ .directories = json::getPaths(obj, "directories") };

            json::throwUnknownType("offload request", type);
        });
    }

    OffloadResult decodeOffloadResult(std::string_view line)
    {
        return json::decodeLine(line, "offload result", [](const Wt::Json::Object& obj, std::string_view type) -> OffloadResult {
            if (type == "proximity_groups")
                return proximityGroupsFromJson(obj);
            if (type == "source_files_deleted")
            {
                return SourceFilesDeleted{
                    .deviceId = json::getDeviceId(obj, "device_id"),
                    .deletedCount = json::getUInt32(obj, "deleted_count"),
                    .failedCount = json::getUInt32(obj, "failed_count"),
                };
            }
            if (type == "directories_purged")
                return DirectoriesPurged{ .purgedCount = json::getUInt32(obj, "purged_count"), .failedCount = json::getUInt32(obj, "failed_count") };

            json::throwUnknownType("offload result", type);
        });
    }
} // namespace lpd::messages
