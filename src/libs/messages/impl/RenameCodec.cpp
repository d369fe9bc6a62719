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
        Wt::Json::Object toJson(const RenameDownloadStarted& downloadStarted)
        {
            Wt::Json::Object obj{ json::createObject("download_started") };
            obj["naming"] = json::toJson(downloadStarted.naming);
            obj["sequences"] = json::toJson(downloadStarted.sequences);
            return obj;
        }

        Wt::Json::Object toJson(const RenameFileData& data)
        {
            Wt::Json::Object obj{ json::createObject("rename_file") };
            json::set(obj, "device_id", data.deviceId);
            json::set(obj, "unique_id", data.uniqueId);
            json::set(obj, "file_type", toString(data.type));
            json::set(obj, "temp_path", data.tempPath);
            json::set(obj, "download_folder", data.downloadFolder);
            json::set(obj, "original_name", data.originalName);
            json::set(obj, "mtime", data.modificationTime);
            json::set(obj, "download_count", data.downloadCount);
            json::set(obj, "job_code", data.jobCode);
            return obj;
        }

        Wt::Json::Object toJson(const RenameDownloadCompleted&)
        {
            return json::createObject("download_completed");
        }

        Wt::Json::Object toJson(const RenameFileResult& result)
        {
            Wt::Json::Object obj{ json::createObject("file_result") };
            json::set(obj, "device_id", result.deviceId);
            json::set(obj, "unique_id", result.uniqueId);
            json::setBool(obj, "success", result.success);
            json::set(obj, "final_path", result.finalPath);
            json::set(obj, "subfolder", result.subfolder);
            json::set(obj, "error", result.error);
            return obj;
        }

        Wt::Json::Object toJson(const RenameSequencesUpdate& update)
        {
            Wt::Json::Object obj{ json::createObject("sequences_update") };
            obj["sequences"] = json::toJson(update.sequences);
            return obj;
        }

        RenameFileData renameFileDataFromJson(const Wt::Json::Object& obj)
        {
            RenameFileData data;
            data.deviceId = json::getDeviceId(obj, "device_id");
            data.uniqueId = json::getString(obj, "unique_id");
            data.type = json::getFileType(obj, "file_type");
            data.tempPath = json::getPath(obj, "temp_path");
            data.downloadFolder = json::getPath(obj, "download_folder");
            data.originalName = json::getString(obj, "original_name");
            data.modificationTime = json::getInt64(obj, "mtime");
            data.downloadCount = json::getUInt32(obj, "download_count");
            data.jobCode = json::getString(obj, "job_code");
            return data;
        }

        RenameFileResult fileResultFromJson(const Wt::Json::Object& obj)
        {
            RenameFileResult result;
            result.deviceId = json::getDeviceId(obj, "device_id");
            result.uniqueId = json::getString(obj, "unique_id");
            result.success = json::getBool(obj, "success");
            result.finalPath = json::getPath(obj, "final_path");
            result.subfolder = json::getPath(obj, "subfolder");
            result.error = json::getString(obj, "error");
            return result;
        }
    } // namespace

    std::string encode(const RenameRequest& request)
    {
        return std::visit([](const auto& msg) { return json::serialize(toJson(msg)); }, request);
    }

    std::string encode(const RenameResult& result)
    {
        return std::visit([](const auto& msg) { return json::serialize(toJson(msg)); }, result);
    }

    RenameRequest decodeRenameRequest(std::string_view line)
    {
        return json::decodeLine(line, "rename request", [](const Wt::Json::Object& obj, std::string_view type) -> RenameRequest {
            if (type == "download_started")
            {
                return RenameDownloadStarted{
                    .naming = json::namingPreferencesFromJson(obj.get("naming")),
                    .sequences = json::sequenceStateFromJson(obj.get("sequences")),
                };
            }
            if (type == "rename_file")
                return renameFileDataFromJson(obj);
            if (type == "download_completed")
                return RenameDownloadCompleted{};

            json::throwUnknownType("rename request", type);
        });
    }

    RenameResult decodeRenameResult(std::string_view line)
    {
        return json::decodeLine(line, "rename result", [](const Wt::Json::Object& obj, std::string_view type) -> RenameResult {
            if (type == "file_result")
                return fileResultFromJson(obj);
            if (type == "sequences_update")
                return RenameSequencesUpdate{ json::sequenceStateFromJson(obj.get("sequences")) };

            json::throwUnknownType("rename result", type);
        });
    }
} // namespace lpd::messages
