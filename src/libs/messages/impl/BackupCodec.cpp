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
        Wt::Json::Object toJson(const BackupArguments& args)
        {
            Wt::Json::Object obj{ json::createObject("backup_arguments") };
            json::set(obj, "destination", args.destination);
            json::set(obj, "location_type", toString(args.type));
            json::setBool(obj, "use_identifier_folders", args.useIdentifierFolders);
            json::set(obj, "photo_identifier", args.photoIdentifier);
            json::set(obj, "video_identifier", args.videoIdentifier);
            json::setBool(obj, "overwrite", args.overwrite);
            json::setBool(obj, "verify", args.verify);
            return obj;
        }

        Wt::Json::Object toJson(const BackupFileData& data)
        {
            Wt::Json::Object obj{ json::createObject("backup_file") };
            json::set(obj, "device_id", data.deviceId);
            json::set(obj, "unique_id", data.uniqueId);
            json::set(obj, "file_type", toString(data.type));
            json::set(obj, "source_path", data.sourcePath);
            json::set(obj, "subfolder", data.subfolder);
            return obj;
        }

        Wt::Json::Object toJson(const BytesProgress& progress)
        {
            Wt::Json::Object obj{ json::createObject("bytes_progress") };
            json::set(obj, "bytes", progress.bytes);
            return obj;
        }

        Wt::Json::Object toJson(const BackupFileResult& result)
        {
            Wt::Json::Object obj{ json::createObject("file_result") };
            json::set(obj, "device_id", result.deviceId);
            json::set(obj, "unique_id", result.uniqueId);
            json::setBool(obj, "success", result.success);
            json::set(obj, "backup_path", result.backupPath);
            json::set(obj, "error", result.error);
            return obj;
        }

        BackupArguments backupArgumentsFromJson(const Wt::Json::Object& obj)
        {
            BackupArguments args;
            args.destination = json::getPath(obj, "destination");

            const std::string locationType{ json::getString(obj, "location_type") };
            const std::optional<BackupLocationType> type{ backupLocationTypeFromString(locationType) };
            if (!type)
                throw CodecException{ "Invalid backup location type '" + locationType + "'" };
            args.type = *type;

            args.useIdentifierFolders = json::getBool(obj, "use_identifier_folders");
            args.photoIdentifier = json::getString(obj, "photo_identifier");
            args.videoIdentifier = json::getString(obj, "video_identifier");
            args.overwrite = json::getBool(obj, "overwrite");
            args.verify = json::getBool(obj, "verify");
            return args;
        }

        BackupFileData backupFileDataFromJson(const Wt::Json::Object& obj)
        {
            BackupFileData data;
            data.deviceId = json::getDeviceId(obj, "device_id");
            data.uniqueId = json::getString(obj, "unique_id");
            data.type = json::getFileType(obj, "file_type");
            data.sourcePath = json::getPath(obj, "source_path");
            data.subfolder = json::getPath(obj, "subfolder");
            return data;
        }

        BackupFileResult fileResultFromJson(const Wt::Json::Object& obj)
        {
            BackupFileResult result;
            result.deviceId = json::getDeviceId(obj, "device_id");
            result.uniqueId = json::getString(obj, "unique_id");
            result.success = json::getBool(obj, "success");
            result.backupPath = json::getPath(obj, "backup_path");
            result.error = json::getString(obj, "error");
            return result;
        }
    } // namespace

    std::string encode(const BackupRequest& request)
    {
        return std::visit([](const auto& msg) { return json::serialize(toJson(msg)); }, request);
    }

    std::string encode(const BackupResult& result)
    {
        return std::visit([](const auto& msg) { return json::serialize(toJson(msg)); }, result);
    }

    BackupRequest decodeBackupRequest(std::string_view line)
    {
        return json::decodeLine(line, "backup request", [](const Wt::Json::Object& obj, std::string_view type) -> BackupRequest {
            if (type == "backup_arguments")
                return backupArgumentsFromJson(obj);
            if (type == "backup_file")
                return backupFileDataFromJson(obj);

            json::throwUnknownType("backup request", type);
        });
    }

    BackupResult decodeBackupResult(std::string_view line)
    {
        return json::decodeLine(line, "backup result", [](const Wt::Json::Object& obj, std::string_view type) -> BackupResult {
            if (type == "bytes_progress")
                return BytesProgress{ json::getUInt64(obj, "bytes") };
            if (type == "file_result")
                return fileResultFromJson(obj);

            json::throwUnknownType("backup result", type);
        });
    }
} // namespace lpd::messages
