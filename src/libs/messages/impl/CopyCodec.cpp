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
        Wt::Json::Object toJson(const CopyFilesArguments& args)
        {
            Wt::Json::Object obj{ json::createObject("copy_files") };
            json::set(obj, "device_id", args.deviceId);
            json::set(obj, "photo_download_folder", args.photoDownloadFolder);
            json::set(obj, "video_download_folder", args.videoDownloadFolder);
            json::setBool(obj, "verify_file", args.verifyFile);

            Wt::Json::Array files;
            for (const MediaFileInfo& file : args.files)
                files.push_back(json::toJson(file));
            obj["files"] = std::move(files);

            return obj;
        }

        Wt::Json::Object toJson(const CopyPause&)
        {
            return json::createObject("pause");
        }

        Wt::Json::Object toJson(const CopyResume&)
        {
            return json::createObject("resume");
        }

        Wt::Json::Object toJson(const BytesProgress& progress)
        {
            Wt::Json::Object obj{ json::createObject("bytes_progress") };
            json::set(obj, "bytes", progress.bytes);
            return obj;
        }

        Wt::Json::Object toJson(const CopyTempDirs& tempDirs)
        {
            Wt::Json::Object obj{ json::createObject("temp_dirs") };
            json::set(obj, "photo_temp_dir", tempDirs.photoTempDir);
            json::set(obj, "video_temp_dir", tempDirs.videoTempDir);
            return obj;
        }

        Wt::Json::Object toJson(const CopyFileResult& result)
        {
            Wt::Json::Object obj{ json::createObject("file_result") };
            json::set(obj, "unique_id", result.uniqueId);
            json::setBool(obj, "success", result.success);
            json::set(obj, "temp_path", result.tempPath);
            json::set(obj, "error", result.error);
            json::set(obj, "download_count", result.downloadCount);
            return obj;
        }

        CopyFilesArguments copyFilesArgumentsFromJson(const Wt::Json::Object& obj)
        {
            CopyFilesArguments args;
            args.deviceId = json::getDeviceId(obj, "device_id");
            args.photoDownloadFolder = json::getPath(obj, "photo_download_folder");
            args.videoDownloadFolder = json::getPath(obj, "video_download_folder");
            args.verifyFile = json::getBool(obj, "verify_file");
            for (const Wt::Json::Value& file : json::getArray(obj, "files"))
                args.files.push_back(json::mediaFileFromJson(file));
            return args;
        }

        CopyFileResult fileResultFromJson(const Wt::Json::Object& obj)
        {
            CopyFileResult result;
            result.uniqueId = json::getString(obj, "unique_id");
            result.success = json::getBool(obj, "success");
            result.tempPath = json::getPath(obj, "temp_path");
            result.error = json::getString(obj, "error");
            result.downloadCount = json::getUInt32(obj, "download_count");
            return result;
        }
    } // namespace

    std::string encode(const CopyRequest& request)
    {
        return std::visit([](const auto& msg) { return json::serialize(toJson(msg)); }, request);
    }

    std::string encode(const CopyResult& result)
    {
        return std::visit([](const auto& msg) { return json::serialize(toJson(msg)); }, result);
    }

    CopyRequest decodeCopyRequest(std::string_view line)
    {
        return json::decodeLine(line, "copy request", [](const Wt::Json::Object& obj, std::string_view type) -> CopyRequest {
            if (type == "copy_files")
                return copyFilesArgumentsFromJson(obj);
            if (type == "pause")
                return CopyPause{};
            if (type == "resume")
                return CopyResume{};

            json::throwUnknownType("copy request", type);
        });
    }

    CopyResult decodeCopyResult(std::string_view line)
    {
        return json::decodeLine(line, "copy result", [](const Wt::Json::Object& obj, std::string_view type) -> CopyResult {
            if (type == "bytes_progress")
                return BytesProgress{ json::getUInt64(obj, "bytes") };
            if (type == "temp_dirs")
                return CopyTempDirs{ .photoTempDir = json::getPath(obj, "photo_temp_dir"), .videoTempDir = json::getPath(obj, "video_temp_dir") };
            if (type == "file_result")
                return fileResultFromJson(obj);

            json::throwUnknownType("copy result", type);
        });
    }
} // namespace lpd::messages
