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
        Wt::Json::Object toJson(const ScanArguments& args)
        {
            Wt::Json::Object obj{ json::createObject("scan_arguments") };
            json::set(obj, "device_id", args.deviceId);
            json::set(obj, "kind", toString(args.kind));
            json::set(obj, "path", args.path);
            json::set(obj, "camera_model", args.cameraModel);
            json::set(obj, "camera_port", args.cameraPort);
            json::setBool(obj, "ignore_other_photo_types", args.ignoreOtherPhotoTypes);
            json::set(obj, "ignored_paths", args.ignoredPaths);
            return obj;
        }

        Wt::Json::Object toJson(const ScanResume&)
        {
            return json::createObject("scan_resume");
        }

        Wt::Json::Object toJson(const ScanDeviceInfo& info)
        {
            Wt::Json::Object obj{ json::createObject("device_info") };
            json::set(obj, "display_name", info.displayName);
            if (info.storageCapacity)
                json::set(obj, "storage_capacity", *info.storageCapacity);
            if (info.storageFree)
                json::set(obj, "storage_free", *info.storageFree);
            return obj;
        }

        Wt::Json::Object toJson(const ScanFilesFound& filesFound)
        {
            Wt::Json::Object obj{ json::createObject("files_found") };

            Wt::Json::Array files;
            for (const MediaFileInfo& file : filesFound.files)
                files.push_back(json::toJson(file));
            obj["files"] = std::move(files);

            return obj;
        }

        Wt::Json::Object toJson(const ScanDeviceError& error)
        {
            Wt::Json::Object obj{ json::createObject("device_error") };
            json::set(obj, "code", toString(error.code));
            json::set(obj, "details", error.details);
            return obj;
        }

        ScanArguments scanArgumentsFromJson(const Wt::Json::Object& obj)
        {
            ScanArguments args;
            args.deviceId = json::getDeviceId(obj, "device_id");

            const std::string kind{ json::getString(obj, "kind") };
            const std::optional<DeviceKind> deviceKind{ deviceKindFromString(kind) };
            if (!deviceKind)
                throw CodecException{ "Invalid device kind '" + kind + "'" };
            args.kind = *deviceKind;

            args.path = json::getPath(obj, "path");
            args.cameraModel = json::getString(obj, "camera_model");
            args.cameraPort = json::getString(obj, "camera_port");
            args.ignoreOtherPhotoTypes = json::getBool(obj, "ignore_other_photo_types");
            args.ignoredPaths = json::getStrings(obj, "ignored_paths");
            return args;
        }

        ScanDeviceInfo deviceInfoFromJson(const Wt::Json::Object& obj)
        {
            ScanDeviceInfo info;
            info.displayName = json::getString(obj, "display_name");
            if (obj.contains("storage_capacity"))
                info.storageCapacity = json::getUInt64(obj, "storage_capacity");
            if (obj.contains("storage_free"))
                info.storageFree = json::getUInt64(obj, "storage_free");
            return info;
        }

        ScanFilesFound filesFoundFromJson(const Wt::Json::Object& obj)
        {
            ScanFilesFound filesFound;
            for (const Wt::Json::Value& file : json::getArray(obj, "files"))
                filesFound.files.push_back(json::mediaFileFromJson(file));
            return filesFound;
        }

        ScanDeviceError deviceErrorFromJson(const Wt::Json::Object& obj)
        {
            const std::string code{ json::getString(obj, "code") };
            const std::optional<CameraErrorCode> errorCode{ cameraErrorCodeFromString(code) };
            if (!errorCode)
                throw CodecException{ "Invalid camera error code '" + code + "'" };

            return ScanDeviceError{ .code = *errorCode, .details = json::getString(obj, "details") };
        }
    } // namespace

    std::string encode(const ScanRequest& request)
    {
        return std::visit([](const auto& msg) { return json::serialize(toJson(msg)); }, request);
    }

    std::string encode(const ScanResult& result)
    {
        return std::visit([](const auto& msg) { return json::serialize(toJson(msg)); }, result);
    }

    ScanRequest decodeScanRequest(std::string_view line)
    {
        return json::decodeLine(line, "scan request", [](const Wt::Json::Object& obj, std::string_view type) -> ScanRequest {
            if (type == "scan_arguments")
                return scanArgumentsFromJson(obj);
            if (type == "scan_resume")
                return ScanResume{};

            json::throwUnknownType("scan request", type);
        });
    }

    ScanResult decodeScanResult(std::string_view line)
    {
        return json::decodeLine(line, "scan result", [](const Wt::Json::Object& obj, std::string_view type) -> ScanResult {
            if (type == "device_info")
                return deviceInfoFromJson(obj);
            if (type == "files_found")
                return filesFoundFromJson(obj);
            if (type == "device_error")
                return deviceErrorFromJson(obj);

            json::throwUnknownType("scan result", type);
        });
    }
} // namespace lpd::messages
