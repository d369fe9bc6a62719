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

#include "JsonUtils.hpp"

#include <algorithm>
#include <limits>

#include <Wt/Json/Serializer.h>

namespace lpd::messages::json
{
    Wt::Json::Object createObject(std::string_view type)
    {
        Wt::Json::Object object;
        object["type"] = Wt::Json::Value{ std::string{ type } };
        return object;
    }

    std::string serialize(const Wt::Json::Object& object)
    {
        std::string res{ Wt::Json::serialize(object, 0) };
        // strings are escaped: raw newlines can only be layout
        std::replace(std::begin(res), std::end(res), '\n', ' ');
        return res;
    }

    Wt::Json::Object parseObject(std::string_view line)
    {
        Wt::Json::Object object;
        try
        {
            Wt::Json::parse(std::string{ line }, object);
        }
        catch (const Wt::Json::ParseError& e)
        {
            throw CodecException{ std::string{ "Cannot parse message: " } + e.what() };
        }

        return object;
    }

    void throwUnknownType(std::string_view what, std::string_view type)
    {
        throw CodecException{ "Unknown " + std::string{ what } + " type '" + std::string{ type } + "'" };
    }

    void throwTypeError(std::string_view what, const std::exception& e)
    {
        throw CodecException{ "Malformed " + std::string{ what } + ": " + e.what() };
    }

    void set(Wt::Json::Object& object, const char* name, std::string_view value)
    {
        object[name] = Wt::Json::Value{ std::string{ value } };
    }

    void set(Wt::Json::Object& object, const char* name, const std::filesystem::path& value)
    {
        object[name] = Wt::Json::Value{ value.string() };
    }

    void set(Wt::Json::Object& object, const char* name, std::uint64_t value)
    {
        object[name] = Wt::Json::Value{ static_cast<long long>(value) };
    }

    void set(Wt::Json::Object& object, const char* name, std::int64_t value)
    {
        object[name] = Wt::Json::Value{ static_cast<long long>(value) };
    }

    void set(Wt::Json::Object& object, const char* name, std::uint32_t value)
    {
        object[name] = Wt::Json::Value{ static_cast<long long>(value) };
    }

    void setBool(Wt::Json::Object& object, const char* name, bool value)
    {
        object[name] = Wt::Json::Value{ value };
    }

    void set(Wt::Json::Object& object, const char* name, DeviceId value)
    {
        set(object, name, value.value());
    }

    void set(Wt::Json::Object& object, const char* name, const std::vector<std::string>& values)
    {
        Wt::Json::Array array;
        for (const std::string& value : values)
            array.push_back(Wt::Json::Value{ value });

        object[name] = std::move(array);
    }

    void set(Wt::Json::Object& object, const char* name, const std::vector<std::filesystem::path>& values)
    {
        Wt::Json::Array array;
        for (const std::filesystem::path& value : values)
            array.push_back(Wt::Json::Value{ value.string() });

        object[name] = std::move(array);
    }

    std::string getString(const Wt::Json::Object& object, const char* name)
    {
        return static_cast<std::string>(object.get(name));
    }

    std::filesystem::path getPath(const Wt::Json::Object& object, const char* name)
    {
        return std::filesystem::path{ getString(object, name) };
    }

    std::int64_t getInt64(const Wt::Json::Object& object, const char* name)
    {
        return static_cast<long long>(object.get(name));
    }

    std::uint64_t getUInt64(const Wt::Json::Object& object, const char* name)
    {
        const std::int64_t value{ getInt64(object, name) };
        if (value < 0)
            throw CodecException{ std::string{ "Negative value for '" } + name + "'" };

        return static_cast<std::uint64_t>(value);
    }

    std::uint32_t getUInt32(const Wt::Json::Object& object, const char* name)
    {
        const std::uint64_t value{ getUInt64(object, name) };
        if (value > std::numeric_limits<std::uint32_t>::max())
            throw CodecException{ std::string{ "Value out of range for '" } + name + "'" };

        return static_cast<std::uint32_t>(value);
    }

    bool getBool(const Wt::Json::Object& object, const char* name)
    {
        return static_cast<bool>(object.get(name));
    }

    DeviceId getDeviceId(const Wt::Json::Object& object, const char* name)
    {
        return DeviceId{ getUInt32(object, name) };
    }

    const Wt::Json::Array& getArray(const Wt::Json::Object& object, const char* name)
    {
        return object.get(name);
    }

    std::vector<std::string> getStrings(const Wt::Json::Object& object, const char* name)
    {
        std::vector<std::string> res;
        for (const Wt::Json::Value& value : getArray(object, name))
            res.push_back(static_cast<std::string>(value));

        return res;
    }

    std::vector<std::filesystem::path> getPaths(const Wt::Json::Object& object, const char* name)
    {
        std::vector<std::filesystem::path> res;
        for (const Wt::Json::Value& value : getArray(object, name))
            res.emplace_back(static_cast<std::string>(value));

        return res;
    }

    FileType getFileType(const Wt::Json::Object& object, const char* name)
    {
        const std::string str{ getString(object, name) };
        const std::optional<FileType> fileType{ fileTypeFromString(str) };
        if (!fileType)
            throw CodecException{ "Invalid file type '" + str + "'" };

        return *fileType;
    }

    Wt::Json::Object toJson(const MediaFileInfo& file)
    {
        Wt::Json::Object object;
        set(object, "unique_id", file.uniqueId);
        set(object, "device_id", file.deviceId);
        set(object, "file_type", toString(file.type));
        set(object, "path", file.path);
        set(object, "size", file.size);
        set(object, "mtime", file.modificationTime);
        return object;
    }

    MediaFileInfo mediaFileFromJson(const Wt::Json::Object& object)
    {
        MediaFileInfo file;
        file.uniqueId = getString(object, "unique_id");
        file.deviceId = getDeviceId(object, "device_id");
        file.type = getFileType(object, "file_type");
        file.path = getPath(object, "path");
        file.size = getUInt64(object, "size");
        file.modificationTime = getInt64(object, "mtime");
        return file;
    }

    Wt::Json::Object toJson(const NamingPreferences& naming)
    {
        Wt::Json::Object object;
        set(object, "photo_subfolder", naming.photoSubfolder);
        set(object, "video_subfolder", naming.videoSubfolder);
        set(object, "photo_rename", naming.photoRename);
        set(object, "video_rename", naming.videoRename);
        return object;
    }

    NamingPreferences namingPreferencesFromJson(const Wt::Json::Object& object)
    {
        NamingPreferences naming;
        naming.photoSubfolder = getString(object, "photo_subfolder");
        naming.videoSubfolder = getString(object, "video_subfolder");
        naming.photoRename = getString(object, "photo_rename");
        naming.videoRename = getString(object, "video_rename");
        return naming;
    }

    Wt::Json::Object toJson(const SequenceState& sequences)
    {
        Wt::Json::Object object;
        set(object, "stored_sequence_no", sequences.storedSequenceNo);
        set(object, "downloads_today_date", sequences.downloadsTodayDate);
        set(object, "downloads_today_count", sequences.downloadsTodayCount);
        return object;
    }

    SequenceState sequenceStateFromJson(const Wt::Json::Object& object)
    {
        SequenceState sequences;
        sequences.storedSequenceNo = getUInt32(object, "stored_sequence_no");
        sequences.downloadsTodayDate = getString(object, "downloads_today_date");
        sequences.downloadsTodayCount = getUInt32(object, "downloads_today_count");
        return sequences;
    }
} // namespace lpd::messages::json
