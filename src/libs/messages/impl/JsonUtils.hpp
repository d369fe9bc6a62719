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

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <Wt/Json/Array.h>
#include <Wt/Json/Object.h>
#include <Wt/Json/Value.h>

#include "messages/Codec.hpp"

namespace lpd::messages::json
{
    Wt::Json::Object createObject(std::string_view type);
    std::string serialize(const Wt::Json::Object& object);

    void set(Wt::Json::Object& object, const char* name, std::string_view value);
    void set(Wt::Json::Object& object, const char* name, const std::filesystem::path& value);
    void set(Wt::Json::Object& object, const char* name, std::uint64_t value);
    void set(Wt::Json::Object& object, const char* name, std::int64_t value);
    void set(Wt::Json::Object& object, const char* name, std::uint32_t value);
    void setBool(Wt::Json::Object& object, const char* name, bool value);
    void set(Wt::Json::Object& object, const char* name, DeviceId value);
    void set(Wt::Json::Object& object, const char* name, const std::vector<std::string>& values);
    void set(Wt::Json::Object& object, const char* name, const std::vector<std::filesystem::path>& values);

    std::string getString(const Wt::Json::Object& object, const char* name);
    std::filesystem::path getPath(const Wt::Json::Object& object, const char* name);
    std::uint64_t getUInt64(const Wt::Json::Object& object, const char* name);
    std::int64_t getInt64(const Wt::Json::Object& object, const char* name);
    std::uint32_t getUInt32(const Wt::Json::Object& object, const char* name);
    bool getBool(const Wt::Json::Object& object, const char* name);
    DeviceId getDeviceId(const Wt::Json::Object& object, const char* name);
    std::vector<std::string> getStrings(const Wt::Json::Object& object, const char* name);
    std::vector<std::filesystem::path> getPaths(const Wt::Json::Object& object, const char* name);
    const Wt::Json::Array& getArray(const Wt::Json::Object& object, const char* name);

    FileType getFileType(const Wt::Json::Object& object, const char* name);

    Wt::Json::Object toJson(const MediaFileInfo& file);
    MediaFileInfo mediaFileFromJson(const Wt::Json::Object& object);

    Wt::Json::Object toJson(const NamingPreferences& naming);
    NamingPreferences namingPreferencesFromJson(const Wt::Json::Object& object);

    Wt::Json::Object toJson(const SequenceState& sequences);
    SequenceState sequenceStateFromJson(const Wt::Json::Object& object);

    // Parses the line, then calls decodeFunc(object, type)
    // Any JSON error is reported as a CodecException
    template<typename DecodeFunc>
    auto decodeLine(std::string_view line, std::string_view what, DecodeFunc decodeFunc);

    Wt::Json::Object parseObject(std::string_view line);
    [[noreturn]] void throwUnknownType(std::string_view what, std::string_view type);
    [[noreturn]] void throwTypeError(std::string_view what, const std::exception& e);
} // namespace lpd::messages::json

#include <Wt/Json/Parser.h>

namespace lpd::messages::json
{
    template<typename DecodeFunc>
    auto decodeLine(std::string_view line, std::string_view what, DecodeFunc decodeFunc)
    {
        const Wt::Json::Object object{ parseObject(line) };
        try
        {
            return decodeFunc(object, getString(object, "type"));
        }
        catch (const Wt::Json::TypeException& e)
        {
            throwTypeError(what, e);
        }
    }
} // namespace lpd::messages::json
