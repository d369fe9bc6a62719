/*
 * Copyright (C) 2018 Emeric Poupon
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

#include "core/String.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>

#include <Wt/WDate.h>
#include <Wt/WDateTime.h>

namespace lpd::core::stringUtils
{
    std::vector<std::string_view> splitString(std::string_view str, char separator)
    {
        std::vector<std::string_view> res;

        std::size_t currentPos{};
        while (true)
        {
            const std::size_t separatorPos{ str.find(separator, currentPos) };
            res.push_back(str.substr(currentPos, separatorPos == std::string_view::npos ? std::string_view::npos : separatorPos - currentPos));
            if (separatorPos == std::string_view::npos)
                break;

            currentPos = separatorPos + 1;
        }

        return res;
    }

    std::string_view stringTrim(std::string_view str, std::string_view whitespaces)
    {
        std::string_view res;

        const auto strBegin = str.find_first_not_of(whitespaces);
        if (strBegin != std::string_view::npos)
        {
            const auto strEnd{ str.find_last_not_of(whitespaces) };
            res = str.substr(strBegin, strEnd - strBegin + 1);
        }

        return res;
    }

    std::string stringToLower(std::string_view str)
    {
        std::string res;
        res.reserve(str.size());

        std::transform(std::cbegin(str), std::cend(str), std::back_inserter(res), [](unsigned char c) { return std::tolower(c); });

        return res;
    }

    std::string replaceInString(std::string_view str, std::string_view from, std::string_view to)
    {
        std::string res{ str };
        if (from.empty())
            return res;

        std::size_t pos{};
        while ((pos = res.find(from, pos)) != std::string::npos)
        {
            res.replace(pos, from.length(), to);
            pos += to.length();
        }

        return res;
    }

    bool stringStartsWith(std::string_view str, std::string_view prefix)
    {
        return str.substr(0, prefix.size()) == prefix;
    }

    bool stringEndsWith(std::string_view str, std::string_view ending)
    {
        return str.size() >= ending.size() && str.substr(str.size() - ending.size()) == ending;
    }

    std::string formatByteSize(std::uint64_t bytes)
    {
        static constexpr std::array<std::string_view, 5> units{ "B", "KB", "MB", "GB", "TB" };

        double value{ static_cast<double>(bytes) };
        std::size_t unit{};
        while (value >= 1000 && unit + 1 < units.size())
        {
            value /= 1000;
            unit++;
        }

        std::ostringstream oss;
        if (unit == 0)
            oss << bytes << " " << units[unit];
        else
            oss << std::fixed << std::setprecision(value < 10 ? 1 : 0) << value << " " << units[unit];

        return oss.str();
    }

    std::string toISO8601String(const Wt::WDateTime& dateTime)
    {
        if (dateTime.isValid())
        {
            // assume UTC
            return dateTime.toString("yyyy-MM-ddThh:mm:ss.zzz", false).toUTF8() + 'Z';
        }

        return "";
    }

    std::string toISO8601String(const Wt::WDate& date)
    {
        if (date.isValid())
            return date.toString("yyyy-MM-dd").toUTF8();

        return "";
    }

    Wt::WDate fromISO8601DateString(std::string_view date)
    {
        return Wt::WDate::fromString(std::string{ date }, "yyyy-MM-dd");
    }
} // namespace lpd::core::stringUtils
