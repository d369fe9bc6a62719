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

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace Wt
{
    class WDate;
    class WDateTime;
} // namespace Wt

namespace lpd::core::stringUtils
{
    [[nodiscard]] std::vector<std::string_view> splitString(std::string_view string, char separator);

    [[nodiscard]] std::string_view stringTrim(std::string_view str, std::string_view whitespaces = " \t\r");

    [[nodiscard]] std::string stringToLower(std::string_view str);

    [[nodiscard]] std::string replaceInString(std::string_view str, std::string_view from, std::string_view to);

    [[nodiscard]] bool stringStartsWith(std::string_view str, std::string_view prefix);
    [[nodiscard]] bool stringEndsWith(std::string_view str, std::string_view ending);

    // "1.2 MB", "340 KB", using decimal units
    [[nodiscard]] std::string formatByteSize(std::uint64_t bytes);

    [[nodiscard]] std::string toISO8601String(const Wt::WDateTime& dateTime);
    [[nodiscard]] std::string toISO8601String(const Wt::WDate& date);
    [[nodiscard]] Wt::WDate fromISO8601DateString(std::string_view date);
} // namespace lpd::core::stringUtils
