/*
 * Copyright (C) 2021 Emeric Poupon
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

#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace lpd::core::pathUtils
{
    bool ensureDirectory(const std::filesystem::path& dir);

    // true if the path is an existing directory the current user can write into
    bool isWritableDirectory(const std::filesystem::path& path);
    bool isReadableDirectory(const std::filesystem::path& path);

    // extensions are expected in lower case, with the leading dot
    bool hasFileAnyExtension(const std::filesystem::path& file, std::span<const std::filesystem::path> supportedExtensions);

    std::string sanitizeFileStem(std::string_view fileStem);
} // namespace lpd::core::pathUtils
