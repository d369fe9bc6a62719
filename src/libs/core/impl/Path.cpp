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

#include "core/Path.hpp"

#include <unistd.h>

#include <algorithm>
#include <array>

#include "core/String.hpp"

namespace lpd::core::pathUtils
{
    namespace
    {
        bool isAccessibleDirectory(const std::filesystem::path& path, int mode)
        {
            std::error_code ec;
            if (!std::filesystem::is_directory(path, ec))
                return false;

            return ::access(path.c_str(), mode) == 0;
        }
    } // namespace

    bool ensureDirectory(const std::filesystem::path& dir)
    {
        std::error_code ec;
        if (std::filesystem::exists(dir, ec))
            return std::filesystem::is_directory(dir, ec);

        return std::filesystem::create_directories(dir, ec);
    }

    bool isWritableDirectory(const std::filesystem::path& path)
    {
        return isAccessibleDirectory(path, W_OK | X_OK);
    }

    bool isReadableDirectory(const std::filesystem::path& path)
    {
        return isAccessibleDirectory(path, R_OK | X_OK);
    }

    bool hasFileAnyExtension(const std::filesystem::path& file, std::span<const std::filesystem::path> supportedExtensions)
    {
        const std::filesystem::path extension{ stringUtils::stringToLower(file.extension().c_str()) };

        return std::find(std::cbegin(supportedExtensions), std::cend(supportedExtensions), extension) != std::cend(supportedExtensions);
    }

    std::string sanitizeFileStem(std::string_view fileStem)
    {
        // Keep UTF8-encoded characters, but skip illegal ASCII characters
        constexpr std::array<unsigned char, 9> illegalChars{ '/', '\\', ':', '*', '?', '"', '<', '>', '|' };

        std::string sanitized;
        sanitized.reserve(fileStem.size());

        for (const char c : fileStem)
        {
            if (std::any_of(std::begin(illegalChars), std::end(illegalChars), [c](unsigned char illegalChar) { return static_cast<unsigned char>(c) == illegalChar; }))
                continue;

            sanitized.push_back(c);
        }

        return sanitized;
    }
} // namespace lpd::core::pathUtils
