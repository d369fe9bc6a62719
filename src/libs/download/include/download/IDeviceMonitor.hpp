/*
 * Copyright (C) 2025 Emeric Poupon
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
#include <functional>
#include <string>

namespace lpd::download
{
    // Mount operations on the platform side
    // Callbacks are expected to be invoked from the supervising event loop
    class IDeviceMonitor
    {
    public:
        virtual ~IDeviceMonitor() = default;

        using UnmountCallback = std::function<void(bool success)>;

        // The camera file system is mounted by another process (it cannot be accessed meanwhile)
        virtual bool isCameraMounted(const std::string& model, const std::string& port) = 0;
        virtual void unmountCamera(const std::string& model, const std::string& port, UnmountCallback callback) = 0;
        virtual void unmountVolume(const std::filesystem::path& path, UnmountCallback callback) = 0;
    };
} // namespace lpd::download
