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
#include <list>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "core/IChildProcess.hpp"
#include "download/IDeviceMonitor.hpp"

namespace lpd::core
{
    class IChildProcessManager;
}

namespace lpd
{
    // Volumes are unmounted with umount(8)
    // Camera file systems are never mounted by another process on this platform
    class DeviceMonitor : public download::IDeviceMonitor
    {
    public:
        DeviceMonitor(boost::asio::io_context& ioContext, core::IChildProcessManager& childProcessManager, const std::filesystem::path& umountBinary);
        ~DeviceMonitor() override;
        DeviceMonitor(const DeviceMonitor&) = delete;
        DeviceMonitor& operator=(const DeviceMonitor&) = delete;

    private:
        bool isCameraMounted(const std::string& model, const std::string& port) override;
        void unmountCamera(const std::string& model, const std::string& port, UnmountCallback callback) override;
        void unmountVolume(const std::filesystem::path& path, UnmountCallback callback) override;

        struct PendingUnmount
        {
            std::filesystem::path path;
            std::unique_ptr<core::IChildProcess> process;
            boost::asio::steady_timer timer;
            UnmountCallback callback;
        };
        using PendingUnmounts = std::list<PendingUnmount>;

        void readUntilEnd(PendingUnmounts::iterator it);
        void waitForExit(PendingUnmounts::iterator it);
        void complete(PendingUnmounts::iterator it, bool success);

        boost::asio::io_context& _ioContext;
        core::IChildProcessManager& _childProcessManager;
        const std::filesystem::path _umountBinary;
        PendingUnmounts _pendingUnmounts;
    };
} // namespace lpd
