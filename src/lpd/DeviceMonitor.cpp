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

#include "DeviceMonitor.hpp"

#include <boost/asio/post.hpp>

#include "core/IChildProcessManager.hpp"
#include "core/ILogger.hpp"

namespace lpd
{
    DeviceMonitor::DeviceMonitor(boost::asio::io_context& ioContext, core::IChildProcessManager& childProcessManager, const std::filesystem::path& umountBinary)
        : _ioContext{ ioContext }
        , _childProcessManager{ childProcessManager }
        , _umountBinary{ umountBinary }
    {
    }

    DeviceMonitor::~DeviceMonitor()
    {
        LPD_LOG_IF(DEVICES, WARNING, !_pendingUnmounts.empty(), "Abandoning " << _pendingUnmounts.size() << " pending unmounts");
    }

    bool DeviceMonitor::isCameraMounted(const std::string& /*model*/, const std::string& /*port*/)
    {
        return false;
    }

    void DeviceMonitor::unmountCamera(const std::string& model, const std::string& port, UnmountCallback callback)
    {
        LPD_LOG(DEVICES, DEBUG, "Nothing to unmount for camera " << model << " on " << port);
        boost::asio::post(_ioContext, [callback{ std::move(callback) }] { callback(true); });
    }

    void DeviceMonitor::unmountVolume(const std::filesystem::path& path, UnmountCallback callback)
    {
        LPD_LOG(DEVICES, INFO, "Unmounting " << path);

        std::unique_ptr<core::IChildProcess> process;
        try
        {
            process = _childProcessManager.spawnChildProcess(_umountBinary, core::IChildProcess::Args{ path.string() });
        }
        catch (const core::ChildProcessException& e)
        {
            LPD_LOG(DEVICES, ERROR, "Cannot unmount " << path << ": " << e.what());
            boost::asio::post(_ioContext, [callback{ std::move(callback) }] { callback(false); });
            return;
        }

        _pendingUnmounts.push_back(PendingUnmount{ path, std::move(process), boost::asio::steady_timer{ _ioContext }, std::move(callback) });
        readUntilEnd(std::prev(std::end(_pendingUnmounts)));
    }

    void DeviceMonitor::readUntilEnd(PendingUnmounts::iterator it)
    {
        it->process->asyncReadLine([this, it](core::IChildProcess::ReadResult result, std::string_view line) {
            if (result == core::IChildProcess::ReadResult::Success)
            {
                LPD_LOG(DEVICES, DEBUG, "umount: " << line);
                readUntilEnd(it);
                return;
            }

            // the process must not be destroyed from its own read handler
            boost::asio::post(_ioContext, [this, it] { waitForExit(it); });
        });
    }

    void DeviceMonitor::waitForExit(PendingUnmounts::iterator it)
    {
        if (const auto exitStatus{ it->process->tryWait() })
        {
            complete(it, exitStatus->success());
            return;
        }

        it->timer.expires_after(std::chrono::milliseconds{ 50 });
        it->timer.async_wait([this, it](const boost::system::error_code& ec) {
            if (ec)
                return;

            waitForExit(it);
        });
    }

    void DeviceMonitor::complete(PendingUnmounts::iterator it, bool success)
    {
        LPD_LOG(DEVICES, INFO, "Unmount of " << it->path << (success ? " succeeded" : " failed"));

        UnmountCallback callback{ std::move(it->callback) };
        _pendingUnmounts.erase(it);
        callback(success);
    }
} // namespace lpd
