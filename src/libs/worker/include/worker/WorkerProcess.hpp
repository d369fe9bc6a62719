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

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "core/IChildProcess.hpp"

namespace lpd::core
{
    class IChildProcessManager;
}

namespace lpd::worker
{
    struct WorkerSettings
    {
        std::string name; // for logs
        std::filesystem::path path;
        core::IChildProcess::Args args;
        std::chrono::milliseconds gracePeriod{ 1000 };
    };

    // One running worker process, exchanging text lines
    class WorkerProcess
    {
    public:
        using LineHandler = std::function<void(std::string_view line)>;
        using ExitHandler = std::function<void(const core::IChildProcess::ExitStatus& status, bool stopRequested)>;

        // throws core::ChildProcessException if the process cannot be spawned
        WorkerProcess(boost::asio::io_context& ioContext, core::IChildProcessManager& childProcessManager, const WorkerSettings& settings, LineHandler lineHandler, ExitHandler exitHandler);
        ~WorkerProcess();
        WorkerProcess(const WorkerProcess&) = delete;
        WorkerProcess& operator=(const WorkerProcess&) = delete;

        void send(std::string line);
        void requestStop();
        void kill();

        bool isStopRequested() const { return _stopRequested; }

    private:
        void readNextLine();
        void onOutputClosed();
        void pollExit();

        static constexpr std::chrono::milliseconds exitPollPeriod{ 20 };

        const std::string _name;
        const std::chrono::milliseconds _gracePeriod;
        LineHandler _lineHandler;
        ExitHandler _exitHandler;
        boost::asio::steady_timer _graceTimer;
        boost::asio::steady_timer _exitPollTimer;
        std::unique_ptr<core::IChildProcess> _process;
        bool _stopRequested{};
        bool _exited{};
    };
} // namespace lpd::worker
