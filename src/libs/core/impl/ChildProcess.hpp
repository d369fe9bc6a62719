/*
 * Copyright (C) 2020 Emeric Poupon
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

#include <sys/types.h>
#include <unistd.h>

#include <deque>
#include <filesystem>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include "core/IChildProcess.hpp"

namespace lpd::core
{
    class ChildProcess : public IChildProcess
    {
    public:
        ChildProcess(boost::asio::io_context& ioContext, const std::filesystem::path& path, const Args& args);
        ~ChildProcess() override;

        ChildProcess(const ChildProcess&) = delete;
        ChildProcess& operator=(const ChildProcess&) = delete;

    private:
        void asyncReadLine(ReadLineCallback callback) override;
        void asyncWrite(std::string data) override;
        void closeStdin() override;
        void terminate() override;
        void kill() override;
        std::optional<ExitStatus> tryWait() override;
        bool finished() const override;

        void sendSignal(int signal);
        bool wait(bool block); // return true if waited
        void writeNext();
        void doCloseStdin();

        using FileDescriptor = boost::asio::posix::stream_descriptor;

        boost::asio::io_context& _ioContext;
        FileDescriptor _childStdout;
        FileDescriptor _childStdin;
        ::pid_t _childPID{};
        bool _finished{};
        std::optional<ExitStatus> _exitStatus;

        std::string _readBuffer;

        std::deque<std::string> _writeQueue;
        bool _writeInProgress{};
        bool _closeStdinRequested{};
    };
} // namespace lpd::core
