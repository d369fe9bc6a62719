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

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/Exception.hpp"

namespace lpd::core
{
    class ChildProcessException : public LpdException
    {
    public:
        using LpdException::LpdException;
    };

    // Child process connected through its stdin and stdout
    // stderr is inherited from the current process
    class IChildProcess
    {
    public:
        using Args = std::vector<std::string>;

        virtual ~IChildProcess() = default;

        enum class ReadResult
        {
            Success,
            Error,
            EndOfFile,
        };

        // line is given without its trailing '\n' and is only valid during the callback
        // callback is not called if the child process object is destroyed meanwhile
        using ReadLineCallback = std::function<void(ReadResult, std::string_view line)>;
        virtual void asyncReadLine(ReadLineCallback callback) = 0;

        // writes are queued and sent in order
        virtual void asyncWrite(std::string data) = 0;
        // stdin is closed once all the pending writes are done
        virtual void closeStdin() = 0;

        virtual void terminate() = 0;
        virtual void kill() = 0;

        struct ExitStatus
        {
            std::optional<int> exitCode;
            std::optional<int> signal;

            bool success() const { return exitCode && *exitCode == 0; }
        };
        // non blocking
        virtual std::optional<ExitStatus> tryWait() = 0;

        virtual bool finished() const = 0; // stdout closed
    };
} // namespace lpd::core
