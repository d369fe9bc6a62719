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

#include "worker/WorkerProcess.hpp"

#include "core/IChildProcessManager.hpp"
#include "core/ILogger.hpp"

namespace lpd::worker
{
    WorkerProcess::WorkerProcess(boost::asio::io_context& ioContext, core::IChildProcessManager& childProcessManager, const WorkerSettings& settings, LineHandler lineHandler, ExitHandler exitHandler)
        : _name{ settings.name }
        , _gracePeriod{ settings.gracePeriod }
        , _lineHandler{ std::move(lineHandler) }
        , _exitHandler{ std::move(exitHandler) }
        , _graceTimer{ ioContext }
        , _exitPollTimer{ ioContext }
        , _process{ childProcessManager.spawnChildProcess(settings.path, settings.args) }
    {
        LPD_LOG(WORKER, DEBUG, "Worker '" << _name << "' started");
        readNextLine();
    }

    WorkerProcess::~WorkerProcess()
    {
        _graceTimer.cancel();
        _exitPollTimer.cancel();
    }

    void WorkerProcess::send(std::string line)
    {
        if (_stopRequested)
        {
            LPD_LOG(WORKER, WARNING, "Worker '" << _name << "': stop requested, dropping message");
            return;
        }

        line += '\n';
        _process->asyncWrite(std::move(line));
    }

    void WorkerProcess::requestStop()
    {
        if (_stopRequested || _exited)
            return;

        LPD_LOG(WORKER, DEBUG, "Worker '" << _name << "': stop requested, grace period = " << _gracePeriod.count() << " ms");
        _stopRequested = true;

        // EOF on its stdin asks the worker to finish
        _process->closeStdin();

        _graceTimer.expires_after(_gracePeriod);
        _graceTimer.async_wait([this](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted)
                return;

            if (!_exited)
            {
                LPD_LOG(WORKER, WARNING, "Worker '" << _name << "' did not stop within " << _gracePeriod.count() << " ms, killing it");
                _process->kill();
            }
        });
    }

    void WorkerProcess::kill()
    {
        if (_exited)
            return;

        _stopRequested = true;
        _process->kill();
    }

    void WorkerProcess::readNextLine()
    {
        _process->asyncReadLine([this](core::IChildProcess::ReadResult result, std::string_view line) {
            if (result != core::IChildProcess::ReadResult::Success)
            {
                onOutputClosed();
                return;
            }

            if (!line.empty())
                _lineHandler(line);

            readNextLine();
        });
    }

    void WorkerProcess::onOutputClosed()
    {
        LPD_LOG(WORKER, DEBUG, "Worker '" << _name << "': output closed");
        pollExit();
    }

    void WorkerProcess::pollExit()
    {
        std::optional<core::IChildProcess::ExitStatus> status;
        try
        {
            status = _process->tryWait();
        }
        catch (const core::ChildProcessException& e)
        {
            LPD_LOG(WORKER, ERROR, "Worker '" << _name << "': " << e.what());
            status = core::IChildProcess::ExitStatus{};
        }

        if (!status)
        {
            _exitPollTimer.expires_after(exitPollPeriod);
            _exitPollTimer.async_wait([this](const boost::system::error_code& ec) {
                if (ec == boost::asio::error::operation_aborted)
                    return;

                pollExit();
            });
            return;
        }

        _exited = true;
        _graceTimer.cancel();

        LPD_LOG(WORKER, DEBUG, "Worker '" << _name << "' exited, code = " << status->exitCode.value_or(-1) << ", signal = " << status->signal.value_or(0));

        // may destroy this
        _exitHandler(*status, _stopRequested);
    }
} // namespace lpd::worker
