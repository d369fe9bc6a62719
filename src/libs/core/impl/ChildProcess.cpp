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

#include "ChildProcess.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cassert>
#include <cerrno>
#include <mutex>
#include <system_error>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>

#include "core/ILogger.hpp"

namespace lpd::core
{
    namespace
    {
        class SystemException : public ChildProcessException
        {
        public:
            SystemException(std::error_code err, const std::string& errMsg)
                : ChildProcessException{ errMsg + ": " + err.message() }
            {
            }

            SystemException(boost::system::error_code ec, const std::string& errMsg)
                : ChildProcessException{ errMsg + ": " + ec.message() }
            {
            }
        };

        std::error_code lastError()
        {
            return std::error_code{ errno, std::generic_category() };
        }

        struct Pipe
        {
            Pipe()
            {
                // Use 'pipe' instead of 'pipe2', more portable
                if (::pipe(fds.data()) == -1)
                    throw SystemException{ lastError(), "pipe failed!" };

                // other child processes must not inherit our ends, or they would keep the pipes opened
                for (const int fd : fds)
                {
                    if (::fcntl(fd, F_SETFD, FD_CLOEXEC) == -1)
                        throw SystemException{ lastError(), "fcntl failed to set FD_CLOEXEC!" };
                }
            }

            ~Pipe()
            {
                closeRead();
                closeWrite();
            }

            Pipe(const Pipe&) = delete;
            Pipe& operator=(const Pipe&) = delete;

            int readEnd() const { return fds[0]; }
            int writeEnd() const { return fds[1]; }

            int releaseRead() { return std::exchange(fds[0], -1); }
            int releaseWrite() { return std::exchange(fds[1], -1); }

            void closeRead()
            {
                if (fds[0] != -1)
                    ::close(releaseRead());
            }

            void closeWrite()
            {
                if (fds[1] != -1)
                    ::close(releaseWrite());
            }

            std::array<int, 2> fds{ -1, -1 };
        };

        void setNonBlocking(int fd)
        {
            const int flags{ ::fcntl(fd, F_GETFL) };
            if (flags == -1 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
                throw SystemException{ lastError(), "fcntl failed to set O_NONBLOCK!" };
        }
    } // namespace

    ChildProcess::ChildProcess(boost::asio::io_context& ioContext, const std::filesystem::path& path, const Args& args)
        : _ioContext{ ioContext }
        , _childStdout{ _ioContext }
        , _childStdin{ _ioContext }
    {
        // make sure only one thread is executing this part of code
        static std::mutex mutex;
        const std::scoped_lock lock{ mutex };

        Pipe stdoutPipe;
        Pipe stdinPipe;

        // Only the parent ends are non blocking - usually programs don't expect stdin/stdout to be non-blocking
        setNonBlocking(stdoutPipe.readEnd());
        setNonBlocking(stdinPipe.writeEnd());

        // prepare args before forking, no allocation in the child
        std::vector<const char*> execArgs;
        execArgs.push_back(path.c_str());
        std::transform(std::cbegin(args), std::cend(args), std::back_inserter(execArgs), [](const std::string& arg) { return arg.c_str(); });
        execArgs.push_back(nullptr);

        const int res{ ::fork() };
        if (res == -1)
            throw SystemException{ lastError(), "fork failed!" };

        if (res == 0) // CHILD
        {
            // stderr is kept: child logs go to the same place as ours
            if (::dup2(stdinPipe.readEnd(), STDIN_FILENO) == -1)
                ::_exit(-1);
            if (::dup2(stdoutPipe.writeEnd(), STDOUT_FILENO) == -1)
                ::_exit(-1);

            // all the pipe ends are close-on-exec, only the dup2ed copies survive
            ::execv(path.c_str(), const_cast<char* const*>(execArgs.data()));
            ::_exit(-1);
        }

        // PARENT
        _childPID = res;
        stdoutPipe.closeWrite();
        stdinPipe.closeRead();

        boost::system::error_code assignError;
        _childStdout.assign(stdoutPipe.releaseRead(), assignError);
        if (assignError)
            throw SystemException{ assignError, "assigning read end of stdout pipe to asio stream failed!" };

        _childStdin.assign(stdinPipe.releaseWrite(), assignError);
        if (assignError)
            throw SystemException{ assignError, "assigning write end of stdin pipe to asio stream failed!" };

        LPD_LOG(CHILDPROCESS, DEBUG, "Child process " << _childPID << " started: '" << path.string() << "'");
    }

    ChildProcess::~ChildProcess()
    {
        LPD_LOG(CHILDPROCESS, DEBUG, "Closing child process " << _childPID << "...");
        {
            boost::system::error_code closeError;
            _childStdout.close(closeError);
            if (closeError)
                LPD_LOG(CHILDPROCESS, ERROR, "Close stdout failed: " << closeError.message());

            _childStdin.close(closeError);
            if (closeError)
                LPD_LOG(CHILDPROCESS, ERROR, "Close stdin failed: " << closeError.message());
        }

        if (!_exitStatus)
        {
            kill();

            try
            {
                wait(true);
            }
            catch (const ChildProcessException& e)
            {
                LPD_LOG(CHILDPROCESS, ERROR, "Cannot wait for child process " << _childPID << ": " << e.what());
            }
        }
    }

    void ChildProcess::sendSignal(int signal)
    {
        if (_exitStatus)
            return;

        // process may already have finished
        if (::kill(_childPID, signal) == -1)
        {
            const int err{ errno };
            LPD_LOG(CHILDPROCESS, DEBUG, "Signal " << signal << " failed for " << _childPID << ": " << (std::error_code{ err, std::generic_category() }.message()));
        }
    }

    void ChildProcess::terminate()
    {
        LPD_LOG(CHILDPROCESS, DEBUG, "Terminating child process " << _childPID << "...");
        sendSignal(SIGTERM);
    }

    void ChildProcess::kill()
    {
        LPD_LOG(CHILDPROCESS, DEBUG, "Killing child process " << _childPID << "...");
        sendSignal(SIGKILL);
    }

    bool ChildProcess::wait(bool block)
    {
        assert(!_exitStatus);

        int wstatus{};
        const pid_t pid{ ::waitpid(_childPID, &wstatus, block ? 0 : WNOHANG) };

        if (pid == -1)
            throw SystemException{ lastError(), "waitpid failed!" };
        if (pid == 0)
            return false;

        ExitStatus status;
        if (WIFEXITED(wstatus))
            status.exitCode = WEXITSTATUS(wstatus);
        else if (WIFSIGNALED(wstatus))
            status.signal = WTERMSIG(wstatus);

        LPD_LOG(CHILDPROCESS, DEBUG, "Child process " << _childPID << " exited, code = " << status.exitCode.value_or(-1) << ", signal = " << status.signal.value_or(0));

        _exitStatus = status;
        return true;
    }

    std::optional<IChildProcess::ExitStatus> ChildProcess::tryWait()
    {
        if (!_exitStatus)
            wait(false);

        return _exitStatus;
    }

    void ChildProcess::asyncReadLine(ReadLineCallback callback)
    {
        assert(!finished());

        boost::asio::async_read_until(_childStdout, boost::asio::dynamic_buffer(_readBuffer), '\n',
            [this, callback{ std::move(callback) }](const boost::system::error_code& error, std::size_t bytesTransferred) {
                if (error == boost::asio::error::operation_aborted)
                {
                    // forbidden to read any captured param here as the ChildProcess instance may already have been destroyed
                    return;
                }

                if (error)
                {
                    if (error == boost::asio::error::eof)
                    {
                        LPD_LOG_IF(CHILDPROCESS, WARNING, !_readBuffer.empty(), "Child process " << _childPID << ": dropping " << _readBuffer.size() << " bytes of incomplete line");
                        _finished = true;
                        callback(ReadResult::EndOfFile, {});
                    }
                    else
                    {
                        LPD_LOG(CHILDPROCESS, ERROR, "Child process " << _childPID << ": read failed: " << error.message());
                        callback(ReadResult::Error, {});
                    }
                    return;
                }

                // bytesTransferred includes the delimiter
                const std::string line{ _readBuffer.substr(0, bytesTransferred - 1) };
                _readBuffer.erase(0, bytesTransferred);
                callback(ReadResult::Success, line);
            });
    }

    void ChildProcess::asyncWrite(std::string data)
    {
        if (_closeStdinRequested || !_childStdin.is_open())
        {
            LPD_LOG(CHILDPROCESS, DEBUG, "Child process " << _childPID << ": stdin closed, dropping write");
            return;
        }

        _writeQueue.push_back(std::move(data));
        if (!_writeInProgress)
            writeNext();
    }

    void ChildProcess::writeNext()
    {
        if (_writeQueue.empty())
        {
            if (_closeStdinRequested)
                doCloseStdin();
            return;
        }

        _writeInProgress = true;
        boost::asio::async_write(_childStdin, boost::asio::buffer(_writeQueue.front()),
            [this](const boost::system::error_code& error, std::size_t /*bytesTransferred*/) {
                if (error == boost::asio::error::operation_aborted)
                    return;

                _writeInProgress = false;
                if (error)
                {
                    // most likely EPIPE: the child process is gone
                    LPD_LOG(CHILDPROCESS, DEBUG, "Child process " << _childPID << ": write failed: " << error.message());
                    _writeQueue.clear();
                    doCloseStdin();
                    return;
                }

                _writeQueue.pop_front();
                writeNext();
            });
    }

    void ChildProcess::closeStdin()
    {
        _closeStdinRequested = true;
        if (!_writeInProgress)
            doCloseStdin();
    }

    void ChildProcess::doCloseStdin()
    {
        if (!_childStdin.is_open())
            return;

        boost::system::error_code closeError;
        _childStdin.close(closeError);
        if (closeError)
            LPD_LOG(CHILDPROCESS, ERROR, "Close stdin failed: " << closeError.message());
    }

    bool ChildProcess::finished() const
    {
        return _finished;
    }
} // namespace lpd::core
