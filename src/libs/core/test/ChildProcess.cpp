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

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <functional>
#include <thread>

#include <boost/asio/io_context.hpp>

#include "core/IChildProcessManager.hpp"

namespace lpd::core::tests
{
    namespace
    {
        std::optional<IChildProcess::ExitStatus> waitForExit(IChildProcess& childProcess)
        {
            for (int i{}; i < 200; ++i)
            {
                if (auto status{ childProcess.tryWait() })
                    return status;

                std::this_thread::sleep_for(std::chrono::milliseconds{ 10 });
            }

            return std::nullopt;
        }
    } // namespace

    TEST(ChildProcess, echoLines)
    {
        boost::asio::io_context ioContext;
        auto manager{ createChildProcessManager(ioContext) };

        std::unique_ptr<IChildProcess> cat{ manager->spawnChildProcess("/bin/cat", {}) };

        std::vector<std::string> lines;
        bool eof{};

        std::function<void(IChildProcess::ReadResult, std::string_view)> onLine;
        onLine = [&](IChildProcess::ReadResult res, std::string_view line) {
            if (res == IChildProcess::ReadResult::Success)
            {
                lines.emplace_back(line);
                cat->asyncReadLine(onLine);
            }
            else
            {
                eof = res == IChildProcess::ReadResult::EndOfFile;
            }
        };

        cat->asyncReadLine(onLine);
        cat->asyncWrite("{\"type\":\"first\"}\n");
        cat->asyncWrite("second\nthird\n");
        cat->closeStdin();

        ioContext.run();

        EXPECT_TRUE(eof);
        EXPECT_TRUE(cat->finished());
        ASSERT_EQ(lines.size(), 3);
        EXPECT_EQ(lines[0], "{\"type\":\"first\"}");
        EXPECT_EQ(lines[1], "second");
        EXPECT_EQ(lines[2], "third");

        const auto status{ waitForExit(*cat) };
        ASSERT_TRUE(status.has_value());
        EXPECT_TRUE(status->success());
    }

    TEST(ChildProcess, kill)
    {
        boost::asio::io_context ioContext;
        auto manager{ createChildProcessManager(ioContext) };

        // cat waits forever on its stdin
        std::unique_ptr<IChildProcess> cat{ manager->spawnChildProcess("/bin/cat", {}) };
        EXPECT_FALSE(cat->tryWait().has_value());

        cat->kill();

        const auto status{ waitForExit(*cat) };
        ASSERT_TRUE(status.has_value());
        EXPECT_FALSE(status->success());
        EXPECT_EQ(status->signal, SIGKILL);
    }

    TEST(ChildProcess, exitCode)
    {
        boost::asio::io_context ioContext;
        auto manager{ createChildProcessManager(ioContext) };

        std::unique_ptr<IChildProcess> process{ manager->spawnChildProcess("/bin/sh", { "-c", "exit 3" }) };

        const auto status{ waitForExit(*process) };
        ASSERT_TRUE(status.has_value());
        EXPECT_EQ(status->exitCode, 3);
        EXPECT_FALSE(status->success());
    }

    TEST(ChildProcess, destroyWhileReading)
    {
        boost::asio::io_context ioContext;
        auto manager{ createChildProcessManager(ioContext) };

        bool called{};
        {
            std::unique_ptr<IChildProcess> cat{ manager->spawnChildProcess("/bin/cat", {}) };
            cat->asyncReadLine([&](IChildProcess::ReadResult, std::string_view) { called = true; });
        }

        ioContext.run();
        EXPECT_FALSE(called);
    }
} // namespace lpd::core::tests
