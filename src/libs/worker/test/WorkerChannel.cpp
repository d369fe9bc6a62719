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
#include <map>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "core/IChildProcessManager.hpp"
#include "worker/WorkerChannel.hpp"

namespace lpd::worker::tests
{
    namespace
    {
        using TextChannel = IWorkerChannel<std::string, std::string>;

        WorkerCodec<std::string, std::string> createTextCodec()
        {
            return WorkerCodec<std::string, std::string>{
                .encodeRequest = [](const std::string& request) { return request; },
                .decodeResult = [](std::string_view line) {
                    if (line == "bad")
                        throw core::LpdException{ "bad line" };
                    return std::string{ line };
                },
            };
        }

        WorkerSettings createSettings(const std::filesystem::path& path, core::IChildProcess::Args args = {}, std::chrono::milliseconds gracePeriod = std::chrono::milliseconds{ 1000 })
        {
            return WorkerSettings{
                .name = "test",
                .path = path,
                .args = std::move(args),
                .gracePeriod = gracePeriod,
            };
        }

        struct Collector
        {
            std::map<std::optional<WorkerKey>, std::vector<std::string>> results;
            std::map<std::optional<WorkerKey>, WorkerFinished> finished;

            TextChannel::EventHandler handler()
            {
                return [this](const TextChannel::Event& event) {
                    if (const auto* result{ std::get_if<std::string>(&event.payload) })
                    {
                        // no result once the worker is reported finished
                        EXPECT_FALSE(finished.contains(event.key));
                        results[event.key].push_back(*result);
                    }
                    else
                    {
                        EXPECT_FALSE(finished.contains(event.key));
                        finished[event.key] = std::get<WorkerFinished>(event.payload);
                    }
                };
            }
        };

        class WorkerChannelTest : public ::testing::Test
        {
        protected:
            void SetUp() override
            {
                std::signal(SIGPIPE, SIG_IGN);
            }

            boost::asio::io_context _ioContext;
            std::unique_ptr<core::IChildProcessManager> _childProcessManager{ core::createChildProcessManager(_ioContext) };
        };
    } // namespace

    TEST_F(WorkerChannelTest, pooledEchoAndStop)
    {
        auto channel{ createPooledWorkerChannel(_ioContext, *_childProcessManager, createSettings("/bin/cat"), createTextCodec()) };
        Collector collector;
        channel->setEventHandler(collector.handler());

        channel->start(1, "a");
        channel->start(2, "b");
        channel->send(1, "c");
        EXPECT_TRUE(channel->isRunning(1));
        EXPECT_TRUE(channel->isRunning(2));
        EXPECT_FALSE(channel->isRunning(3));
        EXPECT_EQ(channel->getRunningCount(), 2);

        channel->stopAll();
        _ioContext.run();

        EXPECT_EQ(collector.results[1], (std::vector<std::string>{ "a", "c" }));
        EXPECT_EQ(collector.results[2], (std::vector<std::string>{ "b" }));
        ASSERT_EQ(collector.finished.size(), 2);
        EXPECT_FALSE(collector.finished[1].unexpected);
        EXPECT_FALSE(collector.finished[2].unexpected);
        EXPECT_EQ(channel->getRunningCount(), 0);
    }

    TEST_F(WorkerChannelTest, pooledStopOne)
    {
        auto channel{ createPooledWorkerChannel(_ioContext, *_childProcessManager, createSettings("/bin/cat"), createTextCodec()) };
        Collector collector;
        channel->setEventHandler([&](const TextChannel::Event& event) {
            collector.handler()(event);
            if (std::holds_alternative<WorkerFinished>(event.payload) && event.key == WorkerKey{ 1 })
            {
                EXPECT_FALSE(channel->isRunning(1));
                EXPECT_TRUE(channel->isRunning(2));
                channel->stop(2);
            }
        });

        channel->start(1, "a");
        channel->start(2, "b");
        channel->stop(1);
        _ioContext.run();

        ASSERT_EQ(collector.finished.size(), 2);
        EXPECT_FALSE(collector.finished[1].unexpected);
        EXPECT_FALSE(collector.finished[2].unexpected);
    }

    TEST_F(WorkerChannelTest, unexpectedExit)
    {
        auto channel{ createPooledWorkerChannel(_ioContext, *_childProcessManager, createSettings("/bin/sh", { "-c", "echo partial; exit 3" }), createTextCodec()) };
        Collector collector;
        channel->setEventHandler(collector.handler());

        channel->start(7, "ignored");
        _ioContext.run();

        EXPECT_EQ(collector.results[7], (std::vector<std::string>{ "partial" }));
        ASSERT_TRUE(collector.finished.contains(7));
        EXPECT_TRUE(collector.finished[7].unexpected);
    }

    TEST_F(WorkerChannelTest, successfulExitOnItsOwn)
    {
        auto channel{ createPooledWorkerChannel(_ioContext, *_childProcessManager, createSettings("/bin/sh", { "-c", "echo done" }), createTextCodec()) };
        Collector collector;
        channel->setEventHandler(collector.handler());

        channel->start(1, "ignored");
        _ioContext.run();

        ASSERT_TRUE(collector.finished.contains(1));
        EXPECT_FALSE(collector.finished[1].unexpected);
    }

    TEST_F(WorkerChannelTest, missingBinary)
    {
        auto channel{ createPooledWorkerChannel(_ioContext, *_childProcessManager, createSettings("/nonexistent/lpd-worker"), createTextCodec()) };
        Collector collector;
        channel->setEventHandler(collector.handler());

        channel->start(1, "request");
        _ioContext.run();

        ASSERT_TRUE(collector.finished.contains(1));
        EXPECT_TRUE(collector.finished[1].unexpected);
        EXPECT_TRUE(collector.results[1].empty());
    }

    TEST_F(WorkerChannelTest, killedAfterGracePeriod)
    {
        auto channel{ createPooledWorkerChannel(_ioContext, *_childProcessManager, createSettings("/bin/sh", { "-c", "exec sleep 30" }, std::chrono::milliseconds{ 50 }), createTextCodec()) };
        Collector collector;
        channel->setEventHandler(collector.handler());

        const auto begin{ std::chrono::steady_clock::now() };
        channel->start(1, "request");
        channel->stop(1);
        _ioContext.run();

        EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds{ 10 });
        ASSERT_TRUE(collector.finished.contains(1));
        // stop was requested
        EXPECT_FALSE(collector.finished[1].unexpected);
    }

    TEST_F(WorkerChannelTest, forceTerminate)
    {
        auto channel{ createPooledWorkerChannel(_ioContext, *_childProcessManager, createSettings("/bin/cat"), createTextCodec()) };
        Collector collector;
        channel->setEventHandler(collector.handler());

        channel->start(1, "a");
        channel->start(2, "b");
        channel->forceTerminate();
        _ioContext.run();

        ASSERT_EQ(collector.finished.size(), 2);
        EXPECT_FALSE(collector.finished[1].unexpected);
        EXPECT_FALSE(collector.finished[2].unexpected);
    }

    TEST_F(WorkerChannelTest, malformedMessageDropped)
    {
        auto channel{ createPooledWorkerChannel(_ioContext, *_childProcessManager, createSettings("/bin/cat"), createTextCodec()) };
        Collector collector;
        channel->setEventHandler(collector.handler());

        channel->start(1, "first");
        channel->send(1, "bad");
        channel->send(1, "last");
        channel->send(2, "not started");
        channel->stopAll();
        _ioContext.run();

        EXPECT_EQ(collector.results[1], (std::vector<std::string>{ "first", "last" }));
        EXPECT_FALSE(collector.results.contains(2));
    }

    TEST_F(WorkerChannelTest, singleton)
    {
        auto channel{ createSingletonWorkerChannel(_ioContext, *_childProcessManager, createSettings("/bin/cat"), createTextCodec()) };
        Collector collector;
        channel->setEventHandler([&](const TextChannel::Event& event) {
            collector.handler()(event);
            if (std::holds_alternative<WorkerFinished>(event.payload))
                EXPECT_FALSE(channel->isRunning(std::nullopt));
        });

        EXPECT_FALSE(channel->isRunning(std::nullopt));
        channel->send(std::nullopt, "dropped");
        channel->start(std::nullopt, "a");
        channel->start(std::nullopt, "b");
        channel->send(std::nullopt, "c");
        EXPECT_TRUE(channel->isRunning(std::nullopt));
        EXPECT_EQ(channel->getRunningCount(), 1);

        channel->stop(std::nullopt);
        _ioContext.run();

        EXPECT_EQ(collector.results[std::nullopt], (std::vector<std::string>{ "a", "b", "c" }));
        ASSERT_TRUE(collector.finished.contains(std::nullopt));
        EXPECT_FALSE(collector.finished[std::nullopt].unexpected);
        EXPECT_EQ(channel->getRunningCount(), 0);
    }

    TEST_F(WorkerChannelTest, singletonRestart)
    {
        auto channel{ createSingletonWorkerChannel(_ioContext, *_childProcessManager, createSettings("/bin/cat"), createTextCodec()) };
        std::vector<std::string> results;
        std::size_t finishedCount{};
        channel->setEventHandler([&](const TextChannel::Event& event) {
            if (const auto* result{ std::get_if<std::string>(&event.payload) })
            {
                results.push_back(*result);
                return;
            }

            if (++finishedCount == 1)
            {
                channel->start(std::nullopt, "second run");
                channel->stop(std::nullopt);
            }
        });

        channel->start(std::nullopt, "first run");
        channel->stop(std::nullopt);
        _ioContext.run();

        EXPECT_EQ(finishedCount, 2);
        EXPECT_EQ(results, (std::vector<std::string>{ "first run", "second run" }));
    }

    TEST_F(WorkerChannelTest, launchWithoutRequest)
    {
        auto channel{ createSingletonWorkerChannel(_ioContext, *_childProcessManager, createSettings("/bin/cat"), createTextCodec()) };
        Collector collector;
        channel->setEventHandler(collector.handler());

        EXPECT_TRUE(channel->launch(std::nullopt));
        EXPECT_TRUE(channel->launch(std::nullopt));
        EXPECT_EQ(channel->getRunningCount(), 1);

        channel->stopAll();
        _ioContext.run();

        EXPECT_TRUE(collector.results.empty());
        ASSERT_TRUE(collector.finished.contains(std::nullopt));
        EXPECT_FALSE(collector.finished[std::nullopt].unexpected);
    }

    TEST_F(WorkerChannelTest, pooledLaunchNeedsKey)
    {
        auto channel{ createPooledWorkerChannel(_ioContext, *_childProcessManager, createSettings("/bin/cat"), createTextCodec()) };
        EXPECT_FALSE(channel->launch(std::nullopt));
        EXPECT_EQ(channel->getRunningCount(), 0);
    }
} // namespace lpd::worker::tests
