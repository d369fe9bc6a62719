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

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <variant>

namespace lpd::worker
{
    // Identifies one pooled worker (device or backup destination)
    using WorkerKey = std::uint32_t;

    // Terminal event of a worker process
    struct WorkerFinished
    {
        bool unexpected{}; // exited on its own, with a failure status
    };

    template<typename Result>
    struct WorkerEvent
    {
        std::optional<WorkerKey> key; // not set for singleton workers
        std::variant<Result, WorkerFinished> payload;
    };

    // Asynchronous bidirectional conduit to out-of-process workers
    // Results are delivered as they come, in the order each worker produced them
    template<typename Request, typename Result>
    class IWorkerChannel
    {
    public:
        using Event = WorkerEvent<Result>;
        using EventHandler = std::function<void(const Event&)>;

        virtual ~IWorkerChannel() = default;

        virtual void setEventHandler(EventHandler handler) = 0;

        // key is mandatory for pooled channels and ignored by singleton channels
        // Spawns the worker if not already running, returns false on failure
        virtual bool launch(std::optional<WorkerKey> key) = 0;
        // launch, then send
        virtual void start(std::optional<WorkerKey> key, const Request& request) = 0;
        virtual void send(std::optional<WorkerKey> key, const Request& request) = 0;

        // Graceful stop requests, workers are killed if still alive after the grace period
        virtual void stop(std::optional<WorkerKey> key) = 0;
        virtual void stopAll() = 0;
        // Kill now the workers still alive
        virtual void forceTerminate() = 0;

        virtual bool isRunning(std::optional<WorkerKey> key) const = 0;
        virtual std::size_t getRunningCount() const = 0;
    };
} // namespace lpd::worker
