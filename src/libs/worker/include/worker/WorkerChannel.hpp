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

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "worker/IWorkerChannel.hpp"
#include "worker/WorkerProcess.hpp"

namespace lpd::worker
{
    template<typename Request, typename Result>
    struct WorkerCodec
    {
        std::function<std::string(const Request&)> encodeRequest;
        std::function<Result(std::string_view)> decodeResult; // throws on malformed input
    };

    namespace details
    {
        template<typename Request, typename Result>
        class WorkerChannelBase : public IWorkerChannel<Request, Result>
        {
        public:
            using Event = typename IWorkerChannel<Request, Result>::Event;
            using EventHandler = typename IWorkerChannel<Request, Result>::EventHandler;

            WorkerChannelBase(boost::asio::io_context& ioContext, core::IChildProcessManager& childProcessManager, WorkerSettings settings, WorkerCodec<Request, Result> codec)
                : _ioContext{ ioContext }
                , _childProcessManager{ childProcessManager }
                , _settings{ std::move(settings) }
                , _codec{ std::move(codec) }
            {
            }

            void setEventHandler(EventHandler handler) override { _eventHandler = std::move(handler); }

            void start(std::optional<WorkerKey> key, const Request& request) override
            {
                if (this->launch(key))
                    this->send(key, request);
            }

        protected:
            std::unique_ptr<WorkerProcess> spawn(std::optional<WorkerKey> key)
            {
                WorkerSettings settings{ _settings };
                if (key)
                    settings.name += "#" + std::to_string(*key);

                return std::make_unique<WorkerProcess>(
                    _ioContext, _childProcessManager, settings,
                    [this, key, name = settings.name](std::string_view line) { onLine(key, name, line); },
                    [this, key](const core::IChildProcess::ExitStatus& status, bool stopRequested) { onExited(key, status, stopRequested); });
            }

            void sendTo(WorkerProcess& worker, const Request& request)
            {
                worker.send(_codec.encodeRequest(request));
            }

            // Spawn failures are reported the same way as a crash, asynchronously
            void postSpawnFailure(std::optional<WorkerKey> key)
            {
                boost::asio::post(_ioContext, [this, key] { emit(Event{ key, WorkerFinished{ true } }); });
            }

            // Release the process object once the current handler is done with it
            void deferDestroy(std::unique_ptr<WorkerProcess> worker)
            {
                std::shared_ptr<WorkerProcess> released{ std::move(worker) };
                boost::asio::post(_ioContext, [released] {});
            }

            virtual std::unique_ptr<WorkerProcess> release(std::optional<WorkerKey> key) = 0;

            const WorkerSettings& getSettings() const { return _settings; }

        private:
            void onLine(std::optional<WorkerKey> key, const std::string& name, std::string_view line)
            {
                std::optional<Result> result;
                try
                {
                    result = _codec.decodeResult(line);
                }
                catch (const core::LpdException& e)
                {
                    LPD_LOG(WORKER, ERROR, "Worker '" << name << "': dropping malformed message: " << e.what());
                    return;
                }

                emit(Event{ key, std::move(*result) });
            }

            void onExited(std::optional<WorkerKey> key, const core::IChildProcess::ExitStatus& status, bool stopRequested)
            {
                const bool unexpected{ !stopRequested && !status.success() };
                LPD_LOG_IF(WORKER, ERROR, unexpected, "Worker '" << _settings.name << "' terminated unexpectedly");

                deferDestroy(release(key));
                emit(Event{ key, WorkerFinished{ unexpected } });
            }

            void emit(const Event& event)
            {
                if (_eventHandler)
                    _eventHandler(event);
            }

            boost::asio::io_context& _ioContext;
            core::IChildProcessManager& _childProcessManager;
            const WorkerSettings _settings;
            const WorkerCodec<Request, Result> _codec;
            EventHandler _eventHandler;
        };
    } // namespace details

    // One worker per key, running in parallel
    template<typename Request, typename Result>
    class PooledWorkerChannel final : public details::WorkerChannelBase<Request, Result>
    {
    public:
        using details::WorkerChannelBase<Request, Result>::WorkerChannelBase;

        ~PooledWorkerChannel() override = default;

    private:
        bool launch(std::optional<WorkerKey> key) override
        {
            if (!key)
            {
                LPD_LOG(WORKER, ERROR, "Worker '" << this->getSettings().name << "': cannot start without a key");
                return false;
            }

            if (_workers.contains(*key))
                return true;

            try
            {
                _workers.emplace(*key, this->spawn(key));
            }
            catch (const core::ChildProcessException& e)
            {
                LPD_LOG(WORKER, ERROR, "Cannot start worker '" << this->getSettings().name << "#" << *key << "': " << e.what());
                this->postSpawnFailure(key);
                return false;
            }

            return true;
        }

        void send(std::optional<WorkerKey> key, const Request& request) override
        {
            WorkerProcess* worker{ find(key) };
            if (!worker)
            {
                LPD_LOG(WORKER, WARNING, "Worker '" << this->getSettings().name << "': no such running worker, dropping message");
                return;
            }

            this->sendTo(*worker, request);
        }

        void stop(std::optional<WorkerKey> key) override
        {
            if (WorkerProcess* worker{ find(key) })
                worker->requestStop();
        }

        void stopAll() override
        {
            for (auto& [key, worker] : _workers)
                worker->requestStop();
        }

        void forceTerminate() override
        {
            for (auto& [key, worker] : _workers)
                worker->kill();
        }

        bool isRunning(std::optional<WorkerKey> key) const override
        {
            return key && _workers.contains(*key);
        }

        std::size_t getRunningCount() const override { return _workers.size(); }

        std::unique_ptr<WorkerProcess> release(std::optional<WorkerKey> key) override
        {
            std::unique_ptr<WorkerProcess> res;
            if (!key)
                return res;

            auto it{ _workers.find(*key) };
            if (it != std::end(_workers))
            {
                res = std::move(it->second);
                _workers.erase(it);
            }
            return res;
        }

        WorkerProcess* find(std::optional<WorkerKey> key)
        {
            if (!key)
                return nullptr;

            auto it{ _workers.find(*key) };
            return it != std::end(_workers) ? it->second.get() : nullptr;
        }

        std::unordered_map<WorkerKey, std::unique_ptr<WorkerProcess>> _workers;
    };

    // At most one worker, keys are ignored
    template<typename Request, typename Result>
    class SingletonWorkerChannel final : public details::WorkerChannelBase<Request, Result>
    {
    public:
        using details::WorkerChannelBase<Request, Result>::WorkerChannelBase;

        ~SingletonWorkerChannel() override = default;

    private:
        bool launch(std::optional<WorkerKey>) override
        {
            if (_worker)
                return true;

            try
            {
                _worker = this->spawn(std::nullopt);
            }
            catch (const core::ChildProcessException& e)
            {
                LPD_LOG(WORKER, ERROR, "Cannot start worker '" << this->getSettings().name << "': " << e.what());
                this->postSpawnFailure(std::nullopt);
                return false;
            }

            return true;
        }

        void send(std::optional<WorkerKey>, const Request& request) override
        {
            if (!_worker)
            {
                LPD_LOG(WORKER, WARNING, "Worker '" << this->getSettings().name << "' is not running, dropping message");
                return;
            }

            this->sendTo(*_worker, request);
        }

        void stop(std::optional<WorkerKey>) override
        {
            if (_worker)
                _worker->requestStop();
        }

        void stopAll() override { stop(std::nullopt); }

        void forceTerminate() override
        {
            if (_worker)
                _worker->kill();
        }

        bool isRunning(std::optional<WorkerKey>) const override { return static_cast<bool>(_worker); }
        std::size_t getRunningCount() const override { return _worker ? 1 : 0; }

        std::unique_ptr<WorkerProcess> release(std::optional<WorkerKey>) override { return std::move(_worker); }

        std::unique_ptr<WorkerProcess> _worker;
    };

    template<typename Request, typename Result>
    std::unique_ptr<IWorkerChannel<Request, Result>> createPooledWorkerChannel(boost::asio::io_context& ioContext, core::IChildProcessManager& childProcessManager, WorkerSettings settings, WorkerCodec<Request, Result> codec)
    {
        return std::make_unique<PooledWorkerChannel<Request, Result>>(ioContext, childProcessManager, std::move(settings), std::move(codec));
    }

    template<typename Request, typename Result>
    std::unique_ptr<IWorkerChannel<Request, Result>> createSingletonWorkerChannel(boost::asio::io_context& ioContext, core::IChildProcessManager& childProcessManager, WorkerSettings settings, WorkerCodec<Request, Result> codec)
    {
        return std::make_unique<SingletonWorkerChannel<Request, Result>>(ioContext, childProcessManager, std::move(settings), std::move(codec));
    }
} // namespace lpd::worker
