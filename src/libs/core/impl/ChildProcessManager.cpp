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

#include "ChildProcessManager.hpp"

#include "ChildProcess.hpp"
#include "core/ILogger.hpp"

namespace lpd::core
{
    std::unique_ptr<IChildProcessManager> createChildProcessManager(boost::asio::io_context& ioContext)
    {
        return std::make_unique<ChildProcessManager>(ioContext);
    }

    ChildProcessManager::ChildProcessManager(boost::asio::io_context& ioContext)
        : _ioContext{ ioContext }
    {
    }

    std::unique_ptr<IChildProcess> ChildProcessManager::spawnChildProcess(const std::filesystem::path& path, const IChildProcess::Args& args)
    {
        LPD_LOG(CHILDPROCESS, DEBUG, "Spawning child process '" << path.string() << "'");
        return std::make_unique<ChildProcess>(_ioContext, path, args);
    }
} // namespace lpd::core
