/*
 * Copyright (C) 2025 Emeric Poupon
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

#include "StageIO.hpp"

#include <istream>
#include <ostream>
#include <thread>

#include "core/ILogger.hpp"

namespace lpd::stages
{
    StageIO::StageIO(std::istream& is, std::ostream& os)
        : _input{ std::make_shared<Input>() }
        , _os{ os }
    {
        // the reader may stay blocked on the input until the process exits
        std::thread reader{ [input = _input, &is] {
            std::string line;
            while (std::getline(is, line))
            {
                if (line.empty())
                    continue;

                {
                    const std::scoped_lock lock{ input->mutex };
                    input->lines.push_back(std::move(line));
                }
                input->cv.notify_one();
            }

            {
                const std::scoped_lock lock{ input->mutex };
                input->closed = true;
            }
            input->cv.notify_one();
        } };
        reader.detach();
    }

    std::optional<std::string> StageIO::readLine()
    {
        std::unique_lock lock{ _input->mutex };
        _input->cv.wait(lock, [this] { return !_input->lines.empty() || _input->closed; });

        if (_input->lines.empty())
            return std::nullopt;

        std::string line{ std::move(_input->lines.front()) };
        _input->lines.pop_front();
        return line;
    }

    std::optional<std::string> StageIO::pollLine()
    {
        const std::scoped_lock lock{ _input->mutex };
        if (_input->lines.empty())
            return std::nullopt;

        std::string line{ std::move(_input->lines.front()) };
        _input->lines.pop_front();
        return line;
    }

    bool StageIO::isInputClosed() const
    {
        const std::scoped_lock lock{ _input->mutex };
        return _input->closed && _input->lines.empty();
    }

    void StageIO::writeLine(std::string_view line)
    {
        _os << line << '\n';
        _os.flush();

        LPD_LOG_IF(WORKER, ERROR, !_os, "Cannot write result, supervisor gone?");
    }
} // namespace lpd::stages
