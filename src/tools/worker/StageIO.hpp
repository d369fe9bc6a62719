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

#pragma once

#include <condition_variable>
#include <deque>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "messages/Codec.hpp"

namespace lpd::stages
{
    // Request lines are read from a dedicated thread, so that stages can poll
    // for control messages while processing files
    class StageIO
    {
    public:
        StageIO(std::istream& is, std::ostream& os);
        StageIO(const StageIO&) = delete;
        StageIO& operator=(const StageIO&) = delete;

        // blocks until a line is available, nullopt once the input is closed
        std::optional<std::string> readLine();
        // nullopt if no line is pending
        std::optional<std::string> pollLine();
        bool isInputClosed() const;

        template<typename Message>
        void write(const Message& message)
        {
            writeLine(messages::encode(message));
        }

    private:
        void writeLine(std::string_view line);

        struct Input
        {
            mutable std::mutex mutex;
            std::condition_variable cv;
            std::deque<std::string> lines;
            bool closed{};
        };

        std::shared_ptr<Input> _input;
        std::ostream& _os;
    };
} // namespace lpd::stages
