/*
 * Copyright (C) 2023 Emeric Poupon
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

#include "core/Service.hpp"

namespace lpd::core::tests
{
    class ISequenceSource
    {
    public:
        virtual ~ISequenceSource() = default;
        virtual unsigned next() = 0;
    };

    class SequenceSource : public ISequenceSource
    {
    public:
        explicit SequenceSource(unsigned start)
            : _value{ start } {}

    private:
        unsigned next() override { return ++_value; }

        unsigned _value;
    };

    TEST(Service, lifetime)
    {
        EXPECT_FALSE(Service<ISequenceSource>::exists());
        EXPECT_EQ(Service<ISequenceSource>::get(), nullptr);

        {
            Service<ISequenceSource> source{ std::make_unique<SequenceSource>(41) };

            EXPECT_TRUE(Service<ISequenceSource>::exists());
            EXPECT_EQ(Service<ISequenceSource>::get()->next(), 42u);
            EXPECT_EQ(source->next(), 43u);
        }

        // released on scope exit
        EXPECT_FALSE(Service<ISequenceSource>::exists());
    }

    TEST(Service, assign)
    {
        Service<ISequenceSource> source;
        EXPECT_FALSE(source.exists());

        ISequenceSource& assigned{ source.assign(std::make_unique<SequenceSource>(0)) };
        EXPECT_TRUE(source.exists());
        EXPECT_EQ(&assigned, Service<ISequenceSource>::get());
        EXPECT_EQ(assigned.next(), 1u);
    }
} // namespace lpd::core::tests
