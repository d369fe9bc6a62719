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

#include <gtest/gtest.h>

#include "download/TimeRemaining.hpp"

namespace lpd::download::tests
{
    namespace
    {
        using namespace std::chrono_literals;

        const DeviceId deviceA{ 1 };
        const DeviceId deviceB{ 2 };
    } // namespace

    TEST(TimeRemaining, nothingOutstanding)
    {
        TimeRemaining timeRemaining;
        EXPECT_EQ(timeRemaining.getTimeRemaining(), 0s);

        const auto now{ TimeRemaining::Clock::now() };
        timeRemaining.addDevice(deviceA, 0, now);
        EXPECT_EQ(timeRemaining.getTimeRemaining(), 0s);
    }

    TEST(TimeRemaining, noRateYet)
    {
        TimeRemaining timeRemaining;
        const auto start{ TimeRemaining::Clock::now() };
        timeRemaining.addDevice(deviceA, 1000, start);

        EXPECT_FALSE(timeRemaining.getTimeRemaining());

        // sample too close to the previous one
        timeRemaining.update(deviceA, 100, start + 500ms);
        EXPECT_FALSE(timeRemaining.getTimeRemaining());

        timeRemaining.update(deviceA, 100, start + 1s);
        ASSERT_TRUE(timeRemaining.getTimeRemaining());
        // 200 bytes/s, 800 bytes to go
        EXPECT_EQ(*timeRemaining.getTimeRemaining(), 4s);
    }

    TEST(TimeRemaining, constantRateIsMonotonic)
    {
        TimeRemaining timeRemaining;
        const auto start{ TimeRemaining::Clock::now() };
        timeRemaining.addDevice(deviceA, 10'000'000, start);

        std::optional<std::chrono::seconds> previous;
        for (int i{ 1 }; i <= 10; ++i)
        {
            timeRemaining.update(deviceA, 1'000'000, start + std::chrono::seconds{ i });

            const auto remaining{ timeRemaining.getTimeRemaining() };
            ASSERT_TRUE(remaining);
            if (previous)
                EXPECT_LE(*remaining, *previous);
            previous = remaining;
        }

        EXPECT_EQ(previous, 0s);
    }

    TEST(TimeRemaining, severalDevices)
    {
        TimeRemaining timeRemaining;
        const auto start{ TimeRemaining::Clock::now() };
        timeRemaining.addDevice(deviceA, 3000, start);
        timeRemaining.addDevice(deviceB, 3000, start);

        timeRemaining.update(deviceA, 1000, start + 1s);
        timeRemaining.update(deviceB, 1000, start + 1s);

        // 4000 bytes to go at 2000 bytes/s
        EXPECT_EQ(timeRemaining.getTimeRemaining(), 2s);

        timeRemaining.removeDevice(deviceB);
        EXPECT_EQ(timeRemaining.getTimeRemaining(), 2s);
        EXPECT_FALSE(timeRemaining.contains(deviceB));
    }

    TEST(TimeRemaining, excludedBytes)
    {
        TimeRemaining timeRemaining;
        const auto start{ TimeRemaining::Clock::now() };
        timeRemaining.addDevice(deviceA, 200'000, start);

        // first file failed before any transfer
        timeRemaining.excludeBytes(deviceA, 100'000);

        timeRemaining.update(deviceA, 50'000, start + 1s);
        EXPECT_EQ(timeRemaining.getTimeRemaining(), 1s);

        timeRemaining.update(deviceA, 50'000, start + 2s);
        EXPECT_EQ(timeRemaining.getTimeRemaining(), 0s);

        // never below zero
        timeRemaining.excludeBytes(deviceA, 1'000'000);
        EXPECT_EQ(timeRemaining.getTimeRemaining(), 0s);
        timeRemaining.excludeBytes(deviceB, 1000);
        EXPECT_FALSE(timeRemaining.contains(deviceB));
    }

    TEST(TimeRemaining, pause)
    {
        TimeRemaining timeRemaining;
        const auto start{ TimeRemaining::Clock::now() };
        timeRemaining.addDevice(deviceA, 10'000, start);

        timeRemaining.update(deviceA, 1000, start + 1s);
        EXPECT_EQ(timeRemaining.getTimeRemaining(), 9s);

        timeRemaining.pause();
        timeRemaining.update(deviceA, 1000, start + 60s);
        // rate not updated while paused
        EXPECT_EQ(timeRemaining.getTimeRemaining(), 8s);

        // elapsed paused time does not count
        timeRemaining.resume(start + 100s);
        timeRemaining.update(deviceA, 1000, start + 101s);
        EXPECT_EQ(timeRemaining.getTimeRemaining(), 7s);
    }

    TEST(TimeCheck, throttling)
    {
        TimeCheck timeCheck;
        const auto start{ TimeCheck::Clock::now() };

        EXPECT_FALSE(timeCheck.checkForUpdate(start));

        timeCheck.setDownloadMark(start);
        timeCheck.increment(1000);
        EXPECT_FALSE(timeCheck.checkForUpdate(start + 500ms));

        timeCheck.increment(1000);
        const std::optional<double> speed{ timeCheck.checkForUpdate(start + 2s) };
        ASSERT_TRUE(speed);
        EXPECT_DOUBLE_EQ(*speed, 1000);

        EXPECT_FALSE(timeCheck.checkForUpdate(start + 2500ms));

        timeCheck.pause();
        EXPECT_FALSE(timeCheck.checkForUpdate(start + 10s));
    }

    TEST(TimeRemaining, formatTimeRemaining)
    {
        EXPECT_EQ(formatTimeRemaining(0s), "");
        EXPECT_EQ(formatTimeRemaining(1s), "About 1 second remaining");
        EXPECT_EQ(formatTimeRemaining(45s), "About 45 seconds remaining");
        EXPECT_EQ(formatTimeRemaining(60s), "About 1 minute remaining");
        EXPECT_EQ(formatTimeRemaining(125s), "About 2:05 minutes remaining");
        EXPECT_EQ(formatTimeRemaining(3600s), "About 60:00 minutes remaining");
    }
} // namespace lpd::download::tests
