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

#include "download/JobCodeCoordinator.hpp"

namespace lpd::download::tests
{
    TEST(JobCodeCoordinator, isUsedBy)
    {
        messages::NamingPreferences naming{ "%Y/%Y%m%d", "%Y/%Y%m%d", "{name}{ext}", "{name}{ext}" };
        EXPECT_FALSE(JobCodeCoordinator::isUsedBy(naming));

        naming.videoSubfolder = "%Y/{jobcode}";
        EXPECT_TRUE(JobCodeCoordinator::isUsedBy(naming));

        JobCodeCoordinator jobCode;
        EXPECT_TRUE(jobCode.isRequired(naming));

        jobCode.provide("Wedding", false);
        EXPECT_FALSE(jobCode.isRequired(naming));

        jobCode.resetCode();
        EXPECT_TRUE(jobCode.isRequired(naming));
    }

    TEST(JobCodeCoordinator, singlePrompt)
    {
        JobCodeCoordinator jobCode;
        const DeviceId deviceA{ 1 };
        const DeviceId deviceB{ 2 };

        EXPECT_TRUE(jobCode.request(std::vector<DeviceId>{ deviceA }));
        EXPECT_TRUE(jobCode.isPromptOutstanding());

        // waits for the first prompt
        EXPECT_FALSE(jobCode.request(std::vector<DeviceId>{ deviceB, deviceA }));

        const std::vector<DeviceId> devices{ jobCode.provide("Wedding", true) };
        EXPECT_EQ(devices, (std::vector<DeviceId>{ deviceA, deviceB }));
        EXPECT_FALSE(jobCode.isPromptOutstanding());
        EXPECT_EQ(jobCode.getCode(), "Wedding");
    }

    TEST(JobCodeCoordinator, cancel)
    {
        JobCodeCoordinator jobCode;
        const DeviceId deviceA{ 1 };
        const DeviceId deviceB{ 2 };

        jobCode.request(std::vector<DeviceId>{ deviceA, deviceB });
        jobCode.removeWaitingDevice(deviceB);

        EXPECT_EQ(jobCode.cancel(), std::vector<DeviceId>{ deviceA });
        EXPECT_FALSE(jobCode.isPromptOutstanding());
        EXPECT_TRUE(jobCode.getCode().empty());

        EXPECT_TRUE(jobCode.request(std::vector<DeviceId>{ deviceA }));
    }

    TEST(JobCodeCoordinator, previousCodes)
    {
        JobCodeCoordinator jobCode{ std::vector<std::string>{ "Birthday", "Wedding" } };

        jobCode.provide("Holidays", true);
        EXPECT_EQ(jobCode.getPreviousCodes(), (std::vector<std::string>{ "Holidays", "Birthday", "Wedding" }));

        jobCode.provide("Wedding", true);
        EXPECT_EQ(jobCode.getPreviousCodes(), (std::vector<std::string>{ "Wedding", "Holidays", "Birthday" }));

        jobCode.provide("Once", false);
        EXPECT_EQ(jobCode.getPreviousCodes(), (std::vector<std::string>{ "Wedding", "Holidays", "Birthday" }));
        EXPECT_EQ(jobCode.getCode(), "Once");

        jobCode.provide("  Wedding\t", true);
        EXPECT_EQ(jobCode.getCode(), "Wedding");
        EXPECT_EQ(jobCode.getPreviousCodes(), (std::vector<std::string>{ "Wedding", "Holidays", "Birthday" }));

        jobCode.provide(" ", true);
        EXPECT_TRUE(jobCode.getCode().empty());
        EXPECT_EQ(jobCode.getPreviousCodes().size(), std::size_t{ 3 });
    }
} // namespace lpd::download::tests
