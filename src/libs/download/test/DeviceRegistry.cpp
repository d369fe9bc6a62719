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

#include "core/Exception.hpp"
#include "download/DeviceRegistry.hpp"

namespace lpd::download::tests
{
    namespace
    {
        messages::MediaFileInfo createFile(std::string uniqueId, FileType type, std::uint64_t size)
        {
            messages::MediaFileInfo file;
            file.uniqueId = std::move(uniqueId);
            file.type = type;
            file.path = "/media/card/DCIM/" + file.uniqueId;
            file.size = size;
            return file;
        }

        DeviceDescription createVolume(const std::filesystem::path& path)
        {
            DeviceDescription description;
            description.kind = DeviceKind::Volume;
            description.displayName = path.filename().string();
            description.path = path;
            return description;
        }
    } // namespace

    TEST(DeviceRegistry, transitions)
    {
        DeviceRegistry registry;
        const DeviceId id{ registry.add(createVolume("/media/card")) };
        EXPECT_EQ(registry.get(id).state, DeviceState::Registered);

        EXPECT_FALSE(registry.transition(id, DeviceState::Scanned));
        EXPECT_TRUE(registry.transition(id, DeviceState::Scanning));
        EXPECT_TRUE(registry.transition(id, DeviceState::Scanned));
        // no way back, except through the error state
        EXPECT_FALSE(registry.transition(id, DeviceState::Scanning));
        EXPECT_TRUE(registry.transition(id, DeviceState::DownloadPending));
        EXPECT_FALSE(registry.transition(id, DeviceState::Completed));
        EXPECT_TRUE(registry.transition(id, DeviceState::Downloading));
        EXPECT_TRUE(registry.transition(id, DeviceState::Completed));
        EXPECT_FALSE(registry.transition(id, DeviceState::Downloading));
        EXPECT_EQ(registry.get(id).state, DeviceState::Completed);

        EXPECT_TRUE(registry.transition(id, DeviceState::Removed));
        EXPECT_FALSE(registry.transition(id, DeviceState::Scanning));
    }

    TEST(DeviceRegistry, errorRetry)
    {
        DeviceRegistry registry;
        const DeviceId id{ registry.add(createVolume("/media/card")) };

        ASSERT_TRUE(registry.transition(id, DeviceState::Scanning));
        ASSERT_TRUE(registry.transition(id, DeviceState::Error));
        registry.get(id).scanError = CameraErrorCode::Locked;

        EXPECT_FALSE(registry.transition(id, DeviceState::Scanned));
        EXPECT_TRUE(registry.transition(id, DeviceState::Scanning));
        EXPECT_FALSE(registry.get(id).scanError.has_value());
    }

    TEST(DeviceRegistry, isTransitionAllowed)
    {
        for (const DeviceState state : { DeviceState::Registered, DeviceState::Scanning, DeviceState::Scanned, DeviceState::DownloadPending, DeviceState::Downloading, DeviceState::Completed, DeviceState::Error })
            EXPECT_TRUE(DeviceRegistry::isTransitionAllowed(state, DeviceState::Removed)) << toString(state);

        EXPECT_FALSE(DeviceRegistry::isTransitionAllowed(DeviceState::Removed, DeviceState::Removed));
        EXPECT_FALSE(DeviceRegistry::isTransitionAllowed(DeviceState::Removed, DeviceState::Registered));
    }

    TEST(DeviceRegistry, removeIsIdempotent)
    {
        DeviceRegistry registry;
        const DeviceId id{ registry.add(createVolume("/media/card")) };

        EXPECT_TRUE(registry.isActive(id));
        EXPECT_TRUE(registry.remove(id));
        EXPECT_FALSE(registry.isActive(id));
        EXPECT_FALSE(registry.remove(id));
        EXPECT_EQ(registry.get(id).state, DeviceState::Removed);

        EXPECT_FALSE(registry.remove(DeviceId{ 42 }));
        EXPECT_EQ(registry.find(DeviceId{ 42 }), nullptr);
        EXPECT_THROW(registry.get(DeviceId{ 42 }), core::LpdException);
    }

    TEST(DeviceRegistry, idsAreNotReused)
    {
        DeviceRegistry registry;
        const DeviceId id1{ registry.add(createVolume("/media/card")) };
        registry.remove(id1);
        const DeviceId id2{ registry.add(createVolume("/media/card")) };

        EXPECT_NE(id1, id2);
        EXPECT_EQ(registry.findByPath("/media/card", DeviceKind::Volume), id2);
        EXPECT_EQ(registry.getActiveDeviceCount(), 1);
    }

    TEST(DeviceRegistry, findCamera)
    {
        DeviceRegistry registry;

        DeviceDescription camera;
        camera.kind = DeviceKind::Camera;
        camera.cameraModel = "Canon EOS 5D";
        camera.cameraPort = "usb:001,004";
        const DeviceId id{ registry.add(camera) };

        EXPECT_EQ(registry.findCamera("Canon EOS 5D", "usb:001,004"), id);
        EXPECT_FALSE(registry.findCamera("Canon EOS 5D", "usb:001,005"));
        EXPECT_FALSE(registry.findByPath("", DeviceKind::Volume));

        registry.remove(id);
        EXPECT_FALSE(registry.findCamera("Canon EOS 5D", "usb:001,004"));
    }

    TEST(DeviceRegistry, addFiles)
    {
        DeviceRegistry registry;
        const DeviceId id{ registry.add(createVolume("/media/card")) };

        const std::vector<messages::MediaFileInfo> files{
            createFile("IMG_0001.JPG", FileType::Photo, 100),
            createFile("IMG_0002.JPG", FileType::Photo, 200),
            createFile("MVI_0003.MOV", FileType::Video, 1000),
        };

        EXPECT_EQ(registry.addFiles(id, files), 3);
        EXPECT_EQ(registry.addFiles(id, files), 0);

        const DeviceRecord& device{ registry.get(id) };
        EXPECT_EQ(device.files.size(), 3);
        EXPECT_EQ(device.discovered, (FileCounts{ 2, 1, 300, 1000 }));

        FileRecord* file{ registry.findFile(id, "MVI_0003.MOV") };
        ASSERT_NE(file, nullptr);
        EXPECT_EQ(file->info.deviceId, id);
        EXPECT_TRUE(file->marked);
        EXPECT_EQ(file->status, FileStatus::Discovered);
        EXPECT_EQ(registry.findFile(id, "unknown"), nullptr);
    }

    TEST(DeviceRegistry, filesToDownload)
    {
        DeviceRegistry registry;
        const DeviceId id{ registry.add(createVolume("/media/card")) };

        const std::vector<messages::MediaFileInfo> files{
            createFile("IMG_0001.JPG", FileType::Photo, 100),
            createFile("IMG_0002.JPG", FileType::Photo, 200),
            createFile("IMG_0003.JPG", FileType::Photo, 300),
        };
        registry.addFiles(id, files);

        const std::string unmarked[]{ "IMG_0002.JPG", "unknown" };
        EXPECT_EQ(registry.setFilesMarked(id, unmarked, false), 1);
        EXPECT_EQ(registry.getFilesToDownload(id).size(), 2);
        EXPECT_EQ(registry.getRemainingFileCount(id), 3);

        registry.findFile(id, "IMG_0001.JPG")->status = FileStatus::Finished;
        EXPECT_EQ(registry.getFilesToDownload(id).size(), 1);
        EXPECT_EQ(registry.getRemainingFileCount(id), 2);

        // already downloaded
        const std::string downloaded[]{ "IMG_0001.JPG" };
        EXPECT_EQ(registry.setFilesMarked(id, downloaded, true), 0);
    }

    TEST(DeviceRegistry, getDevices)
    {
        DeviceRegistry registry;
        const DeviceId id1{ registry.add(createVolume("/media/card1")) };
        const DeviceId id2{ registry.add(createVolume("/media/card2")) };
        registry.transition(id2, DeviceState::Scanning);

        EXPECT_EQ(registry.getDevices(DeviceState::Registered), std::vector<DeviceId>{ id1 });
        EXPECT_EQ(registry.getDevices(DeviceState::Scanning), std::vector<DeviceId>{ id2 });

        registry.remove(id1);
        EXPECT_EQ(registry.getActiveDevices(), std::vector<DeviceId>{ id2 });
    }
} // namespace lpd::download::tests
