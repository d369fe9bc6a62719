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

#include "messages/Codec.hpp"

namespace lpd::messages::tests
{
    TEST(Codec, scanFilesFound)
    {
        const MediaFileInfo file{
            .uniqueId = "3f2a",
            .deviceId = DeviceId{ 4 },
            .type = FileType::Video,
            .path = "/media/card/DCIM/100CANON/MVI_0042.MOV",
            .size = 6'000'000'000, // > 4GB
            .modificationTime = 1'700'000'000,
        };

        const std::string line{ encode(ScanResult{ ScanFilesFound{ { file } } }) };
        EXPECT_EQ(line.find('\n'), std::string::npos);

        const ScanResult result{ decodeScanResult(line) };
        ASSERT_TRUE(std::holds_alternative<ScanFilesFound>(result));
        const ScanFilesFound& filesFound{ std::get<ScanFilesFound>(result) };
        ASSERT_EQ(filesFound.files.size(), 1);
        EXPECT_EQ(filesFound.files[0].uniqueId, file.uniqueId);
        EXPECT_EQ(filesFound.files[0].deviceId, file.deviceId);
        EXPECT_EQ(filesFound.files[0].type, FileType::Video);
        EXPECT_EQ(filesFound.files[0].path, file.path);
        EXPECT_EQ(filesFound.files[0].size, 6'000'000'000);
        EXPECT_EQ(filesFound.files[0].modificationTime, 1'700'000'000);
    }

    TEST(Codec, scanDeviceError)
    {
        const ScanResult result{ decodeScanResult(R"({"type":"device_error","code":"locked","details":"PTP busy"})") };
        ASSERT_TRUE(std::holds_alternative<ScanDeviceError>(result));
        EXPECT_EQ(std::get<ScanDeviceError>(result).code, CameraErrorCode::Locked);
        EXPECT_EQ(std::get<ScanDeviceError>(result).details, "PTP busy");

        EXPECT_THROW(decodeScanResult(R"({"type":"device_error","code":"on_fire","details":""})"), CodecException);
    }

    TEST(Codec, optionalFields)
    {
        const ScanResult result{ decodeScanResult(R"({"type":"device_info","display_name":"EOS 5D"})") };
        ASSERT_TRUE(std::holds_alternative<ScanDeviceInfo>(result));
        EXPECT_EQ(std::get<ScanDeviceInfo>(result).displayName, "EOS 5D");
        EXPECT_FALSE(std::get<ScanDeviceInfo>(result).storageCapacity.has_value());
        EXPECT_FALSE(std::get<ScanDeviceInfo>(result).storageFree.has_value());
    }

    TEST(Codec, newlinesInStrings)
    {
        const std::string line{ encode(CopyResult{ CopyFileResult{ .uniqueId = "a", .success = false, .error = "first line\nsecond line" } }) };
        EXPECT_EQ(line.find('\n'), std::string::npos);

        const CopyResult result{ decodeCopyResult(line) };
        ASSERT_TRUE(std::holds_alternative<CopyFileResult>(result));
        EXPECT_EQ(std::get<CopyFileResult>(result).error, "first line\nsecond line");
    }

    TEST(Codec, progressChunksAreDistinct)
    {
        const CopyResult chunk{ decodeCopyResult(encode(CopyResult{ BytesProgress{ 1'048'576 } })) };
        ASSERT_TRUE(std::holds_alternative<BytesProgress>(chunk));
        EXPECT_EQ(std::get<BytesProgress>(chunk).bytes, 1'048'576);

        const BackupResult backupChunk{ decodeBackupResult(R"({"type":"bytes_progress","bytes":42})") };
        ASSERT_TRUE(std::holds_alternative<BytesProgress>(backupChunk));
        EXPECT_EQ(std::get<BytesProgress>(backupChunk).bytes, 42);
    }

    TEST(Codec, renameDownloadStarted)
    {
        const RenameDownloadStarted downloadStarted{
            .naming = { .photoSubfolder = "%Y/%Y%m%d", .videoSubfolder = "%Y/videos", .photoRename = "{jobcode}-{name}{ext}", .videoRename = "{name}{ext}" },
            .sequences = { .storedSequenceNo = 12, .downloadsTodayDate = "2024-06-01", .downloadsTodayCount = 3 },
        };

        const RenameRequest request{ decodeRenameRequest(encode(RenameRequest{ downloadStarted })) };
        ASSERT_TRUE(std::holds_alternative<RenameDownloadStarted>(request));
        EXPECT_EQ(std::get<RenameDownloadStarted>(request).naming, downloadStarted.naming);
        EXPECT_EQ(std::get<RenameDownloadStarted>(request).sequences, downloadStarted.sequences);
    }

    TEST(Codec, offloadProximity)
    {
        const std::string line{ encode(OffloadResult{ ProximityGroups{ { { .start = 100, .end = 200, .uniqueIds = { "a", "b" } }, { .start = 9000, .end = 9000, .uniqueIds = { "c" } } } } }) };

        const OffloadResult result{ decodeOffloadResult(line) };
        ASSERT_TRUE(std::holds_alternative<ProximityGroups>(result));
        const auto& groups{ std::get<ProximityGroups>(result).groups };
        ASSERT_EQ(groups.size(), 2);
        EXPECT_EQ(groups[0].uniqueIds, (std::vector<std::string>{ "a", "b" }));
        EXPECT_EQ(groups[1].start, 9000);
    }

    TEST(Codec, malformed)
    {
        EXPECT_THROW(decodeScanRequest(""), CodecException);
        EXPECT_THROW(decodeScanRequest("not json"), CodecException);
        EXPECT_THROW(decodeScanRequest(R"({"type":"scan_everything"})"), CodecException);
        EXPECT_THROW(decodeScanRequest(R"({"no_type":true})"), CodecException);
        // missing fields
        EXPECT_THROW(decodeCopyResult(R"({"type":"file_result","unique_id":"a"})"), CodecException);
        // wrong field type
        EXPECT_THROW(decodeCopyResult(R"({"type":"bytes_progress","bytes":"many"})"), CodecException);
        EXPECT_THROW(decodeCopyResult(R"({"type":"bytes_progress","bytes":-1})"), CodecException);
        // a request is not a result
        EXPECT_THROW(decodeBackupResult(encode(BackupRequest{ BackupFileData{} })), CodecException);
    }

    TEST(Types, canBackup)
    {
        EXPECT_TRUE(canBackup(BackupLocationType::Photos, FileType::Photo));
        EXPECT_FALSE(canBackup(BackupLocationType::Photos, FileType::Video));
        EXPECT_FALSE(canBackup(BackupLocationType::Videos, FileType::Photo));
        EXPECT_TRUE(canBackup(BackupLocationType::Videos, FileType::Video));
        EXPECT_TRUE(canBackup(BackupLocationType::PhotosAndVideos, FileType::Photo));
        EXPECT_TRUE(canBackup(BackupLocationType::PhotosAndVideos, FileType::Video));
    }

    TEST(Types, names)
    {
        EXPECT_EQ(toString(BackupLocationType::PhotosAndVideos), "photos_and_videos");
        EXPECT_EQ(backupLocationTypeFromString("videos"), BackupLocationType::Videos);
        EXPECT_EQ(fileTypeFromString("audio"), std::nullopt);
        EXPECT_EQ(deviceKindFromString("camera"), DeviceKind::Camera);
    }
} // namespace lpd::messages::tests
