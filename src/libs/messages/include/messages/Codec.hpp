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

#include <string>
#include <string_view>

#include "core/Exception.hpp"
#include "messages/BackupMessages.hpp"
#include "messages/CopyMessages.hpp"
#include "messages/OffloadMessages.hpp"
#include "messages/RenameMessages.hpp"
#include "messages/ScanMessages.hpp"

// Line oriented JSON codec used on the worker pipes
// Each message is a single JSON object holding a "type" field, encoded without trailing newline
namespace lpd::messages
{
    class CodecException : public core::LpdException
    {
    public:
        using core::LpdException::LpdException;
    };

    std::string encode(const ScanRequest& request);
    std::string encode(const ScanResult& result);
    ScanRequest decodeScanRequest(std::string_view line);
    ScanResult decodeScanResult(std::string_view line);

    std::string encode(const CopyRequest& request);
    std::string encode(const CopyResult& result);
    CopyRequest decodeCopyRequest(std::string_view line);
    CopyResult decodeCopyResult(std::string_view line);

    std::string encode(const RenameRequest& request);
    std::string encode(const RenameResult& result);
    RenameRequest decodeRenameRequest(std::string_view line);
    RenameResult decodeRenameResult(std::string_view line);

    std::string encode(const BackupRequest& request);
    std::string encode(const BackupResult& result);
    BackupRequest decodeBackupRequest(std::string_view line);
    BackupResult decodeBackupResult(std::string_view line);

    std::string encode(const OffloadRequest& request);
    std::string encode(const OffloadResult& result);
    OffloadRequest decodeOffloadRequest(std::string_view line);
    OffloadResult decodeOffloadResult(std::string_view line);
} // namespace lpd::messages
