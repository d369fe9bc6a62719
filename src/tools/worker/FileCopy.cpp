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

#include "FileCopy.hpp"

#include <algorithm>
#include <fstream>
#include <vector>

#include "core/ILogger.hpp"

namespace lpd::stages
{
    namespace
    {
        constexpr std::size_t chunkSize{ 1024 * 1024 };

        FileCopyResult abortCopy(const std::filesystem::path& destination, bool aborted, std::string error)
        {
            std::error_code ec;
            std::filesystem::remove(destination, ec);
            LPD_LOG_IF(WORKER, WARNING, ec, "Cannot remove incomplete file " << destination << ": " << ec.message());

            return FileCopyResult{ false, aborted, std::move(error) };
        }
    } // namespace

    FileCopyResult copyFile(const std::filesystem::path& source, const std::filesystem::path& destination, const ChunkHandler& onChunk)
    {
        std::ifstream is{ source, std::ios::binary };
        if (!is)
            return FileCopyResult{ false, false, "cannot open " + source.string() };

        std::ofstream os{ destination, std::ios::binary | std::ios::trunc };
        if (!os)
            return FileCopyResult{ false, false, "cannot create " + destination.string() };

        std::vector<char> buffer(chunkSize);
        while (is)
        {
            is.read(buffer.data(), buffer.size());
            const std::streamsize readSize{ is.gcount() };
            if (readSize <= 0)
                break;

            os.write(buffer.data(), readSize);
            if (!os)
                return abortCopy(destination, false, "cannot write " + destination.string());

            if (onChunk && !onChunk(static_cast<std::uint64_t>(readSize)))
                return abortCopy(destination, true, "aborted");
        }

        if (is.bad())
            return abortCopy(destination, false, "cannot read " + source.string());

        os.close();
        if (!os)
            return abortCopy(destination, false, "cannot write " + destination.string());

        std::error_code ec;
        const auto lastWriteTime{ std::filesystem::last_write_time(source, ec) };
        if (!ec)
            std::filesystem::last_write_time(destination, lastWriteTime, ec);
        LPD_LOG_IF(WORKER, DEBUG, ec, "Cannot preserve modification time of " << destination << ": " << ec.message());

        return FileCopyResult{ true, false, {} };
    }

    bool areFilesIdentical(const std::filesystem::path& fileA, const std::filesystem::path& fileB)
    {
        std::error_code ec;
        const auto sizeA{ std::filesystem::file_size(fileA, ec) };
        if (ec)
            return false;
        const auto sizeB{ std::filesystem::file_size(fileB, ec) };
        if (ec || sizeA != sizeB)
            return false;

        std::ifstream isA{ fileA, std::ios::binary };
        std::ifstream isB{ fileB, std::ios::binary };
        if (!isA || !isB)
            return false;

        std::vector<char> bufferA(chunkSize);
        std::vector<char> bufferB(chunkSize);
        while (isA && isB)
        {
            isA.read(bufferA.data(), bufferA.size());
            isB.read(bufferB.data(), bufferB.size());

            if (isA.gcount() != isB.gcount())
                return false;
            if (!std::equal(std::cbegin(bufferA), std::cbegin(bufferA) + isA.gcount(), std::cbegin(bufferB)))
                return false;
        }

        return !isA.bad() && !isB.bad();
    }

    std::filesystem::path getAvailablePath(const std::filesystem::path& candidate)
    {
        std::error_code ec;
        if (!std::filesystem::exists(candidate, ec))
            return candidate;

        const std::string stem{ candidate.stem().string() };
        const std::string extension{ candidate.extension().string() };
        for (std::size_t suffix{ 1 };; ++suffix)
        {
            std::filesystem::path path{ candidate.parent_path() / (stem + "_" + std::to_string(suffix) + extension) };
            if (!std::filesystem::exists(path, ec))
                return path;
        }
    }
} // namespace lpd::stages
