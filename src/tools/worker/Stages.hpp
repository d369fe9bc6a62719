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

namespace lpd::stages
{
    class StageIO;

    // Each stage returns the process exit code
    int runScanStage(StageIO& io);
    int runCopyStage(StageIO& io);
    int runRenameStage(StageIO& io);
    int runBackupStage(StageIO& io);
    int runOffloadStage(StageIO& io);
} // namespace lpd::stages
