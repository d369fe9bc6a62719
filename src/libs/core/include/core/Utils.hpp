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

#pragma once

namespace lpd::core::utils
{
    // Helper to visit variants with a set of lambdas
    template<class... Ts>
    struct overloads : Ts...
    {
        using Ts::operator()...;
    };
    template<class... Ts>
    overloads(Ts...) -> overloads<Ts...>;
} // namespace lpd::core::utils
