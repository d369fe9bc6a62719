/*
 * Copyright (C) 2021 Emeric Poupon
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

#include <compare>
#include <functional>

namespace lpd::core
{
    template<typename Tag, typename T>
    class TaggedType
    {
    public:
        using underlying_type = T;

        constexpr TaggedType() = default;
        explicit constexpr TaggedType(T value)
            : _value{ value } {}

        constexpr T value() const { return _value; }

        auto operator<=>(const TaggedType&) const = default;

    private:
        T _value{};
    };

    template<typename Tag>
    using TaggedBool = TaggedType<Tag, bool>;
} // namespace lpd::core

namespace std
{
    template<typename Tag, typename T>
    struct hash<lpd::core::TaggedType<Tag, T>>
    {
        std::size_t operator()(const lpd::core::TaggedType<Tag, T>& value) const noexcept
        {
            return std::hash<T>{}(value.value());
        }
    };
} // namespace std
