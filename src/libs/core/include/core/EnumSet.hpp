/*
 * Copyright (C) 2020 Emeric Poupon
 *
 * This file is part of Liner.
 *
 * Liner is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Liner is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Liner.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <cassert>
#include <cstdint>
#include <initializer_list>
#include <type_traits>

namespace liner::core
{
    // Small bitfield based set, enum values must be contiguous and start at 0
    template<typename T, typename UnderlyingType = std::uint32_t>
    class EnumSet
    {
        static_assert(std::is_enum_v<T>);
        static_assert(std::is_same_v<UnderlyingType, std::uint64_t> || std::is_same_v<UnderlyingType, std::uint32_t>);

    public:
        constexpr EnumSet() = default;
        constexpr EnumSet(std::initializer_list<T> values)
        {
            for (T value : values)
                insert(value);
        }

        constexpr void insert(T value)
        {
            _bitfield |= getMask(value);
        }

        constexpr void erase(T value)
        {
            _bitfield &= ~getMask(value);
        }

        constexpr bool contains(T value) const
        {
            return _bitfield & getMask(value);
        }

        constexpr bool empty() const { return _bitfield == 0; }
        constexpr void clear() { _bitfield = 0; }

        constexpr std::size_t size() const
        {
            std::size_t res{};
            for (UnderlyingType bitfield{ _bitfield }; bitfield; bitfield &= bitfield - 1)
                ++res;

            return res;
        }

        constexpr UnderlyingType getBitfield() const { return _bitfield; }

        constexpr bool operator==(const EnumSet& other) const = default;

    private:
        static constexpr UnderlyingType getMask(T value)
        {
            assert(static_cast<std::size_t>(value) < sizeof(UnderlyingType) * 8);
            return UnderlyingType{ 1 } << static_cast<UnderlyingType>(value);
        }

        UnderlyingType _bitfield{};
    };
} // namespace liner::core
