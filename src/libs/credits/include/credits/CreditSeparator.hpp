/*
 * Copyright (C) 2025 Emeric Poupon
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

#include <span>
#include <vector>

#include "credits/Types.hpp"

namespace liner::credits
{
    class RoleCategorizer;

    struct SeparatedCredits
    {
        std::vector<RawCredit> musicalCredits;
        std::vector<RawCredit> technicalCredits;
    };

    // One output credit per atomic role
    // Roles expanded from brackets inherit the category of their main role ("Synthesizer [Moog]" => both musical)
    SeparatedCredits separateCredits(const RoleCategorizer& categorizer, std::span<const RawCredit> credits);

    struct SeparatedRoles
    {
        std::vector<AtomicRole> musicalRoles;
        std::vector<AtomicRole> technicalRoles;
    };

    SeparatedRoles separateRoles(const RoleCategorizer& categorizer, std::span<const AtomicRole> roles);
} // namespace liner::credits
