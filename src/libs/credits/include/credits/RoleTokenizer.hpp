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

#include <string>
#include <string_view>
#include <vector>

#include "credits/Types.hpp"

namespace liner::credits
{
    // Splits at commas that are not enclosed in brackets, segments are trimmed and empty ones dropped
    // A ']' that would make the bracket depth negative is kept as a literal character
    std::vector<std::string_view> splitTopLevelSegments(std::string_view roleText);

    // "<main role> [<item>, <item>] <suffix>" => main role, items, suffix
    // Bracket items are expanded the same way. Segments not matching this form are returned as is
    std::vector<AtomicRole> expandSegment(std::string_view segment);

    // Removes the bracketed parts of a segment: "Synthesizer [Oberheim, Prophet V]" => "Synthesizer"
    std::string stripBracketedContent(std::string_view segment);

    // ex: "Synthesizer [Oberheim, Prophet V], Producer" => "Synthesizer", "Oberheim", "Prophet V", "Producer"
    std::vector<AtomicRole> tokenizeRoles(std::string_view roleText);
} // namespace liner::credits
