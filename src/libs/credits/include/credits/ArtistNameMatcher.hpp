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
#include <unordered_set>
#include <vector>

namespace liner::credits
{
    std::vector<std::string> createDefaultCommonNames();

    // Decides if a credited name refers to a given artist
    // Strict on purpose: "John" must not match every artist called John
    class ArtistNameMatcher
    {
    public:
        enum class Match
        {
            None,
            Exact,    // same names, case insensitive
            Contains, // credited name contains all the words of the target ("John Coltrane Quartet" / "John Coltrane")
            Partial,  // target contains the credited name as a word ("Coltrane" / "John Coltrane"), weaker
        };

        ArtistNameMatcher();
        explicit ArtistNameMatcher(const std::vector<std::string>& commonNames);

        Match match(std::string_view creditedName, std::string_view targetName) const;
        bool isMatch(std::string_view creditedName, std::string_view targetName) const { return match(creditedName, targetName) != Match::None; }

    private:
        std::unordered_set<std::string> _commonNames; // lower case
    };
} // namespace liner::credits
