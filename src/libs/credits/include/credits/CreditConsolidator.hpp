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
#include <string>
#include <string_view>
#include <vector>

#include "credits/Types.hpp"

namespace liner::credits
{
    std::vector<std::string> createDefaultCompositionOnlyTerms();

    // Groups release level and track level credits into one record per artist
    // A role is an album role if it is credited at release level, or on every track of the release
    class CreditConsolidator
    {
    public:
        // used for credits without any role
        static constexpr std::string_view placeholderRole{ "Contributor" };
        // used for credits without any artist name
        static constexpr std::string_view unknownArtistName{ "Unknown Artist" };

        CreditConsolidator();
        explicit CreditConsolidator(std::vector<std::string> compositionOnlyTerms);

        // throws ContractViolationException if totalTrackCount is negative
        // Artists only credited for compositional roles are not reported
        // Album only artists come first, then artists having track roles, both sorted by name
        std::vector<ConsolidatedArtistCredit> consolidate(std::span<const RawCredit> albumCredits, std::span<const TrackCredit> trackCredits, int totalTrackCount) const;

        bool isCompositionOnly(std::span<const AtomicRole> roles) const;

    private:
        std::vector<std::string> _compositionOnlyTerms; // lower case
    };
} // namespace liner::credits
