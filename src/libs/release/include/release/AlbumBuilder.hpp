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

#include <optional>
#include <string_view>

#include "release/Types.hpp"

namespace liner::credits
{
    class CreditConsolidator;
}

namespace liner::release
{
    class AlbumBuilder
    {
    public:
        static constexpr std::string_view unknownTitle{ "Unknown Title" };
        static constexpr std::string_view unknownArtistName{ "Unknown Artist" };
        static constexpr std::string_view defaultArtistRole{ "Artist" };
        static constexpr std::string_view defaultTrackType{ "track" };

        explicit AlbumBuilder(const credits::CreditConsolidator& creditConsolidator);

        Album build(const RawRelease& release) const;

    private:
        const credits::CreditConsolidator& _creditConsolidator;
    };

    // Reissues often carry the original recording year in their title: "Kind Of Blue (1959)"
    // Title year (earliest one, 1900-2025) is preferred if the release year is after 2010 and the title year before 2000
    std::optional<int> extractYearFromTitle(std::string_view title, std::optional<int> year);

    // id, title, artist and year must be set
    bool validateAlbum(const Album& album);
} // namespace liner::release
