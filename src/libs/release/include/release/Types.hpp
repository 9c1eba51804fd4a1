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

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "credits/Types.hpp"

namespace liner::release
{
    // Format descriptor fields are either a single string ("name", "qty") or a list ("descriptions")
    using FormatValue = std::variant<std::string, std::vector<std::string>>;
    using Format = std::map<std::string, FormatValue>;

    struct ReleaseArtist
    {
        std::string name;
        std::string role;
        std::optional<std::string> id;

        bool operator==(const ReleaseArtist&) const = default;
    };

    struct RawTrack
    {
        std::string position;
        std::string title;
        std::string duration;
        std::string type;
        std::vector<credits::RawCredit> extraArtists;
    };

    // Release record, as provided by the metadata source
    struct RawRelease
    {
        std::string id;
        std::string title;
        std::optional<int> year;
        std::optional<std::string> masterId;
        std::vector<Format> formats;
        std::vector<std::string> genres;
        std::vector<std::string> styles;
        std::vector<ReleaseArtist> artists;
        std::vector<credits::RawCredit> extraArtists; // release level credits
        std::vector<RawTrack> tracklist;
    };

    enum class AlbumType
    {
        Release,
        Master,
    };

    struct Track
    {
        std::string position;
        std::string title;
        std::string duration;
        std::string type;

        bool operator==(const Track&) const = default;
    };

    // Normalized album record
    struct Album
    {
        std::string id;
        std::string title;
        std::optional<int> year;
        std::vector<ReleaseArtist> artists;
        std::string mainArtist;
        std::string mainRole;
        AlbumType type{ AlbumType::Release };
        std::vector<std::string> genres;
        std::vector<std::string> styles;
        std::vector<Format> formats;
        std::vector<Track> tracklist;
        std::vector<credits::ConsolidatedArtistCredit> credits;
    };

    const char* albumTypeToString(AlbumType type);
} // namespace liner::release
