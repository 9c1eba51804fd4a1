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
#include <string>
#include <vector>

namespace liner::credits
{
    // Single role name, once brackets and commas have been expanded
    using AtomicRole = std::string;

    // One line item from a release or track credit list
    struct RawCredit
    {
        std::string artistName;
        std::string roleText;
        std::optional<std::string> sourceId;

        bool operator==(const RawCredit&) const = default;
    };

    enum class RoleCategory
    {
        Musical,
        Technical,
        Unknown,
    };

    enum class CreditScope
    {
        Album,
        Track,
    };

    struct TrackReference
    {
        std::string title;
        std::string position;

        auto operator<=>(const TrackReference&) const = default;
    };

    struct TrackCredit
    {
        TrackReference track;
        RawCredit credit;
    };

    struct TrackRole
    {
        AtomicRole role;
        std::vector<TrackReference> tracks;

        bool operator==(const TrackRole&) const = default;
    };

    struct ConsolidatedArtistCredit
    {
        enum class Source
        {
            Album, // album roles only
            Mixed, // has at least one track specific role
        };

        std::string artistName;
        std::vector<AtomicRole> albumRoles; // unique, in order of first appearance
        std::vector<TrackRole> trackRoles;  // never contains a role already in albumRoles
        std::optional<std::string> id;

        Source getSource() const { return trackRoles.empty() ? Source::Album : Source::Mixed; }
        std::vector<AtomicRole> getAllRoles() const;
    };

    const char* roleCategoryToString(RoleCategory category);
} // namespace liner::credits
