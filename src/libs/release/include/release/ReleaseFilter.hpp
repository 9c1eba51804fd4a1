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
#include <string_view>

#include "release/FilterParameters.hpp"
#include "release/Types.hpp"

namespace liner::credits
{
    class ArtistNameMatcher;
    class PerformanceRoleClassifier;
} // namespace liner::credits

namespace liner::release
{
    enum class FilterCheck
    {
        ExcludedFormat,
        SlashInTitle,
        MissingAlbumFormat,
        InvalidYear,
        VariousArtists,
        TargetArtistNotCredited,
        TargetArtistNotPerforming,
    };
    const char* filterCheckToString(FilterCheck check);

    struct FilterDecision
    {
        struct Rejection
        {
            FilterCheck check;
            std::string reason; // diagnostic only
        };

        std::optional<Rejection> rejection;

        bool isIncluded() const { return !rejection.has_value(); }
    };

    // Checks, in this order, first failure rejects the release:
    //  - no format field contains an exclude word
    //  - no slash in title (optional)
    //  - a format field contains an album keyword, or the format name is a common physical/digital format
    //  - year is set and positive
    //  - primary artist is not "Various" (optional)
    //  - target artist, if any, is credited with at least one performance role
    class ReleaseFilter
    {
    public:
        ReleaseFilter(FilterParameters parameters, const credits::ArtistNameMatcher& artistNameMatcher, const credits::PerformanceRoleClassifier& performanceRoleClassifier);

        FilterDecision shouldInclude(const RawRelease& release, std::string_view targetArtist = {}) const;

        const FilterParameters& getParameters() const { return _parameters; }

    private:
        std::optional<FilterDecision::Rejection> checkFormats(const RawRelease& release) const;
        std::optional<FilterDecision::Rejection> checkTitle(const RawRelease& release) const;
        std::optional<FilterDecision::Rejection> checkAlbumFormat(const RawRelease& release) const;
        std::optional<FilterDecision::Rejection> checkYear(const RawRelease& release) const;
        std::optional<FilterDecision::Rejection> checkVariousArtists(const RawRelease& release) const;
        std::optional<FilterDecision::Rejection> checkTargetArtist(const RawRelease& release, std::string_view targetArtist) const;

        const FilterParameters _parameters;
        const credits::ArtistNameMatcher& _artistNameMatcher;
        const credits::PerformanceRoleClassifier& _performanceRoleClassifier;
    };
} // namespace liner::release
