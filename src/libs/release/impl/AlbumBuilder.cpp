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

#include "release/AlbumBuilder.hpp"

#include <algorithm>
#include <regex>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "credits/CreditConsolidator.hpp"

namespace liner::release
{
    namespace
    {
        std::vector<ReleaseArtist> buildArtists(const std::vector<ReleaseArtist>& artists)
        {
            if (artists.empty())
                return { ReleaseArtist{ std::string{ AlbumBuilder::unknownArtistName }, std::string{ AlbumBuilder::defaultArtistRole }, std::nullopt } };

            std::vector<ReleaseArtist> res;
            res.reserve(artists.size());
            for (const ReleaseArtist& artist : artists)
            {
                ReleaseArtist& newArtist{ res.emplace_back(artist) };
                if (newArtist.name.empty())
                    newArtist.name = AlbumBuilder::unknownArtistName;
                if (newArtist.role.empty())
                    newArtist.role = AlbumBuilder::defaultArtistRole;
            }

            return res;
        }

        std::string buildMainArtist(const std::vector<ReleaseArtist>& artists)
        {
            std::vector<std::string_view> names;
            for (const ReleaseArtist& artist : artists)
                names.push_back(artist.name);

            return core::stringUtils::joinStrings(names, " & ");
        }

        std::vector<Track> buildTracklist(const std::vector<RawTrack>& tracklist)
        {
            std::vector<Track> res;
            res.reserve(tracklist.size());

            for (std::size_t i{}; i < tracklist.size(); ++i)
            {
                const RawTrack& rawTrack{ tracklist[i] };

                Track& track{ res.emplace_back() };
                track.position = !rawTrack.position.empty() ? rawTrack.position : std::to_string(i + 1);
                track.title = !rawTrack.title.empty() ? rawTrack.title : "Track " + std::to_string(i + 1);
                track.duration = rawTrack.duration;
                track.type = !rawTrack.type.empty() ? rawTrack.type : std::string{ AlbumBuilder::defaultTrackType };
            }

            return res;
        }
    } // namespace

    AlbumBuilder::AlbumBuilder(const credits::CreditConsolidator& creditConsolidator)
        : _creditConsolidator{ creditConsolidator }
    {
    }

    Album AlbumBuilder::build(const RawRelease& release) const
    {
        Album album;

        album.id = release.id;
        album.title = !release.title.empty() ? release.title : std::string{ unknownTitle };
        album.year = extractYearFromTitle(release.title, release.year);
        album.artists = buildArtists(release.artists);
        album.mainArtist = buildMainArtist(album.artists);
        album.mainRole = album.artists.front().role;
        album.type = release.masterId ? AlbumType::Master : AlbumType::Release;
        album.genres = release.genres;
        album.styles = release.styles;
        album.formats = release.formats;
        album.tracklist = buildTracklist(release.tracklist);

        std::vector<credits::TrackCredit> trackCredits;
        for (std::size_t i{}; i < release.tracklist.size(); ++i)
        {
            const credits::TrackReference trackRef{ album.tracklist[i].title, album.tracklist[i].position };
            for (const credits::RawCredit& credit : release.tracklist[i].extraArtists)
                trackCredits.push_back(credits::TrackCredit{ trackRef, credit });
        }
        album.credits = _creditConsolidator.consolidate(release.extraArtists, trackCredits, static_cast<int>(album.tracklist.size()));

        return album;
    }

    std::optional<int> extractYearFromTitle(std::string_view title, std::optional<int> year)
    {
        static const std::regex yearRegex{ R"(\b(19[0-9]{2}|20[0-2][0-9])\b)" };

        std::optional<int> earliestTitleYear;
        for (auto it{ std::regex_iterator<std::string_view::const_iterator>{ std::cbegin(title), std::cend(title), yearRegex } }; it != std::regex_iterator<std::string_view::const_iterator>{}; ++it)
        {
            const std::optional<int> titleYear{ core::stringUtils::readAs<int>((*it)[1].str()) };
            if (!titleYear || *titleYear < 1900 || *titleYear > 2025)
                continue;

            if (!earliestTitleYear || *titleYear < *earliestTitleYear)
                earliestTitleYear = titleYear;
        }

        if (year && *year > 2010 && earliestTitleYear && *earliestTitleYear < 2000)
        {
            LINER_LOG(RELEASE, DEBUG, "Using year " << *earliestTitleYear << " from title '" << title << "' instead of " << *year);
            return earliestTitleYear;
        }

        return year;
    }

    bool validateAlbum(const Album& album)
    {
        auto reportMissing{ [&](std::string_view field) {
            LINER_LOG(RELEASE, WARNING, "Album '" << album.id << "' ('" << album.title << "') is missing field '" << field << "'");
            return false;
        } };

        if (album.id.empty())
            return reportMissing("id");
        if (album.title.empty())
            return reportMissing("title");
        if (album.mainArtist.empty())
            return reportMissing("artist");
        if (!album.year || *album.year == 0)
            return reportMissing("year");

        return true;
    }

    const char* albumTypeToString(AlbumType type)
    {
        switch (type)
        {
        case AlbumType::Release:
            return "release";
        case AlbumType::Master:
            return "master";
        }

        return "";
    }
} // namespace liner::release
