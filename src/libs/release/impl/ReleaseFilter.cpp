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

#include "release/ReleaseFilter.hpp"

#include <algorithm>
#include <array>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "credits/ArtistNameMatcher.hpp"
#include "credits/PerformanceRoleClassifier.hpp"
#include "credits/RoleTokenizer.hpp"

namespace liner::release
{
    namespace
    {
        template<typename Visitor>
        void visitFormatValues(const Format& format, Visitor&& visitor)
        {
            for (const auto& [field, value] : format)
            {
                if (const std::string* str{ std::get_if<std::string>(&value) })
                {
                    visitor(*str);
                }
                else if (const std::vector<std::string>* strs{ std::get_if<std::vector<std::string>>(&value) })
                {
                    for (const std::string& item : *strs)
                        visitor(item);
                }
            }
        }

        // returns the first word contained in one of the format values, along with the value
        std::optional<std::pair<std::string, std::string>> findWordInFormats(const std::vector<Format>& formats, const std::vector<std::string>& words)
        {
            std::optional<std::pair<std::string, std::string>> res;

            for (const Format& format : formats)
            {
                visitFormatValues(format, [&](const std::string& value) {
                    if (res)
                        return;

                    auto itWord{ std::find_if(std::cbegin(words), std::cend(words), [&](const std::string& word) { return !word.empty() && core::stringUtils::stringCaseInsensitiveContains(value, word); }) };
                    if (itWord != std::cend(words))
                        res.emplace(*itWord, value);
                });

                if (res)
                    break;
            }

            return res;
        }

        bool isCommonFormatName(const Format& format)
        {
            auto itName{ format.find("name") };
            if (itName == std::cend(format))
                return false;

            const std::string* name{ std::get_if<std::string>(&itName->second) };
            if (!name)
                return false;

            constexpr std::array<std::string_view, 4> commonFormatNames{ "vinyl", "cd", "cassette", "digital" };
            return std::any_of(std::cbegin(commonFormatNames), std::cend(commonFormatNames), [&](std::string_view formatName) {
                return core::stringUtils::stringCaseInsensitiveContains(*name, formatName);
            });
        }

        FilterDecision::Rejection makeRejection(FilterCheck check, std::string reason)
        {
            return FilterDecision::Rejection{ check, std::move(reason) };
        }
    } // namespace

    ReleaseFilter::ReleaseFilter(FilterParameters parameters, const credits::ArtistNameMatcher& artistNameMatcher, const credits::PerformanceRoleClassifier& performanceRoleClassifier)
        : _parameters{ std::move(parameters) }
        , _artistNameMatcher{ artistNameMatcher }
        , _performanceRoleClassifier{ performanceRoleClassifier }
    {
    }

    FilterDecision ReleaseFilter::shouldInclude(const RawRelease& release, std::string_view targetArtist) const
    {
        FilterDecision decision;

        decision.rejection = checkFormats(release);
        if (!decision.rejection)
            decision.rejection = checkTitle(release);
        if (!decision.rejection)
            decision.rejection = checkAlbumFormat(release);
        if (!decision.rejection)
            decision.rejection = checkYear(release);
        if (!decision.rejection)
            decision.rejection = checkVariousArtists(release);
        if (!decision.rejection && !core::stringUtils::stringTrim(targetArtist).empty())
            decision.rejection = checkTargetArtist(release, targetArtist);

        if (decision.rejection)
            LINER_LOG(RELEASE, DEBUG, "Release '" << release.id << "' ('" << release.title << "') rejected: " << filterCheckToString(decision.rejection->check) << ": " << decision.rejection->reason);
        else
            LINER_LOG(RELEASE, DEBUG, "Release '" << release.id << "' ('" << release.title << "') accepted");

        return decision;
    }

    std::optional<FilterDecision::Rejection> ReleaseFilter::checkFormats(const RawRelease& release) const
    {
        if (const auto found{ findWordInFormats(release.formats, _parameters.excludeWords) })
            return makeRejection(FilterCheck::ExcludedFormat, "format '" + found->second + "' contains excluded word '" + found->first + "'");

        return std::nullopt;
    }

    std::optional<FilterDecision::Rejection> ReleaseFilter::checkTitle(const RawRelease& release) const
    {
        if (_parameters.excludeSlashInTitle && release.title.find('/') != std::string::npos)
            return makeRejection(FilterCheck::SlashInTitle, "title '" + release.title + "' contains a slash");

        return std::nullopt;
    }

    std::optional<FilterDecision::Rejection> ReleaseFilter::checkAlbumFormat(const RawRelease& release) const
    {
        if (findWordInFormats(release.formats, _parameters.albumKeywords))
            return std::nullopt;

        if (std::any_of(std::cbegin(release.formats), std::cend(release.formats), isCommonFormatName))
            return std::nullopt;

        return makeRejection(FilterCheck::MissingAlbumFormat, "no album format found");
    }

    std::optional<FilterDecision::Rejection> ReleaseFilter::checkYear(const RawRelease& release) const
    {
        if (!release.year)
            return makeRejection(FilterCheck::InvalidYear, "no year");
        if (*release.year <= 0)
            return makeRejection(FilterCheck::InvalidYear, "invalid year " + std::to_string(*release.year));

        return std::nullopt;
    }

    std::optional<FilterDecision::Rejection> ReleaseFilter::checkVariousArtists(const RawRelease& release) const
    {
        if (!_parameters.excludeVariousArtists || release.artists.empty())
            return std::nullopt;

        const std::string& artistName{ release.artists.front().name };
        if (core::stringUtils::stringCaseInsensitiveContains(artistName, "various"))
            return makeRejection(FilterCheck::VariousArtists, "primary artist is '" + artistName + "'");

        return std::nullopt;
    }

    std::optional<FilterDecision::Rejection> ReleaseFilter::checkTargetArtist(const RawRelease& release, std::string_view targetArtist) const
    {
        std::size_t matchingCreditCount{};
        std::vector<std::string> rejectedRoles;

        auto isPerformingCredit{ [&](const credits::RawCredit& credit) {
            if (!_artistNameMatcher.isMatch(credit.artistName, targetArtist))
                return false;

            matchingCreditCount++;

            // excluded or compositional anywhere in the role text rejects the whole credit
            switch (_performanceRoleClassifier.classify(credit.roleText))
            {
            case credits::PerformanceRoleClassifier::Verdict::Excluded:
            case credits::PerformanceRoleClassifier::Verdict::Compositional:
                rejectedRoles.push_back(credit.roleText);
                return false;

            case credits::PerformanceRoleClassifier::Verdict::Performance:
                LINER_LOG(RELEASE, DEBUG, "'" << targetArtist << "' credited as '" << credit.artistName << "' performs '" << credit.roleText << "'");
                return true;

            case credits::PerformanceRoleClassifier::Verdict::Unrecognized:
                break;
            }

            for (const credits::AtomicRole& role : credits::tokenizeRoles(credit.roleText))
            {
                if (_performanceRoleClassifier.isPerformanceRole(role))
                {
                    LINER_LOG(RELEASE, DEBUG, "'" << targetArtist << "' credited as '" << credit.artistName << "' performs '" << role << "'");
                    return true;
                }
                rejectedRoles.push_back(role);
            }
            return false;
        } };

        if (std::any_of(std::cbegin(release.extraArtists), std::cend(release.extraArtists), isPerformingCredit))
            return std::nullopt;

        for (const RawTrack& track : release.tracklist)
        {
            if (std::any_of(std::cbegin(track.extraArtists), std::cend(track.extraArtists), isPerformingCredit))
                return std::nullopt;
        }

        if (matchingCreditCount == 0)
            return makeRejection(FilterCheck::TargetArtistNotCredited, "'" + std::string{ targetArtist } + "' not found in credits");

        return makeRejection(FilterCheck::TargetArtistNotPerforming, "'" + std::string{ targetArtist } + "' has no performance role (" + core::stringUtils::joinStrings(rejectedRoles, ", ") + ")");
    }

    const char* filterCheckToString(FilterCheck check)
    {
        switch (check)
        {
        case FilterCheck::ExcludedFormat:
            return "excluded format";
        case FilterCheck::SlashInTitle:
            return "slash in title";
        case FilterCheck::MissingAlbumFormat:
            return "missing album format";
        case FilterCheck::InvalidYear:
            return "invalid year";
        case FilterCheck::VariousArtists:
            return "various artists";
        case FilterCheck::TargetArtistNotCredited:
            return "target artist not credited";
        case FilterCheck::TargetArtistNotPerforming:
            return "target artist not performing";
        }

        return "";
    }
} // namespace liner::release
