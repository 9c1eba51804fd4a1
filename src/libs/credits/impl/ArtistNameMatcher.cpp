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

#include "credits/ArtistNameMatcher.hpp"

#include <algorithm>

#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace liner::credits
{
    namespace
    {
        std::string normalizeName(std::string_view name)
        {
            return core::stringUtils::stringToLower(core::stringUtils::stringTrim(name));
        }

        const char* matchToString(ArtistNameMatcher::Match match)
        {
            switch (match)
            {
            case ArtistNameMatcher::Match::None:
                return "none";
            case ArtistNameMatcher::Match::Exact:
                return "exact";
            case ArtistNameMatcher::Match::Contains:
                return "contains";
            case ArtistNameMatcher::Match::Partial:
                return "partial";
            }
            return "";
        }
    } // namespace

    ArtistNameMatcher::ArtistNameMatcher()
        : ArtistNameMatcher{ createDefaultCommonNames() }
    {
    }

    ArtistNameMatcher::ArtistNameMatcher(const std::vector<std::string>& commonNames)
    {
        for (const std::string& commonName : commonNames)
            _commonNames.insert(normalizeName(commonName));
    }

    ArtistNameMatcher::Match ArtistNameMatcher::match(std::string_view creditedName, std::string_view targetName) const
    {
        using namespace core::stringUtils;

        const std::string credited{ normalizeName(creditedName) };
        const std::string target{ normalizeName(targetName) };

        // short words such as "jr" are not required
        auto containsAllTargetWords{ [&] {
            const std::vector<std::string_view> words{ splitString(target, ' ') };
            return std::all_of(std::cbegin(words), std::cend(words), [&](std::string_view word) { return word.size() <= 2 || stringContainsWord(credited, word); });
        } };

        Match res{ Match::None };
        if (credited.empty() || target.empty())
            res = Match::None;
        else if (credited == target)
            res = Match::Exact;
        else if (credited.find(target) != std::string::npos && containsAllTargetWords())
            res = Match::Contains;
        else if (credited.size() >= 3
                 && target.find(credited) != std::string::npos
                 && !_commonNames.contains(credited)
                 && stringContainsWord(target, credited))
            res = Match::Partial;

        LINER_LOG_IF(CREDITS, DEBUG, res != Match::None, "Credited name '" << creditedName << "' matches '" << targetName << "' (" << matchToString(res) << ")");
        return res;
    }
} // namespace liner::credits
