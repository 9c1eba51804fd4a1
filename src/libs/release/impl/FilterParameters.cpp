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

#include "release/FilterParameters.hpp"

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace liner::release
{
    namespace
    {
        const std::initializer_list<std::string_view> defaultExcludeWords{ "compilation", "single", "Shellac", "EP", "10\"", "7\"", "Transcription", "reissue", "remastered" };
        const std::initializer_list<std::string_view> defaultAlbumKeywords{ "album", "lp" };
    } // namespace

    FilterParameters createDefaultFilterParameters()
    {
        FilterParameters params;
        params.excludeWords.assign(std::cbegin(defaultExcludeWords), std::cend(defaultExcludeWords));
        params.albumKeywords.assign(std::cbegin(defaultAlbumKeywords), std::cend(defaultAlbumKeywords));

        return params;
    }

    FilterParameters readFilterParameters(core::IConfig& config)
    {
        FilterParameters params;

        config.visitStrings("exclude-words", [&](std::string_view word) { params.excludeWords.emplace_back(word); }, defaultExcludeWords);
        config.visitStrings("album-keywords", [&](std::string_view keyword) { params.albumKeywords.emplace_back(keyword); }, defaultAlbumKeywords);
        params.excludeSlashInTitle = config.getBool("exclude-slash-in-title", false);
        params.excludeVariousArtists = config.getBool("exclude-various-artists", true);

        LINER_LOG(RELEASE, INFO, "Exclude words: " << core::stringUtils::joinStrings(params.excludeWords, ", "));
        LINER_LOG(RELEASE, INFO, "Album keywords: " << core::stringUtils::joinStrings(params.albumKeywords, ", "));
        LINER_LOG(RELEASE, INFO, "Exclude slash in title: " << std::boolalpha << params.excludeSlashInTitle << ", exclude various artists: " << params.excludeVariousArtists);

        return params;
    }
} // namespace liner::release
