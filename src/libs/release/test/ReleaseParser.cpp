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

#include <optional>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "release/Exception.hpp"
#include "release/ReleaseParser.hpp"

namespace liner::release::tests
{
    TEST(ReleaseParser, discogsRelease)
    {
        constexpr std::string_view json{ R"({
            "id": 1234,
            "title": "Kind Of Blue",
            "year": 1959,
            "master_id": 5460,
            "genres": ["Jazz"],
            "styles": ["Modal", 3],
            "formats": [{ "name": "Vinyl", "qty": "1", "descriptions": ["LP", "Album", "Mono"] }],
            "artists": [{ "name": "Miles Davis", "role": "", "id": 23755 }],
            "extraartists": [
                { "name": "Bill Evans", "role": "Piano", "id": 1 },
                { "name": "Irving Townsend", "role": "Producer" }
            ],
            "tracklist": [
                { "position": "A1", "title": "So What", "duration": "9:22", "type_": "track", "extraartists": [{ "name": "Paul Chambers", "role": "Bass" }] },
                { "position": "A2", "title": "Freddie Freeloader", "duration": "9:46", "type_": "track" }
            ]
        })" };

        const RawRelease release{ parseRelease(json) };

        EXPECT_EQ(release.id, "1234");
        EXPECT_EQ(release.title, "Kind Of Blue");
        EXPECT_EQ(release.year, 1959);
        EXPECT_EQ(release.masterId, "5460");
        EXPECT_EQ(release.genres, (std::vector<std::string>{ "Jazz" }));
        EXPECT_EQ(release.styles, (std::vector<std::string>{ "Modal" }));

        ASSERT_EQ(release.formats.size(), 1);
        const Format& format{ release.formats.front() };
        EXPECT_EQ(format.size(), 3);
        EXPECT_EQ(format.at("name"), FormatValue{ "Vinyl" });
        EXPECT_EQ(format.at("qty"), FormatValue{ "1" });
        EXPECT_EQ(format.at("descriptions"), (FormatValue{ std::vector<std::string>{ "LP", "Album", "Mono" } }));

        ASSERT_EQ(release.artists.size(), 1);
        EXPECT_EQ(release.artists[0], (ReleaseArtist{ "Miles Davis", "", "23755" }));

        ASSERT_EQ(release.extraArtists.size(), 2);
        EXPECT_EQ(release.extraArtists[0], (credits::RawCredit{ "Bill Evans", "Piano", "1" }));
        EXPECT_EQ(release.extraArtists[1], (credits::RawCredit{ "Irving Townsend", "Producer", std::nullopt }));

        ASSERT_EQ(release.tracklist.size(), 2);
        EXPECT_EQ(release.tracklist[0].position, "A1");
        EXPECT_EQ(release.tracklist[0].title, "So What");
        EXPECT_EQ(release.tracklist[0].duration, "9:22");
        EXPECT_EQ(release.tracklist[0].type, "track");
        ASSERT_EQ(release.tracklist[0].extraArtists.size(), 1);
        EXPECT_EQ(release.tracklist[0].extraArtists[0], (credits::RawCredit{ "Paul Chambers", "Bass", std::nullopt }));
        EXPECT_EQ(release.tracklist[1].title, "Freddie Freeloader");
        EXPECT_TRUE(release.tracklist[1].extraArtists.empty());
    }

    TEST(ReleaseParser, malformedFields)
    {
        constexpr std::string_view json{ R"({
            "title": 42,
            "year": "1972",
            "master_id": null,
            "genres": "Jazz",
            "formats": [1, { "name": "CD", "qty": 2, "misc": { "a": "b" } }],
            "artists": [{ "name": ["Miles Davis"] }],
            "tracklist": "nope"
        })" };

        const RawRelease release{ parseRelease(json) };

        EXPECT_EQ(release.id, "");
        EXPECT_EQ(release.title, "");
        EXPECT_EQ(release.year, 1972);
        EXPECT_FALSE(release.masterId);
        EXPECT_TRUE(release.genres.empty());
        ASSERT_EQ(release.formats.size(), 1);
        EXPECT_EQ(release.formats[0].size(), 2);
        EXPECT_EQ(release.formats[0].at("qty"), FormatValue{ "2" });
        ASSERT_EQ(release.artists.size(), 1);
        EXPECT_EQ(release.artists[0].name, "");
        EXPECT_TRUE(release.tracklist.empty());
    }

    TEST(ReleaseParser, year)
    {
        struct TestCase
        {
            std::string_view json;
            std::optional<int> expectedYear;
        } testCases[]{
            { R"({ "year": 1959 })", 1959 },
            { R"({ "year": "1959" })", 1959 },
            { R"({ "year": 0 })", 0 },
            { R"({ "year": "" })", std::nullopt },
            { R"({ "year": "unknown" })", std::nullopt },
            { R"({ "year": null })", std::nullopt },
            { R"({})", std::nullopt },
            { R"({ "year": 1e30 })", std::nullopt },
            { R"({ "year": -1e30 })", std::nullopt },
            { R"({ "year": 3000000000 })", std::nullopt },
        };

        for (const TestCase& testCase : testCases)
            EXPECT_EQ(parseRelease(testCase.json).year, testCase.expectedYear) << " json = '" << testCase.json << "'";
    }

    TEST(ReleaseParser, numericIds)
    {
        struct TestCase
        {
            std::string_view json;
            std::optional<std::string> expectedMasterId;
        } testCases[]{
            { R"({ "master_id": 5460 })", "5460" },
            { R"({ "master_id": -3 })", "-3" },
            { R"({ "master_id": "m5460" })", "m5460" },
            { R"({ "master_id": "" })", std::nullopt },
            { R"({ "master_id": 9007199254740992 })", "9007199254740992" },
        };

        for (const TestCase& testCase : testCases)
            EXPECT_EQ(parseRelease(testCase.json).masterId, testCase.expectedMasterId) << " json = '" << testCase.json << "'";

        // out of integer range: degrades to a non integral representation
        for (std::string_view json : { R"({ "id": 1e30, "master_id": -1e300 })", R"({ "id": 12.5, "master_id": 1e19 })" })
        {
            RawRelease release;
            EXPECT_NO_THROW(release = parseRelease(json)) << " json = '" << json << "'";
            EXPECT_FALSE(release.id.empty());
            EXPECT_TRUE(release.masterId.has_value());
        }
    }

    TEST(ReleaseParser, invalidDocuments)
    {
        for (std::string_view json : { "", "{", "[1, 2]", "\"release\"", "{ \"title\": }" })
            EXPECT_THROW(parseRelease(json), ReleaseParsingException) << " json = '" << json << "'";
    }

    TEST(ReleaseParser, stream)
    {
        std::istringstream iss{ R"({ "id": "r42", "title": "Giant Steps" })" };

        const RawRelease release{ parseRelease(iss) };
        EXPECT_EQ(release.id, "r42");
        EXPECT_EQ(release.title, "Giant Steps");
    }
} // namespace liner::release::tests
