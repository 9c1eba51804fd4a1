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

#include <gtest/gtest.h>

#include "credits/ArtistNameMatcher.hpp"

namespace liner::credits::tests
{
    TEST(ArtistNameMatcher, match)
    {
        const ArtistNameMatcher matcher;

        using Match = ArtistNameMatcher::Match;
        struct TestCase
        {
            std::string_view creditedName;
            std::string_view targetName;
            Match expectedMatch;
        } testCases[]{
            { "John Coltrane", "John Coltrane", Match::Exact },
            { "  john coltrane ", "John Coltrane", Match::Exact },
            { "John Coltrane Quartet", "John Coltrane", Match::Contains },
            { "The Miles Davis Quintet", "Miles Davis", Match::Contains },
            { "Miles Davisson", "Miles Davis", Match::None },    // "davis" is not a whole word
            { "Coltrane", "John Coltrane", Match::Partial },
            { "John", "John Coltrane", Match::None },            // common first name
            { "Davis", "Miles Davis", Match::None },             // common surname
            { "J. Coltrane", "John Coltrane", Match::None },
            { "Jo", "John Coltrane", Match::None },              // too short
            { "Coltranes", "John Coltrane", Match::None },
            { "Trane", "John Coltrane", Match::None },           // not a whole word
            { "Herbie Hancock", "John Coltrane", Match::None },
            { "", "John Coltrane", Match::None },
            { "John Coltrane", "", Match::None },
            { "   ", "   ", Match::None },
        };

        for (const TestCase& testCase : testCases)
        {
            EXPECT_EQ(matcher.match(testCase.creditedName, testCase.targetName), testCase.expectedMatch) << " credited = '" << testCase.creditedName << "', target = '" << testCase.targetName << "'";
            EXPECT_EQ(matcher.isMatch(testCase.creditedName, testCase.targetName), testCase.expectedMatch != Match::None) << " credited = '" << testCase.creditedName << "', target = '" << testCase.targetName << "'";
        }
    }

    TEST(ArtistNameMatcher, shortWordsNotRequired)
    {
        const ArtistNameMatcher matcher;

        // "jr" is too short to be checked as a whole word
        EXPECT_EQ(matcher.match("Harry Connick Jr.", "Harry Connick Jr"), ArtistNameMatcher::Match::Contains);
    }

    TEST(ArtistNameMatcher, customCommonNames)
    {
        const ArtistNameMatcher noCommonNames{ std::vector<std::string>{} };
        EXPECT_EQ(noCommonNames.match("John", "John Coltrane"), ArtistNameMatcher::Match::Partial);

        const ArtistNameMatcher matcher{ std::vector<std::string>{ "Coltrane" } };
        EXPECT_EQ(matcher.match("Coltrane", "John Coltrane"), ArtistNameMatcher::Match::None);
        EXPECT_EQ(matcher.match("John", "John Coltrane"), ArtistNameMatcher::Match::Partial);
    }
} // namespace liner::credits::tests
