/*
 * Copyright (C) 2020 Emeric Poupon
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

#include "core/String.hpp"

namespace liner::core::stringUtils::tests
{
    TEST(StringUtils, splitString_charDelim)
    {
        struct TestCase
        {
            std::string_view input;
            char delimiter;
            std::vector<std::string_view> expectedOutput;
        };

        TestCase tests[]{
            { "abc", '-', { "abc" } },
            { "", '-', { "" } },
            { "a-b-c", '-', { "a", "b", "c" } },
            { ";b;c", ';', { "", "b", "c" } },
            { "a;b; ", ';', { "a", "b", " " } },
            { ";", ';', { "", "" } },
            { ";;a;;b;;", ';', { "", "", "a", "", "b", "", "" } },
            { "lead vocals", ' ', { "lead", "vocals" } },
            { "a-b|c", '-', { "a", "b|c" } },
        };

        for (const TestCase& test : tests)
        {
            const std::vector<std::string_view> res{ splitString(test.input, test.delimiter) };
            EXPECT_EQ(res, test.expectedOutput) << "Input = '" << test.input << "', delims = '" << test.delimiter << "'";
        }
    }

    TEST(StringUtils, splitString_stringDelim)
    {
        struct TestCase
        {
            std::string_view input;
            std::string_view delimiter;
            std::vector<std::string_view> expectedOutput;
        };

        TestCase tests[]{
            { "", "", { "" } },
            { "abc", "", { "abc" } },
            { "//abc//", "//", { "", "abc", "" } },
            { "ab / cd", " / ", { "ab", "cd" } },
            { "ab/cd", " / ", { "ab/cd" } },
        };

        for (const TestCase& test : tests)
        {
            const std::vector<std::string_view> res{ splitString(test.input, test.delimiter) };
            EXPECT_EQ(res, test.expectedOutput) << "Input = '" << test.input << "', delim = '" << test.delimiter << "'";
        }
    }

    TEST(StringUtils, joinStrings)
    {
        const std::vector<std::string> names{ "Miles Davis", "John Coltrane" };
        EXPECT_EQ(joinStrings(names, " & "), "Miles Davis & John Coltrane");
        EXPECT_EQ(joinStrings(std::span<const std::string>{}, ", "), "");

        const std::vector<std::string_view> roles{ "Piano" };
        EXPECT_EQ(joinStrings(roles, ", "), "Piano");
    }

    TEST(StringUtils, stringTrim)
    {
        struct TestCase
        {
            std::string_view input;
            std::string_view expectedOutput;
        } tests[]{
            { "", "" },
            { " ", "" },
            { "a", "a" },
            { " a ", "a" },
            { "\t Written-By \r\n", "Written-By" },
            { "Prophet V ", "Prophet V" },
            { "a b", "a b" },
        };

        for (const TestCase& test : tests)
            EXPECT_EQ(stringTrim(test.input), test.expectedOutput) << "Input = '" << test.input << "'";
    }

    TEST(StringUtils, stringToLower)
    {
        EXPECT_EQ(stringToLower("Tenor SAXOPHONE"), "tenor saxophone");
        EXPECT_EQ(stringToLower(""), "");

        std::string str{ "Mixed By" };
        stringToLower(str);
        EXPECT_EQ(str, "mixed by");
    }

    TEST(StringUtils, caseInsensitive)
    {
        EXPECT_TRUE(stringCaseInsensitiveEqual("Various", "VARIOUS"));
        EXPECT_FALSE(stringCaseInsensitiveEqual("Various", "Various Artists"));

        EXPECT_TRUE(stringCaseInsensitiveContains("Various Artists", "various"));
        EXPECT_TRUE(stringCaseInsensitiveContains("LP, Album", "album"));
        EXPECT_TRUE(stringCaseInsensitiveContains("abc", ""));
        EXPECT_FALSE(stringCaseInsensitiveContains("Vinyl", "CD"));
        EXPECT_FALSE(stringCaseInsensitiveContains("", "a"));
    }

    TEST(StringUtils, startsEndsWith)
    {
        EXPECT_TRUE(stringStartsWith("lead vocals", "lead "));
        EXPECT_FALSE(stringStartsWith("lead", "lead vocals"));
        EXPECT_TRUE(stringStartsWith("lead", ""));

        EXPECT_TRUE(stringEndsWith("electric guitar", " guitar"));
        EXPECT_FALSE(stringEndsWith("guitar", "electric guitar"));
    }

    TEST(StringUtils, stringContainsWord)
    {
        struct TestCase
        {
            std::string_view str;
            std::string_view word;
            bool expected;
        } tests[]{
            { "john coltrane quartet", "coltrane", true },
            { "john coltrane quartet", "john", true },
            { "john coltrane quartet", "quartet", true },
            { "john coltrane quartet", "colt", false },
            { "johnny", "john", false },
            { "bassoon", "bass", false },
            { "bass, guitar", "bass", true },
            { "lead-vocals", "vocals", true },
            { "dr. john", "dr.", true },
            { "dr.john", "dr.", false },
            { "", "a", false },
            { "a", "", false },
            { "abc abc", "abc", true },
            { "xabc abc", "abc", true },
        };

        for (const TestCase& test : tests)
            EXPECT_EQ(stringContainsWord(test.str, test.word), test.expected) << "str = '" << test.str << "', word = '" << test.word << "'";
    }

    TEST(StringUtils, readAs)
    {
        EXPECT_EQ(readAs<int>("1972"), 1972);
        EXPECT_EQ(readAs<int>("abc"), std::nullopt);
        EXPECT_EQ(readAs<std::string>("Trumpet"), "Trumpet");
        EXPECT_EQ(readAs<bool>("true"), true);
        EXPECT_EQ(readAs<bool>("0"), false);
        EXPECT_EQ(readAs<bool>("maybe"), std::nullopt);
    }
} // namespace liner::core::stringUtils::tests
