/*
 * Copyright (C) 2013 Emeric Poupon
 *
 * This file is part of BLM.
 *
 * BLM is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * BLM is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with BLM.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <gtest/gtest.h>

#include "core/String.hpp"

namespace blm::core::stringUtils::tests
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
            { "a-b|c", '-', { "a", "b|c" } },
        };

        for (const TestCase& test : tests)
        {
            const std::vector<std::string_view> res{ splitString(test.input, test.delimiter) };
            EXPECT_EQ(res, test.expectedOutput) << "Input = '" << test.input << "', delim = '" << test.delimiter << "'";
        }
    }

    TEST(StringUtils, splitString_multiStringDelim)
    {
        struct TestCase
        {
            std::string_view input;
            std::vector<std::string_view> delimiters;
            std::vector<std::string_view> expectedOutput;
        };

        TestCase tests[]{
            { "", { "" }, { "" } },
            { "abc", { "b" }, { "a", "c" } },
            { "ab; cd", { "; " }, { "ab", "cd" } },
            { "ab;/cd", { "/", ";" }, { "ab", "", "cd" } },
            { "ab/cd/ef", { "/", "cd" }, { "ab", "", "", "ef" } },
        };

        for (const TestCase& test : tests)
        {
            const std::vector<std::string_view> res{ splitString(test.input, test.delimiters) };
            EXPECT_EQ(res, test.expectedOutput) << "Input = '" << test.input << "'";
        }
    }

    TEST(StringUtils, joinStrings)
    {
        const std::vector<std::string> strings{ "Ozzy", "Primus" };
        EXPECT_EQ(joinStrings(strings, "; "), "Ozzy; Primus");
        EXPECT_EQ(joinStrings(std::vector<std::string>{}, "; "), "");
        EXPECT_EQ(joinStrings(std::vector<std::string>{ "Single" }, "; "), "Single");
    }

    TEST(StringUtils, escapeAndSplitStrings)
    {
        struct TestCase
        {
            std::vector<std::string> input;
            std::string expectedJoined;
        };

        TestCase tests[]{
            { {}, "" },
            { { "a" }, "a" },
            { { "a", "b" }, "a;b" },
            { { "a;b", "c" }, "a\\;b;c" },
            { { "a\\b", "c" }, "a\\\\b;c" },
            { { "", "c" }, ";c" },
        };

        for (const TestCase& test : tests)
        {
            const std::string joined{ escapeAndJoinStrings(test.input, ';', '\\') };
            EXPECT_EQ(joined, test.expectedJoined);
            EXPECT_EQ(splitEscapedStrings(joined, ';', '\\'), test.input) << "Joined = '" << joined << "'";
        }
    }

    TEST(StringUtils, stringTrim)
    {
        EXPECT_EQ(stringTrim("  abc  "), "abc");
        EXPECT_EQ(stringTrim("\tabc\n"), "abc");
        EXPECT_EQ(stringTrim("   "), "");
        EXPECT_EQ(stringTrim(""), "");
        EXPECT_EQ(stringTrim("a b"), "a b");
    }

    TEST(StringUtils, stringToLower)
    {
        EXPECT_EQ(stringToLower("GODSMACK"), "godsmack");
        EXPECT_EQ(stringToLower("MiXeD 123"), "mixed 123");
        // non ASCII bytes are preserved
        EXPECT_EQ(stringToLower("\xC3\x89T\xC3\x89"), "\xC3\x89t\xC3\x89");
    }

    TEST(StringUtils, stringCaseInsensitiveEqual)
    {
        EXPECT_TRUE(stringCaseInsensitiveEqual("Ozzy/Primus", "OZZY/primus"));
        EXPECT_FALSE(stringCaseInsensitiveEqual("Ozzy", "Ozzy "));
        EXPECT_TRUE(stringCaseInsensitiveEqual("", ""));
    }

    TEST(StringUtils, replaceInString)
    {
        EXPECT_EQ(replaceInString("a&b&c", "&", " and "), "a and b and c");
        EXPECT_EQ(replaceInString("abc", "", "x"), "abc");
        EXPECT_EQ(replaceInString("aaa", "a", "aa"), "aaaaaa");
    }

    TEST(StringUtils, foldToAscii)
    {
        struct TestCase
        {
            std::string_view input;
            std::string_view expectedOutput;
        };

        TestCase tests[]{
            { "", "" },
            { "abc", "abc" },
            { "Beyonc\xC3\xA9", "Beyonce" },                      // é
            { "Mot\xC3\xB6rhead", "Motorhead" },                  // ö
            { "Stra\xC3\x9F" "e", "Strasse" },                    // ß
            { "\xC3\x86ther", "AEther" },                         // Æ
            { "Sigur R\xC3\xB3s", "Sigur Ros" },                  // ó
            { "\xC5\x81\xC3\xB3" "d\xC5\xBA", "Lodz" },           // Łódź
            { "Don\xE2\x80\x99t", "Don't" },                      // right single quote
            { "\xE2\x80\x9CHey\xE2\x80\x9D", "\"Hey\"" },         // double quotes
            { "Title\xE2\x80\xA6", "Title..." },                  // ellipsis
            { "A\xE2\x80\x93" "B", "A-B" },                       // en dash
            { "Cafe\xCC\x81", "Cafe" },                           // combining acute accent
            { "\xC2\xBFQui\xC3\xA9n?", "Quien?" },                // inverted question mark
            { "\xE6\x9D\xB1\xE4\xBA\xAC", "\xE6\x9D\xB1\xE4\xBA\xAC" }, // CJK kept
            { "bad\xFF" "byte", "bad\xFF" "byte" },
        };

        for (const TestCase& test : tests)
            EXPECT_EQ(foldToAscii(test.input), test.expectedOutput) << "Input = '" << test.input << "'";
    }

    TEST(StringUtils, collapseWhitespaces)
    {
        EXPECT_EQ(collapseWhitespaces("  a   b \t c  "), "a b c");
        EXPECT_EQ(collapseWhitespaces(""), "");
        EXPECT_EQ(collapseWhitespaces("   "), "");
        EXPECT_EQ(collapseWhitespaces("abc"), "abc");
    }

    TEST(StringUtils, readAs)
    {
        EXPECT_EQ(readAs<double>("0.85"), 0.85);
        EXPECT_EQ(readAs<int>("12"), 12);
        EXPECT_EQ(readAs<int>("12a"), std::nullopt);
        EXPECT_EQ(readAs<double>(""), std::nullopt);
        EXPECT_EQ(readAs<bool>("true"), true);
        EXPECT_EQ(readAs<bool>("0"), false);
        EXPECT_EQ(readAs<bool>("maybe"), std::nullopt);
        EXPECT_EQ(readAs<std::string>("foo"), "foo");
    }
} // namespace blm::core::stringUtils::tests
