/*
 * Copyright (C) 2025 Emeric Poupon
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

#include "services/matching/Normalizer.hpp"

namespace blm::matching::tests
{
    TEST(Normalizer, clean)
    {
        struct TestCase
        {
            std::string_view input;
            std::string_view expectedOutput;
        };

        constexpr TestCase tests[]{
            { "", "" },
            { "!!!", "" },
            { "GODSMACK", "godsmack" },
            { "  Godsmack  ", "godsmack" },
            { "godsmack", "godsmack" },
            { "Smells Like Teen Spirit (Remastered)", "smells like teen spirit" },
            { "Song - Remastered 2011", "song" },
            { "Song - 2011 Remaster", "song" },
            { "Voodoo (Live) feat. Someone", "voodoo" },
            { "Little Feat", "little feat" },
            { "Simon & Garfunkel", "simon and garfunkel" },
            { "AC/DC", "ac dc" },
            { "10,000 Maniacs", "10000 maniacs" },
            { "Hello...World", "hello world" },
            { "Beyoncé", "beyonce" },
            { "Don't Stop Me Now", "dont stop me now" },
            { "Song [Demo", "song" },
        };

        for (const TestCase& test : tests)
            EXPECT_EQ(normalizer::clean(test.input), test.expectedOutput) << "input = '" << test.input << "'";
    }

    TEST(Normalizer, clean_idempotent)
    {
        constexpr std::string_view inputs[]{
            "Smells Like Teen Spirit (Remastered)",
            "Voodoo (Live) feat. Someone",
            "((nested) brackets) - Live at Wembley",
            "Song - Remix (Radio Edit) [2011]",
            "a - b - c",
            "  Weird   spacing ... & + ",
            "Motörhead",
        };

        for (std::string_view input : inputs)
        {
            const std::string cleaned{ normalizer::clean(input) };
            EXPECT_EQ(normalizer::clean(cleaned), cleaned) << "input = '" << input << "'";
        }
    }

    TEST(Normalizer, cleanArtist)
    {
        EXPECT_EQ(normalizer::cleanArtist("The Beatles"), "beatles");
        EXPECT_EQ(normalizer::cleanArtist("A Perfect Circle"), "perfect circle");
        EXPECT_EQ(normalizer::cleanArtist("The"), "the");
        EXPECT_EQ(normalizer::cleanArtist("Theatre Of Tragedy"), "theatre of tragedy");
    }

    TEST(Normalizer, generateSignature)
    {
        EXPECT_EQ(normalizer::generateSignature("Nirvana", "Smells Like Teen Spirit"), "nirvana::smells like teen spirit");
        EXPECT_EQ(normalizer::generateSignature("Nirvana", "Smells Like Teen Spirit"), normalizer::generateSignature("nirvana", "smells like teen spirit (remastered)"));
        EXPECT_EQ(normalizer::generateSignature("GODSMACK", "Voodoo (Live) feat. Someone"), "godsmack::voodoo");

        EXPECT_EQ(normalizer::generateSignature("", "Voodoo"), "");
        EXPECT_EQ(normalizer::generateSignature("Godsmack", ""), "");
        EXPECT_EQ(normalizer::generateSignature("Godsmack", "(Live)"), "godsmack::live");
        EXPECT_EQ(normalizer::generateSignature("...", "Voodoo"), "");
    }

    TEST(Normalizer, splitArtists)
    {
        struct TestCase
        {
            std::string_view input;
            std::vector<std::string> expectedOutput;
        };

        const TestCase tests[]{
            { "", {} },
            { "Godsmack", { "godsmack" } },
            { "Ozzy Osbourne feat. Primus", { "ozzy osbourne", "primus" } },
            { "Ozzy/Primus", { "ozzy", "primus" } },
            { "Simon & Garfunkel", { "simon", "garfunkel" } },
            { "Crosby, Stills, Nash & Young", { "crosby", "stills", "nash", "young" } },
            { "Queen vs. David Bowie", { "queen", "david bowie" } },
            { "Jay-Z w/ Linkin Park", { "jay z", "linkin park" } },
            { "Ozzy & ozzy", { "ozzy" } },
            { "10,000 Maniacs", { "10000 maniacs" } },
        };

        for (const TestCase& test : tests)
            EXPECT_EQ(normalizer::splitArtists(test.input), test.expectedOutput) << "input = '" << test.input << "'";
    }

    TEST(Normalizer, splitArtistsUnsplittableNames)
    {
        const std::vector<std::string> unsplittableNames{ "AC/DC", "Simon & Garfunkel", "P!nk" };

        EXPECT_EQ(normalizer::splitArtists("AC/DC & Bon Jovi", unsplittableNames), (std::vector<std::string>{ "ac dc", "bon jovi" }));
        EXPECT_EQ(normalizer::splitArtists("Simon & Garfunkel feat. Paul Simon", unsplittableNames), (std::vector<std::string>{ "simon and garfunkel", "paul simon" }));
        EXPECT_EQ(normalizer::splitArtists("p!nk/Nate Ruess", unsplittableNames), (std::vector<std::string>{ "pnk", "nate ruess" }));
        // whole words only
        EXPECT_EQ(normalizer::splitArtists("XAC/DC", unsplittableNames), (std::vector<std::string>{ "xac", "dc" }));
        EXPECT_EQ(normalizer::splitArtists("AC/DC & Bon Jovi"), (std::vector<std::string>{ "ac", "dc", "bon jovi" }));
    }

    TEST(Normalizer, protectNames)
    {
        const std::vector<std::string> names{ "AC/DC", "AC" };

        std::vector<std::string> protectedTexts;
        const std::string protectedText{ normalizer::protectNames("ac/dc & AC", names, protectedTexts) };
        EXPECT_EQ(protectedText.find('/'), std::string::npos);
        ASSERT_EQ(protectedTexts.size(), 2);
        EXPECT_EQ(protectedTexts[0], "ac/dc");
        EXPECT_EQ(protectedTexts[1], "AC");
        EXPECT_EQ(normalizer::restoreNames(protectedText, protectedTexts), "ac/dc & AC");

        EXPECT_EQ(normalizer::restoreNames("no names", protectedTexts), "no names");
    }

    TEST(Normalizer, extractVersionType)
    {
        struct TestCase
        {
            std::string_view input;
            std::string_view expectedOutput;
        };

        constexpr TestCase tests[]{
            { "Voodoo", "Original" },
            { "", "Original" },
            { "Voodoo (Live)", "Live" },
            { "Song - Radio Edit", "Radio Edit" },
            { "Song (2011 Remaster)", "Remaster" },
            { "Song [Remix]", "Remix" },
            { "Song (Acoustic Version)", "Acoustic" },
            { "Song (Extended Mix)", "Extended" },
            { "Song - Edit", "Edit" },
            { "Live Forever", "Original" },
        };

        for (const TestCase& test : tests)
            EXPECT_EQ(normalizer::extractVersionType(test.input), test.expectedOutput) << "input = '" << test.input << "'";
    }

    TEST(Normalizer, toArtistTitleCase)
    {
        EXPECT_EQ(normalizer::toArtistTitleCase("ozzy"), "Ozzy");
        EXPECT_EQ(normalizer::toArtistTitleCase("GODSMACK"), "Godsmack");
        EXPECT_EQ(normalizer::toArtistTitleCase("REM"), "REM");
        EXPECT_EQ(normalizer::toArtistTitleCase("the rolling  stones"), "The Rolling Stones");
        EXPECT_EQ(normalizer::toArtistTitleCase("AND"), "And");
        EXPECT_EQ(normalizer::toArtistTitleCase("McCartney"), "McCartney");
        EXPECT_EQ(normalizer::toArtistTitleCase(""), "");
    }
} // namespace blm::matching::tests
