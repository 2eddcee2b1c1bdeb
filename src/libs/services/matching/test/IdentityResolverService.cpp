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

#include <thread>

#include "Common.hpp"

#include "database/objects/ArtistAlias.hpp"
#include "database/objects/ProposedSplit.hpp"
#include "services/matching/Exception.hpp"

namespace blm::matching::tests
{
    using IdentityResolverServiceTest = MatchingFixture;

    TEST_F(IdentityResolverServiceTest, detectSplit)
    {
        const auto resolver{ createResolver() };

        struct TestCase
        {
            std::string_view input;
            std::optional<std::vector<std::string>> expectedOutput;
        };

        const TestCase tests[]{
            { "", std::nullopt },
            { "Godsmack", std::nullopt },
            { "Ozzy/Primus", std::vector<std::string>{ "Ozzy", "Primus" } },
            { "Ozzy Osbourne feat. Primus", std::vector<std::string>{ "Ozzy Osbourne", "Primus" } },
            { "Jay-Z w/ Linkin Park", std::vector<std::string>{ "Jay-Z", "Linkin Park" } },
            { "Queen and David Bowie", std::vector<std::string>{ "Queen", "David Bowie" } },
            { "eminem ft. RIHANNA", std::vector<std::string>{ "Eminem", "Rihanna" } },
            { "Ozzy & ozzy", std::nullopt },
            { "AC/DC", std::nullopt },
            { "ac/dc", std::nullopt },
            { "Simon & Garfunkel", std::nullopt },
            { "Earth, Wind & Fire", std::nullopt },
            // first separator in priority order wins
            { "Tom Petty & The Heartbreakers w/ Stevie Nicks", std::vector<std::string>{ "Tom Petty & The Heartbreakers", "Stevie Nicks" } },
            { "Ozzy & Primus / Slash", std::vector<std::string>{ "Ozzy", "Primus / Slash" } },
            // known names inside a longer credit
            { "AC/DC feat. Axl Rose", std::vector<std::string>{ "AC/DC", "Axl Rose" } },
            { "ac/dc & Bon Jovi", std::vector<std::string>{ "AC/DC", "Bon Jovi" } },
            { "Simon & Garfunkel/Paul Simon", std::vector<std::string>{ "Simon & Garfunkel", "Paul Simon" } },
        };

        for (const TestCase& test : tests)
            EXPECT_EQ(resolver->detectSplit(test.input), test.expectedOutput) << "input = '" << test.input << "'";

        auto transaction{ session.createReadTransaction() };
        EXPECT_EQ(db::ProposedSplit::getCount(session), 0);
    }

    TEST_F(IdentityResolverServiceTest, customSplitExceptions)
    {
        const std::vector<std::string> splitExceptions{ "Hootie & The Blowfish", "  " };
        const auto resolver{ createIdentityResolverService(tmpDb.getDb(), splitExceptions) };

        EXPECT_FALSE(resolver->detectSplit("hootie & the blowfish"));
        // not part of the configured list
        EXPECT_TRUE(resolver->detectSplit("AC/DC"));
    }

    TEST_F(IdentityResolverServiceTest, resolveBatch_proposesSplitOnce)
    {
        const auto resolver{ createResolver() };

        const std::vector<std::string> rawArtists{ "Ozzy/Primus", "Godsmack", "Ozzy/Primus" };
        for (int i{}; i < 2; ++i)
        {
            const std::map<std::string, std::string> resolved{ resolver->resolveBatch(rawArtists) };
            ASSERT_EQ(resolved.size(), 2);
            EXPECT_EQ(resolved.at("Ozzy/Primus"), "Ozzy; Primus");
            EXPECT_EQ(resolved.at("Godsmack"), "Godsmack");
        }

        const std::vector<SplitProposal> splits{ resolver->findSplits(db::ProposedSplitStatus::Pending) };
        ASSERT_EQ(splits.size(), 1);
        EXPECT_EQ(splits[0].rawArtist, "Ozzy/Primus");
        EXPECT_EQ(splits[0].artists, (std::vector<std::string>{ "Ozzy", "Primus" }));
        EXPECT_DOUBLE_EQ(splits[0].confidence, 0.95);

        EXPECT_TRUE(resolver->resolveBatch({}).empty());
    }

    TEST_F(IdentityResolverServiceTest, resolveBatch_concurrent)
    {
        const auto resolver{ createResolver() };

        std::vector<std::thread> threads;
        for (int i{}; i < 4; ++i)
        {
            threads.emplace_back([&] {
                const std::vector<std::string> rawArtists{ "Ozzy/Primus" };
                const std::map<std::string, std::string> resolved{ resolver->resolveBatch(rawArtists) };
                EXPECT_EQ(resolved.at("Ozzy/Primus"), "Ozzy; Primus");
            });
        }
        for (std::thread& thread : threads)
            thread.join();

        auto transaction{ session.createReadTransaction() };
        EXPECT_EQ(db::ProposedSplit::getCount(session), 1);
    }

    TEST_F(IdentityResolverServiceTest, resolveBatch_twoConnectionPools)
    {
        // separate writer locks: proposals of the same raw artist collide in sqlite
        const std::unique_ptr<db::IDb> otherDb{ tmpDb.createOtherDb() };
        const auto resolver{ createResolver() };
        const auto otherResolver{ createResolver(*otherDb) };

        constexpr std::size_t artistCount{ 50 };
        const auto resolveAll{ [&](IIdentityResolverService& identityResolver) {
            for (std::size_t i{}; i < artistCount; ++i)
            {
                const std::string index{ std::to_string(i) };
                const std::vector<std::string> rawArtists{ "Ozzy " + index + "/Primus " + index };
                const std::map<std::string, std::string> resolved{ identityResolver.resolveBatch(rawArtists) };
                EXPECT_EQ(resolved.at(rawArtists.front()), "Ozzy " + index + "; Primus " + index);
            }
        } };

        std::thread thread{ [&] { resolveAll(*otherResolver); } };
        resolveAll(*resolver);
        thread.join();

        auto transaction{ session.createReadTransaction() };
        EXPECT_EQ(db::ProposedSplit::getCount(session), artistCount);
    }

    TEST_F(IdentityResolverServiceTest, aliases)
    {
        const auto resolver{ createResolver() };

        resolver->addAlias("Puff Daddy", "Diddy", true);
        resolver->markNoAlias("Tom & Jerry");

        const std::vector<std::string> rawArtists{ "puff daddy", "Tom & Jerry", "Godsmack" };
        const std::map<std::string, std::string> resolved{ resolver->resolveBatch(rawArtists) };
        EXPECT_EQ(resolved.at("puff daddy"), "Diddy");
        EXPECT_EQ(resolved.at("Tom & Jerry"), "Tom & Jerry");
        EXPECT_EQ(resolved.at("Godsmack"), "Godsmack");

        // upsert
        resolver->addAlias("PUFF DADDY", "P. Diddy", false);
        {
            auto transaction{ session.createReadTransaction() };

            EXPECT_EQ(db::ArtistAlias::getCount(session), 2);
            EXPECT_EQ(db::ProposedSplit::getCount(session), 0);

            const db::ArtistAlias::pointer alias{ db::ArtistAlias::find(session, "Puff Daddy") };
            ASSERT_TRUE(alias);
            EXPECT_EQ(alias->getResolvedName(), "P. Diddy");
            EXPECT_FALSE(alias->isVerified());
        }

        EXPECT_THROW(resolver->addAlias("", "Diddy", true), Exception);
        EXPECT_THROW(resolver->addAlias("Puff Daddy", " ", true), Exception);
        EXPECT_THROW(resolver->markNoAlias(""), Exception);
    }

    TEST_F(IdentityResolverServiceTest, approveSplit)
    {
        const auto resolver{ createResolver() };

        EXPECT_FALSE(resolver->approveSplit("Ozzy/Primus"));

        const std::vector<std::string> rawArtists{ "Ozzy/Primus" };
        resolver->resolveBatch(rawArtists);

        const std::vector<std::string> names{ "Ozzy Osbourne", " Primus " };
        EXPECT_TRUE(resolver->updateSplit("Ozzy/Primus", names));
        EXPECT_TRUE(resolver->approveSplit("Ozzy/Primus"));
        EXPECT_FALSE(resolver->updateSplit("Ozzy/Primus", names));

        EXPECT_TRUE(resolver->findSplits(db::ProposedSplitStatus::Pending).empty());
        const std::vector<SplitProposal> splits{ resolver->findSplits(db::ProposedSplitStatus::Approved) };
        ASSERT_EQ(splits.size(), 1);
        EXPECT_EQ(splits[0].artists, (std::vector<std::string>{ "Ozzy Osbourne", "Primus" }));

        const std::map<std::string, std::string> resolved{ resolver->resolveBatch(rawArtists) };
        EXPECT_EQ(resolved.at("Ozzy/Primus"), "Ozzy Osbourne; Primus");

        auto transaction{ session.createReadTransaction() };
        const db::ArtistAlias::pointer alias{ db::ArtistAlias::find(session, "Ozzy/Primus") };
        ASSERT_TRUE(alias);
        EXPECT_TRUE(alias->isVerified());
    }

    TEST_F(IdentityResolverServiceTest, rejectSplit)
    {
        const auto resolver{ createResolver() };

        EXPECT_FALSE(resolver->rejectSplit("Simon and Paul"));

        const std::vector<std::string> rawArtists{ "Simon and Paul" };
        EXPECT_EQ(resolver->resolveBatch(rawArtists).at("Simon and Paul"), "Simon; Paul");

        const std::vector<SplitProposal> splits{ resolver->findSplits(db::ProposedSplitStatus::Pending) };
        ASSERT_EQ(splits.size(), 1);
        EXPECT_DOUBLE_EQ(splits[0].confidence, 0.7);

        const std::vector<std::string> names{ "Simon" };
        EXPECT_THROW(resolver->updateSplit("Simon and Paul", names), Exception);

        EXPECT_TRUE(resolver->rejectSplit("Simon and Paul"));
        EXPECT_EQ(resolver->resolveBatch(rawArtists).at("Simon and Paul"), "Simon and Paul");
        EXPECT_EQ(resolver->findSplits(db::ProposedSplitStatus::Rejected).size(), 1);

        // verified decisions are not overridden by the negative cache
        resolver->markNoAlias("Simon and Paul");
        auto transaction{ session.createReadTransaction() };
        const db::ArtistAlias::pointer alias{ db::ArtistAlias::find(session, "Simon and Paul") };
        ASSERT_TRUE(alias);
        EXPECT_FALSE(alias->isNull());
        EXPECT_TRUE(alias->isVerified());
    }
} // namespace blm::matching::tests
