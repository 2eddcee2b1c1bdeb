/*
 * Copyright (C) 2024 Emeric Poupon
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

#include "Common.hpp"

namespace blm::db::tests
{
    TEST_F(DatabaseFixture, ProposedSplit)
    {
        const std::vector<std::string> artists{ "Ozzy", "Primus" };
        ScopedProposedSplit split{ session, "Ozzy/Primus", artists, 0.8 };

        {
            auto transaction{ session.createReadTransaction() };

            EXPECT_EQ(ProposedSplit::getCount(session), 1);
            EXPECT_EQ(split->getRawArtist(), "Ozzy/Primus");
            EXPECT_EQ(split->getProposedArtists(), artists);
            EXPECT_EQ(split->getStatus(), ProposedSplitStatus::Pending);
            EXPECT_DOUBLE_EQ(split->getConfidence(), 0.8);
            EXPECT_TRUE(split->getCreatedAt().isValid());

            const ProposedSplit::pointer found{ ProposedSplit::find(session, "Ozzy/Primus") };
            ASSERT_TRUE(found);
            EXPECT_EQ(found->getId(), split.getId());
        }

        {
            auto transaction{ session.createWriteTransaction() };

            const std::vector<std::string> newArtists{ "Ozzy Osbourne", "Primus", "Some; Weird\\Name" };
            auto s{ split.get().modify() };
            s->setProposedArtists(newArtists);
            s->setStatus(ProposedSplitStatus::Approved);
        }

        {
            auto transaction{ session.createReadTransaction() };

            const std::vector<std::string> expectedArtists{ "Ozzy Osbourne", "Primus", "Some; Weird\\Name" };
            EXPECT_EQ(split->getProposedArtists(), expectedArtists);
            EXPECT_EQ(split->getStatus(), ProposedSplitStatus::Approved);
        }
    }

    TEST_F(DatabaseFixture, ProposedSplit_findByStatus)
    {
        const std::vector<std::string> artists1{ "Ozzy", "Primus" };
        const std::vector<std::string> artists2{ "Jay-Z", "Kanye West" };
        ScopedProposedSplit split1{ session, "Ozzy/Primus", artists1, 0.8 };
        ScopedProposedSplit split2{ session, "Jay-Z & Kanye West", artists2, 0.8 };

        {
            auto transaction{ session.createWriteTransaction() };
            split2.get().modify()->setStatus(ProposedSplitStatus::Rejected);
        }

        {
            auto transaction{ session.createReadTransaction() };

            std::vector<ProposedSplitId> pending;
            ProposedSplit::find(session, ProposedSplitStatus::Pending, std::nullopt, [&](const ProposedSplit::pointer& s) {
                pending.push_back(s->getId());
            });
            ASSERT_EQ(pending.size(), 1);
            EXPECT_EQ(pending.front(), split1.getId());

            const std::vector<std::string> rawArtists{ "Ozzy/Primus", "Jay-Z & Kanye West", "Simon & Garfunkel" };
            std::size_t count{};
            ProposedSplit::find(session, rawArtists, [&](const ProposedSplit::pointer&) {
                count++;
            });
            EXPECT_EQ(count, 2);
        }
    }

    TEST_F(DatabaseFixture, ProposedSplit_uniqueRawArtist)
    {
        const std::vector<std::string> artists{ "Ozzy", "Primus" };
        ScopedProposedSplit split{ session, "Ozzy/Primus", artists, 0.8 };

        EXPECT_THROW(
            {
                auto transaction{ session.createWriteTransaction() };
                session.execute("INSERT INTO proposed_split(version, raw_artist, proposed_artists, status, confidence) VALUES (0, 'Ozzy/Primus', 'Ozzy;Primus', 0, 0.8)");
            },
            Wt::Dbo::Exception);

        auto transaction{ session.createReadTransaction() };
        EXPECT_EQ(ProposedSplit::getCount(session), 1);
    }
} // namespace blm::db::tests
