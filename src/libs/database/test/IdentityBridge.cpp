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

#include <map>

#include "Common.hpp"

namespace blm::db::tests
{
    TEST_F(DatabaseFixture, IdentityBridge)
    {
        ScopedArtist artist{ session, "Godsmack", "godsmack" };
        ScopedWork work{ session, artist.lockAndGet(), "Voodoo", "voodoo" };

        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_FALSE(IdentityBridge::find(session, "godsmack::voodoo"));
        }

        ScopedIdentityBridge bridge{ session, "godsmack::voodoo", "GODSMACK", "Voodoo (Live)", work.lockAndGet(), 1.0 };

        {
            auto transaction{ session.createReadTransaction() };

            EXPECT_EQ(IdentityBridge::getCount(session), 1);

            const IdentityBridge::pointer found{ IdentityBridge::find(session, "godsmack::voodoo") };
            ASSERT_TRUE(found);
            EXPECT_EQ(found->getId(), bridge.getId());
            EXPECT_EQ(found->getSignature(), "godsmack::voodoo");
            EXPECT_EQ(found->getReferenceArtist(), "GODSMACK");
            EXPECT_EQ(found->getReferenceTitle(), "Voodoo (Live)");
            EXPECT_EQ(found->getWorkId(), work.getId());
            EXPECT_DOUBLE_EQ(found->getConfidence(), 1.0);
            EXPECT_FALSE(found->isRevoked());
            EXPECT_TRUE(found->getCreatedAt().isValid());

            std::vector<IdentityBridgeId> bridges;
            IdentityBridge::find(session, work.getId(), [&](const IdentityBridge::pointer& b) {
                bridges.push_back(b->getId());
            });
            ASSERT_EQ(bridges.size(), 1);
            EXPECT_EQ(bridges.front(), bridge.getId());
        }
    }

    TEST_F(DatabaseFixture, IdentityBridge_confidenceClamped)
    {
        ScopedArtist artist{ session, "Godsmack", "godsmack" };
        ScopedWork work{ session, artist.lockAndGet(), "Voodoo", "voodoo" };
        ScopedIdentityBridge bridge{ session, "godsmack::voodoo", "Godsmack", "Voodoo", work.lockAndGet(), 1.5 };

        auto transaction{ session.createReadTransaction() };
        EXPECT_DOUBLE_EQ(bridge->getConfidence(), 1.0);
    }

    TEST_F(DatabaseFixture, IdentityBridge_findActive)
    {
        ScopedArtist artist{ session, "Godsmack", "godsmack" };
        ScopedWork work1{ session, artist.lockAndGet(), "Voodoo", "voodoo" };
        ScopedWork work2{ session, artist.lockAndGet(), "Awake", "awake" };
        ScopedIdentityBridge bridge1{ session, "godsmack::voodoo", "Godsmack", "Voodoo", work1.lockAndGet(), 1.0 };
        ScopedIdentityBridge bridge2{ session, "godsmack::awake", "Godsmack", "Awake", work2.lockAndGet(), 0.75 };

        const std::vector<std::string> signatures{ "godsmack::voodoo", "godsmack::awake", "godsmack::unknown" };

        {
            auto transaction{ session.createReadTransaction() };

            std::map<std::string, WorkId> results;
            IdentityBridge::findActive(session, signatures, [&](std::string_view signature, WorkId workId, double) {
                results.emplace(signature, workId);
            });
            ASSERT_EQ(results.size(), 2);
            EXPECT_EQ(results["godsmack::voodoo"], work1.getId());
            EXPECT_EQ(results["godsmack::awake"], work2.getId());
        }

        {
            auto transaction{ session.createWriteTransaction() };
            bridge2.get().modify()->setRevoked(true);
        }

        {
            auto transaction{ session.createReadTransaction() };

            std::map<std::string, WorkId> results;
            IdentityBridge::findActive(session, signatures, [&](std::string_view signature, WorkId workId, double) {
                results.emplace(signature, workId);
            });
            ASSERT_EQ(results.size(), 1);
            EXPECT_EQ(results["godsmack::voodoo"], work1.getId());

            // revoked entries are kept for audit
            const IdentityBridge::pointer revoked{ IdentityBridge::find(session, "godsmack::awake") };
            ASSERT_TRUE(revoked);
            EXPECT_TRUE(revoked->isRevoked());
        }
    }

    TEST_F(DatabaseFixture, IdentityBridge_uniqueSignature)
    {
        ScopedArtist artist{ session, "Godsmack", "godsmack" };
        ScopedWork work1{ session, artist.lockAndGet(), "Voodoo", "voodoo" };
        ScopedWork work2{ session, artist.lockAndGet(), "Awake", "awake" };
        ScopedIdentityBridge bridge{ session, "godsmack::voodoo", "Godsmack", "Voodoo", work1.lockAndGet(), 1.0 };

        EXPECT_THROW(
            {
                auto transaction{ session.createWriteTransaction() };
                session.execute("INSERT INTO identity_bridge(version, signature, reference_artist, reference_title, confidence, is_revoked, work_id) VALUES (0, 'godsmack::voodoo', 'Godsmack', 'Voodoo', 1.0, 0, " + work2.getId().toString() + ")");
            },
            Wt::Dbo::Exception);

        {
            auto transaction{ session.createReadTransaction() };

            EXPECT_EQ(IdentityBridge::getCount(session), 1);
            EXPECT_EQ(IdentityBridge::find(session, "godsmack::voodoo")->getWorkId(), work1.getId());
        }
    }

    TEST_F(DatabaseFixture, IdentityBridge_removedWithWork)
    {
        ScopedArtist artist{ session, "Godsmack", "godsmack" };
        auto work{ std::make_unique<ScopedWork>(session, artist.lockAndGet(), "Voodoo", "voodoo") };
        ScopedIdentityBridge bridge{ session, "godsmack::voodoo", "Godsmack", "Voodoo", work->lockAndGet(), 1.0 };

        work.reset();

        auto transaction{ session.createReadTransaction() };
        EXPECT_EQ(IdentityBridge::getCount(session), 0);
    }
} // namespace blm::db::tests
