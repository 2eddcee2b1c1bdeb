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

#include "Common.hpp"

#include <string>
#include <thread>

#include "database/objects/Artist.hpp"
#include "database/objects/IdentityBridge.hpp"
#include "database/objects/Work.hpp"
#include "services/matching/Exception.hpp"
#include "services/matching/IIdentityBridgeCache.hpp"

namespace blm::matching::tests
{
    namespace
    {
        db::WorkId createWork(db::Session& session, std::string_view artistName, std::string_view title)
        {
            auto transaction{ session.createWriteTransaction() };

            db::Artist::pointer artist{ db::Artist::find(session, artistName) };
            if (!artist)
                artist = session.create<db::Artist>(artistName, artistName);

            return session.create<db::Work>(artist, title, title)->getId();
        }
    } // namespace

    using IdentityBridgeCacheTest = MatchingFixture;

    TEST_F(IdentityBridgeCacheTest, recordAndLookup)
    {
        const db::WorkId work{ createWork(session, "nirvana", "smells like teen spirit") };
        const auto cache{ createIdentityBridgeCache(tmpDb.getDb()) };

        EXPECT_FALSE(cache->lookup("nirvana::smells like teen spirit"));
        EXPECT_FALSE(cache->lookup(""));

        EXPECT_TRUE(cache->record("nirvana::smells like teen spirit", "Nirvana", "Smells Like Teen Spirit", work, 0.9));

        const std::optional<BridgeHit> hit{ cache->lookup("nirvana::smells like teen spirit") };
        ASSERT_TRUE(hit);
        EXPECT_EQ(hit->work, work);
        EXPECT_DOUBLE_EQ(hit->confidence, 0.9);

        // same work: no-op
        EXPECT_TRUE(cache->record("nirvana::smells like teen spirit", "nirvana", "smells like teen spirit (remastered)", work, 1.0));
        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_EQ(db::IdentityBridge::getCount(session), 1);
        }

        const std::vector<BridgeInfo> bridges{ cache->findBridges(work) };
        ASSERT_EQ(bridges.size(), 1);
        EXPECT_EQ(bridges[0].signature, "nirvana::smells like teen spirit");
        EXPECT_EQ(bridges[0].referenceArtist, "Nirvana");
        EXPECT_EQ(bridges[0].referenceTitle, "Smells Like Teen Spirit");
        EXPECT_FALSE(bridges[0].revoked);
    }

    TEST_F(IdentityBridgeCacheTest, lookupBatch)
    {
        const db::WorkId work1{ createWork(session, "godsmack", "voodoo") };
        const db::WorkId work2{ createWork(session, "nirvana", "lithium") };
        const auto cache{ createIdentityBridgeCache(tmpDb.getDb()) };

        cache->record("godsmack::voodoo", "Godsmack", "Voodoo", work1, 1.0);
        cache->record("nirvana::lithium", "Nirvana", "Lithium", work2, 0.75);
        cache->record("nirvana::lithium live", "Nirvana", "Lithium Live", work2, 0.75);
        EXPECT_TRUE(cache->revoke("nirvana::lithium live"));

        const std::vector<std::string> signatures{ "godsmack::voodoo", "nirvana::lithium", "nirvana::lithium live", "unknown::song" };
        const auto hits{ cache->lookupBatch(signatures) };
        ASSERT_EQ(hits.size(), 2);
        EXPECT_EQ(hits.at("godsmack::voodoo").work, work1);
        EXPECT_EQ(hits.at("nirvana::lithium").work, work2);
        EXPECT_DOUBLE_EQ(hits.at("nirvana::lithium").confidence, 0.75);

        EXPECT_TRUE(cache->lookupBatch({}).empty());
    }

    TEST_F(IdentityBridgeCacheTest, conflicts)
    {
        const db::WorkId work1{ createWork(session, "godsmack", "voodoo") };
        const db::WorkId work2{ createWork(session, "godsmack", "awake") };
        const auto cache{ createIdentityBridgeCache(tmpDb.getDb()) };

        EXPECT_THROW(cache->record("", "Godsmack", "Voodoo", work1, 1.0), Exception);
        EXPECT_THROW(cache->record("godsmack::voodoo", "Godsmack", "Voodoo", db::WorkId{ 12345 }, 1.0), Exception);

        cache->record("godsmack::voodoo", "Godsmack", "Voodoo", work1, 1.0);

        try
        {
            cache->record("godsmack::voodoo", "Godsmack", "Voodoo", work2, 1.0);
            FAIL() << "conflict not reported";
        }
        catch (const DuplicateSignatureException& e)
        {
            EXPECT_EQ(e.getSignature(), "godsmack::voodoo");
            EXPECT_EQ(e.getExistingWork(), work1);
            EXPECT_EQ(e.getRequestedWork(), work2);
        }

        // still mapped to the first work
        const std::optional<BridgeHit> hit{ cache->lookup("godsmack::voodoo") };
        ASSERT_TRUE(hit);
        EXPECT_EQ(hit->work, work1);
    }

    TEST_F(IdentityBridgeCacheTest, revoke)
    {
        const db::WorkId work{ createWork(session, "godsmack", "voodoo") };
        const auto cache{ createIdentityBridgeCache(tmpDb.getDb()) };

        EXPECT_FALSE(cache->revoke("godsmack::voodoo"));

        cache->record("godsmack::voodoo", "Godsmack", "Voodoo", work, 1.0);
        EXPECT_TRUE(cache->revoke("godsmack::voodoo"));
        EXPECT_FALSE(cache->revoke("godsmack::voodoo"));
        EXPECT_FALSE(cache->lookup("godsmack::voodoo"));

        // revoked entries are kept and never recorded again, whatever the work
        const db::WorkId otherWork{ createWork(session, "godsmack", "awake") };
        EXPECT_FALSE(cache->record("godsmack::voodoo", "Godsmack", "Voodoo", work, 1.0));
        EXPECT_FALSE(cache->record("godsmack::voodoo", "Godsmack", "Voodoo", otherWork, 1.0));
        EXPECT_FALSE(cache->lookup("godsmack::voodoo"));

        const std::vector<BridgeInfo> bridges{ cache->findBridges(work) };
        ASSERT_EQ(bridges.size(), 1);
        EXPECT_TRUE(bridges[0].revoked);
        EXPECT_TRUE(cache->findBridges(otherWork).empty());

        auto transaction{ session.createReadTransaction() };
        EXPECT_EQ(db::IdentityBridge::getCount(session), 1);
    }

    TEST_F(IdentityBridgeCacheTest, recordRaceThroughTwoConnectionPools)
    {
        const db::WorkId work{ createWork(session, "pixies", "debaser") };
        const db::WorkId otherWork{ createWork(session, "pixies", "hey") };

        // separate writer locks: inserts of the same signature collide in sqlite
        const std::unique_ptr<db::IDb> otherDb{ tmpDb.createOtherDb() };
        const auto cache{ createIdentityBridgeCache(tmpDb.getDb()) };
        const auto otherCache{ createIdentityBridgeCache(*otherDb) };

        constexpr std::size_t signatureCount{ 50 };
        const auto recordAll{ [&](IIdentityBridgeCache& bridgeCache) {
            for (std::size_t i{}; i < signatureCount; ++i)
                EXPECT_TRUE(bridgeCache.record("pixies::debaser " + std::to_string(i), "Pixies", "Debaser", work, 1.0)) << i;
        } };

        std::thread thread{ [&] { recordAll(*otherCache); } };
        recordAll(*cache);
        thread.join();

        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_EQ(db::IdentityBridge::getCount(session), signatureCount);
        }

        for (std::size_t i{}; i < signatureCount; ++i)
        {
            const std::string signature{ "pixies::debaser " + std::to_string(i) };
            ASSERT_TRUE(otherCache->lookup(signature)) << signature;
            EXPECT_EQ(otherCache->lookup(signature)->work, work);
        }

        // a recovered entry is still checked against the requested work
        EXPECT_THROW(otherCache->record("pixies::debaser 0", "Pixies", "Hey", otherWork, 1.0), DuplicateSignatureException);
    }
} // namespace blm::matching::tests
