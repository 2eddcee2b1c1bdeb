/*
 * Copyright (C) 2023 Emeric Poupon
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

#include <cstdio>
#include <iterator>

namespace blm::db::tests
{
    TmpDatabase::TmpDatabase()
        : _tmpFile{ std::tmpnam(nullptr) }
        , _fileDeleter{ _tmpFile }
        , _db{ createDb(_tmpFile, 1) }
    {
    }

    IDb& TmpDatabase::getDb()
    {
        return *_db;
    }

    DatabaseFixture::~DatabaseFixture()
    {
        testDatabaseEmpty();
    }

    void DatabaseFixture::SetUpTestCase()
    {
        _tmpDb = std::make_unique<TmpDatabase>();

        db::Session& s{ _tmpDb->getDb().getTLSSession() };
        s.prepareTablesIfNeeded();
        s.createIndexesIfNeeded();
    }

    void DatabaseFixture::TearDownTestCase()
    {
        _tmpDb.reset();
    }

    void DatabaseFixture::testDatabaseEmpty()
    {
        using namespace db;

        auto transaction{ session.createReadTransaction() };

        EXPECT_EQ(Artist::getCount(session), 0);
        EXPECT_EQ(ArtistAlias::getCount(session), 0);
        EXPECT_EQ(BroadcastLog::getCount(session), 0);
        EXPECT_EQ(IdentityBridge::getCount(session), 0);
        EXPECT_EQ(MatchReview::getCount(session), 0);
        EXPECT_EQ(MatchSettings::getCount(session), 0);
        EXPECT_EQ(ProposedSplit::getCount(session), 0);
        EXPECT_EQ(Recording::getCount(session), 0);
        EXPECT_EQ(Station::getCount(session), 0);
        EXPECT_EQ(Work::getCount(session), 0);
        EXPECT_EQ(WorkArtistLink::getCount(session), 0);
    }

    TEST_F(DatabaseFixture, Common_IdType)
    {
        {
            const IdType id{};
            EXPECT_FALSE(id.isValid());
        }

        {
            const IdType id{ 0 };
            EXPECT_TRUE(id.isValid());
        }

        {
            const IdType id1{ 0 };
            const IdType id2{ 1 };
            EXPECT_NE(id1, id2);
            EXPECT_LT(id1, id2);
            EXPECT_GT(id2, id1);
        }

        {
            const WorkId id{ 42 };
            EXPECT_EQ(id.toString(), "42");
            EXPECT_EQ(std::hash<WorkId>{}(id), std::hash<WorkId>{}(WorkId{ 42 }));
        }
    }
} // namespace blm::db::tests
