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

#include <cstdio>

#include "services/matching/Exception.hpp"

namespace blm::matching::tests
{
    std::vector<IndexCandidate> ScriptedSimilarityIndex::search(std::string_view artist, std::string_view title, std::size_t limit)
    {
        const MatchQuery query{ std::string{ artist }, std::string{ title } };
        return searchBatch(std::span{ &query, 1 }, limit).front();
    }

    std::vector<std::vector<IndexCandidate>> ScriptedSimilarityIndex::searchBatch(std::span<const MatchQuery> queries, std::size_t limit)
    {
        _searchCount++;
        if (_fail)
            throw SimilarityIndexException{ "index unavailable" };

        std::vector<std::vector<IndexCandidate>> res;
        for (const MatchQuery& query : queries)
        {
            std::vector<IndexCandidate>& candidates{ res.emplace_back() };
            if (const auto it{ _candidates.find(query) }; it != std::cend(_candidates))
                candidates = it->second;
            if (candidates.size() > limit)
                candidates.resize(limit);
        }

        if (_extraResult)
            res.emplace_back();

        return res;
    }

    TmpDatabase::TmpDatabase()
        : _tmpFile{ std::tmpnam(nullptr) }
        , _db{ db::createDb(_tmpFile, 4) }
    {
        db::Session& session{ _db->getTLSSession() };
        session.prepareTablesIfNeeded();
        session.createIndexesIfNeeded();
    }

    TmpDatabase::~TmpDatabase()
    {
        _db.reset();
        std::filesystem::remove(_tmpFile);
    }

    std::unique_ptr<db::IDb> TmpDatabase::createOtherDb() const
    {
        return db::createDb(_tmpFile, 1);
    }

    std::unique_ptr<IMatcherService> MatchingFixture::createMatcher(ISimilarityIndex& index, const MatcherSettings& settings)
    {
        return createMatcherService(tmpDb.getDb(), index, settings);
    }

    std::unique_ptr<IIdentityResolverService> MatchingFixture::createResolver()
    {
        return createResolver(tmpDb.getDb());
    }

    std::unique_ptr<IIdentityResolverService> MatchingFixture::createResolver(db::IDb& db)
    {
        std::vector<std::string> splitExceptions;
        for (std::string_view splitException : defaultSplitExceptions)
            splitExceptions.emplace_back(splitException);

        return createIdentityResolverService(db, splitExceptions);
    }
} // namespace blm::matching::tests
