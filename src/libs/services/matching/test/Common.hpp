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

#pragma once

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "services/matching/IIdentityResolverService.hpp"
#include "services/matching/IMatcherService.hpp"
#include "services/matching/ISimilarityIndex.hpp"

namespace blm::matching::tests
{
    // Returns the scripted candidates for a (clean artist, clean title) query and counts the searches
    class ScriptedSimilarityIndex final : public ISimilarityIndex
    {
    public:
        void setCandidates(const MatchQuery& query, std::vector<IndexCandidate> candidates) { _candidates[query] = std::move(candidates); }
        void setFailure(bool fail) { _fail = fail; }
        void setExtraResult(bool extraResult) { _extraResult = extraResult; }

        std::size_t getSearchCount() const { return _searchCount; }
        std::size_t getAddCount() const { return _addCount; }

    private:
        void add(db::RecordingId, std::string_view, std::string_view) override { _addCount++; }
        void addBatch(std::span<const IndexEntry> entries) override { _addCount += entries.size(); }
        void clear() override {}
        std::size_t size() const override { return _addCount; }

        std::vector<IndexCandidate> search(std::string_view artist, std::string_view title, std::size_t limit) override;
        std::vector<std::vector<IndexCandidate>> searchBatch(std::span<const MatchQuery> queries, std::size_t limit) override;

        std::map<MatchQuery, std::vector<IndexCandidate>> _candidates;
        bool _fail{};
        bool _extraResult{};
        std::atomic<std::size_t> _searchCount{};
        std::atomic<std::size_t> _addCount{};
    };

    class TmpDatabase final
    {
    public:
        TmpDatabase();
        ~TmpDatabase();
        TmpDatabase(const TmpDatabase&) = delete;
        TmpDatabase& operator=(const TmpDatabase&) = delete;

        db::IDb& getDb() { return *_db; }
        // another connection pool on the same file, with its own writer lock
        std::unique_ptr<db::IDb> createOtherDb() const;

    private:
        const std::filesystem::path _tmpFile;
        std::unique_ptr<db::IDb> _db;
    };

    // Fresh database for each test
    class MatchingFixture : public ::testing::Test
    {
    public:
        std::unique_ptr<IMatcherService> createMatcher(ISimilarityIndex& index, const MatcherSettings& settings = {});
        std::unique_ptr<IIdentityResolverService> createResolver();
        std::unique_ptr<IIdentityResolverService> createResolver(db::IDb& db);

        TmpDatabase tmpDb;
        db::Session& session{ tmpDb.getDb().getTLSSession() };
    };
} // namespace blm::matching::tests
