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

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "services/matching/IIdentityBridgeCache.hpp"
#include "services/matching/IMatcherService.hpp"
#include "services/matching/ISimilarityIndex.hpp"

namespace blm::matching
{
    class MatcherService final : public IMatcherService
    {
    public:
        MatcherService(db::IDb& db, ISimilarityIndex& index, const MatcherSettings& settings);
        ~MatcherService() override;
        MatcherService(const MatcherService&) = delete;
        MatcherService& operator=(const MatcherService&) = delete;

    private:
        MatchResults matchBatch(std::span<const MatchQuery> queries) override;
        MatchOutcome findMatch(std::string_view artist, std::string_view title) override;
        MatchExplanations explainBatch(std::span<const MatchQuery> queries) override;
        MatchExplanation explainMatch(std::string_view artist, std::string_view title) override;

        std::size_t scanAndPromote() override;
        std::size_t linkOrphanedLogs() override;

        Thresholds getThresholds() override;
        void setThresholds(const Thresholds& thresholds) override;

        std::vector<ReviewInfo> findReviews(db::MatchReviewStatus status, std::optional<db::Range> range) override;
        bool acceptReview(std::string_view signature) override;
        bool dismissReview(std::string_view signature) override;

        bool revoke(std::string_view signature) override;
        std::vector<BridgeInfo> findBridges(db::WorkId work) override;

        db::WorkId addWork(const WorkDefinition& work) override;
        db::BroadcastLogId addBroadcastLog(std::string_view station, std::string_view rawArtist, std::string_view rawTitle, const Wt::WDateTime& playedAt) override;
        void rebuildIndex() override;

        // one per distinct signature in a batch
        struct PendingQuery
        {
            std::string signature;
            std::string cleanArtist;
            std::string cleanTitle;
            MatchQuery reference; // first raw query seen for this signature
        };
        using Outcomes = std::unordered_map<std::string, MatchOutcome>;                      // by signature
        using ScoredCandidates = std::unordered_map<std::string, std::vector<ScoredCandidate>>; // by signature

        struct ReviewCandidate
        {
            const PendingQuery* query{};
            ScoredCandidate candidate;
        };

        // explanations set: dry run that reports every scored candidate
        MatchResults processBatch(std::span<const MatchQuery> queries, ScoredCandidates* explanations);
        void resolveWithBridges(std::span<const PendingQuery* const> queries, Outcomes& outcomes);
        void resolveWithCatalog(std::span<const PendingQuery* const> queries, bool recordBridges, Outcomes& outcomes);
        void resolveWithSimilarity(std::span<const PendingQuery* const> queries, const Thresholds& thresholds, ScoredCandidates* explanations, Outcomes& outcomes);
        std::vector<std::vector<IndexCandidate>> searchCandidates(std::span<const PendingQuery* const> queries);
        std::vector<std::vector<ScoredCandidate>> scoreCandidates(std::span<const PendingQuery* const> queries, const Thresholds& thresholds);
        void recordReviews(std::span<const ReviewCandidate> reviews);

        bool promote(const std::string& signature, const MatchQuery& reference, double confidence);
        std::size_t linkLogs(std::string_view signature, db::WorkId work, db::MatchReason reason);

        db::IDb& _db;
        ISimilarityIndex& _index;
        const MatcherSettings _settings;
        std::unique_ptr<IIdentityBridgeCache> _bridgeCache;
    };
} // namespace blm::matching
