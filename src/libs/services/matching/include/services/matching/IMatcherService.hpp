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

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <Wt/WDateTime.h>

#include "database/Types.hpp"
#include "database/objects/BroadcastLogId.hpp"
#include "database/objects/WorkId.hpp"
#include "services/matching/IIdentityBridgeCache.hpp"
#include "services/matching/Types.hpp"

namespace blm::db
{
    class IDb;
}

namespace blm::matching
{
    class ISimilarityIndex;

    struct MatcherSettings
    {
        Thresholds defaultThresholds; // used to create the persisted settings on first start
        std::size_t similaritySearchLimit{ 10 };
        std::vector<std::string> unsplittableArtists; // kept whole when linking the co-artists of promoted works
    };

    struct WorkDefinition
    {
        std::string artist;
        std::string title;
        std::vector<std::string> coArtists;
        std::filesystem::path filePath; // empty for a placeholder recording
    };

    struct ReviewInfo
    {
        std::string signature;
        std::string rawArtist;
        std::string rawTitle;
        db::WorkId suggestedWork;
        double artistSimilarity{};
        double titleSimilarity{};
        double distance{};
        std::size_t occurrenceCount{};
        db::MatchReviewStatus status{ db::MatchReviewStatus::Pending };
    };

    class IMatcherService
    {
    public:
        virtual ~IMatcherService() = default;

        // Identity bridge, then exact catalog match, then similarity search.
        // Identical queries are resolved once. A failure on one query never aborts the batch.
        virtual MatchResults matchBatch(std::span<const MatchQuery> queries) = 0;
        virtual MatchOutcome findMatch(std::string_view artist, std::string_view title) = 0;

        // Same pipeline as a dry run: no bridge or review is recorded, and every similarity candidate is scored
        virtual MatchExplanations explainBatch(std::span<const MatchQuery> queries) = 0;
        virtual MatchExplanation explainMatch(std::string_view artist, std::string_view title) = 0;

        // Creates works for recurring unmatched signatures, returns the number of created works
        virtual std::size_t scanAndPromote() = 0;
        // Links the unmatched broadcast logs that now resolve, returns the number of linked logs
        virtual std::size_t linkOrphanedLogs() = 0;

        // Persisted, applied from the next batch on
        virtual Thresholds getThresholds() = 0;
        virtual void setThresholds(const Thresholds& thresholds) = 0;

        // Review queue
        virtual std::vector<ReviewInfo> findReviews(db::MatchReviewStatus status, std::optional<db::Range> range = std::nullopt) = 0;
        virtual bool acceptReview(std::string_view signature) = 0; // false if not pending, without suggestion or revoked
        virtual bool dismissReview(std::string_view signature) = 0;

        // Bridge administration
        virtual bool revoke(std::string_view signature) = 0;
        virtual std::vector<BridgeInfo> findBridges(db::WorkId work) = 0;

        // Catalog
        virtual db::WorkId addWork(const WorkDefinition& work) = 0;
        virtual db::BroadcastLogId addBroadcastLog(std::string_view station, std::string_view rawArtist, std::string_view rawTitle, const Wt::WDateTime& playedAt) = 0;
        virtual void rebuildIndex() = 0;
    };

    std::unique_ptr<IMatcherService> createMatcherService(db::IDb& db, ISimilarityIndex& index, const MatcherSettings& settings = {});
} // namespace blm::matching
