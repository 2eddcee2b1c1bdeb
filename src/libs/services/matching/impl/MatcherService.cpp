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

#include "MatcherService.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <utility>

#include <Wt/Dbo/Exception.h>

#include "core/ILogger.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/Artist.hpp"
#include "database/objects/BroadcastLog.hpp"
#include "database/objects/IdentityBridge.hpp"
#include "database/objects/MatchReview.hpp"
#include "database/objects/MatchSettings.hpp"
#include "database/objects/Recording.hpp"
#include "database/objects/Station.hpp"
#include "database/objects/Work.hpp"
#include "database/objects/WorkArtistLink.hpp"
#include "services/matching/Exception.hpp"
#include "services/matching/Normalizer.hpp"
#include "services/matching/Similarity.hpp"

namespace blm::matching
{
    namespace
    {
        void applyThresholds(db::MatchSettings::pointer& settings, const Thresholds& thresholds)
        {
            auto modifiableSettings{ settings.modify() };
            modifiableSettings->setVariantArtistScore(thresholds.variantArtistScore);
            modifiableSettings->setVariantTitleScore(thresholds.variantTitleScore);
            modifiableSettings->setAliasArtistScore(thresholds.aliasArtistScore);
            modifiableSettings->setAliasTitleScore(thresholds.aliasTitleScore);
            modifiableSettings->setVectorStrongDistance(thresholds.vectorStrongDistance);
            modifiableSettings->setVectorTitleGuard(thresholds.vectorTitleGuard);
            modifiableSettings->setPromotionMinOccurrences(thresholds.promotionMinOccurrences);
            modifiableSettings->setPromotionConfidence(thresholds.promotionConfidence);
        }

        Thresholds toThresholds(const db::MatchSettings::pointer& settings)
        {
            Thresholds thresholds;
            thresholds.variantArtistScore = settings->getVariantArtistScore();
            thresholds.variantTitleScore = settings->getVariantTitleScore();
            thresholds.aliasArtistScore = settings->getAliasArtistScore();
            thresholds.aliasTitleScore = settings->getAliasTitleScore();
            thresholds.vectorStrongDistance = settings->getVectorStrongDistance();
            thresholds.vectorTitleGuard = settings->getVectorTitleGuard();
            thresholds.promotionMinOccurrences = settings->getPromotionMinOccurrences();
            thresholds.promotionConfidence = settings->getPromotionConfidence();
            return thresholds;
        }

        void checkThresholds(const Thresholds& thresholds)
        {
            const auto checkRatio{ [](std::string_view name, double value) {
                if (!(value >= 0 && value <= 1))
                    throw Exception{ "Invalid value for " + std::string{ name } + ": " + std::to_string(value) + ", must be in [0, 1]" };
            } };

            checkRatio("variant-artist-score", thresholds.variantArtistScore);
            checkRatio("variant-title-score", thresholds.variantTitleScore);
            checkRatio("alias-artist-score", thresholds.aliasArtistScore);
            checkRatio("alias-title-score", thresholds.aliasTitleScore);
            checkRatio("vector-strong-distance", thresholds.vectorStrongDistance);
            checkRatio("vector-title-guard", thresholds.vectorTitleGuard);
            checkRatio("promotion-confidence", thresholds.promotionConfidence);
            if (thresholds.promotionMinOccurrences == 0)
                throw Exception{ "Invalid value for promotion-min-occurrences: must be at least 1" };
        }

        // Same spelling first, then any artist sharing the normalized name
        db::Artist::pointer getOrCreateArtist(db::Session& session, std::string_view name)
        {
            if (db::Artist::pointer artist{ db::Artist::find(session, name) })
                return artist;

            const std::string normalizedName{ normalizer::clean(name) };

            db::Artist::pointer artist;
            db::Artist::findByNormalizedName(session, normalizedName, [&](const db::Artist::pointer& existingArtist) {
                if (!artist)
                    artist = existingArtist;
            });
            if (artist)
                return artist;

            return session.create<db::Artist>(name, normalizedName);
        }

        db::Work::pointer getOrCreateWork(db::Session& session, const db::Artist::pointer& artist, std::string_view title)
        {
            const std::string normalizedTitle{ normalizer::clean(title) };
            if (db::Work::pointer work{ db::Work::find(session, artist->getId(), normalizedTitle) })
                return work;

            db::Work::pointer work{ session.create<db::Work>(artist, title, normalizedTitle) };
            session.create<db::WorkArtistLink>(work, artist, db::WorkArtistRole::Primary);

            return work;
        }

        void linkArtist(db::Session& session, const db::Work::pointer& work, const db::Artist::pointer& artist, db::WorkArtistRole role)
        {
            if (!db::WorkArtistLink::find(session, work->getId(), artist->getId()))
                session.create<db::WorkArtistLink>(work, artist, role);
        }

        // Collaboration credits: link the already known individual artists
        void linkKnownCoArtists(db::Session& session, const db::Work::pointer& work, std::string_view rawArtist, std::span<const std::string> unsplittableArtists)
        {
            const std::vector<std::string> names{ normalizer::splitArtists(rawArtist, unsplittableArtists) };
            if (names.size() < 2)
                return;

            for (const std::string& name : names)
            {
                db::Artist::pointer coArtist;
                db::Artist::findByNormalizedName(session, name, [&](const db::Artist::pointer& artist) {
                    if (!coArtist)
                        coArtist = artist;
                });

                if (coArtist)
                    linkArtist(session, work, coArtist, db::WorkArtistRole::Featured);
            }
        }

        CandidateTier classifyCandidate(const ScoredCandidate& candidate, const Thresholds& thresholds)
        {
            if (candidate.artistSimilarity >= thresholds.variantArtistScore && candidate.titleSimilarity >= thresholds.variantTitleScore)
                return CandidateTier::Variant;
            if (candidate.distance <= thresholds.vectorStrongDistance && candidate.titleSimilarity >= thresholds.vectorTitleGuard)
                return CandidateTier::Vector;
            if (candidate.artistSimilarity >= thresholds.aliasArtistScore && candidate.titleSimilarity >= thresholds.aliasTitleScore)
                return CandidateTier::Review;

            return CandidateTier::None;
        }

        bool isWellFormed(std::span<const IndexCandidate> candidates)
        {
            return std::all_of(std::cbegin(candidates), std::cend(candidates), [](const IndexCandidate& candidate) {
                return candidate.recording.isValid() && std::isfinite(candidate.distance) && candidate.distance >= 0;
            });
        }
    } // namespace

    std::unique_ptr<IMatcherService> createMatcherService(db::IDb& db, ISimilarityIndex& index, const MatcherSettings& settings)
    {
        return std::make_unique<MatcherService>(db, index, settings);
    }

    MatcherService::MatcherService(db::IDb& db, ISimilarityIndex& index, const MatcherSettings& settings)
        : _db{ db }
        , _index{ index }
        , _settings{ settings }
        , _bridgeCache{ createIdentityBridgeCache(db) }
    {
        checkThresholds(_settings.defaultThresholds);

        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createWriteTransaction() };

            if (!db::MatchSettings::find(session))
            {
                db::MatchSettings::pointer matchSettings{ session.create<db::MatchSettings>() };
                applyThresholds(matchSettings, _settings.defaultThresholds);
                BLM_LOG(MATCHING, INFO, "Created match settings from configuration defaults");
            }
        }

        BLM_LOG(MATCHING, INFO, "Service started!");
    }

    MatcherService::~MatcherService()
    {
        BLM_LOG(MATCHING, INFO, "Service stopped!");
    }

    MatchResults MatcherService::matchBatch(std::span<const MatchQuery> queries)
    {
        return processBatch(queries, nullptr);
    }

    MatchResults MatcherService::processBatch(std::span<const MatchQuery> queries, ScoredCandidates* explanations)
    {
        MatchResults results;
        if (queries.empty())
            return results;

        const Thresholds thresholds{ getThresholds() };

        std::map<std::string, PendingQuery> pendingQueries; // ordered for a deterministic processing
        std::map<MatchQuery, std::string> signatureByQuery;
        for (const MatchQuery& query : queries)
        {
            if (results.contains(query) || signatureByQuery.contains(query))
                continue;

            std::string signature{ normalizer::generateSignature(query.artist, query.title) };
            if (signature.empty())
            {
                results.emplace(query, Unmatched{ UnmatchedReason::NoMatchFound, {} });
                continue;
            }

            pendingQueries.try_emplace(signature, PendingQuery{ signature, normalizer::clean(query.artist), normalizer::clean(query.title), query });
            signatureByQuery.emplace(query, std::move(signature));
        }

        Outcomes outcomes;
        const auto getUnresolvedQueries{ [&] {
            std::vector<const PendingQuery*> unresolved;
            for (const auto& [signature, pendingQuery] : pendingQueries)
            {
                if (!outcomes.contains(signature))
                    unresolved.push_back(&pendingQuery);
            }
            return unresolved;
        } };

        resolveWithBridges(getUnresolvedQueries(), outcomes);
        resolveWithCatalog(getUnresolvedQueries(), !explanations, outcomes);
        resolveWithSimilarity(getUnresolvedQueries(), thresholds, explanations, outcomes);

        std::size_t matchedCount{};
        for (const auto& [query, signature] : signatureByQuery)
        {
            const auto itOutcome{ outcomes.find(signature) };
            const MatchOutcome outcome{ itOutcome != std::cend(outcomes) ? itOutcome->second : MatchOutcome{ Unmatched{} } };
            if (std::holds_alternative<Matched>(outcome))
                matchedCount++;

            results.emplace(query, outcome);
        }

        BLM_LOG(MATCHING, DEBUG, (explanations ? "explainBatch: " : "matchBatch: ") << results.size() << " distinct queries, " << pendingQueries.size() << " signatures, " << matchedCount << " matched");

        return results;
    }

    MatchOutcome MatcherService::findMatch(std::string_view artist, std::string_view title)
    {
        const MatchQuery query{ std::string{ artist }, std::string{ title } };
        MatchResults results{ matchBatch(std::span{ &query, 1 }) };

        return results.begin()->second;
    }

    MatchExplanations MatcherService::explainBatch(std::span<const MatchQuery> queries)
    {
        ScoredCandidates scoredCandidates;
        MatchResults results{ processBatch(queries, &scoredCandidates) };

        MatchExplanations explanations;
        for (auto& [query, outcome] : results)
        {
            MatchExplanation& explanation{ explanations[query] };
            explanation.signature = normalizer::generateSignature(query.artist, query.title);
            explanation.outcome = std::move(outcome);

            const auto itCandidates{ scoredCandidates.find(explanation.signature) };
            if (itCandidates != std::cend(scoredCandidates))
                explanation.candidates = itCandidates->second;
        }

        return explanations;
    }

    MatchExplanation MatcherService::explainMatch(std::string_view artist, std::string_view title)
    {
        const MatchQuery query{ std::string{ artist }, std::string{ title } };
        MatchExplanations explanations{ explainBatch(std::span{ &query, 1 }) };

        return explanations.begin()->second;
    }

    void MatcherService::resolveWithBridges(std::span<const PendingQuery* const> queries, Outcomes& outcomes)
    {
        if (queries.empty())
            return;

        std::vector<std::string> signatures;
        signatures.reserve(queries.size());
        for (const PendingQuery* query : queries)
            signatures.push_back(query->signature);

        for (auto& [signature, hit] : _bridgeCache->lookupBatch(signatures))
            outcomes.emplace(signature, Matched{ hit.work, db::MatchReason::IdentityBridge, hit.confidence });
    }

    void MatcherService::resolveWithCatalog(std::span<const PendingQuery* const> queries, bool recordBridges, Outcomes& outcomes)
    {
        if (queries.empty())
            return;

        std::vector<std::string> titles;
        {
            std::set<std::string_view> uniqueTitles;
            for (const PendingQuery* query : queries)
            {
                if (uniqueTitles.insert(query->cleanTitle).second)
                    titles.push_back(query->cleanTitle);
            }
        }

        // lowest work id wins when several works share the same names
        std::map<std::pair<std::string, std::string>, db::WorkId> catalogEntries;
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createReadTransaction() };

            db::Work::findByNormalizedTitles(session, titles, [&](std::string_view artist, std::string_view title, db::WorkId work) {
                catalogEntries.try_emplace(std::make_pair(std::string{ artist }, std::string{ title }), work);
            });
        }

        for (const PendingQuery* query : queries)
        {
            const auto itEntry{ catalogEntries.find(std::make_pair(query->cleanArtist, query->cleanTitle)) };
            if (itEntry == std::cend(catalogEntries))
                continue;

            // a revoked signature still matches the catalog, it is just not bridged again
            const db::WorkId work{ itEntry->second };
            if (!recordBridges)
            {
                outcomes.emplace(query->signature, Matched{ work, db::MatchReason::ExactMatch, 1.0 });
                continue;
            }

            try
            {
                _bridgeCache->record(query->signature, query->reference.artist, query->reference.title, work, 1.0);
                outcomes.emplace(query->signature, Matched{ work, db::MatchReason::ExactMatch, 1.0 });
            }
            catch (const DuplicateSignatureException&)
            {
                outcomes.emplace(query->signature, Unmatched{ UnmatchedReason::DuplicateSignature, work });
            }
            catch (const core::BlmException& e)
            {
                BLM_LOG(MATCHING, ERROR, "Cannot bridge '" << query->signature << "': " << e.what());
                outcomes.emplace(query->signature, Matched{ work, db::MatchReason::ExactMatch, 1.0 });
            }
        }
    }

    std::vector<std::vector<IndexCandidate>> MatcherService::searchCandidates(std::span<const PendingQuery* const> queries)
    {
        std::vector<MatchQuery> indexQueries;
        indexQueries.reserve(queries.size());
        for (const PendingQuery* query : queries)
            indexQueries.push_back(MatchQuery{ query->cleanArtist, query->cleanTitle });

        std::vector<std::vector<IndexCandidate>> candidates;
        try
        {
            candidates = _index.searchBatch(indexQueries, _settings.similaritySearchLimit);
        }
        catch (const std::exception& e)
        {
            BLM_LOG(INDEX, ERROR, "Similarity search failed: " << e.what());
            return std::vector<std::vector<IndexCandidate>>(queries.size());
        }

        if (candidates.size() != queries.size())
        {
            BLM_LOG(INDEX, ERROR, "Malformed similarity response: " << candidates.size() << " result lists for " << queries.size() << " queries");
            return std::vector<std::vector<IndexCandidate>>(queries.size());
        }

        return candidates;
    }

    std::vector<std::vector<ScoredCandidate>> MatcherService::scoreCandidates(std::span<const PendingQuery* const> queries, const Thresholds& thresholds)
    {
        std::vector<std::vector<IndexCandidate>> candidates{ searchCandidates(queries) };

        struct RecordingDetails
        {
            db::WorkId work;
            std::string cleanTitle;
            std::vector<std::string> cleanArtists;
        };
        std::unordered_map<db::RecordingId, std::optional<RecordingDetails>> recordingDetails;
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createReadTransaction() };

            for (const std::vector<IndexCandidate>& queryCandidates : candidates)
            {
                for (const IndexCandidate& candidate : queryCandidates)
                {
                    if (recordingDetails.contains(candidate.recording))
                        continue;

                    std::optional<RecordingDetails>& details{ recordingDetails[candidate.recording] };

                    const db::Recording::pointer recording{ candidate.recording.isValid() ? db::Recording::find(session, candidate.recording) : db::Recording::pointer{} };
                    if (!recording)
                        continue;

                    const db::Work::pointer work{ recording->getWork() };
                    details.emplace();
                    details->work = work->getId();
                    details->cleanTitle = normalizer::clean(recording->getTitle());
                    for (const db::Artist::pointer& artist : work->getArtists())
                        details->cleanArtists.push_back(normalizer::cleanArtist(artist->getName()));
                }
            }
        }

        std::vector<std::vector<ScoredCandidate>> scoredCandidates(queries.size());
        for (std::size_t i{}; i < queries.size(); ++i)
        {
            const PendingQuery& query{ *queries[i] };
            std::vector<IndexCandidate>& queryCandidates{ candidates[i] };

            const bool hasUnknownRecording{ std::any_of(std::cbegin(queryCandidates), std::cend(queryCandidates), [&](const IndexCandidate& candidate) { return !recordingDetails[candidate.recording].has_value(); }) };
            if (!isWellFormed(queryCandidates) || hasUnknownRecording)
            {
                BLM_LOG(INDEX, WARNING, "Malformed similarity candidates for '" << query.signature << "', ignored");
                queryCandidates.clear();
            }

            std::sort(std::begin(queryCandidates), std::end(queryCandidates), [](const IndexCandidate& lhs, const IndexCandidate& rhs) {
                if (lhs.distance != rhs.distance)
                    return lhs.distance < rhs.distance;
                return lhs.recording < rhs.recording;
            });

            const std::string queryArtist{ normalizer::cleanArtist(query.reference.artist) };
            for (const IndexCandidate& candidate : queryCandidates)
            {
                const RecordingDetails& details{ *recordingDetails[candidate.recording] };

                ScoredCandidate& scored{ scoredCandidates[i].emplace_back() };
                scored.recording = candidate.recording;
                scored.work = details.work;
                scored.distance = candidate.distance;
                for (const std::string& artist : details.cleanArtists)
                    scored.artistSimilarity = std::max(scored.artistSimilarity, computeSimilarity(artist, queryArtist));
                scored.titleSimilarity = computeSimilarity(details.cleanTitle, query.cleanTitle);
                scored.tier = classifyCandidate(scored, thresholds);
            }
        }

        return scoredCandidates;
    }

    void MatcherService::resolveWithSimilarity(std::span<const PendingQuery* const> queries, const Thresholds& thresholds, ScoredCandidates* explanations, Outcomes& outcomes)
    {
        if (queries.empty())
            return;

        std::vector<std::vector<ScoredCandidate>> scoredCandidates{ scoreCandidates(queries, thresholds) };

        std::vector<ReviewCandidate> reviews;
        for (std::size_t i{}; i < queries.size(); ++i)
        {
            const PendingQuery& query{ *queries[i] };
            const std::vector<ScoredCandidate>& queryCandidates{ scoredCandidates[i] };

            // first qualifying candidate decides
            const auto itCandidate{ std::find_if(std::cbegin(queryCandidates), std::cend(queryCandidates), [](const ScoredCandidate& candidate) { return candidate.tier != CandidateTier::None; }) };
            if (itCandidate == std::cend(queryCandidates))
            {
                outcomes.emplace(query.signature, Unmatched{ UnmatchedReason::NoMatchFound, {} });
            }
            else
            {
                switch (itCandidate->tier)
                {
                case CandidateTier::Variant:
                    outcomes.emplace(query.signature, Matched{ itCandidate->work, db::MatchReason::VariantMatch, (itCandidate->artistSimilarity + itCandidate->titleSimilarity) / 2 });
                    break;
                case CandidateTier::Vector:
                    outcomes.emplace(query.signature, Matched{ itCandidate->work, db::MatchReason::VectorMatch, 1 - itCandidate->distance });
                    break;
                case CandidateTier::Review:
                    outcomes.emplace(query.signature, Unmatched{ UnmatchedReason::FlaggedForReview, itCandidate->work });
                    reviews.push_back(ReviewCandidate{ &query, *itCandidate });
                    break;
                case CandidateTier::None:
                    break;
                }
            }

            if (explanations)
                (*explanations)[query.signature] = std::move(scoredCandidates[i]);
        }

        if (!explanations)
            recordReviews(reviews);
    }

    void MatcherService::recordReviews(std::span<const ReviewCandidate> reviews)
    {
        if (reviews.empty())
            return;

        try
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createWriteTransaction() };

            for (const ReviewCandidate& candidate : reviews)
            {
                db::MatchReview::pointer review{ db::MatchReview::find(session, candidate.query->signature) };
                if (!review)
                    review = session.create<db::MatchReview>(candidate.query->signature, candidate.query->reference.artist, candidate.query->reference.title);

                if (review->getStatus() == db::MatchReviewStatus::Pending)
                {
                    if (const db::Work::pointer work{ db::Work::find(session, candidate.candidate.work) })
                        review.modify()->setSuggestion(work, candidate.candidate.artistSimilarity, candidate.candidate.titleSimilarity, candidate.candidate.distance);
                }
                // distinct plays, so that matching the same query again does not inflate it
                review.modify()->setOccurrenceCount(db::BroadcastLog::getCount(session, candidate.query->signature));
            }
        }
        catch (const Wt::Dbo::Exception& e)
        {
            BLM_LOG(MATCHING, WARNING, "Cannot record match reviews: " << e.what());
        }
    }

    std::size_t MatcherService::scanAndPromote()
    {
        const Thresholds thresholds{ getThresholds() };

        struct SignatureOccurrences
        {
            MatchQuery reference;
            std::size_t count{};
        };
        std::map<std::string, SignatureOccurrences> occurrences;
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createReadTransaction() };

            db::BroadcastLog::findUnmatched(session, std::nullopt, [&](const db::BroadcastLog::pointer& log) {
                std::string signature{ normalizer::generateSignature(log->getRawArtist(), log->getRawTitle()) };
                if (signature.empty())
                    return;

                SignatureOccurrences& signatureOccurrences{ occurrences[std::move(signature)] };
                if (signatureOccurrences.count++ == 0)
                    signatureOccurrences.reference = MatchQuery{ std::string{ log->getRawArtist() }, std::string{ log->getRawTitle() } };
            });

            // revoked bridges also prevent promotion
            for (auto it{ std::begin(occurrences) }; it != std::end(occurrences);)
            {
                if (it->second.count < thresholds.promotionMinOccurrences || db::IdentityBridge::find(session, it->first))
                    it = occurrences.erase(it);
                else
                    ++it;
            }
        }

        if (occurrences.empty())
            return 0;

        std::vector<MatchQuery> queries;
        queries.reserve(occurrences.size());
        for (const auto& [signature, signatureOccurrences] : occurrences)
            queries.push_back(signatureOccurrences.reference);

        const MatchResults results{ matchBatch(queries) };

        std::size_t createdWorkCount{};
        for (const auto& [signature, signatureOccurrences] : occurrences)
        {
            if (std::holds_alternative<Matched>(results.at(signatureOccurrences.reference)))
                continue;

            try
            {
                if (promote(signature, signatureOccurrences.reference, thresholds.promotionConfidence))
                    createdWorkCount++;
            }
            catch (const DuplicateSignatureException& e)
            {
                BLM_LOG(MATCHING, DEBUG, "Skipping promotion of '" << signature << "': " << e.what());
            }
            catch (const Wt::Dbo::Exception& e)
            {
                BLM_LOG(MATCHING, WARNING, "Cannot promote '" << signature << "': " << e.what());
            }
            catch (const core::BlmException& e)
            {
                BLM_LOG(MATCHING, ERROR, "Cannot promote '" << signature << "': " << e.what());
            }
        }

        BLM_LOG(MATCHING, INFO, "Promotion done: " << createdWorkCount << " works created out of " << occurrences.size() << " candidate signatures");

        return createdWorkCount;
    }

    bool MatcherService::promote(const std::string& signature, const MatchQuery& reference, double confidence)
    {
        db::RecordingId recordingId;
        db::WorkId workId;
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createWriteTransaction() };

            if (db::IdentityBridge::find(session, signature))
                return false;

            const db::Artist::pointer artist{ getOrCreateArtist(session, reference.artist) };
            const db::Work::pointer work{ getOrCreateWork(session, artist, reference.title) };
            linkKnownCoArtists(session, work, reference.artist, _settings.unsplittableArtists);

            db::Recording::pointer recording{ session.create<db::Recording>(work, reference.title) };
            recording.modify()->setVersionType(normalizer::extractVersionType(reference.title));

            _bridgeCache->record(signature, reference.artist, reference.title, work->getId(), confidence);

            recordingId = recording->getId();
            workId = work->getId();
        }

        _index.add(recordingId, normalizer::clean(reference.artist), normalizer::clean(reference.title));
        BLM_LOG(MATCHING, INFO, "Promoted '" << reference.artist << "' / '" << reference.title << "' to work " << workId.toString());

        return true;
    }

    std::size_t MatcherService::linkOrphanedLogs()
    {
        struct OrphanLog
        {
            db::BroadcastLogId id;
            MatchQuery query;
        };
        std::vector<OrphanLog> orphanLogs;
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createReadTransaction() };

            db::BroadcastLog::findUnmatched(session, std::nullopt, [&](const db::BroadcastLog::pointer& log) {
                orphanLogs.push_back(OrphanLog{ log->getId(), MatchQuery{ std::string{ log->getRawArtist() }, std::string{ log->getRawTitle() } } });
            });
        }

        if (orphanLogs.empty())
            return 0;

        std::vector<MatchQuery> queries;
        queries.reserve(orphanLogs.size());
        for (const OrphanLog& orphanLog : orphanLogs)
            queries.push_back(orphanLog.query);

        const MatchResults results{ matchBatch(queries) };

        std::size_t linkedCount{};
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createWriteTransaction() };

            for (const OrphanLog& orphanLog : orphanLogs)
            {
                const Matched* matched{ std::get_if<Matched>(&results.at(orphanLog.query)) };
                if (!matched)
                    continue;

                db::BroadcastLog::pointer log{ db::BroadcastLog::find(session, orphanLog.id) };
                if (!log || log->isMatched())
                    continue;

                const db::Work::pointer work{ db::Work::find(session, matched->work) };
                if (!work)
                    continue;

                log.modify()->setWork(work, matched->reason);
                linkedCount++;
            }
        }

        BLM_LOG(MATCHING, INFO, "Linked " << linkedCount << " out of " << orphanLogs.size() << " orphaned logs");

        return linkedCount;
    }

    std::size_t MatcherService::linkLogs(std::string_view signature, db::WorkId work, db::MatchReason reason)
    {
        std::vector<db::BroadcastLogId> logIds;
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createReadTransaction() };

            db::BroadcastLog::findUnmatched(session, std::nullopt, [&](const db::BroadcastLog::pointer& log) {
                if (normalizer::generateSignature(log->getRawArtist(), log->getRawTitle()) == signature)
                    logIds.push_back(log->getId());
            });
        }

        if (logIds.empty())
            return 0;

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        const db::Work::pointer workObj{ db::Work::find(session, work) };
        if (!workObj)
            return 0;

        std::size_t linkedCount{};
        for (const db::BroadcastLogId logId : logIds)
        {
            db::BroadcastLog::pointer log{ db::BroadcastLog::find(session, logId) };
            if (!log || log->isMatched())
                continue;

            log.modify()->setWork(workObj, reason);
            linkedCount++;
        }

        return linkedCount;
    }

    Thresholds MatcherService::getThresholds()
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        const db::MatchSettings::pointer settings{ db::MatchSettings::find(session) };
        if (!settings)
            return _settings.defaultThresholds;

        return toThresholds(settings);
    }

    void MatcherService::setThresholds(const Thresholds& thresholds)
    {
        checkThresholds(thresholds);

        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createWriteTransaction() };

            db::MatchSettings::pointer settings{ db::MatchSettings::find(session) };
            if (!settings)
                settings = session.create<db::MatchSettings>();

            applyThresholds(settings, thresholds);
        }

        BLM_LOG(MATCHING, INFO, "Thresholds updated: variant = " << thresholds.variantArtistScore << "/" << thresholds.variantTitleScore
                                                                 << ", alias = " << thresholds.aliasArtistScore << "/" << thresholds.aliasTitleScore
                                                                 << ", vector = " << thresholds.vectorStrongDistance << "/" << thresholds.vectorTitleGuard);
    }

    std::vector<ReviewInfo> MatcherService::findReviews(db::MatchReviewStatus status, std::optional<db::Range> range)
    {
        std::vector<ReviewInfo> res;

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        db::MatchReview::find(session, status, range, [&](const db::MatchReview::pointer& review) {
            ReviewInfo& info{ res.emplace_back() };
            info.signature = review->getSignature();
            info.rawArtist = review->getRawArtist();
            info.rawTitle = review->getRawTitle();
            info.suggestedWork = review->getSuggestedWorkId();
            info.artistSimilarity = review->getArtistSimilarity();
            info.titleSimilarity = review->getTitleSimilarity();
            info.distance = review->getDistance();
            info.occurrenceCount = review->getOccurrenceCount();
            info.status = review->getStatus();
        });

        return res;
    }

    bool MatcherService::acceptReview(std::string_view signature)
    {
        MatchQuery reference;
        db::WorkId work;
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createReadTransaction() };

            const db::MatchReview::pointer review{ db::MatchReview::find(session, signature) };
            if (!review || review->getStatus() != db::MatchReviewStatus::Pending || !review->getSuggestedWorkId().isValid())
                return false;

            reference = MatchQuery{ std::string{ review->getRawArtist() }, std::string{ review->getRawTitle() } };
            work = review->getSuggestedWorkId();
        }

        if (!_bridgeCache->record(signature, reference.artist, reference.title, work, 1.0))
        {
            BLM_LOG(MATCHING, INFO, "Cannot accept review '" << signature << "': signature revoked");
            return false;
        }

        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createWriteTransaction() };

            if (db::MatchReview::pointer review{ db::MatchReview::find(session, signature) })
                review.modify()->setStatus(db::MatchReviewStatus::Accepted);
        }

        const std::size_t linkedCount{ linkLogs(signature, work, db::MatchReason::ReviewAccepted) };
        BLM_LOG(MATCHING, INFO, "Accepted review '" << signature << "' to work " << work.toString() << ", " << linkedCount << " logs linked");

        return true;
    }

    bool MatcherService::dismissReview(std::string_view signature)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        db::MatchReview::pointer review{ db::MatchReview::find(session, signature) };
        if (!review || review->getStatus() != db::MatchReviewStatus::Pending)
            return false;

        review.modify()->setStatus(db::MatchReviewStatus::Dismissed);
        BLM_LOG(MATCHING, INFO, "Dismissed review '" << signature << "'");

        return true;
    }

    bool MatcherService::revoke(std::string_view signature)
    {
        return _bridgeCache->revoke(signature);
    }

    std::vector<BridgeInfo> MatcherService::findBridges(db::WorkId work)
    {
        return _bridgeCache->findBridges(work);
    }

    db::WorkId MatcherService::addWork(const WorkDefinition& definition)
    {
        if (normalizer::clean(definition.artist).empty() || normalizer::clean(definition.title).empty())
            throw Exception{ "Cannot add work '" + definition.artist + "' / '" + definition.title + "': empty artist or title" };

        db::WorkId workId;
        db::RecordingId recordingId;
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createWriteTransaction() };

            const db::Artist::pointer artist{ getOrCreateArtist(session, definition.artist) };
            const db::Work::pointer work{ getOrCreateWork(session, artist, definition.title) };
            for (const std::string& coArtistName : definition.coArtists)
            {
                if (normalizer::clean(coArtistName).empty())
                    continue;

                const db::Artist::pointer coArtist{ getOrCreateArtist(session, coArtistName) };
                if (coArtist->getId() != artist->getId())
                    linkArtist(session, work, coArtist, db::WorkArtistRole::Featured);
            }

            db::Recording::pointer recording{ session.create<db::Recording>(work, definition.title) };
            recording.modify()->setVersionType(normalizer::extractVersionType(definition.title));
            if (!definition.filePath.empty())
            {
                recording.modify()->setFilePath(definition.filePath);
                recording.modify()->setVerified(true);
            }

            workId = work->getId();
            recordingId = recording->getId();
        }

        _index.add(recordingId, normalizer::clean(definition.artist), normalizer::clean(definition.title));
        BLM_LOG(MATCHING, DEBUG, "Added work " << workId.toString() << ": '" << definition.artist << "' / '" << definition.title << "'");

        return workId;
    }

    db::BroadcastLogId MatcherService::addBroadcastLog(std::string_view stationName, std::string_view rawArtist, std::string_view rawTitle, const Wt::WDateTime& playedAt)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        db::Station::pointer station{ db::Station::find(session, stationName) };
        if (!station)
            station = session.create<db::Station>(stationName);

        db::BroadcastLog::pointer log{ session.create<db::BroadcastLog>(station, rawArtist, rawTitle, playedAt) };
        log.modify()->setSignature(normalizer::generateSignature(rawArtist, rawTitle));

        return log->getId();
    }

    void MatcherService::rebuildIndex()
    {
        constexpr std::size_t batchSize{ 1000 };

        _index.clear();

        std::vector<IndexEntry> entries;
        for (std::size_t offset{};; offset += batchSize)
        {
            entries.clear();
            {
                db::Session& session{ _db.getTLSSession() };
                auto transaction{ session.createReadTransaction() };

                db::Recording::findIndexEntries(session, db::Range{ offset, batchSize }, [&](db::RecordingId recording, std::string_view artistName, std::string_view title) {
                    entries.push_back(IndexEntry{ recording, normalizer::clean(artistName), normalizer::clean(title) });
                });
            }

            _index.addBatch(entries);
            if (entries.size() < batchSize)
                break;
        }

        BLM_LOG(INDEX, INFO, "Similarity index rebuilt, " << _index.size() << " entries");
    }
} // namespace blm::matching
