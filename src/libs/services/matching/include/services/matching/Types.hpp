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

#include <compare>
#include <cstddef>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include "database/Types.hpp"
#include "database/objects/RecordingId.hpp"
#include "database/objects/WorkId.hpp"

namespace blm::matching
{
    struct MatchQuery
    {
        std::string artist;
        std::string title;

        auto operator<=>(const MatchQuery&) const = default;
    };

    struct Matched
    {
        db::WorkId work;
        db::MatchReason reason{ db::MatchReason::None };
        double confidence{};
    };

    enum class UnmatchedReason
    {
        NoMatchFound,
        FlaggedForReview,   // close candidate found, queued for a human decision
        DuplicateSignature, // the signature cannot be bridged to the matched work
    };

    struct Unmatched
    {
        UnmatchedReason reason{ UnmatchedReason::NoMatchFound };
        db::WorkId suggestedWork; // set for FlaggedForReview and DuplicateSignature
    };

    using MatchOutcome = std::variant<Matched, Unmatched>;

    // keyed by the exact input queries
    using MatchResults = std::map<MatchQuery, MatchOutcome>;

    // Rule satisfied by a similarity candidate, the first candidate not in None decides
    enum class CandidateTier
    {
        Variant,
        Vector,
        Review,
        None,
    };

    struct ScoredCandidate
    {
        db::RecordingId recording;
        db::WorkId work;
        double artistSimilarity{};
        double titleSimilarity{};
        double distance{};
        CandidateTier tier{ CandidateTier::None };
    };

    struct MatchExplanation
    {
        std::string signature;
        MatchOutcome outcome;
        std::vector<ScoredCandidate> candidates; // evaluation order, empty if resolved before the similarity stage
    };
    using MatchExplanations = std::map<MatchQuery, MatchExplanation>;

    const char* toString(db::MatchReason reason);
    const char* toString(UnmatchedReason reason);
    const char* toString(CandidateTier tier);

    struct Thresholds
    {
        double variantArtistScore{ 0.85 };
        double variantTitleScore{ 0.80 };
        double aliasArtistScore{ 0.70 };
        double aliasTitleScore{ 0.70 };
        double vectorStrongDistance{ 0.15 };
        double vectorTitleGuard{ 0.50 };
        std::size_t promotionMinOccurrences{ 1 };
        double promotionConfidence{ 0.75 };

        bool operator==(const Thresholds&) const = default;
    };
} // namespace blm::matching
