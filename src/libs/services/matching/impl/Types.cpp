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

#include "services/matching/Types.hpp"

namespace blm::matching
{
    const char* toString(db::MatchReason reason)
    {
        switch (reason)
        {
        case db::MatchReason::None:
            return "None";
        case db::MatchReason::IdentityBridge:
            return "Identity Bridge";
        case db::MatchReason::ExactMatch:
            return "Exact Match";
        case db::MatchReason::VariantMatch:
            return "Variant Match";
        case db::MatchReason::VectorMatch:
            return "Vector Match";
        case db::MatchReason::ReviewAccepted:
            return "Review Accepted";
        }

        return "Unknown";
    }

    const char* toString(UnmatchedReason reason)
    {
        switch (reason)
        {
        case UnmatchedReason::NoMatchFound:
            return "No Match Found";
        case UnmatchedReason::FlaggedForReview:
            return "Flagged For Review";
        case UnmatchedReason::DuplicateSignature:
            return "Duplicate Signature";
        }

        return "Unknown";
    }

    const char* toString(CandidateTier tier)
    {
        switch (tier)
        {
        case CandidateTier::Variant:
            return "Variant";
        case CandidateTier::Vector:
            return "Vector";
        case CandidateTier::Review:
            return "Review";
        case CandidateTier::None:
            return "None";
        }

        return "Unknown";
    }
} // namespace blm::matching
