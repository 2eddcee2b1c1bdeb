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

#pragma once

#include <cstddef>

#include <Wt/Dbo/Field.h>

#include "database/IdType.hpp"
#include "database/Object.hpp"

BLM_DECLARE_IDTYPE(MatchSettingsId)

namespace blm::db
{
    class Session;

    // Single row holding the tunable matching thresholds
    class MatchSettings final : public Object<MatchSettings, MatchSettingsId>
    {
    public:
        MatchSettings() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session);
        static pointer find(Session& session, MatchSettingsId id);

        // Getters
        double getVariantArtistScore() const { return _variantArtistScore; }
        double getVariantTitleScore() const { return _variantTitleScore; }
        double getAliasArtistScore() const { return _aliasArtistScore; }
        double getAliasTitleScore() const { return _aliasTitleScore; }
        double getVectorStrongDistance() const { return _vectorStrongDistance; }
        double getVectorTitleGuard() const { return _vectorTitleGuard; }
        std::size_t getPromotionMinOccurrences() const { return _promotionMinOccurrences; }
        double getPromotionConfidence() const { return _promotionConfidence; }

        // Setters
        void setVariantArtistScore(double value) { _variantArtistScore = value; }
        void setVariantTitleScore(double value) { _variantTitleScore = value; }
        void setAliasArtistScore(double value) { _aliasArtistScore = value; }
        void setAliasTitleScore(double value) { _aliasTitleScore = value; }
        void setVectorStrongDistance(double value) { _vectorStrongDistance = value; }
        void setVectorTitleGuard(double value) { _vectorTitleGuard = value; }
        void setPromotionMinOccurrences(std::size_t value) { _promotionMinOccurrences = static_cast<int>(value); }
        void setPromotionConfidence(double value) { _promotionConfidence = value; }

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _variantArtistScore, "variant_artist_score");
            Wt::Dbo::field(a, _variantTitleScore, "variant_title_score");
            Wt::Dbo::field(a, _aliasArtistScore, "alias_artist_score");
            Wt::Dbo::field(a, _aliasTitleScore, "alias_title_score");
            Wt::Dbo::field(a, _vectorStrongDistance, "vector_strong_distance");
            Wt::Dbo::field(a, _vectorTitleGuard, "vector_title_guard");
            Wt::Dbo::field(a, _promotionMinOccurrences, "promotion_min_occurrences");
            Wt::Dbo::field(a, _promotionConfidence, "promotion_confidence");
        }

    private:
        friend class Session;

        static pointer create(Session& session);

        double _variantArtistScore{ 0.85 };
        double _variantTitleScore{ 0.80 };
        double _aliasArtistScore{ 0.70 };
        double _aliasTitleScore{ 0.70 };
        double _vectorStrongDistance{ 0.15 };
        double _vectorTitleGuard{ 0.50 };
        int _promotionMinOccurrences{ 1 };
        double _promotionConfidence{ 0.75 };
    };
} // namespace blm::db
