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

#include "Common.hpp"

namespace blm::db::tests
{
    TEST_F(DatabaseFixture, MatchReview)
    {
        ScopedArtist artist{ session, "Godsmack", "godsmack" };
        ScopedWork work{ session, artist.lockAndGet(), "Voodoo", "voodoo" };
        ScopedMatchReview review{ session, "godsmak::vodoo", "Godsmak", "Vodoo" };

        {
            auto transaction{ session.createWriteTransaction() };

            auto r{ review.get().modify() };
            r->setSuggestion(work.get(), 0.72, 0.75, 0.3);
            r->setOccurrenceCount(2);
        }

        {
            auto transaction{ session.createReadTransaction() };

            EXPECT_EQ(MatchReview::getCount(session), 1);
            EXPECT_EQ(review->getSignature(), "godsmak::vodoo");
            EXPECT_EQ(review->getRawArtist(), "Godsmak");
            EXPECT_EQ(review->getRawTitle(), "Vodoo");
            EXPECT_EQ(review->getSuggestedWorkId(), work.getId());
            EXPECT_DOUBLE_EQ(review->getArtistSimilarity(), 0.72);
            EXPECT_DOUBLE_EQ(review->getTitleSimilarity(), 0.75);
            EXPECT_DOUBLE_EQ(review->getDistance(), 0.3);
            EXPECT_EQ(review->getOccurrenceCount(), 2);
            EXPECT_EQ(review->getStatus(), MatchReviewStatus::Pending);

            const MatchReview::pointer found{ MatchReview::find(session, "godsmak::vodoo") };
            ASSERT_TRUE(found);
            EXPECT_EQ(found->getId(), review.getId());

            std::size_t count{};
            MatchReview::find(session, MatchReviewStatus::Pending, std::nullopt, [&](const MatchReview::pointer&) {
                count++;
            });
            EXPECT_EQ(count, 1);
        }

        {
            auto transaction{ session.createWriteTransaction() };
            review.get().modify()->setStatus(MatchReviewStatus::Dismissed);
        }

        {
            auto transaction{ session.createReadTransaction() };

            std::size_t count{};
            MatchReview::find(session, MatchReviewStatus::Pending, std::nullopt, [&](const MatchReview::pointer&) {
                count++;
            });
            EXPECT_EQ(count, 0);
        }
    }

    TEST_F(DatabaseFixture, MatchSettings)
    {
        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_FALSE(MatchSettings::find(session));
        }

        ScopedMatchSettings settings{ session };

        {
            auto transaction{ session.createReadTransaction() };

            const MatchSettings::pointer found{ MatchSettings::find(session) };
            ASSERT_TRUE(found);
            EXPECT_EQ(found->getId(), settings.getId());
            EXPECT_DOUBLE_EQ(found->getVariantArtistScore(), 0.85);
            EXPECT_DOUBLE_EQ(found->getVariantTitleScore(), 0.80);
            EXPECT_DOUBLE_EQ(found->getAliasArtistScore(), 0.70);
            EXPECT_DOUBLE_EQ(found->getAliasTitleScore(), 0.70);
            EXPECT_DOUBLE_EQ(found->getVectorStrongDistance(), 0.15);
            EXPECT_DOUBLE_EQ(found->getVectorTitleGuard(), 0.50);
            EXPECT_EQ(found->getPromotionMinOccurrences(), 1);
            EXPECT_DOUBLE_EQ(found->getPromotionConfidence(), 0.75);
        }

        {
            auto transaction{ session.createWriteTransaction() };

            auto s{ settings.get().modify() };
            s->setVectorTitleGuard(0.6);
            s->setPromotionMinOccurrences(3);
        }

        {
            auto transaction{ session.createReadTransaction() };

            EXPECT_DOUBLE_EQ(settings->getVectorTitleGuard(), 0.6);
            EXPECT_EQ(settings->getPromotionMinOccurrences(), 3);
        }
    }
} // namespace blm::db::tests
