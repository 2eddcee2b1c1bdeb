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

#include "database/objects/MatchReview.hpp"

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "database/Session.hpp"
#include "database/objects/Work.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(blm::db::MatchReview)

namespace blm::db
{
    MatchReview::MatchReview(std::string_view signature, std::string_view rawArtist, std::string_view rawTitle)
        : _signature{ signature }
        , _rawArtist{ rawArtist }
        , _rawTitle{ rawTitle }
        , _lastSeen{ utils::normalizeDateTime(Wt::WDateTime::currentDateTime()) }
    {
    }

    MatchReview::pointer MatchReview::create(Session& session, std::string_view signature, std::string_view rawArtist, std::string_view rawTitle)
    {
        return session.getDboSession()->add(std::unique_ptr<MatchReview>{ new MatchReview{ signature, rawArtist, rawTitle } });
    }

    std::size_t MatchReview::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM match_review"));
    }

    MatchReview::pointer MatchReview::find(Session& session, MatchReviewId id)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<MatchReview>>("SELECT m_r from match_review m_r").where("m_r.id = ?").bind(id));
    }

    MatchReview::pointer MatchReview::find(Session& session, std::string_view signature)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<MatchReview>>("SELECT m_r from match_review m_r").where("m_r.signature = ?").bind(std::string{ signature }));
    }

    void MatchReview::find(Session& session, MatchReviewStatus status, std::optional<Range> range, const std::function<void(const pointer&)>& func)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<MatchReview>>("SELECT m_r from match_review m_r").where("m_r.status = ?").bind(status).orderBy("m_r.occurrence_count DESC, m_r.id") };

        utils::forEachQueryRangeResult(query, range, [&](const MatchReview::pointer& review) {
            func(review);
        });
    }

    ObjectPtr<Work> MatchReview::getSuggestedWork() const
    {
        return _suggestedWork;
    }

    void MatchReview::setSuggestion(const ObjectPtr<Work>& work, double artistSimilarity, double titleSimilarity, double distance)
    {
        _suggestedWork = getDboPtr(work);
        _artistSimilarity = artistSimilarity;
        _titleSimilarity = titleSimilarity;
        _distance = distance;
    }

    void MatchReview::setOccurrenceCount(std::size_t count)
    {
        _occurrenceCount = static_cast<int>(count);
        _lastSeen = utils::normalizeDateTime(Wt::WDateTime::currentDateTime());
    }
} // namespace blm::db
