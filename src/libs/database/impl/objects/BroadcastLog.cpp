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

#include "database/objects/BroadcastLog.hpp"

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "database/Session.hpp"
#include "database/objects/Station.hpp"
#include "database/objects/Work.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(blm::db::BroadcastLog)

namespace blm::db
{
    BroadcastLog::BroadcastLog(const ObjectPtr<Station>& station, std::string_view rawArtist, std::string_view rawTitle, const Wt::WDateTime& playedAt)
        : _rawArtist{ rawArtist }
        , _rawTitle{ rawTitle }
        , _playedAt{ utils::normalizeDateTime(playedAt) }
        , _station{ getDboPtr(station) }
    {
    }

    BroadcastLog::pointer BroadcastLog::create(Session& session, const ObjectPtr<Station>& station, std::string_view rawArtist, std::string_view rawTitle, const Wt::WDateTime& playedAt)
    {
        return session.getDboSession()->add(std::unique_ptr<BroadcastLog>{ new BroadcastLog{ station, rawArtist, rawTitle, playedAt } });
    }

    std::size_t BroadcastLog::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM broadcast_log"));
    }

    std::size_t BroadcastLog::getCount(Session& session, std::string_view signature)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM broadcast_log").where("signature = ?").bind(std::string{ signature }));
    }

    std::size_t BroadcastLog::getUnmatchedCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM broadcast_log WHERE work_id IS NULL"));
    }

    BroadcastLog::pointer BroadcastLog::find(Session& session, BroadcastLogId id)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<BroadcastLog>>("SELECT b_l from broadcast_log b_l").where("b_l.id = ?").bind(id));
    }

    void BroadcastLog::find(Session& session, WorkId work, std::optional<Range> range, const std::function<void(const pointer&)>& func)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<BroadcastLog>>("SELECT b_l from broadcast_log b_l").where("b_l.work_id = ?").bind(work).orderBy("b_l.id") };

        utils::forEachQueryRangeResult(query, range, [&](const BroadcastLog::pointer& log) {
            func(log);
        });
    }

    void BroadcastLog::findUnmatched(Session& session, std::optional<Range> range, const std::function<void(const pointer&)>& func)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<BroadcastLog>>("SELECT b_l from broadcast_log b_l").where("b_l.work_id IS NULL").orderBy("b_l.id") };

        utils::forEachQueryRangeResult(query, range, [&](const BroadcastLog::pointer& log) {
            func(log);
        });
    }

    void BroadcastLog::setWork(const ObjectPtr<Work>& work, MatchReason reason)
    {
        _work = getDboPtr(work);
        _matchReason = reason;
    }
} // namespace blm::db
