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

#include "database/objects/WorkArtistLink.hpp"

#include <tuple>

#include <Wt/Dbo/Impl.h>

#include "database/Session.hpp"
#include "database/objects/Artist.hpp"
#include "database/objects/Work.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(blm::db::WorkArtistLink)

namespace blm::db
{
    WorkArtistLink::WorkArtistLink(const ObjectPtr<Work>& work, const ObjectPtr<Artist>& artist, WorkArtistRole role)
        : _role{ role }
        , _work{ getDboPtr(work) }
        , _artist{ getDboPtr(artist) }
    {
    }

    WorkArtistLink::pointer WorkArtistLink::create(Session& session, const ObjectPtr<Work>& work, const ObjectPtr<Artist>& artist, WorkArtistRole role)
    {
        return session.getDboSession()->add(std::unique_ptr<WorkArtistLink>{ new WorkArtistLink{ work, artist, role } });
    }

    std::size_t WorkArtistLink::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM work_artist_link"));
    }

    WorkArtistLink::pointer WorkArtistLink::find(Session& session, WorkArtistLinkId id)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<WorkArtistLink>>("SELECT w_a_l from work_artist_link w_a_l").where("w_a_l.id = ?").bind(id));
    }

    WorkArtistLink::pointer WorkArtistLink::find(Session& session, WorkId work, ArtistId artist)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<WorkArtistLink>>("SELECT w_a_l from work_artist_link w_a_l") };
        query.where("w_a_l.work_id = ?").bind(work);
        query.where("w_a_l.artist_id = ?").bind(artist);
        query.orderBy("w_a_l.id").limit(1);

        return utils::fetchQuerySingleResult(query);
    }

    void WorkArtistLink::find(Session& session, WorkId work, const std::function<void(const pointer&, const ObjectPtr<Artist>&)>& func)
    {
        session.checkReadTransaction();

        using ResultType = std::tuple<Wt::Dbo::ptr<WorkArtistLink>, Wt::Dbo::ptr<Artist>>;

        auto query{ session.getDboSession()->query<ResultType>("SELECT w_a_l, a FROM work_artist_link w_a_l").join("artist a ON w_a_l.artist_id = a.id").where("w_a_l.work_id = ?").bind(work).orderBy("w_a_l.role, w_a_l.id") };

        utils::forEachQueryResult(query, [&](const ResultType& result) {
            func(std::get<Wt::Dbo::ptr<WorkArtistLink>>(result), std::get<Wt::Dbo::ptr<Artist>>(result));
        });
    }

    ObjectPtr<Work> WorkArtistLink::getWork() const
    {
        return _work;
    }

    ObjectPtr<Artist> WorkArtistLink::getArtist() const
    {
        return _artist;
    }
} // namespace blm::db
