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

#include "database/objects/Work.hpp"

#include <algorithm>
#include <cassert>
#include <tuple>

#include <Wt/Dbo/Impl.h>

#include "core/ILogger.hpp"
#include "database/Session.hpp"
#include "database/objects/Artist.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(blm::db::Work)

namespace blm::db
{
    Work::Work(const ObjectPtr<Artist>& primaryArtist, std::string_view title, std::string_view normalizedTitle)
        : _primaryArtist{ getDboPtr(primaryArtist) }
    {
        setTitle(title, normalizedTitle);
    }

    Work::pointer Work::create(Session& session, const ObjectPtr<Artist>& primaryArtist, std::string_view title, std::string_view normalizedTitle)
    {
        return session.getDboSession()->add(std::unique_ptr<Work>{ new Work{ primaryArtist, title, normalizedTitle } });
    }

    std::size_t Work::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM work"));
    }

    Work::pointer Work::find(Session& session, WorkId id)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Work>>("SELECT w from work w").where("w.id = ?").bind(id));
    }

    void Work::find(Session& session, std::optional<Range> range, const std::function<void(const pointer&)>& func)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<Work>>("SELECT w from work w").orderBy("w.id") };

        utils::forEachQueryRangeResult(query, range, [&](const Work::pointer& work) {
            func(work);
        });
    }

    Work::pointer Work::find(Session& session, ArtistId primaryArtist, std::string_view normalizedTitle)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<Work>>("SELECT w from work w") };
        query.where("w.primary_artist_id = ?").bind(primaryArtist);
        query.where("w.normalized_title = ?").bind(std::string{ normalizedTitle });
        query.orderBy("w.id").limit(1);

        return utils::fetchQuerySingleResult(query);
    }

    void Work::findByNormalizedTitles(Session& session, std::span<const std::string> normalizedTitles, const std::function<void(std::string_view normalizedArtistName, std::string_view normalizedTitle, WorkId work)>& func)
    {
        session.checkReadTransaction();

        using ResultType = std::tuple<std::string, std::string, WorkId>;

        for (std::size_t offset{}; offset < normalizedTitles.size(); offset += utils::maxBoundParameterCount)
        {
            const std::span<const std::string> chunk{ normalizedTitles.subspan(offset, std::min(utils::maxBoundParameterCount, normalizedTitles.size() - offset)) };

            auto query{ session.getDboSession()->query<ResultType>("SELECT a.normalized_name, w.normalized_title, w.id FROM work w") };
            query.join("work_artist_link w_a_l ON w_a_l.work_id = w.id");
            query.join("artist a ON a.id = w_a_l.artist_id");
            query.where("w.normalized_title IN (" + utils::makeInClausePlaceholders(chunk.size()) + ")");
            for (const std::string& normalizedTitle : chunk)
                query.bind(normalizedTitle);
            query.orderBy("w.id, w_a_l.id");

            utils::forEachQueryResult(query, [&](const ResultType& res) {
                func(std::get<0>(res), std::get<1>(res), std::get<2>(res));
            });
        }
    }

    ObjectPtr<Artist> Work::getPrimaryArtist() const
    {
        return _primaryArtist;
    }

    ArtistId Work::getPrimaryArtistId() const
    {
        return _primaryArtist.id();
    }

    std::vector<ObjectPtr<Artist>> Work::getArtists() const
    {
        assert(session());

        auto query{ session()->query<Wt::Dbo::ptr<Artist>>("SELECT a FROM artist a") };
        query.join("work_artist_link w_a_l ON w_a_l.artist_id = a.id");
        query.where("w_a_l.work_id = ?").bind(getId());
        query.orderBy("w_a_l.role, w_a_l.id");

        std::vector<ObjectPtr<Artist>> res;
        utils::forEachQueryResult(query, [&](const Wt::Dbo::ptr<Artist>& artist) {
            if (std::none_of(std::cbegin(res), std::cend(res), [&](const ObjectPtr<Artist>& existing) { return existing->getId() == artist->getId(); }))
                res.push_back(artist);
        });

        return res;
    }

    void Work::setTitle(std::string_view title, std::string_view normalizedTitle)
    {
        _title.assign(title, 0, maxTitleLength);
        BLM_LOG_IF(DB, WARNING, title.size() > maxTitleLength, "Work title too long, truncated to '" << _title << "'");

        _normalizedTitle.assign(normalizedTitle, 0, maxTitleLength);
    }
} // namespace blm::db
