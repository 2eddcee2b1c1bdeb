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

#include "database/objects/Artist.hpp"

#include <Wt/Dbo/Impl.h>

#include "core/ILogger.hpp"
#include "database/Session.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(blm::db::Artist)

namespace blm::db
{
    Artist::Artist(std::string_view name, std::string_view normalizedName)
    {
        setName(name, normalizedName);
    }

    Artist::pointer Artist::create(Session& session, std::string_view name, std::string_view normalizedName)
    {
        return session.getDboSession()->add(std::unique_ptr<Artist>{ new Artist{ name, normalizedName } });
    }

    std::size_t Artist::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM artist"));
    }

    Artist::pointer Artist::find(Session& session, ArtistId id)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Artist>>("SELECT a from artist a").where("a.id = ?").bind(id));
    }

    Artist::pointer Artist::find(Session& session, std::string_view name)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Artist>>("SELECT a from artist a").where("a.name = ?").bind(std::string{ name }));
    }

    void Artist::findByNormalizedName(Session& session, std::string_view normalizedName, const std::function<void(const pointer&)>& func)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<Artist>>("SELECT a from artist a").where("a.normalized_name = ?").bind(std::string{ normalizedName }).orderBy("a.id") };

        utils::forEachQueryResult(query, [&](const Artist::pointer& artist) {
            func(artist);
        });
    }

    void Artist::find(Session& session, std::optional<Range> range, const std::function<void(const pointer&)>& func)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<Artist>>("SELECT a from artist a").orderBy("a.id") };

        utils::forEachQueryRangeResult(query, range, [&](const Artist::pointer& artist) {
            func(artist);
        });
    }

    void Artist::setName(std::string_view name, std::string_view normalizedName)
    {
        _name.assign(name, 0, maxNameLength);
        BLM_LOG_IF(DB, WARNING, name.size() > maxNameLength, "Artist name too long, truncated to '" << _name << "'");

        _normalizedName.assign(normalizedName, 0, maxNameLength);
    }
} // namespace blm::db
