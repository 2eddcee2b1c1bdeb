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

#include "database/objects/Station.hpp"

#include <Wt/Dbo/Impl.h>

#include "database/Session.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(blm::db::Station)

namespace blm::db
{
    Station::Station(std::string_view name)
        : _name{ name }
    {
    }

    Station::pointer Station::create(Session& session, std::string_view name)
    {
        return session.getDboSession()->add(std::unique_ptr<Station>{ new Station{ name } });
    }

    std::size_t Station::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM station"));
    }

    Station::pointer Station::find(Session& session, StationId id)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Station>>("SELECT s from station s").where("s.id = ?").bind(id));
    }

    Station::pointer Station::find(Session& session, std::string_view name)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Station>>("SELECT s from station s").where("s.name = ?").bind(std::string{ name }));
    }
} // namespace blm::db
