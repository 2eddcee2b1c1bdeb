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

#include "database/objects/MatchSettings.hpp"

#include <Wt/Dbo/Impl.h>

#include "database/Session.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(blm::db::MatchSettings)

namespace blm::db
{
    MatchSettings::pointer MatchSettings::create(Session& session)
    {
        return session.getDboSession()->add(std::make_unique<MatchSettings>());
    }

    std::size_t MatchSettings::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM match_settings"));
    }

    MatchSettings::pointer MatchSettings::find(Session& session, MatchSettingsId id)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<MatchSettings>>("SELECT m_s from match_settings m_s").where("m_s.id = ?").bind(id));
    }

    MatchSettings::pointer MatchSettings::find(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<MatchSettings>>("SELECT m_s from match_settings m_s").orderBy("m_s.id").limit(1));
    }
} // namespace blm::db
