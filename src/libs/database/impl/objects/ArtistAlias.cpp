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

#include "database/objects/ArtistAlias.hpp"

#include <algorithm>

#include <Wt/Dbo/Impl.h>

#include "database/Session.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(blm::db::ArtistAlias)

namespace blm::db
{
    ArtistAlias::ArtistAlias(std::string_view rawName)
        : _rawName{ rawName }
    {
    }

    ArtistAlias::pointer ArtistAlias::create(Session& session, std::string_view rawName)
    {
        return session.getDboSession()->add(std::unique_ptr<ArtistAlias>{ new ArtistAlias{ rawName } });
    }

    std::size_t ArtistAlias::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM artist_alias"));
    }

    ArtistAlias::pointer ArtistAlias::find(Session& session, ArtistAliasId id)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<ArtistAlias>>("SELECT a_a from artist_alias a_a").where("a_a.id = ?").bind(id));
    }

    ArtistAlias::pointer ArtistAlias::find(Session& session, std::string_view rawName)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<ArtistAlias>>("SELECT a_a from artist_alias a_a").where("a_a.raw_name = ? COLLATE NOCASE").bind(std::string{ rawName }));
    }

    void ArtistAlias::find(Session& session, std::span<const std::string> rawNames, const std::function<void(const pointer&)>& func)
    {
        session.checkReadTransaction();

        for (std::size_t offset{}; offset < rawNames.size(); offset += utils::maxBoundParameterCount)
        {
            const std::span<const std::string> chunk{ rawNames.subspan(offset, std::min(utils::maxBoundParameterCount, rawNames.size() - offset)) };

            auto query{ session.getDboSession()->query<Wt::Dbo::ptr<ArtistAlias>>("SELECT a_a from artist_alias a_a") };
            query.where("a_a.raw_name COLLATE NOCASE IN (" + utils::makeInClausePlaceholders(chunk.size()) + ")");
            for (const std::string& rawName : chunk)
                query.bind(rawName);

            utils::forEachQueryResult(query, [&](const ArtistAlias::pointer& alias) {
                func(alias);
            });
        }
    }

    void ArtistAlias::setResolvedName(std::string_view resolvedName)
    {
        _resolvedName = resolvedName;
        _isNull = false;
    }

    void ArtistAlias::setNull()
    {
        _resolvedName.clear();
        _isNull = true;
    }
} // namespace blm::db
