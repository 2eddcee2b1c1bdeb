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

#include "database/objects/IdentityBridge.hpp"

#include <algorithm>
#include <tuple>

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "database/Session.hpp"
#include "database/Types.hpp"
#include "database/objects/Work.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(blm::db::IdentityBridge)

namespace blm::db
{
    IdentityBridge::IdentityBridge(std::string_view signature, std::string_view referenceArtist, std::string_view referenceTitle, const ObjectPtr<Work>& work, double confidence)
        : _signature{ signature }
        , _referenceArtist{ referenceArtist }
        , _referenceTitle{ referenceTitle }
        , _confidence{ std::clamp(confidence, 0.0, 1.0) }
        , _createdAt{ utils::normalizeDateTime(Wt::WDateTime::currentDateTime()) }
        , _work{ getDboPtr(work) }
    {
        if (_signature.size() > maxSignatureLength)
            throw Exception{ "Signature too long: '" + _signature + "'" };
    }

    IdentityBridge::pointer IdentityBridge::create(Session& session, std::string_view signature, std::string_view referenceArtist, std::string_view referenceTitle, const ObjectPtr<Work>& work, double confidence)
    {
        return session.getDboSession()->add(std::unique_ptr<IdentityBridge>{ new IdentityBridge{ signature, referenceArtist, referenceTitle, work, confidence } });
    }

    std::size_t IdentityBridge::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM identity_bridge"));
    }

    IdentityBridge::pointer IdentityBridge::find(Session& session, IdentityBridgeId id)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<IdentityBridge>>("SELECT i_b from identity_bridge i_b").where("i_b.id = ?").bind(id));
    }

    IdentityBridge::pointer IdentityBridge::find(Session& session, std::string_view signature)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<IdentityBridge>>("SELECT i_b from identity_bridge i_b").where("i_b.signature = ?").bind(std::string{ signature }));
    }

    void IdentityBridge::find(Session& session, WorkId work, const std::function<void(const pointer&)>& func)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<IdentityBridge>>("SELECT i_b from identity_bridge i_b").where("i_b.work_id = ?").bind(work).orderBy("i_b.id") };

        utils::forEachQueryResult(query, [&](const IdentityBridge::pointer& bridge) {
            func(bridge);
        });
    }

    void IdentityBridge::findActive(Session& session, std::span<const std::string> signatures, const std::function<void(std::string_view signature, WorkId work, double confidence)>& func)
    {
        session.checkReadTransaction();

        using ResultType = std::tuple<std::string, WorkId, double>;

        for (std::size_t offset{}; offset < signatures.size(); offset += utils::maxBoundParameterCount)
        {
            const std::span<const std::string> chunk{ signatures.subspan(offset, std::min(utils::maxBoundParameterCount, signatures.size() - offset)) };

            auto query{ session.getDboSession()->query<ResultType>("SELECT i_b.signature, i_b.work_id, i_b.confidence FROM identity_bridge i_b") };
            query.where("i_b.is_revoked = FALSE");
            query.where("i_b.signature IN (" + utils::makeInClausePlaceholders(chunk.size()) + ")");
            for (const std::string& signature : chunk)
                query.bind(signature);

            utils::forEachQueryResult(query, [&](const ResultType& res) {
                func(std::get<0>(res), std::get<1>(res), std::get<2>(res));
            });
        }
    }
} // namespace blm::db
