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

#include "database/objects/ProposedSplit.hpp"

#include <algorithm>

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "core/String.hpp"
#include "database/Session.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(blm::db::ProposedSplit)

namespace blm::db
{
    namespace
    {
        constexpr char artistDelimiter{ ';' };
        constexpr char escapeChar{ '\\' };
    } // namespace

    ProposedSplit::ProposedSplit(std::string_view rawArtist, std::span<const std::string> artists, double confidence)
        : _rawArtist{ rawArtist }
        , _confidence{ std::clamp(confidence, 0.0, 1.0) }
        , _createdAt{ utils::normalizeDateTime(Wt::WDateTime::currentDateTime()) }
    {
        setProposedArtists(artists);
    }

    ProposedSplit::pointer ProposedSplit::create(Session& session, std::string_view rawArtist, std::span<const std::string> artists, double confidence)
    {
        return session.getDboSession()->add(std::unique_ptr<ProposedSplit>{ new ProposedSplit{ rawArtist, artists, confidence } });
    }

    std::size_t ProposedSplit::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM proposed_split"));
    }

    ProposedSplit::pointer ProposedSplit::find(Session& session, ProposedSplitId id)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<ProposedSplit>>("SELECT p_s from proposed_split p_s").where("p_s.id = ?").bind(id));
    }

    ProposedSplit::pointer ProposedSplit::find(Session& session, std::string_view rawArtist)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<ProposedSplit>>("SELECT p_s from proposed_split p_s").where("p_s.raw_artist = ?").bind(std::string{ rawArtist }));
    }

    void ProposedSplit::find(Session& session, std::span<const std::string> rawArtists, const std::function<void(const pointer&)>& func)
    {
        session.checkReadTransaction();

        for (std::size_t offset{}; offset < rawArtists.size(); offset += utils::maxBoundParameterCount)
        {
            const std::span<const std::string> chunk{ rawArtists.subspan(offset, std::min(utils::maxBoundParameterCount, rawArtists.size() - offset)) };

            auto query{ session.getDboSession()->query<Wt::Dbo::ptr<ProposedSplit>>("SELECT p_s from proposed_split p_s") };
            query.where("p_s.raw_artist IN (" + utils::makeInClausePlaceholders(chunk.size()) + ")");
            for (const std::string& rawArtist : chunk)
                query.bind(rawArtist);

            utils::forEachQueryResult(query, [&](const ProposedSplit::pointer& split) {
                func(split);
            });
        }
    }

    void ProposedSplit::find(Session& session, ProposedSplitStatus status, std::optional<Range> range, const std::function<void(const pointer&)>& func)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<ProposedSplit>>("SELECT p_s from proposed_split p_s").where("p_s.status = ?").bind(status).orderBy("p_s.id") };

        utils::forEachQueryRangeResult(query, range, [&](const ProposedSplit::pointer& split) {
            func(split);
        });
    }

    std::vector<std::string> ProposedSplit::getProposedArtists() const
    {
        return core::stringUtils::splitEscapedStrings(_proposedArtists, artistDelimiter, escapeChar);
    }

    void ProposedSplit::setProposedArtists(std::span<const std::string> artists)
    {
        _proposedArtists = core::stringUtils::escapeAndJoinStrings(artists, artistDelimiter, escapeChar);
    }
} // namespace blm::db
