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

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <Wt/Dbo/Field.h>
#include <Wt/WDateTime.h>

#include "database/IdType.hpp"
#include "database/Object.hpp"
#include "database/Types.hpp"
#include "database/objects/BroadcastLogId.hpp"
#include "database/objects/StationId.hpp"
#include "database/objects/WorkId.hpp"

namespace blm::db
{
    class Session;
    class Station;
    class Work;

    // One raw (artist, title) row as reported by a station, possibly linked to a work
    class BroadcastLog final : public Object<BroadcastLog, BroadcastLogId>
    {
    public:
        BroadcastLog() = default;

        static std::size_t getCount(Session& session);
        static std::size_t getCount(Session& session, std::string_view signature);
        static std::size_t getUnmatchedCount(Session& session);
        static pointer find(Session& session, BroadcastLogId id);
        static void find(Session& session, WorkId work, std::optional<Range> range, const std::function<void(const pointer&)>& func);
        static void findUnmatched(Session& session, std::optional<Range> range, const std::function<void(const pointer&)>& func);

        // accessors
        std::string_view getRawArtist() const { return _rawArtist; }
        std::string_view getRawTitle() const { return _rawTitle; }
        std::string_view getSignature() const { return _signature; }
        const Wt::WDateTime& getPlayedAt() const { return _playedAt; }
        MatchReason getMatchReason() const { return _matchReason; }
        StationId getStationId() const { return _station.id(); }
        WorkId getWorkId() const { return _work.id(); }
        bool isMatched() const { return static_cast<bool>(_work); }

        // setters
        void setSignature(std::string_view signature) { _signature = signature; }
        void setWork(const ObjectPtr<Work>& work, MatchReason reason);

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _rawArtist, "raw_artist");
            Wt::Dbo::field(a, _rawTitle, "raw_title");
            Wt::Dbo::field(a, _signature, "signature");
            Wt::Dbo::field(a, _playedAt, "played_at");
            Wt::Dbo::field(a, _matchReason, "match_reason");

            Wt::Dbo::belongsTo(a, _station, "station", Wt::Dbo::OnDeleteCascade);
            Wt::Dbo::belongsTo(a, _work, "work", Wt::Dbo::OnDeleteSetNull);
        }

    private:
        friend class Session;

        BroadcastLog(const ObjectPtr<Station>& station, std::string_view rawArtist, std::string_view rawTitle, const Wt::WDateTime& playedAt);
        static pointer create(Session& session, const ObjectPtr<Station>& station, std::string_view rawArtist, std::string_view rawTitle, const Wt::WDateTime& playedAt);

        std::string _rawArtist;
        std::string _rawTitle;
        std::string _signature;
        Wt::WDateTime _playedAt;
        MatchReason _matchReason{ MatchReason::None };

        Wt::Dbo::ptr<Station> _station;
        Wt::Dbo::ptr<Work> _work;
    };
} // namespace blm::db
