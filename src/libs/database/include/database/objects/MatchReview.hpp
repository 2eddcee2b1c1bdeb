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
#include "database/objects/WorkId.hpp"

BLM_DECLARE_IDTYPE(MatchReviewId)

namespace blm::db
{
    class Session;
    class Work;

    // Near miss of the similarity stage, kept for a human to accept or dismiss
    class MatchReview final : public Object<MatchReview, MatchReviewId>
    {
    public:
        MatchReview() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, MatchReviewId id);
        static pointer find(Session& session, std::string_view signature);
        static void find(Session& session, MatchReviewStatus status, std::optional<Range> range, const std::function<void(const pointer&)>& func);

        // accessors
        std::string_view getSignature() const { return _signature; }
        std::string_view getRawArtist() const { return _rawArtist; }
        std::string_view getRawTitle() const { return _rawTitle; }
        double getArtistSimilarity() const { return _artistSimilarity; }
        double getTitleSimilarity() const { return _titleSimilarity; }
        double getDistance() const { return _distance; }
        MatchReviewStatus getStatus() const { return _status; }
        std::size_t getOccurrenceCount() const { return _occurrenceCount; }
        const Wt::WDateTime& getLastSeen() const { return _lastSeen; }
        WorkId getSuggestedWorkId() const { return _suggestedWork.id(); }
        ObjectPtr<Work> getSuggestedWork() const;

        // setters
        void setSuggestion(const ObjectPtr<Work>& work, double artistSimilarity, double titleSimilarity, double distance);
        void setStatus(MatchReviewStatus status) { _status = status; }
        void setOccurrenceCount(std::size_t count); // also refreshes the last seen time

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _signature, "signature");
            Wt::Dbo::field(a, _rawArtist, "raw_artist");
            Wt::Dbo::field(a, _rawTitle, "raw_title");
            Wt::Dbo::field(a, _artistSimilarity, "artist_similarity");
            Wt::Dbo::field(a, _titleSimilarity, "title_similarity");
            Wt::Dbo::field(a, _distance, "distance");
            Wt::Dbo::field(a, _status, "status");
            Wt::Dbo::field(a, _occurrenceCount, "occurrence_count");
            Wt::Dbo::field(a, _lastSeen, "last_seen");

            Wt::Dbo::belongsTo(a, _suggestedWork, "suggested_work", Wt::Dbo::OnDeleteCascade);
        }

    private:
        friend class Session;

        MatchReview(std::string_view signature, std::string_view rawArtist, std::string_view rawTitle);
        static pointer create(Session& session, std::string_view signature, std::string_view rawArtist, std::string_view rawTitle);

        std::string _signature;
        std::string _rawArtist;
        std::string _rawTitle;
        double _artistSimilarity{};
        double _titleSimilarity{};
        double _distance{};
        MatchReviewStatus _status{ MatchReviewStatus::Pending };
        int _occurrenceCount{};
        Wt::WDateTime _lastSeen;

        Wt::Dbo::ptr<Work> _suggestedWork;
    };
} // namespace blm::db
