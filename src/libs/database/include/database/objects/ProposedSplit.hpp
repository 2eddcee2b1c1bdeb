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
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <Wt/Dbo/Field.h>
#include <Wt/WDateTime.h>

#include "database/IdType.hpp"
#include "database/Object.hpp"
#include "database/Types.hpp"

BLM_DECLARE_IDTYPE(ProposedSplitId)

namespace blm::db
{
    class Session;

    // Collaboration credit split awaiting a human decision, at most one per raw artist
    class ProposedSplit final : public Object<ProposedSplit, ProposedSplitId>
    {
    public:
        ProposedSplit() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, ProposedSplitId id);
        static pointer find(Session& session, std::string_view rawArtist);
        static void find(Session& session, std::span<const std::string> rawArtists, const std::function<void(const pointer&)>& func);
        static void find(Session& session, ProposedSplitStatus status, std::optional<Range> range, const std::function<void(const pointer&)>& func);

        // accessors
        std::string_view getRawArtist() const { return _rawArtist; }
        std::vector<std::string> getProposedArtists() const;
        ProposedSplitStatus getStatus() const { return _status; }
        double getConfidence() const { return _confidence; }
        const Wt::WDateTime& getCreatedAt() const { return _createdAt; }

        // setters
        void setProposedArtists(std::span<const std::string> artists);
        void setStatus(ProposedSplitStatus status) { _status = status; }

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _rawArtist, "raw_artist");
            Wt::Dbo::field(a, _proposedArtists, "proposed_artists");
            Wt::Dbo::field(a, _status, "status");
            Wt::Dbo::field(a, _confidence, "confidence");
            Wt::Dbo::field(a, _createdAt, "created_at");
        }

    private:
        friend class Session;

        ProposedSplit(std::string_view rawArtist, std::span<const std::string> artists, double confidence);
        static pointer create(Session& session, std::string_view rawArtist, std::span<const std::string> artists, double confidence);

        std::string _rawArtist;
        std::string _proposedArtists; // escaped list
        ProposedSplitStatus _status{ ProposedSplitStatus::Pending };
        double _confidence{};
        Wt::WDateTime _createdAt;
    };
} // namespace blm::db
