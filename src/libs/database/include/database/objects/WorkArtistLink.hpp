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

#include <Wt/Dbo/Field.h>

#include "database/IdType.hpp"
#include "database/Object.hpp"
#include "database/Types.hpp"
#include "database/objects/ArtistId.hpp"
#include "database/objects/WorkId.hpp"

BLM_DECLARE_IDTYPE(WorkArtistLinkId)

namespace blm::db
{
    class Artist;
    class Session;
    class Work;

    class WorkArtistLink final : public Object<WorkArtistLink, WorkArtistLinkId>
    {
    public:
        WorkArtistLink() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, WorkArtistLinkId linkId);
        static pointer find(Session& session, WorkId work, ArtistId artist);
        static void find(Session& session, WorkId work, const std::function<void(const pointer&, const ObjectPtr<Artist>&)>& func);

        // accessors
        ObjectPtr<Work> getWork() const;
        ObjectPtr<Artist> getArtist() const;
        WorkId getWorkId() const { return _work.id(); }
        ArtistId getArtistId() const { return _artist.id(); }
        WorkArtistRole getRole() const { return _role; }

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _role, "role");

            Wt::Dbo::belongsTo(a, _work, "work", Wt::Dbo::OnDeleteCascade);
            Wt::Dbo::belongsTo(a, _artist, "artist", Wt::Dbo::OnDeleteCascade);
        }

    private:
        friend class Session;

        WorkArtistLink(const ObjectPtr<Work>& work, const ObjectPtr<Artist>& artist, WorkArtistRole role);
        static pointer create(Session& session, const ObjectPtr<Work>& work, const ObjectPtr<Artist>& artist, WorkArtistRole role);

        WorkArtistRole _role{ WorkArtistRole::Primary };

        Wt::Dbo::ptr<Work> _work;
        Wt::Dbo::ptr<Artist> _artist;
    };
} // namespace blm::db
