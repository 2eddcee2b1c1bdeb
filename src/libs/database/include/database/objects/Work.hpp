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

#include "database/Object.hpp"
#include "database/Types.hpp"
#include "database/objects/ArtistId.hpp"
#include "database/objects/WorkId.hpp"

namespace blm::db
{
    class Artist;
    class Session;

    // Unit of identity: every recording, bridge and matched log points to a work
    class Work final : public Object<Work, WorkId>
    {
    public:
        static constexpr std::size_t maxTitleLength{ 512 };

        Work() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, WorkId id);
        static void find(Session& session, std::optional<Range> range, const std::function<void(const pointer&)>& func);
        static pointer find(Session& session, ArtistId primaryArtist, std::string_view normalizedTitle);

        // Calls func for each (normalized artist name, normalized title, work) where the title is one of
        // the given ones. Every artist linked to the work is reported, ordered by work id.
        static void findByNormalizedTitles(Session& session, std::span<const std::string> normalizedTitles, const std::function<void(std::string_view normalizedArtistName, std::string_view normalizedTitle, WorkId work)>& func);

        // accessors
        std::string_view getTitle() const { return _title; }
        std::string_view getNormalizedTitle() const { return _normalizedTitle; }
        bool isInstrumental() const { return _isInstrumental; }
        ObjectPtr<Artist> getPrimaryArtist() const;
        ArtistId getPrimaryArtistId() const;
        std::vector<ObjectPtr<Artist>> getArtists() const; // primary artist first, then co-artists

        // setters
        void setTitle(std::string_view title, std::string_view normalizedTitle);
        void setInstrumental(bool instrumental) { _isInstrumental = instrumental; }

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _title, "title");
            Wt::Dbo::field(a, _normalizedTitle, "normalized_title");
            Wt::Dbo::field(a, _isInstrumental, "is_instrumental");

            Wt::Dbo::belongsTo(a, _primaryArtist, "primary_artist", Wt::Dbo::OnDeleteCascade);
        }

    private:
        friend class Session;

        Work(const ObjectPtr<Artist>& primaryArtist, std::string_view title, std::string_view normalizedTitle);
        static pointer create(Session& session, const ObjectPtr<Artist>& primaryArtist, std::string_view title, std::string_view normalizedTitle);

        std::string _title;
        std::string _normalizedTitle;
        bool _isInstrumental{};

        Wt::Dbo::ptr<Artist> _primaryArtist;
    };
} // namespace blm::db
