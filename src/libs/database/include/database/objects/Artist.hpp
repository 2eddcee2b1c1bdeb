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

#include "database/Object.hpp"
#include "database/Types.hpp"
#include "database/objects/ArtistId.hpp"

namespace blm::db
{
    class Session;

    class Artist final : public Object<Artist, ArtistId>
    {
    public:
        static constexpr std::size_t maxNameLength{ 512 };

        Artist() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, ArtistId id);
        static pointer find(Session& session, std::string_view name);
        static void findByNormalizedName(Session& session, std::string_view normalizedName, const std::function<void(const pointer&)>& func);
        static void find(Session& session, std::optional<Range> range, const std::function<void(const pointer&)>& func);

        // accessors
        std::string_view getName() const { return _name; }
        std::string_view getNormalizedName() const { return _normalizedName; }

        // setters
        void setName(std::string_view name, std::string_view normalizedName);

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _name, "name");
            Wt::Dbo::field(a, _normalizedName, "normalized_name");
        }

    private:
        friend class Session;

        Artist(std::string_view name, std::string_view normalizedName);
        static pointer create(Session& session, std::string_view name, std::string_view normalizedName);

        std::string _name;
        std::string _normalizedName;
    };
} // namespace blm::db
