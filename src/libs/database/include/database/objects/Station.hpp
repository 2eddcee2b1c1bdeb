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
#include <string>
#include <string_view>

#include <Wt/Dbo/Field.h>

#include "database/Object.hpp"
#include "database/objects/StationId.hpp"

namespace blm::db
{
    class Session;

    class Station final : public Object<Station, StationId>
    {
    public:
        Station() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, StationId id);
        static pointer find(Session& session, std::string_view name);

        std::string_view getName() const { return _name; }

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _name, "name");
        }

    private:
        friend class Session;

        Station(std::string_view name);
        static pointer create(Session& session, std::string_view name);

        std::string _name;
    };
} // namespace blm::db
