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
#include <span>
#include <string>
#include <string_view>

#include <Wt/Dbo/Field.h>

#include "database/IdType.hpp"
#include "database/Object.hpp"

BLM_DECLARE_IDTYPE(ArtistAliasId)

namespace blm::db
{
    class Session;

    // Maps a raw artist credit to its canonical form. Raw names are compared case insensitively.
    // A "null" alias is a negative cache entry: the raw name resolves to itself.
    class ArtistAlias final : public Object<ArtistAlias, ArtistAliasId>
    {
    public:
        ArtistAlias() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, ArtistAliasId id);
        static pointer find(Session& session, std::string_view rawName);
        static void find(Session& session, std::span<const std::string> rawNames, const std::function<void(const pointer&)>& func);

        // accessors
        std::string_view getRawName() const { return _rawName; }
        std::string_view getResolvedName() const { return _isNull ? std::string_view{ _rawName } : std::string_view{ _resolvedName }; }
        bool isNull() const { return _isNull; }
        bool isVerified() const { return _isVerified; }

        // setters
        void setResolvedName(std::string_view resolvedName);
        void setNull();
        void setVerified(bool verified) { _isVerified = verified; }

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _rawName, "raw_name");
            Wt::Dbo::field(a, _resolvedName, "resolved_name");
            Wt::Dbo::field(a, _isNull, "is_null");
            Wt::Dbo::field(a, _isVerified, "is_verified");
        }

    private:
        friend class Session;

        ArtistAlias(std::string_view rawName);
        static pointer create(Session& session, std::string_view rawName);

        std::string _rawName;
        std::string _resolvedName;
        bool _isNull{ true };
        bool _isVerified{};
    };
} // namespace blm::db
