/*
 * Copyright (C) 2021 Emeric Poupon
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

#include <compare>
#include <functional>
#include <string>

namespace blm::db
{
    // Row id, invalid until the object is persisted
    class IdType
    {
    public:
        using ValueType = long long;

        IdType() = default;
        IdType(ValueType id)
            : _id{ id } {}

        bool isValid() const { return _id != invalidValue; }
        std::string toString() const { return std::to_string(_id); }

        ValueType getValue() const { return _id; }
        auto operator<=>(const IdType& other) const = default;

    private:
        static constexpr ValueType invalidValue{ -1 };
        ValueType _id{ invalidValue };
    };
} // namespace blm::db

#define BLM_DECLARE_IDTYPE(name)                                             \
    namespace blm::db                                                        \
    {                                                                        \
        class name : public IdType                                           \
        {                                                                    \
        public:                                                              \
            using IdType::IdType;                                            \
            auto operator<=>(const name& other) const = default;             \
        };                                                                   \
    }                                                                        \
    namespace std                                                            \
    {                                                                        \
        template<>                                                           \
        class hash<blm::db::name>                                            \
        {                                                                    \
        public:                                                              \
            size_t operator()(blm::db::name id) const                        \
            {                                                                \
                return std::hash<blm::db::name::ValueType>()(id.getValue()); \
            }                                                                \
        };                                                                   \
    } // ns std
