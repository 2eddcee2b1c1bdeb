/*
 * Copyright (C) 2023 Emeric Poupon
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

#include "Utils.hpp"

namespace blm::db::utils
{
    Wt::WDateTime normalizeDateTime(const Wt::WDateTime& dateTime)
    {
        // force second resolution
        return Wt::WDateTime::fromTime_t(dateTime.toTime_t());
    }

    std::string makeInClausePlaceholders(std::size_t count)
    {
        std::string res;
        res.reserve(count * 2);

        for (std::size_t i{}; i < count; ++i)
        {
            if (i != 0)
                res += ',';
            res += '?';
        }

        return res;
    }
} // namespace blm::db::utils
