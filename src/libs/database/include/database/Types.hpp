/*
 * Copyright (C) 2013 Emeric Poupon
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

#include "core/Exception.hpp"

namespace blm::db
{
    class Exception : public core::BlmException
    {
    public:
        using BlmException::BlmException;
    };

    struct Range
    {
        std::size_t offset{};
        std::size_t size{};
    };

    // How a broadcast log got linked to its work
    enum class MatchReason
    {
        None = 0,
        IdentityBridge = 1,
        ExactMatch = 2,
        VariantMatch = 3,
        VectorMatch = 4,
        ReviewAccepted = 5,
    };

    enum class WorkArtistRole
    {
        Primary = 0,
        Featured = 1,
        Composer = 2,
    };

    enum class ProposedSplitStatus
    {
        Pending = 0,
        Approved = 1,
        Rejected = 2,
    };

    enum class MatchReviewStatus
    {
        Pending = 0,
        Accepted = 1,
        Dismissed = 2,
    };
} // namespace blm::db
