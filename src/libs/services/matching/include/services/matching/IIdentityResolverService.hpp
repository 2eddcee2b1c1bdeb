/*
 * Copyright (C) 2025 Emeric Poupon
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

#include <array>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "database/Types.hpp"

namespace blm::db
{
    class IDb;
}

namespace blm::matching
{
    // Names that look like collaborations but are single artists
    inline constexpr std::array<std::string_view, 9> defaultSplitExceptions{
        "AC/DC",
        "P!nk",
        "Panic! At The Disco",
        "Simon & Garfunkel",
        "Earth, Wind & Fire",
        "Hall & Oates",
        "Crosby, Stills, Nash & Young",
        "Peter, Paul and Mary",
        "Mumford & Sons",
    };

    struct SplitProposal
    {
        std::string rawArtist;
        std::vector<std::string> artists;
        db::ProposedSplitStatus status{ db::ProposedSplitStatus::Pending };
        double confidence{};
    };

    class IIdentityResolverService
    {
    public:
        virtual ~IIdentityResolverService() = default;

        // Maps each raw artist credit to its canonical form: the verified alias if any,
        // the "; " joined names of a detected collaboration (proposed for review), or the raw string itself
        virtual std::map<std::string, std::string> resolveBatch(std::span<const std::string> rawArtists) = 0;

        // Pure detection, nothing is persisted. At least two distinct names when set.
        virtual std::optional<std::vector<std::string>> detectSplit(std::string_view rawArtist) const = 0;

        // Human decisions, return false if there is no such proposal
        virtual bool approveSplit(std::string_view rawArtist) = 0;
        virtual bool rejectSplit(std::string_view rawArtist) = 0;
        virtual bool updateSplit(std::string_view rawArtist, std::span<const std::string> artists) = 0; // pending proposals only
        virtual std::vector<SplitProposal> findSplits(db::ProposedSplitStatus status, std::optional<db::Range> range = std::nullopt) = 0;

        virtual void addAlias(std::string_view rawArtist, std::string_view resolvedArtist, bool verified) = 0;
        virtual void markNoAlias(std::string_view rawArtist) = 0;
    };

    std::unique_ptr<IIdentityResolverService> createIdentityResolverService(db::IDb& db, std::span<const std::string> splitExceptions);
} // namespace blm::matching
