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

#include <string>
#include <vector>

#include "services/matching/IIdentityResolverService.hpp"

namespace blm::matching
{
    class IdentityResolverService final : public IIdentityResolverService
    {
    public:
        IdentityResolverService(db::IDb& db, std::span<const std::string> splitExceptions);
        ~IdentityResolverService() override = default;
        IdentityResolverService(const IdentityResolverService&) = delete;
        IdentityResolverService& operator=(const IdentityResolverService&) = delete;

    private:
        std::map<std::string, std::string> resolveBatch(std::span<const std::string> rawArtists) override;
        std::optional<std::vector<std::string>> detectSplit(std::string_view rawArtist) const override;

        bool approveSplit(std::string_view rawArtist) override;
        bool rejectSplit(std::string_view rawArtist) override;
        bool updateSplit(std::string_view rawArtist, std::span<const std::string> artists) override;
        std::vector<SplitProposal> findSplits(db::ProposedSplitStatus status, std::optional<db::Range> range) override;

        void addAlias(std::string_view rawArtist, std::string_view resolvedArtist, bool verified) override;
        void markNoAlias(std::string_view rawArtist) override;

        const std::string* findSplitException(std::string_view rawArtist) const;
        std::string formatArtistName(std::string_view name) const; // configured spelling for known names
        void proposeSplit(const std::string& rawArtist, std::span<const std::string> artists);

        db::IDb& _db;
        std::vector<std::string> _splitExceptions;
    };
} // namespace blm::matching
