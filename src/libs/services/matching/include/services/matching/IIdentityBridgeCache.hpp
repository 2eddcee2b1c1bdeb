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

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <Wt/WDateTime.h>

#include "database/objects/WorkId.hpp"

namespace blm::db
{
    class IDb;
}

namespace blm::matching
{
    struct BridgeHit
    {
        db::WorkId work;
        double confidence{};
    };

    struct BridgeInfo
    {
        std::string signature;
        std::string referenceArtist;
        std::string referenceTitle;
        db::WorkId work;
        double confidence{};
        bool revoked{};
        Wt::WDateTime createdAt;
    };

    // Persistent signature -> work mapping. Revoked entries are kept for audit but never returned by lookups.
    class IIdentityBridgeCache
    {
    public:
        virtual ~IIdentityBridgeCache() = default;

        virtual std::optional<BridgeHit> lookup(std::string_view signature) = 0;
        // single query, only active entries are reported
        virtual std::unordered_map<std::string, BridgeHit> lookupBatch(std::span<const std::string> signatures) = 0;

        // Returns true if an active entry now maps the signature to work (no-op if it already did).
        // Returns false if the signature has been revoked: the revoked entry is kept and nothing is recorded.
        // Throws DuplicateSignatureException if an active entry maps the signature to another work.
        virtual bool record(std::string_view signature, std::string_view referenceArtist, std::string_view referenceTitle, db::WorkId work, double confidence) = 0;

        // returns false if there was no active entry for this signature
        virtual bool revoke(std::string_view signature) = 0;

        virtual std::vector<BridgeInfo> findBridges(db::WorkId work) = 0;
    };

    std::unique_ptr<IIdentityBridgeCache> createIdentityBridgeCache(db::IDb& db);
} // namespace blm::matching
