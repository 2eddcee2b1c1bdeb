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

#include "services/matching/IIdentityBridgeCache.hpp"

namespace blm::db
{
    class IdentityBridge;
    template<typename T>
    class ObjectPtr;
} // namespace blm::db

namespace blm::matching
{
    class IdentityBridgeCache final : public IIdentityBridgeCache
    {
    public:
        IdentityBridgeCache(db::IDb& db);
        ~IdentityBridgeCache() override = default;
        IdentityBridgeCache(const IdentityBridgeCache&) = delete;
        IdentityBridgeCache& operator=(const IdentityBridgeCache&) = delete;

    private:
        std::optional<BridgeHit> lookup(std::string_view signature) override;
        std::unordered_map<std::string, BridgeHit> lookupBatch(std::span<const std::string> signatures) override;
        bool record(std::string_view signature, std::string_view referenceArtist, std::string_view referenceTitle, db::WorkId work, double confidence) override;
        bool revoke(std::string_view signature) override;
        std::vector<BridgeInfo> findBridges(db::WorkId work) override;

        bool tryCreate(std::string_view signature, std::string_view referenceArtist, std::string_view referenceTitle, db::WorkId work, double confidence);
        static bool checkExistingEntry(const db::ObjectPtr<db::IdentityBridge>& bridge, db::WorkId requestedWork);

        db::IDb& _db;
    };
} // namespace blm::matching
