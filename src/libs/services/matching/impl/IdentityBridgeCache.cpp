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

#include "IdentityBridgeCache.hpp"

#include <Wt/Dbo/Exception.h>

#include "core/ILogger.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/IdentityBridge.hpp"
#include "database/objects/Work.hpp"
#include "services/matching/Exception.hpp"

#include "WriteConflict.hpp"

namespace blm::matching
{
    std::unique_ptr<IIdentityBridgeCache> createIdentityBridgeCache(db::IDb& db)
    {
        return std::make_unique<IdentityBridgeCache>(db);
    }

    IdentityBridgeCache::IdentityBridgeCache(db::IDb& db)
        : _db{ db }
    {
    }

    std::optional<BridgeHit> IdentityBridgeCache::lookup(std::string_view signature)
    {
        if (signature.empty())
            return std::nullopt;

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        const db::IdentityBridge::pointer bridge{ db::IdentityBridge::find(session, signature) };
        if (!bridge || bridge->isRevoked())
            return std::nullopt;

        return BridgeHit{ bridge->getWorkId(), bridge->getConfidence() };
    }

    std::unordered_map<std::string, BridgeHit> IdentityBridgeCache::lookupBatch(std::span<const std::string> signatures)
    {
        std::unordered_map<std::string, BridgeHit> res;
        if (signatures.empty())
            return res;

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        db::IdentityBridge::findActive(session, signatures, [&](std::string_view signature, db::WorkId work, double confidence) {
            res.emplace(signature, BridgeHit{ work, confidence });
        });

        return res;
    }

    bool IdentityBridgeCache::record(std::string_view signature, std::string_view referenceArtist, std::string_view referenceTitle, db::WorkId work, double confidence)
    {
        if (signature.empty())
            throw Exception{ "Cannot bridge an empty signature" };

        for (std::size_t attempt{ 1 };; ++attempt)
        {
            try
            {
                return tryCreate(signature, referenceArtist, referenceTitle, work, confidence);
            }
            catch (const Wt::Dbo::Exception& e)
            {
                {
                    db::Session& session{ _db.getTLSSession() };
                    auto transaction{ session.createReadTransaction() };

                    // inserted meanwhile through another connection
                    if (const db::IdentityBridge::pointer bridge{ db::IdentityBridge::find(session, signature) })
                        return checkExistingEntry(bridge, work);
                }

                if (attempt == writeConflict::maxAttempts)
                    throw Exception{ "Cannot record bridge for signature '" + std::string{ signature } + "': " + e.what() };

                BLM_LOG(MATCHING, DEBUG, "Cannot insert bridge for '" << signature << "': " << e.what() << ", retrying");
                writeConflict::waitBeforeNextAttempt(attempt);
            }
        }
    }

    bool IdentityBridgeCache::tryCreate(std::string_view signature, std::string_view referenceArtist, std::string_view referenceTitle, db::WorkId work, double confidence)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        if (const db::IdentityBridge::pointer bridge{ db::IdentityBridge::find(session, signature) })
            return checkExistingEntry(bridge, work);

        const db::Work::pointer workObj{ db::Work::find(session, work) };
        if (!workObj)
            throw Exception{ "Cannot bridge '" + std::string{ signature } + "': work " + work.toString() + " not found" };

        session.create<db::IdentityBridge>(signature, referenceArtist, referenceTitle, workObj, confidence);
        BLM_LOG(MATCHING, DEBUG, "Bridged '" << signature << "' to work " << work.toString() << ", confidence = " << confidence);

        return true;
    }

    bool IdentityBridgeCache::checkExistingEntry(const db::IdentityBridge::pointer& bridge, db::WorkId requestedWork)
    {
        if (bridge->isRevoked())
        {
            BLM_LOG(MATCHING, DEBUG, "Not bridging '" << bridge->getSignature() << "' to work " << requestedWork.toString() << ": signature revoked");
            return false;
        }

        if (bridge->getWorkId() == requestedWork)
            return true;

        BLM_LOG(MATCHING, WARNING, "Bridge conflict for '" << bridge->getSignature() << "': active entry on work " << bridge->getWorkId().toString() << ", requested work " << requestedWork.toString());
        throw DuplicateSignatureException{ bridge->getSignature(), bridge->getWorkId(), requestedWork };
    }

    bool IdentityBridgeCache::revoke(std::string_view signature)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        db::IdentityBridge::pointer bridge{ db::IdentityBridge::find(session, signature) };
        if (!bridge || bridge->isRevoked())
            return false;

        bridge.modify()->setRevoked(true);
        BLM_LOG(MATCHING, INFO, "Revoked bridge '" << signature << "' to work " << bridge->getWorkId().toString());

        return true;
    }

    std::vector<BridgeInfo> IdentityBridgeCache::findBridges(db::WorkId work)
    {
        std::vector<BridgeInfo> res;

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        db::IdentityBridge::find(session, work, [&](const db::IdentityBridge::pointer& bridge) {
            BridgeInfo& info{ res.emplace_back() };
            info.signature = bridge->getSignature();
            info.referenceArtist = bridge->getReferenceArtist();
            info.referenceTitle = bridge->getReferenceTitle();
            info.work = bridge->getWorkId();
            info.confidence = bridge->getConfidence();
            info.revoked = bridge->isRevoked();
            info.createdAt = bridge->getCreatedAt();
        });

        return res;
    }
} // namespace blm::matching
