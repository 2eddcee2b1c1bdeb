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
#include <Wt/WDateTime.h>

#include "database/IdType.hpp"
#include "database/Object.hpp"
#include "database/objects/WorkId.hpp"

BLM_DECLARE_IDTYPE(IdentityBridgeId)

namespace blm::db
{
    class Session;
    class Work;

    // Verified mapping from a normalized (artist, title) signature to a work.
    // Entries are never overwritten: they can only be revoked, and stay for audit.
    class IdentityBridge final : public Object<IdentityBridge, IdentityBridgeId>
    {
    public:
        static constexpr std::size_t maxSignatureLength{ 1024 };

        IdentityBridge() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, IdentityBridgeId id);
        static pointer find(Session& session, std::string_view signature); // revoked entries included
        static void find(Session& session, WorkId work, const std::function<void(const pointer&)>& func);

        // Reports the work of each non revoked entry whose signature is among the given ones
        static void findActive(Session& session, std::span<const std::string> signatures, const std::function<void(std::string_view signature, WorkId work, double confidence)>& func);

        // accessors
        std::string_view getSignature() const { return _signature; }
        std::string_view getReferenceArtist() const { return _referenceArtist; }
        std::string_view getReferenceTitle() const { return _referenceTitle; }
        double getConfidence() const { return _confidence; }
        bool isRevoked() const { return _isRevoked; }
        const Wt::WDateTime& getCreatedAt() const { return _createdAt; }
        WorkId getWorkId() const { return _work.id(); }

        // setters
        void setRevoked(bool revoked) { _isRevoked = revoked; }

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _signature, "signature");
            Wt::Dbo::field(a, _referenceArtist, "reference_artist");
            Wt::Dbo::field(a, _referenceTitle, "reference_title");
            Wt::Dbo::field(a, _confidence, "confidence");
            Wt::Dbo::field(a, _isRevoked, "is_revoked");
            Wt::Dbo::field(a, _createdAt, "created_at");

            Wt::Dbo::belongsTo(a, _work, "work", Wt::Dbo::OnDeleteCascade);
        }

    private:
        friend class Session;

        IdentityBridge(std::string_view signature, std::string_view referenceArtist, std::string_view referenceTitle, const ObjectPtr<Work>& work, double confidence);
        static pointer create(Session& session, std::string_view signature, std::string_view referenceArtist, std::string_view referenceTitle, const ObjectPtr<Work>& work, double confidence);

        std::string _signature;
        std::string _referenceArtist;
        std::string _referenceTitle;
        double _confidence{};
        bool _isRevoked{};
        Wt::WDateTime _createdAt;

        Wt::Dbo::ptr<Work> _work;
    };
} // namespace blm::db
