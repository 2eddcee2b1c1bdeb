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
#include <string_view>

#include "core/Exception.hpp"
#include "database/objects/WorkId.hpp"

namespace blm::matching
{
    class Exception : public core::BlmException
    {
    public:
        using BlmException::BlmException;
    };

    // The signature is already bridged (or was revoked) and cannot be mapped to the requested work
    class DuplicateSignatureException : public Exception
    {
    public:
        DuplicateSignatureException(std::string_view signature, db::WorkId existingWork, db::WorkId requestedWork)
            : Exception{ "Signature '" + std::string{ signature } + "' already bridged to work " + existingWork.toString() + ", cannot bridge to work " + requestedWork.toString() }
            , _signature{ signature }
            , _existingWork{ existingWork }
            , _requestedWork{ requestedWork }
        {
        }

        const std::string& getSignature() const { return _signature; }
        db::WorkId getExistingWork() const { return _existingWork; }
        db::WorkId getRequestedWork() const { return _requestedWork; }

    private:
        std::string _signature;
        db::WorkId _existingWork;
        db::WorkId _requestedWork;
    };

    class SimilarityIndexException : public Exception
    {
    public:
        using Exception::Exception;
    };
} // namespace blm::matching
