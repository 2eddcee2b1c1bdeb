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

#include "TransactionChecker.hpp"

#if BLM_CHECK_TRANSACTION_ACCESSES

    #include <algorithm>
    #include <cassert>
    #include <vector>

namespace blm::db
{
    namespace
    {
        struct StackEntry
        {
            TransactionChecker::TransactionType type;
            const Wt::Dbo::Session* session{};
        };

        // each thread works on its own session, nested transactions must target the same one
        thread_local std::vector<StackEntry> transactionStack;
    } // namespace

    void TransactionChecker::pushWriteTransaction(const Wt::Dbo::Session& session)
    {
        pushTransaction(TransactionType::Write, session);
    }

    void TransactionChecker::pushReadTransaction(const Wt::Dbo::Session& session)
    {
        pushTransaction(TransactionType::Read, session);
    }

    void TransactionChecker::popWriteTransaction(const Wt::Dbo::Session& session)
    {
        popTransaction(TransactionType::Write, session);
    }

    void TransactionChecker::popReadTransaction(const Wt::Dbo::Session& session)
    {
        popTransaction(TransactionType::Read, session);
    }

    void TransactionChecker::pushTransaction(TransactionType type, const Wt::Dbo::Session& session)
    {
        assert(transactionStack.empty() || transactionStack.back().session == &session);
        transactionStack.push_back(StackEntry{ type, &session });
    }

    void TransactionChecker::popTransaction(TransactionType type, const Wt::Dbo::Session& session)
    {
        assert(!transactionStack.empty());
        assert(transactionStack.back().type == type);
        assert(transactionStack.back().session == &session);
        transactionStack.pop_back();
    }

    void TransactionChecker::checkWriteTransaction(const Wt::Dbo::Session& session)
    {
        // a write transaction may have been opened before a nested read one
        assert(std::any_of(transactionStack.cbegin(), transactionStack.cend(), [&](const StackEntry& entry) { return entry.type == TransactionType::Write && entry.session == &session; }));
    }

    void TransactionChecker::checkReadTransaction(const Wt::Dbo::Session& session)
    {
        assert(!transactionStack.empty());
        assert(transactionStack.back().session == &session);
    }
} // namespace blm::db

#endif
