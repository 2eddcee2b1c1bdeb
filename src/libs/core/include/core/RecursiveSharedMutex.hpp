/*
 * Copyright (C) 2021 Emeric Poupon
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
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <unordered_map>

namespace blm::core
{
    // API compatible with std::shared_mutex
    // The unique owner may take shared and unique locks again without deadlocking
    class RecursiveSharedMutex
    {
    public:
        void lock();
        void unlock();

        void lock_shared();
        void unlock_shared();

        bool isUniqueLocked() const;
        bool isSharedLocked() const;

    private:
        std::shared_mutex _mutex;
        std::thread::id _uniqueOwner;
        std::size_t _uniqueCount{};

        mutable std::mutex _sharedCountMutex;
        std::unordered_map<std::thread::id, std::size_t> _sharedCounts;
    };
} // namespace blm::core
