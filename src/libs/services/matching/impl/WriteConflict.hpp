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

#include <chrono>
#include <cstddef>
#include <thread>

namespace blm::matching::writeConflict
{
    // Another connection on the same database file may hold the write lock or have inserted the same row:
    // sqlite does not wait for a read transaction that upgrades to write
    static inline constexpr std::size_t maxAttempts{ 5 };

    inline void waitBeforeNextAttempt(std::size_t attempt)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds{ 20 } * attempt);
    }
} // namespace blm::matching::writeConflict
