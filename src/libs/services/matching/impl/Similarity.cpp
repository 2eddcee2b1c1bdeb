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

#include "services/matching/Similarity.hpp"

#include <utility>
#include <vector>

namespace blm::matching
{
    namespace
    {
        struct CommonBlock
        {
            std::size_t posA{};
            std::size_t posB{};
            std::size_t size{};
        };

        // Longest common substring, the earliest one in a, then in b
        CommonBlock findLongestCommonBlock(std::string_view a, std::string_view b)
        {
            CommonBlock best;

            std::vector<std::size_t> previousRow(b.size() + 1);
            std::vector<std::size_t> currentRow(b.size() + 1);
            for (std::size_t i{}; i < a.size(); ++i)
            {
                for (std::size_t j{}; j < b.size(); ++j)
                {
                    currentRow[j + 1] = (a[i] == b[j]) ? previousRow[j] + 1 : 0;
                    if (currentRow[j + 1] > best.size)
                    {
                        best.size = currentRow[j + 1];
                        best.posA = i + 1 - best.size;
                        best.posB = j + 1 - best.size;
                    }
                }
                std::swap(previousRow, currentRow);
            }

            return best;
        }

        std::size_t countMatchingCharacters(std::string_view a, std::string_view b)
        {
            if (a.empty() || b.empty())
                return 0;

            const CommonBlock block{ findLongestCommonBlock(a, b) };
            if (block.size == 0)
                return 0;

            return block.size
                   + countMatchingCharacters(a.substr(0, block.posA), b.substr(0, block.posB))
                   + countMatchingCharacters(a.substr(block.posA + block.size), b.substr(block.posB + block.size));
        }
    } // namespace

    double computeSimilarity(std::string_view a, std::string_view b)
    {
        if (a.empty() && b.empty())
            return 1.0;

        return 2.0 * static_cast<double>(countMatchingCharacters(a, b)) / static_cast<double>(a.size() + b.size());
    }
} // namespace blm::matching
