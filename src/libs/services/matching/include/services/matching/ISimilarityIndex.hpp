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

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "database/objects/RecordingId.hpp"
#include "services/matching/Types.hpp"

namespace blm::matching
{
    struct IndexEntry
    {
        db::RecordingId recording;
        std::string artist;
        std::string title;
    };

    struct IndexCandidate
    {
        db::RecordingId recording;
        double distance{}; // 0 means identical
    };

    // Nearest neighbour search over catalog recordings.
    // Implementations may throw SimilarityIndexException.
    class ISimilarityIndex
    {
    public:
        virtual ~ISimilarityIndex() = default;

        // an existing entry with the same recording is replaced
        virtual void add(db::RecordingId recording, std::string_view artist, std::string_view title) = 0;
        virtual void addBatch(std::span<const IndexEntry> entries) = 0;
        virtual void clear() = 0;
        virtual std::size_t size() const = 0;

        // candidates are sorted by ascending distance
        virtual std::vector<IndexCandidate> search(std::string_view artist, std::string_view title, std::size_t limit) = 0;
        // one result list per query, in query order
        virtual std::vector<std::vector<IndexCandidate>> searchBatch(std::span<const MatchQuery> queries, std::size_t limit) = 0;
    };

    // Cosine distance between character trigram profiles of "artist - title"
    std::unique_ptr<ISimilarityIndex> createInMemorySimilarityIndex();
} // namespace blm::matching
