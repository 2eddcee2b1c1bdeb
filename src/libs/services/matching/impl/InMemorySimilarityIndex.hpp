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

#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "services/matching/ISimilarityIndex.hpp"

namespace blm::matching
{
    class InMemorySimilarityIndex final : public ISimilarityIndex
    {
    public:
        InMemorySimilarityIndex() = default;
        ~InMemorySimilarityIndex() override = default;
        InMemorySimilarityIndex(const InMemorySimilarityIndex&) = delete;
        InMemorySimilarityIndex& operator=(const InMemorySimilarityIndex&) = delete;

    private:
        void add(db::RecordingId recording, std::string_view artist, std::string_view title) override;
        void addBatch(std::span<const IndexEntry> entries) override;
        void clear() override;
        std::size_t size() const override;

        std::vector<IndexCandidate> search(std::string_view artist, std::string_view title, std::size_t limit) override;
        std::vector<std::vector<IndexCandidate>> searchBatch(std::span<const MatchQuery> queries, std::size_t limit) override;

        struct Profile
        {
            std::unordered_map<std::string, unsigned> trigramCounts;
            double norm{};
        };
        static Profile computeProfile(std::string_view artist, std::string_view title);
        static double computeDistance(const Profile& a, const Profile& b);
        std::vector<IndexCandidate> searchProfile(const Profile& profile, std::size_t limit) const;

        mutable std::shared_mutex _mutex;
        std::unordered_map<db::RecordingId, Profile> _profiles;
    };
} // namespace blm::matching
