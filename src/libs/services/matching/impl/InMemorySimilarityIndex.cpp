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

#include "InMemorySimilarityIndex.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>

#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace blm::matching
{
    std::unique_ptr<ISimilarityIndex> createInMemorySimilarityIndex()
    {
        return std::make_unique<InMemorySimilarityIndex>();
    }

    void InMemorySimilarityIndex::add(db::RecordingId recording, std::string_view artist, std::string_view title)
    {
        Profile profile{ computeProfile(artist, title) };

        std::unique_lock lock{ _mutex };
        _profiles.insert_or_assign(recording, std::move(profile));
    }

    void InMemorySimilarityIndex::addBatch(std::span<const IndexEntry> entries)
    {
        std::vector<std::pair<db::RecordingId, Profile>> profiles;
        profiles.reserve(entries.size());
        for (const IndexEntry& entry : entries)
            profiles.emplace_back(entry.recording, computeProfile(entry.artist, entry.title));

        {
            std::unique_lock lock{ _mutex };
            for (auto& [recording, profile] : profiles)
                _profiles.insert_or_assign(recording, std::move(profile));
        }

        BLM_LOG(INDEX, DEBUG, "Added " << entries.size() << " entries, index size = " << size());
    }

    void InMemorySimilarityIndex::clear()
    {
        std::unique_lock lock{ _mutex };
        _profiles.clear();
    }

    std::size_t InMemorySimilarityIndex::size() const
    {
        std::shared_lock lock{ _mutex };
        return _profiles.size();
    }

    std::vector<IndexCandidate> InMemorySimilarityIndex::search(std::string_view artist, std::string_view title, std::size_t limit)
    {
        const Profile profile{ computeProfile(artist, title) };

        std::shared_lock lock{ _mutex };
        return searchProfile(profile, limit);
    }

    std::vector<std::vector<IndexCandidate>> InMemorySimilarityIndex::searchBatch(std::span<const MatchQuery> queries, std::size_t limit)
    {
        std::vector<std::vector<IndexCandidate>> res;
        res.reserve(queries.size());

        std::shared_lock lock{ _mutex };
        for (const MatchQuery& query : queries)
            res.push_back(searchProfile(computeProfile(query.artist, query.title), limit));

        return res;
    }

    InMemorySimilarityIndex::Profile InMemorySimilarityIndex::computeProfile(std::string_view artist, std::string_view title)
    {
        std::string text{ " " };
        text += core::stringUtils::stringToLower(artist);
        text += " - ";
        text += core::stringUtils::stringToLower(title);
        text += " ";

        Profile profile;
        for (std::size_t i{}; i + 3 <= text.size(); ++i)
            profile.trigramCounts[text.substr(i, 3)]++;

        double squaredNorm{};
        for (const auto& [trigram, count] : profile.trigramCounts)
            squaredNorm += static_cast<double>(count) * count;
        profile.norm = std::sqrt(squaredNorm);

        return profile;
    }

    double InMemorySimilarityIndex::computeDistance(const Profile& a, const Profile& b)
    {
        if (a.norm == 0 || b.norm == 0)
            return 1.0;

        const Profile& smaller{ a.trigramCounts.size() < b.trigramCounts.size() ? a : b };
        const Profile& bigger{ &smaller == &a ? b : a };

        double dotProduct{};
        for (const auto& [trigram, count] : smaller.trigramCounts)
        {
            if (const auto it{ bigger.trigramCounts.find(trigram) }; it != std::cend(bigger.trigramCounts))
                dotProduct += static_cast<double>(count) * it->second;
        }

        return std::clamp(1.0 - dotProduct / (a.norm * b.norm), 0.0, 1.0);
    }

    std::vector<IndexCandidate> InMemorySimilarityIndex::searchProfile(const Profile& profile, std::size_t limit) const
    {
        std::vector<IndexCandidate> candidates;
        candidates.reserve(_profiles.size());
        for (const auto& [recording, entryProfile] : _profiles)
            candidates.push_back(IndexCandidate{ recording, computeDistance(profile, entryProfile) });

        const auto compare{ [](const IndexCandidate& lhs, const IndexCandidate& rhs) {
            if (lhs.distance != rhs.distance)
                return lhs.distance < rhs.distance;
            return lhs.recording < rhs.recording;
        } };

        if (candidates.size() > limit)
        {
            std::partial_sort(std::begin(candidates), std::begin(candidates) + static_cast<std::ptrdiff_t>(limit), std::end(candidates), compare);
            candidates.resize(limit);
        }
        else
            std::sort(std::begin(candidates), std::end(candidates), compare);

        return candidates;
    }
} // namespace blm::matching
