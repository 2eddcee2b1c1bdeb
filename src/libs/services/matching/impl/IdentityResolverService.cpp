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

#include "IdentityResolverService.hpp"

#include <algorithm>
#include <array>
#include <regex>
#include <set>

#include <Wt/Dbo/Exception.h>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/ArtistAlias.hpp"
#include "database/objects/ProposedSplit.hpp"
#include "services/matching/Exception.hpp"
#include "services/matching/Normalizer.hpp"

#include "WriteConflict.hpp"

namespace blm::matching
{
    namespace
    {
        constexpr std::string_view joinedArtistsDelimiter{ "; " };
        constexpr double markedSplitConfidence{ 0.95 };
        constexpr double conjunctionSplitConfidence{ 0.7 };

        // Priority order
        const std::array<std::regex, 5> splitSeparatorRegexes{
            std::regex{ R"(\s+w/\s+)", std::regex::icase },
            std::regex{ R"(\s+f/\s+)", std::regex::icase },
            std::regex{ R"(\s+(?:featuring|feat|ft|with|and)\.?\s+)", std::regex::icase },
            std::regex{ R"(\s*&\s*)" },
            std::regex{ R"(\s*/\s*)" },
        };

        // Separators that can only mean a collaboration
        const std::regex collaborationMarkerRegex{ R"(/|\b(?:featuring|feat|ft|with)\b)", std::regex::icase };

        // Credit debris left at the edges of a name
        const std::regex leadingCreditRegex{ R"(^(?:featuring|feat\.?|ft\.?|w/|f/|with)\s+)", std::regex::icase };

        double computeSplitConfidence(std::string_view rawArtist)
        {
            const std::string str{ rawArtist };
            return std::regex_search(str, collaborationMarkerRegex) ? markedSplitConfidence : conjunctionSplitConfidence;
        }

        std::string joinArtists(std::span<const std::string> artists)
        {
            return core::stringUtils::joinStrings(artists, joinedArtistsDelimiter);
        }
    } // namespace

    std::unique_ptr<IIdentityResolverService> createIdentityResolverService(db::IDb& db, std::span<const std::string> splitExceptions)
    {
        return std::make_unique<IdentityResolverService>(db, splitExceptions);
    }

    IdentityResolverService::IdentityResolverService(db::IDb& db, std::span<const std::string> splitExceptions)
        : _db{ db }
    {
        for (const std::string& splitException : splitExceptions)
        {
            std::string_view trimmed{ core::stringUtils::stringTrim(splitException) };
            if (!trimmed.empty())
                _splitExceptions.emplace_back(trimmed);
        }

        BLM_LOG(IDENTITY, INFO, "Service started! " << _splitExceptions.size() << " split exceptions");
    }

    std::map<std::string, std::string> IdentityResolverService::resolveBatch(std::span<const std::string> rawArtists)
    {
        std::map<std::string, std::string> res;

        std::vector<std::string> uniqueRawArtists;
        for (const std::string& rawArtist : rawArtists)
        {
            if (res.try_emplace(rawArtist).second)
                uniqueRawArtists.push_back(rawArtist);
        }

        if (uniqueRawArtists.empty())
            return res;

        std::set<std::string> resolvedRawArtists;
        std::map<std::string, std::vector<std::string>> existingSplits;
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createReadTransaction() };

            // raw names are matched case insensitively
            db::ArtistAlias::find(session, uniqueRawArtists, [&](const db::ArtistAlias::pointer& alias) {
                for (const std::string& rawArtist : uniqueRawArtists)
                {
                    if (!core::stringUtils::stringCaseInsensitiveEqual(rawArtist, alias->getRawName()))
                        continue;

                    res[rawArtist] = alias->isNull() ? rawArtist : std::string{ alias->getResolvedName() };
                    resolvedRawArtists.insert(rawArtist);
                }
            });

            db::ProposedSplit::find(session, uniqueRawArtists, [&](const db::ProposedSplit::pointer& split) {
                existingSplits.emplace(split->getRawArtist(), split->getProposedArtists());
            });
        }

        std::size_t proposedCount{};
        for (const std::string& rawArtist : uniqueRawArtists)
        {
            if (resolvedRawArtists.contains(rawArtist))
                continue;

            const std::optional<std::vector<std::string>> artists{ detectSplit(rawArtist) };
            if (!artists)
            {
                res[rawArtist] = rawArtist;
                continue;
            }

            if (const auto itSplit{ existingSplits.find(rawArtist) }; itSplit != std::cend(existingSplits))
            {
                res[rawArtist] = joinArtists(itSplit->second);
                continue;
            }

            proposeSplit(rawArtist, *artists);
            res[rawArtist] = joinArtists(*artists);
            proposedCount++;
        }

        BLM_LOG(IDENTITY, DEBUG, "resolveBatch: " << uniqueRawArtists.size() << " distinct artists, " << resolvedRawArtists.size() << " aliased, " << proposedCount << " new splits");

        return res;
    }

    std::optional<std::vector<std::string>> IdentityResolverService::detectSplit(std::string_view rawArtist) const
    {
        const std::string_view trimmed{ core::stringUtils::stringTrim(rawArtist) };
        if (trimmed.empty() || findSplitException(trimmed))
            return std::nullopt;

        // "AC/DC feat. Axl Rose": known names are never split
        std::vector<std::string> protectedNames;
        const std::string protectedArtist{ normalizer::protectNames(trimmed, _splitExceptions, protectedNames) };

        // the first separator giving several names wins
        for (const std::regex& separatorRegex : splitSeparatorRegexes)
        {
            std::vector<std::string> artists;
            std::set<std::string> seenArtists;
            for (auto it{ std::sregex_token_iterator{ std::cbegin(protectedArtist), std::cend(protectedArtist), separatorRegex, -1 } }; it != std::sregex_token_iterator{}; ++it)
            {
                const std::string part{ normalizer::restoreNames(it->str(), protectedNames) };
                const std::string name{ std::regex_replace(std::string{ core::stringUtils::stringTrim(part) }, leadingCreditRegex, "") };
                if (normalizer::clean(name).empty())
                    continue;

                std::string artist{ formatArtistName(name) };
                if (seenArtists.insert(core::stringUtils::stringToLower(std::string_view{ artist })).second)
                    artists.push_back(std::move(artist));
            }

            if (artists.size() >= 2)
                return artists;
        }

        return std::nullopt;
    }

    const std::string* IdentityResolverService::findSplitException(std::string_view rawArtist) const
    {
        const auto it{ std::find_if(std::cbegin(_splitExceptions), std::cend(_splitExceptions), [&](const std::string& splitException) {
            return core::stringUtils::stringCaseInsensitiveEqual(splitException, rawArtist);
        }) };

        return it != std::cend(_splitExceptions) ? &*it : nullptr;
    }

    std::string IdentityResolverService::formatArtistName(std::string_view name) const
    {
        if (const std::string* splitException{ findSplitException(name) })
            return *splitException;

        return normalizer::toArtistTitleCase(name);
    }

    void IdentityResolverService::proposeSplit(const std::string& rawArtist, std::span<const std::string> artists)
    {
        const double confidence{ computeSplitConfidence(rawArtist) };

        for (std::size_t attempt{ 1 };; ++attempt)
        {
            try
            {
                db::Session& session{ _db.getTLSSession() };
                auto transaction{ session.createWriteTransaction() };

                if (db::ProposedSplit::find(session, rawArtist))
                    return;

                session.create<db::ProposedSplit>(rawArtist, artists, confidence);
                break;
            }
            catch (const Wt::Dbo::Exception& e)
            {
                {
                    db::Session& session{ _db.getTLSSession() };
                    auto transaction{ session.createReadTransaction() };

                    // proposed meanwhile through another connection
                    if (db::ProposedSplit::find(session, rawArtist))
                        return;
                }

                if (attempt == writeConflict::maxAttempts)
                    throw Exception{ "Cannot propose split for '" + rawArtist + "': " + e.what() };

                BLM_LOG(IDENTITY, DEBUG, "Cannot insert split proposal for '" << rawArtist << "': " << e.what() << ", retrying");
                writeConflict::waitBeforeNextAttempt(attempt);
            }
        }

        BLM_LOG(IDENTITY, INFO, "New split proposal for '" << rawArtist << "': '" << joinArtists(artists) << "', confidence = " << confidence);
    }

    bool IdentityResolverService::approveSplit(std::string_view rawArtist)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        db::ProposedSplit::pointer split{ db::ProposedSplit::find(session, rawArtist) };
        if (!split)
            return false;

        const std::string resolvedArtist{ joinArtists(split->getProposedArtists()) };
        split.modify()->setStatus(db::ProposedSplitStatus::Approved);

        db::ArtistAlias::pointer alias{ db::ArtistAlias::find(session, rawArtist) };
        if (!alias)
            alias = session.create<db::ArtistAlias>(rawArtist);

        alias.modify()->setResolvedName(resolvedArtist);
        alias.modify()->setVerified(true);

        BLM_LOG(IDENTITY, INFO, "Approved split of '" << rawArtist << "' into '" << resolvedArtist << "'");

        return true;
    }

    bool IdentityResolverService::rejectSplit(std::string_view rawArtist)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        db::ProposedSplit::pointer split{ db::ProposedSplit::find(session, rawArtist) };
        if (!split)
            return false;

        split.modify()->setStatus(db::ProposedSplitStatus::Rejected);

        db::ArtistAlias::pointer alias{ db::ArtistAlias::find(session, rawArtist) };
        if (!alias)
            alias = session.create<db::ArtistAlias>(rawArtist);

        alias.modify()->setResolvedName(rawArtist);
        alias.modify()->setVerified(true);

        BLM_LOG(IDENTITY, INFO, "Rejected split of '" << rawArtist << "'");

        return true;
    }

    bool IdentityResolverService::updateSplit(std::string_view rawArtist, std::span<const std::string> artists)
    {
        std::vector<std::string> names;
        for (const std::string& artist : artists)
        {
            std::string_view name{ core::stringUtils::stringTrim(artist) };
            if (!name.empty())
                names.emplace_back(name);
        }
        if (names.size() < 2)
            throw Exception{ "A split needs at least two artists" };

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        db::ProposedSplit::pointer split{ db::ProposedSplit::find(session, rawArtist) };
        if (!split || split->getStatus() != db::ProposedSplitStatus::Pending)
            return false;

        split.modify()->setProposedArtists(names);
        BLM_LOG(IDENTITY, INFO, "Updated split of '" << rawArtist << "' to '" << joinArtists(names) << "'");

        return true;
    }

    std::vector<SplitProposal> IdentityResolverService::findSplits(db::ProposedSplitStatus status, std::optional<db::Range> range)
    {
        std::vector<SplitProposal> res;

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        db::ProposedSplit::find(session, status, range, [&](const db::ProposedSplit::pointer& split) {
            res.push_back(SplitProposal{ std::string{ split->getRawArtist() }, split->getProposedArtists(), split->getStatus(), split->getConfidence() });
        });

        return res;
    }

    void IdentityResolverService::addAlias(std::string_view rawArtist, std::string_view resolvedArtist, bool verified)
    {
        if (core::stringUtils::stringTrim(rawArtist).empty() || core::stringUtils::stringTrim(resolvedArtist).empty())
            throw Exception{ "Cannot add an alias with an empty name" };

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        db::ArtistAlias::pointer alias{ db::ArtistAlias::find(session, rawArtist) };
        if (!alias)
            alias = session.create<db::ArtistAlias>(rawArtist);

        alias.modify()->setResolvedName(resolvedArtist);
        alias.modify()->setVerified(verified);

        BLM_LOG(IDENTITY, DEBUG, "Alias '" << rawArtist << "' -> '" << resolvedArtist << "'" << (verified ? " (verified)" : ""));
    }

    void IdentityResolverService::markNoAlias(std::string_view rawArtist)
    {
        if (core::stringUtils::stringTrim(rawArtist).empty())
            throw Exception{ "Cannot mark an empty name" };

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        db::ArtistAlias::pointer alias{ db::ArtistAlias::find(session, rawArtist) };
        if (!alias)
            alias = session.create<db::ArtistAlias>(rawArtist);
        else if (alias->isVerified())
            return;

        alias.modify()->setNull();
    }
} // namespace blm::matching
