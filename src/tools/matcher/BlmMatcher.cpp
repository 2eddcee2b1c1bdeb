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

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <Wt/WDateTime.h>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "core/String.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "services/matching/Exception.hpp"
#include "services/matching/IIdentityResolverService.hpp"
#include "services/matching/IMatcherService.hpp"
#include "services/matching/ISimilarityIndex.hpp"

namespace blm
{
    namespace
    {
        constexpr std::string_view defaultConfigPath{ "/etc/blm.conf" };

        core::logging::Severity getLogMinSeverity(core::IConfig& config)
        {
            const std::string_view minSeverity{ config.getString("log-min-severity", "info") };
            if (const std::optional<core::logging::Severity> severity{ core::logging::getSeverityFromName(minSeverity) })
                return *severity;

            throw core::BlmException{ "Invalid config value for 'log-min-severity': '" + std::string{ minSeverity } + "'" };
        }

        std::vector<std::string> getSplitExceptions(core::IConfig& config)
        {
            std::vector<std::string> res;
            config.visitStrings("identity-split-exceptions", [&](std::string_view splitException) { res.emplace_back(splitException); }, {});

            if (res.empty())
            {
                for (std::string_view splitException : matching::defaultSplitExceptions)
                    res.emplace_back(splitException);
            }

            return res;
        }

        matching::MatcherSettings getMatcherSettings(core::IConfig& config)
        {
            matching::MatcherSettings settings;
            matching::Thresholds& thresholds{ settings.defaultThresholds };

            thresholds.variantArtistScore = config.getDouble("matching-variant-artist-score", thresholds.variantArtistScore);
            thresholds.variantTitleScore = config.getDouble("matching-variant-title-score", thresholds.variantTitleScore);
            thresholds.aliasArtistScore = config.getDouble("matching-alias-artist-score", thresholds.aliasArtistScore);
            thresholds.aliasTitleScore = config.getDouble("matching-alias-title-score", thresholds.aliasTitleScore);
            thresholds.vectorStrongDistance = config.getDouble("matching-vector-strong-distance", thresholds.vectorStrongDistance);
            thresholds.vectorTitleGuard = config.getDouble("matching-vector-title-guard", thresholds.vectorTitleGuard);
            thresholds.promotionMinOccurrences = config.getULong("matching-promotion-min-occurrences", thresholds.promotionMinOccurrences);
            thresholds.promotionConfidence = config.getDouble("matching-promotion-confidence", thresholds.promotionConfidence);
            settings.similaritySearchLimit = config.getULong("matching-similarity-search-limit", settings.similaritySearchLimit);
            settings.unsplittableArtists = getSplitExceptions(config);

            return settings;
        }

        void setThreshold(matching::Thresholds& thresholds, std::string_view assignment)
        {
            const std::size_t separatorPos{ assignment.find('=') };
            if (separatorPos == std::string_view::npos)
                throw core::BlmException{ "Invalid threshold '" + std::string{ assignment } + "', expected name=value" };

            const std::string_view name{ core::stringUtils::stringTrim(assignment.substr(0, separatorPos)) };
            const std::string_view value{ core::stringUtils::stringTrim(assignment.substr(separatorPos + 1)) };

            if (name == "promotion-min-occurrences")
            {
                const std::optional<std::size_t> count{ core::stringUtils::readAs<std::size_t>(value) };
                if (!count)
                    throw core::BlmException{ "Invalid value for '" + std::string{ name } + "': '" + std::string{ value } + "'" };
                thresholds.promotionMinOccurrences = *count;
                return;
            }

            const std::optional<double> ratio{ core::stringUtils::readAs<double>(value) };
            if (!ratio)
                throw core::BlmException{ "Invalid value for '" + std::string{ name } + "': '" + std::string{ value } + "'" };

            if (name == "variant-artist-score")
                thresholds.variantArtistScore = *ratio;
            else if (name == "variant-title-score")
                thresholds.variantTitleScore = *ratio;
            else if (name == "alias-artist-score")
                thresholds.aliasArtistScore = *ratio;
            else if (name == "alias-title-score")
                thresholds.aliasTitleScore = *ratio;
            else if (name == "vector-strong-distance")
                thresholds.vectorStrongDistance = *ratio;
            else if (name == "vector-title-guard")
                thresholds.vectorTitleGuard = *ratio;
            else if (name == "promotion-confidence")
                thresholds.promotionConfidence = *ratio;
            else
                throw core::BlmException{ "Unknown threshold '" + std::string{ name } + "'" };
        }

        void printOutcome(const matching::MatchOutcome& outcome)
        {
            if (const matching::Matched* matched{ std::get_if<matching::Matched>(&outcome) })
            {
                std::cout << "Matched: work " << matched->work.toString() << ", reason = '" << matching::toString(matched->reason) << "', confidence = " << matched->confidence << std::endl;
                return;
            }

            const matching::Unmatched& unmatched{ std::get<matching::Unmatched>(outcome) };
            std::cout << "Unmatched: " << matching::toString(unmatched.reason);
            if (unmatched.suggestedWork.isValid())
                std::cout << ", suggested work " << unmatched.suggestedWork.toString();
            std::cout << std::endl;
        }

        void printExplanation(const matching::MatchExplanation& explanation)
        {
            std::cout << "Signature: '" << explanation.signature << "'" << std::endl;
            printOutcome(explanation.outcome);

            if (explanation.candidates.empty())
            {
                std::cout << "No similarity candidate evaluated" << std::endl;
                return;
            }

            for (const matching::ScoredCandidate& candidate : explanation.candidates)
            {
                std::cout << "Recording " << candidate.recording.toString() << " (work " << candidate.work.toString() << ")"
                          << ": artist = " << candidate.artistSimilarity << ", title = " << candidate.titleSimilarity << ", distance = " << candidate.distance
                          << ", tier = " << matching::toString(candidate.tier) << std::endl;
            }
        }

        void printSplits(matching::IIdentityResolverService& resolver)
        {
            const std::vector<matching::SplitProposal> splits{ resolver.findSplits(db::ProposedSplitStatus::Pending) };

            std::cout << "*** Pending splits (" << splits.size() << ") ***" << std::endl;
            for (const matching::SplitProposal& split : splits)
                std::cout << "'" << split.rawArtist << "' -> '" << core::stringUtils::joinStrings(split.artists, "; ") << "', confidence = " << split.confidence << std::endl;
        }

        void printReviews(matching::IMatcherService& matcher)
        {
            const std::vector<matching::ReviewInfo> reviews{ matcher.findReviews(db::MatchReviewStatus::Pending) };

            std::cout << "*** Pending reviews (" << reviews.size() << ") ***" << std::endl;
            for (const matching::ReviewInfo& review : reviews)
            {
                std::cout << "'" << review.signature << "' (" << review.occurrenceCount << " times) -> work " << review.suggestedWork.toString()
                          << ", artist = " << review.artistSimilarity << ", title = " << review.titleSimilarity << ", distance = " << review.distance << std::endl;
            }
        }

        const std::string& getRequired(const boost::program_options::variables_map& vm, const char* option)
        {
            if (!vm.count(option))
                throw core::BlmException{ "Missing '--" + std::string{ option } + "' option" };

            return vm[option].as<std::string>();
        }
    } // namespace
} // namespace blm

int main(int argc, char* argv[])
{
    try
    {
        using namespace blm;
        namespace program_options = boost::program_options;

        program_options::options_description options{ "Options" };

        // clang-format off
        options.add_options()
        ("conf,c", program_options::value<std::string>()->default_value(std::string{ defaultConfigPath }), "blm config file")
        ("artist", program_options::value<std::string>(), "Artist, used by --add-work, --add-log, --match and --explain")
        ("title", program_options::value<std::string>(), "Title, used by --add-work, --add-log, --match and --explain")
        ("co-artist", program_options::value<std::vector<std::string>>()->composing(), "Co-artist of the work, used by --add-work")
        ("file", program_options::value<std::string>(), "Verified audio file of the work, used by --add-work")
        ("station", program_options::value<std::string>(), "Station name, used by --add-log")
        ("played-at", program_options::value<std::string>(), "ISO 8601 play date, used by --add-log (default: now)")
        ("add-work", "Add a work to the catalog")
        ("add-log", "Add a broadcast log entry")
        ("match", "Match an artist / title pair")
        ("explain", "Explain how an artist / title pair would be matched, without recording anything")
        ("resolve", program_options::value<std::vector<std::string>>()->composing(), "Resolve raw artist credits")
        ("promote", "Promote recurring unmatched logs to new works")
        ("link", "Link unmatched logs to works")
        ("approve-split", program_options::value<std::string>(), "Approve the split proposal of a raw artist")
        ("reject-split", program_options::value<std::string>(), "Reject the split proposal of a raw artist")
        ("list-splits", "List pending split proposals")
        ("list-reviews", "List pending match reviews")
        ("accept-review", program_options::value<std::string>(), "Accept the suggested work of a match review")
        ("dismiss-review", program_options::value<std::string>(), "Dismiss a match review")
        ("revoke", program_options::value<std::string>(), "Revoke an identity bridge")
        ("set-threshold", program_options::value<std::vector<std::string>>()->composing(), "Set a matching threshold (name=value)")
        ("help,h", "produce help message");
        // clang-format on

        program_options::variables_map vm;
        program_options::store(program_options::parse_command_line(argc, argv, options), vm);

        if (vm.count("help"))
        {
            std::cout << options << "\n";
            return EXIT_SUCCESS;
        }

        program_options::notify(vm);

        core::Service<core::IConfig> config{ core::createConfig(vm["conf"].as<std::string>()) };
        core::Service<core::logging::ILogger> logger{ core::logging::createLogger(getLogMinSeverity(*config), config->getPath("log-file", "")) };

        const auto db{ db::createDb(config->getPath("working-dir", "/var/blm") / "blm.db", config->getULong("db-connection-count", 10)) };
        {
            db::Session& session{ db->getTLSSession() };
            session.prepareTablesIfNeeded();
            session.createIndexesIfNeeded();
        }

        const auto index{ matching::createInMemorySimilarityIndex() };
        const auto matcher{ matching::createMatcherService(*db, *index, getMatcherSettings(*config)) };
        const auto resolver{ matching::createIdentityResolverService(*db, getSplitExceptions(*config)) };

        if (vm.count("set-threshold"))
        {
            matching::Thresholds thresholds{ matcher->getThresholds() };
            for (const std::string& assignment : vm["set-threshold"].as<std::vector<std::string>>())
                setThreshold(thresholds, assignment);

            matcher->setThresholds(thresholds);
            std::cout << "Thresholds updated" << std::endl;
        }

        if (vm.count("add-work"))
        {
            matching::WorkDefinition work;
            work.artist = getRequired(vm, "artist");
            work.title = getRequired(vm, "title");
            if (vm.count("co-artist"))
                work.coArtists = vm["co-artist"].as<std::vector<std::string>>();
            if (vm.count("file"))
                work.filePath = vm["file"].as<std::string>();

            std::cout << "Added work " << matcher->addWork(work).toString() << std::endl;
        }

        if (vm.count("add-log"))
        {
            Wt::WDateTime playedAt{ Wt::WDateTime::currentDateTime() };
            if (vm.count("played-at"))
            {
                playedAt = core::stringUtils::fromISO8601String(vm["played-at"].as<std::string>());
                if (!playedAt.isValid())
                    throw core::BlmException{ "Invalid '--played-at' value" };
            }

            const db::BroadcastLogId logId{ matcher->addBroadcastLog(getRequired(vm, "station"), getRequired(vm, "artist"), getRequired(vm, "title"), playedAt) };
            std::cout << "Added log " << logId.toString() << std::endl;
        }

        if (vm.count("approve-split"))
            std::cout << (resolver->approveSplit(vm["approve-split"].as<std::string>()) ? "Split approved" : "No such split proposal") << std::endl;

        if (vm.count("reject-split"))
            std::cout << (resolver->rejectSplit(vm["reject-split"].as<std::string>()) ? "Split rejected" : "No such split proposal") << std::endl;

        if (vm.count("revoke"))
            std::cout << (matcher->revoke(vm["revoke"].as<std::string>()) ? "Bridge revoked" : "No active bridge for this signature") << std::endl;

        if (vm.count("accept-review"))
            std::cout << (matcher->acceptReview(vm["accept-review"].as<std::string>()) ? "Review accepted" : "No pending review for this signature") << std::endl;

        if (vm.count("dismiss-review"))
            std::cout << (matcher->dismissReview(vm["dismiss-review"].as<std::string>()) ? "Review dismissed" : "No pending review for this signature") << std::endl;

        if (vm.count("resolve"))
        {
            for (const auto& [rawArtist, resolvedArtist] : resolver->resolveBatch(vm["resolve"].as<std::vector<std::string>>()))
                std::cout << "'" << rawArtist << "' -> '" << resolvedArtist << "'" << std::endl;
        }

        if (vm.count("match") || vm.count("explain") || vm.count("promote") || vm.count("link"))
        {
            BLM_LOG(MAIN, INFO, "Loading similarity index...");
            matcher->rebuildIndex();
        }

        if (vm.count("match"))
            printOutcome(matcher->findMatch(getRequired(vm, "artist"), getRequired(vm, "title")));

        if (vm.count("explain"))
            printExplanation(matcher->explainMatch(getRequired(vm, "artist"), getRequired(vm, "title")));

        if (vm.count("promote"))
            std::cout << "Created " << matcher->scanAndPromote() << " works" << std::endl;

        if (vm.count("link"))
            std::cout << "Linked " << matcher->linkOrphanedLogs() << " logs" << std::endl;

        if (vm.count("list-splits"))
            printSplits(*resolver);

        if (vm.count("list-reviews"))
            printReviews(*matcher);
    }
    catch (const blm::matching::DuplicateSignatureException& e)
    {
        std::cerr << "Identity conflict: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
