/*
 * Copyright (C) 2019 Emeric Poupon
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

#include "database/Session.hpp"

#include <Wt/Dbo/WtSqlTraits.h>

#include "core/ILogger.hpp"
#include "database/Object.hpp"
#include "database/objects/Artist.hpp"
#include "database/objects/ArtistAlias.hpp"
#include "database/objects/BroadcastLog.hpp"
#include "database/objects/IdentityBridge.hpp"
#include "database/objects/MatchReview.hpp"
#include "database/objects/MatchSettings.hpp"
#include "database/objects/ProposedSplit.hpp"
#include "database/objects/Recording.hpp"
#include "database/objects/Station.hpp"
#include "database/objects/Work.hpp"
#include "database/objects/WorkArtistLink.hpp"

#include "Db.hpp"
#include "TransactionChecker.hpp"
#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

namespace blm::db
{
    void ObjectPtrBase::checkWriteTransaction([[maybe_unused]] const Wt::Dbo::Session& session)
    {
#if BLM_CHECK_TRANSACTION_ACCESSES
        TransactionChecker::checkWriteTransaction(session);
#endif
    }

    Session::Session(IDb& db)
        : _db{ db }
    {
        _session.setConnectionPool(static_cast<Db&>(_db).getConnectionPool());

        _session.mapClass<Artist>("artist");
        _session.mapClass<ArtistAlias>("artist_alias");
        _session.mapClass<BroadcastLog>("broadcast_log");
        _session.mapClass<IdentityBridge>("identity_bridge");
        _session.mapClass<MatchReview>("match_review");
        _session.mapClass<MatchSettings>("match_settings");
        _session.mapClass<ProposedSplit>("proposed_split");
        _session.mapClass<Recording>("recording");
        _session.mapClass<Station>("station");
        _session.mapClass<Work>("work");
        _session.mapClass<WorkArtistLink>("work_artist_link");
    }

    WriteTransaction Session::createWriteTransaction()
    {
        return WriteTransaction{ static_cast<Db&>(_db).getMutex(), _session };
    }

    ReadTransaction Session::createReadTransaction()
    {
        return ReadTransaction{ _session };
    }

    void Session::checkWriteTransaction() const
    {
#if BLM_CHECK_TRANSACTION_ACCESSES
        TransactionChecker::checkWriteTransaction(_session);
#endif
    }

    void Session::checkReadTransaction() const
    {
#if BLM_CHECK_TRANSACTION_ACCESSES
        TransactionChecker::checkReadTransaction(_session);
#endif
    }

    void Session::execute(std::string_view statement)
    {
        utils::executeCommand(_session, std::string{ statement });
    }

    void Session::prepareTablesIfNeeded()
    {
        BLM_LOG(DB, INFO, "Preparing tables...");

        // Initial creation case
        try
        {
            auto transaction{ createWriteTransaction() };
            _session.createTables();
            BLM_LOG(DB, INFO, "Tables created");
        }
        catch (Wt::Dbo::Exception& e)
        {
            BLM_LOG(DB, DEBUG, "Cannot create tables: " << e.what());
            if (std::string_view{ e.what() }.find("already exists") == std::string_view::npos)
            {
                BLM_LOG(DB, ERROR, "Cannot create tables: " << e.what());
                throw;
            }
        }
    }

    void Session::createIndexesIfNeeded()
    {
        BLM_LOG(DB, INFO, "Creating indexes... This may take a while...");

        {
            auto transaction{ createWriteTransaction() };

            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS artist_name_idx ON artist(name)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS artist_normalized_name_idx ON artist(normalized_name)");
            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS artist_alias_raw_name_idx ON artist_alias(raw_name COLLATE NOCASE)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS broadcast_log_played_at_idx ON broadcast_log(played_at)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS broadcast_log_station_idx ON broadcast_log(station_id)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS broadcast_log_signature_idx ON broadcast_log(signature)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS broadcast_log_work_idx ON broadcast_log(work_id)");
            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS identity_bridge_signature_idx ON identity_bridge(signature)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS identity_bridge_work_idx ON identity_bridge(work_id)");
            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS match_review_signature_idx ON match_review(signature)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS match_review_status_idx ON match_review(status)");
            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS proposed_split_raw_artist_idx ON proposed_split(raw_artist)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS proposed_split_status_idx ON proposed_split(status)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS recording_work_idx ON recording(work_id)");
            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS station_name_idx ON station(name)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS work_normalized_title_idx ON work(normalized_title)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS work_primary_artist_idx ON work(primary_artist_id)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS work_artist_link_artist_idx ON work_artist_link(artist_id)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS work_artist_link_work_idx ON work_artist_link(work_id)");
        }

        BLM_LOG(DB, INFO, "Indexes created!");
    }
} // namespace blm::db
