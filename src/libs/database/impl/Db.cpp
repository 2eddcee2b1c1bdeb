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

#include "Db.hpp"

#include <string>

#include <Wt/Dbo/FixedSqlConnectionPool.h>
#include <Wt/Dbo/backend/Sqlite3.h>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "database/Session.hpp"
#include "database/Types.hpp"

namespace blm::db
{
    namespace
    {
        // pooled connections are clones of the first one, each needs its own pragmas
        class Connection : public Wt::Dbo::backend::Sqlite3
        {
        public:
            explicit Connection(const std::filesystem::path& dbPath)
                : Wt::Dbo::backend::Sqlite3{ dbPath.string() }
            {
                setPragmas();
            }

            Connection(const Connection& other)
                : Wt::Dbo::backend::Sqlite3{ other }
            {
                setPragmas();
            }

        private:
            Connection& operator=(const Connection&) = delete;

            std::unique_ptr<SqlConnection> clone() const override
            {
                return std::make_unique<Connection>(*this);
            }

            void setPragmas()
            {
                // WAL lets readers proceed while the single writer holds the exclusive lock
                executeSql("PRAGMA journal_mode=WAL");
                executeSql("PRAGMA synchronous=normal");
                executeSql("PRAGMA foreign_keys=ON");
                executeSql("PRAGMA busy_timeout=5000");
            }
        };
    } // namespace

    std::unique_ptr<IDb> createDb(const std::filesystem::path& dbPath, std::size_t connectionCount)
    {
        return std::make_unique<Db>(dbPath, connectionCount);
    }

    Db::Db(const std::filesystem::path& dbPath, std::size_t connectionCount)
    {
        BLM_LOG(DB, INFO, "Opening database " << dbPath << " with " << connectionCount << " connections");

        std::string checkType{ "quick" };
        auto connection{ std::make_unique<Connection>(dbPath) };
        if (core::IConfig * config{ core::Service<core::IConfig>::get() }) // not set in unit tests
        {
            connection->setProperty("show-queries", config->getBool("db-show-queries", false) ? "true" : "false");
            checkType = config->getString("db-integrity-check", "quick");
        }

        auto connectionPool{ std::make_unique<Wt::Dbo::FixedSqlConnectionPool>(std::move(connection), static_cast<int>(connectionCount)) };
        connectionPool->setTimeout(std::chrono::seconds{ 10 });
        _connectionPool = std::move(connectionPool);

        if (checkType == "quick")
            checkIntegrity("PRAGMA quick_check");
        else if (checkType == "full")
            checkIntegrity("PRAGMA integrity_check");
        else if (checkType != "none")
            throw Exception{ "Invalid 'db-integrity-check' value: '" + checkType + "'. Expected 'quick', 'full' or 'none'." };
    }

    // sessions must go before the connection pool they use
    Db::~Db()
    {
        _tlsSessions.clear();
    }

    Session& Db::getTLSSession()
    {
        const std::thread::id threadId{ std::this_thread::get_id() };

        std::scoped_lock lock{ _tlsSessionsMutex };

        std::unique_ptr<Session>& session{ _tlsSessions[threadId] };
        if (!session)
            session = std::make_unique<Session>(*this);

        return *session;
    }

    void Db::withConnection(const std::function<void(Wt::Dbo::SqlConnection&)>& func)
    {
        std::unique_ptr<Wt::Dbo::SqlConnection> connection{ _connectionPool->getConnection() };
        try
        {
            func(*connection);
        }
        catch (...)
        {
            _connectionPool->returnConnection(std::move(connection));
            throw;
        }
        _connectionPool->returnConnection(std::move(connection));
    }

    void Db::checkIntegrity(std::string_view pragma)
    {
        BLM_LOG(DB, INFO, "Running '" << pragma << "'...");

        std::size_t errorCount{};
        withConnection([&](Wt::Dbo::SqlConnection& connection) {
            auto statement{ connection.prepareStatement(std::string{ pragma }) };
            statement->execute();

            // a single "ok" row when the database is sane, one row per problem otherwise
            std::string result;
            result.reserve(256);
            while (statement->nextRow())
            {
                result.clear();
                statement->getResult(0, &result, static_cast<int>(result.capacity()));
                if (result == "ok")
                    break;

                BLM_LOG(DB, ERROR, "Integrity error: " << result);
                errorCount++;
            }
        });

        if (errorCount > 0)
            throw Exception{ "Database integrity check failed with " + std::to_string(errorCount) + " errors, restore a backup or recreate the database" };

        BLM_LOG(DB, INFO, "Database integrity check passed");
    }
} // namespace blm::db
