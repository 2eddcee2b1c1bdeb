/*
 * Copyright (C) 2024 Emeric Poupon
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

#include "database/objects/Recording.hpp"

#include <tuple>

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/StdSqlTraits.h>

#include "core/ILogger.hpp"
#include "database/Session.hpp"
#include "database/objects/Work.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(blm::db::Recording)

namespace blm::db
{
    Recording::Recording(const ObjectPtr<Work>& work, std::string_view title)
        : _work{ getDboPtr(work) }
    {
        setTitle(title);
    }

    Recording::pointer Recording::create(Session& session, const ObjectPtr<Work>& work, std::string_view title)
    {
        return session.getDboSession()->add(std::unique_ptr<Recording>{ new Recording{ work, title } });
    }

    std::size_t Recording::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM recording"));
    }

    Recording::pointer Recording::find(Session& session, RecordingId id)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Recording>>("SELECT r from recording r").where("r.id = ?").bind(id));
    }

    void Recording::find(Session& session, WorkId work, const std::function<void(const pointer&)>& func)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<Recording>>("SELECT r from recording r").where("r.work_id = ?").bind(work).orderBy("r.id") };

        utils::forEachQueryResult(query, [&](const Recording::pointer& recording) {
            func(recording);
        });
    }

    void Recording::findIndexEntries(Session& session, std::optional<Range> range, const std::function<void(RecordingId recording, std::string_view artistName, std::string_view title)>& func)
    {
        session.checkReadTransaction();

        using ResultType = std::tuple<RecordingId, std::string, std::string>;

        auto query{ session.getDboSession()->query<ResultType>("SELECT r.id, a.name, r.title FROM recording r") };
        query.join("work w ON w.id = r.work_id");
        query.join("artist a ON a.id = w.primary_artist_id");
        query.orderBy("r.id");

        utils::forEachQueryRangeResult(query, range, [&](const ResultType& res) {
            func(std::get<0>(res), std::get<1>(res), std::get<2>(res));
        });
    }

    ObjectPtr<Work> Recording::getWork() const
    {
        return _work;
    }

    void Recording::setTitle(std::string_view title)
    {
        _title.assign(title, 0, maxTitleLength);
        BLM_LOG_IF(DB, WARNING, title.size() > maxTitleLength, "Recording title too long, truncated to '" << _title << "'");
    }
} // namespace blm::db
