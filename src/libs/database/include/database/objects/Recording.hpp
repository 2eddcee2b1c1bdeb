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

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <Wt/Dbo/Field.h>

#include "database/Object.hpp"
#include "database/Types.hpp"
#include "database/objects/RecordingId.hpp"
#include "database/objects/WorkId.hpp"

namespace blm::db
{
    class Session;
    class Work;

    // Concrete instance of a work. A recording without file is a placeholder created by promotion.
    class Recording final : public Object<Recording, RecordingId>
    {
    public:
        static constexpr std::size_t maxTitleLength{ 512 };

        Recording() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, RecordingId id);
        static void find(Session& session, WorkId work, const std::function<void(const pointer&)>& func);

        // Visits every recording along with the name of its work's primary artist
        static void findIndexEntries(Session& session, std::optional<Range> range, const std::function<void(RecordingId recording, std::string_view artistName, std::string_view title)>& func);

        // accessors
        std::string_view getTitle() const { return _title; }
        std::string_view getVersionType() const { return _versionType; }
        std::chrono::milliseconds getDuration() const { return _duration; }
        std::filesystem::path getFilePath() const { return _filePath; }
        bool isPlaceholder() const { return _filePath.empty(); }
        bool isVerified() const { return _isVerified; }
        ObjectPtr<Work> getWork() const;
        WorkId getWorkId() const { return _work.id(); }

        // setters
        void setTitle(std::string_view title);
        void setVersionType(std::string_view versionType) { _versionType = versionType; }
        void setDuration(std::chrono::milliseconds duration) { _duration = std::chrono::duration_cast<std::chrono::duration<int, std::milli>>(duration); }
        void setFilePath(const std::filesystem::path& filePath) { _filePath = filePath.string(); }
        void setVerified(bool verified) { _isVerified = verified; }

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _title, "title");
            Wt::Dbo::field(a, _versionType, "version_type");
            Wt::Dbo::field(a, _duration, "duration");
            Wt::Dbo::field(a, _filePath, "file_path");
            Wt::Dbo::field(a, _isVerified, "is_verified");

            Wt::Dbo::belongsTo(a, _work, "work", Wt::Dbo::OnDeleteCascade);
        }

    private:
        friend class Session;

        Recording(const ObjectPtr<Work>& work, std::string_view title);
        static pointer create(Session& session, const ObjectPtr<Work>& work, std::string_view title);

        std::string _title;
        std::string _versionType;
        std::chrono::duration<int, std::milli> _duration{};
        std::string _filePath;
        bool _isVerified{};

        Wt::Dbo::ptr<Work> _work;
    };
} // namespace blm::db
