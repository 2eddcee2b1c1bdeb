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

#pragma once

#include <cassert>
#include <memory>

namespace blm::core
{
    // Process wide instance of Class, owned by the scope that installed it
    template<typename Class>
    class Service
    {
    public:
        Service() = default;
        Service(std::unique_ptr<Class> service)
        {
            assert(!_service);
            _service = std::move(service);
            _owner = true;
        }

        ~Service()
        {
            if (_owner)
                _service.reset();
        }

        Service(const Service&) = delete;
        Service& operator=(const Service&) = delete;

        Class* operator->() const { return get(); }
        Class& operator*() const { return *get(); }

        static Class* get() { return _service.get(); }
        static bool exists() { return static_cast<bool>(_service); }

    private:
        bool _owner{};
        static inline std::unique_ptr<Class> _service;
    };
} // namespace blm::core
