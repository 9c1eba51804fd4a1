/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of Liner.
 *
 * Liner is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Liner is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Liner.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "credits/Types.hpp"

namespace liner::credits
{
    std::vector<AtomicRole> ConsolidatedArtistCredit::getAllRoles() const
    {
        std::vector<AtomicRole> roles{ albumRoles };
        for (const TrackRole& trackRole : trackRoles)
            roles.push_back(trackRole.role);

        return roles;
    }

    const char* roleCategoryToString(RoleCategory category)
    {
        switch (category)
        {
        case RoleCategory::Musical:
            return "musical";
        case RoleCategory::Technical:
            return "technical";
        case RoleCategory::Unknown:
            return "unknown";
        }

        return "";
    }
} // namespace liner::credits
