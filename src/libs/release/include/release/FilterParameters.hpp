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

#pragma once

#include <string>
#include <vector>

namespace liner::core
{
    class IConfig;
}

namespace liner::release
{
    struct FilterParameters
    {
        std::vector<std::string> excludeWords;  // case insensitive, searched in every format field
        std::vector<std::string> albumKeywords; // at least one format field must contain one of these
        bool excludeSlashInTitle{};
        bool excludeVariousArtists{ true };
    };

    FilterParameters createDefaultFilterParameters();

    // Settings not found in the config get their default value
    FilterParameters readFilterParameters(core::IConfig& config);
} // namespace liner::release
