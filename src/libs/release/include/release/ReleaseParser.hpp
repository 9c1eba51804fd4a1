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

#include <iosfwd>
#include <string_view>

#include "release/Types.hpp"

namespace liner::release
{
    // Parses a Discogs release document
    // Throws ReleaseParsingException if the document is not a JSON object
    // Missing or badly typed fields are left empty
    RawRelease parseRelease(std::string_view json);
    RawRelease parseRelease(std::istream& is);
} // namespace liner::release
