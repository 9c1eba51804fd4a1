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

#include "credits/RoleTokenizer.hpp"

#include <algorithm>

#include "core/String.hpp"

namespace liner::credits
{
    namespace
    {
        // position of the ']' closing the '[' at openPos, taking nested brackets into account
        std::size_t findClosingBracket(std::string_view str, std::size_t openPos)
        {
            std::size_t depth{};
            for (std::size_t i{ openPos }; i < str.size(); ++i)
            {
                if (str[i] == '[')
                    ++depth;
                else if (str[i] == ']' && --depth == 0)
                    return i;
            }

            return std::string_view::npos;
        }
    } // namespace

    std::vector<std::string_view> splitTopLevelSegments(std::string_view roleText)
    {
        std::vector<std::string_view> segments;

        auto addSegment{ [&](std::string_view segment) {
            segment = core::stringUtils::stringTrim(segment);
            if (!segment.empty())
                segments.push_back(segment);
        } };

        std::size_t bracketDepth{};
        std::size_t segmentBegin{};
        for (std::size_t i{}; i < roleText.size(); ++i)
        {
            switch (roleText[i])
            {
            case '[':
                ++bracketDepth;
                break;

            case ']':
                if (bracketDepth > 0)
                    --bracketDepth;
                break;

            case ',':
                if (bracketDepth == 0)
                {
                    addSegment(roleText.substr(segmentBegin, i - segmentBegin));
                    segmentBegin = i + 1;
                }
                break;

            default:
                break;
            }
        }
        addSegment(roleText.substr(std::min(segmentBegin, roleText.size())));

        return segments;
    }

    std::vector<AtomicRole> expandSegment(std::string_view segment)
    {
        std::vector<AtomicRole> roles;

        auto addRole{ [&](std::string_view role) {
            role = core::stringUtils::stringTrim(role);
            if (!role.empty())
                roles.emplace_back(role);
        } };

        // main role must be non empty, bracket content must be non empty
        const std::size_t openPos{ segment.find('[') };
        const std::size_t closePos{ openPos == std::string_view::npos ? std::string_view::npos : findClosingBracket(segment, openPos) };
        if (openPos == 0 || closePos == std::string_view::npos || closePos == openPos + 1)
        {
            addRole(segment);
            return roles;
        }

        addRole(segment.substr(0, openPos));
        for (std::string_view item : splitTopLevelSegments(segment.substr(openPos + 1, closePos - openPos - 1)))
        {
            // "Synth [Moog [Model D], ARP]"
            for (AtomicRole& role : expandSegment(item))
                roles.push_back(std::move(role));
        }
        addRole(segment.substr(closePos + 1));

        return roles;
    }

    std::string stripBracketedContent(std::string_view segment)
    {
        std::string res;
        res.reserve(segment.size());

        std::size_t currentPos{};
        while (currentPos < segment.size())
        {
            const std::size_t openPos{ segment.find('[', currentPos) };
            const std::size_t closePos{ openPos == std::string_view::npos ? std::string_view::npos : findClosingBracket(segment, openPos) };
            if (closePos == std::string_view::npos)
                break;

            // whitespaces preceding the brackets go away with them
            const std::string_view beforeBracket{ segment.substr(currentPos, openPos - currentPos) };
            res += beforeBracket.substr(0, beforeBracket.find_last_not_of(" \t") + 1);
            currentPos = closePos + 1;
        }

        if (currentPos < segment.size())
            res += segment.substr(currentPos);

        return std::string{ core::stringUtils::stringTrim(res) };
    }

    std::vector<AtomicRole> tokenizeRoles(std::string_view roleText)
    {
        std::vector<AtomicRole> roles;

        for (std::string_view segment : splitTopLevelSegments(roleText))
        {
            std::vector<AtomicRole> segmentRoles{ expandSegment(segment) };
            roles.insert(std::end(roles), std::make_move_iterator(std::begin(segmentRoles)), std::make_move_iterator(std::end(segmentRoles)));
        }

        return roles;
    }
} // namespace liner::credits
