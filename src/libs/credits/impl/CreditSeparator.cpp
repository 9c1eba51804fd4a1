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

#include "credits/CreditSeparator.hpp"

#include "core/ILogger.hpp"
#include "credits/RoleCategorizer.hpp"
#include "credits/RoleTokenizer.hpp"

namespace liner::credits
{
    SeparatedCredits separateCredits(const RoleCategorizer& categorizer, std::span<const RawCredit> credits)
    {
        SeparatedCredits res;

        for (const RawCredit& credit : credits)
        {
            for (std::string_view segment : splitTopLevelSegments(credit.roleText))
            {
                // bracket items are refinements of the main role
                const RoleCategory category{ categorizer.categorize(stripBracketedContent(segment)) };
                std::vector<RawCredit>& output{ category == RoleCategory::Technical ? res.technicalCredits : res.musicalCredits };

                for (AtomicRole& role : expandSegment(segment))
                    output.push_back(RawCredit{ credit.artistName, std::move(role), credit.sourceId });
            }
        }

        LINER_LOG(CREDITS, DEBUG, "Separated " << credits.size() << " credits into " << res.musicalCredits.size() << " musical and " << res.technicalCredits.size() << " technical credits");

        return res;
    }

    SeparatedRoles separateRoles(const RoleCategorizer& categorizer, std::span<const AtomicRole> roles)
    {
        SeparatedRoles res;

        for (const AtomicRole& role : roles)
        {
            if (categorizer.categorize(role) == RoleCategory::Technical)
                res.technicalRoles.push_back(role);
            else
                res.musicalRoles.push_back(role);
        }

        return res;
    }
} // namespace liner::credits
