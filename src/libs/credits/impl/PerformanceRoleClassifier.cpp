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

#include "credits/PerformanceRoleClassifier.hpp"

#include <algorithm>

#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace liner::credits
{
    namespace
    {
        void normalizeEntries(std::vector<std::string>& entries)
        {
            for (std::string& entry : entries)
                entry = core::stringUtils::stringToLower(core::stringUtils::stringTrim(entry));
        }
    } // namespace

    PerformanceRoleClassifier::PerformanceRoleClassifier(PerformanceRoleRules rules)
        : _rules{ std::move(rules) }
    {
        normalizeEntries(_rules.performanceRoles);
        normalizeEntries(_rules.excludedRoles);
        normalizeEntries(_rules.compositionalKeywords);
    }

    PerformanceRoleClassifier::Verdict PerformanceRoleClassifier::classify(std::string_view role) const
    {
        const std::string normalizedRole{ core::stringUtils::stringToLower(core::stringUtils::stringTrim(role)) };

        Verdict verdict{ Verdict::Unrecognized };
        if (isExcluded(normalizedRole))
            verdict = Verdict::Excluded;
        else if (hasCompositionalKeyword(normalizedRole))
            verdict = Verdict::Compositional;
        else if (isPerformance(normalizedRole))
            verdict = Verdict::Performance;

        LINER_LOG(CREDITS, DEBUG, "Role '" << role << "': " << verdictToString(verdict));
        return verdict;
    }

    bool PerformanceRoleClassifier::isExcluded(std::string_view normalizedRole) const
    {
        // a contained excluded role also covers the whole word case
        return std::any_of(std::cbegin(_rules.excludedRoles), std::cend(_rules.excludedRoles), [&](const std::string& excludedRole) {
            return normalizedRole.find(excludedRole) != std::string_view::npos;
        });
    }

    bool PerformanceRoleClassifier::hasCompositionalKeyword(std::string_view normalizedRole) const
    {
        return std::any_of(std::cbegin(_rules.compositionalKeywords), std::cend(_rules.compositionalKeywords), [&](const std::string& keyword) {
            return normalizedRole.find(keyword) != std::string_view::npos;
        });
    }

    bool PerformanceRoleClassifier::isPerformance(std::string_view normalizedRole) const
    {
        using namespace core::stringUtils;

        return std::any_of(std::cbegin(_rules.performanceRoles), std::cend(_rules.performanceRoles), [&](const std::string& performanceRole) {
            return normalizedRole == performanceRole
                   || stringStartsWith(normalizedRole, performanceRole + ' ')
                   || stringStartsWith(normalizedRole, performanceRole + ',')
                   || stringEndsWith(normalizedRole, ' ' + performanceRole)
                   || stringContainsWord(normalizedRole, performanceRole);
        });
    }

    const char* verdictToString(PerformanceRoleClassifier::Verdict verdict)
    {
        switch (verdict)
        {
        case PerformanceRoleClassifier::Verdict::Performance:
            return "performance";
        case PerformanceRoleClassifier::Verdict::Excluded:
            return "excluded";
        case PerformanceRoleClassifier::Verdict::Compositional:
            return "compositional";
        case PerformanceRoleClassifier::Verdict::Unrecognized:
            return "unrecognized";
        }

        return "";
    }
} // namespace liner::credits
