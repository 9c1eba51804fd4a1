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
#include <string_view>
#include <vector>

namespace liner::credits
{
    struct PerformanceRoleRules
    {
        std::vector<std::string> performanceRoles;
        std::vector<std::string> excludedRoles;
        std::vector<std::string> compositionalKeywords;
    };
    PerformanceRoleRules createDefaultPerformanceRoleRules();

    // Strict allow list of roles denoting a physical performance (instrument, vocals)
    // Compositional, arrangement and production roles never count as performing, even if musical
    class PerformanceRoleClassifier
    {
    public:
        enum class Verdict
        {
            Performance,
            Excluded,      // explicitly excluded role
            Compositional, // contains a compositional keyword
            Unrecognized,
        };

        explicit PerformanceRoleClassifier(PerformanceRoleRules rules);

        Verdict classify(std::string_view role) const;
        bool isPerformanceRole(std::string_view role) const { return classify(role) == Verdict::Performance; }

    private:
        bool isExcluded(std::string_view normalizedRole) const;
        bool hasCompositionalKeyword(std::string_view normalizedRole) const;
        bool isPerformance(std::string_view normalizedRole) const;

        PerformanceRoleRules _rules; // entries are lower case
    };

    const char* verdictToString(PerformanceRoleClassifier::Verdict verdict);
} // namespace liner::credits
