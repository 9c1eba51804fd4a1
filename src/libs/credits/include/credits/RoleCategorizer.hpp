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

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <variant>
#include <vector>

#include "credits/Types.hpp"

namespace liner::core
{
    class IConfig;
}

namespace liner::credits
{
    struct RoleRules
    {
        std::vector<std::string> technicalRoles;
        std::vector<std::string> musicalRoles;
        // case insensitive ECMAScript expressions, searched in the raw role
        std::vector<std::string> technicalPatterns;
        std::vector<std::string> musicalPatterns;
    };
    RoleRules createDefaultRoleRules();

    // Categorizes an atomic role as musical or technical
    // Rules are evaluated in order, first match wins:
    //  - exact match in the technical then in the musical roles
    //  - a word of the role (longer than 2 chars) is part of a technical role, then of a musical role
    //  - technical patterns, then musical patterns
    //  - unknown role category (musical by default)
    class RoleCategorizer
    {
    public:
        enum class RuleKind
        {
            ExactMatch,
            KeywordMatch,
            Pattern,
            Default,
        };

        struct Classification
        {
            RoleCategory category;
            RuleKind rule;
        };

        struct Stats
        {
            std::size_t technicalRoleCount{};
            std::size_t musicalRoleCount{};
            std::size_t totalRoleCount{};
        };

        explicit RoleCategorizer(const RoleRules& rules, RoleCategory unknownRoleCategory = RoleCategory::Musical);

        RoleCategory categorize(std::string_view role) const;
        Classification classify(std::string_view role) const;

        RoleCategory getUnknownRoleCategory() const { return _unknownRoleCategory; }
        Stats getStats() const;

        // lower case, no punctuation, single spaces
        static std::string normalizeRole(std::string_view role);

    private:
        struct ExactMatcher
        {
            std::unordered_set<std::string> normalizedRoles;
        };

        struct KeywordMatcher
        {
            std::vector<std::string> normalizedRoles;
        };

        struct PatternMatcher
        {
            std::regex regex;
        };

        using Matcher = std::variant<ExactMatcher, KeywordMatcher, PatternMatcher>;

        struct Rule
        {
            Matcher matcher;
            RoleCategory category;
        };

        static bool matches(const Rule& rule, std::string_view normalizedRole, std::string_view role);
        static RuleKind getRuleKind(const Rule& rule);

        std::vector<Rule> _rules;
        const RoleCategory _unknownRoleCategory;
    };

    // "unknown-role-category" setting, "musical" or "technical"
    RoleCategory readUnknownRoleCategory(core::IConfig& config);

    const char* ruleKindToString(RoleCategorizer::RuleKind rule);
} // namespace liner::credits
