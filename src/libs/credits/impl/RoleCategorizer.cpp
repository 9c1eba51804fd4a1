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

#include "credits/RoleCategorizer.hpp"

#include <cctype>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "credits/Exception.hpp"

namespace liner::credits
{
    namespace
    {
        template<class... Ts>
        struct overloaded : Ts...
        {
            using Ts::operator()...;
        };
    } // namespace

    RoleCategorizer::RoleCategorizer(const RoleRules& rules, RoleCategory unknownRoleCategory)
        : _unknownRoleCategory{ unknownRoleCategory }
    {
        if (_unknownRoleCategory == RoleCategory::Unknown)
            throw ContractViolationException{ "Unknown role category must be either musical or technical" };

        ExactMatcher technicalExactMatcher;
        ExactMatcher musicalExactMatcher;
        for (const std::string& role : rules.technicalRoles)
            technicalExactMatcher.normalizedRoles.insert(normalizeRole(role));
        for (const std::string& role : rules.musicalRoles)
            musicalExactMatcher.normalizedRoles.insert(normalizeRole(role));

        KeywordMatcher technicalKeywordMatcher;
        technicalKeywordMatcher.normalizedRoles.assign(std::cbegin(technicalExactMatcher.normalizedRoles), std::cend(technicalExactMatcher.normalizedRoles));
        KeywordMatcher musicalKeywordMatcher;
        musicalKeywordMatcher.normalizedRoles.assign(std::cbegin(musicalExactMatcher.normalizedRoles), std::cend(musicalExactMatcher.normalizedRoles));

        _rules.push_back({ std::move(technicalExactMatcher), RoleCategory::Technical });
        _rules.push_back({ std::move(musicalExactMatcher), RoleCategory::Musical });
        _rules.push_back({ std::move(technicalKeywordMatcher), RoleCategory::Technical });
        _rules.push_back({ std::move(musicalKeywordMatcher), RoleCategory::Musical });

        for (const std::string& pattern : rules.technicalPatterns)
            _rules.push_back({ PatternMatcher{ std::regex{ pattern, std::regex::ECMAScript | std::regex::icase } }, RoleCategory::Technical });
        for (const std::string& pattern : rules.musicalPatterns)
            _rules.push_back({ PatternMatcher{ std::regex{ pattern, std::regex::ECMAScript | std::regex::icase } }, RoleCategory::Musical });
    }

    RoleCategory RoleCategorizer::categorize(std::string_view role) const
    {
        return classify(role).category;
    }

    RoleCategorizer::Classification RoleCategorizer::classify(std::string_view role) const
    {
        const std::string normalizedRole{ normalizeRole(role) };

        for (const Rule& rule : _rules)
        {
            if (matches(rule, normalizedRole, role))
            {
                const Classification res{ rule.category, getRuleKind(rule) };
                LINER_LOG(CREDITS, DEBUG, "Role '" << role << "' categorized as " << roleCategoryToString(res.category) << " (" << ruleKindToString(res.rule) << ")");
                return res;
            }
        }

        LINER_LOG(CREDITS, DEBUG, "Role '" << role << "' not recognized, defaulting to " << roleCategoryToString(_unknownRoleCategory));
        return Classification{ _unknownRoleCategory, RuleKind::Default };
    }

    RoleCategorizer::Stats RoleCategorizer::getStats() const
    {
        Stats stats;

        for (const Rule& rule : _rules)
        {
            const ExactMatcher* exactMatcher{ std::get_if<ExactMatcher>(&rule.matcher) };
            if (!exactMatcher)
                continue;

            if (rule.category == RoleCategory::Technical)
                stats.technicalRoleCount += exactMatcher->normalizedRoles.size();
            else if (rule.category == RoleCategory::Musical)
                stats.musicalRoleCount += exactMatcher->normalizedRoles.size();
        }
        stats.totalRoleCount = stats.technicalRoleCount + stats.musicalRoleCount;

        return stats;
    }

    std::string RoleCategorizer::normalizeRole(std::string_view role)
    {
        std::string res;
        res.reserve(role.size());

        bool pendingSpace{};
        for (const char c : role)
        {
            if (std::isspace(static_cast<unsigned char>(c)))
            {
                pendingSpace = !res.empty();
                continue;
            }

            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_')
                continue;

            if (pendingSpace)
            {
                res.push_back(' ');
                pendingSpace = false;
            }
            res.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }

        return res;
    }

    bool RoleCategorizer::matches(const Rule& rule, std::string_view normalizedRole, std::string_view role)
    {
        return std::visit(overloaded{
                              [&](const ExactMatcher& matcher) {
                                  return matcher.normalizedRoles.contains(std::string{ normalizedRole });
                              },
                              [&](const KeywordMatcher& matcher) {
                                  for (std::string_view word : core::stringUtils::splitString(normalizedRole, ' '))
                                  {
                                      if (word.size() <= 2)
                                          continue;

                                      for (const std::string& entry : matcher.normalizedRoles)
                                      {
                                          if (entry.find(word) != std::string::npos)
                                              return true;
                                      }
                                  }
                                  return false;
                              },
                              [&](const PatternMatcher& matcher) {
                                  return std::regex_search(std::cbegin(role), std::cend(role), matcher.regex);
                              } },
                          rule.matcher);
    }

    RoleCategorizer::RuleKind RoleCategorizer::getRuleKind(const Rule& rule)
    {
        return std::visit(overloaded{
                              [](const ExactMatcher&) { return RuleKind::ExactMatch; },
                              [](const KeywordMatcher&) { return RuleKind::KeywordMatch; },
                              [](const PatternMatcher&) { return RuleKind::Pattern; } },
                          rule.matcher);
    }

    RoleCategory readUnknownRoleCategory(core::IConfig& config)
    {
        const std::string_view value{ config.getString("unknown-role-category", "musical") };

        if (core::stringUtils::stringCaseInsensitiveEqual(value, "musical"))
            return RoleCategory::Musical;
        if (core::stringUtils::stringCaseInsensitiveEqual(value, "technical"))
            return RoleCategory::Technical;

        throw Exception{ "Invalid value '" + std::string{ value } + "' for 'unknown-role-category', expected 'musical' or 'technical'" };
    }

    const char* ruleKindToString(RoleCategorizer::RuleKind rule)
    {
        switch (rule)
        {
        case RoleCategorizer::RuleKind::ExactMatch:
            return "exact match";
        case RoleCategorizer::RuleKind::KeywordMatch:
            return "keyword match";
        case RoleCategorizer::RuleKind::Pattern:
            return "pattern";
        case RoleCategorizer::RuleKind::Default:
            return "default";
        }

        return "";
    }
} // namespace liner::credits
