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

#include <gtest/gtest.h>

#include "credits/CreditSeparator.hpp"
#include "credits/RoleCategorizer.hpp"

namespace liner::credits::tests
{
    TEST(CreditSeparator, separateCredits)
    {
        const RoleCategorizer categorizer{ createDefaultRoleRules() };

        const std::vector<RawCredit> credits{
            { "Jan Hammer", "Synthesizer [Moog, Oberheim], Producer", "123" },
            { "Rudy Van Gelder", "Mastered By [Digital]", std::nullopt },
            { "Nobody", "", std::nullopt },
            { "Nobody", " , ", std::nullopt },
        };

        const SeparatedCredits separated{ separateCredits(categorizer, credits) };

        const std::vector<RawCredit> expectedMusicalCredits{
            { "Jan Hammer", "Synthesizer", "123" },
            { "Jan Hammer", "Moog", "123" },
            { "Jan Hammer", "Oberheim", "123" },
        };
        const std::vector<RawCredit> expectedTechnicalCredits{
            { "Jan Hammer", "Producer", "123" },
            { "Rudy Van Gelder", "Mastered By", std::nullopt },
            { "Rudy Van Gelder", "Digital", std::nullopt },
        };

        EXPECT_EQ(separated.musicalCredits, expectedMusicalCredits);
        EXPECT_EQ(separated.technicalCredits, expectedTechnicalCredits);
    }

    TEST(CreditSeparator, bracketItemsFollowMainRole)
    {
        const RoleCategorizer categorizer{ createDefaultRoleRules() };

        // "Recorded By" alone would be technical, it is a bracket item of a musical role here
        const std::vector<RawCredit> credits{ { "Some Artist", "Guitar [Recorded By]", std::nullopt } };
        const SeparatedCredits separated{ separateCredits(categorizer, credits) };

        EXPECT_TRUE(separated.technicalCredits.empty());
        ASSERT_EQ(separated.musicalCredits.size(), 2);
        EXPECT_EQ(separated.musicalCredits[1].roleText, "Recorded By");
    }

    TEST(CreditSeparator, separateRoles)
    {
        const RoleCategorizer categorizer{ createDefaultRoleRules() };

        const std::vector<AtomicRole> roles{ "Guitar", "Mixed By", "Xyzzy", "Producer", "Vocals" };
        const SeparatedRoles separated{ separateRoles(categorizer, roles) };

        EXPECT_EQ(separated.musicalRoles, (std::vector<AtomicRole>{ "Guitar", "Xyzzy", "Vocals" }));
        EXPECT_EQ(separated.technicalRoles, (std::vector<AtomicRole>{ "Mixed By", "Producer" }));
    }
} // namespace liner::credits::tests
