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

#include "credits/CreditConsolidator.hpp"
#include "credits/Exception.hpp"

namespace liner::credits::tests
{
    namespace
    {
        const TrackReference track1{ "So What", "A1" };
        const TrackReference track2{ "Freddie Freeloader", "A2" };
        const TrackReference track3{ "Blue In Green", "A3" };
    } // namespace

    TEST(CreditConsolidator, albumCreditsOnly)
    {
        const std::vector<RawCredit> albumCredits{
            { "Miles Davis", "Trumpet, Bandleader", "23755" },
            { "Miles Davis", "Trumpet", std::nullopt },
            { "Irving Townsend", "Producer", std::nullopt },
            { "Bill Evans", "Piano [Steinway], Piano", std::nullopt },
        };

        const std::vector<ConsolidatedArtistCredit> credits{ CreditConsolidator{}.consolidate(albumCredits, {}, 5) };
        ASSERT_EQ(credits.size(), 3);

        EXPECT_EQ(credits[0].artistName, "Bill Evans");
        EXPECT_EQ(credits[0].albumRoles, (std::vector<AtomicRole>{ "Piano", "Steinway" }));
        EXPECT_EQ(credits[1].artistName, "Irving Townsend");
        EXPECT_EQ(credits[1].albumRoles, (std::vector<AtomicRole>{ "Producer" }));
        EXPECT_EQ(credits[2].artistName, "Miles Davis");
        EXPECT_EQ(credits[2].albumRoles, (std::vector<AtomicRole>{ "Trumpet", "Bandleader" }));
        EXPECT_EQ(credits[2].id, "23755");

        for (const ConsolidatedArtistCredit& credit : credits)
        {
            EXPECT_TRUE(credit.trackRoles.empty()) << " artist = '" << credit.artistName << "'";
            EXPECT_EQ(credit.getSource(), ConsolidatedArtistCredit::Source::Album);
        }
    }

    TEST(CreditConsolidator, roleOnEveryTrackIsAlbumRole)
    {
        const std::vector<TrackCredit> trackCredits{
            { track1, { "Paul Chambers", "Bass", std::nullopt } },
            { track2, { "Paul Chambers", "Bass", std::nullopt } },
            { track3, { "Paul Chambers", "Bass", std::nullopt } },
        };

        const std::vector<ConsolidatedArtistCredit> credits{ CreditConsolidator{}.consolidate({}, trackCredits, 3) };
        ASSERT_EQ(credits.size(), 1);
        EXPECT_EQ(credits[0].albumRoles, (std::vector<AtomicRole>{ "Bass" }));
        EXPECT_TRUE(credits[0].trackRoles.empty());
        EXPECT_EQ(credits[0].getAllRoles(), (std::vector<AtomicRole>{ "Bass" }));
    }

    TEST(CreditConsolidator, trackRoles)
    {
        const std::vector<TrackCredit> trackCredits{
            { track1, { "Cannonball Adderley", "Alto Saxophone", std::nullopt } },
            { track1, { "Cannonball Adderley", "Alto Saxophone", std::nullopt } },
            { track2, { "Cannonball Adderley", "Alto Saxophone", std::nullopt } },
            { track3, { "Wynton Kelly", "Piano", std::nullopt } },
        };

        const std::vector<ConsolidatedArtistCredit> credits{ CreditConsolidator{}.consolidate({}, trackCredits, 3) };
        ASSERT_EQ(credits.size(), 2);

        EXPECT_EQ(credits[0].artistName, "Cannonball Adderley");
        EXPECT_TRUE(credits[0].albumRoles.empty());
        ASSERT_EQ(credits[0].trackRoles.size(), 1);
        EXPECT_EQ(credits[0].trackRoles[0].role, "Alto Saxophone");
        EXPECT_EQ(credits[0].trackRoles[0].tracks, (std::vector<TrackReference>{ track1, track2 }));
        EXPECT_EQ(credits[0].getSource(), ConsolidatedArtistCredit::Source::Mixed);

        EXPECT_EQ(credits[1].artistName, "Wynton Kelly");
        ASSERT_EQ(credits[1].trackRoles.size(), 1);
        EXPECT_EQ(credits[1].trackRoles[0].tracks, (std::vector<TrackReference>{ track3 }));
    }

    TEST(CreditConsolidator, albumLevelWins)
    {
        const std::vector<RawCredit> albumCredits{
            { "Bill Evans", "Piano", std::nullopt },
        };
        const std::vector<TrackCredit> trackCredits{
            { track3, { "Bill Evans", "Piano, Arranged By", std::nullopt } },
        };

        const std::vector<ConsolidatedArtistCredit> credits{ CreditConsolidator{}.consolidate(albumCredits, trackCredits, 3) };
        ASSERT_EQ(credits.size(), 1);
        EXPECT_EQ(credits[0].albumRoles, (std::vector<AtomicRole>{ "Piano" }));
        ASSERT_EQ(credits[0].trackRoles.size(), 1);
        EXPECT_EQ(credits[0].trackRoles[0], (TrackRole{ "Arranged By", { track3 } }));
    }

    TEST(CreditConsolidator, compositionOnlyArtistsAreDropped)
    {
        const std::vector<RawCredit> albumCredits{
            { "Some Writer", "Written-By", std::nullopt },
            { "Some Lyricist", "Lyrics By, Words By", std::nullopt },
            { "Miles Davis", "Written-By, Trumpet", std::nullopt },
        };
        const std::vector<TrackCredit> trackCredits{
            { track1, { "Some Writer", "Composed By", std::nullopt } },
        };

        const std::vector<ConsolidatedArtistCredit> credits{ CreditConsolidator{}.consolidate(albumCredits, trackCredits, 3) };
        ASSERT_EQ(credits.size(), 1);
        EXPECT_EQ(credits[0].artistName, "Miles Davis");
        EXPECT_EQ(credits[0].albumRoles, (std::vector<AtomicRole>{ "Written-By", "Trumpet" }));
    }

    TEST(CreditConsolidator, ordering)
    {
        const std::vector<RawCredit> albumCredits{
            { "bob", "Drums", std::nullopt },
            { "Alice", "Guitar", std::nullopt },
            { "Bob", "Drums", std::nullopt },
        };
        const std::vector<TrackCredit> trackCredits{
            { track1, { "Aaron", "Vocals", std::nullopt } },
        };

        const std::vector<ConsolidatedArtistCredit> credits{ CreditConsolidator{}.consolidate(albumCredits, trackCredits, 3) };
        ASSERT_EQ(credits.size(), 4);
        EXPECT_EQ(credits[0].artistName, "Alice");
        EXPECT_EQ(credits[1].artistName, "Bob");
        EXPECT_EQ(credits[2].artistName, "bob");
        EXPECT_EQ(credits[3].artistName, "Aaron"); // track specific roles come last
    }

    TEST(CreditConsolidator, placeholders)
    {
        const std::vector<RawCredit> albumCredits{
            { "Jimmy Cobb", "", std::nullopt },
            { "", "Drums", std::nullopt },
            { "Jimmy Cobb", "Drums", "" },
            { "Jimmy Cobb", "Drums", "34278" },
            { "Jimmy Cobb", "Drums", "99999" },
        };

        const std::vector<ConsolidatedArtistCredit> credits{ CreditConsolidator{}.consolidate(albumCredits, {}, 3) };
        ASSERT_EQ(credits.size(), 2);
        EXPECT_EQ(credits[0].artistName, "Jimmy Cobb");
        EXPECT_EQ(credits[0].albumRoles, (std::vector<AtomicRole>{ std::string{ CreditConsolidator::placeholderRole }, "Drums" }));
        EXPECT_EQ(credits[0].id, "34278");
        EXPECT_EQ(credits[1].artistName, CreditConsolidator::unknownArtistName);
        EXPECT_EQ(credits[1].albumRoles, (std::vector<AtomicRole>{ "Drums" }));
    }

    TEST(CreditConsolidator, trackCount)
    {
        const std::vector<TrackCredit> trackCredits{
            { track1, { "Paul Chambers", "Bass", std::nullopt } },
        };

        EXPECT_THROW(CreditConsolidator{}.consolidate({}, trackCredits, -1), ContractViolationException);

        // no track count: cannot tell if the role is on every track
        const std::vector<ConsolidatedArtistCredit> credits{ CreditConsolidator{}.consolidate({}, trackCredits, 0) };
        ASSERT_EQ(credits.size(), 1);
        EXPECT_TRUE(credits[0].albumRoles.empty());
        EXPECT_EQ(credits[0].trackRoles.size(), 1);

        EXPECT_TRUE(CreditConsolidator{}.consolidate({}, {}, 0).empty());
    }

    TEST(CreditConsolidator, isCompositionOnly)
    {
        const CreditConsolidator consolidator;

        EXPECT_FALSE(consolidator.isCompositionOnly(std::vector<AtomicRole>{}));
        EXPECT_TRUE(consolidator.isCompositionOnly(std::vector<AtomicRole>{ "Written-By" }));
        EXPECT_TRUE(consolidator.isCompositionOnly(std::vector<AtomicRole>{ "Composer", "LYRICS BY" }));
        EXPECT_FALSE(consolidator.isCompositionOnly(std::vector<AtomicRole>{ "Composer", "Piano" }));

        const CreditConsolidator custom{ std::vector<std::string>{ "Orchestrated" } };
        EXPECT_TRUE(custom.isCompositionOnly(std::vector<AtomicRole>{ "Orchestrated By" }));
        EXPECT_FALSE(custom.isCompositionOnly(std::vector<AtomicRole>{ "Written-By" }));
    }
} // namespace liner::credits::tests
