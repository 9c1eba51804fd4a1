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

#include "credits/CreditConsolidator.hpp"

#include <algorithm>
#include <unordered_map>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "credits/Exception.hpp"
#include "credits/RoleTokenizer.hpp"

namespace liner::credits
{
    namespace
    {
        struct RoleEntry
        {
            AtomicRole role;
            bool creditedOnAlbum{};
            std::vector<TrackReference> tracks;
        };

        struct ArtistEntry
        {
            std::string name;
            std::optional<std::string> id;
            std::vector<RoleEntry> roles; // in order of first appearance
            std::unordered_map<AtomicRole, std::size_t> roleIndexes;

            RoleEntry& getOrCreateRole(const AtomicRole& role)
            {
                auto [it, inserted]{ roleIndexes.emplace(role, roles.size()) };
                if (inserted)
                    roles.push_back(RoleEntry{ role, false, {} });

                return roles[it->second];
            }
        };

        // artist => role => tracks
        class CreditsAccumulator
        {
        public:
            void add(const RawCredit& credit, const TrackReference* track)
            {
                ArtistEntry& artist{ getOrCreateArtist(credit.artistName) };
                if (!artist.id && credit.sourceId && !credit.sourceId->empty())
                    artist.id = credit.sourceId;

                std::vector<AtomicRole> roles{ tokenizeRoles(credit.roleText) };
                if (roles.empty())
                    roles.emplace_back(CreditConsolidator::placeholderRole);

                for (const AtomicRole& role : roles)
                {
                    RoleEntry& entry{ artist.getOrCreateRole(role) };
                    if (!track)
                        entry.creditedOnAlbum = true;
                    else if (std::find(std::cbegin(entry.tracks), std::cend(entry.tracks), *track) == std::cend(entry.tracks))
                        entry.tracks.push_back(*track);
                }
            }

            const std::vector<ArtistEntry>& getArtists() const { return _artists; }

        private:
            ArtistEntry& getOrCreateArtist(std::string_view artistName)
            {
                std::string name{ core::stringUtils::stringTrim(artistName) };
                if (name.empty())
                    name = CreditConsolidator::unknownArtistName;

                auto [it, inserted]{ _artistIndexes.emplace(name, _artists.size()) };
                if (inserted)
                    _artists.push_back(ArtistEntry{ std::move(name), std::nullopt, {}, {} });

                return _artists[it->second];
            }

            std::vector<ArtistEntry> _artists; // in order of first appearance
            std::unordered_map<std::string, std::size_t> _artistIndexes;
        };

        bool isAlbumRole(const RoleEntry& entry, int totalTrackCount)
        {
            if (entry.creditedOnAlbum || entry.tracks.empty())
                return true;

            return totalTrackCount > 0 && entry.tracks.size() >= static_cast<std::size_t>(totalTrackCount);
        }

        ConsolidatedArtistCredit toConsolidatedCredit(const ArtistEntry& artist, int totalTrackCount)
        {
            ConsolidatedArtistCredit res;
            res.artistName = artist.name;
            res.id = artist.id;

            for (const RoleEntry& entry : artist.roles)
            {
                if (isAlbumRole(entry, totalTrackCount))
                    res.albumRoles.push_back(entry.role);
                else
                    res.trackRoles.push_back(TrackRole{ entry.role, entry.tracks });
            }

            return res;
        }
    } // namespace

    CreditConsolidator::CreditConsolidator()
        : CreditConsolidator{ createDefaultCompositionOnlyTerms() }
    {
    }

    CreditConsolidator::CreditConsolidator(std::vector<std::string> compositionOnlyTerms)
        : _compositionOnlyTerms{ std::move(compositionOnlyTerms) }
    {
        for (std::string& term : _compositionOnlyTerms)
            core::stringUtils::stringToLower(term);
    }

    std::vector<ConsolidatedArtistCredit> CreditConsolidator::consolidate(std::span<const RawCredit> albumCredits, std::span<const TrackCredit> trackCredits, int totalTrackCount) const
    {
        if (totalTrackCount < 0)
            throw ContractViolationException{ "Total track count must not be negative (got " + std::to_string(totalTrackCount) + ")" };

        CreditsAccumulator accumulator;
        for (const RawCredit& credit : albumCredits)
            accumulator.add(credit, nullptr);
        for (const TrackCredit& trackCredit : trackCredits)
            accumulator.add(trackCredit.credit, &trackCredit.track);

        std::vector<ConsolidatedArtistCredit> res;
        for (const ArtistEntry& artist : accumulator.getArtists())
        {
            ConsolidatedArtistCredit credit{ toConsolidatedCredit(artist, totalTrackCount) };

            const std::vector<AtomicRole> roles{ credit.getAllRoles() };
            if (isCompositionOnly(roles))
            {
                LINER_LOG(CREDITS, DEBUG, "Skipping artist '" << credit.artistName << "': only credited for composition");
                continue;
            }

            res.push_back(std::move(credit));
        }

        std::stable_sort(std::begin(res), std::end(res), [](const ConsolidatedArtistCredit& lhs, const ConsolidatedArtistCredit& rhs) {
            if (lhs.getSource() != rhs.getSource())
                return lhs.getSource() < rhs.getSource();

            const std::string lhsName{ core::stringUtils::stringToLower(lhs.artistName) };
            const std::string rhsName{ core::stringUtils::stringToLower(rhs.artistName) };
            if (lhsName != rhsName)
                return lhsName < rhsName;

            return lhs.artistName < rhs.artistName;
        });

        LINER_LOG(CREDITS, DEBUG, "Consolidated " << albumCredits.size() << " album credits and " << trackCredits.size() << " track credits into " << res.size() << " artists");

        return res;
    }

    bool CreditConsolidator::isCompositionOnly(std::span<const AtomicRole> roles) const
    {
        if (roles.empty())
            return false;

        return std::all_of(std::cbegin(roles), std::cend(roles), [this](const AtomicRole& role) {
            return std::any_of(std::cbegin(_compositionOnlyTerms), std::cend(_compositionOnlyTerms), [&](const std::string& term) {
                return core::stringUtils::stringCaseInsensitiveContains(role, term);
            });
        });
    }
} // namespace liner::credits
