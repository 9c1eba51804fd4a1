/*
 * Copyright (C) 2023 Emeric Poupon
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

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>

#include <boost/program_options.hpp>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/StreamLogger.hpp"
#include "core/String.hpp"
#include "credits/ArtistNameMatcher.hpp"
#include "credits/CreditConsolidator.hpp"
#include "credits/PerformanceRoleClassifier.hpp"
#include "credits/RoleCategorizer.hpp"
#include "release/AlbumBuilder.hpp"
#include "release/Exception.hpp"
#include "release/FilterParameters.hpp"
#include "release/ReleaseFilter.hpp"
#include "release/ReleaseParser.hpp"

namespace liner::release
{
    namespace
    {
        std::ostream& operator<<(std::ostream& os, const FormatValue& value)
        {
            if (const std::string* str{ std::get_if<std::string>(&value) })
                return os << "'" << *str << "'";

            os << "[";
            bool first{ true };
            for (const std::string& item : std::get<std::vector<std::string>>(value))
            {
                os << (first ? "" : ", ") << "'" << item << "'";
                first = false;
            }
            return os << "]";
        }

        std::ostream& operator<<(std::ostream& os, const FilterDecision& decision)
        {
            if (decision.isIncluded())
                return os << "included";

            return os << "rejected (" << filterCheckToString(decision.rejection->check) << "): " << decision.rejection->reason;
        }

        std::ostream& operator<<(std::ostream& os, const ReleaseArtist& artist)
        {
            os << artist.name << " (" << artist.role << ")";
            if (artist.id)
                os << " [" << *artist.id << "]";

            return os;
        }

        void printRole(const credits::RoleCategorizer& categorizer, std::string_view role)
        {
            const credits::RoleCategorizer::Classification classification{ categorizer.classify(role) };
            std::cout << role << " [" << credits::roleCategoryToString(classification.category) << ", " << credits::ruleKindToString(classification.rule) << "]";
        }

        void printCredit(const credits::RoleCategorizer& categorizer, const credits::ConsolidatedArtistCredit& credit)
        {
            std::cout << "\t" << credit.artistName;
            if (credit.id)
                std::cout << " [" << *credit.id << "]";
            std::cout << std::endl;

            for (const credits::AtomicRole& role : credit.albumRoles)
            {
                std::cout << "\t\tAlbum role: ";
                printRole(categorizer, role);
                std::cout << std::endl;
            }

            for (const credits::TrackRole& trackRole : credit.trackRoles)
            {
                std::cout << "\t\tTrack role: ";
                printRole(categorizer, trackRole.role);
                std::cout << " on";
                for (const credits::TrackReference& track : trackRole.tracks)
                    std::cout << " " << track.position << " ('" << track.title << "')";
                std::cout << std::endl;
            }
        }

        void printAlbum(const credits::RoleCategorizer& categorizer, const Album& album)
        {
            std::cout << "Id: " << album.id << std::endl;
            std::cout << "Title: " << album.title << std::endl;
            if (album.year)
                std::cout << "Year: " << *album.year << std::endl;
            std::cout << "Type: " << albumTypeToString(album.type) << std::endl;
            std::cout << "Main artist: " << album.mainArtist << " (" << album.mainRole << ")" << std::endl;
            for (const ReleaseArtist& artist : album.artists)
                std::cout << "Artist: " << artist << std::endl;

            for (std::string_view genre : album.genres)
                std::cout << "Genre: " << genre << std::endl;
            for (std::string_view style : album.styles)
                std::cout << "Style: " << style << std::endl;

            for (const Format& format : album.formats)
            {
                std::cout << "Format:" << std::endl;
                for (const auto& [field, value] : format)
                    std::cout << "\t" << field << ": " << value << std::endl;
            }

            for (const Track& track : album.tracklist)
            {
                std::cout << "Track: " << track.position << " '" << track.title << "'";
                if (!track.duration.empty())
                    std::cout << " (" << track.duration << ")";
                if (track.type != AlbumBuilder::defaultTrackType)
                    std::cout << " [" << track.type << "]";
                std::cout << std::endl;
            }

            std::cout << "Credits:" << std::endl;
            for (const credits::ConsolidatedArtistCredit& credit : album.credits)
                printCredit(categorizer, credit);

            std::cout << "Valid: " << std::boolalpha << validateAlbum(album) << std::endl;
        }

        bool processFile(const std::filesystem::path& file, const ReleaseFilter& filter, const AlbumBuilder& albumBuilder, const credits::RoleCategorizer& categorizer, std::string_view targetArtist)
        {
            std::ifstream ifs{ file.string() };
            if (!ifs)
            {
                std::cerr << "Cannot open file '" << file.string() << "'" << std::endl;
                return false;
            }

            try
            {
                const RawRelease release{ parseRelease(ifs) };

                std::cout << "Decision: " << filter.shouldInclude(release, targetArtist) << std::endl;
                printAlbum(categorizer, albumBuilder.build(release));
                std::cout << std::endl;
            }
            catch (const Exception& e)
            {
                std::cerr << "Cannot process file '" << file.string() << "': " << e.what() << std::endl;
                return false;
            }

            return true;
        }
    } // namespace
} // namespace liner::release

int main(int argc, char* argv[])
{
    try
    {
        using namespace liner;
        namespace program_options = boost::program_options;

        program_options::options_description options{ "Options" };
        // clang-format off
        options.add_options()
            ("help,h", "Display this help message")
            ("conf,c", program_options::value<std::string>(), "Configuration file")
            ("artist,a", program_options::value<std::string>()->default_value(""), "Target artist, must be credited with a performance role")
            ("verbose,v", program_options::bool_switch()->default_value(false), "Display debug logs");
        // clang-format on

        program_options::options_description hiddenOptions{ "Hidden options" };
        hiddenOptions.add_options()("file", program_options::value<std::vector<std::string>>()->composing(), "file");

        program_options::options_description allOptions;
        allOptions.add(options).add(hiddenOptions);

        program_options::positional_options_description positional;
        positional.add("file", -1);

        program_options::variables_map vm;
        program_options::store(program_options::command_line_parser(argc, argv)
                                   .options(allOptions)
                                   .positional(positional)
                                   .run(),
            vm);

        program_options::notify(vm);

        auto displayHelp = [&](std::ostream& os) {
            os << "Usage: " << argv[0] << " [options] file..." << std::endl;
            os << options << std::endl;
        };

        if (vm.count("help"))
        {
            displayHelp(std::cout);
            return EXIT_SUCCESS;
        }

        if (vm.count("file") == 0)
        {
            std::cerr << "No input file provided" << std::endl;
            displayHelp(std::cerr);
            return EXIT_FAILURE;
        }

        std::unique_ptr<core::IConfig> config;
        if (vm.count("conf"))
            config = core::createConfig(vm["conf"].as<std::string>());

        std::unique_ptr<core::logging::ILogger> logger;
        if (vm["verbose"].as<bool>())
        {
            logger = std::make_unique<core::logging::StreamLogger>(std::cout, core::logging::StreamLogger::allSeverities);
        }
        else if (config)
        {
            const std::string_view strMinSeverity{ config->getString("log-min-severity", "info") };
            const std::optional<core::logging::Severity> minSeverity{ core::logging::parseSeverity(strMinSeverity) };
            if (!minSeverity)
            {
                std::cerr << "Invalid log-min-severity '" << strMinSeverity << "'" << std::endl;
                return EXIT_FAILURE;
            }
            logger = core::logging::createLogger(*minSeverity, config->getPath("log-file", ""));
        }
        else
        {
            logger = std::make_unique<core::logging::StreamLogger>(std::cerr);
        }
        core::Service<core::logging::ILogger> loggerService{ std::move(logger) };

        const credits::RoleCategorizer categorizer{ credits::createDefaultRoleRules(), config ? credits::readUnknownRoleCategory(*config) : credits::RoleCategory::Musical };
        const credits::ArtistNameMatcher artistNameMatcher;
        const credits::PerformanceRoleClassifier performanceRoleClassifier{ credits::createDefaultPerformanceRoleRules() };
        const credits::CreditConsolidator creditConsolidator;

        const release::ReleaseFilter filter{ config ? release::readFilterParameters(*config) : release::createDefaultFilterParameters(), artistNameMatcher, performanceRoleClassifier };
        const release::AlbumBuilder albumBuilder{ creditConsolidator };

        const std::string& targetArtist{ vm["artist"].as<std::string>() };
        if (!targetArtist.empty())
            LINER_LOG(MAIN, INFO, "Checking performance roles of '" << targetArtist << "'");

        bool success{ true };
        for (const std::string& inputFile : vm["file"].as<std::vector<std::string>>())
        {
            std::cout << "Processing file '" << inputFile << "'" << std::endl;
            if (!release::processFile(inputFile, filter, albumBuilder, categorizer, targetArtist))
                success = false;
        }

        return success ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (const liner::core::LinerException& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const boost::program_options::error& e)
    {
        std::cerr << "Invalid usage: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
