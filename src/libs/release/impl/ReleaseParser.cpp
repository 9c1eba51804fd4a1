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

#include "release/ReleaseParser.hpp"

#include <cmath>
#include <istream>
#include <iterator>
#include <limits>

#include <Wt/Json/Array.h>
#include <Wt/Json/Object.h>
#include <Wt/Json/Parser.h>
#include <Wt/Json/Value.h>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "release/Exception.hpp"

namespace liner::release
{
    namespace
    {
        // integral values beyond 2^53 are not exact anyway
        constexpr double maxExactInteger{ 9007199254740992.0 };

        std::string numberToString(const Wt::Json::Value& value)
        {
            const double number{ static_cast<double>(value) };
            if (std::trunc(number) == number && std::abs(number) <= maxExactInteger)
                return std::to_string(static_cast<long long>(number));

            return std::to_string(number);
        }

        std::string getString(const Wt::Json::Object& obj, const std::string& name)
        {
            if (obj.type(name) != Wt::Json::Type::String)
                return "";

            return static_cast<std::string>(obj.get(name));
        }

        // ids are numbers in Discogs documents
        std::optional<std::string> getId(const Wt::Json::Object& obj, const std::string& name)
        {
            std::string id;
            if (obj.type(name) == Wt::Json::Type::Number)
                id = numberToString(obj.get(name));
            else
                id = getString(obj, name);

            if (id.empty())
                return std::nullopt;

            return id;
        }

        std::optional<int> getYear(const Wt::Json::Object& obj)
        {
            switch (obj.type("year"))
            {
            case Wt::Json::Type::Number:
            {
                const double year{ static_cast<double>(obj.get("year")) };
                if (year < static_cast<double>(std::numeric_limits<int>::min()) || year > static_cast<double>(std::numeric_limits<int>::max()))
                {
                    LINER_LOG(RELEASE, DEBUG, "Year " << year << " out of range, skipping");
                    return std::nullopt;
                }
                return static_cast<int>(year);
            }
            case Wt::Json::Type::String:
                return core::stringUtils::readAs<int>(static_cast<std::string>(obj.get("year")));
            default:
                return std::nullopt;
            }
        }

        template<typename Visitor>
        void visitArray(const Wt::Json::Object& obj, const std::string& name, Wt::Json::Type elementType, Visitor&& visitor)
        {
            if (obj.type(name) != Wt::Json::Type::Array)
            {
                LINER_LOG_IF(RELEASE, DEBUG, obj.type(name) != Wt::Json::Type::Null, "Field '" << name << "' is not an array, skipping");
                return;
            }

            const Wt::Json::Array& array = obj.get(name);
            for (const Wt::Json::Value& value : array)
            {
                if (value.type() != elementType)
                {
                    LINER_LOG(RELEASE, DEBUG, "Unexpected element type in '" << name << "', skipping");
                    continue;
                }

                visitor(value);
            }
        }

        std::vector<std::string> getStrings(const Wt::Json::Object& obj, const std::string& name)
        {
            std::vector<std::string> res;
            visitArray(obj, name, Wt::Json::Type::String, [&](const Wt::Json::Value& value) { res.push_back(static_cast<std::string>(value)); });

            return res;
        }

        Format parseFormat(const Wt::Json::Object& formatObj)
        {
            Format format;

            for (const auto& [field, value] : formatObj)
            {
                switch (value.type())
                {
                case Wt::Json::Type::String:
                    format.emplace(field, static_cast<std::string>(value));
                    break;

                case Wt::Json::Type::Number:
                    format.emplace(field, numberToString(value));
                    break;

                case Wt::Json::Type::Array:
                    format.emplace(field, getStrings(formatObj, field));
                    break;

                default:
                    break;
                }
            }

            return format;
        }

        credits::RawCredit parseCredit(const Wt::Json::Object& creditObj)
        {
            return credits::RawCredit{
                .artistName = getString(creditObj, "name"),
                .roleText = getString(creditObj, "role"),
                .sourceId = getId(creditObj, "id"),
            };
        }

        std::vector<credits::RawCredit> parseCredits(const Wt::Json::Object& obj)
        {
            std::vector<credits::RawCredit> res;
            visitArray(obj, "extraartists", Wt::Json::Type::Object, [&](const Wt::Json::Object& creditObj) { res.push_back(parseCredit(creditObj)); });

            return res;
        }

        ReleaseArtist parseArtist(const Wt::Json::Object& artistObj)
        {
            return ReleaseArtist{
                .name = getString(artistObj, "name"),
                .role = getString(artistObj, "role"),
                .id = getId(artistObj, "id"),
            };
        }

        RawTrack parseTrack(const Wt::Json::Object& trackObj)
        {
            return RawTrack{
                .position = getString(trackObj, "position"),
                .title = getString(trackObj, "title"),
                .duration = getString(trackObj, "duration"),
                .type = getString(trackObj, "type_"),
                .extraArtists = parseCredits(trackObj),
            };
        }

        RawRelease parseReleaseObject(const Wt::Json::Object& root)
        {
            RawRelease release;

            release.id = getId(root, "id").value_or("");
            release.title = getString(root, "title");
            release.year = getYear(root);
            release.masterId = getId(root, "master_id");
            release.genres = getStrings(root, "genres");
            release.styles = getStrings(root, "styles");
            visitArray(root, "formats", Wt::Json::Type::Object, [&](const Wt::Json::Object& formatObj) { release.formats.push_back(parseFormat(formatObj)); });
            visitArray(root, "artists", Wt::Json::Type::Object, [&](const Wt::Json::Object& artistObj) { release.artists.push_back(parseArtist(artistObj)); });
            release.extraArtists = parseCredits(root);
            visitArray(root, "tracklist", Wt::Json::Type::Object, [&](const Wt::Json::Object& trackObj) { release.tracklist.push_back(parseTrack(trackObj)); });

            LINER_LOG(RELEASE, DEBUG, "Parsed release '" << release.id << "' ('" << release.title << "'): " << release.tracklist.size() << " tracks, " << release.extraArtists.size() << " release credits");

            return release;
        }
    } // namespace

    RawRelease parseRelease(std::string_view json)
    {
        Wt::Json::Object root;

        try
        {
            Wt::Json::parse(std::string{ json }, root);
        }
        catch (const Wt::WException& error)
        {
            LINER_LOG(RELEASE, ERROR, "Cannot parse release: " << error.what());
            throw ReleaseParsingException{ std::string{ "Cannot parse release: " } + error.what() };
        }

        return parseReleaseObject(root);
    }

    RawRelease parseRelease(std::istream& is)
    {
        const std::string json{ std::istreambuf_iterator<char>{ is }, std::istreambuf_iterator<char>{} };
        if (is.bad())
            throw ReleaseParsingException{ "Cannot read release" };

        return parseRelease(std::string_view{ json });
    }
} // namespace liner::release
