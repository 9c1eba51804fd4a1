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

#include "credits/ArtistNameMatcher.hpp"
#include "credits/CreditConsolidator.hpp"
#include "credits/PerformanceRoleClassifier.hpp"
#include "credits/RoleCategorizer.hpp"

namespace liner::credits
{
    RoleRules createDefaultRoleRules()
    {
        RoleRules rules;

        rules.technicalRoles = {
            // production
            "producer", "co-producer", "executive producer", "associate producer", "reissue producer", "executive-producer", "product manager", "produced by", "production", "session production",
            // engineering
            "engineer", "recording engineer", "mixing engineer", "mastering engineer", "sound engineer", "audio engineer", "mix engineer", "master engineer", "mixed by", "mastered by", "recorded by", "engineered by",
            "remastered by", "remastering by", "re-record", "transferred by", "restoration", "edited by", "digitally", "digital remastering", "digital editing", "uncredited",
            // design, artwork
            "design", "cover design", "art direction", "artwork", "artwork by", "illustration", "graphic design", "layout", "typography", "creative director", "sleeve design", "package design", "painting",
            // photography
            "photography", "photography by", "photographer", "cover photography", "band photography", "portrait photography", "photos", "individual photographs",
            // documentation
            "liner notes", "sleeve notes", "notes", "text by", "booklet editor", "research", "transcription by", "annotation",
            // management, coordination
            "management", "coordinator", "project manager", "supervisor", "recording supervisor", "supervised by", "contractor", "a&r", "a&r coordinator", "presenter", "hosted by", "consultant", "advisor",
            "advisement", "original session", "original sessions", "session",
            // compilation
            "for release", "compiled by", "sequenced by", "supervision", "supervision by",
            // technical production
            "technician", "lacquer cut by", "cutting engineer", "post production", "remix", "remixed by",
            // legal, business
            "legal", "copyright", "rights", "licensing", "clearance", "publisher", "publishing",
            // misc
            "directed by", "copyist", "graphics", "crew", "booking", "adapted by", "promotion", "assisting", "stylist", "hair", "public relations", "assistants", "french translation",
            "additional assistant", "translation", "assistance", "assistent", "technical support"
        };

        rules.musicalRoles = {
            // vocals
            "vocals", "lead vocals", "backing vocals", "background vocals", "harmony vocals", "choir", "chorus", "voice", "singer", "soprano", "alto", "tenor", "baritone", "bass vocals",
            // strings
            "guitar", "electric guitar", "acoustic guitar", "classical guitar", "lead guitar", "rhythm guitar", "slide guitar", "steel guitar", "twelve-string guitar", "12-string guitar", "bass guitar",
            "electric bass", "acoustic bass", "upright bass", "double bass", "fretless bass", "violin", "viola", "cello", "fiddle", "mandolin", "banjo", "ukulele", "harp", "sitar",
            // keyboards
            "piano", "keyboards", "electric piano", "acoustic piano", "grand piano", "upright piano", "organ", "hammond organ", "church organ", "synthesizer", "synth", "moog", "mellotron", "harpsichord",
            "celeste", "accordion", "harmonium",
            // percussions
            "drums", "drum kit", "drum set", "percussion", "timpani", "congas", "bongos", "djembe", "tabla", "hand percussion", "tambourine", "shaker", "maracas", "cowbell", "triangle", "cymbals", "gong",
            "vibraphone", "xylophone", "marimba",
            // winds
            "saxophone", "alto saxophone", "tenor saxophone", "soprano saxophone", "baritone saxophone", "sax", "trumpet", "cornet", "flugelhorn", "trombone", "french horn", "tuba", "euphonium", "flute",
            "piccolo", "clarinet", "oboe", "bassoon", "english horn", "harmonica", "recorder", "bagpipes",
            // composition, arrangement
            "composer", "songwriter", "written-by", "written by", "music by", "composed by", "arranger", "arranged by", "orchestrator", "orchestrated by", "string arrangements", "horn arrangements",
            "vocal arrangements", "conductor", "musical director", "bandleader", "soloist",
            // performance
            "performer", "musician", "instrumentalist", "artist", "featured artist", "guest artist", "session musician"
        };

        rules.technicalPatterns = {
            "engineer", "producer?", "produced", "design", "photography", "photos?", "artwork", "painting", "mastered?", "remastering", "mixed?", "recorded?", "supervisor?", "coordinator",
            "management", "director", "notes", "liner", "layout", "typography", "consultant", "advisor", "digitally", "uncredited", "digital", "session", "original session", "compiled", "sequenced",
            "supervision", "for release"
        };

        rules.musicalPatterns = {
            "guitar", "bass", "piano", "vocal", "drum", "trumpet", "saxophone", "violin", "composer", "arranged?", "conductor"
        };

        return rules;
    }

    PerformanceRoleRules createDefaultPerformanceRoleRules()
    {
        PerformanceRoleRules rules;

        rules.performanceRoles = {
            // instruments
            "piano", "guitar", "bass", "drums", "saxophone", "trumpet", "violin", "keyboards", "synthesizer", "organ", "harmonica", "flute", "clarinet", "trombone", "percussion", "cello", "viola",
            "double bass", "acoustic bass", "electric guitar", "acoustic guitar", "electric bass", "acoustic piano", "electric piano", "lead guitar", "rhythm guitar", "bass guitar", "harmonic", "harp",
            "banjo", "mandolin", "ukulele", "accordion", "alto saxophone", "tenor saxophone", "soprano saxophone", "baritone saxophone", "french horn", "tuba", "piccolo", "oboe", "bassoon", "bagpipes",
            "vibraphone", "xylophone", "marimba", "timpani", "congas", "bongos", "djembe", "tabla", "tambourine", "shaker", "maracas", "cowbell", "triangle", "cymbals", "gong", "celeste", "harmonium",
            "mellotron", "moog", "synth", "cornet", "flugelhorn", "euphonium", "english horn", "recorder", "sitar", "fiddle", "harpsichord", "church organ", "hammond organ",
            // vocals
            "vocals", "lead vocals", "backing vocals", "harmony vocals", "voice", "singer", "vocal", "lead vocal", "background vocals", "harmony", "soprano", "alto", "tenor", "baritone", "bass vocals",
            "choir", "chorus",
            // other performers
            "performer", "musician", "soloist", "bandleader", "conductor", "musical director"
        };

        rules.excludedRoles = {
            // composition
            "written-by", "written by", "composer", "composed by", "songwriter", "writer", "lyrics by", "music by", "words by", "lyricist", "text by", "composition", "compositional", "composition by",
            "compositions", "original music", "original music by", "music composed by", "song writer", "songs written by", "songs by", "material by", "author", "authored by", "copyright", "publishing",
            // arrangement
            "arranger", "arranged by", "arrangement", "arrangements", "orchestrator", "orchestrated by", "orchestration", "orchestrations", "string arrangements", "horn arrangements", "vocal arrangements",
            "rhythm arrangements", "orchestral arrangements", "arranged and conducted", "musical arrangements", "additional arrangements", "score", "transcription", "transcribed by", "adaptation",
            "adapted by",
            // production
            "producer", "produced by", "executive producer", "co-producer", "associate producer", "reissue producer", "executive-producer", "product manager", "production", "production coordinator",
            "album producer", "record producer", "musical producer",
            // engineering
            "engineer", "engineered by", "recording engineer", "mixing engineer", "mastering engineer", "sound engineer", "audio engineer", "mix engineer", "master engineer", "mixed by", "mastered by",
            "recorded by", "remastered by", "transferred by", "restoration", "edited by", "assistant engineer", "recording", "mixing", "mastering", "digital editing", "sound design", "audio editing",
            // design, documentation
            "photography", "photographed by", "design", "designed by", "artwork", "illustration", "illustrated by", "graphic design", "layout", "typography", "creative director", "sleeve design",
            "album design", "cover design", "liner notes", "sleeve notes", "notes", "booklet editor", "concept", "art direction", "creative concept",
            // management, business
            "coordinator", "management", "managed by", "a&r", "supervisor", "supervised by", "contractor", "presenter", "hosted by", "legal", "rights", "licensing", "clearance", "publisher",
            "label coordinator", "project coordinator",
            // samples, spoken parts
            "voice", "voice [uncredited samples]", "uncredited samples", "samples", "spoken word", "speech", "narrator", "narration", "announcement", "voice-over", "voiceover", "radio announcement",
            "spoken introduction", "field recording", "archive recording", "historical recording",
            // acknowledgments
            "thanks", "special thanks", "acknowledgments", "acknowledgement", "dedication", "dedicated to", "in memory of", "tribute", "inspiration", "inspired by", "influence", "consultant",
            // misc
            "remastering", "transfer", "digitization", "compilation", "compiled by", "selection", "selected by", "sequencing", "sequence", "programming", "programmed by", "sampling", "sample source",
            "source material"
        };

        rules.compositionalKeywords = {
            "written", "wrote", "composer", "composition", "composed", "songwriter", "lyrics", "lyricist", "author", "copyright", "publishing"
        };

        return rules;
    }

    std::vector<std::string> createDefaultCommonNames()
    {
        return {
            "john", "paul", "george", "bill", "bob", "mike", "dave", "steve", "jim", "tom",
            "mary", "lisa", "susan", "karen", "nancy", "linda", "carol", "sarah", "donna",
            "smith", "johnson", "williams", "brown", "jones", "garcia", "miller", "davis",
            "rodriguez", "martinez", "hernandez", "lopez", "gonzalez", "wilson", "anderson",
            "taylor", "thomas", "jackson", "white", "harris", "martin", "thompson", "lee"
        };
    }

    std::vector<std::string> createDefaultCompositionOnlyTerms()
    {
        return { "written-by", "written by", "composed by", "composer", "words by", "lyrics by", "lyricist" };
    }
} // namespace liner::credits
