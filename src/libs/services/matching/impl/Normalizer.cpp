/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of BLM.
 *
 * BLM is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * BLM is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with BLM.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "services/matching/Normalizer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <regex>
#include <string>
#include <utility>

#include "core/String.hpp"

namespace blm::matching::normalizer
{
    namespace
    {
        // "Song - Remastered 2011", "Song - 2011 Remaster", "Song - Live at Wembley"...
        const std::regex dashSuffixRegex{ R"(\s+-\s+(?:\d{4}\s+)?(?:remaster|remastered|live|remix|mix|edit|version|demo|radio|acoustic|unplugged|mono|stereo|single|album|extended|bonus|instrumental|original|\d{4})\b.*$)" };
        // a period or a following name is required for "feat"/"ft", so that "Little Feat" stays untouched
        const std::regex featRegex{ R"(\s+(?:featuring\b|feat[.\s]|ft[.\s]).*$)" };
        const std::regex ellipsisRegex{ R"(\.{3,})" };
        const std::regex leadingArticleRegex{ R"(^(?:the|a|an)\s+)" };

        // applied one after the other, the most specific ones first
        const std::array<std::regex, 8> artistSeparatorRegexes{
            std::regex{ R"(\s+(?:featuring\s+|(?:feat|ft)(?:\.\s*|\s+)))", std::regex::icase },
            std::regex{ R"(\s+duet\s+with\s+)", std::regex::icase },
            std::regex{ R"(\s+vs\.?\s+)", std::regex::icase },
            std::regex{ R"(\s+with\s+)", std::regex::icase },
            std::regex{ R"(\s+[fw]/\s*)", std::regex::icase },
            std::regex{ R"(\s*&\s*)" },
            std::regex{ R"(\s*/\s*)" },
            std::regex{ R"(\s+and\s+)", std::regex::icase },
        };

        struct VersionKeyword
        {
            std::regex regex;
            std::string_view label;
        };

        const std::array<VersionKeyword, 11> versionKeywords{ {
            { std::regex{ R"(\bradio\s+edit\b)", std::regex::icase }, "Radio Edit" },
            { std::regex{ R"(\bremaster(?:ed)?\b)", std::regex::icase }, "Remaster" },
            { std::regex{ R"(\blive\b)", std::regex::icase }, "Live" },
            { std::regex{ R"(\bacoustic\b)", std::regex::icase }, "Acoustic" },
            { std::regex{ R"(\bunplugged\b)", std::regex::icase }, "Unplugged" },
            { std::regex{ R"(\binstrumental\b)", std::regex::icase }, "Instrumental" },
            { std::regex{ R"(\bextended\b)", std::regex::icase }, "Extended" },
            { std::regex{ R"(\bdemo\b)", std::regex::icase }, "Demo" },
            { std::regex{ R"(\b(?:re)?mix(?:ed)?\b)", std::regex::icase }, "Remix" },
            { std::regex{ R"(\bedit\b)", std::regex::icase }, "Edit" },
            { std::regex{ R"(\bmono\b)", std::regex::icase }, "Mono" },
        } };

        bool isOpeningBracket(char c)
        {
            return c == '(' || c == '[' || c == '{';
        }

        bool isClosingBracket(char c)
        {
            return c == ')' || c == ']' || c == '}';
        }

        bool hasAlnum(std::string_view str)
        {
            return std::any_of(std::cbegin(str), std::cend(str), [](char c) {
                return static_cast<unsigned char>(c) >= 0x80 || std::isalnum(static_cast<unsigned char>(c));
            });
        }

        // An unclosed bracket is a truncated qualifier: everything after it goes away.
        // If nothing would be left, only the bracket characters are removed.
        std::string removeBracketedContent(std::string_view str)
        {
            std::string res;
            res.reserve(str.size());

            std::size_t depth{};
            for (const char c : str)
            {
                if (isOpeningBracket(c))
                {
                    if (depth++ == 0)
                        res.push_back(' ');
                }
                else if (isClosingBracket(c))
                {
                    if (depth > 0)
                        --depth;
                    else
                        res.push_back(' ');
                }
                else if (depth == 0)
                    res.push_back(c);
            }

            if (hasAlnum(res) || !hasAlnum(str))
                return res;

            res.clear();
            for (const char c : str)
                res.push_back(isOpeningBracket(c) || isClosingBracket(c) ? ' ' : c);

            return res;
        }

        bool isDigitAt(std::string_view str, std::size_t pos)
        {
            return pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]));
        }

        // Word separators become spaces, other ASCII punctuation is dropped, non ASCII bytes are kept
        std::string removePunctuation(std::string_view str)
        {
            std::string res;
            res.reserve(str.size());

            for (std::size_t i{}; i < str.size(); ++i)
            {
                const char c{ str[i] };
                const unsigned char uc{ static_cast<unsigned char>(c) };

                if (uc >= 0x80 || std::isalnum(uc))
                    res.push_back(c);
                else if (std::isspace(uc))
                    res.push_back(' ');
                else if (c == ',')
                {
                    // thousands separator: "10,000"
                    if (!(i > 0 && isDigitAt(str, i - 1) && isDigitAt(str, i + 1)))
                        res.push_back(' ');
                }
                else if (c == '/' || c == '\\' || c == '-' || c == '_' || c == ':' || c == ';' || c == '|' || c == '~')
                    res.push_back(' ');
            }

            return res;
        }

        std::string cleanOnce(std::string_view text)
        {
            std::string res{ core::stringUtils::foldToAscii(text) };
            core::stringUtils::stringToLower(res);

            res = removeBracketedContent(res);
            res = std::regex_replace(res, dashSuffixRegex, "");
            res = std::regex_replace(res, featRegex, "");
            res = std::regex_replace(res, ellipsisRegex, " ");
            res = core::stringUtils::replaceInString(res, "&", " and ");
            res = core::stringUtils::replaceInString(res, "+", " plus ");
            res = removePunctuation(res);

            return core::stringUtils::collapseWhitespaces(res);
        }

        std::string capitalize(std::string_view word)
        {
            std::string res{ word };
            if (!res.empty())
                res.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(res.front())));

            return res;
        }

        constexpr char protectedNameMarker{ '\x1F' };

        bool isWordChar(char c)
        {
            return std::isalnum(static_cast<unsigned char>(c));
        }

        bool isAllCaps(std::string_view word)
        {
            bool hasUpper{};
            for (const char c : word)
            {
                const unsigned char uc{ static_cast<unsigned char>(c) };
                if (std::islower(uc))
                    return false;
                if (std::isupper(uc))
                    hasUpper = true;
            }
            return hasUpper;
        }
    } // namespace

    std::string clean(std::string_view text)
    {
        std::string current{ text };
        while (true)
        {
            std::string next{ cleanOnce(current) };
            if (next == current)
                return next;

            current = std::move(next);
        }
    }

    std::string cleanArtist(std::string_view text)
    {
        const std::string cleaned{ clean(text) };

        std::string res{ std::regex_replace(cleaned, leadingArticleRegex, "") };
        if (res.empty())
            return cleaned;

        return res;
    }

    std::string generateSignature(std::string_view artist, std::string_view title)
    {
        const std::string cleanedArtist{ clean(artist) };
        const std::string cleanedTitle{ clean(title) };
        if (cleanedArtist.empty() || cleanedTitle.empty())
            return "";

        std::string res;
        res.reserve(cleanedArtist.size() + signatureSeparator.size() + cleanedTitle.size());
        res += cleanedArtist;
        res += signatureSeparator;
        res += cleanedTitle;

        return res;
    }

    std::vector<std::string> splitArtists(std::string_view rawArtist, std::span<const std::string> unsplittableNames)
    {
        std::vector<std::string> protectedTexts;
        std::string normalized{ protectNames(core::stringUtils::foldToAscii(rawArtist), unsplittableNames, protectedTexts) };
        for (const std::regex& separatorRegex : artistSeparatorRegexes)
            normalized = std::regex_replace(normalized, separatorRegex, "|");

        // comma separated lists, but not thousands separators
        for (std::size_t i{}; i < normalized.size(); ++i)
        {
            if (normalized[i] == ',' && !(i > 0 && isDigitAt(normalized, i - 1) && isDigitAt(normalized, i + 1)))
                normalized[i] = '|';
        }

        std::vector<std::string> res;
        for (std::string_view part : core::stringUtils::splitString(normalized, '|'))
        {
            std::string cleaned{ clean(restoreNames(part, protectedTexts)) };
            if (cleaned.empty())
                continue;

            if (std::find(std::cbegin(res), std::cend(res), cleaned) == std::cend(res))
                res.push_back(std::move(cleaned));
        }

        return res;
    }

    std::string protectNames(std::string_view text, std::span<const std::string> names, std::vector<std::string>& protectedTexts)
    {
        std::string unmarkedText{ text };
        std::replace(std::begin(unmarkedText), std::end(unmarkedText), protectedNameMarker, ' ');
        const std::string loweredText{ core::stringUtils::stringToLower(std::string_view{ unmarkedText }) };

        std::vector<std::string> loweredNames;
        loweredNames.reserve(names.size());
        for (const std::string& name : names)
            loweredNames.push_back(core::stringUtils::stringToLower(name));

        std::string res;
        res.reserve(text.size());

        std::size_t pos{};
        while (pos < loweredText.size())
        {
            // longest name wins
            std::size_t matchSize{};
            if (pos == 0 || !isWordChar(loweredText[pos - 1]))
            {
                for (const std::string& name : loweredNames)
                {
                    if (name.empty() || name.size() <= matchSize || loweredText.compare(pos, name.size(), name) != 0)
                        continue;

                    const std::size_t end{ pos + name.size() };
                    if (end < loweredText.size() && isWordChar(loweredText[end]))
                        continue;

                    matchSize = name.size();
                }
            }

            if (matchSize == 0)
            {
                res.push_back(unmarkedText[pos++]);
                continue;
            }

            res.push_back(protectedNameMarker);
            res += std::to_string(protectedTexts.size());
            res.push_back(protectedNameMarker);
            protectedTexts.push_back(unmarkedText.substr(pos, matchSize));
            pos += matchSize;
        }

        return res;
    }

    std::string restoreNames(std::string_view text, std::span<const std::string> protectedTexts)
    {
        std::string res;
        res.reserve(text.size());

        std::size_t pos{};
        while (pos < text.size())
        {
            if (text[pos] == protectedNameMarker)
            {
                const std::size_t end{ text.find(protectedNameMarker, pos + 1) };
                if (end != std::string_view::npos)
                {
                    const std::optional<std::size_t> index{ core::stringUtils::readAs<std::size_t>(text.substr(pos + 1, end - pos - 1)) };
                    if (index && *index < protectedTexts.size())
                    {
                        res += protectedTexts[*index];
                        pos = end + 1;
                        continue;
                    }
                }
            }

            res.push_back(text[pos++]);
        }

        return res;
    }

    std::string extractVersionType(std::string_view title)
    {
        // qualifiers are the bracketed parts and the dash suffix
        std::vector<std::string> qualifiers;

        std::string current;
        std::size_t depth{};
        for (const char c : title)
        {
            if (isOpeningBracket(c))
            {
                if (depth++ > 0)
                    current.push_back(' ');
            }
            else if (isClosingBracket(c))
            {
                if (depth > 0 && --depth == 0)
                {
                    qualifiers.push_back(std::move(current));
                    current.clear();
                }
            }
            else if (depth > 0)
                current.push_back(c);
        }
        if (depth > 0)
            qualifiers.push_back(std::move(current));

        if (const std::size_t dashPos{ title.find(" - ") }; dashPos != std::string_view::npos)
            qualifiers.emplace_back(title.substr(dashPos + 3));

        for (const std::string& qualifier : qualifiers)
        {
            for (const VersionKeyword& keyword : versionKeywords)
            {
                if (std::regex_search(qualifier, keyword.regex))
                    return std::string{ keyword.label };
            }
        }

        return "Original";
    }

    std::string toArtistTitleCase(std::string_view name)
    {
        const std::string collapsed{ core::stringUtils::collapseWhitespaces(name) };

        std::vector<std::string> words;
        for (std::string_view word : core::stringUtils::splitString(collapsed, ' '))
        {
            if (word.empty())
                continue;

            if (isAllCaps(word))
            {
                const std::string lowered{ core::stringUtils::stringToLower(word) };
                const bool isStopWord{ lowered == "and" || lowered == "the" || lowered == "with" || lowered == "feat" };
                if (word.size() <= 4 && !isStopWord)
                    words.emplace_back(word);
                else
                    words.push_back(capitalize(lowered));
            }
            else
                words.push_back(capitalize(word));
        }

        return core::stringUtils::joinStrings(words, " ");
    }
} // namespace blm::matching::normalizer
