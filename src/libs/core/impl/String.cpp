/*
 * Copyright (C) 2013 Emeric Poupon
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

#include "core/String.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>

#include <Wt/WDateTime.h>

namespace blm::core::stringUtils
{
    namespace details
    {
        template<typename StringType>
        std::string joinStrings(std::span<const StringType> strings, std::string_view delimiter)
        {
            std::string res;
            bool first{ true };

            for (const StringType& str : strings)
            {
                if (!first)
                    res += delimiter;
                res += str;
                first = false;
            }

            return res;
        }

        // U+00C0 to U+00FF
        constexpr std::array<std::string_view, 64> latin1Letters{
            "A", "A", "A", "A", "A", "A", "AE", "C", "E", "E", "E", "E", "I", "I", "I", "I",
            "D", "N", "O", "O", "O", "O", "O", "x", "O", "U", "U", "U", "U", "Y", "TH", "ss",
            "a", "a", "a", "a", "a", "a", "ae", "c", "e", "e", "e", "e", "i", "i", "i", "i",
            "d", "n", "o", "o", "o", "o", "o", "", "o", "u", "u", "u", "u", "y", "th", "y"
        };

        // U+0100 to U+017F
        constexpr std::array<std::string_view, 128> latinExtendedALetters{
            "A", "a", "A", "a", "A", "a", "C", "c", "C", "c", "C", "c", "C", "c", "D", "d",
            "D", "d", "E", "e", "E", "e", "E", "e", "E", "e", "E", "e", "G", "g", "G", "g",
            "G", "g", "G", "g", "H", "h", "H", "h", "I", "i", "I", "i", "I", "i", "I", "i",
            "I", "i", "IJ", "ij", "J", "j", "K", "k", "k", "L", "l", "L", "l", "L", "l", "L",
            "l", "L", "l", "N", "n", "N", "n", "N", "n", "n", "N", "n", "O", "o", "O", "o",
            "O", "o", "OE", "oe", "R", "r", "R", "r", "R", "r", "S", "s", "S", "s", "S", "s",
            "S", "s", "T", "t", "T", "t", "T", "t", "U", "u", "U", "u", "U", "u", "U", "u",
            "U", "u", "U", "u", "W", "w", "Y", "y", "Y", "Z", "z", "Z", "z", "Z", "z", "s"
        };

        std::optional<std::string_view> foldCodePoint(std::uint32_t codePoint)
        {
            if (codePoint >= 0x00C0 && codePoint <= 0x00FF)
                return latin1Letters[codePoint - 0x00C0];
            if (codePoint >= 0x0100 && codePoint <= 0x017F)
                return latinExtendedALetters[codePoint - 0x0100];
            if (codePoint >= 0x0300 && codePoint <= 0x036F) // combining diacritical marks
                return "";

            switch (codePoint)
            {
            case 0x00A0: // no-break space
                return " ";
            case 0x00B4: // acute accent, often used as an apostrophe
            case 0x2018:
            case 0x2019:
            case 0x201B:
            case 0x2032:
                return "'";
            case 0x201C:
            case 0x201D:
            case 0x201E:
            case 0x2033:
                return "\"";
            case 0x2010:
            case 0x2011:
            case 0x2012:
            case 0x2013:
            case 0x2014:
                return "-";
            case 0x2026:
                return "...";
            }

            // remaining Latin-1 punctuation and symbols
            if (codePoint >= 0x0080 && codePoint < 0x00C0)
                return "";

            return std::nullopt;
        }

        // Returns the sequence length, 0 if invalid
        std::size_t decodeUTF8(std::string_view str, std::size_t pos, std::uint32_t& codePoint)
        {
            const unsigned char lead{ static_cast<unsigned char>(str[pos]) };

            std::size_t length{};
            if (lead < 0x80)
            {
                codePoint = lead;
                return 1;
            }
            else if ((lead & 0xE0) == 0xC0)
            {
                length = 2;
                codePoint = lead & 0x1F;
            }
            else if ((lead & 0xF0) == 0xE0)
            {
                length = 3;
                codePoint = lead & 0x0F;
            }
            else if ((lead & 0xF8) == 0xF0)
            {
                length = 4;
                codePoint = lead & 0x07;
            }
            else
                return 0;

            if (pos + length > str.size())
                return 0;

            for (std::size_t i{ 1 }; i < length; ++i)
            {
                const unsigned char c{ static_cast<unsigned char>(str[pos + i]) };
                if ((c & 0xC0) != 0x80)
                    return 0;
                codePoint = (codePoint << 6) | (c & 0x3F);
            }

            return length;
        }
    } // namespace details

    template<>
    std::optional<std::string> readAs(std::string_view str)
    {
        return std::string{ str };
    }

    template<>
    std::optional<bool> readAs(std::string_view str)
    {
        if (str == "1" || stringCaseInsensitiveEqual(str, "true"))
            return true;
        else if (str == "0" || stringCaseInsensitiveEqual(str, "false"))
            return false;

        return std::nullopt;
    }

    std::vector<std::string_view> splitString(std::string_view str, char separator)
    {
        return splitString(str, std::string_view{ &separator, 1 });
    }

    std::vector<std::string_view> splitString(std::string_view str, std::string_view separator)
    {
        return splitString(str, std::span{ &separator, 1 });
    }

    std::vector<std::string_view> splitString(std::string_view str, std::span<const std::string_view> separators)
    {
        std::vector<std::string_view> res;

        std::size_t currentPos{};
        while (currentPos < str.size())
        {
            std::size_t nextSeparatorPos{ std::string_view::npos };
            std::size_t sepLen{};

            for (const std::string_view sep : separators)
            {
                if (sep.empty())
                    continue;

                const std::size_t found{ str.find(sep, currentPos) };
                if (found < nextSeparatorPos)
                {
                    nextSeparatorPos = found;
                    sepLen = sep.size();
                }
            }

            if (nextSeparatorPos == std::string_view::npos)
                break;

            res.push_back(str.substr(currentPos, nextSeparatorPos - currentPos));
            currentPos = nextSeparatorPos + sepLen;
        }

        res.push_back(str.substr(std::min(currentPos, str.size())));
        return res;
    }

    std::string joinStrings(std::span<const std::string_view> strings, std::string_view delimiter)
    {
        return details::joinStrings(strings, delimiter);
    }

    std::string joinStrings(std::span<const std::string> strings, std::string_view delimiter)
    {
        return details::joinStrings(strings, delimiter);
    }

    std::string escapeAndJoinStrings(std::span<const std::string> strings, char delimiter, char escapeChar)
    {
        std::string result;
        bool first{ true };
        for (const std::string& str : strings)
        {
            if (!first)
                result.push_back(delimiter);
            first = false;

            for (char c : str)
            {
                if (c == delimiter || c == escapeChar)
                    result.push_back(escapeChar);

                result.push_back(c);
            }
        }
        return result;
    }

    std::vector<std::string> splitEscapedStrings(std::string_view str, char delimiter, char escapeChar)
    {
        std::vector<std::string> result;
        if (str.empty())
            return result;

        std::string current;
        bool escaped{};

        for (char c : str)
        {
            if (escaped)
            {
                current.push_back(c);
                escaped = false;
            }
            else if (c == delimiter)
            {
                result.push_back(std::move(current));
                current.clear();
            }
            else if (c == escapeChar)
                escaped = true;
            else
                current.push_back(c);
        }

        result.push_back(std::move(current));
        return result;
    }

    std::string_view stringTrim(std::string_view str, std::string_view whitespaces)
    {
        const auto strBegin{ str.find_first_not_of(whitespaces) };
        if (strBegin == std::string_view::npos)
            return {};

        const auto strEnd{ str.find_last_not_of(whitespaces) };
        return str.substr(strBegin, strEnd - strBegin + 1);
    }

    std::string stringToLower(std::string_view str)
    {
        std::string res{ str };
        stringToLower(res);
        return res;
    }

    void stringToLower(std::string& str)
    {
        std::transform(std::cbegin(str), std::cend(str), std::begin(str), [](unsigned char c) { return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c); });
    }

    bool stringCaseInsensitiveEqual(std::string_view strA, std::string_view strB)
    {
        if (strA.size() != strB.size())
            return false;

        for (std::size_t i{}; i < strA.size(); ++i)
        {
            if (std::tolower(static_cast<unsigned char>(strA[i])) != std::tolower(static_cast<unsigned char>(strB[i])))
                return false;
        }

        return true;
    }

    std::string replaceInString(std::string_view str, std::string_view from, std::string_view to)
    {
        std::string res{ str };
        if (from.empty())
            return res;

        std::size_t pos{};
        while ((pos = res.find(from, pos)) != std::string::npos)
        {
            res.replace(pos, from.length(), to);
            pos += to.length();
        }

        return res;
    }

    std::string foldToAscii(std::string_view str)
    {
        std::string res;
        res.reserve(str.size());

        std::size_t pos{};
        while (pos < str.size())
        {
            std::uint32_t codePoint{};
            const std::size_t length{ details::decodeUTF8(str, pos, codePoint) };
            if (length == 0)
            {
                // invalid sequence, keep the byte
                res.push_back(str[pos++]);
                continue;
            }

            if (const std::optional<std::string_view> folded{ details::foldCodePoint(codePoint) })
                res += *folded;
            else
                res.append(str.substr(pos, length));

            pos += length;
        }

        return res;
    }

    std::string collapseWhitespaces(std::string_view str)
    {
        std::string res;
        res.reserve(str.size());

        bool pendingSpace{};
        for (const char c : str)
        {
            if (std::isspace(static_cast<unsigned char>(c)))
            {
                pendingSpace = !res.empty();
                continue;
            }

            if (pendingSpace)
                res.push_back(' ');
            pendingSpace = false;
            res.push_back(c);
        }

        return res;
    }

    std::string toISO8601String(const Wt::WDateTime& dateTime)
    {
        if (dateTime.isValid())
        {
            // assume UTC
            return dateTime.toString("yyyy-MM-ddThh:mm:ss.zzz", false).toUTF8() + 'Z';
        }

        return "";
    }

    Wt::WDateTime fromISO8601String(std::string_view dateTime)
    {
        // assume UTC
        if (!dateTime.empty() && dateTime.back() == 'Z')
            dateTime.remove_suffix(1);

        Wt::WDateTime res{ Wt::WDateTime::fromString(Wt::WString{ std::string{ dateTime } }, "yyyy-MM-ddThh:mm:ss.zzz") };
        if (!res.isValid())
            res = Wt::WDateTime::fromString(Wt::WString{ std::string{ dateTime } }, "yyyy-MM-ddThh:mm:ss");

        return res;
    }
} // namespace blm::core::stringUtils
