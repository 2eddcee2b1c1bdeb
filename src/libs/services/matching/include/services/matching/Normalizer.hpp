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

#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

// Text normalization shared by the matcher and the identity resolver.
// All functions are pure and accept any input, including empty or malformed UTF-8.
namespace blm::matching::normalizer
{
    // Lower case ASCII folded text without decorations: bracketed qualifiers, version dash suffixes,
    // "feat." credits and ellipses are removed, '&' and '+' are spelled out, punctuation is dropped
    // and whitespaces are collapsed. clean(clean(x)) == clean(x)
    std::string clean(std::string_view text);

    // clean() without a leading article, only used to score artist similarity
    std::string cleanArtist(std::string_view text);

    // clean(artist) + "::" + clean(title), or an empty string if one of the parts cleans to nothing
    std::string generateSignature(std::string_view artist, std::string_view title);

    inline constexpr std::string_view signatureSeparator{ "::" };

    // Cleaned individual names of a collaboration credit, first seen order, no duplicates.
    // Occurrences of unsplittableNames ("AC/DC") are kept whole.
    std::vector<std::string> splitArtists(std::string_view rawArtist, std::span<const std::string> unsplittableNames = {});

    // Replaces the case insensitive, whole word occurrences of names by placeholders no separator matches.
    // The replaced texts are appended to protectedTexts, restoreNames() puts them back.
    std::string protectNames(std::string_view text, std::span<const std::string> names, std::vector<std::string>& protectedTexts);
    std::string restoreNames(std::string_view text, std::span<const std::string> protectedTexts);

    // "Live", "Remix", "Radio Edit"... or "Original" if the title has no version qualifier
    std::string extractVersionType(std::string_view title);

    // Capitalizes each word. Short all caps words ("AC", "REM") are kept, longer ones are lowered.
    std::string toArtistTitleCase(std::string_view name);
} // namespace blm::matching::normalizer
