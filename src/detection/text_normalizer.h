#pragma once

/// @file text_normalizer.h
/// @brief Evasion-resistant view of the content with a byte map back to it
///
/// Detection runs over a folded copy of the content:
/// - sanitizer placeholders become a single mask byte
/// - zero-width and bidi control characters are dropped
/// - fullwidth forms and Cyrillic/Greek lookalikes fold to ASCII
/// - whitespace runs collapse to one byte
/// - ASCII is lowercased and leetspeak inside words is undone
///
/// Every normalized byte remembers the original byte range it came from,
/// so matches found on the folded text can be reported against the
/// original content.

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ipishield::detection {

/// @brief Byte standing in for a sanitizer placeholder in normalized text
inline constexpr char kMaskChar = '\x1f';

/// @brief Opening of the placeholder written by the sanitization engine
inline constexpr std::string_view kPlaceholderPrefix = "[FILTERED:";

/// @brief One decoded UTF-8 character
struct Utf8Char {
    char32_t codepoint = 0;
    size_t offset = 0;  ///< Byte offset in the source
    size_t length = 1;  ///< Encoded length in bytes
    bool valid = true;  ///< False for malformed sequences (decoded as U+FFFD)
};

/// @brief Decode UTF-8, never failing; malformed bytes decode one at a time
std::vector<Utf8Char> DecodeUtf8(std::string_view text);

/// @brief Zero-width characters, soft hyphen and bidi controls
bool IsInvisibleFormatChar(char32_t cp);

/// @brief Map fullwidth ASCII and common Latin lookalikes to ASCII
/// @return The ASCII replacement, or 0 if the character has none
char FoldToAscii(char32_t cp);

/// @brief Length of a sanitizer placeholder starting at @p pos, or 0
size_t PlaceholderLengthAt(std::string_view text, size_t pos);

/// @brief Normalized text plus its byte map into the original
struct NormalizedText {
    std::string text;

    /// For each byte of text, the original range [source_begin, source_end)
    std::vector<size_t> source_begin;
    std::vector<size_t> source_end;

    size_t original_length = 0;

    /// @brief Map a normalized half-open range to an original half-open range
    /// @return {0, 0} for an empty or out-of-range input
    std::pair<size_t, size_t> ToOriginal(size_t begin, size_t end) const;

    /// @brief Split [begin, end) at masked placeholders
    ///
    /// Pieces are trimmed of surrounding spaces; pieces without a letter or
    /// digit are dropped.
    std::vector<std::pair<size_t, size_t>> UnmaskedPieces(size_t begin, size_t end) const;
};

/// @brief Build the normalized view of @p content
NormalizedText Normalize(std::string_view content);

/// @brief Split normalized text into word tokens ([a-z0-9'] runs)
///
/// Tokens are grouped into runs separated by masked placeholders, so
/// callers building n-grams never join words across a placeholder.
std::vector<std::vector<std::string>> TokenRuns(std::string_view normalized);

}  // namespace ipishield::detection
