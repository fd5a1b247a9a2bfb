#include "detection/text_normalizer.h"

#include <algorithm>
#include <unordered_map>

#include <absl/strings/ascii.h>

namespace ipishield::detection {

namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

// One normalized byte and the original range it stands for
struct Unit {
    char byte;
    size_t begin;
    size_t end;
};

const std::unordered_map<char32_t, char>& LookalikeTable() {
    static const std::unordered_map<char32_t, char> table = {
        // Cyrillic lowercase
        {0x0430, 'a'}, {0x0435, 'e'}, {0x043E, 'o'}, {0x0440, 'p'},
        {0x0441, 'c'}, {0x0443, 'y'}, {0x0445, 'x'}, {0x0456, 'i'},
        {0x0458, 'j'}, {0x0455, 's'}, {0x0501, 'd'}, {0x04BB, 'h'},
        // Cyrillic uppercase
        {0x0410, 'A'}, {0x0412, 'B'}, {0x0415, 'E'}, {0x041A, 'K'},
        {0x041C, 'M'}, {0x041D, 'H'}, {0x041E, 'O'}, {0x0420, 'P'},
        {0x0421, 'C'}, {0x0422, 'T'}, {0x0425, 'X'}, {0x0406, 'I'},
        {0x0405, 'S'}, {0x0408, 'J'},
        // Greek lowercase
        {0x03B1, 'a'}, {0x03B5, 'e'}, {0x03B9, 'i'}, {0x03BF, 'o'},
        {0x03C1, 'p'}, {0x03C5, 'u'}, {0x03BD, 'v'}, {0x03BA, 'k'},
        {0x03C4, 't'},
        // Greek uppercase
        {0x0391, 'A'}, {0x0392, 'B'}, {0x0395, 'E'}, {0x0396, 'Z'},
        {0x0397, 'H'}, {0x0399, 'I'}, {0x039A, 'K'}, {0x039C, 'M'},
        {0x039D, 'N'}, {0x039F, 'O'}, {0x03A1, 'P'}, {0x03A4, 'T'},
        {0x03A5, 'Y'}, {0x03A7, 'X'},
    };
    return table;
}

bool IsLineBreak(char32_t cp) {
    return cp == '\n' || cp == '\r' || cp == '\v' || cp == '\f' ||
           cp == 0x2028 || cp == 0x2029;
}

bool IsSpace(char32_t cp) {
    if (cp < 0x80) {
        return absl::ascii_isspace(static_cast<unsigned char>(cp));
    }
    return cp == 0x00A0 || cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) ||
           cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F ||
           cp == 0x3000;
}

char UndoLeet(char c) {
    switch (c) {
        case '0': return 'o';
        case '1': return 'i';
        case '3': return 'e';
        case '4': return 'a';
        case '5': return 's';
        case '7': return 't';
        case '@': return 'a';
        case '$': return 's';
        default: return c;
    }
}

bool IsTokenChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '@' || c == '$';
}

}  // namespace

std::vector<Utf8Char> DecodeUtf8(std::string_view text) {
    std::vector<Utf8Char> result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        Utf8Char ch;
        ch.offset = i;

        if (lead < 0x80) {
            ch.codepoint = lead;
            result.push_back(ch);
            ++i;
            continue;
        }

        size_t extra = 0;
        char32_t value = 0;
        if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            value = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            value = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            value = lead & 0x07;
        }

        bool ok = extra > 0 && i + extra < text.size();
        if (ok) {
            for (size_t k = 1; k <= extra; ++k) {
                const auto cont = static_cast<unsigned char>(text[i + k]);
                if ((cont & 0xC0) != 0x80) {
                    ok = false;
                    break;
                }
                value = (value << 6) | (cont & 0x3F);
            }
        }

        if (!ok) {
            ch.codepoint = kReplacementChar;
            ch.valid = false;
            result.push_back(ch);
            ++i;
            continue;
        }

        ch.codepoint = value;
        ch.length = extra + 1;
        result.push_back(ch);
        i += extra + 1;
    }

    return result;
}

bool IsInvisibleFormatChar(char32_t cp) {
    return (cp >= 0x200B && cp <= 0x200D) || cp == 0x2060 || cp == 0xFEFF ||
           cp == 0x00AD || cp == 0x180E || (cp >= 0x202A && cp <= 0x202E) ||
           (cp >= 0x2066 && cp <= 0x2069);
}

char FoldToAscii(char32_t cp) {
    if (cp >= 0xFF01 && cp <= 0xFF5E) {
        return static_cast<char>(cp - 0xFEE0);
    }
    const auto& table = LookalikeTable();
    auto it = table.find(cp);
    return it == table.end() ? '\0' : it->second;
}

size_t PlaceholderLengthAt(std::string_view text, size_t pos) {
    if (text.compare(pos, kPlaceholderPrefix.size(), kPlaceholderPrefix) != 0) {
        return 0;
    }
    size_t i = pos + kPlaceholderPrefix.size();
    const size_t type_begin = i;
    while (i < text.size()) {
        const char c = text[i];
        if (absl::ascii_isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
            c == ':') {
            ++i;
            continue;
        }
        break;
    }
    if (i == type_begin || i >= text.size() || text[i] != ']') {
        return 0;
    }
    return i + 1 - pos;
}

std::pair<size_t, size_t> NormalizedText::ToOriginal(size_t begin, size_t end) const {
    if (begin >= end || end > text.size()) {
        return {0, 0};
    }
    return {source_begin[begin], source_end[end - 1]};
}

std::vector<std::pair<size_t, size_t>> NormalizedText::UnmaskedPieces(size_t begin,
                                                                      size_t end) const {
    std::vector<std::pair<size_t, size_t>> pieces;
    end = std::min(end, text.size());

    size_t piece = begin;
    for (size_t i = begin; i <= end; ++i) {
        if (i < end && text[i] != kMaskChar) {
            continue;
        }
        size_t first = piece;
        size_t last = i;
        while (first < last && (text[first] == ' ' || text[first] == '\n')) ++first;
        while (last > first && (text[last - 1] == ' ' || text[last - 1] == '\n')) --last;

        const bool has_word = std::any_of(text.begin() + first, text.begin() + last,
            [](char c) { return absl::ascii_isalnum(static_cast<unsigned char>(c)); });
        if (has_word) {
            pieces.emplace_back(first, last);
        }
        piece = i + 1;
    }
    return pieces;
}

NormalizedText Normalize(std::string_view content) {
    // Pass 1: placeholders, invisible characters, folding, whitespace runs
    std::vector<Unit> units;
    units.reserve(content.size());

    bool in_space = false;
    const auto chars = DecodeUtf8(content);
    size_t ci = 0;

    while (ci < chars.size()) {
        const Utf8Char& ch = chars[ci];
        const size_t pos = ch.offset;

        if (size_t placeholder = PlaceholderLengthAt(content, pos); placeholder > 0) {
            units.push_back({kMaskChar, pos, pos + placeholder});
            in_space = false;
            const size_t stop = pos + placeholder;
            while (ci < chars.size() && chars[ci].offset < stop) {
                ++ci;
            }
            continue;
        }
        ++ci;

        const char32_t cp = ch.codepoint;
        if (IsInvisibleFormatChar(cp)) {
            continue;
        }

        if (IsSpace(cp)) {
            const char byte = IsLineBreak(cp) ? '\n' : ' ';
            if (in_space) {
                Unit& last = units.back();
                last.end = ch.offset + ch.length;
                if (byte == '\n') {
                    last.byte = '\n';
                }
            } else {
                units.push_back({byte, ch.offset, ch.offset + ch.length});
                in_space = true;
            }
            continue;
        }
        in_space = false;

        if (cp < 0x80) {
            units.push_back({static_cast<char>(cp), ch.offset, ch.offset + ch.length});
            continue;
        }

        if (char folded = FoldToAscii(cp); folded != '\0') {
            units.push_back({folded, ch.offset, ch.offset + ch.length});
            continue;
        }

        // Keep other characters verbatim; each byte maps to the whole character
        for (size_t k = 0; k < ch.length; ++k) {
            units.push_back({content[ch.offset + k], ch.offset, ch.offset + ch.length});
        }
    }

    // Pass 2: lowercase
    for (auto& unit : units) {
        unit.byte = absl::ascii_tolower(static_cast<unsigned char>(unit.byte));
    }

    // Pass 3: leetspeak, only inside tokens that carry at least one letter
    size_t i = 0;
    while (i < units.size()) {
        if (!IsTokenChar(units[i].byte)) {
            ++i;
            continue;
        }
        size_t j = i;
        bool has_letter = false;
        while (j < units.size() && IsTokenChar(units[j].byte)) {
            if (units[j].byte >= 'a' && units[j].byte <= 'z') {
                has_letter = true;
            }
            ++j;
        }
        if (has_letter) {
            for (size_t k = i; k < j; ++k) {
                units[k].byte = UndoLeet(units[k].byte);
            }
        }
        i = j;
    }

    NormalizedText result;
    result.original_length = content.size();
    result.text.reserve(units.size());
    result.source_begin.reserve(units.size());
    result.source_end.reserve(units.size());
    for (const auto& unit : units) {
        result.text.push_back(unit.byte);
        result.source_begin.push_back(unit.begin);
        result.source_end.push_back(unit.end);
    }
    return result;
}

std::vector<std::vector<std::string>> TokenRuns(std::string_view normalized) {
    std::vector<std::vector<std::string>> runs(1);
    std::string token;

    auto flush = [&] {
        if (!token.empty()) {
            runs.back().push_back(std::move(token));
            token.clear();
        }
    };

    for (char c : normalized) {
        if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '\'') {
            token.push_back(c);
            continue;
        }
        flush();
        if (c == kMaskChar && !runs.back().empty()) {
            runs.emplace_back();
        }
    }
    flush();

    if (runs.back().empty()) {
        runs.pop_back();
    }
    return runs;
}

}  // namespace ipishield::detection
