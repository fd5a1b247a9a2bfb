#include "detection/anomaly_signal.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <optional>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#include "common/logging.h"

namespace ipishield::detection {

namespace {

// Sentence openers that address the reader with an instruction
constexpr std::array<std::string_view, 39> kImperativeOpeners = {
    "ignore", "disregard", "forget", "override", "bypass", "reveal", "print",
    "repeat", "output", "show", "display", "send", "execute", "run", "delete",
    "act", "pretend", "respond", "reply", "answer", "say", "write", "tell",
    "follow", "stop", "obey", "switch", "enable", "disable", "remember",
    "you must", "you will", "you should", "you are now", "always", "never",
    "from now on", "system:", "important:",
};

enum class CharClass { kLower, kUpper, kDigit, kSpace, kPunct, kOther };
constexpr size_t kCharClassCount = 6;

CharClass Classify(char32_t cp) {
    if (cp < 0x80) {
        const auto c = static_cast<unsigned char>(cp);
        if (absl::ascii_islower(c)) return CharClass::kLower;
        if (absl::ascii_isupper(c)) return CharClass::kUpper;
        if (absl::ascii_isdigit(c)) return CharClass::kDigit;
        if (absl::ascii_isspace(c)) return CharClass::kSpace;
        if (absl::ascii_ispunct(c)) return CharClass::kPunct;
    }
    return CharClass::kOther;
}

bool IsUnusual(const Utf8Char& ch) {
    const char32_t cp = ch.codepoint;
    if (!ch.valid) return true;
    if (cp < 0x20) return cp != '\n' && cp != '\r' && cp != '\t';
    if (cp == 0x7F || (cp >= 0x80 && cp <= 0x9F)) return true;
    if (IsInvisibleFormatChar(cp)) return true;
    if (cp >= 0xE000 && cp <= 0xF8FF) return true;    // private use
    if (cp >= 0xF0000) return true;                    // supplementary private use
    return false;
}

bool MixedAlphabet(std::string_view run) {
    bool lower = false;
    bool digit = false;
    int inner_upper = 0;
    for (size_t i = 0; i < run.size(); ++i) {
        const auto c = static_cast<unsigned char>(run[i]);
        lower |= absl::ascii_islower(c) != 0;
        digit |= absl::ascii_isdigit(c) != 0;
        if (i > 0 && absl::ascii_isupper(c)) {
            ++inner_upper;
        }
    }
    const bool letters = lower || inner_upper > 0;
    return (letters && digit) || (inner_upper >= 2 && lower);
}

std::vector<std::pair<size_t, size_t>> MergeRanges(std::vector<std::pair<size_t, size_t>> ranges) {
    std::sort(ranges.begin(), ranges.end());
    std::vector<std::pair<size_t, size_t>> merged;
    for (const auto& range : ranges) {
        if (!merged.empty() && range.first <= merged.back().second) {
            merged.back().second = std::max(merged.back().second, range.second);
        } else {
            merged.push_back(range);
        }
    }
    return merged;
}

struct EscapeForm {
    std::string_view prefix;
    size_t digits;
    size_t min_units;
};

constexpr std::array<EscapeForm, 3> kEscapeForms = {{
    {"%", 2, 3},
    {"\\x", 2, 2},
    {"\\u", 4, 2},
}};

bool HexDigitsAt(std::string_view s, size_t pos, size_t count) {
    if (pos + count > s.size()) {
        return false;
    }
    for (size_t k = 0; k < count; ++k) {
        if (!absl::ascii_isxdigit(static_cast<unsigned char>(s[pos + k]))) {
            return false;
        }
    }
    return true;
}

/// Bytes covered by consecutive escapes of @p form starting at @p pos
size_t EscapeRunLength(std::string_view s, size_t pos, const EscapeForm& form) {
    size_t end = pos;
    while (s.compare(end, form.prefix.size(), form.prefix) == 0 &&
           HexDigitsAt(s, end + form.prefix.size(), form.digits)) {
        end += form.prefix.size() + form.digits;
    }
    return end - pos;
}

/// Length of a 0x literal with at least 8 hex digits at @p pos, or 0
size_t HexLiteralLength(std::string_view s, size_t pos) {
    if (pos + 2 > s.size() || s[pos] != '0' || (s[pos + 1] != 'x' && s[pos + 1] != 'X')) {
        return 0;
    }
    size_t end = pos + 2;
    while (end < s.size() && absl::ascii_isxdigit(static_cast<unsigned char>(s[end]))) {
        ++end;
    }
    return end - pos - 2 >= 8 ? end - pos : 0;
}

bool IsSentenceBreak(char c) {
    return c == '.' || c == '!' || c == '?' || c == '\n' || c == ';' || c == kMaskChar;
}

bool StartsWithOpener(std::string_view sentence) {
    for (std::string_view opener : kImperativeOpeners) {
        if (sentence.size() < opener.size() || sentence.compare(0, opener.size(), opener) != 0) {
            continue;
        }
        if (sentence.size() == opener.size() || opener.back() == ':') {
            return true;
        }
        const auto next = static_cast<unsigned char>(sentence[opener.size()]);
        if (!absl::ascii_isalnum(next)) {
            return true;
        }
    }
    return false;
}

}  // namespace

double ThresholdCurve::Apply(double value) const {
    if (full_at <= zero_at) {
        return value >= full_at ? 100.0 : 0.0;
    }
    if (value <= zero_at) return 0.0;
    if (value >= full_at) return 100.0;
    return 100.0 * (value - zero_at) / (full_at - zero_at);
}

AnomalySignal::AnomalySignal(AnomalySignalConfig config) : config_(std::move(config)) {}

double AnomalySignal::ComputeEntropy(const std::string& content, size_t* analysed_chars) const {
    std::array<size_t, kCharClassCount> counts{};
    size_t total = 0;

    const auto chars = DecodeUtf8(content);
    size_t skip_until = 0;
    for (const auto& ch : chars) {
        if (ch.offset < skip_until) {
            continue;
        }
        // Placeholders left by a previous sanitization are opaque
        if (size_t len = PlaceholderLengthAt(content, ch.offset); len > 0) {
            skip_until = ch.offset + len;
            continue;
        }
        ++counts[static_cast<size_t>(Classify(ch.codepoint))];
        ++total;
    }

    *analysed_chars = total;
    if (total == 0) {
        return 0.0;
    }

    double entropy = 0.0;
    for (size_t count : counts) {
        if (count == 0) continue;
        const double p = static_cast<double>(count) / static_cast<double>(total);
        entropy -= p * std::log2(p);
    }
    return entropy;
}

void AnomalySignal::MeasureUnusual(const std::string& content, AnomalyMeasures& measures) const {
    const auto chars = DecodeUtf8(content);
    if (chars.empty()) {
        return;
    }

    size_t unusual = 0;
    std::optional<std::pair<size_t, size_t>> run;
    for (const auto& ch : chars) {
        if (IsUnusual(ch)) {
            ++unusual;
            if (run && run->second == ch.offset) {
                run->second = ch.offset + ch.length;
            } else {
                if (run) measures.unusual_runs.push_back(*run);
                run = std::make_pair(ch.offset, ch.offset + ch.length);
            }
        }
    }
    if (run) {
        measures.unusual_runs.push_back(*run);
    }

    measures.unusual_ratio = static_cast<double>(unusual) / static_cast<double>(chars.size());
    measures.unusual_score = config_.unusual_curve.Apply(measures.unusual_ratio);
}

void AnomalySignal::MeasureEncoding(const std::string& content, AnomalyMeasures& measures) const {
    std::vector<std::pair<size_t, size_t>> ranges;

    // Escape runs (%41%42%43, \x41\x42, \u0041\u0042, 0xDEADBEEF), scanned by hand
    // so a long run costs no stack
    size_t pos = 0;
    while (pos < content.size()) {
        size_t run = 0;
        for (const auto& form : kEscapeForms) {
            const size_t length = EscapeRunLength(content, pos, form);
            if (length >= form.min_units * (form.prefix.size() + form.digits)) {
                run = length;
                break;
            }
        }
        if (run == 0) {
            run = HexLiteralLength(content, pos);
        }
        if (run > 0) {
            ranges.emplace_back(pos, pos + run);
            pos += run;
        } else {
            ++pos;
        }
    }

    // Base64-like runs: long runs of the base64 alphabet with mixed classes
    auto in_alphabet = [](char c) {
        return absl::ascii_isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
    };
    size_t i = 0;
    while (i < content.size()) {
        if (!in_alphabet(content[i])) {
            ++i;
            continue;
        }
        size_t j = i;
        while (j < content.size() && in_alphabet(content[j])) {
            ++j;
        }
        size_t end = j;
        while (end < content.size() && end - j < 2 && content[end] == '=') {
            ++end;
        }
        if (j - i >= config_.min_encoded_run &&
            MixedAlphabet(std::string_view(content.data() + i, j - i))) {
            ranges.emplace_back(i, end);
        }
        i = end;
    }

    measures.encoded_runs = MergeRanges(std::move(ranges));

    size_t covered = 0;
    for (const auto& [begin, end] : measures.encoded_runs) {
        covered += end - begin;
    }
    measures.encoding_ratio =
        content.empty() ? 0.0 : static_cast<double>(covered) / static_cast<double>(content.size());
    measures.encoding_score = config_.encoding_curve.Apply(measures.encoding_ratio);
}

void AnomalySignal::MeasureImperatives(const NormalizedText& text,
                                       AnomalyMeasures& measures) const {
    const std::string& s = text.text;
    size_t start = 0;
    while (start < s.size()) {
        size_t stop = start;
        while (stop < s.size() && !IsSentenceBreak(s[stop])) {
            ++stop;
        }

        // Trim leading list markers, quotes and spaces
        size_t first = start;
        while (first < stop && (s[first] == ' ' || s[first] == '-' || s[first] == '*' ||
                                s[first] == '"' || s[first] == '\'' || s[first] == '>')) {
            ++first;
        }
        size_t last = stop;
        while (last > first && s[last - 1] == ' ') {
            --last;
        }

        if (last > first && StartsWithOpener(std::string_view(s).substr(first, last - first))) {
            ++measures.imperative_sentences;
            measures.imperative_sentence_ranges.push_back(text.ToOriginal(first, last));
        }

        start = stop + 1;
    }
    measures.imperative_score =
        config_.imperative_curve.Apply(static_cast<double>(measures.imperative_sentences));
}

AnomalyMeasures AnomalySignal::Measure(const SignalInput& input) const {
    AnomalyMeasures measures;

    size_t analysed = 0;
    const double entropy = ComputeEntropy(input.content, &analysed);
    if (analysed >= config_.entropy_min_chars) {
        measures.entropy_bits = entropy;
        measures.entropy_score = config_.entropy_curve.Apply(entropy);
    }

    MeasureUnusual(input.content, measures);
    MeasureEncoding(input.content, measures);
    MeasureImperatives(input.normalized, measures);
    return measures;
}

absl::StatusOr<SignalResult> AnomalySignal::Analyze(const SignalInput& input) const {
    SignalResult result;
    result.signal_name = Name();
    result.available = true;

    const AnomalyMeasures m = Measure(input);

    const double weight_sum = config_.entropy_weight + config_.unusual_weight +
                              config_.encoding_weight + config_.imperative_weight;
    if (weight_sum > 0.0) {
        result.score = (config_.entropy_weight * m.entropy_score +
                        config_.unusual_weight * m.unusual_score +
                        config_.encoding_weight * m.encoding_score +
                        config_.imperative_weight * m.imperative_score) / weight_sum;
    }

    auto add_segment = [&](size_t begin, size_t end, std::string_view submetric,
                           double score, std::string reason) {
        if (begin >= end || end > input.content.size()) {
            return;
        }
        FlaggedSegment segment;
        segment.text = input.content.substr(begin, end - begin);
        segment.begin = begin;
        segment.end = end;
        segment.pattern_type = absl::StrCat("anomaly:", std::string(submetric));
        segment.confidence = score / 100.0;
        segment.reason = std::move(reason);
        result.segments.push_back(std::move(segment));
    };

    if (m.entropy_score > config_.entropy_flag) {
        add_segment(0, input.content.size(), "entropy", m.entropy_score,
                    absl::StrFormat("character class entropy %.2f bits", m.entropy_bits));
    }
    if (m.unusual_score > config_.unusual_flag) {
        for (const auto& [begin, end] : m.unusual_runs) {
            add_segment(begin, end, "unusual-chars", m.unusual_score,
                        absl::StrFormat("unusual character ratio %.3f", m.unusual_ratio));
        }
    }
    if (m.encoding_score > config_.encoding_flag) {
        for (const auto& [begin, end] : m.encoded_runs) {
            add_segment(begin, end, "encoding", m.encoding_score,
                        absl::StrFormat("encoded content ratio %.2f", m.encoding_ratio));
        }
    }
    if (m.imperative_score > config_.imperative_flag) {
        for (const auto& [begin, end] : m.imperative_sentence_ranges) {
            add_segment(begin, end, "imperative", m.imperative_score,
                        absl::StrCat(m.imperative_sentences, " imperative sentences"));
        }
    }

    IPISHIELD_LOG_DEBUG(
        "Anomaly measures: entropy={:.2f} unusual={:.3f} encoding={:.2f} imperative={} score={:.1f}",
        m.entropy_bits, m.unusual_ratio, m.encoding_ratio, m.imperative_sentences, result.score);
    return result;
}

}  // namespace ipishield::detection
