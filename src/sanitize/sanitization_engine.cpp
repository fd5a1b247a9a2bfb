#include "sanitize/sanitization_engine.h"

#include <algorithm>
#include <cmath>
#include <regex>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"
#include "detection/text_normalizer.h"

namespace ipishield::sanitize {

namespace {

constexpr std::string_view kCustomSignal = "custom";
constexpr std::string_view kCustomType = "custom";

double RoundTo2(double value) {
    return std::round(value * 100.0) / 100.0;
}

// Ranges of placeholders already present in the content
std::vector<std::pair<size_t, size_t>> PlaceholderRanges(std::string_view content) {
    std::vector<std::pair<size_t, size_t>> ranges;
    size_t pos = content.find(detection::kPlaceholderPrefix);
    while (pos != std::string_view::npos) {
        const size_t len = detection::PlaceholderLengthAt(content, pos);
        if (len > 0) {
            ranges.emplace_back(pos, pos + len);
            pos = content.find(detection::kPlaceholderPrefix, pos + len);
        } else {
            pos = content.find(detection::kPlaceholderPrefix, pos + 1);
        }
    }
    return ranges;
}

std::string RiskSummary(const AnalysisReport& report) {
    return absl::StrFormat("injection risk %.2f (%s), %d flagged segments",
                           report.score.injection_score,
                           detection::RiskCategoryToString(report.score.risk_category),
                           report.segments.size());
}

}  // namespace

// ===== String conversions =====

std::string_view SanitizationModeToString(SanitizationMode mode) {
    switch (mode) {
        case SanitizationMode::kStrict: return "STRICT";
        case SanitizationMode::kBalanced: return "BALANCED";
        case SanitizationMode::kPermissive: return "PERMISSIVE";
    }
    return "unknown";
}

std::string_view SanitizationActionToString(SanitizationAction action) {
    switch (action) {
        case SanitizationAction::kBlocked: return "BLOCKED";
        case SanitizationAction::kScrubbed: return "SCRUBBED";
        case SanitizationAction::kWarned: return "WARNED";
        case SanitizationAction::kPassed: return "PASSED";
    }
    return "unknown";
}

absl::StatusOr<SanitizationMode> ParseSanitizationMode(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(absl::StripAsciiWhitespace(std::string(name)));
    if (lowered == "strict") return SanitizationMode::kStrict;
    if (lowered == "balanced") return SanitizationMode::kBalanced;
    if (lowered == "permissive") return SanitizationMode::kPermissive;
    return ValidationError(absl::StrCat("unknown sanitization mode '", std::string(name), "'"));
}

// ===== Range helpers =====

absl::StatusOr<std::vector<MergedRange>> MergeSegments(
    const std::vector<AttributedSegment>& segments, size_t content_size) {
    std::vector<const AttributedSegment*> ordered;
    ordered.reserve(segments.size());
    for (const auto& attributed : segments) {
        const auto& s = attributed.segment;
        if (!(s.begin < s.end && s.end <= content_size)) {
            return SanitizerFailure(absl::StrCat(
                "segment [", s.begin, ", ", s.end, ") from '", attributed.signal_name,
                "' lies outside content of ", content_size, " bytes"));
        }
        ordered.push_back(&attributed);
    }

    std::stable_sort(ordered.begin(), ordered.end(),
        [](const AttributedSegment* a, const AttributedSegment* b) {
            return a->segment.begin < b->segment.begin;
        });

    std::vector<MergedRange> merged;
    for (const AttributedSegment* attributed : ordered) {
        const auto& s = attributed->segment;
        if (!merged.empty() && s.begin <= merged.back().end) {
            MergedRange& current = merged.back();
            current.end = std::max(current.end, s.end);
            if (s.confidence > current.confidence) {
                current.confidence = s.confidence;
                current.pattern_type = s.pattern_type;
            }
            current.reasons.push_back(s.reason);
            continue;
        }
        merged.push_back(MergedRange{s.begin, s.end, s.pattern_type, s.confidence, {s.reason}});
    }
    return merged;
}

std::string MakePlaceholder(std::string_view pattern_type) {
    std::string type;
    type.reserve(pattern_type.size());
    for (char c : pattern_type) {
        const bool safe = absl::ascii_isalnum(static_cast<unsigned char>(c)) || c == '-' ||
                          c == '_' || c == ':';
        type.push_back(safe ? c : '-');
    }
    if (type.empty()) {
        type = "unknown";
    }
    return absl::StrCat(std::string(detection::kPlaceholderPrefix), type, "]");
}

absl::StatusOr<std::string> ApplyReplacements(std::string_view content,
                                              const std::vector<MergedRange>& ranges,
                                              std::vector<Replacement>* replacements) {
    size_t previous_end = 0;
    for (const auto& range : ranges) {
        if (range.begin >= range.end || range.end > content.size()) {
            return SanitizerFailure(absl::StrCat("range [", range.begin, ", ", range.end,
                                                 ") is out of bounds"));
        }
        if (range.begin < previous_end) {
            return SanitizerFailure("replacement ranges overlap or are unsorted");
        }
        previous_end = range.end;
    }

    std::string output(content);
    std::vector<Replacement> applied(ranges.size());

    // Right to left so earlier offsets stay valid
    for (size_t i = ranges.size(); i-- > 0;) {
        const MergedRange& range = ranges[i];
        Replacement& r = applied[i];
        r.begin = range.begin;
        r.end = range.end;
        r.original = std::string(content.substr(range.begin, range.end - range.begin));
        r.placeholder = MakePlaceholder(range.pattern_type);
        r.reason = absl::StrJoin(range.reasons, "; ");
        output.replace(range.begin, range.end - range.begin, r.placeholder);
    }

    if (replacements != nullptr) {
        *replacements = std::move(applied);
    }
    return output;
}

std::string EscapeLlmTriggers(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (text.compare(i, 3, "```") == 0) {
            out += "` ` `";
            i += 2;
        } else if (text.compare(i, 2, "<|") == 0) {
            out += "< |";
            i += 1;
        } else if (text.compare(i, 2, "|>") == 0) {
            out += "| >";
            i += 1;
        } else if (c == '\r' || c == '\n') {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

// ===== SanitizationEngine =====

SanitizationEngine::SanitizationEngine(AnalyzeFn analyze) : analyze_(std::move(analyze)) {}

absl::StatusOr<std::vector<AttributedSegment>> SanitizationEngine::MatchCustomPatterns(
    const std::string& content, const std::vector<std::string>& patterns) const {
    std::vector<AttributedSegment> segments;
    if (patterns.empty()) {
        return segments;
    }

    const auto placeholders = PlaceholderRanges(content);
    auto overlaps_placeholder = [&](size_t begin, size_t end) {
        return std::any_of(placeholders.begin(), placeholders.end(),
                           [&](const auto& p) { return begin < p.second && p.first < end; });
    };

    for (const auto& pattern : patterns) {
        std::regex regex;
        try {
            regex = std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            return ValidationError(
                absl::StrCat("invalid custom pattern '", pattern, "': ", e.what()));
        }

        try {
            for (auto it = std::sregex_iterator(content.begin(), content.end(), regex);
                 it != std::sregex_iterator(); ++it) {
                if (it->length() == 0) {
                    continue;
                }
                const size_t begin = static_cast<size_t>(it->position());
                const size_t end = begin + static_cast<size_t>(it->length());
                if (overlaps_placeholder(begin, end)) {
                    continue;
                }
                detection::FlaggedSegment segment;
                segment.text = it->str();
                segment.begin = begin;
                segment.end = end;
                segment.pattern_type = std::string(kCustomType);
                segment.confidence = 1.0;
                segment.reason = absl::StrCat("matched custom pattern '", pattern, "'");
                segments.push_back(AttributedSegment{std::string(kCustomSignal), std::move(segment)});
            }
        } catch (const std::regex_error& e) {
            return ValidationError(
                absl::StrCat("custom pattern '", pattern, "' failed to run: ", e.what()));
        }
    }
    return segments;
}

absl::Status SanitizationEngine::Scrub(const AnalysisRequest& request,
                                       const AnalysisReport& report,
                                       const SanitizeOptions& options,
                                       SanitizationResult& result) const {
    IPISHIELD_ASSIGN_OR_RETURN(auto custom,
                               MatchCustomPatterns(request.content, options.custom_patterns));

    try {
        std::vector<AttributedSegment> segments = report.segments;
        segments.insert(segments.end(), std::make_move_iterator(custom.begin()),
                        std::make_move_iterator(custom.end()));

        IPISHIELD_ASSIGN_OR_RETURN(auto merged, MergeSegments(segments, request.content.size()));
        IPISHIELD_ASSIGN_OR_RETURN(
            result.sanitized_content,
            ApplyReplacements(request.content, merged, &result.replacements));
        result.segments_modified = static_cast<int>(merged.size());
    } catch (const std::exception& e) {
        return SanitizerFailure(absl::StrCat("rewriting failed: ", e.what()));
    }
    return absl::OkStatus();
}

absl::StatusOr<SanitizationResult> SanitizationEngine::Sanitize(
    const AnalysisRequest& request, SanitizationMode mode,
    const SanitizeOptions& options) const {
    MetricsRegistry::Instance()
        .GetCounter(LabeledName(metric_names::kSanitizationsTotal, "mode",
                                SanitizationModeToString(mode)))
        .Increment();

    // Reject bad custom patterns before doing any work, in every mode
    IPISHIELD_ASSIGN_OR_RETURN(auto custom_matches,
                               MatchCustomPatterns(request.content, options.custom_patterns));

    IPISHIELD_ASSIGN_OR_RETURN(AnalysisReport first, analyze_(request));

    SanitizationResult result;
    result.mode = mode;
    result.original_risk_score = first.score.injection_score;

    const auto action = first.score.recommended_action;

    if (mode == SanitizationMode::kStrict && action == detection::RecommendedAction::kBlock) {
        result.sanitized_content = std::string(kBlockMarker);
        result.segments_modified = 0;
        result.action_taken = SanitizationAction::kBlocked;
        result.warnings.push_back(absl::StrCat("content blocked: ", RiskSummary(first)));
    } else if (mode == SanitizationMode::kPermissive) {
        result.sanitized_content = request.content;
        result.action_taken = action == detection::RecommendedAction::kPass
            ? SanitizationAction::kPassed
            : SanitizationAction::kWarned;
        result.warnings.push_back("permissive mode: content passed through unmodified");
        if (action != detection::RecommendedAction::kPass) {
            result.warnings.push_back(RiskSummary(first));
        }
        if (!custom_matches.empty()) {
            result.warnings.push_back(
                absl::StrCat(custom_matches.size(), " custom pattern matches left in place"));
        }
    } else {
        auto status = Scrub(request, first, options, result);
        if (!status.ok()) {
            IPISHIELD_COUNTER(metric_names::kSanitizerFailuresTotal).Increment();
            IPISHIELD_LOG_ERROR("Sanitization failed in {} mode: {}",
                                SanitizationModeToString(mode), status.ToString());
            return status;
        }
        result.action_taken = result.segments_modified > 0 ? SanitizationAction::kScrubbed
                                                           : SanitizationAction::kPassed;
        if (action == detection::RecommendedAction::kPassWithWarnings) {
            result.warnings.push_back(RiskSummary(first));
        }
    }

    AnalysisRequest second = request;
    second.content = result.sanitized_content;
    IPISHIELD_ASSIGN_OR_RETURN(AnalysisReport post, analyze_(second));

    // Scrubbing that failed to lower the risk falls back to filtering everything
    if (result.action_taken == SanitizationAction::kScrubbed &&
        post.score.injection_score > first.score.injection_score) {
        const auto top = std::max_element(
            result.replacements.begin(), result.replacements.end(),
            [](const Replacement& a, const Replacement& b) { return a.end - a.begin < b.end - b.begin; });
        const std::string placeholder =
            top != result.replacements.end() ? top->placeholder : MakePlaceholder("unknown");

        IPISHIELD_LOG_WARN("Scrubbed content scored higher ({:.2f} > {:.2f}); filtering it whole",
                           post.score.injection_score, first.score.injection_score);
        result.warnings.push_back("residual risk after scrubbing; content filtered whole");
        result.sanitized_content = placeholder;
        result.segments_modified = 1;
        result.replacements = {Replacement{request.content, placeholder, 0,
                                           request.content.size(), "residual risk"}};

        second.content = result.sanitized_content;
        IPISHIELD_ASSIGN_OR_RETURN(post, analyze_(second));
    }

    result.post_sanitization_risk_score = post.score.injection_score;
    result.risk_reduction =
        RoundTo2(std::max(0.0, result.original_risk_score - result.post_sanitization_risk_score));
    result.original_report = std::move(first);
    result.post_report = std::move(post);

    IPISHIELD_LOG_INFO("Sanitized in {} mode: {} ({} ranges), risk {:.2f} -> {:.2f}",
                       SanitizationModeToString(mode),
                       SanitizationActionToString(result.action_taken), result.segments_modified,
                       result.original_risk_score, result.post_sanitization_risk_score);
    return result;
}

}  // namespace ipishield::sanitize
