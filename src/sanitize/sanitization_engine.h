#pragma once

/// @file sanitization_engine.h
/// @brief Mode-driven rewriting of flagged content with mandatory re-scoring
///
/// Modes:
/// - STRICT: content whose verdict is BLOCK is replaced by the block marker;
///   anything else is scrubbed as in BALANCED
/// - BALANCED: flagged ranges are merged (interval union) and each merged
///   range is replaced by a [FILTERED:<type>] placeholder
/// - PERMISSIVE: content passes through untouched, with warnings
///
/// The sanitized output is always analysed again so callers can see the
/// residual risk.

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "detection/types.h"

namespace ipishield::sanitize {

using detection::AnalysisReport;
using detection::AnalysisRequest;
using detection::AttributedSegment;

/// @brief Replacement for blocked content
inline constexpr std::string_view kBlockMarker = "[BLOCKED]";

enum class SanitizationMode {
    kStrict,
    kBalanced,
    kPermissive,
};

/// @brief What the engine ended up doing
enum class SanitizationAction {
    kBlocked,
    kScrubbed,
    kWarned,
    kPassed,
};

std::string_view SanitizationModeToString(SanitizationMode mode);
std::string_view SanitizationActionToString(SanitizationAction action);

/// @brief Parse "strict", "balanced" or "permissive"
absl::StatusOr<SanitizationMode> ParseSanitizationMode(std::string_view name);

/// @brief Per-call extras
struct SanitizeOptions {
    /// Additional regexes (case-insensitive) whose matches are scrubbed
    std::vector<std::string> custom_patterns;
};

/// @brief One replaced range
struct Replacement {
    std::string original;
    std::string placeholder;
    size_t begin = 0;
    size_t end = 0;
    std::string reason;
};

/// @brief Outcome of Sanitize
struct SanitizationResult {
    SanitizationMode mode = SanitizationMode::kBalanced;
    std::string sanitized_content;
    int segments_modified = 0;
    double original_risk_score = 0.0;
    double post_sanitization_risk_score = 0.0;
    double risk_reduction = 0.0;
    SanitizationAction action_taken = SanitizationAction::kPassed;
    std::vector<Replacement> replacements;
    std::vector<std::string> warnings;

    /// Verdicts of both passes
    AnalysisReport original_report;
    AnalysisReport post_report;
};

/// @brief A merged flagged range
struct MergedRange {
    size_t begin = 0;
    size_t end = 0;
    std::string pattern_type;  ///< Type of the highest-confidence contributor
    double confidence = 0.0;
    std::vector<std::string> reasons;
};

/// @brief Interval-union merge; touching ranges merge too
/// @return SanitizerFailure if any segment lies outside [0, content_size]
absl::StatusOr<std::vector<MergedRange>> MergeSegments(
    const std::vector<AttributedSegment>& segments, size_t content_size);

/// @brief "[FILTERED:<type>]" with the type reduced to placeholder-safe characters
std::string MakePlaceholder(std::string_view pattern_type);

/// @brief Replace merged ranges right to left
/// @return SanitizerFailure if ranges overlap, are unsorted or out of bounds
absl::StatusOr<std::string> ApplyReplacements(std::string_view content,
                                              const std::vector<MergedRange>& ranges,
                                              std::vector<Replacement>* replacements);

/// @brief Defuse sequences that chat models treat as structure
///
/// Rewrites ``` to ` ` `, <| to < |, |> to | > and line breaks to spaces.
std::string EscapeLlmTriggers(std::string_view text);

/// @brief Runs one analysis pass; supplied by the owner of the pipeline
using AnalyzeFn = std::function<absl::StatusOr<AnalysisReport>(const AnalysisRequest&)>;

/// @brief Sanitization state machine
class SanitizationEngine {
public:
    explicit SanitizationEngine(AnalyzeFn analyze);

    /// @brief Analyse, rewrite according to @p mode, then analyse the output
    /// @return InvalidArgument for a bad custom pattern, Internal if rewriting
    ///         fails; errors from the analysis passes are propagated
    absl::StatusOr<SanitizationResult> Sanitize(const AnalysisRequest& request,
                                                SanitizationMode mode,
                                                const SanitizeOptions& options = {}) const;

private:
    absl::StatusOr<std::vector<AttributedSegment>> MatchCustomPatterns(
        const std::string& content, const std::vector<std::string>& patterns) const;

    absl::Status Scrub(const AnalysisRequest& request, const AnalysisReport& report,
                       const SanitizeOptions& options, SanitizationResult& result) const;

    AnalyzeFn analyze_;
};

}  // namespace ipishield::sanitize
