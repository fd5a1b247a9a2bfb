#pragma once

/// @file types.h
/// @brief Request, signal and report value types of the detection pipeline

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

namespace ipishield::detection {

/// @brief Names of the built-in signals
namespace signal_names {
inline constexpr std::string_view kPattern = "pattern";
inline constexpr std::string_view kAnomaly = "anomaly";
inline constexpr std::string_view kClassifier = "classifier";
inline constexpr std::string_view kEmbedding = "embedding";
}  // namespace signal_names

/// @brief Kind of content handed over by the extraction layer
enum class ContentType {
    kText,
    kHtml,
    kImageDerived,
};

/// @brief Where the text came from (context for logs only)
enum class Provenance {
    kDirect,
    kOcr,
    kHtml,
};

/// @brief Per-request tweaks
struct AnalysisOptions {
    /// Signals to leave out for this request; they count as unavailable
    std::set<std::string> skip_signals;
};

/// @brief One unit of content to analyse
struct AnalysisRequest {
    std::string content;
    ContentType content_type = ContentType::kText;
    Provenance provenance = Provenance::kDirect;
    std::optional<AnalysisOptions> options;
};

/// @brief A suspicious span found by one signal
///
/// Offsets are byte offsets into the analysed content, half-open.
struct FlaggedSegment {
    std::string text;
    size_t begin = 0;
    size_t end = 0;
    std::string pattern_type;
    double confidence = 0.0;  ///< 0.0 - 1.0
    std::string reason;
};

/// @brief Uniform output of every signal
struct SignalResult {
    std::string signal_name;
    double score = 0.0;  ///< 0 - 100
    bool available = false;
    std::vector<FlaggedSegment> segments;
    std::chrono::microseconds elapsed{0};

    /// Set when the call failed or timed out; observability only
    std::optional<std::string> error;

    /// @brief Result for a signal that did not take part in the request
    static SignalResult Unavailable(std::string_view name);

    /// @brief Degraded result: counted as available with a zero score
    static SignalResult Degraded(std::string_view name, std::string error);
};

/// @brief A segment tagged with the signal that produced it
struct AttributedSegment {
    std::string signal_name;
    FlaggedSegment segment;
};

enum class RiskCategory {
    kLow,
    kMedium,
    kHigh,
    kCritical,
};

enum class RecommendedAction {
    kPass,
    kPassWithWarnings,
    kBlock,
};

/// @brief Aggregated verdict over the available signals
struct CompositeScore {
    double injection_score = 0.0;  ///< 0 - 100, higher = riskier
    double safety_score = 100.0;   ///< 0 - 100, higher = safer
    RiskCategory risk_category = RiskCategory::kLow;
    RecommendedAction recommended_action = RecommendedAction::kPass;

    /// Score of each signal that contributed
    std::map<std::string, double> signal_breakdown;
};

/// @brief Everything Analyze returns
struct AnalysisReport {
    CompositeScore score;
    std::vector<SignalResult> signals;
    std::vector<AttributedSegment> segments;
    ContentType content_type = ContentType::kText;
    Provenance provenance = Provenance::kDirect;
    size_t content_length = 0;
    std::chrono::microseconds elapsed{0};
};

// ===== String conversions =====

std::string_view ContentTypeToString(ContentType type);
std::string_view ProvenanceToString(Provenance provenance);
std::string_view RiskCategoryToString(RiskCategory category);
std::string_view RecommendedActionToString(RecommendedAction action);

/// @brief Parse "text", "html" or "image" (also "image_derived")
absl::StatusOr<ContentType> ParseContentType(std::string_view name);

/// @brief Parse "direct", "ocr" or "html"
absl::StatusOr<Provenance> ParseProvenance(std::string_view name);

}  // namespace ipishield::detection
