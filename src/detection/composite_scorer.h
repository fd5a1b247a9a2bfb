#pragma once

/// @file composite_scorer.h
/// @brief Weighted aggregation of signal scores into a risk verdict

#include <map>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "detection/types.h"

namespace ipishield::detection {

/// @brief Default signal weights
std::map<std::string, double> DefaultSignalWeights();

/// @brief Lower bounds (inclusive) of the risk buckets
struct RiskThresholds {
    double medium = 40.0;
    double high = 60.0;
    double critical = 80.0;

    /// @brief Thresholds must be strictly increasing within (0, 100]
    absl::Status Validate() const;
};

struct CompositeScorerConfig {
    std::map<std::string, double> weights = DefaultSignalWeights();
    RiskThresholds thresholds;
};

/// @brief Stateless scorer; the weights are renormalized over available signals
///
/// Signals without a configured weight are reported in the breakdown but do
/// not move the injection score.
class CompositeScorer {
public:
    /// @brief Validate weights and thresholds
    /// @return ConfigurationError on negative/non-finite weights, an all-zero
    ///         weight set or invalid thresholds
    static absl::StatusOr<CompositeScorer> Create(CompositeScorerConfig config);

    CompositeScore Score(const std::vector<SignalResult>& results) const;

    RiskCategory Categorize(double injection_score) const;

    static RecommendedAction ActionFor(RiskCategory category);

    /// @brief Safety view of an injection score, kept as a separate computation
    static double ComputeSafetyScore(double injection_score);

    /// @brief All segments of the available signals, tagged and unmerged
    static std::vector<AttributedSegment> CollectSegments(const std::vector<SignalResult>& results);

    const CompositeScorerConfig& GetConfig() const { return config_; }

private:
    explicit CompositeScorer(CompositeScorerConfig config);

    CompositeScorerConfig config_;
};

}  // namespace ipishield::detection
