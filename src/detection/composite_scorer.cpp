#include "detection/composite_scorer.h"

#include <algorithm>
#include <cmath>

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace ipishield::detection {

namespace {

double RoundTo2(double value) {
    return std::round(value * 100.0) / 100.0;
}

}  // namespace

std::map<std::string, double> DefaultSignalWeights() {
    return {
        {std::string(signal_names::kPattern), 0.45},
        {std::string(signal_names::kClassifier), 0.35},
        {std::string(signal_names::kEmbedding), 0.10},
        {std::string(signal_names::kAnomaly), 0.10},
    };
}

absl::Status RiskThresholds::Validate() const {
    for (double t : {medium, high, critical}) {
        if (!std::isfinite(t) || t <= 0.0 || t > 100.0) {
            return ConfigurationError(absl::StrCat("risk threshold ", t, " is outside (0, 100]"));
        }
    }
    if (!(medium < high && high < critical)) {
        return ConfigurationError(absl::StrCat(
            "risk thresholds must increase: medium=", medium, " high=", high,
            " critical=", critical));
    }
    return absl::OkStatus();
}

absl::StatusOr<CompositeScorer> CompositeScorer::Create(CompositeScorerConfig config) {
    double total = 0.0;
    for (const auto& [name, weight] : config.weights) {
        if (!std::isfinite(weight) || weight < 0.0) {
            return ConfigurationError(absl::StrCat("weight for '", name, "' must be >= 0"));
        }
        total += weight;
    }
    if (total <= 0.0) {
        return ConfigurationError("at least one signal weight must be positive");
    }
    IPISHIELD_RETURN_IF_ERROR(config.thresholds.Validate());
    return CompositeScorer(std::move(config));
}

CompositeScorer::CompositeScorer(CompositeScorerConfig config) : config_(std::move(config)) {}

CompositeScore CompositeScorer::Score(const std::vector<SignalResult>& results) const {
    CompositeScore score;

    double weighted = 0.0;
    double weight_sum = 0.0;
    for (const auto& result : results) {
        if (!result.available) {
            continue;
        }
        score.signal_breakdown[result.signal_name] = RoundTo2(result.score);

        auto it = config_.weights.find(result.signal_name);
        if (it == config_.weights.end() || it->second <= 0.0) {
            continue;
        }
        weighted += it->second * std::clamp(result.score, 0.0, 100.0);
        weight_sum += it->second;
    }

    score.injection_score = weight_sum > 0.0 ? RoundTo2(weighted / weight_sum) : 0.0;
    score.safety_score = ComputeSafetyScore(score.injection_score);
    score.risk_category = Categorize(score.injection_score);
    score.recommended_action = ActionFor(score.risk_category);
    return score;
}

RiskCategory CompositeScorer::Categorize(double injection_score) const {
    const auto& t = config_.thresholds;
    if (injection_score >= t.critical) return RiskCategory::kCritical;
    if (injection_score >= t.high) return RiskCategory::kHigh;
    if (injection_score >= t.medium) return RiskCategory::kMedium;
    return RiskCategory::kLow;
}

RecommendedAction CompositeScorer::ActionFor(RiskCategory category) {
    switch (category) {
        case RiskCategory::kCritical:
        case RiskCategory::kHigh:
            return RecommendedAction::kBlock;
        case RiskCategory::kMedium:
            return RecommendedAction::kPassWithWarnings;
        case RiskCategory::kLow:
            return RecommendedAction::kPass;
    }
    return RecommendedAction::kPass;
}

double CompositeScorer::ComputeSafetyScore(double injection_score) {
    return RoundTo2(std::clamp(100.0 - injection_score, 0.0, 100.0));
}

std::vector<AttributedSegment> CompositeScorer::CollectSegments(
    const std::vector<SignalResult>& results) {
    std::vector<AttributedSegment> segments;
    for (const auto& result : results) {
        if (!result.available) {
            continue;
        }
        for (const auto& segment : result.segments) {
            segments.push_back(AttributedSegment{result.signal_name, segment});
        }
    }
    return segments;
}

}  // namespace ipishield::detection
