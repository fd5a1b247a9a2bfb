#pragma once

/// @file shield.h
/// @brief Public facade: analysis and sanitization of untrusted content

#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "detection/composite_scorer.h"
#include "detection/detector_registry.h"
#include "detection/signal.h"
#include "detection/types.h"
#include "sanitize/sanitization_engine.h"
#include "shield/shield_config.h"

namespace ipishield {

using detection::AnalysisReport;
using detection::AnalysisRequest;
using sanitize::SanitizationMode;
using sanitize::SanitizationResult;
using sanitize::SanitizeOptions;

/// @brief Build a request from the string forms used by the CLI and config
/// @return ValidationError for an unknown content type or provenance
absl::StatusOr<AnalysisRequest> MakeRequest(std::string content,
                                            std::string_view content_type = "text",
                                            std::string_view provenance = "direct");

/// @brief Indirect prompt injection detector and sanitizer
///
/// Thread-safe: Analyze and Sanitize may be called concurrently. A Shield is
/// only ever handed out fully constructed; configuration errors surface from
/// Create.
class Shield {
public:
    /// @brief Build the four built-in signals from @p config
    static absl::StatusOr<std::unique_ptr<Shield>> Create(ShieldConfig config);

    /// @brief Build a Shield over caller-supplied signals
    static absl::StatusOr<std::unique_ptr<Shield>> CreateWithSignals(
        ShieldConfig config, std::vector<std::shared_ptr<detection::Signal>> signals);

    ~Shield();

    Shield(const Shield&) = delete;
    Shield& operator=(const Shield&) = delete;

    /// @brief Run every signal and aggregate the verdict
    /// @return InvalidArgument for empty or oversized content
    absl::StatusOr<AnalysisReport> Analyze(const AnalysisRequest& request) const;

    /// @brief Analyse, rewrite according to @p mode and score the output again
    absl::StatusOr<SanitizationResult> Sanitize(const AnalysisRequest& request,
                                                SanitizationMode mode,
                                                const SanitizeOptions& options = {}) const;

    /// @brief Convenience overload for plain text
    absl::StatusOr<SanitizationResult> Sanitize(std::string content,
                                                SanitizationMode mode) const;

    std::set<std::string> AvailableSignals() const;

    std::map<std::string, detection::Availability> Health() const;

    /// @brief Load optional models now
    void Warmup();

    /// @brief Request checks applied before the pipeline runs
    absl::Status ValidateRequest(const AnalysisRequest& request) const;

    const ShieldConfig& GetConfig() const { return config_; }

private:
    Shield(ShieldConfig config, detection::CompositeScorer scorer);

    /// Pipeline without request validation; also used for re-scoring
    absl::StatusOr<AnalysisReport> AnalyzeUnchecked(const AnalysisRequest& request) const;

    ShieldConfig config_;
    detection::CompositeScorer scorer_;
    std::unique_ptr<detection::DetectorRegistry> registry_;
    std::unique_ptr<sanitize::SanitizationEngine> sanitizer_;
};

}  // namespace ipishield
