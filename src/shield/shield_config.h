#pragma once

/// @file shield_config.h
/// @brief Typed configuration of the Shield facade

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/config.h"
#include "common/logging.h"
#include "detection/classifier_signal.h"
#include "detection/composite_scorer.h"
#include "detection/detector_registry.h"
#include "detection/embedding_signal.h"

namespace ipishield {

/// @brief Everything needed to build a Shield
///
/// YAML layout (all keys optional):
/// @code
/// scoring:
///   weights: {pattern: 0.45, classifier: 0.35, embedding: 0.10, anomaly: 0.10}
///   thresholds: {medium: 40, high: 60, critical: 80}
/// signals:
///   timeout_ms: 250
///   pattern: {rules_path: config/rules.yaml}
///   classifier: {enabled: true, model_path: ..., timeout_ms: 250, flag_threshold: 0.7}
///   embedding: {enabled: true, corpus_path: ..., timeout_ms: 250, noise_floor: 0.55}
/// registry: {workers: 0, warmup: false}
/// limits: {max_content_bytes: 262144}
/// logging: {level: info, file: ""}
/// @endcode
struct ShieldConfig {
    detection::CompositeScorerConfig scoring;

    /// Extra pattern rules merged over the built-in table; empty = built-ins only
    std::string pattern_rules_path;

    detection::ClassifierSignalConfig classifier;
    detection::EmbeddingSignalConfig embedding;
    detection::DetectorRegistryConfig registry;

    /// Load optional models during Create instead of on first use
    bool warmup = false;

    size_t max_content_bytes = 256 * 1024;

    LogConfig logging;

    static ShieldConfig Default() { return ShieldConfig{}; }

    /// @brief Map a loaded Config onto the typed structure and validate it
    static absl::StatusOr<ShieldConfig> FromConfig(const Config& config);

    /// @brief Optional YAML file overlaid with IPISHIELD_* environment variables
    static absl::StatusOr<ShieldConfig> Load(const std::optional<std::filesystem::path>& path,
                                             std::string_view env_prefix = "IPISHIELD_");

    /// @return ConfigurationError describing the first invalid setting
    absl::Status Validate() const;
};

}  // namespace ipishield
