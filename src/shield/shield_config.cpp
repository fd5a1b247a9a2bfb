#include "shield/shield_config.h"

#include <cmath>

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace ipishield {

namespace {

constexpr int64_t kDefaultTimeoutMs = 250;

absl::StatusOr<std::chrono::milliseconds> ReadTimeout(const Config& config,
                                                      std::string_view key,
                                                      int64_t fallback_ms) {
    IPISHIELD_ASSIGN_OR_RETURN(int64_t ms, config.ReadInt(key, fallback_ms));
    if (ms < 0) {
        return ConfigurationError(absl::StrCat(std::string(key), " must be >= 0, got ", ms));
    }
    return std::chrono::milliseconds(ms);
}

}  // namespace

absl::StatusOr<ShieldConfig> ShieldConfig::FromConfig(const Config& config) {
    ShieldConfig result;

    // ===== Scoring =====
    IPISHIELD_ASSIGN_OR_RETURN(auto weights, config.ReadDoubleMap("scoring.weights"));
    for (const auto& [name, weight] : weights) {
        result.scoring.weights[name] = weight;
    }
    auto& thresholds = result.scoring.thresholds;
    IPISHIELD_ASSIGN_OR_RETURN(thresholds.medium,
                               config.ReadDouble("scoring.thresholds.medium", thresholds.medium));
    IPISHIELD_ASSIGN_OR_RETURN(thresholds.high,
                               config.ReadDouble("scoring.thresholds.high", thresholds.high));
    IPISHIELD_ASSIGN_OR_RETURN(
        thresholds.critical, config.ReadDouble("scoring.thresholds.critical", thresholds.critical));

    // ===== Signals =====
    IPISHIELD_ASSIGN_OR_RETURN(int64_t shared_timeout,
                               config.ReadInt("signals.timeout_ms", kDefaultTimeoutMs));

    result.pattern_rules_path = config.GetString("signals.pattern.rules_path", "");

    auto& classifier = result.classifier;
    IPISHIELD_ASSIGN_OR_RETURN(classifier.enabled,
                               config.ReadBool("signals.classifier.enabled", classifier.enabled));
    classifier.model_path = config.GetString("signals.classifier.model_path", classifier.model_path);
    IPISHIELD_ASSIGN_OR_RETURN(classifier.timeout,
                               ReadTimeout(config, "signals.classifier.timeout_ms", shared_timeout));
    IPISHIELD_ASSIGN_OR_RETURN(
        classifier.flag_threshold,
        config.ReadDouble("signals.classifier.flag_threshold", classifier.flag_threshold));

    auto& embedding = result.embedding;
    IPISHIELD_ASSIGN_OR_RETURN(embedding.enabled,
                               config.ReadBool("signals.embedding.enabled", embedding.enabled));
    embedding.corpus_path = config.GetString("signals.embedding.corpus_path", embedding.corpus_path);
    IPISHIELD_ASSIGN_OR_RETURN(embedding.timeout,
                               ReadTimeout(config, "signals.embedding.timeout_ms", shared_timeout));
    IPISHIELD_ASSIGN_OR_RETURN(
        embedding.noise_floor,
        config.ReadDouble("signals.embedding.noise_floor", embedding.noise_floor));
    IPISHIELD_ASSIGN_OR_RETURN(
        int64_t dimension,
        config.ReadInt("signals.embedding.dimension", static_cast<int64_t>(embedding.dimension)));
    if (dimension <= 0) {
        return ConfigurationError(absl::StrCat("signals.embedding.dimension must be > 0, got ",
                                               dimension));
    }
    embedding.dimension = static_cast<size_t>(dimension);

    // ===== Registry =====
    IPISHIELD_ASSIGN_OR_RETURN(int64_t workers, config.ReadInt("registry.workers", 0));
    if (workers < 0) {
        return ConfigurationError(absl::StrCat("registry.workers must be >= 0, got ", workers));
    }
    result.registry.workers = static_cast<size_t>(workers);
    IPISHIELD_ASSIGN_OR_RETURN(result.warmup, config.ReadBool("registry.warmup", result.warmup));

    // ===== Limits =====
    IPISHIELD_ASSIGN_OR_RETURN(
        int64_t max_bytes,
        config.ReadInt("limits.max_content_bytes", static_cast<int64_t>(result.max_content_bytes)));
    if (max_bytes <= 0) {
        return ConfigurationError(
            absl::StrCat("limits.max_content_bytes must be > 0, got ", max_bytes));
    }
    result.max_content_bytes = static_cast<size_t>(max_bytes);

    // ===== Logging =====
    const std::string level = config.GetString("logging.level", "info");
    auto parsed_level = ParseLogLevel(level);
    if (!parsed_level.ok()) {
        return ConfigurationError(absl::StrCat("logging.level: ", parsed_level.status().message()));
    }
    result.logging.level = *parsed_level;
    const std::string log_file = config.GetString("logging.file", "");
    if (!log_file.empty()) {
        result.logging.enable_file = true;
        result.logging.file_path = log_file;
    }

    IPISHIELD_RETURN_IF_ERROR(result.Validate());
    return result;
}

absl::StatusOr<ShieldConfig> ShieldConfig::Load(const std::optional<std::filesystem::path>& path,
                                                std::string_view env_prefix) {
    IPISHIELD_ASSIGN_OR_RETURN(Config config, Config::LoadLayered(path, env_prefix));
    return FromConfig(config);
}

absl::Status ShieldConfig::Validate() const {
    double weight_sum = 0.0;
    for (const auto& [name, weight] : scoring.weights) {
        if (!std::isfinite(weight) || weight < 0.0) {
            return ConfigurationError(
                absl::StrCat("scoring.weights.", name, " must be a finite value >= 0"));
        }
        weight_sum += weight;
    }
    if (weight_sum <= 0.0) {
        return ConfigurationError("scoring.weights must contain a positive weight");
    }
    IPISHIELD_RETURN_IF_ERROR(scoring.thresholds.Validate());

    if (classifier.flag_threshold < 0.0 || classifier.flag_threshold > 1.0) {
        return ConfigurationError(absl::StrCat(
            "signals.classifier.flag_threshold must be within [0, 1], got ",
            classifier.flag_threshold));
    }
    if (embedding.noise_floor < 0.0 || embedding.noise_floor >= 1.0) {
        return ConfigurationError(absl::StrCat(
            "signals.embedding.noise_floor must be within [0, 1), got ", embedding.noise_floor));
    }
    if (classifier.timeout.count() < 0 || embedding.timeout.count() < 0) {
        return ConfigurationError("signal timeouts must be >= 0");
    }
    if (max_content_bytes == 0) {
        return ConfigurationError("limits.max_content_bytes must be > 0");
    }
    return absl::OkStatus();
}

}  // namespace ipishield
