/// @file shield_config_test.cpp
/// @brief Tests for mapping and validating Shield configuration

#include <cstdlib>

#include <gtest/gtest.h>

#include "shield/shield_config.h"

namespace ipishield {
namespace {

absl::StatusOr<ShieldConfig> FromYaml(const std::string& yaml) {
    auto config = Config::LoadFromString(yaml);
    if (!config.ok()) {
        return config.status();
    }
    return ShieldConfig::FromConfig(*config);
}

TEST(ShieldConfigTest, DefaultsAreValid) {
    ShieldConfig config = ShieldConfig::Default();
    EXPECT_TRUE(config.Validate().ok());
    EXPECT_DOUBLE_EQ(config.scoring.weights.at("pattern"), 0.45);
    EXPECT_DOUBLE_EQ(config.scoring.thresholds.critical, 80.0);
    EXPECT_EQ(config.max_content_bytes, 256u * 1024u);
    EXPECT_TRUE(config.classifier.enabled);
    EXPECT_EQ(config.embedding.noise_floor, 0.55);
}

TEST(ShieldConfigTest, EmptyDocumentYieldsDefaults) {
    auto config = FromYaml("{}");
    ASSERT_TRUE(config.ok()) << config.status().message();
    EXPECT_EQ(config->classifier.timeout, std::chrono::milliseconds(250));
    EXPECT_EQ(config->registry.workers, 0u);
    EXPECT_EQ(config->logging.level, LogLevel::kInfo);
    EXPECT_FALSE(config->logging.enable_file);
}

TEST(ShieldConfigTest, MapsEverySection) {
    auto config = FromYaml(R"(
scoring:
  weights:
    pattern: 0.6
  thresholds:
    medium: 30
    high: 50
    critical: 70
signals:
  timeout_ms: 400
  pattern:
    rules_path: config/extra_rules.yaml
  classifier:
    model_path: /opt/models/classifier.yaml
    timeout_ms: 120
    flag_threshold: 0.8
  embedding:
    enabled: false
    corpus_path: /opt/models/corpus.yaml
    noise_floor: 0.6
    dimension: 256
registry:
  workers: 3
  warmup: true
limits:
  max_content_bytes: 1024
logging:
  level: debug
  file: /var/log/ipishield.log
)");
    ASSERT_TRUE(config.ok()) << config.status().message();

    // Partial weight maps override only the named signals
    EXPECT_DOUBLE_EQ(config->scoring.weights.at("pattern"), 0.6);
    EXPECT_DOUBLE_EQ(config->scoring.weights.at("classifier"), 0.35);
    EXPECT_DOUBLE_EQ(config->scoring.thresholds.medium, 30.0);
    EXPECT_DOUBLE_EQ(config->scoring.thresholds.critical, 70.0);

    EXPECT_EQ(config->pattern_rules_path, "config/extra_rules.yaml");
    EXPECT_EQ(config->classifier.model_path, "/opt/models/classifier.yaml");
    EXPECT_EQ(config->classifier.timeout, std::chrono::milliseconds(120));
    EXPECT_DOUBLE_EQ(config->classifier.flag_threshold, 0.8);

    EXPECT_FALSE(config->embedding.enabled);
    EXPECT_EQ(config->embedding.corpus_path, "/opt/models/corpus.yaml");
    EXPECT_EQ(config->embedding.timeout, std::chrono::milliseconds(400));
    EXPECT_DOUBLE_EQ(config->embedding.noise_floor, 0.6);
    EXPECT_EQ(config->embedding.dimension, 256u);

    EXPECT_EQ(config->registry.workers, 3u);
    EXPECT_TRUE(config->warmup);
    EXPECT_EQ(config->max_content_bytes, 1024u);
    EXPECT_EQ(config->logging.level, LogLevel::kDebug);
    EXPECT_TRUE(config->logging.enable_file);
    EXPECT_EQ(config->logging.file_path, "/var/log/ipishield.log");
}

TEST(ShieldConfigTest, InvalidSettingsAreConfigurationErrors) {
    const std::vector<std::string> invalid = {
        "scoring: {weights: {pattern: -0.5}}",
        "scoring: {weights: {pattern: 0, classifier: 0, embedding: 0, anomaly: 0}}",
        "scoring: {thresholds: {medium: 70, high: 60}}",
        "scoring: {thresholds: {critical: 150}}",
        "signals: {classifier: {flag_threshold: 1.5}}",
        "signals: {embedding: {noise_floor: 1.0}}",
        "signals: {embedding: {timeout_ms: -5}}",
        "signals: {embedding: {dimension: 0}}",
        "registry: {workers: -1}",
        "limits: {max_content_bytes: 0}",
        "logging: {level: loud}",
    };
    for (const auto& yaml : invalid) {
        auto config = FromYaml(yaml);
        ASSERT_FALSE(config.ok()) << yaml;
        EXPECT_EQ(config.status().code(), absl::StatusCode::kFailedPrecondition) << yaml;
    }
}

TEST(ShieldConfigTest, MalformedValuesAreRejected) {
    const std::vector<std::string> malformed = {
        "signals: {classifier: {enabled: perhaps}}",
        "signals: {timeout_ms: soon}",
        "scoring: {weights: {pattern: heavy}}",
        "limits: {max_content_bytes: lots}",
    };
    for (const auto& yaml : malformed) {
        auto config = FromYaml(yaml);
        ASSERT_FALSE(config.ok()) << yaml;
        EXPECT_EQ(config.status().code(), absl::StatusCode::kInvalidArgument) << yaml;
    }
}

TEST(ShieldConfigTest, LoadsShippedConfigWithEnvironmentOverrides) {
    ::setenv("IPISHIELDCFG_WORKERS", "5", 1);
    ::setenv("IPISHIELDCFG_LOG_LEVEL", "error", 1);
    ::setenv("IPISHIELDCFG_EMBEDDING_ENABLED", "false", 1);

    auto config = ShieldConfig::Load(
        std::filesystem::path(IPISHIELD_SOURCE_DIR) / "config" / "ipishield.yaml", "IPISHIELDCFG_");

    ::unsetenv("IPISHIELDCFG_WORKERS");
    ::unsetenv("IPISHIELDCFG_LOG_LEVEL");
    ::unsetenv("IPISHIELDCFG_EMBEDDING_ENABLED");

    ASSERT_TRUE(config.ok()) << config.status().message();
    EXPECT_EQ(config->registry.workers, 5u);
    EXPECT_EQ(config->logging.level, LogLevel::kError);
    EXPECT_FALSE(config->embedding.enabled);
    EXPECT_TRUE(config->classifier.enabled);
    EXPECT_EQ(config->classifier.model_path, "models/injection_classifier.yaml");
    EXPECT_EQ(config->max_content_bytes, 262144u);
}

TEST(ShieldConfigTest, MissingFileFailsToLoad) {
    auto config = ShieldConfig::Load(std::filesystem::path("/nonexistent/ipishield.yaml"),
                                     "IPISHIELDCFG_");
    EXPECT_FALSE(config.ok());
}

}  // namespace
}  // namespace ipishield
