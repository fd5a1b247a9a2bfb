#pragma once

/// @file classifier_signal.h
/// @brief Optional intent classifier signal

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include <absl/status/statusor.h>
#include <yaml-cpp/yaml.h>

#include "detection/lazy_capability.h"
#include "detection/signal.h"

namespace ipishield::detection {

/// @brief Model estimating the probability that text carries injected instructions
class ClassifierModel {
public:
    virtual ~ClassifierModel() = default;

    /// @brief Probability in [0, 1] for already normalized text
    virtual absl::StatusOr<double> PredictProbability(std::string_view normalized_text) const = 0;

    virtual std::string Name() const = 0;
};

/// @brief Bag-of-n-grams logistic regression
///
/// Features are the distinct word unigrams and bigrams of the normalized
/// text; each present feature adds its weight once. The artifact is YAML:
/// @code
///   bias: -6.0
///   max_tokens: 4096
///   weights:
///     ignore: 2.5
///     "previous instructions": 4.0
/// @endcode
class LogisticTextClassifier : public ClassifierModel {
public:
    LogisticTextClassifier(double bias, std::unordered_map<std::string, double> weights,
                           size_t max_tokens = 4096);

    /// @brief Load an artifact from disk
    static absl::StatusOr<std::unique_ptr<LogisticTextClassifier>> Load(
        const std::filesystem::path& path);

    /// @brief Build from a parsed artifact
    static absl::StatusOr<std::unique_ptr<LogisticTextClassifier>> FromYaml(const YAML::Node& root);

    absl::StatusOr<double> PredictProbability(std::string_view normalized_text) const override;
    std::string Name() const override { return "logistic-ngram"; }

    size_t FeatureCount() const { return weights_.size(); }

private:
    double bias_;
    std::unordered_map<std::string, double> weights_;
    size_t max_tokens_;
};

/// @brief Configuration for the classifier signal
struct ClassifierSignalConfig {
    bool enabled = true;
    std::string model_path = "models/injection_classifier.yaml";
    std::chrono::milliseconds timeout{250};
    double flag_threshold = 0.7;  ///< Probability above which a segment is emitted
};

using ClassifierLoader = std::function<absl::StatusOr<std::shared_ptr<const ClassifierModel>>()>;

/// @brief Classifier signal backed by a lazily loaded model
class ClassifierSignal : public Signal {
public:
    ClassifierSignal(ClassifierSignalConfig config, ClassifierLoader loader);

    /// @brief Signal loading a LogisticTextClassifier from config.model_path
    static std::unique_ptr<ClassifierSignal> Create(ClassifierSignalConfig config);

    std::string Name() const override { return std::string(signal_names::kClassifier); }
    absl::StatusOr<SignalResult> Analyze(const SignalInput& input) const override;

    Availability GetAvailability() const override { return model_.State(); }
    bool IsOptional() const override { return true; }
    std::chrono::milliseconds CallTimeout() const override { return config_.timeout; }
    absl::Status Warmup() override;

private:
    ClassifierSignalConfig config_;
    mutable LazyCapability<ClassifierModel> model_;
};

}  // namespace ipishield::detection
