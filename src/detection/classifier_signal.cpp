#include "detection/classifier_signal.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace ipishield::detection {

// ===== LogisticTextClassifier =====

LogisticTextClassifier::LogisticTextClassifier(double bias,
                                               std::unordered_map<std::string, double> weights,
                                               size_t max_tokens)
    : bias_(bias), weights_(std::move(weights)), max_tokens_(max_tokens) {}

absl::StatusOr<std::unique_ptr<LogisticTextClassifier>> LogisticTextClassifier::FromYaml(
    const YAML::Node& root) {
    try {
        if (!root || !root.IsMap()) {
            return MakeError(ErrorCode::kModelLoadError, "classifier artifact must be a mapping");
        }
        if (!root["bias"] || !root["weights"] || !root["weights"].IsMap()) {
            return MakeError(ErrorCode::kModelLoadError,
                             "classifier artifact needs 'bias' and a 'weights' mapping");
        }

        const double bias = root["bias"].as<double>();
        const size_t max_tokens = root["max_tokens"] ? root["max_tokens"].as<size_t>() : 4096;

        std::unordered_map<std::string, double> weights;
        for (const auto& kv : root["weights"]) {
            weights[kv.first.as<std::string>()] = kv.second.as<double>();
        }
        if (weights.empty()) {
            return MakeError(ErrorCode::kModelLoadError, "classifier artifact has no weights");
        }
        if (!std::isfinite(bias) ||
            std::any_of(weights.begin(), weights.end(),
                        [](const auto& kv) { return !std::isfinite(kv.second); })) {
            return MakeError(ErrorCode::kModelLoadError, "classifier artifact has non-finite values");
        }

        return std::make_unique<LogisticTextClassifier>(bias, std::move(weights), max_tokens);
    } catch (const YAML::Exception& e) {
        return MakeError(ErrorCode::kModelLoadError,
                         absl::StrCat("malformed classifier artifact: ", e.what()));
    }
}

absl::StatusOr<std::unique_ptr<LogisticTextClassifier>> LogisticTextClassifier::Load(
    const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return MakeError(ErrorCode::kModelLoadError,
                         absl::StrCat("classifier artifact not found: ", path.string()));
    }
    try {
        return FromYaml(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        return MakeError(ErrorCode::kModelLoadError,
                         absl::StrCat("failed to read ", path.string(), ": ", e.what()));
    }
}

absl::StatusOr<double> LogisticTextClassifier::PredictProbability(
    std::string_view normalized_text) const {
    std::unordered_set<std::string> features;
    size_t seen = 0;

    for (const auto& run : TokenRuns(normalized_text)) {
        for (size_t i = 0; i < run.size() && seen < max_tokens_; ++i, ++seen) {
            features.insert(run[i]);
            if (i + 1 < run.size()) {
                features.insert(absl::StrCat(run[i], " ", run[i + 1]));
            }
        }
    }

    double z = bias_;
    for (const auto& feature : features) {
        auto it = weights_.find(feature);
        if (it != weights_.end()) {
            z += it->second;
        }
    }
    return 1.0 / (1.0 + std::exp(-z));
}

// ===== ClassifierSignal =====

namespace {

absl::StatusOr<std::shared_ptr<const ClassifierModel>> DisabledClassifier() {
    return absl::FailedPreconditionError("disabled by configuration");
}

}  // namespace

ClassifierSignal::ClassifierSignal(ClassifierSignalConfig config, ClassifierLoader loader)
    : config_(std::move(config)),
      model_(std::string(signal_names::kClassifier),
             config_.enabled ? std::move(loader) : ClassifierLoader(DisabledClassifier)) {
    if (!config_.enabled) {
        // Resolve the capability right away so it reports unavailable
        model_.Get().status().IgnoreError();
    }
}

std::unique_ptr<ClassifierSignal> ClassifierSignal::Create(ClassifierSignalConfig config) {
    const std::string path = config.model_path;
    ClassifierLoader loader = [path]() -> absl::StatusOr<std::shared_ptr<const ClassifierModel>> {
        auto model = LogisticTextClassifier::Load(path);
        if (!model.ok()) {
            return model.status();
        }
        IPISHIELD_LOG_INFO("Loaded classifier '{}' with {} features from {}",
                           (*model)->Name(), (*model)->FeatureCount(), path);
        return std::shared_ptr<const ClassifierModel>(std::move(model).value());
    };
    return std::make_unique<ClassifierSignal>(std::move(config), std::move(loader));
}

absl::Status ClassifierSignal::Warmup() {
    return model_.Get().status();
}

absl::StatusOr<SignalResult> ClassifierSignal::Analyze(const SignalInput& input) const {
    auto model = model_.Get();
    if (!model.ok()) {
        return SignalResult::Unavailable(Name());
    }

    IPISHIELD_ASSIGN_OR_RETURN(double probability,
                               (*model)->PredictProbability(input.normalized.text));
    if (!std::isfinite(probability)) {
        return MakeError(ErrorCode::kSignalFailure, "classifier returned a non-finite probability");
    }
    probability = std::clamp(probability, 0.0, 1.0);

    SignalResult result;
    result.signal_name = Name();
    result.available = true;
    result.score = std::round(probability * 100.0);

    if (probability > config_.flag_threshold && !input.content.empty()) {
        FlaggedSegment segment;
        segment.text = input.content;
        segment.begin = 0;
        segment.end = input.content.size();
        segment.pattern_type = "classifier:malicious-intent";
        segment.confidence = probability;
        segment.reason = absl::StrCat("classifier probability ", probability);
        result.segments.push_back(std::move(segment));
    }
    return result;
}

}  // namespace ipishield::detection
