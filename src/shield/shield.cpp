#include "shield/shield.h"

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"
#include "detection/anomaly_signal.h"
#include "detection/classifier_signal.h"
#include "detection/embedding_signal.h"
#include "detection/pattern_signal.h"

namespace ipishield {

using detection::Availability;

absl::StatusOr<AnalysisRequest> MakeRequest(std::string content, std::string_view content_type,
                                            std::string_view provenance) {
    AnalysisRequest request;
    request.content = std::move(content);
    IPISHIELD_ASSIGN_OR_RETURN(request.content_type, detection::ParseContentType(content_type));
    IPISHIELD_ASSIGN_OR_RETURN(request.provenance, detection::ParseProvenance(provenance));
    return request;
}

// ===== Construction =====

absl::StatusOr<std::unique_ptr<Shield>> Shield::Create(ShieldConfig config) {
    IPISHIELD_RETURN_IF_ERROR(config.Validate());

    detection::PatternSignalConfig pattern_config;
    if (!config.pattern_rules_path.empty()) {
        IPISHIELD_ASSIGN_OR_RETURN(
            pattern_config.categories,
            detection::LoadPatternCategories(config.pattern_rules_path,
                                             detection::DefaultPatternCategories()));
        IPISHIELD_LOG_INFO("Loaded pattern rules from {}", config.pattern_rules_path);
    }
    IPISHIELD_ASSIGN_OR_RETURN(auto pattern, detection::PatternSignal::Create(pattern_config));

    std::vector<std::shared_ptr<detection::Signal>> signals;
    signals.push_back(std::move(pattern));
    signals.push_back(std::make_shared<detection::AnomalySignal>());
    signals.push_back(detection::ClassifierSignal::Create(config.classifier));
    signals.push_back(detection::EmbeddingSignal::Create(config.embedding));

    return CreateWithSignals(std::move(config), std::move(signals));
}

absl::StatusOr<std::unique_ptr<Shield>> Shield::CreateWithSignals(
    ShieldConfig config, std::vector<std::shared_ptr<detection::Signal>> signals) {
    IPISHIELD_RETURN_IF_ERROR(config.Validate());
    IPISHIELD_ASSIGN_OR_RETURN(auto scorer, detection::CompositeScorer::Create(config.scoring));

    std::unique_ptr<Shield> shield(new Shield(std::move(config), std::move(scorer)));
    for (auto& signal : signals) {
        IPISHIELD_RETURN_IF_ERROR(shield->registry_->Register(std::move(signal)));
    }

    if (shield->config_.warmup) {
        shield->Warmup();
    }

    IPISHIELD_LOG_INFO("Shield ready: signals [{}], {} workers, max content {} bytes",
                       absl::StrJoin(shield->registry_->SignalNames(), ", "),
                       shield->registry_->Workers(), shield->config_.max_content_bytes);
    return shield;
}

Shield::Shield(ShieldConfig config, detection::CompositeScorer scorer)
    : config_(std::move(config)),
      scorer_(std::move(scorer)),
      registry_(std::make_unique<detection::DetectorRegistry>(config_.registry)) {
    // Re-scoring runs on sanitizer output, which may legitimately exceed the
    // request limits, so the engine bypasses validation
    sanitizer_ = std::make_unique<sanitize::SanitizationEngine>(
        [this](const AnalysisRequest& request) { return AnalyzeUnchecked(request); });
}

Shield::~Shield() = default;

// ===== Requests =====

absl::Status Shield::ValidateRequest(const AnalysisRequest& request) const {
    if (absl::StripAsciiWhitespace(request.content).empty()) {
        return ValidationError("content is empty or whitespace only");
    }
    if (request.content.size() > config_.max_content_bytes) {
        return ValidationError(absl::StrCat("content is ", request.content.size(),
                                            " bytes; the limit is ", config_.max_content_bytes));
    }
    switch (request.content_type) {
        case detection::ContentType::kText:
        case detection::ContentType::kHtml:
        case detection::ContentType::kImageDerived:
            break;
        default:
            return ValidationError("unknown content type");
    }
    return absl::OkStatus();
}

absl::StatusOr<AnalysisReport> Shield::Analyze(const AnalysisRequest& request) const {
    IPISHIELD_RETURN_IF_ERROR(ValidateRequest(request));
    return AnalyzeUnchecked(request);
}

absl::StatusOr<AnalysisReport> Shield::AnalyzeUnchecked(const AnalysisRequest& request) const {
    auto& histogram = IPISHIELD_HISTOGRAM(metric_names::kAnalysisSeconds);
    ScopedTimer timer(histogram);

    auto input = detection::SignalInput::Create(request);
    const auto& options = request.options ? *request.options : detection::AnalysisOptions{};

    AnalysisReport report;
    report.signals = registry_->RunAll(input, options);
    report.score = scorer_.Score(report.signals);
    report.segments = detection::CompositeScorer::CollectSegments(report.signals);
    report.content_type = request.content_type;
    report.provenance = request.provenance;
    report.content_length = request.content.size();
    report.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::duration<double>(timer.ElapsedSeconds()));

    IPISHIELD_COUNTER(metric_names::kAnalysesTotal).Increment();
    IPISHIELD_LOG_DEBUG("Analysed {} bytes of {} ({}): score {:.2f} {} -> {}",
                        report.content_length,
                        detection::ContentTypeToString(report.content_type),
                        detection::ProvenanceToString(report.provenance),
                        report.score.injection_score,
                        detection::RiskCategoryToString(report.score.risk_category),
                        detection::RecommendedActionToString(report.score.recommended_action));
    return report;
}

absl::StatusOr<SanitizationResult> Shield::Sanitize(const AnalysisRequest& request,
                                                    SanitizationMode mode,
                                                    const SanitizeOptions& options) const {
    IPISHIELD_RETURN_IF_ERROR(ValidateRequest(request));
    return sanitizer_->Sanitize(request, mode, options);
}

absl::StatusOr<SanitizationResult> Shield::Sanitize(std::string content,
                                                    SanitizationMode mode) const {
    AnalysisRequest request;
    request.content = std::move(content);
    return Sanitize(request, mode);
}

// ===== Introspection =====

std::set<std::string> Shield::AvailableSignals() const {
    return registry_->AvailableSignals();
}

std::map<std::string, Availability> Shield::Health() const {
    return registry_->Health();
}

void Shield::Warmup() {
    registry_->Warmup();
}

}  // namespace ipishield
