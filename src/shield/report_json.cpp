#include "shield/report_json.h"

#include <string>

namespace ipishield {

using nlohmann::json;

json ToJson(const detection::FlaggedSegment& segment) {
    return json{
        {"text", segment.text},
        {"begin", segment.begin},
        {"end", segment.end},
        {"pattern_type", segment.pattern_type},
        {"confidence", segment.confidence},
        {"reason", segment.reason},
    };
}

json ToJson(const detection::SignalResult& result) {
    json segments = json::array();
    for (const auto& segment : result.segments) {
        segments.push_back(ToJson(segment));
    }
    json out{
        {"signal", result.signal_name},
        {"score", result.score},
        {"available", result.available},
        {"elapsed_us", result.elapsed.count()},
        {"segments", std::move(segments)},
    };
    if (result.error) {
        out["error"] = *result.error;
    }
    return out;
}

json ToJson(const detection::CompositeScore& score) {
    return json{
        {"injection_score", score.injection_score},
        {"safety_score", score.safety_score},
        {"risk_category", std::string(detection::RiskCategoryToString(score.risk_category))},
        {"recommended_action", std::string(detection::RecommendedActionToString(score.recommended_action))},
        {"signal_breakdown", score.signal_breakdown},
    };
}

json ToJson(const detection::AnalysisReport& report) {
    json signals = json::array();
    for (const auto& result : report.signals) {
        signals.push_back(ToJson(result));
    }
    json segments = json::array();
    for (const auto& attributed : report.segments) {
        json entry = ToJson(attributed.segment);
        entry["signal"] = attributed.signal_name;
        segments.push_back(std::move(entry));
    }
    return json{
        {"score", ToJson(report.score)},
        {"content_type", std::string(detection::ContentTypeToString(report.content_type))},
        {"provenance", std::string(detection::ProvenanceToString(report.provenance))},
        {"content_length", report.content_length},
        {"elapsed_us", report.elapsed.count()},
        {"signals", std::move(signals)},
        {"flagged_segments", std::move(segments)},
    };
}

json ToJson(const sanitize::SanitizationResult& result) {
    json replacements = json::array();
    for (const auto& r : result.replacements) {
        replacements.push_back(json{
            {"original", r.original},
            {"placeholder", r.placeholder},
            {"begin", r.begin},
            {"end", r.end},
            {"reason", r.reason},
        });
    }
    return json{
        {"mode", std::string(sanitize::SanitizationModeToString(result.mode))},
        {"action_taken", std::string(sanitize::SanitizationActionToString(result.action_taken))},
        {"sanitized_content", result.sanitized_content},
        {"segments_modified", result.segments_modified},
        {"original_risk_score", result.original_risk_score},
        {"post_sanitization_risk_score", result.post_sanitization_risk_score},
        {"risk_reduction", result.risk_reduction},
        {"replacements", std::move(replacements)},
        {"warnings", result.warnings},
        {"original_score", ToJson(result.original_report.score)},
        {"post_score", ToJson(result.post_report.score)},
    };
}

json HealthToJson(const std::map<std::string, detection::Availability>& health) {
    json out = json::object();
    for (const auto& [name, availability] : health) {
        out[name] = std::string(detection::AvailabilityToString(availability));
    }
    return out;
}

}  // namespace ipishield
