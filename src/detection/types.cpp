#include "detection/types.h"

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace ipishield::detection {

SignalResult SignalResult::Unavailable(std::string_view name) {
    SignalResult result;
    result.signal_name = std::string(name);
    result.available = false;
    return result;
}

SignalResult SignalResult::Degraded(std::string_view name, std::string error) {
    SignalResult result;
    result.signal_name = std::string(name);
    result.available = true;
    result.score = 0.0;
    result.error = std::move(error);
    return result;
}

std::string_view ContentTypeToString(ContentType type) {
    switch (type) {
        case ContentType::kText: return "text";
        case ContentType::kHtml: return "html";
        case ContentType::kImageDerived: return "image";
    }
    return "unknown";
}

std::string_view ProvenanceToString(Provenance provenance) {
    switch (provenance) {
        case Provenance::kDirect: return "direct";
        case Provenance::kOcr: return "ocr";
        case Provenance::kHtml: return "html";
    }
    return "unknown";
}

std::string_view RiskCategoryToString(RiskCategory category) {
    switch (category) {
        case RiskCategory::kLow: return "LOW";
        case RiskCategory::kMedium: return "MEDIUM";
        case RiskCategory::kHigh: return "HIGH";
        case RiskCategory::kCritical: return "CRITICAL";
    }
    return "unknown";
}

std::string_view RecommendedActionToString(RecommendedAction action) {
    switch (action) {
        case RecommendedAction::kPass: return "PASS";
        case RecommendedAction::kPassWithWarnings: return "PASS_WITH_WARNINGS";
        case RecommendedAction::kBlock: return "BLOCK";
    }
    return "unknown";
}

absl::StatusOr<ContentType> ParseContentType(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(absl::StripAsciiWhitespace(std::string(name)));
    if (lowered == "text" || lowered == "plain" || lowered == "text/plain") {
        return ContentType::kText;
    }
    if (lowered == "html" || lowered == "text/html") {
        return ContentType::kHtml;
    }
    if (lowered == "image" || lowered == "image_derived") {
        return ContentType::kImageDerived;
    }
    return ValidationError(absl::StrCat("unsupported content type '", std::string(name), "'"));
}

absl::StatusOr<Provenance> ParseProvenance(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(absl::StripAsciiWhitespace(std::string(name)));
    if (lowered == "direct") return Provenance::kDirect;
    if (lowered == "ocr") return Provenance::kOcr;
    if (lowered == "html") return Provenance::kHtml;
    return ValidationError(absl::StrCat("unsupported provenance '", std::string(name), "'"));
}

}  // namespace ipishield::detection
