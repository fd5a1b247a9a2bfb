#include "detection/signal.h"

namespace ipishield::detection {

std::string_view AvailabilityToString(Availability availability) {
    switch (availability) {
        case Availability::kUninitialized: return "uninitialized";
        case Availability::kAvailable: return "available";
        case Availability::kUnavailable: return "unavailable";
    }
    return "unknown";
}

std::shared_ptr<const SignalInput> SignalInput::Create(const AnalysisRequest& request) {
    auto input = std::make_shared<SignalInput>();
    input->content = request.content;
    input->normalized = Normalize(request.content);
    input->content_type = request.content_type;
    input->provenance = request.provenance;
    return input;
}

}  // namespace ipishield::detection
