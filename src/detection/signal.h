#pragma once

/// @file signal.h
/// @brief Base interface for detection signals

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "detection/text_normalizer.h"
#include "detection/types.h"

namespace ipishield::detection {

/// @brief Lifecycle of a signal's backing capability
enum class Availability {
    kUninitialized,  ///< Not loaded yet; loads on first use
    kAvailable,      ///< Ready
    kUnavailable,    ///< Load failed; permanently disabled for the process
};

std::string_view AvailabilityToString(Availability availability);

/// @brief Request-scoped input shared by all signals of one analysis
///
/// Built once per request and never modified afterwards. Held through a
/// shared_ptr so calls that outlive their request keep it alive.
struct SignalInput {
    std::string content;
    NormalizedText normalized;
    ContentType content_type = ContentType::kText;
    Provenance provenance = Provenance::kDirect;

    static std::shared_ptr<const SignalInput> Create(const AnalysisRequest& request);
};

/// @brief Abstract base class for signals
///
/// Implementations must be safe to call concurrently from several requests.
class Signal {
public:
    virtual ~Signal() = default;

    /// @brief Stable signal name (e.g. "pattern")
    virtual std::string Name() const = 0;

    /// @brief Score one input
    ///
    /// A result with available=false means the capability turned out to be
    /// missing during this call.
    virtual absl::StatusOr<SignalResult> Analyze(const SignalInput& input) const = 0;

    /// @brief Current availability; core signals are always available
    virtual Availability GetAvailability() const { return Availability::kAvailable; }

    /// @brief Optional signals are bounded by CallTimeout()
    virtual bool IsOptional() const { return false; }

    /// @brief Per-call budget for optional signals
    virtual std::chrono::milliseconds CallTimeout() const { return std::chrono::milliseconds(0); }

    /// @brief Eagerly load whatever the signal loads lazily
    virtual absl::Status Warmup() { return absl::OkStatus(); }
};

}  // namespace ipishield::detection
