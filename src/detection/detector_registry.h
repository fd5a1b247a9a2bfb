#pragma once

/// @file detector_registry.h
/// @brief Owns the signals and runs them concurrently for each request

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <absl/status/status.h>

#include "common/thread_pool.h"
#include "detection/signal.h"

namespace ipishield::detection {

/// @brief Configuration for the detector registry
struct DetectorRegistryConfig {
    /// Worker threads per pool (0 = hardware concurrency, at least 4)
    size_t workers = 0;

    /// Queued plus running optional calls allowed before new ones are
    /// degraded without dispatch (0 = four per worker)
    size_t max_optional_pending = 0;
};

/// @brief Registry of detection signals
///
/// Every call is isolated: an exception, an error status or an expired
/// timeout turns into a zero score for that signal and that request only.
/// Signals whose capability is permanently unavailable are not dispatched.
///
/// Core and optional signals run on separate pools. A timed-out optional
/// call keeps its worker until it returns, so a stuck model can only
/// exhaust the optional pool; core signals are never queued behind it.
///
/// Register all signals before the first RunAll; the signal list is not
/// guarded against concurrent modification.
class DetectorRegistry {
public:
    explicit DetectorRegistry(DetectorRegistryConfig config = {});
    ~DetectorRegistry();

    DetectorRegistry(const DetectorRegistry&) = delete;
    DetectorRegistry& operator=(const DetectorRegistry&) = delete;

    /// @brief Add a signal
    /// @return ConfigurationError for a null signal or a duplicate name
    absl::Status Register(std::shared_ptr<Signal> signal);

    /// @brief Run every eligible signal over one input
    /// @return One result per registered signal, in registration order
    std::vector<SignalResult> RunAll(std::shared_ptr<const SignalInput> input,
                                     const AnalysisOptions& options = {}) const;

    /// @brief Names of signals that are not permanently unavailable
    std::set<std::string> AvailableSignals() const;

    /// @brief Lifecycle state of every registered signal
    std::map<std::string, Availability> Health() const;

    /// @brief Trigger lazy loads now instead of on the first request
    void Warmup();

    std::vector<std::string> SignalNames() const;

    size_t Workers() const { return core_pool_->Size(); }

    size_t OptionalWorkers() const { return optional_pool_->Size(); }

private:
    /// Run one signal, converting every failure into a degraded result
    static SignalResult RunGuarded(const Signal& signal, const SignalInput& input);

    std::vector<std::shared_ptr<Signal>> signals_;
    size_t max_optional_pending_;
    std::unique_ptr<ThreadPool> core_pool_;
    std::unique_ptr<ThreadPool> optional_pool_;
};

}  // namespace ipishield::detection
