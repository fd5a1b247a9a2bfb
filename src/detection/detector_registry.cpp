#include "detection/detector_registry.h"

#include <algorithm>
#include <chrono>
#include <future>
#include <thread>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"

namespace ipishield::detection {

namespace {

constexpr size_t kMinWorkers = 4;
constexpr size_t kOptionalPendingPerWorker = 4;

Counter& SignalCounter(std::string_view metric, std::string_view signal) {
    return MetricsRegistry::Instance().GetCounter(LabeledName(metric, "signal", signal));
}

std::chrono::microseconds Since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
}

}  // namespace

DetectorRegistry::DetectorRegistry(DetectorRegistryConfig config) {
    size_t workers = config.workers;
    if (workers == 0) {
        workers = std::max<size_t>(kMinWorkers, std::thread::hardware_concurrency());
    }
    max_optional_pending_ = config.max_optional_pending > 0
                                ? config.max_optional_pending
                                : workers * kOptionalPendingPerWorker;
    core_pool_ = std::make_unique<ThreadPool>(workers, "ipishield-core");
    optional_pool_ = std::make_unique<ThreadPool>(workers, "ipishield-optional");
}

DetectorRegistry::~DetectorRegistry() = default;

absl::Status DetectorRegistry::Register(std::shared_ptr<Signal> signal) {
    if (!signal) {
        return ConfigurationError("cannot register a null signal");
    }
    const std::string name = signal->Name();
    for (const auto& existing : signals_) {
        if (existing->Name() == name) {
            return ConfigurationError(absl::StrCat("signal '", name, "' is already registered"));
        }
    }
    IPISHIELD_LOG_DEBUG("Registered signal '{}' (optional={}, timeout={}ms)", name,
                        signal->IsOptional(), signal->CallTimeout().count());
    signals_.push_back(std::move(signal));
    return absl::OkStatus();
}

SignalResult DetectorRegistry::RunGuarded(const Signal& signal, const SignalInput& input) {
    const auto start = std::chrono::steady_clock::now();
    const std::string name = signal.Name();
    SignalResult result;

    try {
        auto analyzed = signal.Analyze(input);
        if (analyzed.ok()) {
            result = std::move(analyzed).value();
        } else {
            IPISHIELD_LOG_WARN("Signal '{}' failed: {}", name, analyzed.status().ToString());
            SignalCounter(metric_names::kSignalErrorsTotal, name).Increment();
            result = SignalResult::Degraded(name, analyzed.status().ToString());
        }
    } catch (const std::exception& e) {
        IPISHIELD_LOG_WARN("Signal '{}' threw: {}", name, e.what());
        SignalCounter(metric_names::kSignalErrorsTotal, name).Increment();
        result = SignalResult::Degraded(name, absl::StrCat("exception: ", e.what()));
    }

    result.signal_name = name;
    if (!result.available) {
        result.score = 0.0;
        result.segments.clear();
    }

    // Keep only segments that address the analysed content
    auto invalid = [&](const FlaggedSegment& s) {
        return !(s.begin < s.end && s.end <= input.content.size());
    };
    const size_t before = result.segments.size();
    result.segments.erase(
        std::remove_if(result.segments.begin(), result.segments.end(), invalid),
        result.segments.end());
    if (result.segments.size() != before) {
        IPISHIELD_LOG_WARN("Signal '{}' produced {} out-of-range segments; dropped", name,
                           before - result.segments.size());
    }

    result.score = std::clamp(result.score, 0.0, 100.0);
    result.elapsed = Since(start);
    return result;
}

std::vector<SignalResult> DetectorRegistry::RunAll(std::shared_ptr<const SignalInput> input,
                                                   const AnalysisOptions& options) const {
    struct Pending {
        size_t index;
        std::shared_ptr<Signal> signal;
        std::future<SignalResult> future;
    };

    std::vector<SignalResult> results(signals_.size());
    std::vector<Pending> pending;
    pending.reserve(signals_.size());

    const auto dispatch = std::chrono::steady_clock::now();

    for (size_t i = 0; i < signals_.size(); ++i) {
        const auto& signal = signals_[i];
        const std::string name = signal->Name();

        if (options.skip_signals.count(name) > 0) {
            results[i] = SignalResult::Unavailable(name);
            continue;
        }
        if (signal->GetAvailability() == Availability::kUnavailable) {
            SignalCounter(metric_names::kSignalUnavailableTotal, name).Increment();
            results[i] = SignalResult::Unavailable(name);
            continue;
        }

        const bool optional = signal->IsOptional();
        if (optional && optional_pool_->PendingTasks() >= max_optional_pending_) {
            IPISHIELD_LOG_WARN("Signal '{}' not dispatched: {} optional calls still pending",
                               name, max_optional_pending_);
            SignalCounter(metric_names::kSignalTimeoutsTotal, name).Increment();
            results[i] = SignalResult::Degraded(name, "optional workers saturated");
            continue;
        }

        // The task co-owns the signal and the input so it can outlive this call
        auto task = [signal, input]() { return RunGuarded(*signal, *input); };
        ThreadPool& pool = optional ? *optional_pool_ : *core_pool_;
        auto submitted = pool.Submit(std::move(task));
        if (!submitted.ok()) {
            IPISHIELD_LOG_ERROR("Could not dispatch signal '{}': {}", name,
                                submitted.status().ToString());
            SignalCounter(metric_names::kSignalErrorsTotal, name).Increment();
            results[i] = SignalResult::Degraded(name, submitted.status().ToString());
            continue;
        }
        pending.push_back(Pending{i, signal, std::move(submitted).value()});
    }

    for (auto& p : pending) {
        const std::string name = p.signal->Name();
        const auto timeout = p.signal->CallTimeout();

        if (p.signal->IsOptional() && timeout.count() > 0) {
            if (p.future.wait_until(dispatch + timeout) != std::future_status::ready) {
                IPISHIELD_LOG_WARN("Signal '{}' exceeded {}ms; degraded for this request",
                                   name, timeout.count());
                SignalCounter(metric_names::kSignalTimeoutsTotal, name).Increment();
                results[p.index] = SignalResult::Degraded(
                    name, absl::StrCat("timed out after ", timeout.count(), "ms"));
                results[p.index].elapsed = Since(dispatch);
                continue;
            }
        }

        try {
            results[p.index] = p.future.get();
        } catch (const std::exception& e) {
            IPISHIELD_LOG_WARN("Signal '{}' task failed: {}", name, e.what());
            SignalCounter(metric_names::kSignalErrorsTotal, name).Increment();
            results[p.index] = SignalResult::Degraded(name, e.what());
        }

        if (!results[p.index].available) {
            SignalCounter(metric_names::kSignalUnavailableTotal, name).Increment();
        }
    }

    return results;
}

std::set<std::string> DetectorRegistry::AvailableSignals() const {
    std::set<std::string> names;
    for (const auto& signal : signals_) {
        if (signal->GetAvailability() != Availability::kUnavailable) {
            names.insert(signal->Name());
        }
    }
    return names;
}

std::map<std::string, Availability> DetectorRegistry::Health() const {
    std::map<std::string, Availability> health;
    for (const auto& signal : signals_) {
        health[signal->Name()] = signal->GetAvailability();
    }
    IPISHIELD_GAUGE(metric_names::kSignalsAvailable)
        .Set(static_cast<double>(AvailableSignals().size()));
    return health;
}

void DetectorRegistry::Warmup() {
    for (const auto& signal : signals_) {
        auto status = signal->Warmup();
        if (status.ok()) {
            IPISHIELD_LOG_DEBUG("Signal '{}' warm", signal->Name());
        } else {
            IPISHIELD_LOG_WARN("Signal '{}' failed to warm up: {}", signal->Name(),
                               status.ToString());
        }
    }
}

std::vector<std::string> DetectorRegistry::SignalNames() const {
    std::vector<std::string> names;
    names.reserve(signals_.size());
    for (const auto& signal : signals_) {
        names.push_back(signal->Name());
    }
    return names;
}

}  // namespace ipishield::detection
