#pragma once

/// @file metrics.h
/// @brief IPI-Shield internal metrics for signal health and pipeline latency

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ipishield {

// ===== Well-known metric names =====

namespace metric_names {

inline constexpr std::string_view kAnalysesTotal = "ipishield_analyses_total";
inline constexpr std::string_view kSanitizationsTotal = "ipishield_sanitizations_total";
inline constexpr std::string_view kSanitizerFailuresTotal = "ipishield_sanitizer_failures_total";
inline constexpr std::string_view kSignalErrorsTotal = "ipishield_signal_errors_total";
inline constexpr std::string_view kSignalTimeoutsTotal = "ipishield_signal_timeouts_total";
inline constexpr std::string_view kSignalUnavailableTotal = "ipishield_signal_unavailable_total";
inline constexpr std::string_view kSignalsAvailable = "ipishield_signals_available";
inline constexpr std::string_view kAnalysisSeconds = "ipishield_analysis_seconds";

}  // namespace metric_names

/// @brief Build a series name carrying a single label, e.g. name{signal="pattern"}
std::string LabeledName(std::string_view name, std::string_view label,
                        std::string_view value);

/// @brief A monotonically increasing counter
class Counter {
public:
    explicit Counter(std::string name, std::string description = "");

    void Increment();

    /// @brief Increment the counter by a specific amount
    /// @param delta Amount to add (negative values are ignored)
    void Add(int64_t delta);

    int64_t Value() const;

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    friend class MetricsRegistry;
    void Clear() { value_.store(0, std::memory_order_relaxed); }

    std::string name_;
    std::string description_;
    std::atomic<int64_t> value_{0};
};

/// @brief A gauge metric that can go up and down
class Gauge {
public:
    explicit Gauge(std::string name, std::string description = "");

    void Set(double value);
    void Increment(double delta = 1.0);
    void Decrement(double delta = 1.0);
    double Value() const;

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::atomic<double> value_{0.0};
};

/// @brief A histogram for measuring value distributions
class Histogram {
public:
    /// @brief Create a histogram with default latency buckets (seconds)
    explicit Histogram(std::string name, std::string description = "");

    /// @brief Create a histogram with custom bucket upper bounds
    Histogram(std::string name, std::vector<double> buckets, std::string description = "");

    void Observe(double value);

    int64_t Count() const;
    double Sum() const;

    /// @brief Cumulative bucket counts, last entry is +Inf
    std::vector<std::pair<double, int64_t>> Buckets() const;

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    friend class MetricsRegistry;
    void Clear();

    std::string name_;
    std::string description_;
    std::vector<double> bucket_bounds_;
    // One slot per bound plus the +Inf bucket
    std::unique_ptr<std::atomic<int64_t>[]> bucket_counts_;
    std::atomic<int64_t> count_{0};
    std::atomic<double> sum_{0.0};
};

/// @brief RAII timer that records its lifetime into a histogram
class ScopedTimer {
public:
    explicit ScopedTimer(Histogram& histogram);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    /// @brief Seconds elapsed since construction
    double ElapsedSeconds() const;

private:
    Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// @brief Process-wide registry of named metrics
///
/// References returned by the Get* methods stay valid for the lifetime of
/// the process; Reset() zeroes values but never removes series.
class MetricsRegistry {
public:
    static MetricsRegistry& Instance();

    Counter& GetCounter(std::string_view name, std::string_view description = "");
    Gauge& GetGauge(std::string_view name, std::string_view description = "");
    Histogram& GetHistogram(std::string_view name, std::string_view description = "");

    /// @brief Export all metrics in Prometheus text exposition format
    std::string ExportText() const;

    /// @brief Zero every registered metric (primarily for testing)
    void Reset();

private:
    MetricsRegistry() = default;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Counter>, std::less<>> counters_;
    std::map<std::string, std::unique_ptr<Gauge>, std::less<>> gauges_;
    std::map<std::string, std::unique_ptr<Histogram>, std::less<>> histograms_;
};

// Convenience macros for metrics

#define IPISHIELD_COUNTER(name) \
    ::ipishield::MetricsRegistry::Instance().GetCounter(name)

#define IPISHIELD_GAUGE(name) \
    ::ipishield::MetricsRegistry::Instance().GetGauge(name)

#define IPISHIELD_HISTOGRAM(name) \
    ::ipishield::MetricsRegistry::Instance().GetHistogram(name)

}  // namespace ipishield
