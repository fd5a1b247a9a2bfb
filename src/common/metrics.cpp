#include "metrics.h"

#include <algorithm>
#include <limits>
#include <set>
#include <sstream>

#include <absl/strings/str_cat.h>

namespace ipishield {

namespace {

// Default histogram buckets (latency in seconds)
const std::vector<double> kDefaultBuckets = {
    0.0005, 0.001, 0.0025, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5
};

std::string_view BaseName(std::string_view series) {
    auto brace = series.find('{');
    return brace == std::string_view::npos ? series : series.substr(0, brace);
}

std::string_view LabelPart(std::string_view series) {
    auto brace = series.find('{');
    if (brace == std::string_view::npos) {
        return {};
    }
    // Strip the braces, keep the label pairs
    return series.substr(brace + 1, series.size() - brace - 2);
}

void AddDouble(std::atomic<double>& target, double delta) {
    double current = target.load(std::memory_order_relaxed);
    while (!target.compare_exchange_weak(current, current + delta,
                                         std::memory_order_relaxed)) {
    }
}

}  // namespace

std::string LabeledName(std::string_view name, std::string_view label,
                        std::string_view value) {
    return absl::StrCat(std::string(name), "{", std::string(label), "=\"", std::string(value), "\"}");
}

// ===== Counter =====

Counter::Counter(std::string name, std::string description)
    : name_(std::move(name)), description_(std::move(description)) {}

void Counter::Increment() {
    value_.fetch_add(1, std::memory_order_relaxed);
}

void Counter::Add(int64_t delta) {
    if (delta >= 0) {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }
}

int64_t Counter::Value() const {
    return value_.load(std::memory_order_relaxed);
}

// ===== Gauge =====

Gauge::Gauge(std::string name, std::string description)
    : name_(std::move(name)), description_(std::move(description)) {}

void Gauge::Set(double value) {
    value_.store(value, std::memory_order_relaxed);
}

void Gauge::Increment(double delta) {
    AddDouble(value_, delta);
}

void Gauge::Decrement(double delta) {
    Increment(-delta);
}

double Gauge::Value() const {
    return value_.load(std::memory_order_relaxed);
}

// ===== Histogram =====

Histogram::Histogram(std::string name, std::string description)
    : Histogram(std::move(name), kDefaultBuckets, std::move(description)) {}

Histogram::Histogram(std::string name, std::vector<double> buckets, std::string description)
    : name_(std::move(name)),
      description_(std::move(description)),
      bucket_bounds_(std::move(buckets)) {
    std::sort(bucket_bounds_.begin(), bucket_bounds_.end());
    bucket_counts_ = std::make_unique<std::atomic<int64_t>[]>(bucket_bounds_.size() + 1);
    Clear();
}

void Histogram::Observe(double value) {
    count_.fetch_add(1, std::memory_order_relaxed);
    AddDouble(sum_, value);

    // Buckets are upper-inclusive
    auto it = std::lower_bound(bucket_bounds_.begin(), bucket_bounds_.end(), value);
    size_t bucket_idx = static_cast<size_t>(std::distance(bucket_bounds_.begin(), it));
    bucket_counts_[bucket_idx].fetch_add(1, std::memory_order_relaxed);
}

int64_t Histogram::Count() const {
    return count_.load(std::memory_order_relaxed);
}

double Histogram::Sum() const {
    return sum_.load(std::memory_order_relaxed);
}

std::vector<std::pair<double, int64_t>> Histogram::Buckets() const {
    std::vector<std::pair<double, int64_t>> result;
    result.reserve(bucket_bounds_.size() + 1);

    int64_t cumulative = 0;
    for (size_t i = 0; i < bucket_bounds_.size(); ++i) {
        cumulative += bucket_counts_[i].load(std::memory_order_relaxed);
        result.emplace_back(bucket_bounds_[i], cumulative);
    }
    cumulative += bucket_counts_[bucket_bounds_.size()].load(std::memory_order_relaxed);
    result.emplace_back(std::numeric_limits<double>::infinity(), cumulative);

    return result;
}

void Histogram::Clear() {
    for (size_t i = 0; i <= bucket_bounds_.size(); ++i) {
        bucket_counts_[i].store(0, std::memory_order_relaxed);
    }
    count_.store(0, std::memory_order_relaxed);
    sum_.store(0.0, std::memory_order_relaxed);
}

// ===== ScopedTimer =====

ScopedTimer::ScopedTimer(Histogram& histogram)
    : histogram_(histogram), start_(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
    histogram_.Observe(ElapsedSeconds());
}

double ScopedTimer::ElapsedSeconds() const {
    std::chrono::duration<double> duration = std::chrono::steady_clock::now() - start_;
    return duration.count();
}

// ===== MetricsRegistry =====

MetricsRegistry& MetricsRegistry::Instance() {
    static MetricsRegistry instance;
    return instance;
}

Counter& MetricsRegistry::GetCounter(std::string_view name, std::string_view description) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    if (it == counters_.end()) {
        it = counters_.emplace(std::string(name),
                               std::make_unique<Counter>(std::string(name),
                                                         std::string(description))).first;
    }
    return *it->second;
}

Gauge& MetricsRegistry::GetGauge(std::string_view name, std::string_view description) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = gauges_.find(name);
    if (it == gauges_.end()) {
        it = gauges_.emplace(std::string(name),
                             std::make_unique<Gauge>(std::string(name),
                                                     std::string(description))).first;
    }
    return *it->second;
}

Histogram& MetricsRegistry::GetHistogram(std::string_view name, std::string_view description) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histograms_.find(name);
    if (it == histograms_.end()) {
        it = histograms_.emplace(std::string(name),
                                 std::make_unique<Histogram>(std::string(name),
                                                             std::string(description))).first;
    }
    return *it->second;
}

std::string MetricsRegistry::ExportText() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;
    std::set<std::string, std::less<>> announced;

    auto announce = [&](std::string_view series, const std::string& description,
                        std::string_view type) {
        std::string_view base = BaseName(series);
        if (announced.insert(std::string(base)).second) {
            oss << "# HELP " << base << " " << description << "\n";
            oss << "# TYPE " << base << " " << type << "\n";
        }
    };

    for (const auto& [name, counter] : counters_) {
        announce(name, counter->Description(), "counter");
        oss << name << " " << counter->Value() << "\n";
    }

    for (const auto& [name, gauge] : gauges_) {
        announce(name, gauge->Description(), "gauge");
        oss << name << " " << gauge->Value() << "\n";
    }

    for (const auto& [name, histogram] : histograms_) {
        announce(name, histogram->Description(), "histogram");
        std::string_view base = BaseName(name);
        std::string_view labels = LabelPart(name);
        std::string prefix = labels.empty() ? "" : absl::StrCat(std::string(labels), ",");
        for (const auto& [bound, count] : histogram->Buckets()) {
            oss << base << "_bucket{" << prefix << "le=\"";
            if (bound == std::numeric_limits<double>::infinity()) {
                oss << "+Inf";
            } else {
                oss << bound;
            }
            oss << "\"} " << count << "\n";
        }
        std::string suffix = labels.empty() ? "" : absl::StrCat("{", std::string(labels), "}");
        oss << base << "_sum" << suffix << " " << histogram->Sum() << "\n";
        oss << base << "_count" << suffix << " " << histogram->Count() << "\n";
    }

    return oss.str();
}

void MetricsRegistry::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, counter] : counters_) {
        counter->Clear();
    }
    for (auto& [name, gauge] : gauges_) {
        gauge->Set(0.0);
    }
    for (auto& [name, histogram] : histograms_) {
        histogram->Clear();
    }
}

}  // namespace ipishield
