#pragma once

/// @file anomaly_signal.h
/// @brief Statistical anomaly signal (entropy, unusual characters, encoded runs,
///        imperative repetition)

#include <memory>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "detection/signal.h"

namespace ipishield::detection {

/// @brief Linear ramp mapping a raw measure onto a 0-100 score
struct ThresholdCurve {
    double zero_at = 0.0;  ///< At or below: 0
    double full_at = 1.0;  ///< At or above: 100

    double Apply(double value) const;
};

/// @brief Configuration for anomaly detection
struct AnomalySignalConfig {
    ThresholdCurve entropy_curve{1.9, 2.45};
    double entropy_flag = 70.0;
    size_t entropy_min_chars = 32;

    ThresholdCurve unusual_curve{0.002, 0.05};
    double unusual_flag = 50.0;

    ThresholdCurve encoding_curve{0.02, 0.30};
    double encoding_flag = 40.0;
    size_t min_encoded_run = 16;

    ThresholdCurve imperative_curve{2.0, 6.0};
    double imperative_flag = 60.0;

    double entropy_weight = 0.25;
    double unusual_weight = 0.25;
    double encoding_weight = 0.25;
    double imperative_weight = 0.25;
};

/// @brief Raw measures and their scores for one input
struct AnomalyMeasures {
    double entropy_bits = 0.0;
    double unusual_ratio = 0.0;
    double encoding_ratio = 0.0;
    int imperative_sentences = 0;

    double entropy_score = 0.0;
    double unusual_score = 0.0;
    double encoding_score = 0.0;
    double imperative_score = 0.0;

    /// Offsets (original content) of the runs behind each measure
    std::vector<std::pair<size_t, size_t>> unusual_runs;
    std::vector<std::pair<size_t, size_t>> encoded_runs;
    std::vector<std::pair<size_t, size_t>> imperative_sentence_ranges;
};

/// @brief Anomaly signal; always available
class AnomalySignal : public Signal {
public:
    explicit AnomalySignal(AnomalySignalConfig config = {});

    std::string Name() const override { return std::string(signal_names::kAnomaly); }
    absl::StatusOr<SignalResult> Analyze(const SignalInput& input) const override;

    /// @brief Compute every sub-metric without building segments
    AnomalyMeasures Measure(const SignalInput& input) const;

    const AnomalySignalConfig& GetConfig() const { return config_; }

private:
    double ComputeEntropy(const std::string& content, size_t* analysed_chars) const;
    void MeasureUnusual(const std::string& content, AnomalyMeasures& measures) const;
    void MeasureEncoding(const std::string& content, AnomalyMeasures& measures) const;
    void MeasureImperatives(const NormalizedText& text, AnomalyMeasures& measures) const;

    AnomalySignalConfig config_;
};

}  // namespace ipishield::detection
