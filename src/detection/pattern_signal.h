#pragma once

/// @file pattern_signal.h
/// @brief Rule-based detection of known injection phrasings
///
/// Rules are grouped into categories (jailbreak, role-override, ...), each
/// with a severity on a 0-100 scale that individual rules may override.
/// Matching runs over the normalized view of the content, so spacing,
/// case, homoglyph and leetspeak tricks do not hide a phrase. Runs of
/// base64 or hex in the original content are decoded and checked too.
///
/// Example:
/// @code
///   auto signal = PatternSignal::Create(PatternSignalConfig{});
///   if (!signal.ok()) return signal.status();
///   auto input = SignalInput::Create({"Ignore all previous instructions"});
///   auto result = (*signal)->Analyze(*input);  // score 95, one "jailbreak" segment
/// @endcode

#include <filesystem>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <yaml-cpp/yaml.h>

#include "detection/signal.h"

namespace ipishield::detection {

/// @brief One regular expression in a category
struct PatternRule {
    std::string pattern;
    std::optional<int> severity;  ///< Overrides the category severity
    std::string description;
};

/// @brief A named group of rules sharing a default severity
struct PatternCategory {
    std::string name;
    int severity = 50;
    std::vector<PatternRule> rules;
};

/// @brief The rule table shipped with the library
std::vector<PatternCategory> DefaultPatternCategories();

/// @brief Parse a YAML rule table
///
/// Format:
/// @code
///   mode: extend          # or "replace"; extend appends to @p base
///   categories:
///     jailbreak:
///       severity: 95
///       rules:
///         - '\bjailbreak\b'
///         - pattern: '\bdan\s*mode\b'
///           severity: 100
/// @endcode
absl::StatusOr<std::vector<PatternCategory>> ParsePatternCategories(
    const YAML::Node& root, std::vector<PatternCategory> base);

/// @brief Load a YAML rule table from disk (see ParsePatternCategories)
absl::StatusOr<std::vector<PatternCategory>> LoadPatternCategories(
    const std::filesystem::path& path, std::vector<PatternCategory> base);

/// @brief Configuration for the pattern signal
struct PatternSignalConfig {
    std::vector<PatternCategory> categories = DefaultPatternCategories();

    /// Decode base64/hex runs and match the decoded text
    bool detect_encoded_payloads = true;
    size_t min_base64_run = 24;
    size_t min_hex_run = 32;

    /// Share of printable characters required for decoded text to be checked
    double min_printable_ratio = 0.9;
};

/// @brief A single rule hit on normalized text
struct PatternMatch {
    std::string category;
    int severity = 0;
    size_t begin = 0;  ///< Normalized offsets
    size_t end = 0;
};

/// @brief Pattern-matching signal; always available
class PatternSignal : public Signal {
public:
    /// @brief Compile the rule table
    /// @return ConfigurationError for an invalid regex or a severity outside [0, 100]
    static absl::StatusOr<std::unique_ptr<PatternSignal>> Create(PatternSignalConfig config);

    std::string Name() const override { return std::string(signal_names::kPattern); }
    absl::StatusOr<SignalResult> Analyze(const SignalInput& input) const override;

    /// @brief Run every rule over normalized text, skipping masked placeholders
    absl::StatusOr<std::vector<PatternMatch>> Match(const NormalizedText& text) const;

    size_t RuleCount() const { return rules_.size(); }

private:
    struct CompiledRule {
        std::string category;
        int severity;
        std::string description;
        std::regex regex;
    };

    PatternSignal(PatternSignalConfig config, std::vector<CompiledRule> rules);

    /// Base64/hex runs in the original content whose decoded text hits a rule
    absl::StatusOr<std::vector<FlaggedSegment>> DetectEncodedPayloads(
        const std::string& content) const;

    PatternSignalConfig config_;
    std::vector<CompiledRule> rules_;
};

}  // namespace ipishield::detection
