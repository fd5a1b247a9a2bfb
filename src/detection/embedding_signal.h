#pragma once

/// @file embedding_signal.h
/// @brief Optional nearest-neighbour signal against a corpus of known attacks

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/status/statusor.h>
#include <yaml-cpp/yaml.h>

#include "detection/lazy_capability.h"
#include "detection/signal.h"

namespace ipishield::detection {

/// @brief Maps normalized text to a fixed-size vector
class EmbeddingModel {
public:
    virtual ~EmbeddingModel() = default;

    virtual absl::StatusOr<std::vector<float>> Encode(std::string_view normalized_text) const = 0;

    virtual size_t Dimension() const = 0;
};

/// @brief Feature-hashing embedding (FNV-1a, signed buckets, L2-normalized)
///
/// Features are word unigrams, word bigrams and character trigrams. Text
/// with no features encodes to the zero vector.
class HashingEmbeddingModel : public EmbeddingModel {
public:
    explicit HashingEmbeddingModel(size_t dimension = 384);

    absl::StatusOr<std::vector<float>> Encode(std::string_view normalized_text) const override;
    size_t Dimension() const override { return dimension_; }

private:
    void AddFeature(std::string_view feature, float weight, std::vector<float>& vec) const;

    size_t dimension_;
};

/// @brief Cosine similarity of two equally sized vectors (0 if either is zero)
double CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

/// @brief Encoded corpus of known attack phrasings
class AttackCorpus {
public:
    struct Entry {
        std::string category;
        std::string text;
        std::vector<float> embedding;
    };

    struct Neighbour {
        const Entry* entry = nullptr;
        double similarity = 0.0;
    };

    /// @brief Encode (category, text) pairs
    /// @return ModelLoadError if the list is empty or encoding fails
    static absl::StatusOr<std::shared_ptr<const AttackCorpus>> FromEntries(
        const std::vector<std::pair<std::string, std::string>>& entries,
        const EmbeddingModel& model);

    /// @brief Load a YAML corpus: a list (or an "entries" list) of {category, text}
    static absl::StatusOr<std::shared_ptr<const AttackCorpus>> Load(
        const std::filesystem::path& path, const EmbeddingModel& model);

    /// @brief Most similar entry, if any
    std::optional<Neighbour> Nearest(const std::vector<float>& query) const;

    size_t Size() const { return entries_.size(); }

private:
    std::vector<Entry> entries_;
};

/// @brief Model plus corpus, loaded together
struct EmbeddingBackend {
    std::shared_ptr<const EmbeddingModel> model;
    std::shared_ptr<const AttackCorpus> corpus;
};

/// @brief Configuration for the embedding signal
struct EmbeddingSignalConfig {
    bool enabled = true;
    std::string corpus_path = "models/attack_corpus.yaml";
    size_t dimension = 384;
    std::chrono::milliseconds timeout{250};
    double noise_floor = 0.55;  ///< Similarities at or below score 0
};

using EmbeddingLoader = std::function<absl::StatusOr<std::shared_ptr<const EmbeddingBackend>>()>;

/// @brief Embedding similarity signal backed by a lazily loaded corpus
class EmbeddingSignal : public Signal {
public:
    EmbeddingSignal(EmbeddingSignalConfig config, EmbeddingLoader loader);

    /// @brief Signal using HashingEmbeddingModel and the corpus at config.corpus_path
    static std::unique_ptr<EmbeddingSignal> Create(EmbeddingSignalConfig config);

    std::string Name() const override { return std::string(signal_names::kEmbedding); }
    absl::StatusOr<SignalResult> Analyze(const SignalInput& input) const override;

    Availability GetAvailability() const override { return backend_.State(); }
    bool IsOptional() const override { return true; }
    std::chrono::milliseconds CallTimeout() const override { return config_.timeout; }
    absl::Status Warmup() override;

private:
    EmbeddingSignalConfig config_;
    mutable LazyCapability<EmbeddingBackend> backend_;
};

}  // namespace ipishield::detection
