#include "detection/embedding_signal.h"

#include <algorithm>
#include <cmath>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#include "common/error.h"
#include "common/logging.h"

namespace ipishield::detection {

namespace {

constexpr uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

constexpr float kUnigramWeight = 1.0f;
constexpr float kBigramWeight = 1.5f;
constexpr float kTrigramWeight = 0.3f;

uint64_t Fnv1a(std::string_view data) {
    uint64_t hash = kFnvOffset;
    for (char c : data) {
        hash ^= static_cast<unsigned char>(c);
        hash *= kFnvPrime;
    }
    return hash;
}

absl::StatusOr<std::shared_ptr<const EmbeddingBackend>> DisabledEmbedding() {
    return absl::FailedPreconditionError("disabled by configuration");
}

}  // namespace

// ===== HashingEmbeddingModel =====

HashingEmbeddingModel::HashingEmbeddingModel(size_t dimension)
    : dimension_(dimension == 0 ? 384 : dimension) {}

void HashingEmbeddingModel::AddFeature(std::string_view feature, float weight,
                                       std::vector<float>& vec) const {
    const uint64_t hash = Fnv1a(feature);
    const size_t index = static_cast<size_t>(hash % dimension_);
    const float sign = (hash >> 63) ? -1.0f : 1.0f;
    vec[index] += sign * weight;
}

absl::StatusOr<std::vector<float>> HashingEmbeddingModel::Encode(
    std::string_view normalized_text) const {
    std::vector<float> vec(dimension_, 0.0f);

    for (const auto& run : TokenRuns(normalized_text)) {
        for (size_t i = 0; i < run.size(); ++i) {
            AddFeature(absl::StrCat("w:", run[i]), kUnigramWeight, vec);
            if (i + 1 < run.size()) {
                AddFeature(absl::StrCat("b:", run[i], " ", run[i + 1]), kBigramWeight, vec);
            }

            // Character trigrams over the padded word
            const std::string padded = absl::StrCat(" ", run[i], " ");
            for (size_t k = 0; k + 3 <= padded.size(); ++k) {
                AddFeature(absl::StrCat("c:", padded.substr(k, 3)), kTrigramWeight, vec);
            }
        }
    }

    double norm = 0.0;
    for (float v : vec) {
        norm += static_cast<double>(v) * v;
    }
    if (norm > 0.0) {
        const double inv = 1.0 / std::sqrt(norm);
        for (float& v : vec) {
            v = static_cast<float>(v * inv);
        }
    }
    return vec;
}

double CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0;
    }
    double dot = 0.0;
    double na = 0.0;
    double nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na == 0.0 || nb == 0.0) {
        return 0.0;
    }
    return dot / (std::sqrt(na) * std::sqrt(nb));
}

// ===== AttackCorpus =====

absl::StatusOr<std::shared_ptr<const AttackCorpus>> AttackCorpus::FromEntries(
    const std::vector<std::pair<std::string, std::string>>& entries,
    const EmbeddingModel& model) {
    if (entries.empty()) {
        return MakeError(ErrorCode::kModelLoadError, "attack corpus is empty");
    }

    auto corpus = std::make_shared<AttackCorpus>();
    corpus->entries_.reserve(entries.size());
    for (const auto& [category, text] : entries) {
        if (category.empty() || text.empty()) {
            return MakeError(ErrorCode::kModelLoadError,
                             "attack corpus entries need a category and a text");
        }
        IPISHIELD_ASSIGN_OR_RETURN(auto embedding, model.Encode(Normalize(text).text));
        corpus->entries_.push_back(Entry{category, text, std::move(embedding)});
    }
    return std::shared_ptr<const AttackCorpus>(std::move(corpus));
}

absl::StatusOr<std::shared_ptr<const AttackCorpus>> AttackCorpus::Load(
    const std::filesystem::path& path, const EmbeddingModel& model) {
    if (!std::filesystem::exists(path)) {
        return MakeError(ErrorCode::kModelLoadError,
                         absl::StrCat("attack corpus not found: ", path.string()));
    }

    std::vector<std::pair<std::string, std::string>> entries;
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        YAML::Node list = root.IsMap() ? root["entries"] : root;
        if (!list || !list.IsSequence()) {
            return MakeError(ErrorCode::kModelLoadError,
                             absl::StrCat("attack corpus ", path.string(), " has no entry list"));
        }
        for (const auto& item : list) {
            if (!item.IsMap() || !item["category"] || !item["text"]) {
                return MakeError(ErrorCode::kModelLoadError,
                                 "attack corpus entries need 'category' and 'text'");
            }
            entries.emplace_back(item["category"].as<std::string>(), item["text"].as<std::string>());
        }
    } catch (const YAML::Exception& e) {
        return MakeError(ErrorCode::kModelLoadError,
                         absl::StrCat("failed to read attack corpus ", path.string(), ": ",
                                      e.what()));
    }
    return FromEntries(entries, model);
}

std::optional<AttackCorpus::Neighbour> AttackCorpus::Nearest(
    const std::vector<float>& query) const {
    std::optional<Neighbour> best;
    for (const auto& entry : entries_) {
        const double similarity = CosineSimilarity(query, entry.embedding);
        if (!best || similarity > best->similarity) {
            best = Neighbour{&entry, similarity};
        }
    }
    return best;
}

// ===== EmbeddingSignal =====

EmbeddingSignal::EmbeddingSignal(EmbeddingSignalConfig config, EmbeddingLoader loader)
    : config_(std::move(config)),
      backend_(std::string(signal_names::kEmbedding),
               config_.enabled ? std::move(loader) : EmbeddingLoader(DisabledEmbedding)) {
    if (!config_.enabled) {
        backend_.Get().status().IgnoreError();
    }
}

std::unique_ptr<EmbeddingSignal> EmbeddingSignal::Create(EmbeddingSignalConfig config) {
    const std::string path = config.corpus_path;
    const size_t dimension = config.dimension;
    EmbeddingLoader loader =
        [path, dimension]() -> absl::StatusOr<std::shared_ptr<const EmbeddingBackend>> {
        auto backend = std::make_shared<EmbeddingBackend>();
        backend->model = std::make_shared<HashingEmbeddingModel>(dimension);
        IPISHIELD_ASSIGN_OR_RETURN(backend->corpus, AttackCorpus::Load(path, *backend->model));
        IPISHIELD_LOG_INFO("Loaded attack corpus with {} entries from {}",
                           backend->corpus->Size(), path);
        return std::shared_ptr<const EmbeddingBackend>(std::move(backend));
    };
    return std::make_unique<EmbeddingSignal>(std::move(config), std::move(loader));
}

absl::Status EmbeddingSignal::Warmup() {
    return backend_.Get().status();
}

absl::StatusOr<SignalResult> EmbeddingSignal::Analyze(const SignalInput& input) const {
    auto backend = backend_.Get();
    if (!backend.ok()) {
        return SignalResult::Unavailable(Name());
    }

    IPISHIELD_ASSIGN_OR_RETURN(auto query, (*backend)->model->Encode(input.normalized.text));

    SignalResult result;
    result.signal_name = Name();
    result.available = true;

    auto nearest = (*backend)->corpus->Nearest(query);
    if (!nearest || nearest->similarity <= config_.noise_floor) {
        return result;
    }

    const double similarity = std::min(nearest->similarity, 1.0);
    result.score = std::round(similarity * 10000.0) / 100.0;

    FlaggedSegment segment;
    segment.text = input.content;
    segment.begin = 0;
    segment.end = input.content.size();
    segment.pattern_type = absl::StrCat("embedding:", nearest->entry->category);
    segment.confidence = similarity;
    segment.reason = absl::StrFormat("similar (%.2f) to known attack \"%s\"", similarity,
                                     nearest->entry->text);
    result.segments.push_back(std::move(segment));
    return result;
}

}  // namespace ipishield::detection
