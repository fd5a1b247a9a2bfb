#include "config.h"

#include <cstdlib>
#include <functional>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "logging.h"

namespace ipishield {

namespace {

// Environment variable suffix -> dotted configuration key
struct EnvBinding {
    const char* suffix;
    const char* key;
    enum class Kind { kString, kInt, kDouble, kBool } kind;
};

constexpr EnvBinding kEnvBindings[] = {
    {"LOG_LEVEL", "logging.level", EnvBinding::Kind::kString},
    {"CLASSIFIER_MODEL", "signals.classifier.model_path", EnvBinding::Kind::kString},
    {"CLASSIFIER_ENABLED", "signals.classifier.enabled", EnvBinding::Kind::kBool},
    {"EMBEDDING_CORPUS", "signals.embedding.corpus_path", EnvBinding::Kind::kString},
    {"EMBEDDING_ENABLED", "signals.embedding.enabled", EnvBinding::Kind::kBool},
    {"PATTERN_RULES", "signals.pattern.rules_path", EnvBinding::Kind::kString},
    {"SIGNAL_TIMEOUT_MS", "signals.timeout_ms", EnvBinding::Kind::kInt},
    {"WORKERS", "registry.workers", EnvBinding::Kind::kInt},
    {"MAX_CONTENT_BYTES", "limits.max_content_bytes", EnvBinding::Kind::kInt},
};

}  // namespace

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return absl::NotFoundError(
            absl::StrCat("Configuration file not found: ", path.string()));
    }

    try {
        Config config;
        config.root_ = YAML::LoadFile(path.string());
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML configuration: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML content: ", e.what()));
    }
}

Config Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    for (const auto& binding : kEnvBindings) {
        const std::string name = absl::StrCat(std::string(prefix), binding.suffix);
        const char* raw = std::getenv(name.c_str());
        if (raw == nullptr) {
            continue;
        }
        const std::string value(raw);

        switch (binding.kind) {
            case EnvBinding::Kind::kString:
                config.Set(binding.key, value);
                break;
            case EnvBinding::Kind::kInt: {
                int64_t parsed = 0;
                if (absl::SimpleAtoi(value, &parsed)) {
                    config.Set(binding.key, parsed);
                } else {
                    // Keep the raw text so strict validation reports it
                    config.Set(binding.key, value);
                }
                break;
            }
            case EnvBinding::Kind::kDouble: {
                double parsed = 0.0;
                if (absl::SimpleAtod(value, &parsed)) {
                    config.Set(binding.key, parsed);
                } else {
                    config.Set(binding.key, value);
                }
                break;
            }
            case EnvBinding::Kind::kBool: {
                bool parsed = false;
                if (absl::SimpleAtob(value, &parsed)) {
                    config.Set(binding.key, parsed);
                } else {
                    config.Set(binding.key, value);
                }
                break;
            }
        }
    }

    return config;
}

absl::StatusOr<Config> Config::LoadLayered(
    const std::optional<std::filesystem::path>& path,
    std::string_view env_prefix) {
    Config config;

    if (path.has_value()) {
        auto file_config = LoadFromFile(*path);
        if (!file_config.ok()) {
            return file_config.status();
        }
        config.Merge(*file_config);
    }

    // Environment variables have the highest priority
    config.Merge(LoadFromEnvironment(env_prefix));
    return config;
}

void Config::Merge(const Config& other) {
    if (!other.root_ || !other.root_.IsMap()) {
        return;
    }
    if (!root_ || !root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    // Deep merge YAML nodes
    std::function<void(YAML::Node, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node base, const YAML::Node& overlay) {
        for (const auto& kv : overlay) {
            const std::string key = kv.first.as<std::string>();
            if (base[key] && base[key].IsMap() && kv.second.IsMap()) {
                merge_nodes(base[key], kv.second);
            } else {
                base[key] = YAML::Clone(kv.second);
            }
        }
    };

    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(std::string(key), '.');
    YAML::Node current = YAML::Clone(root_);

    for (const auto& part : parts) {
        if (!current || !current.IsMap()) {
            return std::nullopt;
        }
        const YAML::Node& parent = current;
        YAML::Node child = parent[part];
        current.reset(child);
    }

    if (!current || current.IsNull()) {
        return std::nullopt;
    }

    return current;
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        return node->as<std::string>();
    }
    return std::string(default_value);
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    auto value = ReadInt(key, default_value);
    return value.ok() ? *value : default_value;
}

double Config::GetDouble(std::string_view key, double default_value) const {
    auto value = ReadDouble(key, default_value);
    return value.ok() ? *value : default_value;
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    auto value = ReadBool(key, default_value);
    return value.ok() ? *value : default_value;
}

std::vector<std::string> Config::GetStringList(std::string_view key) const {
    std::vector<std::string> result;
    auto node = GetNestedNode(key);
    if (node && node->IsSequence()) {
        for (const auto& item : *node) {
            if (item.IsScalar()) {
                result.push_back(item.as<std::string>());
            }
        }
    }
    return result;
}

absl::StatusOr<double> Config::ReadDouble(std::string_view key, double default_value) const {
    auto node = GetNestedNode(key);
    if (!node) {
        return default_value;
    }
    double value = 0.0;
    if (!node->IsScalar() || !absl::SimpleAtod(node->Scalar(), &value)) {
        return absl::InvalidArgumentError(
            absl::StrCat("Configuration key '", std::string(key), "' is not a number"));
    }
    return value;
}

absl::StatusOr<int64_t> Config::ReadInt(std::string_view key, int64_t default_value) const {
    auto node = GetNestedNode(key);
    if (!node) {
        return default_value;
    }
    int64_t value = 0;
    if (!node->IsScalar() || !absl::SimpleAtoi(node->Scalar(), &value)) {
        return absl::InvalidArgumentError(
            absl::StrCat("Configuration key '", std::string(key), "' is not an integer"));
    }
    return value;
}

absl::StatusOr<bool> Config::ReadBool(std::string_view key, bool default_value) const {
    auto node = GetNestedNode(key);
    if (!node) {
        return default_value;
    }
    bool value = false;
    if (!node->IsScalar() || !absl::SimpleAtob(node->Scalar(), &value)) {
        return absl::InvalidArgumentError(
            absl::StrCat("Configuration key '", std::string(key), "' is not a boolean"));
    }
    return value;
}

absl::StatusOr<std::map<std::string, double>> Config::ReadDoubleMap(
    std::string_view key) const {
    std::map<std::string, double> result;
    auto node = GetNestedNode(key);
    if (!node) {
        return result;
    }
    if (!node->IsMap()) {
        return absl::InvalidArgumentError(
            absl::StrCat("Configuration key '", std::string(key), "' must be a mapping"));
    }
    for (const auto& kv : *node) {
        const std::string name = kv.first.as<std::string>();
        double value = 0.0;
        if (!kv.second.IsScalar() || !absl::SimpleAtod(kv.second.Scalar(), &value)) {
            return absl::InvalidArgumentError(
                absl::StrCat("Configuration key '", std::string(key), ".", name, "' is not a number"));
        }
        result[name] = value;
    }
    return result;
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(std::string(key), '.');

    if (!root_ || !root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    YAML::Node current = root_;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        YAML::Node child = current[parts[i]];
        if (!child.IsMap()) {
            child = YAML::Node(YAML::NodeType::Map);
        }
        current.reset(child);
    }

    std::visit([&](auto&& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& item : val) {
                seq.push_back(item);
            }
            current[parts.back()] = seq;
        } else if constexpr (std::is_same_v<T, std::unordered_map<std::string, std::string>>) {
            YAML::Node map(YAML::NodeType::Map);
            for (const auto& [k, v] : val) {
                map[k] = v;
            }
            current[parts.back()] = map;
        } else {
            current[parts.back()] = val;
        }
    }, value);
}

}  // namespace ipishield
