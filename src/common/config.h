#pragma once

/// @file config.h
/// @brief IPI-Shield configuration management

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <yaml-cpp/yaml.h>

namespace ipishield {

/// @brief Configuration value that can hold different types
using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string,
    std::vector<std::string>,
    std::unordered_map<std::string, std::string>
>;

/// @brief Configuration manager for loading and accessing configuration
///
/// Values are addressed with dot notation ("scoring.weights.pattern").
/// The Get* accessors are lenient and fall back to the default on a
/// missing or malformed value; the Read* accessors report a malformed
/// value as an error so startup validation can reject it.
class Config {
public:
    /// @brief Default constructor creates empty configuration
    Config() = default;

    /// @brief Load configuration from a YAML file
    /// @param path Path to the YAML configuration file
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Load configuration from a YAML string
    /// @param yaml_content YAML content as a string
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Load configuration from environment variables with a prefix
    /// @param prefix Environment variable prefix (e.g., "IPISHIELD_")
    static Config LoadFromEnvironment(std::string_view prefix = "IPISHIELD_");

    /// @brief Load an optional file and overlay the environment on top of it
    /// @param path Configuration file, if any
    /// @param env_prefix Environment variable prefix
    static absl::StatusOr<Config> LoadLayered(
        const std::optional<std::filesystem::path>& path,
        std::string_view env_prefix = "IPISHIELD_");

    /// @brief Merge another configuration into this one (other takes precedence)
    void Merge(const Config& other);

    std::string GetString(std::string_view key, std::string_view default_value = "") const;
    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;
    double GetDouble(std::string_view key, double default_value = 0.0) const;
    bool GetBool(std::string_view key, bool default_value = false) const;

    /// @brief Get a list of strings
    /// @return List of strings or empty vector if not found
    std::vector<std::string> GetStringList(std::string_view key) const;

    /// @brief Strict numeric read; absent keys yield the default
    absl::StatusOr<double> ReadDouble(std::string_view key, double default_value) const;

    /// @brief Strict integer read; absent keys yield the default
    absl::StatusOr<int64_t> ReadInt(std::string_view key, int64_t default_value) const;

    /// @brief Strict boolean read; absent keys yield the default
    absl::StatusOr<bool> ReadBool(std::string_view key, bool default_value) const;

    /// @brief Read a map of name -> number (e.g. per-signal weights)
    /// @return Empty map if the key is absent, error if any entry is malformed
    absl::StatusOr<std::map<std::string, double>> ReadDoubleMap(std::string_view key) const;

    /// @brief Check if a key exists
    bool HasKey(std::string_view key) const;

    /// @brief Set a configuration value
    void Set(std::string_view key, ConfigValue value);

    /// @brief Get the underlying YAML node for advanced access
    const YAML::Node& GetNode() const { return root_; }

private:
    YAML::Node root_;

    /// @brief Navigate to a nested node using dot notation
    std::optional<YAML::Node> GetNestedNode(std::string_view key) const;
};

}  // namespace ipishield
