#pragma once

/// @file config.h
/// @brief pglogstats configuration management

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace pglogstats {

/// @brief Configuration value that can hold different types
using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string,
    std::vector<std::string>
>;

/// @brief Layered key/value configuration backed by a YAML document
///
/// Keys use dot notation ("analysis.max_slow_queries"). Layers are combined
/// with Merge(), the later layer winning on conflicting scalar keys.
class Config {
public:
    Config() = default;

    /// @brief Load configuration from a YAML file
    /// @param path Path to the YAML configuration file
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Load configuration from a YAML string
    /// @param yaml_content YAML content as a string
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Load the recognized PGLOGSTATS_* environment overrides
    /// @param prefix Environment variable prefix
    /// @return Configuration holding only the variables that are set, or an
    ///         error when a numeric variable does not parse
    static absl::StatusOr<Config> LoadFromEnvironment(std::string_view prefix = "PGLOGSTATS_");

    /// @brief Merge another configuration into this one (other takes precedence)
    void Merge(const Config& other);

    std::string GetString(std::string_view key, std::string_view default_value = "") const;
    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;
    double GetDouble(std::string_view key, double default_value = 0.0) const;
    bool GetBool(std::string_view key, bool default_value = false) const;

    /// @brief Get a list of strings
    /// @return List of strings or empty vector if not found
    std::vector<std::string> GetStringList(std::string_view key) const;

    /// @brief Strict integer lookup
    /// @return std::nullopt if the key is absent, InvalidArgument if the value
    ///         is present but not an integer
    absl::StatusOr<std::optional<int64_t>> GetIntStrict(std::string_view key) const;

    /// @brief Strict floating point lookup, same contract as GetIntStrict()
    absl::StatusOr<std::optional<double>> GetDoubleStrict(std::string_view key) const;

    /// @brief Strict boolean lookup, same contract as GetIntStrict()
    absl::StatusOr<std::optional<bool>> GetBoolStrict(std::string_view key) const;

    /// @brief Check if a key exists
    bool HasKey(std::string_view key) const;

    /// @brief Set a configuration value, creating intermediate maps
    void Set(std::string_view key, ConfigValue value);

    /// @brief Get the underlying YAML node for advanced access
    const YAML::Node& GetNode() const { return root_; }

    /// @brief Export configuration to JSON
    nlohmann::json ToJson() const;

private:
    YAML::Node root_;

    /// @brief Navigate to a nested node using dot notation
    std::optional<YAML::Node> GetNestedNode(std::string_view key) const;
};

/// @brief Build the effective configuration: file (optional) overlaid by
///        environment variables
/// @param config_path Path to a YAML configuration file
/// @param env_prefix Environment variable prefix
absl::StatusOr<Config> LoadLayeredConfig(
    const std::optional<std::filesystem::path>& config_path = std::nullopt,
    std::string_view env_prefix = "PGLOGSTATS_"
);

}  // namespace pglogstats
