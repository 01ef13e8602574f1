#include "common/config.h"

#include <cstdlib>
#include <functional>
#include <type_traits>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "common/logging.h"

namespace pglogstats {

namespace {

/// Environment variable suffix -> config key, value kind
struct EnvBinding {
    const char* suffix;
    const char* key;
    enum class Kind { kString, kInt, kDouble } kind;
};

constexpr EnvBinding kEnvBindings[] = {
    {"SAMPLE_SIZE", "input.sample_size", EnvBinding::Kind::kInt},
    {"JOBS", "input.jobs", EnvBinding::Kind::kInt},
    {"OUTPUT_FORMAT", "output.format", EnvBinding::Kind::kString},
    {"LOG_LEVEL", "logging.level", EnvBinding::Kind::kString},
    {"SLOW_QUERY_THRESHOLD_MS", "analysis.slow_query_threshold_ms", EnvBinding::Kind::kDouble},
};

nlohmann::json YamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& kv : node) {
                object[kv.first.as<std::string>()] = YamlToJson(kv.second);
            }
            return object;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(YamlToJson(item));
            }
            return array;
        }
        case YAML::NodeType::Scalar: {
            const std::string& text = node.Scalar();
            int64_t as_int = 0;
            double as_double = 0.0;
            if (absl::SimpleAtoi(text, &as_int)) return as_int;
            if (absl::SimpleAtod(text, &as_double)) return as_double;
            if (text == "true") return true;
            if (text == "false") return false;
            return text;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
        default:
            return nullptr;
    }
}

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
            absl::StrCat("Failed to parse YAML configuration ", path.string(), ": ", e.what()));
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

absl::StatusOr<Config> Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    for (const auto& binding : kEnvBindings) {
        const std::string name = absl::StrCat(prefix, binding.suffix);
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            continue;
        }

        switch (binding.kind) {
            case EnvBinding::Kind::kString:
                config.Set(binding.key, std::string(value));
                break;
            case EnvBinding::Kind::kInt: {
                int64_t parsed = 0;
                if (!absl::SimpleAtoi(value, &parsed)) {
                    return absl::InvalidArgumentError(
                        absl::StrCat(name, " must be an integer, got '", value, "'"));
                }
                config.Set(binding.key, parsed);
                break;
            }
            case EnvBinding::Kind::kDouble: {
                double parsed = 0.0;
                if (!absl::SimpleAtod(value, &parsed)) {
                    return absl::InvalidArgumentError(
                        absl::StrCat(name, " must be a number, got '", value, "'"));
                }
                config.Set(binding.key, parsed);
                break;
            }
        }
        PGLOGSTATS_LOG_DEBUG("Environment override {} -> {}", name, binding.key);
    }

    return config;
}

void Config::Merge(const Config& other) {
    std::function<void(YAML::Node&, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node& base, const YAML::Node& overlay) {
        if (!overlay.IsMap()) {
            return;
        }
        for (const auto& kv : overlay) {
            const std::string key = kv.first.as<std::string>();
            if (base[key] && base[key].IsMap() && kv.second.IsMap()) {
                YAML::Node base_child = base[key];
                merge_nodes(base_child, kv.second);
            } else {
                base[key] = YAML::Clone(kv.second);
            }
        }
    };

    if (!root_ || root_.IsNull()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }
    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(key, '.');
    YAML::Node current = YAML::Clone(root_);

    for (const auto& part : parts) {
        if (!current.IsMap()) {
            return std::nullopt;
        }
        const YAML::Node& parent = current;
        YAML::Node child = parent[part];
        if (!child) {
            return std::nullopt;
        }
        current.reset(child);
    }

    if (current.IsNull()) {
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
    auto value = GetIntStrict(key);
    if (value.ok() && value->has_value()) {
        return **value;
    }
    return default_value;
}

double Config::GetDouble(std::string_view key, double default_value) const {
    auto value = GetDoubleStrict(key);
    if (value.ok() && value->has_value()) {
        return **value;
    }
    return default_value;
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    auto value = GetBoolStrict(key);
    if (value.ok() && value->has_value()) {
        return **value;
    }
    return default_value;
}

absl::StatusOr<std::optional<int64_t>> Config::GetIntStrict(std::string_view key) const {
    auto node = GetNestedNode(key);
    if (!node) {
        return std::optional<int64_t>();
    }
    int64_t value = 0;
    if (!node->IsScalar() || !absl::SimpleAtoi(node->Scalar(), &value)) {
        return absl::InvalidArgumentError(absl::StrCat("'", key, "' must be an integer"));
    }
    return std::optional<int64_t>(value);
}

absl::StatusOr<std::optional<double>> Config::GetDoubleStrict(std::string_view key) const {
    auto node = GetNestedNode(key);
    if (!node) {
        return std::optional<double>();
    }
    double value = 0.0;
    if (!node->IsScalar() || !absl::SimpleAtod(node->Scalar(), &value)) {
        return absl::InvalidArgumentError(absl::StrCat("'", key, "' must be a number"));
    }
    return std::optional<double>(value);
}

absl::StatusOr<std::optional<bool>> Config::GetBoolStrict(std::string_view key) const {
    auto node = GetNestedNode(key);
    if (!node) {
        return std::optional<bool>();
    }
    bool value = false;
    if (!node->IsScalar() || !absl::SimpleAtob(node->Scalar(), &value)) {
        return absl::InvalidArgumentError(absl::StrCat("'", key, "' must be a boolean"));
    }
    return std::optional<bool>(value);
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

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(key, '.');

    if (!root_ || !root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    // reset() rebinds the handle; plain assignment would overwrite the node
    YAML::Node current;
    current.reset(root_);
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!current[parts[i]].IsMap()) {
            current[parts[i]] = YAML::Node(YAML::NodeType::Map);
        }
        YAML::Node child = current[parts[i]];
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
        } else {
            current[parts.back()] = val;
        }
    }, value);
}

nlohmann::json Config::ToJson() const {
    return YamlToJson(root_);
}

absl::StatusOr<Config> LoadLayeredConfig(
    const std::optional<std::filesystem::path>& config_path,
    std::string_view env_prefix
) {
    Config config;

    if (config_path.has_value()) {
        auto file_config = Config::LoadFromFile(*config_path);
        if (!file_config.ok()) {
            return file_config.status();
        }
        config.Merge(*file_config);
        PGLOGSTATS_LOG_INFO("Loaded configuration from {}", config_path->string());
    }

    auto env_config = Config::LoadFromEnvironment(env_prefix);
    if (!env_config.ok()) {
        return env_config.status();
    }
    config.Merge(*env_config);

    return config;
}

}  // namespace pglogstats
