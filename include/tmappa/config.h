#pragma once

#include <tmappa/result.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace tmappa {

class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // Layers, lowest priority first: defaults, config file, TMAPPA_* env, cmdOverrides.
    // An empty configPath falls back to the XDG config file when it exists.
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    // Non-copyable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Get a value by dotted path (e.g., "colour.mutation")
    // Returns nullopt if key doesn't exist or doesn't convert
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    // Path of the config file that was loaded, empty if none
    const std::string& loadedPath() const { return _loadedPath; }

    static std::filesystem::path getXDGConfigPath();

    static constexpr const char* ENV_PREFIX = "TMAPPA_";

    static constexpr const char* KEY_COLOUR_MUTATION = "colour.mutation";
    static constexpr const char* KEY_COLOUR_ROOT_HUE = "colour.root-hue";
    static constexpr const char* KEY_RANDOM_SEED = "random.seed";
    static constexpr const char* KEY_LOG_LEVEL = "log.level";

    float mutation() const;
    float rootHue() const;
    std::optional<uint32_t> seed() const;
    std::string logLevel() const;

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);

    // Override existing keys from TMAPPA_* variables
    void applyEnvOverrides(YAML::Node node, const std::string& prefix);

    YAML::Node getNode(const std::string& path) const;

    // "colour.root-hue" -> "TMAPPA_COLOUR_ROOT_HUE"
    static std::string pathToEnvVar(const std::string& path);

    // Merge YAML nodes (source into target)
    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    std::string _loadedPath;
    YAML::Node _cmdOverrides;
};

template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace tmappa
