#include <tmappa/config.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <utility>
#include <vector>

namespace tmappa {

namespace {

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

} // namespace

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _config(YAML::NodeType::Map), _configPath(configPath), _cmdOverrides(cmdOverrides) {}

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Result<void> Config::init() noexcept {
    try {
        loadDefaults();

        std::string effectivePath = _configPath;
        if (effectivePath.empty()) {
            auto xdgPath = getXDGConfigPath();
            std::error_code ec;
            if (std::filesystem::exists(xdgPath, ec)) {
                effectivePath = xdgPath.string();
            }
        }

        if (!effectivePath.empty()) {
            if (auto res = loadFile(effectivePath); !res) {
                spdlog::warn("Failed to load config file {}: {}", effectivePath, error_msg(res));
            } else {
                spdlog::info("Loaded config from: {}", effectivePath);
                _loadedPath = effectivePath;
            }
        }

        applyEnvOverrides(_config, "");

        if (_cmdOverrides && _cmdOverrides.IsMap()) {
            mergeNodes(_config, _cmdOverrides);
        }
    } catch (const YAML::Exception& e) {
        return Err("YAML error: " + std::string(e.what()));
    }
    return Ok();
}

void Config::loadDefaults() {
    _config["colour"]["mutation"] = 0.5f;
    _config["colour"]["root-hue"] = 0.0f;
    _config["random"]["seed"] = YAML::Node(YAML::NodeType::Null);
    _config["log"]["level"] = "info";
}

Result<void> Config::loadFile(const std::string& path) {
    try {
        YAML::Node fileConfig = YAML::LoadFile(path);
        if (!fileConfig || fileConfig.IsNull()) {
            return Ok();
        }
        if (!fileConfig.IsMap()) {
            return Err("top level of " + path + " must be a map");
        }
        mergeNodes(_config, fileConfig);
        return Ok();
    } catch (const YAML::BadFile&) {
        return Err("Cannot open config file: " + path);
    } catch (const YAML::Exception& e) {
        return Err("YAML parse error: " + std::string(e.what()));
    }
}

void Config::applyEnvOverrides(YAML::Node node, const std::string& prefix) {
    std::vector<std::string> keys;
    for (auto it = node.begin(); it != node.end(); ++it) {
        keys.push_back(it->first.as<std::string>());
    }

    for (const auto& key : keys) {
        std::string fullPath = prefix.empty() ? key : prefix + "." + key;
        YAML::Node child = node[key];
        if (child.IsMap()) {
            applyEnvOverrides(child, fullPath);
            continue;
        }

        std::string envVar = pathToEnvVar(fullPath);
        if (const char* val = std::getenv(envVar.c_str())) {
            node[key] = std::string(val);
            spdlog::debug("Config override from env: {}={}", envVar, val);
        }
    }
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

YAML::Node Config::getNode(const std::string& path) const {
    YAML::Node current;
    current.reset(_config);
    for (const auto& part : splitPath(path)) {
        if (!current.IsMap()) return YAML::Node();
        // Const lookup so a missing key is not inserted
        const YAML::Node& lookup = current;
        YAML::Node next = lookup[part];
        if (!next) return YAML::Node();
        current.reset(next);
    }
    return current;
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        YAML::Node existing = target[key];
        if (it->second.IsMap() && existing.IsMap()) {
            mergeNodes(existing, it->second);
        } else {
            target[key] = YAML::Clone(it->second);
        }
    }
}

float Config::mutation() const {
    return get<float>(KEY_COLOUR_MUTATION, 0.5f);
}

float Config::rootHue() const {
    return get<float>(KEY_COLOUR_ROOT_HUE, 0.0f);
}

std::optional<uint32_t> Config::seed() const {
    return get<uint32_t>(KEY_RANDOM_SEED);
}

std::string Config::logLevel() const {
    return get<std::string>(KEY_LOG_LEVEL, "info");
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;

#ifdef _WIN32
    const char* appData = std::getenv("APPDATA");
    configDir = (appData && appData[0] != '\0') ? appData : ".";
#else
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            configDir = std::filesystem::path(home) / ".config";
        } else {
            configDir = "/tmp";
        }
    }
#endif

    return configDir / "tmappa" / "config.yaml";
}

} // namespace tmappa
