// =================================================================
// src/Kasu/ConfigParser.cpp
// =================================================================
// Implementation for the YAML configuration file reader.

#include "Kasu/ConfigParser.hpp"
#include "Kasu/Errors.hpp"
#include "Kasu/Logger.hpp"
#include <filesystem>
#include <system_error>

namespace Kasu {

// Helper function to trim whitespace from both ends of a string.
static std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\n\r");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, (last - first + 1));
}

ConfigParser::ConfigParser(const std::string& config_path) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        throw ConfigError("Config file not found: " + config_path);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Error parsing config file " + config_path + ": " + e.what());
    }

    if (root.IsNull()) {
        // An empty file configures nothing
        m_source_path = config_path;
        return;
    }
    if (!root.IsMap()) {
        throw ConfigError("Config file " + config_path + " must contain a mapping of options");
    }

    m_root = root;
    m_source_path = config_path;
}

ConfigParser ConfigParser::load(const std::string& explicit_path) {
    if (!explicit_path.empty()) {
        ConfigParser parser(explicit_path);
        Logger::getInstance().info("ConfigParser", "Loaded config from: " + explicit_path);
        return parser;
    }

    for (const char* candidate : DEFAULT_CONFIG_FILES) {
        std::error_code ec;
        if (!std::filesystem::exists(candidate, ec)) {
            continue;
        }
        try {
            ConfigParser parser(candidate);
            Logger::getInstance().info("ConfigParser", std::string("Loaded config from: ") + candidate);
            return parser;
        } catch (const ConfigError& e) {
            Logger::getInstance().warning("ConfigParser", e.what());
        }
    }

    return ConfigParser();
}

YAML::Node ConfigParser::getNode(const std::string& key) const {
    if (!m_root || !m_root.IsMap()) {
        return YAML::Node();
    }
    const YAML::Node& root = m_root;
    return root[key];
}

bool ConfigParser::hasKey(const std::string& key) const {
    YAML::Node node = getNode(key);
    return node.IsDefined() && !node.IsNull();
}

std::optional<std::string> ConfigParser::getStringValue(const std::string& key) const {
    YAML::Node node = getNode(key);
    if (!node.IsDefined() || !node.IsScalar()) {
        return std::nullopt;
    }
    return node.as<std::string>();
}

bool ConfigParser::getBoolValue(const std::string& key) const {
    YAML::Node node = getNode(key);
    if (!node.IsDefined() || !node.IsScalar()) {
        return false;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::BadConversion&) {
        Logger::getInstance().warning("ConfigParser", "Ignoring non-boolean value for '" + key + "'");
        return false;
    }
}

std::optional<long long> ConfigParser::getIntValue(const std::string& key) const {
    YAML::Node node = getNode(key);
    if (!node.IsDefined() || !node.IsScalar()) {
        return std::nullopt;
    }
    try {
        return node.as<long long>();
    } catch (const YAML::BadConversion&) {
        Logger::getInstance().warning("ConfigParser", "Ignoring non-integer value for '" + key + "'");
        return std::nullopt;
    }
}

std::optional<std::vector<std::string>> ConfigParser::getPatternList(const std::string& key) const {
    YAML::Node node = getNode(key);
    if (!node.IsDefined() || node.IsNull()) {
        return std::nullopt;
    }

    std::vector<std::string> patterns;

    if (node.IsScalar()) {
        std::string joined = node.as<std::string>();
        size_t start = 0;
        while (start <= joined.size()) {
            size_t comma = joined.find(',', start);
            if (comma == std::string::npos) {
                comma = joined.size();
            }
            std::string pattern = trim(joined.substr(start, comma - start));
            if (!pattern.empty()) {
                patterns.push_back(pattern);
            }
            start = comma + 1;
        }
        return patterns;
    }

    if (node.IsSequence()) {
        for (const auto& entry : node) {
            // YAML has no string tag on plain scalars; reject nested structures
            if (!entry.IsScalar()) {
                Logger::getInstance().warning("ConfigParser",
                    "Invalid " + key + " patterns in config file (must be strings)");
                return std::nullopt;
            }
            std::string pattern = trim(entry.as<std::string>());
            if (!pattern.empty()) {
                patterns.push_back(pattern);
            }
        }
        return patterns;
    }

    Logger::getInstance().warning("ConfigParser",
        "Invalid " + key + " patterns in config file (must be a string or a list)");
    return std::nullopt;
}

} // namespace Kasu
