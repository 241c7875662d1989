// =================================================================
// include/Kasu/ConfigParser.hpp
// =================================================================
// Defines the YAML configuration file reader.

#pragma once

#include <yaml-cpp/yaml.h>
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace Kasu {

/**
 * @brief Read-only view of a YAML configuration file
 *
 * The file must hold a mapping of option names to scalars or, for pattern
 * lists, sequences. Accessors never throw on a missing or mistyped key.
 */
class ConfigParser {
public:
    /**
     * @brief Construct an empty configuration
     */
    ConfigParser() = default;

    /**
     * @brief Load a configuration file
     * @param config_path The path to the YAML file
     * @throws ConfigError if the file is missing or cannot be parsed
     */
    explicit ConfigParser(const std::string& config_path);

    /**
     * @brief Locate and load the configuration of a run
     *
     * An explicit path must load. Without one, the first existing entry of
     * DEFAULT_CONFIG_FILES is used; if it cannot be parsed a warning is
     * logged and an empty configuration is returned.
     *
     * @param explicit_path Path given with --config, or empty
     * @return Loaded configuration, possibly empty
     * @throws ConfigError if explicit_path cannot be loaded
     */
    static ConfigParser load(const std::string& explicit_path);

    bool isLoaded() const { return !m_source_path.empty(); }

    const std::string& getSourcePath() const { return m_source_path; }

    bool hasKey(const std::string& key) const;

    /**
     * @brief Retrieves a scalar value as a string
     * @param key The configuration key (e.g., "output")
     * @return The value, or nullopt if the key is absent or not a scalar
     */
    std::optional<std::string> getStringValue(const std::string& key) const;

    /**
     * @brief Retrieves a boolean flag
     * @param key The configuration key (e.g., "tree")
     * @return true only if the key holds a true boolean
     */
    bool getBoolValue(const std::string& key) const;

    /**
     * @brief Retrieves an integer value
     * @param key The configuration key (e.g., "head")
     * @return The value, or nullopt if absent or not an integer
     */
    std::optional<long long> getIntValue(const std::string& key) const;

    /**
     * @brief Retrieves a pattern list
     *
     * Accepts a comma-separated string or a sequence of strings; entries are
     * trimmed and empty ones dropped. A sequence holding anything other than
     * strings is rejected with a warning.
     *
     * @param key The configuration key ("glob" or "exclude")
     * @return The patterns, or nullopt if absent or rejected
     */
    std::optional<std::vector<std::string>> getPatternList(const std::string& key) const;

    static constexpr std::array<const char*, 3> DEFAULT_CONFIG_FILES = {
        ".config.yaml",
        ".config.yml",
        ".config"
    };

private:
    YAML::Node m_root;
    std::string m_source_path;

    YAML::Node getNode(const std::string& key) const;
};

} // namespace Kasu
