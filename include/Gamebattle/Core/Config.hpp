/**
 * @file Config.hpp
 * @brief Configuration file loading for the Gamebattle orchestrator
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 *
 * Loads `key = value` configuration files with protection against:
 * - TOCTOU (Time-Of-Check-To-Time-Of-Use) races
 * - Path traversal outside an allowed directory
 * - Symlink substitution
 * - Oversized files
 *
 * Environment variables are overlaid on top of the file contents.
 */

#pragma once

#ifndef GAMEBATTLE_CORE_CONFIG_HPP
#define GAMEBATTLE_CORE_CONFIG_HPP

#include <Gamebattle/Core/Types.hpp>
#include <Gamebattle/Core/ErrorCodes.hpp>
#include <string>
#include <map>
#include <memory>
#include <optional>
#include <variant>
#include <functional>

namespace Gamebattle::Config {

using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string
>;

using ConfigMap = std::map<std::string, ConfigValue>;

/// Environment lookup; returns nullopt for unset variables
using EnvironmentLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Lookup backed by getenv
EnvironmentLookup processEnvironment();

/**
 * @brief Infer the typed value of a raw setting
 *
 * "true"/"false" become bool, integers become int64_t, decimals become
 * double and everything else stays a string.
 */
ConfigValue inferValue(const std::string& raw);

/// Read a bool setting; strings "1", "yes", "on" and "true" count as true
std::optional<bool> getBool(const ConfigMap& config, const std::string& key);

/// Read an integer setting
std::optional<int64_t> getInt(const ConfigMap& config, const std::string& key);

/// Read a floating-point setting (integers are widened)
std::optional<double> getDouble(const ConfigMap& config, const std::string& key);

/// Read a setting as text, whatever its inferred type
std::optional<std::string> getString(const ConfigMap& config, const std::string& key);

/**
 * @brief Configuration loader
 *
 * The file is opened once and measured on the open descriptor, so the
 * checked file is the file that is read.
 */
struct ConfigLoaderOptions {
    size_t max_file_size = 1024 * 1024;  // 1MB default
    std::string allowed_directory;       // Restrict to directory
};

class ConfigLoader {
public:
    using Options = ConfigLoaderOptions;

    explicit ConfigLoader(const Options& options = {});
    ~ConfigLoader();

    /**
     * @brief Load configuration from file
     * @param path Path to configuration file
     * @return Parsed configuration or error
     */
    Result<ConfigMap> load(const std::string& path);

    /**
     * @brief Parse configuration from memory
     * @param data Configuration text
     * @return Parsed configuration or error
     */
    Result<ConfigMap> loadFromMemory(ByteSpan data);

    /**
     * @brief Overlay environment variables onto a configuration
     * @param config Configuration to update
     * @param bindings Environment variable name to config key
     * @param env Environment lookup
     * @return Number of keys overridden
     */
    static size_t applyEnvironment(ConfigMap& config,
                                   const std::map<std::string, std::string>& bindings,
                                   const EnvironmentLookup& env);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Gamebattle::Config

#endif // GAMEBATTLE_CORE_CONFIG_HPP
