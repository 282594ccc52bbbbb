/**
 * @file ConfigLoader.cpp
 * @brief Implementation of configuration loading
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#include <Gamebattle/Core/Config.hpp>
#include <Gamebattle/Core/Logger.hpp>

#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <stdlib.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <sstream>

namespace Gamebattle::Config {

// ============================================================================
// Value Helpers
// ============================================================================

EnvironmentLookup processEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

ConfigValue inferValue(const std::string& raw) {
    if (raw == "true") return true;
    if (raw == "false") return false;

    if (!raw.empty()) {
        int64_t integer = 0;
        auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), integer);
        if (ec == std::errc() && ptr == raw.data() + raw.size()) {
            return integer;
        }

        if (raw.find('.') != std::string::npos) {
            char* end = nullptr;
            errno = 0;
            double number = std::strtod(raw.c_str(), &end);
            if (errno == 0 && end == raw.c_str() + raw.size()) {
                return number;
            }
        }
    }

    return raw;
}

std::optional<bool> getBool(const ConfigMap& config, const std::string& key) {
    auto it = config.find(key);
    if (it == config.end()) {
        return std::nullopt;
    }
    if (auto b = std::get_if<bool>(&it->second)) {
        return *b;
    }
    if (auto i = std::get_if<int64_t>(&it->second)) {
        return *i != 0;
    }
    if (auto s = std::get_if<std::string>(&it->second)) {
        std::string lowered = *s;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lowered == "1" || lowered == "yes" || lowered == "on" || lowered == "true";
    }
    return std::nullopt;
}

std::optional<int64_t> getInt(const ConfigMap& config, const std::string& key) {
    auto it = config.find(key);
    if (it == config.end()) {
        return std::nullopt;
    }
    if (auto i = std::get_if<int64_t>(&it->second)) {
        return *i;
    }
    return std::nullopt;
}

std::optional<double> getDouble(const ConfigMap& config, const std::string& key) {
    auto it = config.find(key);
    if (it == config.end()) {
        return std::nullopt;
    }
    if (auto d = std::get_if<double>(&it->second)) {
        return *d;
    }
    if (auto i = std::get_if<int64_t>(&it->second)) {
        return static_cast<double>(*i);
    }
    return std::nullopt;
}

std::optional<std::string> getString(const ConfigMap& config, const std::string& key) {
    auto it = config.find(key);
    if (it == config.end()) {
        return std::nullopt;
    }
    return std::visit([](const auto& value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return value;
        } else if constexpr (std::is_same_v<T, bool>) {
            return value ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(value);
        } else {
            std::ostringstream out;
            out << value;
            return out.str();
        }
    }, it->second);
}

// ============================================================================
// ConfigLoader::Impl
// ============================================================================

class ConfigLoader::Impl {
public:
    Options options;

    explicit Impl(const Options& opts) : options(opts) {}

    Result<std::string> canonicalizePath(const std::string& path) {
        char* resolved = realpath(path.c_str(), nullptr);
        if (!resolved) {
            return errno == ENOENT ? ErrorCode::FileNotFound : ErrorCode::InvalidPath;
        }
        std::string result(resolved);
        free(resolved);
        return result;
    }

    Result<bool> isPathAllowed(const std::string& canonicalPath) {
        if (options.allowed_directory.empty()) {
            return true;
        }

        auto allowedResult = canonicalizePath(options.allowed_directory);
        if (allowedResult.isFailure()) {
            return allowedResult.error();
        }

        std::string allowed = allowedResult.value();
        if (allowed.back() != '/') {
            allowed.push_back('/');
        }

        return canonicalPath.compare(0, allowed.length(), allowed) == 0;
    }

    Result<ByteBuffer> readFileSecurely(const std::string& path) {
        auto canonResult = canonicalizePath(path);
        if (canonResult.isFailure()) {
            return canonResult.error();
        }
        const std::string& canonPath = canonResult.value();

        auto allowedResult = isPathAllowed(canonPath);
        if (allowedResult.isFailure()) {
            return allowedResult.error();
        }
        if (!allowedResult.value()) {
            return ErrorCode::AccessDenied;
        }

        int fd = open(canonPath.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
        if (fd < 0) {
            return ErrorCode::FileNotFound;
        }

        struct stat st;
        if (fstat(fd, &st) < 0) {
            close(fd);
            return ErrorCode::IOError;
        }

        if (!S_ISREG(st.st_mode)) {
            close(fd);
            return ErrorCode::InvalidPath;
        }

        if (static_cast<size_t>(st.st_size) > options.max_file_size) {
            close(fd);
            return ErrorCode::FileTooLarge;
        }

        ByteBuffer data(static_cast<size_t>(st.st_size));
        size_t offset = 0;
        while (offset < data.size()) {
            ssize_t n = read(fd, data.data() + offset, data.size() - offset);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                break;
            }
            offset += static_cast<size_t>(n);
        }
        close(fd);

        if (offset != data.size()) {
            return ErrorCode::IOError;
        }

        return data;
    }

    Result<ConfigMap> parseConfig(ByteSpan data) {
        ConfigMap config;

        std::string content(reinterpret_cast<const char*>(data.data()), data.size());
        std::istringstream stream(content);
        std::string line;
        size_t lineNumber = 0;

        while (std::getline(stream, line)) {
            ++lineNumber;

            size_t start = line.find_first_not_of(" \t");
            if (start == std::string::npos || line[start] == '#' || line[start] == ';') {
                continue;
            }

            size_t pos = line.find('=');
            if (pos == std::string::npos) {
                GAMEBATTLE_LOG_WARNING_F("Ignoring config line %zu without '='", lineNumber);
                continue;
            }

            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);

            key.erase(0, key.find_first_not_of(" \t"));
            key.erase(key.find_last_not_of(" \t") + 1);
            value.erase(0, value.find_first_not_of(" \t"));
            value.erase(value.find_last_not_of(" \t\r\n") + 1);

            if (key.empty()) {
                return ErrorCode::InvalidFormat;
            }

            config[key] = inferValue(value);
        }

        return config;
    }
};

// ============================================================================
// ConfigLoader - Public API
// ============================================================================

ConfigLoader::ConfigLoader(const Options& options)
    : m_impl(std::make_unique<Impl>(options)) {}

ConfigLoader::~ConfigLoader() = default;

Result<ConfigMap> ConfigLoader::load(const std::string& path) {
    auto dataResult = m_impl->readFileSecurely(path);
    if (dataResult.isFailure()) {
        GAMEBATTLE_LOG_ERROR_F("Failed to read config %s: %s", path.c_str(),
                               std::string(getErrorMessage(dataResult.error())).c_str());
        return dataResult.error();
    }

    return loadFromMemory(dataResult.value());
}

Result<ConfigMap> ConfigLoader::loadFromMemory(ByteSpan data) {
    return m_impl->parseConfig(data);
}

size_t ConfigLoader::applyEnvironment(ConfigMap& config,
                                      const std::map<std::string, std::string>& bindings,
                                      const EnvironmentLookup& env) {
    size_t applied = 0;
    for (const auto& [variable, key] : bindings) {
        auto value = env(variable);
        if (!value || value->empty()) {
            continue;
        }
        config[key] = inferValue(*value);
        ++applied;
    }
    return applied;
}

} // namespace Gamebattle::Config
