/**
 * @file test_config_loader.cpp
 * @brief Unit tests for configuration loading and orchestrator settings
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 *
 * Covers:
 * - key = value parsing and value inference
 * - Directory restriction and size limits
 * - Environment overlay
 * - OrchestratorConfig conversion and validation
 */

#include <Gamebattle/Core/Config.hpp>
#include <Gamebattle/Orchestrator/OrchestratorConfig.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <map>

using namespace Gamebattle;
using namespace Gamebattle::Config;
using namespace Gamebattle::Orchestrator;
using namespace Gamebattle::Testing;

namespace fs = std::filesystem;

namespace {

EnvironmentLookup fakeEnvironment(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

} // namespace

class ConfigLoaderTest : public ::testing::Test {
protected:
    TempDirectory dir;
};

// ============================================================================
// Parsing
// ============================================================================

TEST_F(ConfigLoaderTest, BasicLoad) {
    std::string path = dir.write("orchestrator.conf",
        "# orchestrator settings\n"
        "games_path = /srv/games\n"
        "  listen_port=9090  \n"
        "; legacy comment\n"
        "enable_competition = true\n"
        "sandbox_cpu_fraction = 0.25\n"
        "line without separator\n");

    ConfigLoader loader;
    auto result = loader.load(path);
    ASSERT_RESULT_OK(result);

    const auto& config = result.value();
    EXPECT_EQ(config.size(), 4u);
    EXPECT_EQ(getString(config, "games_path"), "/srv/games");
    EXPECT_EQ(getInt(config, "listen_port"), 9090);
    EXPECT_EQ(getBool(config, "enable_competition"), true);
    EXPECT_DOUBLE_EQ(getDouble(config, "sandbox_cpu_fraction").value(), 0.25);
}

TEST_F(ConfigLoaderTest, LoadFromMemory) {
    ConfigLoader loader;
    auto result = loader.loadFromMemory(asBytes("log_level = debug\r\nretention_ms = 1000\r\n"));
    ASSERT_RESULT_OK(result);

    EXPECT_EQ(getString(result.value(), "log_level"), "debug");
    EXPECT_EQ(getInt(result.value(), "retention_ms"), 1000);
}

TEST_F(ConfigLoaderTest, EmptyKeyIsRejected) {
    ConfigLoader loader;
    auto result = loader.loadFromMemory(asBytes(" = orphan\n"));
    EXPECT_RESULT_ERROR(result, ErrorCode::InvalidFormat);
}

TEST_F(ConfigLoaderTest, InferValue) {
    EXPECT_EQ(std::get<bool>(inferValue("true")), true);
    EXPECT_EQ(std::get<bool>(inferValue("false")), false);
    EXPECT_EQ(std::get<int64_t>(inferValue("-42")), -42);
    EXPECT_DOUBLE_EQ(std::get<double>(inferValue("3.5")), 3.5);
    EXPECT_EQ(std::get<std::string>(inferValue("8080x")), "8080x");
    EXPECT_EQ(std::get<std::string>(inferValue("")), "");
}

TEST_F(ConfigLoaderTest, TypedAccessors) {
    ConfigMap config;
    config["flag"] = std::string("Yes");
    config["count"] = int64_t{7};
    config["name"] = std::string("arena");

    EXPECT_EQ(getBool(config, "flag"), true);
    EXPECT_EQ(getBool(config, "count"), true);
    EXPECT_FALSE(getInt(config, "name").has_value());
    EXPECT_DOUBLE_EQ(getDouble(config, "count").value(), 7.0);
    EXPECT_EQ(getString(config, "count"), "7");
    EXPECT_FALSE(getString(config, "missing").has_value());
}

// ============================================================================
// File Safety
// ============================================================================

TEST_F(ConfigLoaderTest, MissingFile) {
    ConfigLoader loader;
    auto result = loader.load(dir.path() + "/absent.conf");
    EXPECT_RESULT_ERROR(result, ErrorCode::FileNotFound);
}

TEST_F(ConfigLoaderTest, SizeLimit) {
    std::string path = dir.write("large.conf", "key = " + std::string(2048, 'v') + "\n");

    ConfigLoader::Options options;
    options.max_file_size = 1024;
    ConfigLoader loader(options);

    auto result = loader.load(path);
    EXPECT_RESULT_ERROR(result, ErrorCode::FileTooLarge);
}

TEST_F(ConfigLoaderTest, DirectoryRestriction) {
    fs::create_directories(dir.path() + "/allowed");
    std::string inside = dir.write("allowed/ok.conf", "key = value\n");
    std::string outside = dir.write("outside.conf", "key = value\n");

    ConfigLoader::Options options;
    options.allowed_directory = dir.path() + "/allowed";
    ConfigLoader loader(options);

    ASSERT_TRUE(loader.load(inside).isSuccess());
    EXPECT_RESULT_ERROR(loader.load(outside), ErrorCode::AccessDenied);
}

TEST_F(ConfigLoaderTest, PathTraversalBlocked) {
    fs::create_directories(dir.path() + "/allowed");
    dir.write("secret.conf", "key = value\n");

    ConfigLoader::Options options;
    options.allowed_directory = dir.path() + "/allowed";
    ConfigLoader loader(options);

    auto result = loader.load(dir.path() + "/allowed/../secret.conf");
    EXPECT_RESULT_ERROR(result, ErrorCode::AccessDenied);
}

TEST_F(ConfigLoaderTest, SymlinkOutsideAllowedDirectoryIsDenied) {
    fs::create_directories(dir.path() + "/allowed");
    std::string target = dir.write("target.conf", "key = value\n");
    fs::create_symlink(target, dir.path() + "/allowed/link.conf");

    ConfigLoader::Options options;
    options.allowed_directory = dir.path() + "/allowed";
    ConfigLoader loader(options);

    EXPECT_RESULT_ERROR(loader.load(dir.path() + "/allowed/link.conf"), ErrorCode::AccessDenied);
}

// ============================================================================
// Environment Overlay
// ============================================================================

TEST_F(ConfigLoaderTest, ApplyEnvironment) {
    ConfigMap config;
    config["listen_port"] = int64_t{8080};
    config["log_level"] = std::string("info");

    std::map<std::string, std::string> bindings = {
        {"LISTEN_PORT", "listen_port"},
        {"LOG_LEVEL", "log_level"},
        {"LOG_FILE", "log_file"},
    };
    auto env = fakeEnvironment({{"LISTEN_PORT", "9000"}, {"LOG_LEVEL", ""}});

    size_t applied = ConfigLoader::applyEnvironment(config, bindings, env);

    EXPECT_EQ(applied, 1u);
    EXPECT_EQ(getInt(config, "listen_port"), 9000);
    EXPECT_EQ(getString(config, "log_level"), "info");
    EXPECT_EQ(config.count("log_file"), 0u);
}

// ============================================================================
// OrchestratorConfig
// ============================================================================

TEST_F(ConfigLoaderTest, OrchestratorDefaultsAreValid) {
    auto config = OrchestratorConfig::load("", fakeEnvironment({}));
    ASSERT_RESULT_OK(config);

    EXPECT_EQ(config.value().maxSessionsPerUser, 1u);
    EXPECT_FALSE(config.value().competitionEnabled);
    EXPECT_EQ(config.value().storeBackend, StoreBackend::Memory);
}

TEST_F(ConfigLoaderTest, OrchestratorFileAndEnvironment) {
    std::string path = dir.write("orchestrator.conf",
        "games_path = /srv/games\n"
        "max_sessions_per_user = 2\n"
        "detached_output_policy = drop\n"
        "transport = pipe\n"
        "disconnect_grace_ms = 1500\n"
        "sandbox_lifetime_seconds = 120\n");

    auto env = fakeEnvironment({
        {"ENABLE_COMPETITION", "yes"},
        {"ADMIN_EMAILS", "judge@example.edu, chair@example.edu"},
        {"MAX_SESSIONS_PER_USER", "3"},
        {"REPORT_WEBHOOK", "http://127.0.0.1:9/hook"},
    });

    auto result = OrchestratorConfig::load(path, env);
    ASSERT_RESULT_OK(result);
    const auto& config = result.value();

    EXPECT_EQ(config.gamesPath, "/srv/games");
    EXPECT_EQ(config.maxSessionsPerUser, 3u);
    EXPECT_EQ(config.detachedPolicy, DetachedOutputPolicy::DropWithMarker);
    EXPECT_EQ(config.transport, ChannelTransport::Pipe);
    EXPECT_EQ(config.disconnectGrace, Milliseconds(1500));
    EXPECT_EQ(config.limits.wallClock, Seconds(120));
    EXPECT_TRUE(config.competitionEnabled);
    EXPECT_EQ(config.webhookUrl, "http://127.0.0.1:9/hook");
    EXPECT_TRUE(config.isAdmin("judge@example.edu"));
    EXPECT_TRUE(config.isAdmin("chair@example.edu"));
    EXPECT_FALSE(config.isAdmin("student@example.edu"));
}

TEST_F(ConfigLoaderTest, AdminListAcceptsJsonArray) {
    ConfigMap map;
    map["admin_ids"] = std::string(R"(["a@example.edu","b@example.edu"])");

    auto config = OrchestratorConfig::fromConfigMap(map);
    ASSERT_RESULT_OK(config);
    EXPECT_EQ(config.value().adminIds.size(), 2u);
    EXPECT_TRUE(config.value().isAdmin("b@example.edu"));
}

TEST_F(ConfigLoaderTest, OrchestratorRejectsBadValues) {
    {
        ConfigMap map;
        map["max_sessions_per_user"] = int64_t{0};
        EXPECT_RESULT_ERROR(OrchestratorConfig::fromConfigMap(map), ErrorCode::ConfigInvalid);
    }
    {
        ConfigMap map;
        map["detached_output_policy"] = std::string("keep-everything");
        EXPECT_RESULT_ERROR(OrchestratorConfig::fromConfigMap(map), ErrorCode::ConfigInvalid);
    }
    {
        ConfigMap map;
        map["stop_grace_ms"] = int64_t{-5};
        EXPECT_RESULT_ERROR(OrchestratorConfig::fromConfigMap(map), ErrorCode::ConfigInvalid);
    }
    {
        ConfigMap map;
        map["listen_port"] = int64_t{70000};
        EXPECT_RESULT_ERROR(OrchestratorConfig::fromConfigMap(map), ErrorCode::ConfigInvalid);
    }
    {
        ConfigMap map;
        map["games_path"] = std::string("");
        EXPECT_RESULT_ERROR(OrchestratorConfig::fromConfigMap(map), ErrorCode::ConfigMissing);
    }
}
