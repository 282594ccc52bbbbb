/**
 * @file GameCatalog.cpp
 * @brief Games directory loading
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#include <Gamebattle/Orchestrator/GameCatalog.hpp>
#include <Gamebattle/Core/Logger.hpp>
#include <nlohmann/json.hpp>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace Gamebattle::Orchestrator {

using json = nlohmann::json;
namespace fs = std::filesystem;

std::string gameIdForEmail(const std::string& email) {
    return email.substr(0, email.find('@'));
}

Result<GameArtifact> parseGameIndex(const std::string& text, const std::string& baseDirectory) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        GAMEBATTLE_LOG_WARNING_F("Malformed game index: %s", e.what());
        return ErrorCode::JsonParseFailed;
    }

    try {
        if (!doc.is_object() || !doc.contains("email") || !doc.contains("name")) {
            return ErrorCode::InvalidFormat;
        }

        GameArtifact artifact;
        artifact.authorEmail = doc.at("email").get<std::string>();
        artifact.id = gameIdForEmail(artifact.authorEmail);
        artifact.name = doc.at("name").get<std::string>();
        artifact.author = doc.value("author", artifact.id);
        artifact.workingDirectory = baseDirectory;

        if (artifact.id.empty()) {
            return ErrorCode::InvalidFormat;
        }

        std::string kind = doc.value("kind", std::string(doc.contains("image") ? "container" : "executable"));
        if (kind == "container") {
            artifact.kind = ArtifactKind::Container;
            std::string folder = artifact.id;
            for (auto& c : folder) {
                c = (c == ' ') ? '-' : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            artifact.image = doc.value("image", "gamebattle-" + folder);
        } else if (kind == "executable") {
            artifact.kind = ArtifactKind::Executable;
            if (doc.contains("command")) {
                artifact.command = doc.at("command").get<std::vector<std::string>>();
            } else if (doc.contains("file")) {
                artifact.command = {(fs::path(baseDirectory) / doc.at("file").get<std::string>()).string()};
            }
            if (artifact.command.empty()) {
                return ErrorCode::InvalidFormat;
            }
        } else {
            return ErrorCode::InvalidFormat;
        }

        if (doc.contains("exitCodes")) {
            for (const auto& [code, result] : doc.at("exitCodes").items()) {
                artifact.scoring.exitCodeResults[std::stoi(code)] = result.get<std::string>();
            }
        }
        if (doc.contains("scoring")) {
            for (const auto& [result, points] : doc.at("scoring").items()) {
                artifact.scoring.points[result] = points.get<int64_t>();
            }
        }

        return artifact;

    } catch (const json::exception& e) {
        GAMEBATTLE_LOG_WARNING_F("Invalid game index: %s", e.what());
        return ErrorCode::InvalidFormat;
    } catch (const std::logic_error& e) {
        // std::stoi on a non-numeric exit code
        GAMEBATTLE_LOG_WARNING_F("Invalid exit code in game index: %s", e.what());
        return ErrorCode::InvalidFormat;
    }
}

// ============================================================================
// DirectoryGameCatalog
// ============================================================================

DirectoryGameCatalog::DirectoryGameCatalog(std::string directory)
    : m_directory(std::move(directory)) {
}

Result<size_t> DirectoryGameCatalog::reload() {
    std::error_code ec;
    if (!fs::is_directory(m_directory, ec)) {
        GAMEBATTLE_LOG_ERROR_F("Games directory %s does not exist", m_directory.c_str());
        return ErrorCode::FileNotFound;
    }

    std::map<GameId, GameArtifact> games;
    for (const auto& entry : fs::directory_iterator(m_directory, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }

        std::ifstream file(entry.path());
        std::stringstream contents;
        contents << file.rdbuf();

        auto artifact = parseGameIndex(contents.str(), fs::absolute(m_directory).string());
        if (artifact.isFailure()) {
            GAMEBATTLE_LOG_WARNING_F("Skipping game index %s", entry.path().c_str());
            continue;
        }

        auto id = artifact.value().id;
        if (games.count(id) != 0) {
            GAMEBATTLE_LOG_WARNING_F("Duplicate game id %s in %s", id.c_str(), entry.path().c_str());
            continue;
        }
        games.emplace(id, std::move(artifact).value());
    }

    if (ec) {
        return ErrorCode::IOError;
    }

    size_t count = games.size();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_games = std::move(games);
    }

    GAMEBATTLE_LOG_INFO_F("Loaded %zu games from %s", count, m_directory.c_str());
    return count;
}

Result<GameArtifact> DirectoryGameCatalog::resolve(const GameId& gameId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_games.find(gameId);
    if (it == m_games.end()) {
        return ErrorCode::ArtifactNotFound;
    }
    return it->second;
}

std::vector<GameArtifact> DirectoryGameCatalog::list() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<GameArtifact> games;
    games.reserve(m_games.size());
    for (const auto& [id, artifact] : m_games) {
        games.push_back(artifact);
    }
    return games;
}

// ============================================================================
// MemoryGameCatalog
// ============================================================================

void MemoryGameCatalog::add(GameArtifact artifact) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto id = artifact.id;
    m_games[id] = std::move(artifact);
}

Result<GameArtifact> MemoryGameCatalog::resolve(const GameId& gameId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_games.find(gameId);
    if (it == m_games.end()) {
        return ErrorCode::ArtifactNotFound;
    }
    return it->second;
}

std::vector<GameArtifact> MemoryGameCatalog::list() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<GameArtifact> games;
    for (const auto& [id, artifact] : m_games) {
        games.push_back(artifact);
    }
    return games;
}

} // namespace Gamebattle::Orchestrator
