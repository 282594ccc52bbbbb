/**
 * @file AccessGate.cpp
 * @brief Header-based caller identification
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#include <Gamebattle/Orchestrator/AccessGate.hpp>

#include <algorithm>
#include <cctype>

namespace Gamebattle::Orchestrator {

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

} // namespace

HeaderAccessGate::HeaderAccessGate(std::shared_ptr<const OrchestratorConfig> config)
    : m_config(std::move(config)) {
}

Result<Identity> HeaderAccessGate::identify(const Network::HttpHeaders& headers) const {
    for (const auto& [name, value] : headers) {
        if (!equalsIgnoreCase(name, m_config->userHeader)) {
            continue;
        }
        std::string userId = trim(value);
        if (userId.empty()) {
            break;
        }
        return Identity{userId, m_config->isAdmin(userId)};
    }
    return ErrorCode::Unauthenticated;
}

} // namespace Gamebattle::Orchestrator
