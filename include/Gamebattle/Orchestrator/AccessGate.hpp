/**
 * @file AccessGate.hpp
 * @brief Caller identity for inbound requests
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#pragma once

#ifndef GAMEBATTLE_ORCHESTRATOR_ACCESS_GATE_HPP
#define GAMEBATTLE_ORCHESTRATOR_ACCESS_GATE_HPP

#include <Gamebattle/Core/Types.hpp>
#include <Gamebattle/Core/ErrorCodes.hpp>
#include <Gamebattle/Core/HttpClient.hpp>
#include <Gamebattle/Orchestrator/OrchestratorConfig.hpp>
#include <memory>
#include <string>

namespace Gamebattle::Orchestrator {

class AccessGate {
public:
    virtual ~AccessGate() = default;

    /**
     * @brief Identify the caller of a request
     * @return Identity, or Unauthenticated
     */
    virtual Result<Identity> identify(const Network::HttpHeaders& headers) const = 0;
};

/**
 * @brief Trusts a user id header set by an authenticating proxy
 *
 * The header name is matched case-insensitively. Admin status comes from the
 * configured allow-list.
 */
class HeaderAccessGate : public AccessGate {
public:
    explicit HeaderAccessGate(std::shared_ptr<const OrchestratorConfig> config);

    Result<Identity> identify(const Network::HttpHeaders& headers) const override;

private:
    std::shared_ptr<const OrchestratorConfig> m_config;
};

} // namespace Gamebattle::Orchestrator

#endif // GAMEBATTLE_ORCHESTRATOR_ACCESS_GATE_HPP
