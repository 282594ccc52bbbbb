/**
 * @file ErrorCodes.cpp
 * @brief Human-readable descriptions for orchestrator error codes
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#include <Gamebattle/Core/ErrorCodes.hpp>

namespace Gamebattle {

std::string_view getErrorMessage(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:                  return "Success";

        case ErrorCode::SystemError:              return "System error";
        case ErrorCode::ThreadCreationFailed:     return "Thread creation failed";
        case ErrorCode::Timeout:                  return "Operation timed out";
        case ErrorCode::Cancelled:                return "Operation cancelled";
        case ErrorCode::NotSupported:             return "Not supported";
        case ErrorCode::InsufficientPrivileges:   return "Insufficient privileges";

        case ErrorCode::ArtifactNotFound:         return "Game not found";
        case ErrorCode::LaunchFailed:             return "Sandbox launch failed";
        case ErrorCode::QuotaExceeded:            return "Server is at capacity";
        case ErrorCode::AlreadyAttached:          return "Sandbox I/O already attached";
        case ErrorCode::SandboxNotFound:          return "Sandbox not found";
        case ErrorCode::ChannelSetupFailed:       return "Channel setup failed";

        case ErrorCode::BridgeClosed:             return "Bridge closed";
        case ErrorCode::ClientDisconnected:       return "Client disconnected";
        case ErrorCode::EndOfInput:               return "Game input is closed";

        case ErrorCode::SessionNotFound:          return "Session not found";
        case ErrorCode::ConcurrencyLimitExceeded: return "Too many sessions";
        case ErrorCode::InvalidState:             return "Invalid session state";
        case ErrorCode::SessionTerminated:        return "Session terminated";

        case ErrorCode::StoreUnavailable:         return "State store unavailable";
        case ErrorCode::ConditionFailed:          return "Compare-and-set condition failed";
        case ErrorCode::LockNotAcquired:          return "Lock not acquired";
        case ErrorCode::KeyNotFound:              return "Key not found";
        case ErrorCode::LeaseLost:                return "Lock lease lost";

        case ErrorCode::CompetitionDisabled:      return "Competition is disabled";
        case ErrorCode::DuplicateOutcome:         return "Outcome already recorded";
        case ErrorCode::SelfReportNotAllowed:     return "You cannot report your own game";

        case ErrorCode::NetworkError:             return "Network error";
        case ErrorCode::ConnectionFailed:         return "Connection failed";
        case ErrorCode::DnsResolutionFailed:      return "DNS resolution failed";
        case ErrorCode::HttpError:                return "HTTP error";
        case ErrorCode::CurlInitFailed:           return "HTTP client initialization failed";
        case ErrorCode::TlsHandshakeFailed:       return "TLS handshake failed";

        case ErrorCode::CryptoError:              return "Cryptographic error";
        case ErrorCode::RandomGenerationFailed:   return "Random generation failed";
        case ErrorCode::InvalidKey:               return "Invalid key";

        case ErrorCode::ConfigError:              return "Configuration error";
        case ErrorCode::ConfigMissing:            return "Required setting missing";
        case ErrorCode::ConfigInvalid:            return "Invalid setting value";

        case ErrorCode::IOError:                  return "I/O error";
        case ErrorCode::FileNotFound:             return "File not found";
        case ErrorCode::FileTooLarge:             return "File too large";
        case ErrorCode::InvalidPath:              return "Invalid path";
        case ErrorCode::AccessDenied:             return "Access denied";

        case ErrorCode::ParseError:               return "Parse error";
        case ErrorCode::JsonParseFailed:          return "Malformed JSON";
        case ErrorCode::InvalidFormat:            return "Invalid format";

        case ErrorCode::Forbidden:                return "Forbidden";
        case ErrorCode::Unauthenticated:          return "Unauthenticated";

        case ErrorCode::InternalError:            return "Internal error";
        case ErrorCode::InvalidArgument:          return "Invalid argument";
        case ErrorCode::OutOfRange:               return "Out of range";
        case ErrorCode::LogicError:               return "Logic error";
    }
    return "Unknown error";
}

std::string_view getCategoryName(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::None:        return "None";
        case ErrorCategory::System:      return "System";
        case ErrorCategory::Sandbox:     return "Sandbox";
        case ErrorCategory::Bridge:      return "Bridge";
        case ErrorCategory::Session:     return "Session";
        case ErrorCategory::Store:       return "Store";
        case ErrorCategory::Competition: return "Competition";
        case ErrorCategory::Network:     return "Network";
        case ErrorCategory::Crypto:      return "Crypto";
        case ErrorCategory::Config:      return "Config";
        case ErrorCategory::IO:          return "IO";
        case ErrorCategory::Parse:       return "Parse";
        case ErrorCategory::Auth:        return "Auth";
        case ErrorCategory::Internal:    return "Internal";
    }
    return "Unknown";
}

} // namespace Gamebattle
