#pragma once
#include <cstdint>
#include <string_view>

namespace edgli::session {

enum class SessionState : uint8_t {
    Establishing,
    Active,
    Draining,
    Closed,
    Failed
};

enum class SessionRole : uint8_t {
    Initiator,
    Responder
};

[[nodiscard]] constexpr bool IsTerminal(const SessionState state) noexcept {
    return state == SessionState::Closed || state == SessionState::Failed;
}

[[nodiscard]] constexpr std::string_view ToString(const SessionState state) noexcept {
    switch (state) {
        case SessionState::Establishing: return "Establishing";
        case SessionState::Active: return "Active";
        case SessionState::Draining: return "Draining";
        case SessionState::Closed: return "Closed";
        case SessionState::Failed: return "Failed";
    }
    return "Unknown";
}

}
