#pragma once

#include "core/types.hpp"

namespace wg::nav {

enum class SessionState : u8 {
    Idle,                 ///< No origin known
    AwaitingDestination,  ///< Origin scanned, waiting for a destination
    Navigating,           ///< Following the active route
    Deviated,             ///< Last scan was off the expected route
    Arrived,              ///< Terminal: destination reached
    Aborted,              ///< Terminal: cancelled or unrecoverable
};

inline const char* session_state_name(SessionState s) {
    switch (s) {
        case SessionState::Idle:                return "Idle";
        case SessionState::AwaitingDestination: return "AwaitingDestination";
        case SessionState::Navigating:          return "Navigating";
        case SessionState::Deviated:            return "Deviated";
        case SessionState::Arrived:             return "Arrived";
        case SessionState::Aborted:             return "Aborted";
    }
    return "Unknown";
}

inline bool is_terminal(SessionState s) {
    return s == SessionState::Arrived || s == SessionState::Aborted;
}

} // namespace wg::nav
