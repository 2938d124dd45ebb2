#pragma once

#include <cstdint>

namespace core {

enum class DisputeState : std::uint8_t { None, Disputed, ResolvedFinal };

inline constexpr const char* dispute_state_name(DisputeState s) noexcept {
    switch (s) {
    case DisputeState::None: return "none";
    case DisputeState::Disputed: return "disputed";
    case DisputeState::ResolvedFinal: return "resolved_final";
    }
    return "unknown";
}

inline constexpr bool is_terminal_state(DisputeState s) noexcept {
    return s == DisputeState::ResolvedFinal;
}

// A cached transaction can be disputed once, and a dispute ends exactly once,
// by resolve or chargeback. Repeats are rejected rather than treated as no-ops
// so the caller can tell a duplicate control record from a real transition.
inline constexpr bool is_valid_dispute_transition(DisputeState current, DisputeState next) noexcept {
    if (is_terminal_state(current)) {
        return false;
    }
    switch (current) {
    case DisputeState::None:
        return next == DisputeState::Disputed;
    case DisputeState::Disputed:
        return next == DisputeState::ResolvedFinal;
    default:
        return false;
    }
}

inline bool apply_dispute_transition(DisputeState& current, DisputeState next) noexcept {
    if (!is_valid_dispute_transition(current, next)) {
        return false;
    }
    current = next;
    return true;
}

} // namespace core
