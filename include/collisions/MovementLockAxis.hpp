/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOVEMENT_LOCK_AXIS_HPP
#define MOVEMENT_LOCK_AXIS_HPP

#include <cstdint>
#include <ostream>

namespace Ironclad {

// Horizontal axes along which an entity may not move this frame
enum class MovementLockAxis : uint8_t {
    None = 0,
    X = 1 << 0,
    Z = 1 << 1,
    All = X | Z
};

inline constexpr MovementLockAxis operator|(MovementLockAxis a, MovementLockAxis b) {
    return static_cast<MovementLockAxis>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline constexpr MovementLockAxis operator&(MovementLockAxis a, MovementLockAxis b) {
    return static_cast<MovementLockAxis>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

inline MovementLockAxis& operator|=(MovementLockAxis& a, MovementLockAxis b) {
    a = a | b;
    return a;
}

inline constexpr bool hasLockAxis(MovementLockAxis mask, MovementLockAxis axis) {
    return (mask & axis) != MovementLockAxis::None;
}

inline const char* toString(MovementLockAxis mask) {
    switch (mask) {
    case MovementLockAxis::None: return "None";
    case MovementLockAxis::X: return "X";
    case MovementLockAxis::Z: return "Z";
    case MovementLockAxis::All: return "All";
    }
    return "Unknown";
}

// For Boost.Test diagnostics
inline std::ostream& operator<<(std::ostream& os, MovementLockAxis mask) {
    return os << toString(mask);
}

} // namespace Ironclad

#endif // MOVEMENT_LOCK_AXIS_HPP
