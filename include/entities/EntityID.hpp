/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_ID_HPP
#define ENTITY_ID_HPP

#include <atomic>
#include <cstdint>

namespace Ironclad {

using EntityID = uint64_t;

// Never handed out by nextEntityID()
inline constexpr EntityID INVALID_ENTITY_ID = 0;

/**
 * @brief Returns a process-unique entity id, starting at 1.
 */
inline EntityID nextEntityID() {
    static std::atomic<EntityID> s_next{1};
    return s_next.fetch_add(1, std::memory_order_relaxed);
}

} // namespace Ironclad

#endif // ENTITY_ID_HPP
