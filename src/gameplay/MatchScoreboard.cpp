/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "gameplay/MatchScoreboard.hpp"
#include "core/Logger.hpp"
#include "entities/Tank.hpp"

#include <algorithm>
#include <format>
#include <string>

namespace Ironclad {

void MatchScoreboard::addTank(Tank& tank, float maxHealth) {
    m_entries[tank.getID()] = Entry{&tank, maxHealth, 0};
}

void MatchScoreboard::removeTank(EntityID tankId) {
    m_entries.erase(tankId);
}

void MatchScoreboard::applyHit(const BulletHitInfo& hit) {
    if (hit.targetKind == CollisionKind::Obstacle) {
        ++m_obstacleHits;
        return;
    }

    auto target = m_entries.find(hit.targetId);
    if (target == m_entries.end() || target->second.health <= 0.0f) {
        return;
    }

    Entry& entry = target->second;
    entry.health = std::max(0.0f, entry.health - hit.damage);
    if (entry.health > 0.0f) {
        return;
    }

    entry.tank->setBroken(true);
    auto shooter = m_entries.find(hit.shooterId);
    if (shooter != m_entries.end()) {
        ++shooter->second.kills;
    }
    ARENA_INFO(std::format("Tank {} destroyed by {}", hit.targetId, hit.shooterId));
}

float MatchScoreboard::getHealth(EntityID tankId) const {
    auto it = m_entries.find(tankId);
    return it == m_entries.end() ? 0.0f : it->second.health;
}

int MatchScoreboard::getKills(EntityID tankId) const {
    auto it = m_entries.find(tankId);
    return it == m_entries.end() ? 0 : it->second.kills;
}

size_t MatchScoreboard::getAliveCount() const {
    return static_cast<size_t>(std::count_if(m_entries.begin(), m_entries.end(),
                                              [](const auto& entry) { return entry.second.health > 0.0f; }));
}

} // namespace Ironclad
