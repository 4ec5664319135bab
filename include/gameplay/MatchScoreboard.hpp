/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MATCH_SCOREBOARD_HPP
#define MATCH_SCOREBOARD_HPP

#include "collisions/CollisionEventRouter.hpp"
#include "entities/EntityID.hpp"

#include <unordered_map>

namespace Ironclad {

class Tank;

/**
 * @brief Health and kill tally for one match
 *
 * Owned by whoever runs the match and fed from the bullet hit callback.
 * Hits on obstacles are counted but do not affect health.
 */
class MatchScoreboard {
public:
    MatchScoreboard() = default;

    void addTank(Tank& tank, float maxHealth);
    void removeTank(EntityID tankId);

    // Applies damage; a tank reaching 0 health breaks and credits the shooter
    void applyHit(const BulletHitInfo& hit);

    float getHealth(EntityID tankId) const;
    int getKills(EntityID tankId) const;
    int getObstacleHits() const { return m_obstacleHits; }
    size_t getAliveCount() const;

private:
    struct Entry {
        Tank* tank;
        float health;
        int kills;
    };

    std::unordered_map<EntityID, Entry> m_entries;
    int m_obstacleHits{0};
};

} // namespace Ironclad

#endif // MATCH_SCOREBOARD_HPP
