#pragma once

#include "physics/IPhysicsWorld.h"
#include "physics/ScopedBodySet.h"

#include <glm/glm.hpp>
#include <array>
#include <cstdint>
#include <stdexcept>

class ProceduralTerrain;

struct GoalConfig {
    int32_t seed = 4242;
    float yardSize = 14.0f;
    float ringInnerInset = 160.0f;   // Ring radius range measured in from the smaller half extent
    float ringOuterInset = 60.0f;
    int maxTries = 60;
    float maxSlope = 0.48869219f;    // 28 degrees
    float ownerHeightOffset = 0.9f;
    float arrivalRadius = 4.0f;      // Distance to the owner that counts as arriving

    void validate() const {
        if (yardSize <= 0.0f) {
            throw std::invalid_argument("GoalConfig: yardSize must be positive");
        }
        if (ringInnerInset < ringOuterInset) {
            throw std::invalid_argument("GoalConfig: inner inset must not be smaller than the outer inset");
        }
        if (maxTries < 0 || maxSlope < 0.0f || arrivalRadius < 0.0f) {
            throw std::invalid_argument("GoalConfig: tries, slope and arrival radius must not be negative");
        }
    }
};

// One static box of the yard, relative to the site origin
struct GoalColliderBox {
    glm::vec3 offset{0.0f};
    glm::vec3 halfExtents{0.5f};
    float yaw = 0.0f;
};

/**
 * GoalSite - The owner's fenced yard the player is looking for
 *
 * Each reset() picks a gentle spot on a ring near the border, then rebuilds
 * the house, porch and four fence rails as static boxes. The previous boxes
 * are removed first, so repeated resets never leave stale colliders behind.
 */
class GoalSite {
public:
    static constexpr size_t COLLIDER_COUNT = 6;

    GoalSite(const ProceduralTerrain& terrain, IPhysicsWorld& physics, const GoalConfig& config,
             uint32_t sessionSalt = 0);

    void reset(uint32_t sessionSalt);

    const glm::vec3& getPosition() const { return position_; }
    const glm::vec3& getOwnerPosition() const { return ownerPosition_; }
    bool isFallbackPlacement() const { return fallback_; }

    bool isPlayerAtGoal(const glm::vec3& playerPosition, float radius) const;
    bool isPlayerAtGoal(const glm::vec3& playerPosition) const {
        return isPlayerAtGoal(playerPosition, config_.arrivalRadius);
    }

    const std::array<GoalColliderBox, COLLIDER_COUNT>& getColliderBoxes() const { return boxes_; }
    const ScopedBodySet& getColliders() const { return colliders_; }
    const GoalConfig& getConfig() const { return config_; }

    static const glm::vec3 HOUSE_OFFSET;
    static const glm::vec3 OWNER_OFFSET;

private:
    void rebuildColliders();

    const ProceduralTerrain& terrain_;
    GoalConfig config_;
    std::array<GoalColliderBox, COLLIDER_COUNT> boxes_;

    glm::vec3 position_{0.0f};
    glm::vec3 ownerPosition_{0.0f};
    bool fallback_ = false;

    ScopedBodySet colliders_;
};
