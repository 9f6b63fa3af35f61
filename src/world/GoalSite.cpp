#include "GoalSite.h"
#include "PlacementEngine.h"
#include "terrain/ProceduralTerrain.h"
#include "core/SeededRandom.h"

#include <SDL3/SDL_log.h>
#include <glm/gtc/quaternion.hpp>
#include <algorithm>
#include <cmath>

const glm::vec3 GoalSite::HOUSE_OFFSET(2.5f, 0.0f, 0.0f);
const glm::vec3 GoalSite::OWNER_OFFSET(-3.0f, 0.0f, -2.5f);

namespace {

constexpr float COLLIDER_FRICTION = 1.0f;
constexpr float RAIL_HEIGHT = 0.6f;
constexpr float RAIL_HALF_THICKNESS = 0.25f;

} // namespace

GoalSite::GoalSite(const ProceduralTerrain& terrain, IPhysicsWorld& physics, const GoalConfig& config,
                   uint32_t sessionSalt)
    : terrain_(terrain)
    , config_(config)
    , colliders_(&physics) {
    config_.validate();

    const float half = config_.yardSize * 0.5f;
    boxes_ = {{
        {HOUSE_OFFSET + glm::vec3(0.0f, 1.7f, 0.0f), glm::vec3(3.1f, 1.8f, 2.6f), 0.0f},
        {HOUSE_OFFSET + glm::vec3(0.0f, 0.35f, 3.2f), glm::vec3(1.3f, 0.4f, 1.0f), 0.0f},
        {glm::vec3(0.0f, RAIL_HEIGHT, half), glm::vec3(half, RAIL_HALF_THICKNESS, RAIL_HALF_THICKNESS), 0.0f},
        {glm::vec3(0.0f, RAIL_HEIGHT, -half), glm::vec3(half, RAIL_HALF_THICKNESS, RAIL_HALF_THICKNESS), 0.0f},
        {glm::vec3(half, RAIL_HEIGHT, 0.0f), glm::vec3(RAIL_HALF_THICKNESS, RAIL_HALF_THICKNESS, half), 0.0f},
        {glm::vec3(-half, RAIL_HEIGHT, 0.0f), glm::vec3(RAIL_HALF_THICKNESS, RAIL_HALF_THICKNESS, half), 0.0f},
    }};

    reset(sessionSalt);
}

void GoalSite::reset(uint32_t sessionSalt) {
    const TerrainConfig& tc = terrain_.getConfig();
    const float halfExtent = std::min(tc.halfWidth(), tc.halfDepth());
    const float minRadius = std::max(0.0f, halfExtent - config_.ringInnerInset);
    const float maxRadius = std::max(minRadius, halfExtent - config_.ringOuterInset);

    PlacementEngine engine(terrain_);
    SeededRandom rng(SeededRandom::mixSeed(config_.seed, sessionSalt));

    PlacementConstraints rules;
    rules.maxSlope = config_.maxSlope;

    fallback_ = true;
    int tries = 0;
    while (fallback_ && tries < config_.maxTries) {
        tries++;

        float angle = rng.angle();
        float radius = rng.range(minRadius, maxRadius);
        std::optional<PlacementSite> site =
            engine.evaluate(std::cos(angle) * radius, std::sin(angle) * radius, rules);
        if (!site) continue;

        position_ = glm::vec3(site->x, site->groundY, site->z);
        ownerPosition_ = position_ + OWNER_OFFSET;
        ownerPosition_.y = terrain_.getHeightAt(ownerPosition_.x, ownerPosition_.z) + config_.ownerHeightOffset;
        fallback_ = false;
    }

    if (fallback_) {
        position_ = glm::vec3(0.0f, terrain_.getHeightAt(0.0f, 0.0f), 0.0f);
        ownerPosition_ = glm::vec3(0.0f, position_.y + config_.ownerHeightOffset, 0.0f);
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "GoalSite: no site found in %d tries, using the origin", tries);
    } else {
        SDL_Log("GoalSite: placed at (%.1f, %.1f, %.1f) after %d tries",
                position_.x, position_.y, position_.z, tries);
    }

    rebuildColliders();
}

void GoalSite::rebuildColliders() {
    IPhysicsWorld* physics = colliders_.physics();
    colliders_.release();
    if (!physics) return;

    for (const GoalColliderBox& box : boxes_) {
        glm::quat rotation = glm::angleAxis(box.yaw, glm::vec3(0.0f, 1.0f, 0.0f));
        PhysicsBodyID id = physics->createStaticBox(position_ + box.offset, box.halfExtents,
                                                    rotation, COLLIDER_FRICTION);
        if (colliders_.adopt(id) == INVALID_BODY_ID) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "GoalSite: failed to create yard collider");
        }
    }
}

bool GoalSite::isPlayerAtGoal(const glm::vec3& playerPosition, float radius) const {
    glm::vec3 d = playerPosition - ownerPosition_;
    d.y = 0.0f;
    return glm::dot(d, d) <= radius * radius;
}
