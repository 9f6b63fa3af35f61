#include "Collectibles.h"
#include "terrain/ProceduralTerrain.h"
#include "core/SeededRandom.h"

#include <SDL3/SDL_log.h>
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace {

constexpr int CENTER_TRIES = 80;
constexpr int BERRY_TRIES = 30;
constexpr float CENTER_MAX_SLOPE_DEG = 45.0f;
constexpr float BERRY_MAX_SLOPE_DEG = 50.0f;
constexpr float SLOPE_EPSILON = 2.2f;

// Fraction of the pop spent growing before the shrink starts
constexpr float POP_GROW_PHASE = 0.45f;
constexpr float POP_GROW_AMOUNT = 0.35f;

} // namespace

Collectibles::Collectibles(const ProceduralTerrain& terrain, const CollectiblesConfig& config, uint32_t sessionSalt)
    : terrain_(&terrain)
    , config_(config) {
    config_.validate();
    reset(sessionSalt);
}

Collectibles::Collectibles(const std::vector<glm::vec3>& positions, const CollectiblesConfig& config)
    : config_(config) {
    config_.validate();
    instances_.reserve(positions.size());
    for (const glm::vec3& p : positions) {
        Collectible c;
        c.placement.position = p;
        c.placement.kind = PlacementKind::Collectible;
        instances_.push_back(c);
    }
}

void Collectibles::reset(uint32_t sessionSalt) {
    elapsed_ = 0.0f;

    if (!terrain_) {
        for (Collectible& c : instances_) {
            c.collected = false;
            c.popTimer = 0.0f;
        }
        return;
    }

    generateLayout(sessionSalt);
}

void Collectibles::generateLayout(uint32_t sessionSalt) {
    instances_.clear();

    PlacementEngine engine(*terrain_);
    SeededRandom rng(SeededRandom::mixSeed(config_.seed, sessionSalt));

    std::vector<uint32_t> clusterSizes = PlacementEngine::partitionClusters(
        static_cast<uint32_t>(config_.totalCount),
        static_cast<uint32_t>(config_.clusterMin),
        static_cast<uint32_t>(config_.clusterMax), rng);

    PlacementConstraints centerRules;
    centerRules.minSpawnDistance = config_.minDistanceFromSpawn;
    centerRules.maxSlope = glm::radians(CENTER_MAX_SLOPE_DEG);
    centerRules.slopeEpsilon = SLOPE_EPSILON;

    PlacementConstraints berryRules = centerRules;
    berryRules.maxSlope = glm::radians(BERRY_MAX_SLOPE_DEG);

    int failedCenters = 0;
    for (uint32_t clusterSize : clusterSizes) {
        // A cluster whose centre is never found stays at the origin; its berries then
        // fall inside the spawn clearance and are all rejected
        glm::vec2 center(0.0f);
        bool centerFound = false;
        for (int tries = 0; tries < CENTER_TRIES && !centerFound; ++tries) {
            glm::vec2 candidate = engine.uniformPoint(rng);
            if (engine.evaluate(candidate.x, candidate.y, centerRules)) {
                center = candidate;
                centerFound = true;
            }
        }
        if (!centerFound) ++failedCenters;

        for (uint32_t i = 0; i < clusterSize; ++i) {
            for (int tries = 0; tries < BERRY_TRIES; ++tries) {
                glm::vec2 candidate = center + rng.diskPoint(config_.clusterRadius);
                std::optional<PlacementSite> site = engine.evaluate(candidate.x, candidate.y, berryRules);
                if (!site) continue;

                Collectible c;
                c.placement.kind = PlacementKind::Collectible;
                c.placement.position = glm::vec3(site->x, site->groundY + HOVER_HEIGHT, site->z);
                c.baseScale = 0.85f + rng.next() * 0.55f;
                c.placement.scale = glm::vec3(c.baseScale);
                c.phase = rng.angle();
                instances_.push_back(c);
                break;
            }
        }
    }

    if (failedCenters > 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Collectibles: %d of %zu cluster centres not found",
                    failedCenters, clusterSizes.size());
    }
    SDL_Log("Collectibles: placed %zu of %d in %zu clusters (salt %u)",
            instances_.size(), config_.totalCount, clusterSizes.size(), sessionSalt);
}

void Collectibles::update(float deltaTime) {
    elapsed_ += deltaTime;

    for (Collectible& c : instances_) {
        if (c.popTimer > 0.0f) {
            c.popTimer = std::max(0.0f, c.popTimer - deltaTime);
        }
        if (!c.collected) {
            c.placement.yaw += deltaTime * SPIN_SPEED;
        }
    }
}

int Collectibles::collectNear(const glm::vec3& position, float radius) {
    const float r2 = radius * radius;
    int collected = 0;

    for (Collectible& c : instances_) {
        if (c.collected) continue;
        glm::vec3 d = c.placement.position - position;
        if (glm::dot(d, d) > r2) continue;

        c.collected = true;
        c.popTimer = POP_DURATION;
        collected++;
    }

    return collected;
}

std::optional<glm::vec3> Collectibles::getNearestUncollected(const glm::vec3& from) const {
    std::optional<glm::vec3> best;
    float bestD2 = std::numeric_limits<float>::infinity();

    for (const Collectible& c : instances_) {
        if (c.collected) continue;
        glm::vec3 d = c.placement.position - from;
        float d2 = glm::dot(d, d);
        if (d2 < bestD2) {
            bestD2 = d2;
            best = c.placement.position;
        }
    }

    return best;
}

float Collectibles::visualScale(float baseScale, float phase, float popTimer, bool collected, float time) {
    if (collected && popTimer <= 0.0f) return 0.0f;

    float pulse = 1.0f + std::sin(time * PULSE_SPEED + phase) * PULSE_AMPLITUDE;
    float scale = baseScale * pulse;

    if (popTimer > 0.0f) {
        float p = 1.0f - popTimer / POP_DURATION;
        if (p < POP_GROW_PHASE) {
            scale *= 1.0f + (p / POP_GROW_PHASE) * POP_GROW_AMOUNT;
        } else {
            float q = (p - POP_GROW_PHASE) / (1.0f - POP_GROW_PHASE);
            scale *= std::max(0.0f, 1.0f - q);
        }
    }

    return scale;
}

void Collectibles::setModel(const ModelBounds& bounds) {
    templateScale_ = ModelFit::unitHeightScale(bounds);
    if (bounds.size().y <= ModelFit::MIN_EXTENT) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Collectibles: berry model has degenerate bounds, keeping scale 1");
    }
}

float Collectibles::getVisualScale(size_t index) const {
    const Collectible& c = instances_.at(index);
    return visualScale(c.baseScale * templateScale_, c.phase, c.popTimer, c.collected, elapsed_);
}

int Collectibles::collectedCount() const {
    return static_cast<int>(std::count_if(instances_.begin(), instances_.end(),
                                          [](const Collectible& c) { return c.collected; }));
}

int Collectibles::remainingCount() const {
    return totalCount() - collectedCount();
}
