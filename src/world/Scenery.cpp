#include "Scenery.h"
#include "terrain/ProceduralTerrain.h"
#include "core/SeededRandom.h"

#include <SDL3/SDL_log.h>
#include <glm/gtc/constants.hpp>

namespace {

constexpr float TREE_SCALE_MULTIPLIER = 5.0f;
constexpr float COLLIDER_FRICTION = 1.0f;

// Regular trees: uniform over the map
constexpr uint32_t TREE_ATTEMPT_FACTOR = 25;
constexpr float TREE_SPAWN_CLEARANCE = 30.0f;
constexpr float TREE_MAX_SLOPE_DEG = 55.0f;
constexpr float TREE_TRUNK_RADIUS = 0.55f;

// Dense groves: disk samples around a couple of centres
constexpr int32_t GROVE_SEED_OFFSET = 133;
constexpr uint32_t GROVE_ATTEMPT_FACTOR = 45;
constexpr size_t GROVE_CLUSTER_COUNT = 2;
constexpr float GROVE_BAND_MIN = 0.45f;
constexpr float GROVE_BAND_MAX = 0.6f;
constexpr float GROVE_CLUSTER_RADIUS = 110.0f;
constexpr float GROVE_SPAWN_CLEARANCE = 45.0f;
constexpr float GROVE_MAX_SLOPE_DEG = 35.0f;
constexpr float GROVE_TRUNK_RADIUS = 0.65f;

// Rocks
constexpr int32_t ROCK_SEED_OFFSET = 99;
constexpr uint32_t ROCK_ATTEMPT_FACTOR = 35;
constexpr float ROCK_SPAWN_CLEARANCE = 25.0f;
constexpr float ROCK_MAX_SLOPE_DEG = 65.0f;
constexpr float ROCK_MIN_COLLIDER_RADIUS = 0.2f;
const glm::vec3 ROCK_SCALE_SHAPE(1.2f, 0.9f, 1.1f);

} // namespace

Scenery::Scenery(const ProceduralTerrain& terrain, IPhysicsWorld& physics, const ScatterConfig& config,
                 const ModelMetrics& treeMetrics, const ModelMetrics& rockMetrics)
    : terrain_(terrain)
    , physics_(physics)
    , config_(config)
    , treeMetrics_(treeMetrics)
    , rockMetrics_(rockMetrics)
    , colliders_(&physics) {
    config_.validate();
    rebuild();
}

void Scenery::setModelMetrics(const ModelMetrics& treeMetrics, const ModelMetrics& rockMetrics) {
    treeMetrics_ = treeMetrics;
    rockMetrics_ = rockMetrics;
    rebuild();
}

void Scenery::rebuild() {
    colliders_.release();
    trees_.clear();
    rocks_.clear();
    groveCenters_.clear();

    placeTrees();
    placeDenseTrees();
    placeRocks();

    SDL_Log("Scenery: %zu trees (%u regular), %zu rocks, %zu colliders",
            trees_.size(), baseTreeCount_, rocks_.size(), colliders_.size());
}

PlacementInstance Scenery::emitTree(const PlacementSite& site, SeededRandom& rng,
                                    float scaleMin, float scaleSpan, float trunkRadius) {
    float scale = (scaleMin + rng.next() * scaleSpan) * TREE_SCALE_MULTIPLIER;
    float yaw = rng.angle();

    PlacementInstance instance;
    instance.position = glm::vec3(site.x, site.groundY + treeMetrics_.baseOffsetY * scale, site.z);
    instance.yaw = yaw;
    instance.scale = glm::vec3(scale);

    // Trunk approximated by a cylinder standing on the ground
    float trunkHalfHeight = treeMetrics_.height * scale * 0.5f;
    colliders_.adopt(physics_.createStaticCylinder(
        glm::vec3(site.x, site.groundY + trunkHalfHeight, site.z),
        trunkHalfHeight, trunkRadius, COLLIDER_FRICTION));

    return instance;
}

void Scenery::placeTrees() {
    PlacementEngine engine(terrain_);
    SeededRandom rng(config_.seed);

    ScatterRequest request;
    request.kind = PlacementKind::Tree;
    request.count = static_cast<uint32_t>(config_.treeCount);
    request.attemptFactor = TREE_ATTEMPT_FACTOR;
    request.constraints.minSpawnDistance = TREE_SPAWN_CLEARANCE;
    request.constraints.maxSlope = glm::radians(TREE_MAX_SLOPE_DEG);

    ScatterResult result = engine.scatter(request, rng,
        [this](const PlacementSite& site, SeededRandom& r) {
            return emitTree(site, r, 0.75f, 0.6f, TREE_TRUNK_RADIUS);
        });

    trees_ = std::move(result.instances);
    baseTreeCount_ = static_cast<uint32_t>(trees_.size());
}

void Scenery::placeDenseTrees() {
    PlacementEngine engine(terrain_);
    SeededRandom rng(config_.seed + GROVE_SEED_OFFSET);

    const float halfW = terrain_.getConfig().halfWidth();
    const float halfD = terrain_.getConfig().halfDepth();

    if (config_.denseTarget) {
        groveCenters_.push_back(*config_.denseTarget);
    }
    while (groveCenters_.size() < GROVE_CLUSTER_COUNT) {
        // Random quadrant, inside a band between the centre and the border ridge
        float signX = rng.sign();
        float signZ = rng.sign();
        float cx = signX * rng.range(GROVE_BAND_MIN, GROVE_BAND_MAX) * halfW;
        float cz = signZ * rng.range(GROVE_BAND_MIN, GROVE_BAND_MAX) * halfD;
        groveCenters_.emplace_back(cx, cz);
    }

    ScatterRequest request;
    request.kind = PlacementKind::DenseTree;
    request.count = static_cast<uint32_t>(config_.denseTreeCount);
    request.attemptFactor = GROVE_ATTEMPT_FACTOR;
    request.constraints.minSpawnDistance = GROVE_SPAWN_CLEARANCE;
    request.constraints.maxSlope = glm::radians(GROVE_MAX_SLOPE_DEG);
    request.clusterCenters = groveCenters_;
    request.clusterRadius = GROVE_CLUSTER_RADIUS;

    ScatterResult result = engine.scatter(request, rng,
        [this](const PlacementSite& site, SeededRandom& r) {
            return emitTree(site, r, 0.9f, 0.7f, GROVE_TRUNK_RADIUS);
        });

    trees_.insert(trees_.end(), result.instances.begin(), result.instances.end());
}

void Scenery::placeRocks() {
    PlacementEngine engine(terrain_);
    SeededRandom rng(config_.seed + ROCK_SEED_OFFSET);

    ScatterRequest request;
    request.kind = PlacementKind::Rock;
    request.count = static_cast<uint32_t>(config_.rockCount);
    request.attemptFactor = ROCK_ATTEMPT_FACTOR;
    request.constraints.minSpawnDistance = ROCK_SPAWN_CLEARANCE;
    request.constraints.maxSlope = glm::radians(ROCK_MAX_SLOPE_DEG);

    ScatterResult result = engine.scatter(request, rng,
        [this](const PlacementSite& site, SeededRandom& r) {
            float s = 0.6f + r.next() * 1.2f;
            float yaw = r.angle();

            PlacementInstance instance;
            instance.position = glm::vec3(site.x, site.groundY + rockMetrics_.baseOffsetY * s, site.z);
            instance.yaw = yaw;
            instance.scale = ROCK_SCALE_SHAPE * s;

            float radius = std::max(ROCK_MIN_COLLIDER_RADIUS, rockMetrics_.radius * s);
            float centerY = site.groundY + rockMetrics_.height * s * 0.5f;
            colliders_.adopt(physics_.createStaticSphere(glm::vec3(site.x, centerY, site.z),
                                                         radius, COLLIDER_FRICTION));
            return instance;
        });

    rocks_ = std::move(result.instances);
}
