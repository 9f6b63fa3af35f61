#pragma once

#include "PlacementEngine.h"
#include "physics/IPhysicsWorld.h"
#include "physics/ScopedBodySet.h"
#include "scene/ModelFit.h"

#include <glm/glm.hpp>
#include <algorithm>
#include <optional>
#include <stdexcept>
#include <vector>

class ProceduralTerrain;

// Placement-relevant measurements of a scenery asset
struct ModelMetrics {
    float baseOffsetY = 0.0f;   // Lift that puts the model's lowest point at its origin
    float height = 1.0f;
    float radius = 0.5f;

    static ModelMetrics fromBounds(const ModelBounds& bounds) {
        glm::vec3 size = bounds.size();
        ModelMetrics m;
        m.baseOffsetY = -bounds.min.y;
        m.height = std::max(0.01f, size.y);
        m.radius = std::max({size.x, size.y, size.z}) * 0.5f;
        return m;
    }

    // Used until the tree/rock assets report their bounds
    static ModelMetrics defaultTree() { return ModelMetrics{0.0f, 4.4f, 0.5f}; }
    static ModelMetrics defaultRock() { return ModelMetrics{0.0f, 2.4f, 1.2f}; }
};

struct ScatterConfig {
    int treeCount = 900;
    int denseTreeCount = 240;
    int rockCount = 220;
    int32_t seed = 2026;

    // Forces the first dense grove centre onto this XZ position
    std::optional<glm::vec2> denseTarget;

    // Throws std::invalid_argument on negative counts
    void validate() const {
        if (treeCount < 0 || denseTreeCount < 0 || rockCount < 0) {
            throw std::invalid_argument("ScatterConfig: counts must not be negative");
        }
    }
};

/**
 * Scenery - Trees, dense groves and rocks scattered over the terrain
 *
 * Three seeded passes (trees, groves, rocks) each run their own generator so
 * changing one count never moves the objects of another pass. Every placed
 * object gets a static collider: cylinders for trunks, spheres for rocks.
 */
class Scenery {
public:
    Scenery(const ProceduralTerrain& terrain, IPhysicsWorld& physics, const ScatterConfig& config,
            const ModelMetrics& treeMetrics = ModelMetrics::defaultTree(),
            const ModelMetrics& rockMetrics = ModelMetrics::defaultRock());

    // Drop every collider and place everything again
    void rebuild();

    // Asset bounds arrived; placement is redone with the real measurements
    void setModelMetrics(const ModelMetrics& treeMetrics, const ModelMetrics& rockMetrics);

    // Regular trees first, then the grove trees
    const std::vector<PlacementInstance>& getTrees() const { return trees_; }
    const std::vector<PlacementInstance>& getRocks() const { return rocks_; }
    uint32_t getBaseTreeCount() const { return baseTreeCount_; }
    size_t getColliderCount() const { return colliders_.size(); }
    const std::vector<glm::vec2>& getGroveCenters() const { return groveCenters_; }

    const ScatterConfig& getConfig() const { return config_; }

private:
    void placeTrees();
    void placeDenseTrees();
    void placeRocks();

    PlacementInstance emitTree(const PlacementSite& site, SeededRandom& rng,
                               float scaleMin, float scaleSpan, float trunkRadius);

    const ProceduralTerrain& terrain_;
    IPhysicsWorld& physics_;
    ScatterConfig config_;
    ModelMetrics treeMetrics_;
    ModelMetrics rockMetrics_;

    std::vector<PlacementInstance> trees_;
    std::vector<PlacementInstance> rocks_;
    std::vector<glm::vec2> groveCenters_;
    uint32_t baseTreeCount_ = 0;
    ScopedBodySet colliders_;
};
