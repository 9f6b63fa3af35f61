#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

class ProceduralTerrain;
class SeededRandom;

enum class PlacementKind : uint8_t {
    Tree,
    DenseTree,
    Rock,
    Collectible,
    GoalSite
};

const char* placementKindName(PlacementKind kind);

// Transform handed to the renderer for one placed object
struct PlacementInstance {
    glm::vec3 position{0.0f};
    float yaw = 0.0f;
    glm::vec3 scale{1.0f};
    PlacementKind kind = PlacementKind::Tree;
};

// Per-type acceptance rules for a candidate (x, z)
struct PlacementConstraints {
    float minSpawnDistance = 0.0f;   // Keep-out radius around the world origin
    float maxSlope = 0.0f;           // Radians
    float slopeEpsilon = 2.0f;       // Central-difference step for the slope estimate
};

// An accepted candidate, before any per-type decoration
struct PlacementSite {
    float x = 0.0f;
    float z = 0.0f;
    float groundY = 0.0f;
    float slope = 0.0f;
};

struct ScatterRequest {
    PlacementKind kind = PlacementKind::Tree;
    uint32_t count = 0;
    uint32_t attemptFactor = 25;     // Attempts are capped at count * attemptFactor
    PlacementConstraints constraints;

    // Empty: candidates uniform over the world footprint.
    // Otherwise: pick a centre uniformly, then an area-uniform disk sample.
    std::vector<glm::vec2> clusterCenters;
    float clusterRadius = 0.0f;

    // Throws std::invalid_argument
    void validate() const;
};

struct ScatterResult {
    std::vector<PlacementInstance> instances;
    uint32_t attempts = 0;
};

/**
 * PlacementEngine - Rejection sampling of objects over the terrain
 *
 * Candidates are drawn from a SeededRandom, rejected when they fall inside the
 * spawn keep-out radius or on terrain steeper than the type allows, and handed
 * to a per-type emit callback on acceptance. The callback draws the remaining
 * random attributes (scale, yaw), attaches any collider and returns the
 * instance to record. The attempt cap guarantees termination; placing fewer
 * than requested is normal and never an error.
 */
class PlacementEngine {
public:
    using EmitFn = std::function<PlacementInstance(const PlacementSite& site, SeededRandom& rng)>;

    explicit PlacementEngine(const ProceduralTerrain& terrain);

    ScatterResult scatter(const ScatterRequest& request, SeededRandom& rng, const EmitFn& emit) const;

    // Test one candidate against the constraints; returns the grounded site on success
    std::optional<PlacementSite> evaluate(float x, float z, const PlacementConstraints& constraints) const;

    // Uniform point over the world footprint, x drawn before z
    glm::vec2 uniformPoint(SeededRandom& rng) const;

    // Split total into cluster sizes in [minSize, maxSize] (the last may be smaller)
    static std::vector<uint32_t> partitionClusters(uint32_t total, uint32_t minSize, uint32_t maxSize,
                                                   SeededRandom& rng);

    const ProceduralTerrain& getTerrain() const { return terrain_; }

private:
    const ProceduralTerrain& terrain_;
};
