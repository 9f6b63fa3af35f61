#include "PlacementEngine.h"
#include "terrain/ProceduralTerrain.h"
#include "core/SeededRandom.h"

#include <SDL3/SDL_log.h>
#include <algorithm>
#include <stdexcept>

const char* placementKindName(PlacementKind kind) {
    switch (kind) {
        case PlacementKind::Tree: return "trees";
        case PlacementKind::DenseTree: return "dense trees";
        case PlacementKind::Rock: return "rocks";
        case PlacementKind::Collectible: return "collectibles";
        case PlacementKind::GoalSite: return "goal site";
    }
    return "unknown";
}

void ScatterRequest::validate() const {
    if (count > 0 && attemptFactor == 0) {
        throw std::invalid_argument("ScatterRequest: attemptFactor must be positive");
    }
    if (constraints.minSpawnDistance < 0.0f) {
        throw std::invalid_argument("ScatterRequest: minSpawnDistance must not be negative");
    }
    if (constraints.maxSlope < 0.0f) {
        throw std::invalid_argument("ScatterRequest: maxSlope must not be negative");
    }
    if (!(constraints.slopeEpsilon > 0.0f)) {
        throw std::invalid_argument("ScatterRequest: slopeEpsilon must be positive");
    }
    if (!clusterCenters.empty() && clusterRadius < 0.0f) {
        throw std::invalid_argument("ScatterRequest: clusterRadius must not be negative");
    }
}

PlacementEngine::PlacementEngine(const ProceduralTerrain& terrain)
    : terrain_(terrain) {
}

glm::vec2 PlacementEngine::uniformPoint(SeededRandom& rng) const {
    const TerrainConfig& config = terrain_.getConfig();
    float x = (rng.next() - 0.5f) * config.width;
    float z = (rng.next() - 0.5f) * config.depth;
    return glm::vec2(x, z);
}

std::optional<PlacementSite> PlacementEngine::evaluate(float x, float z,
                                                        const PlacementConstraints& constraints) const {
    const float minDist = constraints.minSpawnDistance;
    if (x * x + z * z < minDist * minDist) {
        return std::nullopt;
    }

    float slope = terrain_.estimateSlope(x, z, constraints.slopeEpsilon);
    if (slope > constraints.maxSlope) {
        return std::nullopt;
    }

    PlacementSite site;
    site.x = x;
    site.z = z;
    site.groundY = terrain_.getHeightAt(x, z);
    site.slope = slope;
    return site;
}

ScatterResult PlacementEngine::scatter(const ScatterRequest& request, SeededRandom& rng,
                                       const EmitFn& emit) const {
    request.validate();

    ScatterResult result;
    result.instances.reserve(request.count);

    const uint64_t maxAttempts = static_cast<uint64_t>(request.count) * request.attemptFactor;
    const bool clustered = !request.clusterCenters.empty();

    while (result.instances.size() < request.count && result.attempts < maxAttempts) {
        result.attempts++;

        glm::vec2 candidate;
        if (clustered) {
            const glm::vec2& center =
                request.clusterCenters[rng.index(static_cast<uint32_t>(request.clusterCenters.size()))];
            candidate = center + rng.diskPoint(request.clusterRadius);
        } else {
            candidate = uniformPoint(rng);
        }

        std::optional<PlacementSite> site = evaluate(candidate.x, candidate.y, request.constraints);
        if (!site) continue;

        PlacementInstance instance = emit(*site, rng);
        instance.kind = request.kind;
        result.instances.push_back(instance);
    }

    if (result.instances.size() < request.count) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Placement: %s placed %zu of %u in %u attempts",
                    placementKindName(request.kind), result.instances.size(), request.count, result.attempts);
    } else {
        SDL_Log("Placement: %s placed %zu in %u attempts",
                placementKindName(request.kind), result.instances.size(), result.attempts);
    }

    return result;
}

std::vector<uint32_t> PlacementEngine::partitionClusters(uint32_t total, uint32_t minSize, uint32_t maxSize,
                                                         SeededRandom& rng) {
    if (minSize == 0 || minSize > maxSize) {
        throw std::invalid_argument("PlacementEngine: cluster size range must satisfy 0 < min <= max");
    }

    std::vector<uint32_t> sizes;
    uint32_t remaining = total;
    while (remaining > 0) {
        uint32_t size = std::min(remaining, minSize + rng.index(maxSize - minSize + 1));
        remaining -= size;
        sizes.push_back(size);
    }
    return sizes;
}
