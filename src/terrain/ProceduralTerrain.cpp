#include "ProceduralTerrain.h"
#include "TerrainHeight.h"
#include "core/SeededRandom.h"

#include <SDL3/SDL_log.h>
#include <array>
#include <stdexcept>
#include <string>

namespace {

constexpr int NOISE_OCTAVES = 5;
constexpr float NOISE_BASE_FREQUENCY = 0.0022f;
constexpr float NOISE_OFFSET_RANGE = 256.0f;
constexpr float COLLIDER_FRICTION = 1.0f;

} // namespace

ProceduralTerrain::ProceduralTerrain(const TerrainConfig& config)
    : config_(config) {
    config_.validate();

    stepX_ = config_.width / static_cast<float>(config_.size - 1);
    stepZ_ = config_.depth / static_cast<float>(config_.size - 1);

    generateHeights();
    buildMesh();

    SDL_Log("Terrain: generated %ux%u heightfield (%.0f x %.0f, seed %d)",
            config_.size, config_.size, config_.width, config_.depth, config_.seed);
}

void ProceduralTerrain::generateHeights() {
    const uint32_t size = config_.size;
    heights_.assign(static_cast<size_t>(size) * size, 0.0f);

    SeededRandom rng(config_.seed);
    std::array<glm::vec2, NOISE_OCTAVES> offsets;
    for (glm::vec2& offset : offsets) {
        offset.x = rng.range(-NOISE_OFFSET_RANGE, NOISE_OFFSET_RANGE);
        offset.y = rng.range(-NOISE_OFFSET_RANGE, NOISE_OFFSET_RANGE);
    }

    const float denom = static_cast<float>(size - 1);
    for (uint32_t z = 0; z < size; ++z) {
        for (uint32_t x = 0; x < size; ++x) {
            float wx = (static_cast<float>(x) / denom - 0.5f) * config_.width;
            float wz = (static_cast<float>(z) / denom - 0.5f) * config_.depth;

            float n = TerrainHeight::fbm(glm::vec2(wx, wz), offsets.data(), NOISE_OCTAVES, NOISE_BASE_FREQUENCY);
            float h = TerrainHeight::shapeNoise(n, config_.maxHeight);
            float border = TerrainHeight::borderRise(wx, wz, config_.halfWidth(), config_.halfDepth(),
                                                     config_.borderWidth, config_.borderHeight);

            heights_[TerrainHeight::index(x, z, size)] = h + border;
        }
    }
}

void ProceduralTerrain::buildMesh() {
    const uint32_t size = config_.size;
    const size_t vertexCount = static_cast<size_t>(size) * size;

    mesh_.positions.resize(vertexCount);
    mesh_.normals.resize(vertexCount);

    for (uint32_t z = 0; z < size; ++z) {
        for (uint32_t x = 0; x < size; ++x) {
            size_t i = static_cast<size_t>(z) * size + x;
            mesh_.positions[i] = glm::vec3(
                -config_.halfWidth() + static_cast<float>(x) * stepX_,
                getGridHeight(x, z),
                -config_.halfDepth() + static_cast<float>(z) * stepZ_);
        }
    }

    // Grid normals from neighbouring samples (one-sided at the edges)
    for (uint32_t z = 0; z < size; ++z) {
        for (uint32_t x = 0; x < size; ++x) {
            uint32_t xl = x > 0 ? x - 1 : x;
            uint32_t xr = x + 1 < size ? x + 1 : x;
            uint32_t zd = z > 0 ? z - 1 : z;
            uint32_t zu = z + 1 < size ? z + 1 : z;

            float dhdx = (getGridHeight(xr, z) - getGridHeight(xl, z)) / (static_cast<float>(xr - xl) * stepX_);
            float dhdz = (getGridHeight(x, zu) - getGridHeight(x, zd)) / (static_cast<float>(zu - zd) * stepZ_);
            mesh_.normals[static_cast<size_t>(z) * size + x] = glm::normalize(glm::vec3(-dhdx, 1.0f, -dhdz));
        }
    }

    mesh_.indices.clear();
    mesh_.indices.reserve(static_cast<size_t>(size - 1) * (size - 1) * 6);
    auto vertex = [size](uint32_t x, uint32_t z) { return z * size + x; };
    for (uint32_t z = 0; z + 1 < size; ++z) {
        for (uint32_t x = 0; x + 1 < size; ++x) {
            mesh_.indices.push_back(vertex(x, z));
            mesh_.indices.push_back(vertex(x, z + 1));
            mesh_.indices.push_back(vertex(x + 1, z));

            mesh_.indices.push_back(vertex(x + 1, z));
            mesh_.indices.push_back(vertex(x, z + 1));
            mesh_.indices.push_back(vertex(x + 1, z + 1));
        }
    }
}

float ProceduralTerrain::getGridHeight(uint32_t x, uint32_t z) const {
    return heights_[TerrainHeight::index(x, z, config_.size)];
}

float ProceduralTerrain::getHeightAt(float x, float z) const {
    float gx = (x + config_.halfWidth()) / stepX_;
    float gz = (z + config_.halfDepth()) / stepZ_;
    return TerrainHeight::sampleBilinear(gx, gz, heights_.data(), config_.size);
}

float ProceduralTerrain::estimateSlope(float x, float z, float epsilon) const {
    float hL = getHeightAt(x - epsilon, z);
    float hR = getHeightAt(x + epsilon, z);
    float hD = getHeightAt(x, z - epsilon);
    float hU = getHeightAt(x, z + epsilon);

    float dhdx = (hR - hL) / (2.0f * epsilon);
    float dhdz = (hU - hD) / (2.0f * epsilon);
    return TerrainHeight::slopeFromGradient(dhdx, dhdz);
}

void ProceduralTerrain::validateColliderGeometry(const std::vector<glm::vec3>& positions,
                                                 const std::vector<uint32_t>& indices) {
    if (positions.empty()) {
        throw std::runtime_error("Terrain geometry has no vertices");
    }
    if (indices.empty()) {
        throw std::runtime_error("Terrain geometry is missing indices");
    }
    if (indices.size() % 3 != 0) {
        throw std::runtime_error("Terrain geometry index count " + std::to_string(indices.size()) +
                                 " is not a multiple of 3");
    }
    for (uint32_t idx : indices) {
        if (idx >= positions.size()) {
            throw std::runtime_error("Terrain geometry index " + std::to_string(idx) +
                                     " out of range for " + std::to_string(positions.size()) + " vertices");
        }
    }
}

void ProceduralTerrain::bindPhysics(IPhysicsWorld& physics) {
    if (colliders_.physics() != &physics) {
        colliders_ = ScopedBodySet(&physics);
    }
}

PhysicsBodyID ProceduralTerrain::addPhysicsCollider(IPhysicsWorld& physics) {
    validateColliderGeometry(mesh_.positions, mesh_.indices);
    bindPhysics(physics);

    PhysicsBodyID id = physics.createStaticTriangleMesh(mesh_.positions, mesh_.indices, COLLIDER_FRICTION);
    if (id == INVALID_BODY_ID) {
        throw std::runtime_error("Terrain: physics world rejected the terrain collider");
    }
    colliders_.adopt(id);

    SDL_Log("Terrain: collider created (%zu triangles)", mesh_.indices.size() / 3);
    return id;
}

void ProceduralTerrain::addBoundaryColliders(IPhysicsWorld& physics) {
    bindPhysics(physics);

    const float halfW = config_.halfWidth();
    const float halfD = config_.halfDepth();
    const float t = WALL_THICKNESS;
    const float h = WALL_HEIGHT;

    const glm::quat identity(1, 0, 0, 0);
    PhysicsBodyID ids[] = {
        physics.createStaticBox(glm::vec3(halfW + t, h, 0.0f), glm::vec3(t, h, halfD + t), identity, COLLIDER_FRICTION),
        physics.createStaticBox(glm::vec3(-halfW - t, h, 0.0f), glm::vec3(t, h, halfD + t), identity, COLLIDER_FRICTION),
        physics.createStaticBox(glm::vec3(0.0f, h, halfD + t), glm::vec3(halfW + t, h, t), identity, COLLIDER_FRICTION),
        physics.createStaticBox(glm::vec3(0.0f, h, -halfD - t), glm::vec3(halfW + t, h, t), identity, COLLIDER_FRICTION),
        // Half extents span the whole world twice over so nothing falls past it
        physics.createStaticBox(glm::vec3(0.0f, SAFETY_FLOOR_Y, 0.0f),
                                glm::vec3(config_.width, SAFETY_FLOOR_HALF_HEIGHT, config_.depth),
                                identity, COLLIDER_FRICTION),
    };

    int created = 0;
    for (PhysicsBodyID id : ids) {
        if (colliders_.adopt(id) != INVALID_BODY_ID) ++created;
    }
    if (created != 5) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Terrain: only %d of 5 boundary colliders created", created);
    }
}
