#pragma once

#include "TerrainConfig.h"
#include "physics/IPhysicsWorld.h"
#include "physics/ScopedBodySet.h"

#include <glm/glm.hpp>
#include <vector>
#include <cstdint>

// Render/collision geometry of the heightfield (vertex i = z * size + x)
struct TerrainMesh {
    std::vector<glm::vec3> positions;
    std::vector<glm::vec3> normals;
    std::vector<uint32_t> indices;   // Two CCW-from-above triangles per cell
};

/**
 * ProceduralTerrain - Seeded heightfield with the collider built from it
 *
 * The heightfield, mesh and grid spacing are produced once in the constructor
 * and never change. All world-space queries go through bilinear sampling of
 * the same samples the mesh was built from.
 */
class ProceduralTerrain {
public:
    // Throws std::invalid_argument if the config does not validate
    explicit ProceduralTerrain(const TerrainConfig& config);

    ProceduralTerrain(const ProceduralTerrain&) = delete;
    ProceduralTerrain& operator=(const ProceduralTerrain&) = delete;

    const TerrainConfig& getConfig() const { return config_; }
    const std::vector<float>& getHeights() const { return heights_; }
    const TerrainMesh& getMesh() const { return mesh_; }
    float getStepX() const { return stepX_; }
    float getStepZ() const { return stepZ_; }

    // Raw grid sample (column-major)
    float getGridHeight(uint32_t x, uint32_t z) const;

    // Bilinear height at any finite world position (clamped outside the grid)
    float getHeightAt(float x, float z) const;

    // Central-difference slope angle in radians
    float estimateSlope(float x, float z, float epsilon = 2.0f) const;

    // Static triangle mesh collider, friction 1.0.
    // Throws std::runtime_error if the mesh is not indexed triangle geometry
    // or the physics world rejects it.
    PhysicsBodyID addPhysicsCollider(IPhysicsWorld& physics);

    // Four walls just outside the edges plus a deep safety floor
    void addBoundaryColliders(IPhysicsWorld& physics);

    // Remove every collider this terrain created
    void removeColliders() { colliders_.release(); }
    size_t getColliderCount() const { return colliders_.size(); }

    // Throws std::runtime_error describing what is wrong with the buffers
    static void validateColliderGeometry(const std::vector<glm::vec3>& positions,
                                         const std::vector<uint32_t>& indices);

    static constexpr float WALL_THICKNESS = 5.0f;
    static constexpr float WALL_HEIGHT = 80.0f;
    static constexpr float SAFETY_FLOOR_Y = -260.0f;
    static constexpr float SAFETY_FLOOR_HALF_HEIGHT = 40.0f;

private:
    void generateHeights();
    void buildMesh();
    void bindPhysics(IPhysicsWorld& physics);

    TerrainConfig config_;
    float stepX_ = 1.0f;
    float stepZ_ = 1.0f;
    std::vector<float> heights_;
    TerrainMesh mesh_;
    ScopedBodySet colliders_;
};
