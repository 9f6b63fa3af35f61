#pragma once

#include "IPhysicsWorld.h"
#include "FixedTimestep.h"

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <vector>
#include <memory>
#include <optional>
#include <cstdint>

// Forward declarations for Jolt types
namespace JPH {
    class PhysicsSystem;
    class TempAllocatorImpl;
    class JobSystemThreadPool;
    class ShapeSettings;
}

/**
 * PhysicsWorld - Jolt-backed implementation of IPhysicsWorld
 *
 * update() feeds the render frame time through a FixedTimestep, so Jolt is
 * only ever stepped at exactly 1/60 s regardless of the display rate.
 */
class PhysicsWorld final : public IPhysicsWorld {
public:
    // Factory: returns nullopt on failure
    static std::optional<PhysicsWorld> create();

    // Move-only (RAII handles are non-copyable)
    PhysicsWorld(PhysicsWorld&&) noexcept;
    PhysicsWorld& operator=(PhysicsWorld&&) noexcept;
    PhysicsWorld(const PhysicsWorld&) = delete;
    PhysicsWorld& operator=(const PhysicsWorld&) = delete;

    ~PhysicsWorld() override;

    // Simulation
    void update(float deltaTime) override;

    // Dynamic, rotation-lockable capsule
    PhysicsBodyID createCharacterBody(const CharacterBodySettings& settings) override;

    // Static colliders
    PhysicsBodyID createStaticBox(const glm::vec3& position, const glm::vec3& halfExtents,
                                  const glm::quat& rotation = glm::quat(1, 0, 0, 0),
                                  float friction = 1.0f) override;
    PhysicsBodyID createStaticCylinder(const glm::vec3& position, float halfHeight, float radius,
                                       float friction = 1.0f) override;
    PhysicsBodyID createStaticSphere(const glm::vec3& position, float radius,
                                     float friction = 1.0f) override;

    // Triangle soup with counter-clockwise (seen from the front) winding
    PhysicsBodyID createStaticTriangleMesh(const std::vector<glm::vec3>& positions,
                                           const std::vector<uint32_t>& indices,
                                           float friction = 1.0f) override;

    void removeBody(PhysicsBodyID bodyID) override;

    RaycastHit castRay(const glm::vec3& origin, const glm::vec3& direction, float maxDistance,
                       PhysicsBodyID ignoreBody = INVALID_BODY_ID) const override;

    glm::vec3 getBodyPosition(PhysicsBodyID bodyID) const override;
    void setBodyPosition(PhysicsBodyID bodyID, const glm::vec3& position) override;
    glm::vec3 getBodyVelocity(PhysicsBodyID bodyID) const override;
    void setBodyVelocity(PhysicsBodyID bodyID, const glm::vec3& velocity) override;

    // Debug
    int getBodyCount() const;
    long long getStepCount() const { return timestep_.totalSteps(); }

private:
    PhysicsWorld();  // Private: only factory can construct
    bool initInternal();

    PhysicsBodyID addStaticBody(const JPH::ShapeSettings& shapeSettings, const glm::vec3& position,
                                const glm::quat& rotation, float friction, const char* what);

    // Process-wide Jolt registration, shared by every live world; the last one unregisters
    struct JoltGlobals;
    std::shared_ptr<JoltGlobals> joltGlobals_;

    std::unique_ptr<JPH::TempAllocatorImpl> tempAllocator_;
    std::unique_ptr<JPH::JobSystemThreadPool> jobSystem_;
    std::unique_ptr<JPH::PhysicsSystem> physicsSystem_;

    FixedTimestep timestep_;
};
