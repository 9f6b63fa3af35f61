#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cstdint>
#include <vector>

// Physics body handle
using PhysicsBodyID = uint32_t;
constexpr PhysicsBodyID INVALID_BODY_ID = 0xFFFFFFFF;

struct RaycastHit {
    bool hit = false;
    float distance = 0.0f;
    PhysicsBodyID bodyId = INVALID_BODY_ID;
    glm::vec3 position{0.0f};
    glm::vec3 normal{0.0f, 1.0f, 0.0f};
};

// Dynamic capsule used for the controlled character
struct CharacterBodySettings {
    glm::vec3 position{0.0f};
    float halfHeight = 0.55f;     // Cylinder half height, hemispheres excluded
    float radius = 0.45f;
    float mass = 30.0f;
    float friction = 1.0f;
    float restitution = 0.0f;
    float linearDamping = 0.4f;
    bool lockRotation = true;
    bool continuousCollision = true;
};

/**
 * IPhysicsWorld - The narrow physics contract the simulation core depends on
 *
 * PhysicsWorld implements it on top of Jolt. Gameplay components only create
 * bodies, remove the ones they created, cast rays and read/write velocities,
 * so everything above the physics layer can be exercised without Jolt.
 *
 * Creation calls return INVALID_BODY_ID on failure; the caller owns every ID
 * it receives and must hand it back through removeBody().
 */
class IPhysicsWorld {
public:
    virtual ~IPhysicsWorld() = default;

    // Advance the simulation by a variable frame time (fixed internal step)
    virtual void update(float deltaTime) = 0;

    virtual PhysicsBodyID createCharacterBody(const CharacterBodySettings& settings) = 0;

    virtual PhysicsBodyID createStaticBox(const glm::vec3& position, const glm::vec3& halfExtents,
                                          const glm::quat& rotation = glm::quat(1, 0, 0, 0),
                                          float friction = 1.0f) = 0;
    virtual PhysicsBodyID createStaticCylinder(const glm::vec3& position, float halfHeight, float radius,
                                               float friction = 1.0f) = 0;
    virtual PhysicsBodyID createStaticSphere(const glm::vec3& position, float radius,
                                             float friction = 1.0f) = 0;
    virtual PhysicsBodyID createStaticTriangleMesh(const std::vector<glm::vec3>& positions,
                                                   const std::vector<uint32_t>& indices,
                                                   float friction = 1.0f) = 0;

    virtual void removeBody(PhysicsBodyID bodyID) = 0;

    // Closest hit along direction within maxDistance; ignoreBody is skipped (self-exclusion)
    virtual RaycastHit castRay(const glm::vec3& origin, const glm::vec3& direction, float maxDistance,
                               PhysicsBodyID ignoreBody = INVALID_BODY_ID) const = 0;

    virtual glm::vec3 getBodyPosition(PhysicsBodyID bodyID) const = 0;
    virtual void setBodyPosition(PhysicsBodyID bodyID, const glm::vec3& position) = 0;
    virtual glm::vec3 getBodyVelocity(PhysicsBodyID bodyID) const = 0;
    virtual void setBodyVelocity(PhysicsBodyID bodyID, const glm::vec3& velocity) = 0;
};
