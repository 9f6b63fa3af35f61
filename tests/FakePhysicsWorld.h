#pragma once

#include "physics/IPhysicsWorld.h"

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <vector>

// Scripted stand-in for the Jolt world. Bodies are plain records; the only
// "simulation" is gravity plus a height function for character bodies.
class FakePhysicsWorld final : public IPhysicsWorld {
public:
    enum class Shape { Character, Box, Cylinder, Sphere, Mesh };

    struct Body {
        Shape shape = Shape::Box;
        glm::vec3 position{0.0f};
        glm::vec3 velocity{0.0f};
        glm::vec3 halfExtents{0.0f};
        glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
        float radius = 0.0f;
        float halfHeight = 0.0f;
        float friction = 0.0f;
        size_t triangleCount = 0;
    };

    struct RayQuery {
        glm::vec3 origin{0.0f};
        glm::vec3 direction{0.0f};
        float maxDistance = 0.0f;
        PhysicsBodyID ignoreBody = INVALID_BODY_ID;
    };

    // Ground under character bodies and downward rays; empty means no ground
    std::function<float(float, float)> groundHeight;
    glm::vec3 groundNormal{0.0f, 1.0f, 0.0f};

    // Returned for every ray that is not a downward ground probe
    std::optional<RaycastHit> scriptedHit;

    bool failCreation = false;
    bool throwOnUpdate = false;
    bool applyGravity = true;
    float gravity = -9.81f;

    std::map<PhysicsBodyID, Body> bodies;
    std::vector<PhysicsBodyID> removed;
    mutable std::vector<RayQuery> rays;
    int updateCalls = 0;
    float simulatedTime = 0.0f;

    void update(float deltaTime) override {
        updateCalls++;
        if (throwOnUpdate) throw std::runtime_error("scripted step failure");
        simulatedTime += deltaTime;

        for (auto& [id, body] : bodies) {
            if (body.shape != Shape::Character) continue;
            if (applyGravity) body.velocity.y += gravity * deltaTime;
            body.position += body.velocity * deltaTime;

            if (groundHeight) {
                float floor = groundHeight(body.position.x, body.position.z) + body.halfHeight + body.radius;
                if (body.position.y < floor) {
                    body.position.y = floor;
                    if (body.velocity.y < 0.0f) body.velocity.y = 0.0f;
                }
            }
        }
    }

    PhysicsBodyID createCharacterBody(const CharacterBodySettings& settings) override {
        Body body;
        body.shape = Shape::Character;
        body.position = settings.position;
        body.radius = settings.radius;
        body.halfHeight = settings.halfHeight;
        body.friction = settings.friction;
        return add(body);
    }

    PhysicsBodyID createStaticBox(const glm::vec3& position, const glm::vec3& halfExtents,
                                  const glm::quat& rotation = glm::quat(1, 0, 0, 0),
                                  float friction = 1.0f) override {
        Body body;
        body.shape = Shape::Box;
        body.position = position;
        body.halfExtents = halfExtents;
        body.rotation = rotation;
        body.friction = friction;
        return add(body);
    }

    PhysicsBodyID createStaticCylinder(const glm::vec3& position, float halfHeight, float radius,
                                       float friction = 1.0f) override {
        Body body;
        body.shape = Shape::Cylinder;
        body.position = position;
        body.halfHeight = halfHeight;
        body.radius = radius;
        body.friction = friction;
        return add(body);
    }

    PhysicsBodyID createStaticSphere(const glm::vec3& position, float radius, float friction = 1.0f) override {
        Body body;
        body.shape = Shape::Sphere;
        body.position = position;
        body.radius = radius;
        body.friction = friction;
        return add(body);
    }

    PhysicsBodyID createStaticTriangleMesh(const std::vector<glm::vec3>& positions,
                                           const std::vector<uint32_t>& indices, float friction = 1.0f) override {
        if (positions.empty() || indices.size() % 3 != 0) return INVALID_BODY_ID;
        Body body;
        body.shape = Shape::Mesh;
        body.triangleCount = indices.size() / 3;
        body.friction = friction;
        return add(body);
    }

    void removeBody(PhysicsBodyID bodyID) override {
        if (bodies.erase(bodyID) > 0) {
            removed.push_back(bodyID);
        }
    }

    RaycastHit castRay(const glm::vec3& origin, const glm::vec3& direction, float maxDistance,
                       PhysicsBodyID ignoreBody = INVALID_BODY_ID) const override {
        rays.push_back({origin, direction, maxDistance, ignoreBody});

        RaycastHit result;
        if (groundHeight && direction.y < -0.99f) {
            float distance = origin.y - groundHeight(origin.x, origin.z);
            if (distance >= 0.0f && distance <= maxDistance) {
                result.hit = true;
                result.distance = distance;
                result.position = origin + direction * distance;
                result.normal = groundNormal;
            }
            return result;
        }

        if (scriptedHit && scriptedHit->distance <= maxDistance) {
            result = *scriptedHit;
            result.position = origin + direction * result.distance;
        }
        return result;
    }

    glm::vec3 getBodyPosition(PhysicsBodyID bodyID) const override {
        auto it = bodies.find(bodyID);
        return it != bodies.end() ? it->second.position : glm::vec3(0.0f);
    }

    void setBodyPosition(PhysicsBodyID bodyID, const glm::vec3& position) override {
        auto it = bodies.find(bodyID);
        if (it != bodies.end()) it->second.position = position;
    }

    glm::vec3 getBodyVelocity(PhysicsBodyID bodyID) const override {
        auto it = bodies.find(bodyID);
        return it != bodies.end() ? it->second.velocity : glm::vec3(0.0f);
    }

    void setBodyVelocity(PhysicsBodyID bodyID, const glm::vec3& velocity) override {
        auto it = bodies.find(bodyID);
        if (it != bodies.end()) it->second.velocity = velocity;
    }

    size_t countShape(Shape shape) const {
        size_t n = 0;
        for (const auto& [id, body] : bodies) {
            if (body.shape == shape) ++n;
        }
        return n;
    }

    const Body& body(PhysicsBodyID bodyID) const { return bodies.at(bodyID); }

private:
    PhysicsBodyID add(const Body& body) {
        if (failCreation) return INVALID_BODY_ID;
        PhysicsBodyID id = nextId_++;
        bodies[id] = body;
        return id;
    }

    PhysicsBodyID nextId_ = 1;
};
