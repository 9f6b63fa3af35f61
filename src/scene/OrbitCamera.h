#pragma once

#include "physics/IPhysicsWorld.h"

#include <glm/glm.hpp>
#include <stdexcept>

struct OrbitCameraConfig {
    float yaw = 0.0f;
    float pitch = -0.35f;
    float distance = 8.5f;
    float height = 2.4f;             // Look target above the followed position
    float sensitivity = 0.002f;      // Radians per mouse unit
    float minPitch = -1.2f;
    float maxPitch = 0.25f;
    float minDistance = 0.4f;        // Closest an occluder may pull the camera in
    float occlusionPadding = 0.2f;
    float positionSmoothSpeed = 14.0f;
    float targetSmoothSpeed = 16.0f;

    void validate() const {
        if (minPitch > maxPitch) {
            throw std::invalid_argument("OrbitCameraConfig: minPitch must not exceed maxPitch");
        }
        if (distance < 0.0f || minDistance < 0.0f) {
            throw std::invalid_argument("OrbitCameraConfig: distances must not be negative");
        }
    }
};

/**
 * OrbitCamera - Third-person follow camera orbiting the character
 *
 * Yaw and pitch come from accumulated mouse motion. The desired position sits
 * behind the target; a ray from the target toward it pulls the camera in
 * front of anything in between. Position and look target then follow with
 * frame-rate independent exponential smoothing.
 */
class OrbitCamera {
public:
    explicit OrbitCamera(const OrbitCameraConfig& config = {});

    // ignoreBody is typically the character capsule
    void update(float deltaTime, const glm::vec2& mouseDelta, const glm::vec3& followPosition,
                const IPhysicsWorld& physics, PhysicsBodyID ignoreBody = INVALID_BODY_ID);

    // Jump straight to the current desired pose (after a teleport)
    void snap(const glm::vec3& followPosition);

    glm::mat4 getViewMatrix() const;

    float getYaw() const { return yaw_; }
    float getPitch() const { return pitch_; }
    const glm::vec3& getPosition() const { return currentPosition_; }
    const glm::vec3& getLookTarget() const { return currentTarget_; }
    const glm::vec3& getDesiredPosition() const { return desiredPosition_; }
    bool wasOccluded() const { return occluded_; }

    // Unoccluded camera position for a look target and orientation
    static glm::vec3 orbitPosition(const glm::vec3& target, float yaw, float pitch, float distance, float height);

private:
    OrbitCameraConfig config_;
    float yaw_;
    float pitch_;

    glm::vec3 currentPosition_{0.0f, 5.0f, 10.0f};
    glm::vec3 currentTarget_{0.0f};
    glm::vec3 desiredPosition_{0.0f};
    bool occluded_ = false;
};
