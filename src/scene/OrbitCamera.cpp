#include "OrbitCamera.h"
#include "core/MotionMath.h"

#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>
#include <algorithm>
#include <cmath>

OrbitCamera::OrbitCamera(const OrbitCameraConfig& config)
    : config_(config)
    , yaw_(config.yaw)
    , pitch_(config.pitch) {
    config_.validate();
}

glm::vec3 OrbitCamera::orbitPosition(const glm::vec3& target, float yaw, float pitch, float distance, float height) {
    glm::vec3 behind = glm::angleAxis(yaw, glm::vec3(0.0f, 1.0f, 0.0f)) * glm::vec3(0.0f, 0.0f, 1.0f);
    behind.y = 0.0f;
    behind = glm::normalize(behind);

    glm::vec3 position = target + behind * distance;
    position.y += std::sin(pitch) * distance + height * 0.2f;
    return position;
}

void OrbitCamera::update(float deltaTime, const glm::vec2& mouseDelta, const glm::vec3& followPosition,
                         const IPhysicsWorld& physics, PhysicsBodyID ignoreBody) {
    yaw_ -= mouseDelta.x * config_.sensitivity;
    pitch_ -= mouseDelta.y * config_.sensitivity;
    pitch_ = std::clamp(pitch_, config_.minPitch, config_.maxPitch);

    glm::vec3 target = followPosition + glm::vec3(0.0f, config_.height, 0.0f);
    desiredPosition_ = orbitPosition(target, yaw_, pitch_, config_.distance, config_.height);

    // Pull in front of whatever blocks the line of sight
    occluded_ = false;
    glm::vec3 toCamera = desiredPosition_ - target;
    float len = glm::length(toCamera);
    if (len > 1e-4f) {
        glm::vec3 dir = toCamera / len;
        RaycastHit hit = physics.castRay(target, dir, len, ignoreBody);
        if (hit.hit) {
            float safe = std::max(config_.minDistance, hit.distance - config_.occlusionPadding);
            desiredPosition_ = target + dir * safe;
            occluded_ = true;
        }
    }

    currentPosition_ = MotionMath::damp(currentPosition_, desiredPosition_, config_.positionSmoothSpeed, deltaTime);
    currentTarget_ = MotionMath::damp(currentTarget_, target, config_.targetSmoothSpeed, deltaTime);
}

void OrbitCamera::snap(const glm::vec3& followPosition) {
    currentTarget_ = followPosition + glm::vec3(0.0f, config_.height, 0.0f);
    desiredPosition_ = orbitPosition(currentTarget_, yaw_, pitch_, config_.distance, config_.height);
    currentPosition_ = desiredPosition_;
    occluded_ = false;
}

glm::mat4 OrbitCamera::getViewMatrix() const {
    return glm::lookAt(currentPosition_, currentTarget_, glm::vec3(0.0f, 1.0f, 0.0f));
}
