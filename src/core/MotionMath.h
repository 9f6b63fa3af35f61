#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <cmath>

// Scalar helpers shared by the controller, camera and collectible animation
namespace MotionMath {

// Move current toward target by at most maxDelta (linear rate cap)
inline float approach(float current, float target, float maxDelta) {
    float delta = target - current;
    if (std::abs(delta) <= maxDelta) return target;
    return current + (delta > 0.0f ? maxDelta : -maxDelta);
}

// Frame-rate independent exponential blend factor: 1 - e^(-lambda * dt)
inline float dampFactor(float lambda, float deltaTime) {
    return 1.0f - std::exp(-lambda * deltaTime);
}

inline float damp(float current, float target, float lambda, float deltaTime) {
    return current + (target - current) * dampFactor(lambda, deltaTime);
}

inline glm::vec3 damp(const glm::vec3& current, const glm::vec3& target, float lambda, float deltaTime) {
    return current + (target - current) * dampFactor(lambda, deltaTime);
}

// Wrap to [0, 2*pi)
inline float wrapAngle(float radians) {
    const float twoPi = glm::two_pi<float>();
    float wrapped = std::fmod(radians, twoPi);
    if (wrapped < 0.0f) wrapped += twoPi;
    return wrapped;
}

} // namespace MotionMath
