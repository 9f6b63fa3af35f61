#pragma once

#include <glm/glm.hpp>

// Per-frame input snapshot derived from the device layer
struct InputState {
    float forward = 0.0f;      // -1..1, positive away from the camera
    float right = 0.0f;        // -1..1
    bool runHeld = false;      // Movement modifier (slows to a walk while held)
    bool jumpPressed = false;  // Edge: true only on the frame the key went down
    bool jumpHeld = false;
};

// Mouse motion collected between frames; the simulation drains it once per frame
class MouseDeltaAccumulator {
public:
    void add(float dx, float dy) {
        delta_.x += dx;
        delta_.y += dy;
    }

    glm::vec2 consume() {
        glm::vec2 d = delta_;
        delta_ = glm::vec2(0.0f);
        return d;
    }

private:
    glm::vec2 delta_{0.0f};
};
