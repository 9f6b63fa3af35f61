#pragma once

#include <glm/glm.hpp>

// Axis-aligned bounds of a loaded model in its local space
struct ModelBounds {
    glm::vec3 min{0.0f};
    glm::vec3 max{0.0f};

    glm::vec3 size() const { return max - min; }
};

// Uniform scale and vertical offset that place a model on a body
struct ModelFit {
    float scale = 1.0f;
    float offsetY = 0.0f;
    bool scaled = false;   // false when the bounds were degenerate

    // Heights at or below this are treated as degenerate and never divided by
    static constexpr float MIN_EXTENT = 1e-4f;

    // Scale the model to targetHeight, then shift it so its lowest point sits at desiredMinY.
    // Degenerate bounds leave the model untouched (scale 1, no shift).
    static ModelFit heightAndGround(const ModelBounds& bounds, float targetHeight, float desiredMinY) {
        ModelFit fit;
        float height = bounds.size().y;
        if (height <= MIN_EXTENT) return fit;

        fit.scale = targetHeight / height;
        fit.offsetY = desiredMinY - bounds.min.y * fit.scale;
        fit.scaled = true;
        return fit;
    }

    // Scale that normalises the model to unit height (1 for degenerate bounds)
    static float unitHeightScale(const ModelBounds& bounds) {
        float height = bounds.size().y;
        return height > MIN_EXTENT ? 1.0f / height : 1.0f;
    }
};
