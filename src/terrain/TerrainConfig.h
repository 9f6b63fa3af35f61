#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

// Immutable description of a generated heightfield world
struct TerrainConfig {
    uint32_t size = 513;          // Grid resolution per side, must be odd
    float width = 1000.0f;        // World extent along X
    float depth = 1000.0f;        // World extent along Z
    float maxHeight = 55.0f;      // Peak amplitude of the noise term
    int32_t seed = 1337;
    float borderWidth = 120.0f;   // Band along each edge where the ridge rises
    float borderHeight = 140.0f;  // Ridge height at the very edge

    float halfWidth() const { return width * 0.5f; }
    float halfDepth() const { return depth * 0.5f; }

    // Throws std::invalid_argument describing the first violated constraint
    void validate() const {
        if (size < 3) {
            throw std::invalid_argument("TerrainConfig: size must be at least 3, got " + std::to_string(size));
        }
        if (size % 2 == 0) {
            throw std::invalid_argument("TerrainConfig: size must be odd, got " + std::to_string(size));
        }
        if (!(width > 0.0f) || !(depth > 0.0f)) {
            throw std::invalid_argument("TerrainConfig: width and depth must be positive");
        }
        if (maxHeight < 0.0f) {
            throw std::invalid_argument("TerrainConfig: maxHeight must not be negative");
        }
        if (borderWidth < 0.0f || borderHeight < 0.0f) {
            throw std::invalid_argument("TerrainConfig: border width and height must not be negative");
        }
    }
};
