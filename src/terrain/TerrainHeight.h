#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/noise.hpp>
#include <cstdint>
#include <cmath>
#include <algorithm>

// ============================================================================
// TERRAIN HEIGHT FUNCTIONS
// ============================================================================
// Heightfields are stored column-major: heights[x * size + z], where x and z
// are grid indices and grid (0, 0) sits at world (-width/2, -depth/2).
//
//   worldY = shape(fbm(x, z)) * maxHeight + borderRise(x, z)
//
// The generator, the collider and every placement query read heights through
// these helpers. DO NOT duplicate the layout or the formula elsewhere.
// ============================================================================

namespace TerrainHeight {

// Cubic ease t^2 (3 - 2t)
inline float smoothstep(float t) {
    return t * t * (3.0f - 2.0f * t);
}

// Octave sum of glm::simplex, normalised by the amplitude total.
// Every octave samples at its own offset; the offsets carry the seed.
inline float fbm(const glm::vec2& p, const glm::vec2* octaveOffsets, int octaves, float baseFrequency) {
    float value = 0.0f;
    float amplitudeSum = 0.0f;
    float amplitude = 1.0f;
    float frequency = baseFrequency;

    for (int i = 0; i < octaves; i++) {
        value += amplitude * glm::simplex(p * frequency + octaveOffsets[i]);
        amplitudeSum += amplitude;
        amplitude *= 0.5f;
        frequency *= 2.0f;
    }
    return value / amplitudeSum;
}

// Signed power shaping: flattens plains, sharpens peaks
inline float shapeNoise(float n, float maxHeight) {
    float magnitude = std::pow(std::abs(n), 1.35f);
    return (n < 0.0f ? -magnitude : magnitude) * maxHeight;
}

// Enclosing ridge raised toward the edges of the world
inline float borderRise(float worldX, float worldZ, float halfWidth, float halfDepth,
                        float borderWidth, float borderHeight) {
    if (borderWidth <= 0.0f) return 0.0f;
    float distToEdge = std::min(halfWidth - std::abs(worldX), halfDepth - std::abs(worldZ));
    if (distToEdge >= borderWidth) return 0.0f;

    float t = 1.0f - distToEdge / borderWidth;
    return smoothstep(t) * borderHeight;
}

// Grid index of a column-major heightfield sample
inline uint32_t index(uint32_t x, uint32_t z, uint32_t size) {
    return x * size + z;
}

// Bilinear sample at fractional grid coordinates.
// gx, gz: grid-space coordinates (may be outside [0, size-1], indices clamp)
// data: column-major float array of size * size
inline float sampleBilinear(float gx, float gz, const float* data, uint32_t size) {
    float fx0 = std::floor(gx);
    float fz0 = std::floor(gz);
    float tx = gx - fx0;
    float tz = gz - fz0;

    const float maxIndex = static_cast<float>(size - 1);
    uint32_t x0 = static_cast<uint32_t>(std::clamp(fx0, 0.0f, maxIndex));
    uint32_t x1 = static_cast<uint32_t>(std::clamp(fx0 + 1.0f, 0.0f, maxIndex));
    uint32_t z0 = static_cast<uint32_t>(std::clamp(fz0, 0.0f, maxIndex));
    uint32_t z1 = static_cast<uint32_t>(std::clamp(fz0 + 1.0f, 0.0f, maxIndex));

    float h00 = data[index(x0, z0, size)];
    float h10 = data[index(x1, z0, size)];
    float h01 = data[index(x0, z1, size)];
    float h11 = data[index(x1, z1, size)];

    float hx0 = h00 + (h10 - h00) * tx;
    float hx1 = h01 + (h11 - h01) * tx;
    return hx0 + (hx1 - hx0) * tz;
}

// Slope angle (radians) of a surface with the given height gradient
inline float slopeFromGradient(float dhdx, float dhdz) {
    return std::atan(std::sqrt(dhdx * dhdx + dhdz * dhdz));
}

} // namespace TerrainHeight
