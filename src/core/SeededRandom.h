#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <cmath>
#include <cstdint>

/**
 * SeededRandom - Deterministic float stream for procedural generation
 *
 * Mulberry32-style generator: a Weyl increment followed by two
 * multiply/xorshift folds. Every bit of the output depends on every bit of
 * the state, so the low bits stay usable when a draw is scaled by a small
 * integer (cluster picks, index selection).
 *
 * Two generators built from the same seed produce identical streams for any
 * number of draws. There is no hidden entropy: per-session variation must be
 * passed in through mixSeed().
 */
class SeededRandom {
public:
    explicit SeededRandom(int32_t seed) : state_(static_cast<uint32_t>(seed)) {}

    // Combine a layout seed with an explicit session salt
    static int32_t mixSeed(int32_t seed, uint32_t salt) {
        uint32_t h = static_cast<uint32_t>(seed) ^ (salt * 0x9E3779B9u);
        h ^= h >> 16;
        h *= 0x85EBCA6Bu;
        h ^= h >> 13;
        return static_cast<int32_t>(h);
    }

    // Uniform float in [0, 1)
    float next() {
        state_ += 0x6D2B79F5u;
        uint32_t t = (state_ ^ (state_ >> 15)) * (state_ | 1u);
        t = (t + ((t ^ (t >> 7)) * (t | 61u))) ^ t;
        t ^= t >> 14;
        // Top 24 bits map exactly onto the float mantissa, so 1.0 is never produced
        return static_cast<float>(t >> 8) * (1.0f / 16777216.0f);
    }

    // Uniform float in [minVal, maxVal)
    float range(float minVal, float maxVal) {
        return minVal + next() * (maxVal - minVal);
    }

    // Uniform integer in [0, count); returns 0 when count is 0
    uint32_t index(uint32_t count) {
        if (count == 0) return 0;
        uint32_t i = static_cast<uint32_t>(next() * static_cast<float>(count));
        return i < count ? i : count - 1;
    }

    // Uniform angle in [0, 2*pi)
    float angle() {
        return next() * glm::two_pi<float>();
    }

    // +1 or -1 with equal probability
    float sign() {
        return next() > 0.5f ? 1.0f : -1.0f;
    }

    // Area-uniform point in a disk of the given radius (XZ plane)
    glm::vec2 diskPoint(float radius) {
        float a = angle();
        float r = std::sqrt(next()) * radius;
        return glm::vec2(std::cos(a) * r, std::sin(a) * r);
    }

    uint32_t state() const { return state_; }

private:
    uint32_t state_;
};
