#pragma once

#include "PlacementEngine.h"
#include "scene/ModelFit.h"

#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <vector>

class ProceduralTerrain;

struct CollectiblesConfig {
    int32_t seed = 777;
    int totalCount = 70;
    int clusterMin = 4;
    int clusterMax = 6;
    float clusterRadius = 14.0f;
    float minDistanceFromSpawn = 40.0f;
    float pickupRadius = 1.8f;

    void validate() const {
        if (totalCount < 0) {
            throw std::invalid_argument("CollectiblesConfig: totalCount must not be negative");
        }
        if (clusterMin < 1 || clusterMin > clusterMax) {
            throw std::invalid_argument("CollectiblesConfig: cluster size range must satisfy 1 <= min <= max");
        }
        if (clusterRadius < 0.0f || minDistanceFromSpawn < 0.0f || pickupRadius < 0.0f) {
            throw std::invalid_argument("CollectiblesConfig: radii must not be negative");
        }
    }
};

struct Collectible {
    PlacementInstance placement;   // position is the pickup point, 0.6 above ground
    float baseScale = 1.0f;
    float phase = 0.0f;            // Pulse offset so neighbours do not beat in sync
    float popTimer = 0.0f;         // Counts down from POP_DURATION after pickup
    bool collected = false;
};

/**
 * Collectibles - Berry clusters the player picks up by walking through them
 *
 * Layout is seeded from config.seed mixed with an explicit session salt, so
 * a given (seed, salt) pair always yields the same berries. Collected berries
 * play a short pop (grow, then shrink to nothing) before they are hidden.
 */
class Collectibles {
public:
    static constexpr float POP_DURATION = 0.18f;
    static constexpr float PULSE_SPEED = 2.4f;
    static constexpr float PULSE_AMPLITUDE = 0.12f;
    static constexpr float SPIN_SPEED = 1.35f;
    static constexpr float HOVER_HEIGHT = 0.6f;

    Collectibles(const ProceduralTerrain& terrain, const CollectiblesConfig& config, uint32_t sessionSalt = 0);

    // Fixed layout without a terrain (reset() only clears the collected state)
    explicit Collectibles(const std::vector<glm::vec3>& positions, const CollectiblesConfig& config = {});

    // Regenerate the layout for a new session; everything becomes uncollected
    void reset(uint32_t sessionSalt);

    void update(float deltaTime);

    // Marks every uncollected berry within radius; returns how many were newly collected
    int collectNear(const glm::vec3& position, float radius);
    int collectNear(const glm::vec3& position) { return collectNear(position, config_.pickupRadius); }

    std::optional<glm::vec3> getNearestUncollected(const glm::vec3& from) const;

    // Render scale of a berry; 0 means hidden
    static float visualScale(float baseScale, float phase, float popTimer, bool collected, float time);
    float getVisualScale(size_t index) const;

    // Normalises the loaded berry model to unit height; degenerate bounds keep scale 1
    void setModel(const ModelBounds& bounds);
    float getModelScale() const { return templateScale_; }

    const std::vector<Collectible>& getInstances() const { return instances_; }
    int collectedCount() const;
    int remainingCount() const;
    int totalCount() const { return static_cast<int>(instances_.size()); }
    float getElapsedTime() const { return elapsed_; }
    const CollectiblesConfig& getConfig() const { return config_; }

private:
    void generateLayout(uint32_t sessionSalt);

    const ProceduralTerrain* terrain_ = nullptr;
    CollectiblesConfig config_;
    std::vector<Collectible> instances_;
    float elapsed_ = 0.0f;
    float templateScale_ = 1.0f;
};
