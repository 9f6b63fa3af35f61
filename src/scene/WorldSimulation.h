#pragma once

#include "WorldConfig.h"
#include "InputState.h"
#include "CharacterController.h"
#include "OrbitCamera.h"
#include "physics/IPhysicsWorld.h"
#include "terrain/ProceduralTerrain.h"
#include "world/Scenery.h"
#include "world/Collectibles.h"
#include "world/GoalSite.h"

#include <cstdint>
#include <memory>

// Running totals reported by the headless driver
struct SimulationStats {
    uint64_t frames = 0;
    uint64_t failedFrames = 0;      // Frames whose pipeline threw and was skipped
    int berriesCollected = 0;
    int goalArrivals = 0;
};

/**
 * WorldSimulation - Owns a complete world and drives it frame by frame
 *
 * Construction builds, in order: terrain and its colliders, scenery, goal
 * site, collectibles, character (spawned above the terrain at the origin)
 * and camera. The physics world is injected and must outlive the simulation.
 *
 * tick() never lets an exception escape: a failing frame is logged, counted
 * and skipped, and the next frame runs normally.
 */
class WorldSimulation {
public:
    // Throws std::invalid_argument / std::runtime_error if the world cannot be built
    WorldSimulation(IPhysicsWorld& physics, const WorldConfig& config);

    WorldSimulation(const WorldSimulation&) = delete;
    WorldSimulation& operator=(const WorldSimulation&) = delete;

    // Mouse motion since the last frame; drained by the next tick()
    void addMouseDelta(float dx, float dy) { mouse_.add(dx, dy); }

    // Returns false if the frame threw
    bool tick(float deltaTime, const InputState& input);

    // New goal and berry layouts, character back at spawn
    void reset(uint32_t sessionSalt);

    const ProceduralTerrain& getTerrain() const { return *terrain_; }
    const Scenery& getScenery() const { return *scenery_; }
    const Collectibles& getCollectibles() const { return *collectibles_; }
    Collectibles& getCollectibles() { return *collectibles_; }
    const GoalSite& getGoal() const { return *goal_; }
    const CharacterController& getCharacter() const { return *character_; }
    CharacterController& getCharacter() { return *character_; }
    const OrbitCamera& getCamera() const { return camera_; }
    const SimulationStats& getStats() const { return stats_; }
    const glm::vec3& getSpawnPosition() const { return spawn_; }
    uint32_t getSessionSalt() const { return sessionSalt_; }

private:
    void runFrame(float deltaTime, const InputState& input);

    IPhysicsWorld& physics_;
    WorldConfig config_;
    uint32_t sessionSalt_ = 0;
    glm::vec3 spawn_{0.0f};

    std::unique_ptr<ProceduralTerrain> terrain_;
    std::unique_ptr<Scenery> scenery_;
    std::unique_ptr<GoalSite> goal_;
    std::unique_ptr<Collectibles> collectibles_;
    std::unique_ptr<CharacterController> character_;
    OrbitCamera camera_;
    MouseDeltaAccumulator mouse_;

    bool atGoal_ = false;
    SimulationStats stats_;
};
