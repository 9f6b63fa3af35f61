#include "WorldSimulation.h"

#include <SDL3/SDL_log.h>
#include <exception>

WorldSimulation::WorldSimulation(IPhysicsWorld& physics, const WorldConfig& config)
    : physics_(physics)
    , config_(config)
    , sessionSalt_(config.sessionSalt)
    , camera_(config.camera) {
    config_.validate();

    terrain_ = std::make_unique<ProceduralTerrain>(config_.terrain);
    terrain_->addPhysicsCollider(physics_);
    terrain_->addBoundaryColliders(physics_);

    scenery_ = std::make_unique<Scenery>(*terrain_, physics_, config_.scenery);
    goal_ = std::make_unique<GoalSite>(*terrain_, physics_, config_.goal, sessionSalt_);
    collectibles_ = std::make_unique<Collectibles>(*terrain_, config_.collectibles, sessionSalt_);

    spawn_ = glm::vec3(0.0f, terrain_->getHeightAt(0.0f, 0.0f) + config_.spawnLift, 0.0f);
    CharacterConfig characterConfig = config_.character;
    characterConfig.spawn = spawn_;
    character_ = std::make_unique<CharacterController>(physics_, characterConfig);

    camera_.snap(spawn_);

    SDL_Log("WorldSimulation: ready (%zu trees, %zu rocks, %d berries, spawn y=%.2f)",
            scenery_->getTrees().size(), scenery_->getRocks().size(),
            collectibles_->totalCount(), spawn_.y);
}

bool WorldSimulation::tick(float deltaTime, const InputState& input) {
    stats_.frames++;
    try {
        runFrame(deltaTime, input);
        return true;
    } catch (const std::exception& e) {
        stats_.failedFrames++;
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "WorldSimulation: frame %llu failed: %s",
                     static_cast<unsigned long long>(stats_.frames), e.what());
        return false;
    }
}

void WorldSimulation::runFrame(float deltaTime, const InputState& input) {
    const glm::vec2 mouseDelta = mouse_.consume();
    const bool allowMove = !character_->isCelebrating();

    character_->applyInput(deltaTime, camera_.getYaw(), input, allowMove);
    physics_.update(deltaTime);
    character_->sync(deltaTime, true);

    const glm::vec3& position = character_->getPosition();
    int picked = collectibles_->collectNear(position);
    if (picked > 0) {
        stats_.berriesCollected += picked;
        SDL_Log("WorldSimulation: collected %d berr%s (%d left)",
                picked, picked == 1 ? "y" : "ies", collectibles_->remainingCount());
    }
    collectibles_->update(deltaTime);

    // Celebrate once per arrival; leaving the yard re-arms it
    bool atGoal = goal_->isPlayerAtGoal(position);
    if (atGoal && !atGoal_) {
        stats_.goalArrivals++;
        character_->startCelebration();
        SDL_Log("WorldSimulation: reached the owner");
    }
    atGoal_ = atGoal;

    camera_.update(deltaTime, mouseDelta, position, physics_, character_->getBodyID());
}

void WorldSimulation::reset(uint32_t sessionSalt) {
    sessionSalt_ = sessionSalt;
    goal_->reset(sessionSalt);
    collectibles_->reset(sessionSalt);
    character_->teleport(spawn_);
    camera_.snap(spawn_);
    atGoal_ = false;

    SDL_Log("WorldSimulation: reset with salt %u", sessionSalt);
}
