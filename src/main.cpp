#include "physics/PhysicsSystem.h"
#include "scene/WorldConfig.h"
#include "scene/WorldSimulation.h"

#include <SDL3/SDL_log.h>
#include <glm/gtc/quaternion.hpp>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string>

static void printUsage(const char* progName) {
    SDL_Log("Usage: %s [options]", progName);
    SDL_Log("");
    SDL_Log("  --config <path>    Load world settings from a JSON file");
    SDL_Log("  --frames <n>       Number of frames to simulate (default 600)");
    SDL_Log("  --dt <seconds>     Frame time fed to the simulation (default 1/60)");
    SDL_Log("  --salt <n>         Session salt for goal and berry layouts");
    SDL_Log("  --idle             Do not steer the character toward berries");
    SDL_Log("  --orbit <units>    Horizontal mouse motion fed every frame (default 0)");
}

// Steer toward the nearest berry, hopping when progress stalls
static InputState autopilot(const WorldSimulation& sim, uint64_t frame) {
    InputState input;

    const glm::vec3& position = sim.getCharacter().getPosition();
    std::optional<glm::vec3> berry = sim.getCollectibles().getNearestUncollected(position);
    if (!berry) return input;

    glm::vec3 toBerry = *berry - position;
    toBerry.y = 0.0f;
    if (glm::length(toBerry) < 1e-3f) return input;

    // Undo the camera yaw the controller applies to the input axes
    glm::vec3 local = glm::angleAxis(-sim.getCamera().getYaw(), glm::vec3(0.0f, 1.0f, 0.0f)) *
                      glm::normalize(toBerry);
    input.right = local.x;
    input.forward = -local.z;

    if (sim.getCharacter().horizontalSpeed() < 1.0f && frame % 45 == 0) {
        input.jumpPressed = true;
        input.jumpHeld = true;
    }
    return input;
}

int main(int argc, char* argv[]) {
    std::string configPath;
    uint64_t frameCount = 600;
    float deltaTime = 1.0f / 60.0f;
    std::optional<uint32_t> salt;
    bool steer = true;
    float orbit = 0.0f;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--frames" && i + 1 < argc) {
            frameCount = std::strtoull(argv[++i], nullptr, 10);
        } else if (arg == "--dt" && i + 1 < argc) {
            deltaTime = std::strtof(argv[++i], nullptr);
        } else if (arg == "--salt" && i + 1 < argc) {
            salt = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (arg == "--orbit" && i + 1 < argc) {
            orbit = std::strtof(argv[++i], nullptr);
        } else if (arg == "--idle") {
            steer = false;
        } else {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Unknown option: %s", arg.c_str());
        }
    }

    WorldConfig config = configPath.empty() ? WorldConfig::defaults() : WorldConfig::loadFromJson(configPath);
    if (salt) {
        config.sessionSalt = *salt;
    }

    auto physics = PhysicsWorld::create();
    if (!physics) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to initialize physics");
        return 1;
    }

    std::optional<WorldSimulation> sim;
    try {
        sim.emplace(*physics, config);
    } catch (const std::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to build world: %s", e.what());
        return 1;
    }

    for (uint64_t frame = 0; frame < frameCount; ++frame) {
        InputState input = steer ? autopilot(*sim, frame) : InputState{};
        sim->addMouseDelta(orbit, 0.0f);
        sim->tick(deltaTime, input);
    }

    const SimulationStats& stats = sim->getStats();
    const glm::vec3& position = sim->getCharacter().getPosition();
    SDL_Log("Summary: %llu frames (%llu failed), %lld physics steps",
            static_cast<unsigned long long>(stats.frames),
            static_cast<unsigned long long>(stats.failedFrames),
            physics->getStepCount());
    SDL_Log("Summary: %zu trees, %zu rocks, %d berries placed, %d collected, %d goal arrivals",
            sim->getScenery().getTrees().size(), sim->getScenery().getRocks().size(),
            sim->getCollectibles().totalCount(), stats.berriesCollected, stats.goalArrivals);
    SDL_Log("Summary: final position (%.2f, %.2f, %.2f), %d bodies in the world",
            position.x, position.y, position.z, physics->getBodyCount());

    return 0;
}
