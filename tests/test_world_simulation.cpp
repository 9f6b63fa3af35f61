#include <doctest/doctest.h>
#include <glm/glm.hpp>
#include <memory>
#include <stdexcept>

#include "scene/WorldSimulation.h"
#include "FakePhysicsWorld.h"

namespace {

WorldConfig smallWorld() {
    WorldConfig config = WorldConfig::defaults();
    config.terrain.size = 65;
    config.terrain.width = 400.0f;
    config.terrain.depth = 400.0f;
    config.terrain.maxHeight = 10.0f;
    config.terrain.borderWidth = 40.0f;
    config.terrain.borderHeight = 40.0f;
    config.scenery.treeCount = 30;
    config.scenery.denseTreeCount = 10;
    config.scenery.rockCount = 10;
    config.collectibles.totalCount = 12;
    return config;
}

// Simulation over a fake world whose ground follows the generated terrain
struct SimRig {
    FakePhysicsWorld physics;
    std::unique_ptr<WorldSimulation> sim;

    explicit SimRig(const WorldConfig& config = smallWorld()) {
        sim = std::make_unique<WorldSimulation>(physics, config);
        const ProceduralTerrain* terrain = &sim->getTerrain();
        physics.groundHeight = [terrain](float x, float z) { return terrain->getHeightAt(x, z); };
    }

    void run(int frames, const InputState& input = {}) {
        for (int i = 0; i < frames; ++i) {
            sim->tick(1.0f / 60.0f, input);
        }
    }
};

} // namespace

TEST_SUITE("WorldSimulation") {
    TEST_CASE("construction builds every collider") {
        SimRig rig;
        const WorldSimulation& sim = *rig.sim;

        size_t expected = 1 + 5 + sim.getScenery().getColliderCount() + GoalSite::COLLIDER_COUNT + 1;
        CHECK(rig.physics.bodies.size() == expected);
        CHECK(rig.physics.countShape(FakePhysicsWorld::Shape::Mesh) == 1);
        CHECK(rig.physics.countShape(FakePhysicsWorld::Shape::Character) == 1);
    }

    TEST_CASE("character spawns above the origin") {
        SimRig rig;
        glm::vec3 expected(0.0f, rig.sim->getTerrain().getHeightAt(0.0f, 0.0f) + 6.0f, 0.0f);
        CHECK(rig.sim->getSpawnPosition() == expected);
        CHECK(rig.sim->getCharacter().getPosition() == expected);
    }

    TEST_CASE("character falls and settles on the terrain") {
        SimRig rig;
        rig.run(120);

        CHECK(rig.sim->getCharacter().isGrounded());
        float ground = rig.sim->getTerrain().getHeightAt(0.0f, 0.0f);
        CHECK(rig.sim->getCharacter().getPosition().y == doctest::Approx(ground + 1.0f).epsilon(0.01));
        CHECK(rig.sim->getStats().frames == 120u);
        CHECK(rig.sim->getStats().failedFrames == 0u);
        CHECK(rig.physics.updateCalls == 120);
    }

    TEST_CASE("forward input moves away from the camera") {
        SimRig rig;
        rig.run(60);
        InputState input;
        input.forward = 1.0f;
        rig.run(60, input);
        CHECK(rig.sim->getCharacter().getPosition().z < -3.0f);
    }

    TEST_CASE("walking into a berry collects it") {
        SimRig rig;
        REQUIRE(rig.sim->getCollectibles().totalCount() > 0);
        glm::vec3 berry = rig.sim->getCollectibles().getInstances()[0].placement.position;

        rig.sim->getCharacter().teleport(berry);
        rig.run(1);

        CHECK(rig.sim->getCollectibles().getInstances()[0].collected);
        CHECK(rig.sim->getStats().berriesCollected >= 1);
        CHECK(rig.sim->getCollectibles().collectedCount() == rig.sim->getStats().berriesCollected);
    }

    TEST_CASE("reaching the owner celebrates once per arrival") {
        SimRig rig;
        glm::vec3 owner = rig.sim->getGoal().getOwnerPosition();

        rig.sim->getCharacter().teleport(owner);
        rig.run(1);
        CHECK(rig.sim->getStats().goalArrivals == 1);
        CHECK(rig.sim->getCharacter().isCelebrating());

        rig.run(5);
        CHECK(rig.sim->getStats().goalArrivals == 1);

        rig.sim->getCharacter().teleport(rig.sim->getSpawnPosition());
        rig.run(1);
        rig.sim->getCharacter().teleport(owner);
        rig.run(1);
        CHECK(rig.sim->getStats().goalArrivals == 2);
    }

    TEST_CASE("celebration locks movement") {
        SimRig rig;
        rig.sim->getCharacter().teleport(rig.sim->getGoal().getOwnerPosition());
        rig.run(1);
        REQUIRE(rig.sim->getCharacter().isCelebrating());

        InputState input;
        input.forward = 1.0f;
        rig.run(1, input);
        const glm::vec3& desired = rig.sim->getCharacter().getDesiredVelocity();
        CHECK(glm::length(glm::vec2(desired.x, desired.z)) < 12.0f * 0.5f);
    }

    TEST_CASE("a failing frame is skipped and the loop continues") {
        SimRig rig;
        rig.physics.throwOnUpdate = true;
        CHECK_FALSE(rig.sim->tick(1.0f / 60.0f, InputState{}));
        CHECK(rig.sim->getStats().failedFrames == 1u);

        rig.physics.throwOnUpdate = false;
        CHECK(rig.sim->tick(1.0f / 60.0f, InputState{}));
        CHECK(rig.sim->getStats().frames == 2u);
        CHECK(rig.sim->getStats().failedFrames == 1u);
    }

    TEST_CASE("reset moves goal and berries without leaking colliders") {
        SimRig rig;
        size_t bodies = rig.physics.bodies.size();
        glm::vec3 goalBefore = rig.sim->getGoal().getPosition();

        rig.sim->getCharacter().teleport(rig.sim->getCollectibles().getInstances()[0].placement.position);
        rig.run(10);

        rig.sim->reset(5);
        CHECK(rig.sim->getSessionSalt() == 5u);
        CHECK(rig.physics.bodies.size() == bodies);
        CHECK(rig.sim->getGoal().getPosition() != goalBefore);
        CHECK(rig.sim->getCollectibles().collectedCount() == 0);
        CHECK(rig.sim->getCharacter().getPosition() == rig.sim->getSpawnPosition());
    }

    TEST_CASE("camera follows the character") {
        SimRig rig;
        rig.run(240);
        glm::vec3 expected = rig.sim->getCharacter().getPosition() + glm::vec3(0.0f, 2.4f, 0.0f);
        CHECK(glm::length(rig.sim->getCamera().getLookTarget() - expected) < 0.1f);
        CHECK(rig.physics.rays.back().ignoreBody == rig.sim->getCharacter().getBodyID());
    }

    TEST_CASE("mouse motion is drained once per frame") {
        SimRig rig;
        const float sensitivity = WorldConfig::defaults().camera.sensitivity;
        const float yaw = rig.sim->getCamera().getYaw();

        rig.sim->addMouseDelta(60.0f, 0.0f);
        rig.sim->addMouseDelta(40.0f, 0.0f);
        rig.run(1);
        CHECK(rig.sim->getCamera().getYaw() == doctest::Approx(yaw - 100.0f * sensitivity));

        // Nothing new queued, the camera holds its yaw
        rig.run(3);
        CHECK(rig.sim->getCamera().getYaw() == doctest::Approx(yaw - 100.0f * sensitivity));
    }

    TEST_CASE("mouse motion queued before a failed frame is not replayed") {
        SimRig rig;
        const float yaw = rig.sim->getCamera().getYaw();
        rig.sim->addMouseDelta(50.0f, 0.0f);

        rig.physics.throwOnUpdate = true;
        CHECK_FALSE(rig.sim->tick(1.0f / 60.0f, InputState{}));
        rig.physics.throwOnUpdate = false;
        rig.run(1);
        CHECK(rig.sim->getCamera().getYaw() == doctest::Approx(yaw));
    }

    TEST_CASE("same config builds the same world") {
        SimRig a;
        SimRig b;
        CHECK(a.sim->getGoal().getPosition() == b.sim->getGoal().getPosition());
        REQUIRE(a.sim->getCollectibles().totalCount() == b.sim->getCollectibles().totalCount());
        CHECK(a.sim->getCollectibles().getInstances()[0].placement.position ==
              b.sim->getCollectibles().getInstances()[0].placement.position);
        CHECK(a.sim->getTerrain().getHeights() == b.sim->getTerrain().getHeights());
    }

    TEST_CASE("invalid config is rejected before anything is built") {
        FakePhysicsWorld physics;
        WorldConfig config = smallWorld();
        config.terrain.size = 64;
        CHECK_THROWS_AS(WorldSimulation(physics, config), std::invalid_argument);
        CHECK(physics.bodies.empty());
    }

    TEST_CASE("destruction removes every body") {
        FakePhysicsWorld physics;
        {
            WorldSimulation sim(physics, smallWorld());
            CHECK(!physics.bodies.empty());
        }
        CHECK(physics.bodies.empty());
    }
}
