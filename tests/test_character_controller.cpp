#include <doctest/doctest.h>
#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "scene/CharacterController.h"
#include "FakePhysicsWorld.h"

namespace {

struct MixerLog {
    std::vector<AnimationTag> played;
    std::vector<bool> looped;
    std::vector<std::pair<AnimationTag, AnimationTag>> fades;
    int updates = 0;
};

class RecordingMixer : public IAnimationMixer {
public:
    RecordingMixer(MixerLog& log, bool withAltJump, bool withIdle = true)
        : log_(log), withAltJump_(withAltJump), withIdle_(withIdle) {}

    bool hasClip(AnimationTag tag) const override {
        if (tag == AnimationTag::AltJump) return withAltJump_;
        if (tag == AnimationTag::Idle) return withIdle_;
        return true;
    }
    void play(AnimationTag tag, bool loop) override {
        log_.played.push_back(tag);
        log_.looped.push_back(loop);
    }
    void crossFade(AnimationTag from, AnimationTag to, float) override {
        log_.fades.emplace_back(from, to);
    }
    void update(float) override { log_.updates++; }

private:
    MixerLog& log_;
    bool withAltJump_;
    bool withIdle_;
};

// Flat ground at y = 0; the capsule rests with its centre at y = 1
struct Rig {
    FakePhysicsWorld physics;
    std::unique_ptr<CharacterController> character;

    explicit Rig(const CharacterConfig& base = {}) {
        physics.groundHeight = [](float, float) { return 0.0f; };
        CharacterConfig config = base;
        config.spawn = glm::vec3(0.0f, 1.0f, 0.0f);
        character = std::make_unique<CharacterController>(physics, config);
    }

    void frame(float dt, const InputState& input, float yaw = 0.0f, bool allowMove = true) {
        character->applyInput(dt, yaw, input, allowMove);
        physics.update(dt);
        character->sync(dt);
    }

    glm::vec3 velocity() const { return physics.getBodyVelocity(character->getBodyID()); }

    void liftTo(float y) {
        physics.setBodyPosition(character->getBodyID(), glm::vec3(0.0f, y, 0.0f));
    }
};

InputState forward() {
    InputState input;
    input.forward = 1.0f;
    return input;
}

InputState jump() {
    InputState input;
    input.jumpPressed = true;
    input.jumpHeld = true;
    return input;
}

glm::vec3 slopeNormal(float degrees) {
    float a = glm::radians(degrees);
    return glm::vec3(std::sin(a), std::cos(a), 0.0f);
}

} // namespace

TEST_SUITE("CharacterController body") {
    TEST_CASE("creates a capsule at the spawn point") {
        Rig rig;
        const FakePhysicsWorld::Body& body = rig.physics.body(rig.character->getBodyID());
        CHECK(body.shape == FakePhysicsWorld::Shape::Character);
        CHECK(body.radius == doctest::Approx(0.45f));
        CHECK(body.halfHeight == doctest::Approx(0.55f));
        CHECK(rig.character->getPosition() == glm::vec3(0.0f, 1.0f, 0.0f));
    }

    TEST_CASE("body creation failure throws") {
        FakePhysicsWorld physics;
        physics.failCreation = true;
        CHECK_THROWS_AS(CharacterController(physics, CharacterConfig{}), std::runtime_error);
    }

    TEST_CASE("invalid config throws") {
        FakePhysicsWorld physics;
        CharacterConfig config;
        config.radius = 0.0f;
        CHECK_THROWS_AS(CharacterController(physics, config), std::invalid_argument);
    }

    TEST_CASE("dispose removes the body once") {
        Rig rig;
        rig.character->dispose();
        CHECK(rig.character->isDisposed());
        CHECK(rig.physics.bodies.empty());

        // Further updates are no-ops
        rig.frame(0.016f, forward());
        rig.character->dispose();
        CHECK(rig.physics.removed.size() == 1);
        CHECK(rig.character->horizontalSpeed() == 0.0f);
    }

    TEST_CASE("destruction removes the body") {
        FakePhysicsWorld physics;
        {
            CharacterController character(physics, CharacterConfig{});
            CHECK(physics.bodies.size() == 1);
        }
        CHECK(physics.bodies.empty());
    }
}

TEST_SUITE("CharacterController movement") {
    TEST_CASE("ground probe sets grounded") {
        Rig rig;
        rig.character->applyInput(0.016f, 0.0f, InputState{});
        CHECK(rig.character->isGrounded());
        CHECK(rig.physics.rays.back().ignoreBody == rig.character->getBodyID());

        rig.liftTo(5.0f);
        rig.character->applyInput(0.016f, 0.0f, InputState{});
        CHECK_FALSE(rig.character->isGrounded());
    }

    TEST_CASE("acceleration is a linear rate cap") {
        Rig rig;
        rig.character->applyInput(0.1f, 0.0f, forward());
        // Forward is -Z with zero camera yaw; 45 * 0.1 per frame
        CHECK(rig.velocity().z == doctest::Approx(-4.5f));
        CHECK(rig.velocity().x == doctest::Approx(0.0f));
        CHECK(rig.character->getDesiredVelocity().z == doctest::Approx(-12.75f));
    }

    TEST_CASE("reaches exactly the top speed") {
        Rig rig;
        for (int i = 0; i < 30; ++i) {
            rig.frame(0.05f, forward());
        }
        CHECK(rig.character->horizontalSpeed() == doctest::Approx(12.75f));
    }

    TEST_CASE("the modifier slows to a walk") {
        Rig rig;
        InputState input = forward();
        input.runHeld = true;
        for (int i = 0; i < 30; ++i) {
            rig.frame(0.05f, input);
        }
        CHECK(rig.character->horizontalSpeed() == doctest::Approx(12.75f * 0.55f));
    }

    TEST_CASE("starving scales the speed down") {
        Rig rig;
        rig.character->setStarving(true);
        CHECK(rig.character->isStarving());
        for (int i = 0; i < 30; ++i) {
            rig.frame(0.05f, forward());
        }
        CHECK(rig.character->horizontalSpeed() == doctest::Approx(12.75f * 0.28f));
    }

    TEST_CASE("input is relative to the camera yaw") {
        Rig rig;
        rig.character->applyInput(0.016f, glm::half_pi<float>(), forward());
        const glm::vec3& desired = rig.character->getDesiredVelocity();
        CHECK(desired.x == doctest::Approx(-12.75f));
        CHECK(desired.z == doctest::Approx(0.0f).epsilon(0.001));
    }

    TEST_CASE("diagonal input is normalised") {
        Rig rig;
        InputState input = forward();
        input.right = 1.0f;
        rig.character->applyInput(0.016f, 0.0f, input);
        CHECK(glm::length(rig.character->getDesiredVelocity()) == doctest::Approx(12.75f));
    }

    TEST_CASE("movement can be locked") {
        Rig rig;
        rig.character->applyInput(0.016f, 0.0f, forward(), false);
        CHECK(glm::length(rig.character->getDesiredVelocity()) == doctest::Approx(0.0f));
    }
}

TEST_SUITE("CharacterController jumping") {
    TEST_CASE("jump from the ground") {
        Rig rig;
        rig.character->applyInput(0.016f, 0.0f, jump());
        CHECK(rig.velocity().y == doctest::Approx(7.2f));
        CHECK_FALSE(rig.character->isGrounded());
        CHECK(rig.character->getJumpAnimTime() == doctest::Approx(CharacterController::JUMP_ANIM_TIME));
        CHECK(rig.character->getCoyoteTimer() == 0.0f);
        CHECK(rig.character->getJumpBufferTimer() == 0.0f);
    }

    TEST_CASE("no jump while airborne past the coyote window") {
        Rig rig;
        rig.physics.applyGravity = false;
        rig.liftTo(5.0f);
        rig.character->applyInput(0.016f, 0.0f, jump());
        CHECK(rig.velocity().y == doctest::Approx(0.0f));
        CHECK(rig.character->getJumpBufferTimer() == doctest::Approx(0.12f));
    }

    TEST_CASE("coyote time allows a late jump") {
        Rig rig;
        rig.physics.applyGravity = false;
        rig.character->applyInput(0.05f, 0.0f, InputState{});
        CHECK(rig.character->getCoyoteTimer() == doctest::Approx(0.12f));

        rig.liftTo(5.0f);
        rig.character->applyInput(0.05f, 0.0f, InputState{});
        CHECK(rig.character->getCoyoteTimer() == doctest::Approx(0.07f));

        rig.character->applyInput(0.05f, 0.0f, jump());
        CHECK(rig.velocity().y == doctest::Approx(7.2f));
    }

    TEST_CASE("coyote time runs out") {
        Rig rig;
        rig.physics.applyGravity = false;
        rig.character->applyInput(0.05f, 0.0f, InputState{});
        rig.liftTo(5.0f);
        for (int i = 0; i < 3; ++i) {
            rig.character->applyInput(0.05f, 0.0f, InputState{});
        }
        rig.character->applyInput(0.05f, 0.0f, jump());
        CHECK(rig.velocity().y == doctest::Approx(0.0f));
    }

    TEST_CASE("a buffered press fires on landing") {
        Rig rig;
        rig.physics.applyGravity = false;
        rig.liftTo(5.0f);
        rig.character->applyInput(0.05f, 0.0f, jump());
        CHECK(rig.velocity().y == doctest::Approx(0.0f));

        rig.liftTo(1.0f);
        rig.character->applyInput(0.05f, 0.0f, InputState{});
        CHECK(rig.velocity().y == doctest::Approx(7.2f));
    }

    TEST_CASE("a stale buffered press is dropped") {
        Rig rig;
        rig.physics.applyGravity = false;
        rig.liftTo(5.0f);
        rig.character->applyInput(0.05f, 0.0f, jump());
        for (int i = 0; i < 3; ++i) {
            rig.character->applyInput(0.05f, 0.0f, InputState{});
        }

        rig.liftTo(1.0f);
        rig.character->applyInput(0.05f, 0.0f, InputState{});
        CHECK(rig.velocity().y == doctest::Approx(0.0f));
    }

    TEST_CASE("jump animation timer runs down in sync") {
        Rig rig;
        rig.frame(0.016f, jump());
        float t = rig.character->getJumpAnimTime();
        CHECK(t == doctest::Approx(CharacterController::JUMP_ANIM_TIME - 0.016f));
        for (int i = 0; i < 40; ++i) {
            rig.frame(0.016f, InputState{});
        }
        CHECK(rig.character->getJumpAnimTime() == 0.0f);
        CHECK_FALSE(rig.character->getJumpWasRunning());
    }
}

TEST_SUITE("CharacterController slopes") {
    TEST_CASE("slope helpers") {
        CHECK(CharacterController::slopeAngle(glm::vec3(0.0f, 1.0f, 0.0f)) == doctest::Approx(0.0f));
        CHECK(CharacterController::slopeAngle(slopeNormal(30.0f)) == doctest::Approx(glm::radians(30.0f)));
        CHECK(glm::length(CharacterController::slideDirection(glm::vec3(0.0f, 1.0f, 0.0f))) == 0.0f);

        // Normal tilted toward +X: downhill is +X
        glm::vec3 slide = CharacterController::slideDirection(slopeNormal(60.0f));
        CHECK(slide.x > 0.0f);
        CHECK(slide.y < 0.0f);
        CHECK(glm::length(slide) == doctest::Approx(1.0f));
    }

    TEST_CASE("gentle slopes do not change steering") {
        Rig rig;
        rig.physics.groundNormal = slopeNormal(30.0f);
        InputState input;
        input.right = -1.0f;
        rig.character->applyInput(0.016f, 0.0f, input);
        CHECK(rig.character->getDesiredVelocity().x == doctest::Approx(-12.75f));
    }

    TEST_CASE("uphill steering is removed past the climb limit") {
        Rig rig;
        rig.physics.groundNormal = slopeNormal(45.0f);
        InputState input;
        input.right = -1.0f;
        rig.character->applyInput(0.016f, 0.0f, input);
        CHECK(rig.character->getDesiredVelocity().x == doctest::Approx(0.0f));
    }

    TEST_CASE("across-slope steering survives") {
        Rig rig;
        rig.physics.groundNormal = slopeNormal(45.0f);
        rig.character->applyInput(0.016f, 0.0f, forward());
        CHECK(rig.character->getDesiredVelocity().z == doctest::Approx(-12.75f));
        CHECK(rig.character->getDesiredVelocity().x == doctest::Approx(0.0f));
    }

    TEST_CASE("steep slopes push the character downhill") {
        Rig rig;
        rig.physics.groundNormal = slopeNormal(60.0f);
        InputState input;
        input.right = -1.0f;
        rig.character->applyInput(0.016f, 0.0f, input);

        float expected = 12.0f * (60.0f - 48.0f) / (90.0f - 48.0f);
        CHECK(rig.character->getDesiredVelocity().x == doctest::Approx(expected).epsilon(0.01));
    }

    TEST_CASE("standing still on a steep slope still slides") {
        Rig rig;
        rig.physics.groundNormal = slopeNormal(70.0f);
        rig.character->applyInput(0.016f, 0.0f, InputState{});
        CHECK(rig.character->getDesiredVelocity().x > 0.0f);
    }
}

TEST_SUITE("CharacterController display") {
    TEST_CASE("turns toward the direction of travel") {
        Rig rig;
        InputState input;
        input.right = 1.0f;
        for (int i = 0; i < 60; ++i) {
            rig.frame(1.0f / 60.0f, input);
        }
        CHECK(rig.character->getYaw() == doctest::Approx(glm::half_pi<float>()).epsilon(0.01));
    }

    TEST_CASE("rotation can be frozen") {
        Rig rig;
        InputState input;
        input.right = 1.0f;
        for (int i = 0; i < 10; ++i) {
            rig.character->applyInput(1.0f / 60.0f, 0.0f, input);
            rig.physics.update(1.0f / 60.0f);
            rig.character->sync(1.0f / 60.0f, false);
        }
        CHECK(rig.character->getYaw() == doctest::Approx(0.0f));
    }

    TEST_CASE("sync reads the body position") {
        Rig rig;
        for (int i = 0; i < 10; ++i) {
            rig.frame(0.05f, forward());
        }
        glm::vec3 body = rig.physics.getBodyPosition(rig.character->getBodyID());
        CHECK(rig.character->getPosition() == body);
        CHECK(body.z < 0.0f);
    }

    TEST_CASE("animation follows locomotion") {
        Rig rig;
        MixerLog log;
        rig.character->setModel(ModelBounds{glm::vec3(-1.0f, 0.0f, -1.0f), glm::vec3(1.0f, 2.0f, 1.0f)},
                                std::make_unique<RecordingMixer>(log, true));

        rig.frame(0.016f, InputState{});
        REQUIRE(log.played.size() == 1);
        CHECK(log.played[0] == AnimationTag::Idle);
        CHECK(log.looped[0]);
        CHECK(log.fades.empty());

        rig.frame(0.016f, forward());
        CHECK(rig.character->getActiveTag() == AnimationTag::Run);
        REQUIRE(log.fades.size() == 1);
        CHECK(log.fades[0].first == AnimationTag::Idle);
        CHECK(log.fades[0].second == AnimationTag::Run);

        InputState walk = forward();
        walk.runHeld = true;
        rig.frame(0.016f, walk);
        CHECK(rig.character->getActiveTag() == AnimationTag::Walk);

        // Same tag again: no restart
        size_t plays = log.played.size();
        rig.frame(0.016f, walk);
        CHECK(log.played.size() == plays);
        CHECK(log.updates == 4);
    }

    TEST_CASE("full-speed jumps use the alternate clip when available") {
        Rig rig;
        MixerLog log;
        rig.character->setModel(ModelBounds{glm::vec3(0.0f), glm::vec3(1.0f)},
                                std::make_unique<RecordingMixer>(log, true));
        rig.frame(0.016f, InputState{});

        InputState input = jump();
        input.forward = 1.0f;
        rig.frame(0.016f, input);
        CHECK(rig.character->getJumpWasRunning());
        CHECK(rig.character->getActiveTag() == AnimationTag::AltJump);
        CHECK_FALSE(log.looped.back());
    }

    TEST_CASE("walking jumps and missing alternate clips use the plain jump") {
        SUBCASE("walking") {
            Rig rig;
            MixerLog log;
            rig.character->setModel(ModelBounds{glm::vec3(0.0f), glm::vec3(1.0f)},
                                    std::make_unique<RecordingMixer>(log, true));
            InputState input = jump();
            input.runHeld = true;
            rig.frame(0.016f, input);
            CHECK_FALSE(rig.character->getJumpWasRunning());
            CHECK(rig.character->getActiveTag() == AnimationTag::Jump);
        }
        SUBCASE("no alternate clip") {
            Rig rig;
            MixerLog log;
            rig.character->setModel(ModelBounds{glm::vec3(0.0f), glm::vec3(1.0f)},
                                    std::make_unique<RecordingMixer>(log, false));
            rig.frame(0.016f, jump());
            CHECK(rig.character->getActiveTag() == AnimationTag::Jump);
        }
    }

    TEST_CASE("no idle clip means no animation") {
        Rig rig;
        MixerLog log;
        rig.character->setModel(ModelBounds{glm::vec3(0.0f), glm::vec3(1.0f)},
                                std::make_unique<RecordingMixer>(log, true, false));
        rig.frame(0.016f, forward());
        CHECK(log.played.empty());
        CHECK(log.updates == 0);
        CHECK_FALSE(rig.character->hasActiveTag());
    }

    TEST_CASE("model without a mixer is fine") {
        Rig rig;
        const ModelFit& fit = rig.character->setModel(ModelBounds{glm::vec3(0.0f), glm::vec3(1.0f)}, nullptr);
        CHECK(fit.scaled);
        for (int i = 0; i < 30; ++i) {
            CHECK_NOTHROW(rig.frame(0.016f, forward()));
        }
        CHECK_FALSE(rig.character->hasActiveTag());
    }
}

TEST_SUITE("CharacterController model fit") {
    TEST_CASE("model is scaled to the capsule and grounded") {
        Rig rig;
        const ModelFit& fit = rig.character->setModel(
            ModelBounds{glm::vec3(-1.0f, -2.0f, -1.0f), glm::vec3(1.0f, 2.0f, 1.0f)}, nullptr);
        // Capsule is 2 tall; its bottom is 1 below the body centre
        CHECK(fit.scaled);
        CHECK(fit.scale == doctest::Approx(0.5f));
        CHECK(fit.offsetY == doctest::Approx(0.0f));
    }

    TEST_CASE("degenerate bounds are left alone") {
        Rig rig;
        const ModelFit& fit = rig.character->setModel(
            ModelBounds{glm::vec3(0.0f, 3.0f, 0.0f), glm::vec3(1.0f, 3.0f, 1.0f)}, nullptr);
        CHECK_FALSE(fit.scaled);
        CHECK(fit.scale == 1.0f);
        CHECK(fit.offsetY == 0.0f);
    }

    TEST_CASE("unit height scale") {
        CHECK(ModelFit::unitHeightScale(ModelBounds{glm::vec3(0.0f), glm::vec3(1.0f, 4.0f, 1.0f)}) ==
              doctest::Approx(0.25f));
        CHECK(ModelFit::unitHeightScale(ModelBounds{}) == 1.0f);
    }
}

TEST_SUITE("CharacterController celebration") {
    TEST_CASE("celebration hops on the ground") {
        Rig rig;
        rig.character->startCelebration();
        CHECK(rig.character->isCelebrating());

        rig.character->applyInput(0.016f, 0.0f, InputState{});
        CHECK(rig.velocity().y == doctest::Approx(7.2f * CharacterController::HOP_SPEED_FACTOR));
        CHECK(rig.character->getJumpAnimTime() == doctest::Approx(CharacterController::HOP_ANIM_TIME));
    }

    TEST_CASE("celebration ends after its duration") {
        Rig rig;
        rig.character->startCelebration(0.5f);
        for (int i = 0; i < 40; ++i) {
            rig.frame(1.0f / 60.0f, InputState{});
        }
        CHECK_FALSE(rig.character->isCelebrating());
    }

    TEST_CASE("stopCelebration ends it at once") {
        Rig rig;
        rig.character->startCelebration();
        rig.character->stopCelebration();
        CHECK_FALSE(rig.character->isCelebrating());
    }

    TEST_CASE("teleport clears motion and timers") {
        Rig rig;
        rig.character->startCelebration();
        rig.frame(0.016f, jump());

        rig.character->teleport(glm::vec3(10.0f, 3.0f, -4.0f));
        CHECK(rig.character->getPosition() == glm::vec3(10.0f, 3.0f, -4.0f));
        CHECK(rig.physics.getBodyPosition(rig.character->getBodyID()) == glm::vec3(10.0f, 3.0f, -4.0f));
        CHECK(rig.velocity() == glm::vec3(0.0f));
        CHECK(rig.character->getJumpAnimTime() == 0.0f);
        CHECK(rig.character->getCoyoteTimer() == 0.0f);
        CHECK_FALSE(rig.character->isCelebrating());
    }
}

TEST_SUITE("MouseDeltaAccumulator") {
    TEST_CASE("accumulates until consumed") {
        MouseDeltaAccumulator mouse;
        mouse.add(3.0f, -1.0f);
        mouse.add(2.0f, 4.0f);
        CHECK(mouse.consume() == glm::vec2(5.0f, 3.0f));
        CHECK(mouse.consume() == glm::vec2(0.0f));
    }
}
