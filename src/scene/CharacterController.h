#pragma once

#include "InputState.h"
#include "ModelFit.h"
#include "animation/AnimationTag.h"
#include "animation/IAnimationMixer.h"
#include "physics/IPhysicsWorld.h"
#include "physics/ScopedBodySet.h"

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <memory>
#include <stdexcept>

struct CharacterConfig {
    glm::vec3 spawn{0.0f, 20.0f, 0.0f};
    float radius = 0.45f;
    float halfHeight = 0.55f;
    float maxSpeed = 12.75f;
    float acceleration = 45.0f;
    float jumpSpeed = 7.2f;
    float maxSlopeClimb = 0.6981317f;    // 40 degrees
    float slideSlope = 0.8377580f;       // 48 degrees
    float slideStrength = 12.0f;
    float starvingSpeedMultiplier = 0.28f;
    float coyoteTime = 0.12f;
    float jumpBufferTime = 0.12f;
    float walkSpeedFactor = 0.55f;       // Speed fraction while the modifier is held

    void validate() const {
        if (!(radius > 0.0f) || halfHeight < 0.0f) {
            throw std::invalid_argument("CharacterConfig: capsule needs a positive radius and non-negative half height");
        }
        if (maxSpeed < 0.0f || acceleration < 0.0f || jumpSpeed < 0.0f || slideStrength < 0.0f) {
            throw std::invalid_argument("CharacterConfig: speeds, acceleration and slide strength must not be negative");
        }
        if (slideSlope >= 1.5707963f) {
            throw std::invalid_argument("CharacterConfig: slideSlope must be below 90 degrees");
        }
        if (coyoteTime < 0.0f || jumpBufferTime < 0.0f) {
            throw std::invalid_argument("CharacterConfig: grace windows must not be negative");
        }
    }
};

/**
 * CharacterController - Velocity-driven capsule for the player character
 *
 * The physical state (body position, velocity, grounded flag) is
 * authoritative; orientation and the animation tag are derived from it for
 * display only. The capsule's rotation is locked in the physics world, so
 * turning happens purely on the visual side in sync().
 *
 * Per frame:
 *   applyInput()  - probe ground, run grace timers, steer and jump, write velocity
 *   physics step
 *   sync()        - read the body back, turn toward the heading, drive animation
 */
class CharacterController {
public:
    static constexpr float GROUND_PROBE_MARGIN = 0.25f;
    static constexpr float GROUNDED_TOLERANCE = 0.05f;
    static constexpr float JUMP_ANIM_TIME = 0.45f;
    static constexpr float HOP_ANIM_TIME = 0.4f;
    static constexpr float HOP_SPEED_FACTOR = 0.85f;
    static constexpr float TURN_RATE = 12.0f;
    static constexpr float TURN_MIN_SPEED = 0.2f;
    static constexpr float CROSSFADE_TIME = 0.25f;
    static constexpr float DEFAULT_CELEBRATION_TIME = 3.2f;

    // Throws std::invalid_argument for a bad config, std::runtime_error if the body cannot be created
    CharacterController(IPhysicsWorld& physics, const CharacterConfig& config);
    ~CharacterController();

    CharacterController(const CharacterController&) = delete;
    CharacterController& operator=(const CharacterController&) = delete;

    void applyInput(float deltaTime, float cameraYaw, const InputState& input, bool allowMove = true);
    void sync(float deltaTime, bool allowRotate = true);

    void startCelebration(float duration = DEFAULT_CELEBRATION_TIME);
    void stopCelebration();
    bool isCelebrating() const { return celebrating_; }

    void setStarving(bool starving) { starving_ = starving; }
    bool isStarving() const { return starving_; }

    // Move the body, stop it and clear every timer
    void teleport(const glm::vec3& position);

    // Attach the loaded model. Returns the fit applied to the model root.
    const ModelFit& setModel(const ModelBounds& bounds, std::unique_ptr<IAnimationMixer> mixer);

    // Remove the body from the physics world (also done on destruction)
    void dispose();
    bool isDisposed() const { return bodyId_ == INVALID_BODY_ID; }

    float horizontalSpeed() const;
    const glm::vec3& getPosition() const { return position_; }
    const glm::quat& getRotation() const { return rotation_; }
    float getYaw() const;

    bool isGrounded() const { return grounded_; }
    const glm::vec3& getGroundNormal() const { return groundNormal_; }
    const glm::vec3& getDesiredVelocity() const { return desiredVelocity_; }
    float getCoyoteTimer() const { return coyoteTimer_; }
    float getJumpBufferTimer() const { return jumpBufferTimer_; }
    float getJumpAnimTime() const { return jumpAnimTime_; }
    bool getJumpWasRunning() const { return jumpWasRunning_; }
    AnimationTag getActiveTag() const { return activeTag_; }
    bool hasActiveTag() const { return hasActiveTag_; }
    const ModelFit& getModelFit() const { return modelFit_; }
    PhysicsBodyID getBodyID() const { return bodyId_; }
    const CharacterConfig& getConfig() const { return config_; }

    // Steepness (radians) of the surface with this normal
    static float slopeAngle(const glm::vec3& normal);

    // Gravity projected onto the surface plane, normalised; zero on flat ground
    static glm::vec3 slideDirection(const glm::vec3& normal);

private:
    void updateGroundInfo();
    glm::vec3 resolveSlope(const glm::vec3& desired) const;
    void updateAnimation(float deltaTime, float moveSpeed, bool runActive);

    IPhysicsWorld& physics_;
    CharacterConfig config_;
    ScopedBodySet body_;
    PhysicsBodyID bodyId_ = INVALID_BODY_ID;

    // Physical state
    bool grounded_ = false;
    glm::vec3 groundNormal_{0.0f, 1.0f, 0.0f};
    glm::vec3 desiredVelocity_{0.0f};
    float coyoteTimer_ = 0.0f;
    float jumpBufferTimer_ = 0.0f;
    bool starving_ = false;
    bool lastRunHeld_ = false;

    // Display state
    glm::vec3 position_{0.0f};
    glm::quat rotation_{1.0f, 0.0f, 0.0f, 0.0f};
    float jumpAnimTime_ = 0.0f;
    bool jumpWasRunning_ = false;
    AnimationTag activeTag_ = AnimationTag::Idle;
    bool hasActiveTag_ = false;

    // Celebration hops
    bool celebrating_ = false;
    float celebrationTime_ = 0.0f;
    float celebrationHopTimer_ = 0.0f;
    float celebrationDuration_ = 0.0f;

    std::unique_ptr<IAnimationMixer> mixer_;
    ModelFit modelFit_;
};
