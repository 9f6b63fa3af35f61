#include "CharacterController.h"
#include "core/MotionMath.h"

#include <SDL3/SDL_log.h>
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>

namespace {

const glm::vec3 UP(0.0f, 1.0f, 0.0f);

} // namespace

CharacterController::CharacterController(IPhysicsWorld& physics, const CharacterConfig& config)
    : physics_(physics)
    , config_(config)
    , body_(&physics) {
    config_.validate();

    CharacterBodySettings settings;
    settings.position = config_.spawn;
    settings.halfHeight = config_.halfHeight;
    settings.radius = config_.radius;

    bodyId_ = body_.adopt(physics_.createCharacterBody(settings));
    if (bodyId_ == INVALID_BODY_ID) {
        throw std::runtime_error("CharacterController: failed to create character body");
    }

    position_ = config_.spawn;
}

CharacterController::~CharacterController() {
    dispose();
}

void CharacterController::dispose() {
    body_.release();
    bodyId_ = INVALID_BODY_ID;
}

float CharacterController::slopeAngle(const glm::vec3& normal) {
    return std::acos(std::clamp(normal.y, -1.0f, 1.0f));
}

glm::vec3 CharacterController::slideDirection(const glm::vec3& normal) {
    const glm::vec3 gravity(0.0f, -1.0f, 0.0f);
    glm::vec3 projected = gravity - normal * glm::dot(gravity, normal);
    float len = glm::length(projected);
    if (len < 1e-5f) return glm::vec3(0.0f);
    return projected / len;
}

void CharacterController::updateGroundInfo() {
    const float reach = config_.halfHeight + config_.radius;
    glm::vec3 origin = physics_.getBodyPosition(bodyId_);

    RaycastHit hit = physics_.castRay(origin, -UP, reach + GROUND_PROBE_MARGIN, bodyId_);
    if (!hit.hit) {
        grounded_ = false;
        groundNormal_ = UP;
        return;
    }

    grounded_ = hit.distance <= reach + GROUNDED_TOLERANCE;
    float len = glm::length(hit.normal);
    groundNormal_ = len > 1e-6f ? hit.normal / len : UP;
}

glm::vec3 CharacterController::resolveSlope(const glm::vec3& desired) const {
    float slope = slopeAngle(groundNormal_);
    if (slope <= config_.maxSlopeClimb) return desired;

    glm::vec3 slide = slideDirection(groundNormal_);
    glm::vec3 slideXZ(slide.x, 0.0f, slide.z);
    float slideLen = glm::length(slideXZ);
    if (slideLen > 1e-3f) slideXZ /= slideLen;

    glm::vec3 result = desired;

    // Strip the uphill part of the steering, keep the across-slope part
    float along = glm::dot(result, slideXZ);
    if (along < 0.0f) {
        result -= slideXZ * along;
    }

    // Sliding starts a little past the climb limit and ramps up with steepness
    if (slope >= config_.slideSlope) {
        float amount = (slope - config_.slideSlope) / (glm::half_pi<float>() - config_.slideSlope);
        result += slideXZ * (config_.slideStrength * std::clamp(amount, 0.0f, 1.0f));
    }

    return result;
}

void CharacterController::applyInput(float deltaTime, float cameraYaw, const InputState& input, bool allowMove) {
    if (isDisposed()) return;

    updateGroundInfo();

    // Coyote time: jumping stays possible briefly after walking off an edge
    if (grounded_) {
        coyoteTimer_ = config_.coyoteTime;
    } else {
        coyoteTimer_ = std::max(0.0f, coyoteTimer_ - deltaTime);
    }

    // Jump buffer: a press shortly before landing still counts
    if (input.jumpPressed) {
        jumpBufferTimer_ = config_.jumpBufferTime;
    } else {
        jumpBufferTimer_ = std::max(0.0f, jumpBufferTimer_ - deltaTime);
    }

    lastRunHeld_ = input.runHeld;

    glm::vec3 move(0.0f);
    if (allowMove) {
        move = glm::vec3(input.right, 0.0f, -input.forward);
        if (glm::dot(move, move) > 1e-6f) move = glm::normalize(move);
    }
    move = glm::angleAxis(cameraYaw, UP) * move;

    float targetSpeed = input.runHeld ? config_.maxSpeed * config_.walkSpeedFactor : config_.maxSpeed;
    if (starving_) targetSpeed *= config_.starvingSpeedMultiplier;

    glm::vec3 desired(move.x * targetSpeed, 0.0f, move.z * targetSpeed);
    if (grounded_) {
        desired = resolveSlope(desired);
    }

    glm::vec3 velocity = physics_.getBodyVelocity(bodyId_);
    const float maxDelta = config_.acceleration * deltaTime;
    velocity.x = MotionMath::approach(velocity.x, desired.x, maxDelta);
    velocity.z = MotionMath::approach(velocity.z, desired.z, maxDelta);

    if (coyoteTimer_ > 0.0f && jumpBufferTimer_ > 0.0f) {
        velocity.y = config_.jumpSpeed;
        grounded_ = false;
        coyoteTimer_ = 0.0f;
        jumpBufferTimer_ = 0.0f;
        jumpAnimTime_ = JUMP_ANIM_TIME;
        jumpWasRunning_ = !input.runHeld;
    } else if (celebrating_ && grounded_ && celebrationHopTimer_ <= 0.0f) {
        velocity.y = config_.jumpSpeed * HOP_SPEED_FACTOR;
        grounded_ = false;
        jumpAnimTime_ = HOP_ANIM_TIME;
        jumpWasRunning_ = false;
        // Hops get further apart as the celebration winds down
        float progress = celebrationDuration_ > 0.0f ? 1.0f - celebrationTime_ / celebrationDuration_ : 1.0f;
        celebrationHopTimer_ = 0.45f + progress * 0.35f;
    }

    physics_.setBodyVelocity(bodyId_, velocity);
    desiredVelocity_ = desired;
}

void CharacterController::sync(float deltaTime, bool allowRotate) {
    if (isDisposed()) return;

    position_ = physics_.getBodyPosition(bodyId_);

    float moveSpeed = std::sqrt(desiredVelocity_.x * desiredVelocity_.x + desiredVelocity_.z * desiredVelocity_.z);
    if (allowRotate && moveSpeed > TURN_MIN_SPEED) {
        float targetYaw = std::atan2(desiredVelocity_.x, desiredVelocity_.z);
        glm::quat target = glm::angleAxis(targetYaw, UP);
        rotation_ = glm::slerp(rotation_, target, MotionMath::dampFactor(TURN_RATE, deltaTime));
    }

    updateAnimation(deltaTime, moveSpeed, !lastRunHeld_);

    if (jumpAnimTime_ > 0.0f) {
        jumpAnimTime_ = std::max(0.0f, jumpAnimTime_ - deltaTime);
    }
    if (jumpAnimTime_ == 0.0f) {
        jumpWasRunning_ = false;
    }

    if (celebrating_) {
        celebrationTime_ = std::max(0.0f, celebrationTime_ - deltaTime);
        celebrationHopTimer_ = std::max(0.0f, celebrationHopTimer_ - deltaTime);
        if (celebrationTime_ == 0.0f) {
            celebrating_ = false;
        }
    }
}

void CharacterController::updateAnimation(float deltaTime, float moveSpeed, bool runActive) {
    if (!mixer_ || !mixer_->hasClip(AnimationTag::Idle)) return;

    AnimationInputs inputs;
    inputs.grounded = grounded_;
    inputs.speed = speedBucketFor(moveSpeed, runActive);
    inputs.jumpTimerActive = jumpAnimTime_ > 0.0f;
    inputs.celebrating = celebrating_;
    inputs.launchedFromRun = jumpWasRunning_;
    inputs.altJumpAvailable = mixer_->hasClip(AnimationTag::AltJump);

    AnimationTag next = selectAnimationTag(inputs);
    if ((!hasActiveTag_ || next != activeTag_) && mixer_->hasClip(next)) {
        mixer_->play(next, !isJumpTag(next));
        if (hasActiveTag_) {
            mixer_->crossFade(activeTag_, next, CROSSFADE_TIME);
        }
        activeTag_ = next;
        hasActiveTag_ = true;
    }

    mixer_->update(deltaTime);
}

void CharacterController::startCelebration(float duration) {
    celebrating_ = true;
    celebrationTime_ = duration;
    celebrationDuration_ = duration;
    celebrationHopTimer_ = 0.0f;
}

void CharacterController::stopCelebration() {
    celebrating_ = false;
    celebrationTime_ = 0.0f;
    celebrationHopTimer_ = 0.0f;
    celebrationDuration_ = 0.0f;
}

void CharacterController::teleport(const glm::vec3& position) {
    if (isDisposed()) return;

    physics_.setBodyPosition(bodyId_, position);
    physics_.setBodyVelocity(bodyId_, glm::vec3(0.0f));
    position_ = position;

    grounded_ = false;
    groundNormal_ = UP;
    desiredVelocity_ = glm::vec3(0.0f);
    coyoteTimer_ = 0.0f;
    jumpBufferTimer_ = 0.0f;
    jumpAnimTime_ = 0.0f;
    jumpWasRunning_ = false;
    stopCelebration();
}

const ModelFit& CharacterController::setModel(const ModelBounds& bounds, std::unique_ptr<IAnimationMixer> mixer) {
    const float targetHeight = config_.halfHeight * 2.0f + config_.radius * 2.0f;
    const float desiredMinY = -(config_.halfHeight + config_.radius);

    modelFit_ = ModelFit::heightAndGround(bounds, targetHeight, desiredMinY);
    if (!modelFit_.scaled) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "CharacterController: model has degenerate bounds, skipping scale and grounding");
    }

    mixer_ = std::move(mixer);
    hasActiveTag_ = false;
    activeTag_ = AnimationTag::Idle;
    if (!mixer_) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "CharacterController: model attached without animation clips");
    }
    return modelFit_;
}

float CharacterController::horizontalSpeed() const {
    if (isDisposed()) return 0.0f;
    glm::vec3 v = physics_.getBodyVelocity(bodyId_);
    return std::sqrt(v.x * v.x + v.z * v.z);
}

float CharacterController::getYaw() const {
    glm::vec3 facing = rotation_ * glm::vec3(0.0f, 0.0f, 1.0f);
    return std::atan2(facing.x, facing.z);
}
