#pragma once

#include <cstddef>
#include <cstdint>

// Display-only locomotion states of the controlled character
enum class AnimationTag : uint8_t {
    Idle,
    Walk,
    Run,
    Jump,
    AltJump   // Gallop-style jump, used when launched at full speed
};

constexpr size_t ANIMATION_TAG_COUNT = 5;

const char* animationTagName(AnimationTag tag);

inline bool isJumpTag(AnimationTag tag) {
    return tag == AnimationTag::Jump || tag == AnimationTag::AltJump;
}

enum class SpeedBucket : uint8_t {
    Still,
    Slow,   // Moving with the walk modifier held
    Fast
};

// Horizontal speeds at or below this count as standing still
constexpr float ANIMATION_MOVE_THRESHOLD = 0.25f;

inline SpeedBucket speedBucketFor(float horizontalSpeed, bool runActive) {
    if (horizontalSpeed <= ANIMATION_MOVE_THRESHOLD) return SpeedBucket::Still;
    return runActive ? SpeedBucket::Fast : SpeedBucket::Slow;
}

// Everything the tag choice depends on for one frame
struct AnimationInputs {
    bool grounded = true;
    SpeedBucket speed = SpeedBucket::Still;
    bool jumpTimerActive = false;
    bool celebrating = false;
    bool launchedFromRun = false;
    bool altJumpAvailable = false;
};

// Pure transition function; every combination of inputs maps to exactly one tag
AnimationTag selectAnimationTag(const AnimationInputs& inputs);
