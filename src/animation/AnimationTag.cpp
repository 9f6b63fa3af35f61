#include "AnimationTag.h"

namespace {

// Locomotion row of the transition table, indexed by SpeedBucket
constexpr AnimationTag LOCOMOTION_TAGS[] = {
    AnimationTag::Idle,
    AnimationTag::Walk,
    AnimationTag::Run,
};

} // namespace

const char* animationTagName(AnimationTag tag) {
    switch (tag) {
        case AnimationTag::Idle: return "idle";
        case AnimationTag::Walk: return "walk";
        case AnimationTag::Run: return "run";
        case AnimationTag::Jump: return "jump";
        case AnimationTag::AltJump: return "altJump";
    }
    return "unknown";
}

AnimationTag selectAnimationTag(const AnimationInputs& inputs) {
    // Celebration hops play the jump clip even while standing
    if (inputs.celebrating && inputs.grounded) {
        return AnimationTag::Jump;
    }

    if (inputs.jumpTimerActive && !inputs.grounded) {
        return inputs.launchedFromRun && inputs.altJumpAvailable ? AnimationTag::AltJump : AnimationTag::Jump;
    }

    return LOCOMOTION_TAGS[static_cast<size_t>(inputs.speed)];
}
