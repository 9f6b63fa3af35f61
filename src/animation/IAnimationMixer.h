#pragma once

#include "AnimationTag.h"

/**
 * IAnimationMixer - Clip playback contract of the loaded character model
 *
 * Supplied by the asset layer once the model and its clips are imported.
 * The controller only looks clips up by tag, starts them and cross-fades
 * between them; the mixer is ticked every frame whether or not a
 * transition happened.
 */
class IAnimationMixer {
public:
    virtual ~IAnimationMixer() = default;

    virtual bool hasClip(AnimationTag tag) const = 0;

    // Restart the clip from its first frame. Jump clips play once and hold.
    virtual void play(AnimationTag tag, bool loop) = 0;

    virtual void crossFade(AnimationTag from, AnimationTag to, float duration) = 0;

    virtual void update(float deltaTime) = 0;
};
