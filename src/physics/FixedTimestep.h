#pragma once

#include <algorithm>

/**
 * FixedTimestep - Accumulator that turns variable frame times into fixed steps
 *
 * Each advance() adds min(frameTime, MAX_FRAME_TIME) to the accumulator and
 * invokes the step callback once per whole FIXED_STEP it contains. The
 * remainder carries into the next call. Clamping the frame time bounds the
 * work done after a long stall to MAX_FRAME_TIME / FIXED_STEP steps.
 */
class FixedTimestep {
public:
    static constexpr float FIXED_STEP = 1.0f / 60.0f;
    static constexpr float MAX_FRAME_TIME = 0.25f;

    // Returns the number of fixed steps taken
    template <typename StepFn>
    int advance(float frameTime, StepFn&& step) {
        accumulator_ += std::min(std::max(frameTime, 0.0f), MAX_FRAME_TIME);

        int steps = 0;
        while (accumulator_ >= FIXED_STEP) {
            step(FIXED_STEP);
            accumulator_ -= FIXED_STEP;
            ++steps;
        }
        totalSteps_ += steps;
        return steps;
    }

    float accumulator() const { return accumulator_; }
    long long totalSteps() const { return totalSteps_; }

    void reset() {
        accumulator_ = 0.0f;
        totalSteps_ = 0;
    }

private:
    float accumulator_ = 0.0f;
    long long totalSteps_ = 0;
};
