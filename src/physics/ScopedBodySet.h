#pragma once

#include "IPhysicsWorld.h"
#include <vector>

/**
 * ScopedBodySet - Owns the physics bodies a component created
 *
 * Every collider a placement pass or structure creates is adopted here.
 * release() hands them all back to the physics world; the destructor does the
 * same, so a component's colliders never outlive it. A rebuild is
 * release() followed by fresh adopt() calls, which removes exactly the stale
 * bodies and nothing that belongs to another component.
 */
class ScopedBodySet {
public:
    ScopedBodySet() = default;
    explicit ScopedBodySet(IPhysicsWorld* physics) : physics_(physics) {}

    ~ScopedBodySet() { release(); }

    // Move-only (two owners would remove the same body twice)
    ScopedBodySet(ScopedBodySet&& other) noexcept
        : physics_(other.physics_), bodies_(std::move(other.bodies_)) {
        other.bodies_.clear();
    }
    ScopedBodySet& operator=(ScopedBodySet&& other) noexcept {
        if (this != &other) {
            release();
            physics_ = other.physics_;
            bodies_ = std::move(other.bodies_);
            other.bodies_.clear();
        }
        return *this;
    }
    ScopedBodySet(const ScopedBodySet&) = delete;
    ScopedBodySet& operator=(const ScopedBodySet&) = delete;

    // Track a body; INVALID_BODY_ID is ignored. Returns the ID for chaining.
    PhysicsBodyID adopt(PhysicsBodyID bodyID) {
        if (bodyID != INVALID_BODY_ID) {
            bodies_.push_back(bodyID);
        }
        return bodyID;
    }

    // Remove every tracked body from the world
    void release() {
        if (physics_) {
            for (PhysicsBodyID id : bodies_) {
                physics_->removeBody(id);
            }
        }
        bodies_.clear();
    }

    size_t size() const { return bodies_.size(); }
    bool empty() const { return bodies_.empty(); }
    const std::vector<PhysicsBodyID>& ids() const { return bodies_; }
    IPhysicsWorld* physics() const { return physics_; }

private:
    IPhysicsWorld* physics_ = nullptr;
    std::vector<PhysicsBodyID> bodies_;
};
