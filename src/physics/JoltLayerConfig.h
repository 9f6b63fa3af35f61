#pragma once

#include <Jolt/Jolt.h>
#include <Jolt/Physics/Collision/ObjectLayer.h>
#include <Jolt/Physics/Collision/BroadPhase/BroadPhaseLayer.h>

// Object layers. The world is static except for the controlled capsule.
namespace PhysicsLayers {
    constexpr uint8_t WORLD = 0;        // Terrain, boundary, scenery, goal structure
    constexpr uint8_t CHARACTER = 1;
    constexpr uint8_t NUM_LAYERS = 2;
}

// One broad phase tree per object layer
namespace BroadPhaseLayers {
    constexpr uint8_t STATIC = 0;
    constexpr uint8_t DYNAMIC = 1;
    constexpr uint8_t NUM_LAYERS = 2;
}

class WorldBroadPhaseLayers final : public JPH::BroadPhaseLayerInterface {
public:
    uint32_t GetNumBroadPhaseLayers() const override {
        return BroadPhaseLayers::NUM_LAYERS;
    }

    JPH::BroadPhaseLayer GetBroadPhaseLayer(JPH::ObjectLayer inLayer) const override {
        JPH_ASSERT(inLayer < PhysicsLayers::NUM_LAYERS);
        return inLayer == PhysicsLayers::CHARACTER
            ? JPH::BroadPhaseLayer(BroadPhaseLayers::DYNAMIC)
            : JPH::BroadPhaseLayer(BroadPhaseLayers::STATIC);
    }

#if defined(JPH_EXTERNAL_PROFILE) || defined(JPH_PROFILE_ENABLED)
    const char* GetBroadPhaseLayerName(JPH::BroadPhaseLayer inLayer) const override {
        return (JPH::BroadPhaseLayer::Type)inLayer == BroadPhaseLayers::STATIC ? "STATIC" : "DYNAMIC";
    }
#endif
};

// World geometry never tests against itself
class WorldObjectLayerPairFilter final : public JPH::ObjectLayerPairFilter {
public:
    bool ShouldCollide(JPH::ObjectLayer inObject1, JPH::ObjectLayer inObject2) const override {
        return inObject1 == PhysicsLayers::CHARACTER || inObject2 == PhysicsLayers::CHARACTER;
    }
};

class WorldObjectVsBroadPhaseFilter final : public JPH::ObjectVsBroadPhaseLayerFilter {
public:
    bool ShouldCollide(JPH::ObjectLayer inLayer1, JPH::BroadPhaseLayer inLayer2) const override {
        if (inLayer1 == PhysicsLayers::CHARACTER) return true;
        return inLayer2 == JPH::BroadPhaseLayer(BroadPhaseLayers::DYNAMIC);
    }
};
