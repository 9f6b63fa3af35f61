#include "PhysicsSystem.h"
#include "JoltLayerConfig.h"

// Jolt Physics includes
#include <Jolt/Jolt.h>
#include <Jolt/RegisterTypes.h>
#include <Jolt/Core/Factory.h>
#include <Jolt/Core/TempAllocator.h>
#include <Jolt/Core/JobSystemThreadPool.h>
#include <Jolt/Physics/PhysicsSettings.h>
#include <Jolt/Physics/PhysicsSystem.h>
#include <Jolt/Physics/Collision/Shape/BoxShape.h>
#include <Jolt/Physics/Collision/Shape/SphereShape.h>
#include <Jolt/Physics/Collision/Shape/CapsuleShape.h>
#include <Jolt/Physics/Collision/Shape/CylinderShape.h>
#include <Jolt/Physics/Collision/Shape/MeshShape.h>
#include <Jolt/Physics/Body/BodyCreationSettings.h>
#include <Jolt/Physics/Body/BodyFilter.h>
#include <Jolt/Physics/Body/BodyLock.h>
#include <Jolt/Physics/Collision/RayCast.h>
#include <Jolt/Physics/Collision/CastResult.h>

#include <SDL3/SDL_log.h>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <thread>
#include <cmath>
#include <algorithm>

JPH_SUPPRESS_WARNINGS

namespace {

// Jolt keeps references to these for the lifetime of every PhysicsSystem
const WorldBroadPhaseLayers g_broadPhaseLayers{};
const WorldObjectLayerPairFilter g_objectLayerPairFilter{};
const WorldObjectVsBroadPhaseFilter g_objectVsBroadPhaseFilter{};

// World positions are RVec3, which only differs from Vec3 in double precision builds
JPH::RVec3 toJoltPosition(const glm::vec3& p) { return JPH::RVec3(p.x, p.y, p.z); }
JPH::Vec3 toJolt(const glm::vec3& v) { return JPH::Vec3(v.x, v.y, v.z); }
JPH::Quat toJolt(const glm::quat& q) { return JPH::Quat(q.x, q.y, q.z, q.w); }

template <typename JoltVector>
glm::vec3 toGlm(const JoltVector& v) {
    return glm::vec3(static_cast<float>(v.GetX()), static_cast<float>(v.GetY()), static_cast<float>(v.GetZ()));
}

void logJoltTrace(const char* format, ...) {
    char message[512];
    va_list args;
    va_start(args, format);
    vsnprintf(message, sizeof(message), format, args);
    va_end(args);
    SDL_Log("PhysicsWorld: [Jolt] %s", message);
}

#ifdef JPH_ENABLE_ASSERTS
bool reportJoltAssert(const char* expression, const char* message, const char* file, uint32_t line) {
    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "PhysicsWorld: Jolt assert %s at %s:%u %s",
                 expression, file, line, message ? message : "");
    return true;
}
#endif

} // namespace

struct PhysicsWorld::JoltGlobals {
    JoltGlobals() {
        JPH::RegisterDefaultAllocator();
        JPH::Trace = logJoltTrace;
        JPH_IF_ENABLE_ASSERTS(JPH::AssertFailed = reportJoltAssert;)
        JPH::Factory::sInstance = new JPH::Factory();
        JPH::RegisterTypes();
    }

    ~JoltGlobals() {
        JPH::UnregisterTypes();
        delete JPH::Factory::sInstance;
        JPH::Factory::sInstance = nullptr;
    }

    JoltGlobals(const JoltGlobals&) = delete;
    JoltGlobals& operator=(const JoltGlobals&) = delete;

    // Worlds built while another is alive reuse its registration
    static std::shared_ptr<JoltGlobals> acquire() {
        static std::mutex mutex;
        static std::weak_ptr<JoltGlobals> shared;

        std::lock_guard<std::mutex> lock(mutex);
        std::shared_ptr<JoltGlobals> globals = shared.lock();
        if (!globals) {
            globals = std::make_shared<JoltGlobals>();
            shared = globals;
        }
        return globals;
    }
};

PhysicsWorld::PhysicsWorld() = default;

PhysicsWorld::~PhysicsWorld() {
    // Reverse order of creation; the Jolt registration goes last
    physicsSystem_.reset();
    jobSystem_.reset();
    tempAllocator_.reset();

    if (joltGlobals_) {
        joltGlobals_.reset();
        SDL_Log("PhysicsWorld: shut down");
    }
}

PhysicsWorld::PhysicsWorld(PhysicsWorld&& other) noexcept
    : joltGlobals_(std::move(other.joltGlobals_))
    , tempAllocator_(std::move(other.tempAllocator_))
    , jobSystem_(std::move(other.jobSystem_))
    , physicsSystem_(std::move(other.physicsSystem_))
    , timestep_(other.timestep_) {
}

PhysicsWorld& PhysicsWorld::operator=(PhysicsWorld&& other) noexcept {
    if (this != &other) {
        physicsSystem_.reset();
        jobSystem_.reset();
        tempAllocator_.reset();
        joltGlobals_.reset();

        joltGlobals_ = std::move(other.joltGlobals_);
        tempAllocator_ = std::move(other.tempAllocator_);
        jobSystem_ = std::move(other.jobSystem_);
        physicsSystem_ = std::move(other.physicsSystem_);
        timestep_ = other.timestep_;
    }
    return *this;
}

std::optional<PhysicsWorld> PhysicsWorld::create() {
    PhysicsWorld world;
    if (!world.initInternal()) {
        return std::nullopt;
    }
    return world;
}

bool PhysicsWorld::initInternal() {
    joltGlobals_ = JoltGlobals::acquire();

    // Temp allocator (10 MB); the terrain mesh build is the largest user
    tempAllocator_ = std::make_unique<JPH::TempAllocatorImpl>(10 * 1024 * 1024);

    int numThreads = std::max(1, static_cast<int>(std::thread::hardware_concurrency()) - 1);
    jobSystem_ = std::make_unique<JPH::JobSystemThreadPool>(
        JPH::cMaxPhysicsJobs,
        JPH::cMaxPhysicsBarriers,
        numThreads
    );

    // Scenery alone places ~1400 static colliders
    const uint32_t maxBodies = 4096;
    const uint32_t numBodyMutexes = 0; // Use default
    const uint32_t maxBodyPairs = 2048;
    const uint32_t maxContactConstraints = 2048;

    physicsSystem_ = std::make_unique<JPH::PhysicsSystem>();
    physicsSystem_->Init(
        maxBodies,
        numBodyMutexes,
        maxBodyPairs,
        maxContactConstraints,
        g_broadPhaseLayers,
        g_objectVsBroadPhaseFilter,
        g_objectLayerPairFilter
    );

    physicsSystem_->SetGravity(JPH::Vec3(0.0f, -9.81f, 0.0f));

    SDL_Log("PhysicsWorld: initialized with %d worker threads", numThreads);
    return true;
}

void PhysicsWorld::update(float deltaTime) {
    timestep_.advance(deltaTime, [this](float fixedStep) {
        physicsSystem_->Update(fixedStep, 1, tempAllocator_.get(), jobSystem_.get());
    });
}

PhysicsBodyID PhysicsWorld::createCharacterBody(const CharacterBodySettings& settings) {
    JPH::BodyInterface& bodyInterface = physicsSystem_->GetBodyInterface();

    JPH::CapsuleShapeSettings capsuleSettings(settings.halfHeight, settings.radius);
    JPH::ShapeSettings::ShapeResult shapeResult = capsuleSettings.Create();
    if (!shapeResult.IsValid()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "PhysicsWorld: failed to create character capsule: %s",
                     shapeResult.GetError().c_str());
        return INVALID_BODY_ID;
    }

    JPH::BodyCreationSettings bodySettings(
        shapeResult.Get(),
        toJoltPosition(settings.position),
        JPH::Quat::sIdentity(),
        JPH::EMotionType::Dynamic,
        PhysicsLayers::CHARACTER
    );
    bodySettings.mFriction = settings.friction;
    bodySettings.mRestitution = settings.restitution;
    bodySettings.mLinearDamping = settings.linearDamping;
    bodySettings.mOverrideMassProperties = JPH::EOverrideMassProperties::CalculateInertia;
    bodySettings.mMassPropertiesOverride.mMass = settings.mass;
    bodySettings.mAllowSleeping = false;
    if (settings.lockRotation) {
        bodySettings.mAllowedDOFs = JPH::EAllowedDOFs::TranslationX |
                                    JPH::EAllowedDOFs::TranslationY |
                                    JPH::EAllowedDOFs::TranslationZ;
    }
    if (settings.continuousCollision) {
        bodySettings.mMotionQuality = JPH::EMotionQuality::LinearCast;
    }

    JPH::Body* body = bodyInterface.CreateBody(bodySettings);
    if (!body) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "PhysicsWorld: failed to create character body");
        return INVALID_BODY_ID;
    }

    bodyInterface.AddBody(body->GetID(), JPH::EActivation::Activate);
    SDL_Log("PhysicsWorld: created character capsule at (%.1f, %.1f, %.1f)",
            settings.position.x, settings.position.y, settings.position.z);
    return body->GetID().GetIndexAndSequenceNumber();
}

PhysicsBodyID PhysicsWorld::addStaticBody(const JPH::ShapeSettings& shapeSettings, const glm::vec3& position,
                                          const glm::quat& rotation, float friction, const char* what) {
    JPH::ShapeSettings::ShapeResult shapeResult = shapeSettings.Create();
    if (!shapeResult.IsValid()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "PhysicsWorld: failed to create %s shape: %s",
                     what, shapeResult.GetError().c_str());
        return INVALID_BODY_ID;
    }

    JPH::BodyInterface& bodyInterface = physicsSystem_->GetBodyInterface();

    JPH::BodyCreationSettings bodySettings(
        shapeResult.Get(),
        toJoltPosition(position),
        toJolt(rotation),
        JPH::EMotionType::Static,
        PhysicsLayers::WORLD
    );
    bodySettings.mFriction = friction;
    bodySettings.mRestitution = 0.0f;

    JPH::Body* body = bodyInterface.CreateBody(bodySettings);
    if (!body) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "PhysicsWorld: failed to create %s body (body limit reached?)", what);
        return INVALID_BODY_ID;
    }

    bodyInterface.AddBody(body->GetID(), JPH::EActivation::DontActivate);
    return body->GetID().GetIndexAndSequenceNumber();
}

PhysicsBodyID PhysicsWorld::createStaticBox(const glm::vec3& position, const glm::vec3& halfExtents,
                                            const glm::quat& rotation, float friction) {
    JPH::BoxShapeSettings boxSettings(toJolt(halfExtents));
    return addStaticBody(boxSettings, position, rotation, friction, "box");
}

PhysicsBodyID PhysicsWorld::createStaticCylinder(const glm::vec3& position, float halfHeight, float radius,
                                                 float friction) {
    // Jolt cylinders are Y-axis aligned, which is what tree trunks need
    JPH::CylinderShapeSettings cylinderSettings(halfHeight, radius);
    return addStaticBody(cylinderSettings, position, glm::quat(1, 0, 0, 0), friction, "cylinder");
}

PhysicsBodyID PhysicsWorld::createStaticSphere(const glm::vec3& position, float radius, float friction) {
    JPH::SphereShapeSettings sphereSettings(radius);
    return addStaticBody(sphereSettings, position, glm::quat(1, 0, 0, 0), friction, "sphere");
}

PhysicsBodyID PhysicsWorld::createStaticTriangleMesh(const std::vector<glm::vec3>& positions,
                                                     const std::vector<uint32_t>& indices,
                                                     float friction) {
    if (positions.empty() || indices.size() < 3 || indices.size() % 3 != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "PhysicsWorld: invalid triangle mesh (%zu vertices, %zu indices)",
                     positions.size(), indices.size());
        return INVALID_BODY_ID;
    }

    JPH::VertexList vertices;
    vertices.reserve(positions.size());
    for (const glm::vec3& p : positions) {
        vertices.push_back(JPH::Float3(p.x, p.y, p.z));
    }

    JPH::IndexedTriangleList triangles;
    triangles.reserve(indices.size() / 3);
    for (size_t i = 0; i + 2 < indices.size(); i += 3) {
        triangles.push_back(JPH::IndexedTriangle(indices[i], indices[i + 1], indices[i + 2]));
    }

    JPH::MeshShapeSettings meshSettings(std::move(vertices), std::move(triangles));
    PhysicsBodyID id = addStaticBody(meshSettings, glm::vec3(0.0f), glm::quat(1, 0, 0, 0), friction, "triangle mesh");
    if (id != INVALID_BODY_ID) {
        SDL_Log("PhysicsWorld: created static triangle mesh (%zu vertices, %zu triangles)",
                positions.size(), indices.size() / 3);
    }
    return id;
}

void PhysicsWorld::removeBody(PhysicsBodyID bodyID) {
    if (bodyID == INVALID_BODY_ID) return;

    JPH::BodyID joltID(bodyID);
    JPH::BodyInterface& bodyInterface = physicsSystem_->GetBodyInterface();

    if (bodyInterface.IsAdded(joltID)) {
        bodyInterface.RemoveBody(joltID);
        bodyInterface.DestroyBody(joltID);
    }
}

RaycastHit PhysicsWorld::castRay(const glm::vec3& origin, const glm::vec3& direction, float maxDistance,
                                 PhysicsBodyID ignoreBody) const {
    RaycastHit result;

    float dirLength = glm::length(direction);
    if (dirLength < 1e-6f || maxDistance <= 0.0f) return result;
    glm::vec3 dir = direction / dirLength;

    JPH::RRayCast ray;
    ray.mOrigin = toJoltPosition(origin);
    ray.mDirection = toJolt(dir * maxDistance);

    JPH::RayCastResult hit;
    JPH::IgnoreSingleBodyFilter ignoreFilter(JPH::BodyID(ignoreBody));
    JPH::BodyFilter acceptAll;
    const JPH::BodyFilter& bodyFilter = ignoreBody != INVALID_BODY_ID
        ? static_cast<const JPH::BodyFilter&>(ignoreFilter)
        : acceptAll;

    if (!physicsSystem_->GetNarrowPhaseQuery().CastRay(ray, hit, {}, {}, bodyFilter)) {
        return result;
    }

    result.hit = true;
    result.distance = hit.mFraction * maxDistance;
    result.bodyId = hit.mBodyID.GetIndexAndSequenceNumber();
    result.position = origin + dir * result.distance;

    JPH::BodyLockRead lock(physicsSystem_->GetBodyLockInterface(), hit.mBodyID);
    if (lock.Succeeded()) {
        const JPH::Body& body = lock.GetBody();
        JPH::Vec3 normal = body.GetWorldSpaceSurfaceNormal(hit.mSubShapeID2, ray.GetPointOnRay(hit.mFraction));
        result.normal = toGlm(normal);
    }

    return result;
}

glm::vec3 PhysicsWorld::getBodyPosition(PhysicsBodyID bodyID) const {
    if (bodyID == INVALID_BODY_ID) return glm::vec3(0.0f);

    JPH::BodyID joltID(bodyID);
    const JPH::BodyInterface& bodyInterface = physicsSystem_->GetBodyInterface();
    if (!bodyInterface.IsAdded(joltID)) return glm::vec3(0.0f);

    return toGlm(bodyInterface.GetPosition(joltID));
}

void PhysicsWorld::setBodyPosition(PhysicsBodyID bodyID, const glm::vec3& position) {
    if (bodyID == INVALID_BODY_ID) return;

    JPH::BodyID joltID(bodyID);
    JPH::BodyInterface& bodyInterface = physicsSystem_->GetBodyInterface();
    if (!bodyInterface.IsAdded(joltID)) return;

    bodyInterface.SetPosition(joltID, toJoltPosition(position), JPH::EActivation::Activate);
}

glm::vec3 PhysicsWorld::getBodyVelocity(PhysicsBodyID bodyID) const {
    if (bodyID == INVALID_BODY_ID) return glm::vec3(0.0f);

    JPH::BodyID joltID(bodyID);
    const JPH::BodyInterface& bodyInterface = physicsSystem_->GetBodyInterface();
    if (!bodyInterface.IsAdded(joltID)) return glm::vec3(0.0f);

    return toGlm(bodyInterface.GetLinearVelocity(joltID));
}

void PhysicsWorld::setBodyVelocity(PhysicsBodyID bodyID, const glm::vec3& velocity) {
    if (bodyID == INVALID_BODY_ID) return;

    JPH::BodyID joltID(bodyID);
    JPH::BodyInterface& bodyInterface = physicsSystem_->GetBodyInterface();
    if (!bodyInterface.IsAdded(joltID)) return;

    bodyInterface.SetLinearVelocity(joltID, toJolt(velocity));
}

int PhysicsWorld::getBodyCount() const {
    return static_cast<int>(physicsSystem_->GetNumBodies());
}
