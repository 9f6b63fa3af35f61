#include "WorldConfig.h"

#include <nlohmann/json.hpp>
#include <SDL3/SDL_log.h>
#include <glm/glm.hpp>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <limits>

using json = nlohmann::json;

namespace {

// Angles are authored in degrees
float readDegrees(const json& j, const char* key, float defaultRadians) {
    return glm::radians(j.value(key, glm::degrees(defaultRadians)));
}

// Integers outside the field's range are clamped with a warning instead of wrapping around.
// Non-numeric values throw json::type_error like j.value() does.
template <typename T>
T readInteger(const json& j, const char* key, T defaultValue) {
    static_assert(sizeof(T) <= sizeof(int32_t), "wider fields need their own range handling");

    auto it = j.find(key);
    if (it == j.end()) return defaultValue;

    constexpr int64_t lo = std::numeric_limits<T>::min();
    constexpr int64_t hi = std::numeric_limits<T>::max();

    int64_t v = 0;
    if (it->is_number_unsigned()) {
        uint64_t u = it->get<uint64_t>();
        v = u > static_cast<uint64_t>(hi) ? hi + 1 : static_cast<int64_t>(u);
    } else if (it->is_number_float()) {
        double d = it->get<double>();
        v = static_cast<int64_t>(std::clamp(d, static_cast<double>(lo - 1), static_cast<double>(hi + 1)));
    } else {
        v = it->get<int64_t>();
    }

    if (v < lo || v > hi) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "WorldConfig: %s=%lld is out of range, clamped to [%lld, %lld]",
                    key, static_cast<long long>(v), static_cast<long long>(lo), static_cast<long long>(hi));
        v = std::clamp(v, lo, hi);
    }
    return static_cast<T>(v);
}

void readTerrain(const json& j, TerrainConfig& t) {
    t.size = readInteger(j, "size", t.size);
    t.width = j.value("width", t.width);
    t.depth = j.value("depth", t.depth);
    t.maxHeight = j.value("maxHeight", t.maxHeight);
    t.seed = readInteger(j, "seed", t.seed);
    t.borderWidth = j.value("borderWidth", t.borderWidth);
    t.borderHeight = j.value("borderHeight", t.borderHeight);
}

void readScenery(const json& j, ScatterConfig& s) {
    s.treeCount = readInteger(j, "treeCount", s.treeCount);
    s.denseTreeCount = readInteger(j, "denseTreeCount", s.denseTreeCount);
    s.rockCount = readInteger(j, "rockCount", s.rockCount);
    s.seed = readInteger(j, "seed", s.seed);
    if (j.contains("denseTarget")) {
        const auto& target = j["denseTarget"];
        s.denseTarget = glm::vec2(target.value("x", 0.0f), target.value("z", 0.0f));
    }
}

void readCollectibles(const json& j, CollectiblesConfig& c) {
    c.seed = readInteger(j, "seed", c.seed);
    c.totalCount = readInteger(j, "totalCount", c.totalCount);
    c.clusterMin = readInteger(j, "clusterMin", c.clusterMin);
    c.clusterMax = readInteger(j, "clusterMax", c.clusterMax);
    c.clusterRadius = j.value("clusterRadius", c.clusterRadius);
    c.minDistanceFromSpawn = j.value("minDistanceFromSpawn", c.minDistanceFromSpawn);
    c.pickupRadius = j.value("pickupRadius", c.pickupRadius);
}

void readGoal(const json& j, GoalConfig& g) {
    g.seed = readInteger(j, "seed", g.seed);
    g.yardSize = j.value("yardSize", g.yardSize);
    g.ringInnerInset = j.value("ringInnerInset", g.ringInnerInset);
    g.ringOuterInset = j.value("ringOuterInset", g.ringOuterInset);
    g.maxTries = readInteger(j, "maxTries", g.maxTries);
    g.maxSlope = readDegrees(j, "maxSlopeDegrees", g.maxSlope);
    g.ownerHeightOffset = j.value("ownerHeightOffset", g.ownerHeightOffset);
    g.arrivalRadius = j.value("arrivalRadius", g.arrivalRadius);
}

void readCharacter(const json& j, CharacterConfig& c) {
    c.radius = j.value("radius", c.radius);
    c.halfHeight = j.value("halfHeight", c.halfHeight);
    c.maxSpeed = j.value("maxSpeed", c.maxSpeed);
    c.acceleration = j.value("acceleration", c.acceleration);
    c.jumpSpeed = j.value("jumpSpeed", c.jumpSpeed);
    c.maxSlopeClimb = readDegrees(j, "maxSlopeClimbDegrees", c.maxSlopeClimb);
    c.slideSlope = readDegrees(j, "slideSlopeDegrees", c.slideSlope);
    c.slideStrength = j.value("slideStrength", c.slideStrength);
    c.starvingSpeedMultiplier = j.value("starvingSpeedMultiplier", c.starvingSpeedMultiplier);
    c.coyoteTime = j.value("coyoteTime", c.coyoteTime);
    c.jumpBufferTime = j.value("jumpBufferTime", c.jumpBufferTime);
    c.walkSpeedFactor = j.value("walkSpeedFactor", c.walkSpeedFactor);
}

void readCamera(const json& j, OrbitCameraConfig& c) {
    c.yaw = j.value("yaw", c.yaw);
    c.pitch = j.value("pitch", c.pitch);
    c.distance = j.value("distance", c.distance);
    c.height = j.value("height", c.height);
    c.minDistance = j.value("minDistance", c.minDistance);
    c.occlusionPadding = j.value("occlusionPadding", c.occlusionPadding);
    c.sensitivity = j.value("sensitivity", c.sensitivity);
    c.minPitch = j.value("minPitch", c.minPitch);
    c.maxPitch = j.value("maxPitch", c.maxPitch);
    c.positionSmoothSpeed = j.value("positionSmoothSpeed", c.positionSmoothSpeed);
    c.targetSmoothSpeed = j.value("targetSmoothSpeed", c.targetSmoothSpeed);
}

} // namespace

WorldConfig WorldConfig::defaults() {
    WorldConfig config;
    config.terrain.seed = 42;
    config.terrain.maxHeight = 55.0f;
    config.terrain.borderHeight = 165.0f;
    return config;
}

WorldConfig WorldConfig::loadFromJson(const std::string& jsonPath) {
    std::ifstream file(jsonPath);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "WorldConfig: Failed to open config file: %s", jsonPath.c_str());
        return defaults();
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    return loadFromJsonString(content);
}

WorldConfig WorldConfig::loadFromJsonString(const std::string& jsonString) {
    WorldConfig config = defaults();

    try {
        json j = json::parse(jsonString);

        config.sessionSalt = readInteger(j, "sessionSalt", config.sessionSalt);
        config.spawnLift = j.value("spawnLift", config.spawnLift);

        if (j.contains("terrain")) readTerrain(j["terrain"], config.terrain);
        if (j.contains("scenery")) readScenery(j["scenery"], config.scenery);
        if (j.contains("collectibles")) readCollectibles(j["collectibles"], config.collectibles);
        if (j.contains("goal")) readGoal(j["goal"], config.goal);
        if (j.contains("character")) readCharacter(j["character"], config.character);
        if (j.contains("camera")) readCamera(j["camera"], config.camera);

        SDL_Log("WorldConfig: Loaded config with terrain seed=%d, size=%u, salt=%u",
                config.terrain.seed, config.terrain.size, config.sessionSalt);

    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "WorldConfig: JSON parse error: %s", e.what());
        return defaults();
    }

    return config;
}

void WorldConfig::validate() const {
    terrain.validate();
    scenery.validate();
    collectibles.validate();
    goal.validate();
    character.validate();
    camera.validate();
}
