#pragma once

#include "terrain/TerrainConfig.h"
#include "world/Scenery.h"
#include "world/Collectibles.h"
#include "world/GoalSite.h"
#include "scene/CharacterController.h"
#include "scene/OrbitCamera.h"

#include <cstdint>
#include <string>

/**
 * WorldConfig - Every tunable of a simulated world in one place
 *
 * Defaults reproduce the shipped game. A JSON document may override any
 * subset of fields; angles in JSON are degrees, the structs hold radians.
 *
 *   {
 *     "sessionSalt": 7,
 *     "terrain":      { "seed": 42, "size": 513, "borderHeight": 165 },
 *     "scenery":      { "treeCount": 900, "denseTarget": { "x": 200, "z": -150 } },
 *     "collectibles": { "totalCount": 70, "pickupRadius": 1.8 },
 *     "goal":         { "maxSlopeDegrees": 28 },
 *     "character":    { "maxSpeed": 12.75, "maxSlopeClimbDegrees": 40 },
 *     "camera":       { "distance": 8.5 }
 *   }
 */
struct WorldConfig {
    TerrainConfig terrain;
    ScatterConfig scenery;
    CollectiblesConfig collectibles;
    GoalConfig goal;
    CharacterConfig character;
    OrbitCameraConfig camera;

    uint32_t sessionSalt = 0;
    float spawnLift = 6.0f;   // Spawn height above the terrain at the origin

    // The shipped world: seed 42 and a taller border ridge than the generator default
    static WorldConfig defaults();

    // Missing file or malformed JSON: logs an error and returns defaults()
    static WorldConfig loadFromJson(const std::string& jsonPath);
    static WorldConfig loadFromJsonString(const std::string& jsonString);

    // Throws std::invalid_argument naming the first invalid section
    void validate() const;
};
