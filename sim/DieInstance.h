#pragma once

#include "../math/Vec3.h"

#include <cstdint>

struct RigidBody;
struct VisualNode;

// Metadata measured from the loaded die model, cloned into every spawn.
struct DieTemplate {
    int modelId = -1;
    Vec3 size = {1.0f, 1.0f, 1.0f};
    float halfHeight = 0.5f;
    // Bounding box centre relative to the model origin.
    Vec3 centerOffset;
    bool usedFallback = false;
};

// A live die: the body is authoritative, the visual is copied from it.
struct DieInstance {
    uint32_t id = 0;
    RigidBody* body = nullptr;
    VisualNode* visual = nullptr;
    double bornAt = 0.0;
    double expiresAt = 0.0;
    float halfHeight = 0.5f;
    Vec3 size = {1.0f, 1.0f, 1.0f};
    Vec3 spawnPosition;
};
