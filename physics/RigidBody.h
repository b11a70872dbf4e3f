#pragma once

#include "../math/Vec3.h"
#include "../math/Quat.h"
#include "collision/Collider.h"

#include <cstdint>

struct RigidBody {
    uint32_t id = 0;
    Vec3 position;
    Vec3 velocity;
    Quat orientation;
    Vec3 angularVelocity;
    float mass = 0.0f;
    Collider collider;
    bool isStatic = false;

    // Velocity retained per second is (1 - damping).
    float linearDamping = 0.01f;
    float angularDamping = 0.01f;

    bool allowSleep = false;
    float sleepSpeedLimit = 0.1f;
    float sleepTimeLimit = 1.0f;
    bool sleeping = false;
    float sleepTimer = 0.0f;

    float invMass() const {
        if (isStatic || mass <= 0.0001f) return 0.0f;
        return 1.0f / mass;
    }

    void wakeUp() {
        sleeping = false;
        sleepTimer = 0.0f;
    }

    void sleep() {
        sleeping = true;
        velocity = {0.0f, 0.0f, 0.0f};
        angularVelocity = {0.0f, 0.0f, 0.0f};
    }

    void setVelocity(const Vec3& v) {
        velocity = v;
        wakeUp();
    }

    Vec3 getInvInertiaBody() const {
        if (isStatic) return {0.0f, 0.0f, 0.0f};
        if (mass <= 0.0001f) return {0.0f, 0.0f, 0.0f};

        if (collider.type == ColliderType::Box) {
            Vec3 h = collider.box.halfExtents;
            float Ixx = (1.0f / 3.0f) * mass * (h.y * h.y + h.z * h.z);
            float Iyy = (1.0f / 3.0f) * mass * (h.x * h.x + h.z * h.z);
            float Izz = (1.0f / 3.0f) * mass * (h.x * h.x + h.y * h.y);
            return {
                (Ixx > 0.0001f) ? (1.0f / Ixx) : 0.0f,
                (Iyy > 0.0001f) ? (1.0f / Iyy) : 0.0f,
                (Izz > 0.0001f) ? (1.0f / Izz) : 0.0f,
            };
        }

        // Planes and triangle meshes are only ever static.
        return {0.0f, 0.0f, 0.0f};
    }
};
