#pragma once

// Parameters shared by every contact in the world.
struct ContactMaterial {
    float friction = 0.4f;
    float restitution = 0.25f;
    float stiffness = 1e8f;
    float relaxation = 3.0f;
};

// Per-body motion settings applied at creation.
struct BodySettings {
    float linearDamping = 0.01f;
    float angularDamping = 0.01f;
    bool allowSleep = false;
    float sleepSpeedLimit = 0.1f;
    float sleepTimeLimit = 1.0f;
};
