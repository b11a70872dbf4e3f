#pragma once

#include "../math/Vec3.h"
#include <string>

// Tunables for one dice session. Defaults match config/dice.json.
struct SimConfig {
    std::string stageAsset = "assets/scene.glb";
    std::string dieAsset = "assets/dice.glb";
    float stageScale = 4.0f;

    Vec3 gravity = {0.0f, -9.82f, 0.0f};
    float friction = 0.4f;
    float restitution = 0.25f;
    float contactStiffness = 1e8f;
    float contactRelaxation = 3.0f;
    int solverIterations = 20;
    float solverTolerance = 0.001f;

    float fixedTimeStep = 1.0f / 60.0f;
    int maxSubSteps = 10;
    float maxFrameDelta = 0.02f;

    float dieMass = 0.3f;
    float linearDamping = 0.08f;
    float angularDamping = 0.07f;
    float spinRange = 10.0f;
    float launchJitter = 0.4f;
    float sleepSpeedLimit = 0.2f;
    float sleepTimeLimit = 1.0f;

    float dieLifetime = 90.0f;
    float clearance = 0.02f;
    float exclusionFactor = 0.9f;
    float dropMarginMin = 1.5f;
    float dropMarginScale = 2.0f;
    float aimFallbackDistance = 3.0f;

    int preRollSteps = 6;
    float preRollStep = 1.0f / 120.0f;

    bool singleDiePolicy = true;

    int windowWidth = 1280;
    int windowHeight = 720;
};
