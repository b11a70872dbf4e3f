#pragma once

#include "../math/Vec3.h"
#include "RigidBody.h"
#include "Material.h"
#include "BroadPhase.h"

#include <vector>
#include <cmath>
#include <algorithm>
#include <cstdint>
#include <chrono>

class PhysicsWorld {
public:
    PhysicsWorld();

    int ompMinBodiesForParallel = 32;

    // Performance statistics for the last step() call.
    struct PerfStats {
        float stepMs = 0.0f;
        float buildContactsMs = 0.0f;
        float solveMs = 0.0f;
        int bodies = 0;
        int awake = 0;
        int broadphasePairs = 0;
        int manifolds = 0;
        int solverIterationsUsed = 0;
    };

    PerfStats perf;

    std::vector<RigidBody*> bodies;
    Vec3 gravity = {0.0f, -9.82f, 0.0f};
    ContactMaterial contactMaterial;

    int solverIterations = 20;
    float solverTolerance = 0.001f;

    // Upper bound on the Baumgarte-style push-out velocity from penetration.
    float maxPenetrationBias = 4.0f;

    // Simulated time and the fixed-step accumulator.
    double time = 0.0;
    float accumulator = 0.0f;
    float currentDt = 1.0f / 60.0f;
    uint64_t stepCount = 0;

    // Returns false when the body is null or already registered.
    bool addRigidBody(RigidBody* body);
    // Returns false when the body was not registered.
    bool removeRigidBody(RigidBody* body);
    bool contains(const RigidBody* body) const;

    // Accumulates elapsed wall time and advances in fixed increments, at most
    // maxSubSteps per call. Time left over after the cap is discarded. Returns
    // the number of fixed steps taken.
    int step(float fixedTimeStep, float elapsed, int maxSubSteps);
    void stepFixed(float dt);

    struct ContactPointState {
        Vec3 pointWorld;
        float penetration = 0.0f;
        float targetNormalVelocity = 0.0f;
        float normalImpulse = 0.0f;
        Vec3 tangentImpulse = {0.0f, 0.0f, 0.0f};
    };

    // Normal points from a towards b. Static or unbounded bodies are always a.
    struct ContactManifold {
        RigidBody* a = nullptr;
        RigidBody* b = nullptr;
        Vec3 normal = {0.0f, 1.0f, 0.0f};
        ContactPointState points[8];
        int count = 0;
    };

    std::vector<ContactManifold> contacts;
    BroadPhase broadPhase;

    static void reduceManifoldToMaxPen(ContactManifold& m, int maxCount);
    static void buildFrictionBasis(const Vec3& n, Vec3& t1, Vec3& t2);

    void buildContacts(std::vector<ContactManifold>& out);
    void appendPairContacts(RigidBody* a, RigidBody* b, std::vector<ContactManifold>& out) const;

    static float clampf(float v, float lo, float hi);
    static void getBoxAxes(const RigidBody* b, Vec3 outAxes[3]);
    static void getBoxVertices(const RigidBody* b, Vec3 outVerts[8]);
    static int clipPolygonToPlane(const Vec3* inVerts, int inCount, Vec3* outVerts, const Vec3& n, float d);
    static float closestPtSegmentSegment(
        const Vec3& p1,
        const Vec3& q1,
        const Vec3& p2,
        const Vec3& q2,
        float& s,
        float& t,
        Vec3& c1,
        Vec3& c2
    );
    static bool pointInTri(const Vec3& p, const Vec3& a, const Vec3& b, const Vec3& c);
    static Vec3 closestPtPointTriangle(const Vec3& p, const Vec3& a, const Vec3& b, const Vec3& c);

    bool collidePlaneBox(const RigidBody* planeBody, const RigidBody* boxBody, ContactManifold& m) const;
    bool collideBoxBox(const RigidBody* a, const RigidBody* b, ContactManifold& m) const;
    void appendMeshBoxManifolds(const RigidBody* meshBody, const RigidBody* boxBody, std::vector<ContactManifold>& out, int maxManifolds) const;

    void wakeTouchedSleepers(const std::vector<ContactManifold>& ms);
    void computeContactTargets(std::vector<ContactManifold>& ms);
    float solveContacts(std::vector<ContactManifold>& ms);
    void updateSleep(float deltaTime);

    Vec3 invInertiaWorldMul(const RigidBody* body, const Vec3& v) const;
    void applyImpulseAtPoint(RigidBody* body, const Vec3& impulse, const Vec3& pointWorld);

private:
    uint32_t nextBodyId = 1;

    float spookA = 0.0f;
    float spookB = 0.0f;
    float spookEps = 0.0f;

    void computeSpookParams(float h);
    bool isDynamicAwake(const RigidBody* body) const;
    float effectiveMass(const RigidBody* a, const RigidBody* b, const Vec3& rA, const Vec3& rB, const Vec3& dir) const;
};
