#include "PhysicsWorld.h"
#include "collision/TriangleMesh.h"

#include <chrono>
#include <cmath>
#include <algorithm>
#include <cstdint>
#include <limits>

PhysicsWorld::PhysicsWorld() {
    bodies.reserve(64);
    contacts.reserve(64);
}

bool PhysicsWorld::addRigidBody(RigidBody* body) {
    if (!body) return false;
    if (contains(body)) return false;
    if (body->id == 0) body->id = nextBodyId++;
    bodies.push_back(body);
    return true;
}

bool PhysicsWorld::removeRigidBody(RigidBody* body) {
    auto it = std::find(bodies.begin(), bodies.end(), body);
    if (it == bodies.end()) return false;
    bodies.erase(it);
    // Manifolds from the last step may still point at the body.
    contacts.clear();
    return true;
}

bool PhysicsWorld::contains(const RigidBody* body) const {
    if (!body) return false;
    return std::find(bodies.begin(), bodies.end(), body) != bodies.end();
}

int PhysicsWorld::step(float fixedTimeStep, float elapsed, int maxSubSteps) {
    using clock = std::chrono::steady_clock;

    perf.stepMs = 0.0f;
    perf.buildContactsMs = 0.0f;
    perf.solveMs = 0.0f;

    if (!(fixedTimeStep > 0.0f) || !std::isfinite(fixedTimeStep)) return 0;
    if (!std::isfinite(elapsed) || elapsed < 0.0f) elapsed = 0.0f;
    maxSubSteps = std::max(1, maxSubSteps);

    accumulator += elapsed;

    int substeps = 0;
    while (accumulator >= fixedTimeStep && substeps < maxSubSteps) {
        auto t0 = clock::now();
        stepFixed(fixedTimeStep);
        auto t1 = clock::now();
        perf.stepMs += std::chrono::duration<float, std::milli>(t1 - t0).count();
        accumulator -= fixedTimeStep;
        ++substeps;
    }

    // Whatever the substep cap left behind is dropped.
    accumulator = std::fmod(accumulator, fixedTimeStep);
    if (accumulator < 0.0f) accumulator = 0.0f;
    return substeps;
}

void PhysicsWorld::stepFixed(float deltaTime) {
    using clock = std::chrono::steady_clock;

    if (!(deltaTime > 0.0f)) return;
    currentDt = deltaTime;
    computeSpookParams(deltaTime);

    const int nBodies = (int)bodies.size();
    const bool useOmpBodies = (nBodies >= ompMinBodiesForParallel);
    perf.bodies = nBodies;

    auto applyGravity = [&](RigidBody* body) {
        if (!isDynamicAwake(body)) return;
        body->velocity += gravity * deltaTime;
    };

    if (useOmpBodies) {
        #pragma omp parallel for schedule(static)
        for (int i = 0; i < nBodies; ++i) { applyGravity(bodies[i]); }
    } else {
        for (int i = 0; i < nBodies; ++i) { applyGravity(bodies[i]); }
    }

    contacts.clear();

    auto tContacts0 = clock::now();
    buildContacts(contacts);
    auto tContacts1 = clock::now();
    perf.buildContactsMs += std::chrono::duration<float, std::milli>(tContacts1 - tContacts0).count();

    wakeTouchedSleepers(contacts);
    computeContactTargets(contacts);

    auto tSolve0 = clock::now();
    const float tolSq = solverTolerance * solverTolerance;
    int iter = 0;
    for (; iter < solverIterations; ++iter) {
        float deltaTot = solveContacts(contacts);
        if (deltaTot * deltaTot < tolSq) {
            ++iter;
            break;
        }
    }
    perf.solverIterationsUsed = iter;
    auto tSolve1 = clock::now();
    perf.solveMs += std::chrono::duration<float, std::milli>(tSolve1 - tSolve0).count();

    auto integrate = [&](RigidBody* body) {
        if (!isDynamicAwake(body)) return;

        body->velocity = body->velocity * std::pow(1.0f - body->linearDamping, deltaTime);
        body->angularVelocity = body->angularVelocity * std::pow(1.0f - body->angularDamping, deltaTime);

        body->position += body->velocity * deltaTime;
        body->orientation.integrateAngularVelocity(body->angularVelocity, deltaTime);
    };

    if (useOmpBodies) {
        #pragma omp parallel for schedule(static)
        for (int i = 0; i < nBodies; ++i) { integrate(bodies[i]); }
    } else {
        for (int i = 0; i < nBodies; ++i) { integrate(bodies[i]); }
    }

    updateSleep(deltaTime);

    int awakeCount = 0;
    for (RigidBody* body : bodies) {
        if (body->isStatic) continue;
        if (!body->sleeping) ++awakeCount;
    }
    perf.awake = awakeCount;

    time += deltaTime;
    ++stepCount;
}

void PhysicsWorld::computeSpookParams(float h) {
    const float k = std::max(contactMaterial.stiffness, 1e-6f);
    const float d = std::max(contactMaterial.relaxation, 0.0f);
    spookA = 4.0f / (h * (1.0f + 4.0f * d));
    spookB = (4.0f * d) / (1.0f + 4.0f * d);
    spookEps = 4.0f / (h * h * k * (1.0f + 4.0f * d));
}

bool PhysicsWorld::isDynamicAwake(const RigidBody* body) const {
    return body && !body->isStatic && !body->sleeping && body->mass > 0.0001f;
}

void PhysicsWorld::updateSleep(float deltaTime) {
    for (RigidBody* body : bodies) {
        if (body->isStatic) continue;
        if (!body->allowSleep) continue;
        if (body->sleeping) continue;

        // Linear and angular speed are each held to the same limit.
        float limitSq = body->sleepSpeedLimit * body->sleepSpeedLimit;
        if (body->velocity.lengthSq() < limitSq && body->angularVelocity.lengthSq() < limitSq) {
            body->sleepTimer += deltaTime;
            if (body->sleepTimer > body->sleepTimeLimit) body->sleep();
        } else {
            body->sleepTimer = 0.0f;
        }
    }
}

void PhysicsWorld::reduceManifoldToMaxPen(ContactManifold& m, int maxCount) {
    if (maxCount <= 0) { m.count = 0; return; }
    if (m.count <= maxCount) return;

    int idx[8];
    for (int i = 0; i < m.count; ++i) idx[i] = i;
    const int n = m.count;

    for (int i = 0; i < maxCount; ++i) {
        int best = i;
        float bestPen = m.points[idx[i]].penetration;
        for (int j = i + 1; j < n; ++j) {
            float pen = m.points[idx[j]].penetration;
            if (pen > bestPen) {
                bestPen = pen;
                best = j;
            }
        }
        std::swap(idx[i], idx[best]);
    }

    ContactPointState kept[8];
    for (int i = 0; i < maxCount; ++i) kept[i] = m.points[idx[i]];
    for (int i = 0; i < maxCount; ++i) m.points[i] = kept[i];
    m.count = maxCount;
}

void PhysicsWorld::buildFrictionBasis(const Vec3& n, Vec3& t1, Vec3& t2) {
    Vec3 a = (fabsf(n.y) < 0.9f) ? Vec3{0.0f, 1.0f, 0.0f} : Vec3{1.0f, 0.0f, 0.0f};
    t1 = Vec3::cross(a, n);
    float lenSq = t1.lengthSq();
    if (lenSq < 1e-12f) {
        a = Vec3{0.0f, 0.0f, 1.0f};
        t1 = Vec3::cross(a, n);
        lenSq = t1.lengthSq();
    }
    if (lenSq > 1e-12f) t1 = t1 / sqrtf(lenSq);
    else t1 = Vec3{1.0f, 0.0f, 0.0f};
    t2 = Vec3::cross(n, t1);
}

void PhysicsWorld::buildContacts(std::vector<ContactManifold>& out) {
    broadPhase.build(bodies);
    perf.broadphasePairs = (int)broadPhase.pairs.size();

    for (const BroadPhasePair& pair : broadPhase.pairs) {
        appendPairContacts(pair.a, pair.b, out);
    }

    perf.manifolds = (int)out.size();
}

void PhysicsWorld::appendPairContacts(RigidBody* a, RigidBody* b, std::vector<ContactManifold>& out) const {
    if (!a || !b) return;
    if (a->isStatic && b->isStatic) return;

    // Order so the plane or mesh side is always body a.
    auto rank = [](const RigidBody* body) -> int {
        switch (body->collider.type) {
            case ColliderType::Plane: return 0;
            case ColliderType::Mesh: return 1;
            case ColliderType::Box: return 2;
        }
        return 2;
    };
    if (rank(b) < rank(a)) std::swap(a, b);

    if (b->collider.type != ColliderType::Box) return;

    switch (a->collider.type) {
        case ColliderType::Plane: {
            ContactManifold m;
            if (collidePlaneBox(a, b, m)) out.push_back(m);
            break;
        }
        case ColliderType::Mesh:
            appendMeshBoxManifolds(a, b, out, 4);
            break;
        case ColliderType::Box: {
            ContactManifold m;
            if (collideBoxBox(a, b, m)) out.push_back(m);
            break;
        }
    }
}

float PhysicsWorld::clampf(float v, float lo, float hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

void PhysicsWorld::getBoxAxes(const RigidBody* b, Vec3 outAxes[3]) {
    outAxes[0] = b->orientation.rotate({1.0f, 0.0f, 0.0f});
    outAxes[1] = b->orientation.rotate({0.0f, 1.0f, 0.0f});
    outAxes[2] = b->orientation.rotate({0.0f, 0.0f, 1.0f});
}

void PhysicsWorld::getBoxVertices(const RigidBody* b, Vec3 outVerts[8]) {
    const Vec3 he = b->collider.box.halfExtents;
    int vIdx = 0;
    for (int dx = -1; dx <= 1; dx += 2) {
        for (int dy = -1; dy <= 1; dy += 2) {
            for (int dz = -1; dz <= 1; dz += 2) {
                Vec3 local = {he.x * dx, he.y * dy, he.z * dz};
                outVerts[vIdx++] = b->orientation.rotate(local) + b->position;
            }
        }
    }
}

int PhysicsWorld::clipPolygonToPlane(const Vec3* inVerts, int inCount, Vec3* outVerts, const Vec3& n, float d) {
    if (inCount <= 0) return 0;
    int outCount = 0;
    Vec3 prev = inVerts[inCount - 1];
    float prevDist = Vec3::dot(n, prev) - d;

    for (int i = 0; i < inCount; ++i) {
        Vec3 cur = inVerts[i];
        float curDist = Vec3::dot(n, cur) - d;

        const bool curIn = (curDist <= 0.0f);
        const bool prevIn = (prevDist <= 0.0f);

        if (curIn ^ prevIn) {
            float t = prevDist / (prevDist - curDist);
            outVerts[outCount++] = prev + (cur - prev) * t;
        }
        if (curIn) { outVerts[outCount++] = cur; }

        prev = cur;
        prevDist = curDist;
    }
    return outCount;
}

float PhysicsWorld::closestPtSegmentSegment(const Vec3& p1, const Vec3& q1, const Vec3& p2, const Vec3& q2, float& s, float& t, Vec3& c1, Vec3& c2) {
    Vec3 d1 = q1 - p1;
    Vec3 d2 = q2 - p2;
    Vec3 r = p1 - p2;
    float a = Vec3::dot(d1, d1);
    float e = Vec3::dot(d2, d2);
    float f = Vec3::dot(d2, r);

    const float eps = 1e-8f;
    if (a <= eps && e <= eps) {
        s = 0.0f;
        t = 0.0f;
        c1 = p1;
        c2 = p2;
        return (c1 - c2).lengthSq();
    }
    if (a <= eps) {
        s = 0.0f;
        t = clampf(f / e, 0.0f, 1.0f);
    } else {
        float c = Vec3::dot(d1, r);
        if (e <= eps) {
            t = 0.0f;
            s = clampf(-c / a, 0.0f, 1.0f);
        } else {
            float b = Vec3::dot(d1, d2);
            float denom = a * e - b * b;
            s = (denom != 0.0f) ? clampf((b * f - c * e) / denom, 0.0f, 1.0f) : 0.0f;
            t = (b * s + f) / e;
            if (t < 0.0f) {
                t = 0.0f;
                s = clampf(-c / a, 0.0f, 1.0f);
            } else if (t > 1.0f) {
                t = 1.0f;
                s = clampf((b - c) / a, 0.0f, 1.0f);
            }
        }
    }

    c1 = p1 + d1 * s;
    c2 = p2 + d2 * t;
    return (c1 - c2).lengthSq();
}

bool PhysicsWorld::pointInTri(const Vec3& p, const Vec3& a, const Vec3& b, const Vec3& c) {
    Vec3 v0 = b - a;
    Vec3 v1 = c - a;
    Vec3 v2 = p - a;
    float d00 = Vec3::dot(v0, v0);
    float d01 = Vec3::dot(v0, v1);
    float d11 = Vec3::dot(v1, v1);
    float d20 = Vec3::dot(v2, v0);
    float d21 = Vec3::dot(v2, v1);
    float denom = d00 * d11 - d01 * d01;
    if (fabsf(denom) < 1e-12f) return false;
    float inv = 1.0f / denom;
    float v = (d11 * d20 - d01 * d21) * inv;
    float w = (d00 * d21 - d01 * d20) * inv;
    float u = 1.0f - v - w;
    const float eps = -1e-4f;
    return u >= eps && v >= eps && w >= eps;
}

Vec3 PhysicsWorld::closestPtPointTriangle(const Vec3& p, const Vec3& a, const Vec3& b, const Vec3& c) {
    Vec3 ab = b - a;
    Vec3 ac = c - a;
    Vec3 ap = p - a;
    float d1 = Vec3::dot(ab, ap);
    float d2 = Vec3::dot(ac, ap);
    if (d1 <= 0.0f && d2 <= 0.0f) return a;

    Vec3 bp = p - b;
    float d3 = Vec3::dot(ab, bp);
    float d4 = Vec3::dot(ac, bp);
    if (d3 >= 0.0f && d4 <= d3) return b;

    float vc = d1 * d4 - d3 * d2;
    if (vc <= 0.0f && d1 >= 0.0f && d3 <= 0.0f) {
        float v = d1 / (d1 - d3);
        return a + ab * v;
    }

    Vec3 cp = p - c;
    float d5 = Vec3::dot(ab, cp);
    float d6 = Vec3::dot(ac, cp);
    if (d6 >= 0.0f && d5 <= d6) return c;

    float vb = d5 * d2 - d1 * d6;
    if (vb <= 0.0f && d2 >= 0.0f && d6 <= 0.0f) {
        float w = d2 / (d2 - d6);
        return a + ac * w;
    }

    float va = d3 * d6 - d5 * d4;
    if (va <= 0.0f && (d4 - d3) >= 0.0f && (d5 - d6) >= 0.0f) {
        float w = (d4 - d3) / ((d4 - d3) + (d5 - d6));
        return b + (c - b) * w;
    }

    float denom = 1.0f / (va + vb + vc);
    float v = vb * denom;
    float w = vc * denom;
    return a + ab * v + ac * w;
}

bool PhysicsWorld::collidePlaneBox(const RigidBody* planeBody, const RigidBody* boxBody, ContactManifold& m) const {
    const Vec3 n = planeBody->orientation.rotate(planeBody->collider.plane.normal).normalized();
    if (n.lengthSq() < 0.5f) return false;

    m.a = const_cast<RigidBody*>(planeBody);
    m.b = const_cast<RigidBody*>(boxBody);
    m.normal = n;
    m.count = 0;

    Vec3 verts[8];
    getBoxVertices(boxBody, verts);
    for (const Vec3& v : verts) {
        float dist = Vec3::dot(v - planeBody->position, n);
        if (dist >= 0.0f) continue;
        ContactPointState& cp = m.points[m.count++];
        cp.pointWorld = v - n * dist;
        cp.penetration = -dist;
    }

    if (m.count > 4) reduceManifoldToMaxPen(m, 4);
    return m.count > 0;
}

bool PhysicsWorld::collideBoxBox(const RigidBody* a, const RigidBody* b, ContactManifold& m) const {
    const Vec3 heA = a->collider.box.halfExtents;
    const Vec3 heB = b->collider.box.halfExtents;
    Vec3 Ax[3], Bx[3];
    getBoxAxes(a, Ax);
    getBoxAxes(b, Bx);
    Vec3 d = b->position - a->position;
    float bestOverlap = std::numeric_limits<float>::infinity();
    Vec3 bestAxis = {0.0f, 1.0f, 0.0f};
    int bestAxisType = -1;
    int bestAxisIndex = -1;

    auto testAxis = [&](const Vec3& axis, int axisType, int axisIndex) -> bool {
        float lenSq = axis.lengthSq();
        if (lenSq < 1e-12f) return true;
        Vec3 n = axis / sqrtf(lenSq);
        float ra = heA.x * fabsf(Vec3::dot(n, Ax[0])) + heA.y * fabsf(Vec3::dot(n, Ax[1])) + heA.z * fabsf(Vec3::dot(n, Ax[2]));
        float rb = heB.x * fabsf(Vec3::dot(n, Bx[0])) + heB.y * fabsf(Vec3::dot(n, Bx[1])) + heB.z * fabsf(Vec3::dot(n, Bx[2]));
        float overlap = (ra + rb) - fabsf(Vec3::dot(d, n));
        if (overlap < 0.0f) return false;
        // Slight bias towards face axes so nearly parallel edges do not win.
        float score = (axisType == 2) ? overlap * 1.05f + 1e-4f : overlap;
        if (score < bestOverlap) {
            bestOverlap = score;
            bestAxis = n;
            bestAxisType = axisType;
            bestAxisIndex = axisIndex;
        }
        return true;
    };

    for (int i = 0; i < 3; ++i) { if (!testAxis(Ax[i], 0, i)) return false; }
    for (int i = 0; i < 3; ++i) { if (!testAxis(Bx[i], 1, i)) return false; }

    int crossIndex = 0;
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            if (!testAxis(Vec3::cross(Ax[i], Bx[j]), 2, crossIndex)) return false;
            ++crossIndex;
        }
    }

    if (bestAxisType < 0) return false;
    if (Vec3::dot(bestAxis, d) < 0.0f) bestAxis = -bestAxis;
    if (bestAxisType == 2) bestOverlap = (bestOverlap - 1e-4f) / 1.05f;
    if (bestOverlap < 1e-5f) bestOverlap = 1e-5f;

    auto heComp = [](const Vec3& he, int axis) -> float {
        return (axis == 0) ? he.x : (axis == 1 ? he.y : he.z);
    };

    m.a = const_cast<RigidBody*>(a);
    m.b = const_cast<RigidBody*>(b);
    m.normal = bestAxis;
    m.count = 0;

    if (bestAxisType == 2) {
        const int ai = bestAxisIndex / 3;
        const int bi = bestAxisIndex % 3;
        const int a1 = (ai + 1) % 3;
        const int a2 = (ai + 2) % 3;
        const int b1 = (bi + 1) % 3;
        const int b2 = (bi + 2) % 3;

        const float sA1 = (Vec3::dot(bestAxis, Ax[a1]) >= 0.0f) ? 1.0f : -1.0f;
        const float sA2 = (Vec3::dot(bestAxis, Ax[a2]) >= 0.0f) ? 1.0f : -1.0f;
        const float sB1 = (Vec3::dot(-bestAxis, Bx[b1]) >= 0.0f) ? 1.0f : -1.0f;
        const float sB2 = (Vec3::dot(-bestAxis, Bx[b2]) >= 0.0f) ? 1.0f : -1.0f;

        Vec3 aEdgeCenter = a->position + Ax[a1] * (sA1 * heComp(heA, a1)) + Ax[a2] * (sA2 * heComp(heA, a2));
        Vec3 bEdgeCenter = b->position + Bx[b1] * (sB1 * heComp(heB, b1)) + Bx[b2] * (sB2 * heComp(heB, b2));

        float s = 0.0f, t = 0.0f;
        Vec3 c1, c2;
        closestPtSegmentSegment(
            aEdgeCenter - Ax[ai] * heComp(heA, ai), aEdgeCenter + Ax[ai] * heComp(heA, ai),
            bEdgeCenter - Bx[bi] * heComp(heB, bi), bEdgeCenter + Bx[bi] * heComp(heB, bi),
            s, t, c1, c2);

        m.count = 1;
        m.points[0].pointWorld = (c1 + c2) * 0.5f;
        m.points[0].penetration = bestOverlap;
        return true;
    }

    const RigidBody* ref = (bestAxisType == 0) ? a : b;
    const RigidBody* inc = (bestAxisType == 0) ? b : a;
    Vec3 refAxes[3], incAxes[3];
    getBoxAxes(ref, refAxes);
    getBoxAxes(inc, incAxes);
    const Vec3 refHe = ref->collider.box.halfExtents;
    const Vec3 incHe = inc->collider.box.halfExtents;

    // Reference face points out of ref towards inc.
    const int refAxis = bestAxisIndex;
    const Vec3 refOut = (ref == a) ? bestAxis : -bestAxis;
    const float refSign = (Vec3::dot(refOut, refAxes[refAxis]) >= 0.0f) ? 1.0f : -1.0f;
    const Vec3 refNormal = refAxes[refAxis] * refSign;
    const Vec3 refCenter = ref->position + refNormal * heComp(refHe, refAxis);
    const int uAxis = (refAxis + 1) % 3;
    const int vAxis = (refAxis + 2) % 3;
    const Vec3 u = refAxes[uAxis];
    const Vec3 v = refAxes[vAxis];
    const float hu = heComp(refHe, uAxis);
    const float hv = heComp(refHe, vAxis);

    // Incident face is the one most anti-parallel to the reference normal.
    int incFaceAxis = 0;
    float maxAbs = fabsf(Vec3::dot(incAxes[0], refNormal));
    for (int i = 1; i < 3; ++i) {
        float d0 = fabsf(Vec3::dot(incAxes[i], refNormal));
        if (d0 > maxAbs) {
            maxAbs = d0;
            incFaceAxis = i;
        }
    }
    const float incSign = (Vec3::dot(incAxes[incFaceAxis], refNormal) > 0.0f) ? -1.0f : 1.0f;
    const Vec3 incCenter = inc->position + incAxes[incFaceAxis] * (incSign * heComp(incHe, incFaceAxis));
    const int incUAxis = (incFaceAxis + 1) % 3;
    const int incVAxis = (incFaceAxis + 2) % 3;
    const Vec3 iu = incAxes[incUAxis] * heComp(incHe, incUAxis);
    const Vec3 iv = incAxes[incVAxis] * heComp(incHe, incVAxis);

    Vec3 tmp1[16];
    Vec3 tmp2[16];
    tmp1[0] = incCenter + iu + iv;
    tmp1[1] = incCenter - iu + iv;
    tmp1[2] = incCenter - iu - iv;
    tmp1[3] = incCenter + iu - iv;
    int count = 4;

    count = clipPolygonToPlane(tmp1, count, tmp2, u, Vec3::dot(u, refCenter) + hu);
    if (count == 0) return false;
    count = clipPolygonToPlane(tmp2, count, tmp1, -u, Vec3::dot(-u, refCenter) + hu);
    if (count == 0) return false;
    count = clipPolygonToPlane(tmp1, count, tmp2, v, Vec3::dot(v, refCenter) + hv);
    if (count == 0) return false;
    count = clipPolygonToPlane(tmp2, count, tmp1, -v, Vec3::dot(-v, refCenter) + hv);
    if (count == 0) return false;

    const float planeD = Vec3::dot(refNormal, refCenter);
    for (int i = 0; i < count && m.count < 8; ++i) {
        const Vec3 p = tmp1[i];
        float distToPlane = Vec3::dot(refNormal, p) - planeD;
        if (distToPlane >= 0.0f) continue;
        m.points[m.count].pointWorld = p - refNormal * (0.5f * distToPlane);
        m.points[m.count].penetration = -distToPlane;
        m.count++;
    }
    if (m.count > 4) reduceManifoldToMaxPen(m, 4);

    if (m.count == 0) {
        m.count = 1;
        m.points[0].pointWorld = (a->position + b->position) * 0.5f;
        m.points[0].penetration = bestOverlap;
    }
    return true;
}

void PhysicsWorld::appendMeshBoxManifolds(const RigidBody* meshBody, const RigidBody* boxBody, std::vector<ContactManifold>& out, int maxManifolds) const {
    if (maxManifolds <= 0) return;
    if (!meshBody->collider.mesh) return;

    const TriangleMesh& mesh = *meshBody->collider.mesh;
    const Vec3 he = boxBody->collider.box.halfExtents;

    const Vec3 boxCenterM = meshBody->orientation.rotateInv(boxBody->position - meshBody->position);
    Vec3 boxAxesW[3];
    getBoxAxes(boxBody, boxAxesW);
    const Vec3 boxAxesM[3] = {
        meshBody->orientation.rotateInv(boxAxesW[0]),
        meshBody->orientation.rotateInv(boxAxesW[1]),
        meshBody->orientation.rotateInv(boxAxesW[2]),
    };

    const float r = he.length();
    std::vector<uint32_t> triIds;
    triIds.reserve(256);
    mesh.queryAabb(boxCenterM - Vec3{r, r, r}, boxCenterM + Vec3{r, r, r}, triIds);
    if (triIds.empty()) return;

    Vec3 vertsW[8];
    Vec3 vertsM[8];
    getBoxVertices(boxBody, vertsW);
    for (int i = 0; i < 8; ++i) vertsM[i] = meshBody->orientation.rotateInv(vertsW[i] - meshBody->position);

    // Triangles sharing a normal are merged so a flat floor made of many
    // triangles yields one manifold rather than one per triangle.
    struct Cluster {
        Vec3 nLocal;
        Vec3 a0, b0, c0;
        float pen = 0.0f;
        float support = 0.0f;
        std::vector<uint32_t> members;
    };
    std::vector<Cluster> clusters;
    clusters.reserve(8);

    auto addCluster = [&](uint32_t tid, const Vec3& nLocal, const Vec3& a, const Vec3& b, const Vec3& c, float pen, float support) {
        constexpr float sameNormalCos = 0.98f;
        for (Cluster& cl : clusters) {
            if (Vec3::dot(cl.nLocal, nLocal) >= sameNormalCos) {
                cl.members.push_back(tid);
                if (pen > cl.pen) {
                    cl.pen = pen;
                    cl.a0 = a; cl.b0 = b; cl.c0 = c;
                }
                return;
            }
        }
        Cluster cl;
        cl.nLocal = nLocal;
        cl.a0 = a; cl.b0 = b; cl.c0 = c;
        cl.pen = pen;
        cl.support = support;
        cl.members.push_back(tid);
        clusters.push_back(cl);
    };

    for (uint32_t tid : triIds) {
        if (tid >= mesh.tris.size()) continue;
        const TriangleMeshTri& t = mesh.tris[tid];
        const Vec3& a = mesh.vertices[t.a];
        const Vec3& b = mesh.vertices[t.b];
        const Vec3& c = mesh.vertices[t.c];

        Vec3 n = Vec3::cross(b - a, c - a);
        float nLenSq = n.lengthSq();
        if (nLenSq < 1e-12f) continue;
        Vec3 nLocal = n / sqrtf(nLenSq);

        // Skip triangles whose plane is close but whose area is out of reach.
        Vec3 closest = closestPtPointTriangle(boxCenterM, a, b, c);
        if ((closest - boxCenterM).lengthSq() > r * r) continue;

        Vec3 triCent = (a + b + c) * (1.0f / 3.0f);
        if (Vec3::dot(nLocal, boxCenterM - triCent) < 0.0f) nLocal = -nLocal;

        float rOnN =
            he.x * fabsf(Vec3::dot(nLocal, boxAxesM[0])) +
            he.y * fabsf(Vec3::dot(nLocal, boxAxesM[1])) +
            he.z * fabsf(Vec3::dot(nLocal, boxAxesM[2]));

        float distCenter = Vec3::dot(boxCenterM - a, nLocal);
        if (distCenter >= rOnN) continue;
        float pen = std::max(rOnN - distCenter, 1e-5f);

        Vec3 nWorld = meshBody->orientation.rotate(nLocal);
        addCluster(tid, nLocal, a, b, c, pen, std::max(0.0f, nWorld.y));
    }

    if (clusters.empty()) return;

    std::sort(clusters.begin(), clusters.end(), [](const Cluster& x, const Cluster& y) {
        if (x.support != y.support) return x.support > y.support;
        return x.pen > y.pen;
    });

    const int emitCount = std::min(maxManifolds, (int)clusters.size());
    for (int ci = 0; ci < emitCount; ++ci) {
        const Cluster& cl = clusters[ci];
        const Vec3 nLocal = cl.nLocal;

        ContactManifold m;
        m.a = const_cast<RigidBody*>(meshBody);
        m.b = const_cast<RigidBody*>(boxBody);
        m.normal = meshBody->orientation.rotate(nLocal);
        m.count = 0;

        for (int vi = 0; vi < 8 && m.count < 8; ++vi) {
            float dist = Vec3::dot(vertsM[vi] - cl.a0, nLocal);
            if (dist >= 0.0f) continue;

            // The projected vertex is kept when any triangle of the cluster
            // contains it, otherwise it moves to the nearest cluster triangle.
            Vec3 pPlane = vertsM[vi] - nLocal * dist;
            Vec3 triPtM = closestPtPointTriangle(pPlane, cl.a0, cl.b0, cl.c0);
            float bestSq = (triPtM - pPlane).lengthSq();
            for (uint32_t mid : cl.members) {
                if (bestSq <= 1e-12f) break;
                const TriangleMeshTri& mt = mesh.tris[mid];
                const Vec3& ma = mesh.vertices[mt.a];
                const Vec3& mb = mesh.vertices[mt.b];
                const Vec3& mc = mesh.vertices[mt.c];
                if (pointInTri(pPlane, ma, mb, mc)) {
                    triPtM = pPlane;
                    bestSq = 0.0f;
                    break;
                }
                Vec3 q = closestPtPointTriangle(pPlane, ma, mb, mc);
                float dSq = (q - pPlane).lengthSq();
                if (dSq < bestSq) {
                    bestSq = dSq;
                    triPtM = q;
                }
            }
            Vec3 pTriWorld = meshBody->orientation.rotate(triPtM) + meshBody->position;

            m.points[m.count].pointWorld = (pTriWorld + vertsW[vi]) * 0.5f;
            m.points[m.count].penetration = std::max(-dist, 1e-5f);
            ++m.count;
        }

        if (m.count > 4) reduceManifoldToMaxPen(m, 4);
        if (m.count > 0) out.push_back(m);
    }
}

void PhysicsWorld::wakeTouchedSleepers(const std::vector<ContactManifold>& ms) {
    auto speedSq = [](const RigidBody* body) {
        return std::max(body->velocity.lengthSq(), body->angularVelocity.lengthSq());
    };
    for (const ContactManifold& m : ms) {
        RigidBody* pair[2] = {m.a, m.b};
        for (int i = 0; i < 2; ++i) {
            RigidBody* sleeper = pair[i];
            RigidBody* other = pair[1 - i];
            if (!sleeper->sleeping || !isDynamicAwake(other)) continue;
            float limit = sleeper->sleepSpeedLimit;
            if (speedSq(other) >= 2.0f * limit * limit) sleeper->wakeUp();
        }
    }
}

void PhysicsWorld::computeContactTargets(std::vector<ContactManifold>& ms) {
    // Approach speeds at or below what gravity adds in one step are resting
    // contacts; they get no bounce so dice can settle.
    const float restitutionVelThreshold = std::max(0.08f, 2.0f * gravity.length() * currentDt);
    const float e = contactMaterial.restitution;

    for (ContactManifold& m : ms) {
        for (int i = 0; i < m.count; ++i) {
            ContactPointState& cp = m.points[i];
            const Vec3 p = cp.pointWorld;
            Vec3 vA = m.a->velocity + Vec3::cross(m.a->angularVelocity, p - m.a->position);
            Vec3 vB = m.b->velocity + Vec3::cross(m.b->angularVelocity, p - m.b->position);
            float vn = Vec3::dot(vB - vA, m.normal);

            float eEff = 0.0f;
            if (vn < -restitutionVelThreshold) {
                eEff = e;
            } else if (vn < 0.0f) {
                float speedRatio = (-vn) / restitutionVelThreshold;
                eEff = e * speedRatio * speedRatio;
            }

            float bias = std::min(spookA * cp.penetration, maxPenetrationBias);
            float velocityTerm = (vn < 0.0f) ? (1.0f + eEff) * vn : vn;
            cp.targetNormalVelocity = vn + bias - spookB * velocityTerm;
            cp.normalImpulse = 0.0f;
            cp.tangentImpulse = {0.0f, 0.0f, 0.0f};
        }
    }
}

float PhysicsWorld::effectiveMass(const RigidBody* a, const RigidBody* b, const Vec3& rA, const Vec3& rB, const Vec3& dir) const {
    float k = 0.0f;
    if (isDynamicAwake(a)) {
        k += a->invMass() + Vec3::dot(dir, Vec3::cross(invInertiaWorldMul(a, Vec3::cross(rA, dir)), rA));
    }
    if (isDynamicAwake(b)) {
        k += b->invMass() + Vec3::dot(dir, Vec3::cross(invInertiaWorldMul(b, Vec3::cross(rB, dir)), rB));
    }
    return k;
}

float PhysicsWorld::solveContacts(std::vector<ContactManifold>& ms) {
    float deltaTot = 0.0f;
    const float mu = contactMaterial.friction;

    for (ContactManifold& m : ms) {
        if (!isDynamicAwake(m.a) && !isDynamicAwake(m.b)) continue;

        Vec3 t1, t2;
        buildFrictionBasis(m.normal, t1, t2);

        for (int ci = 0; ci < m.count; ++ci) {
            ContactPointState& cp = m.points[ci];
            if (!cp.pointWorld.isFinite()) continue;
            const Vec3 p = cp.pointWorld;
            const Vec3 rA = p - m.a->position;
            const Vec3 rB = p - m.b->position;

            auto relativeVelocity = [&]() {
                Vec3 vA = m.a->velocity + Vec3::cross(m.a->angularVelocity, rA);
                Vec3 vB = m.b->velocity + Vec3::cross(m.b->angularVelocity, rB);
                return vB - vA;
            };

            auto applyPair = [&](const Vec3& J) {
                applyImpulseAtPoint(m.a, -J, p);
                applyImpulseAtPoint(m.b, J, p);
            };

            {
                float kN = effectiveMass(m.a, m.b, rA, rB, m.normal);
                if (kN > 1e-6f) {
                    float vn = Vec3::dot(relativeVelocity(), m.normal);
                    float dN = (cp.targetNormalVelocity - vn - spookEps * cp.normalImpulse) / (kN + spookEps);
                    float oldN = cp.normalImpulse;
                    float newN = std::max(0.0f, oldN + dN);
                    dN = newN - oldN;
                    cp.normalImpulse = newN;
                    if (dN != 0.0f) applyPair(m.normal * dN);
                    deltaTot += fabsf(dN);
                }
            }
            {
                Vec3 relV = relativeVelocity();
                float oldT1 = Vec3::dot(cp.tangentImpulse, t1);
                float oldT2 = Vec3::dot(cp.tangentImpulse, t2);
                float newT1 = oldT1;
                float newT2 = oldT2;

                float kT1 = effectiveMass(m.a, m.b, rA, rB, t1);
                if (kT1 > 1e-6f) newT1 = oldT1 - Vec3::dot(relV, t1) / kT1;
                float kT2 = effectiveMass(m.a, m.b, rA, rB, t2);
                if (kT2 > 1e-6f) newT2 = oldT2 - Vec3::dot(relV, t2) / kT2;

                float maxF = mu * cp.normalImpulse;
                float magSq = newT1 * newT1 + newT2 * newT2;
                if (magSq > maxF * maxF && magSq > 1e-12f) {
                    float s = maxF / sqrtf(magSq);
                    newT1 *= s;
                    newT2 *= s;
                }

                float dT1 = newT1 - oldT1;
                float dT2 = newT2 - oldT2;
                if (dT1 != 0.0f || dT2 != 0.0f) {
                    cp.tangentImpulse = t1 * newT1 + t2 * newT2;
                    applyPair(t1 * dT1 + t2 * dT2);
                }
                deltaTot += fabsf(dT1) + fabsf(dT2);
            }
        }
    }
    return deltaTot;
}

Vec3 PhysicsWorld::invInertiaWorldMul(const RigidBody* body, const Vec3& v) const {
    Vec3 vLocal = body->orientation.rotateInv(v);
    Vec3 invI = body->getInvInertiaBody();
    Vec3 wLocal = {vLocal.x * invI.x, vLocal.y * invI.y, vLocal.z * invI.z};
    return body->orientation.rotate(wLocal);
}

void PhysicsWorld::applyImpulseAtPoint(RigidBody* body, const Vec3& impulse, const Vec3& pointWorld) {
    if (!isDynamicAwake(body)) return;
    body->velocity = body->velocity + impulse * body->invMass();
    Vec3 r = pointWorld - body->position;
    body->angularVelocity = body->angularVelocity + invInertiaWorldMul(body, Vec3::cross(r, impulse));
}
