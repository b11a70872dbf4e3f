#include "PhysicsFactory.h"
#include <algorithm>

PhysicsFactory::PhysicsFactory(PhysicsWorld& world, std::list<RigidBody>& bodies)
    : world(world), bodies(bodies) {}

RigidBody* PhysicsFactory::CreateBodyBase(const Vec3& pos, float mass, bool isStatic, const Vec3& vel) {
    RigidBody body;
    body.position = pos;
    body.velocity = vel;
    body.orientation = Quat::identity();
    body.angularVelocity = {0.0f, 0.0f, 0.0f};
    body.mass = mass;
    body.isStatic = isStatic;
    if (isStatic) {
        body.mass = 0.0f;
        body.velocity = {0.0f, 0.0f, 0.0f};
    }

    bodies.push_back(body);
    RigidBody* ptr = &bodies.back();
    world.addRigidBody(ptr);
    return ptr;
}

RigidBody* PhysicsFactory::CreateBox(const Vec3& pos, const Vec3& halfExtents, const BodySettings& settings, float mass, bool isStatic, const Vec3& vel) {
    RigidBody* body = CreateBodyBase(pos, mass, isStatic, vel);
    body->collider = Collider::createBox(halfExtents);
    body->linearDamping = std::clamp(settings.linearDamping, 0.0f, 1.0f);
    body->angularDamping = std::clamp(settings.angularDamping, 0.0f, 1.0f);
    body->allowSleep = settings.allowSleep;
    body->sleepSpeedLimit = settings.sleepSpeedLimit;
    body->sleepTimeLimit = settings.sleepTimeLimit;
    return body;
}

RigidBody* PhysicsFactory::CreatePlane(const Vec3& pos, const Vec3& normal) {
    RigidBody* body = CreateBodyBase(pos, 0.0f, true, {0.0f, 0.0f, 0.0f});
    body->collider = Collider::createPlane(normal);
    return body;
}

RigidBody* PhysicsFactory::CreateMesh(const Vec3& pos, std::shared_ptr<TriangleMesh> mesh) {
    if (!mesh) return nullptr;
    RigidBody* body = CreateBodyBase(pos, 0.0f, true, {0.0f, 0.0f, 0.0f});
    body->collider = Collider::createMesh(std::move(mesh));
    return body;
}

bool PhysicsFactory::Destroy(RigidBody* body) {
    if (!body) return false;
    world.removeRigidBody(body);
    auto it = std::find_if(bodies.begin(), bodies.end(), [body](const RigidBody& b) { return &b == body; });
    if (it == bodies.end()) return false;
    bodies.erase(it);
    return true;
}
