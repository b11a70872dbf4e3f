#pragma once
#include "PhysicsWorld.h"
#include "RigidBody.h"
#include "Material.h"
#include <list>
#include <memory>

/**
 * @brief Factory class for creating physics objects.
 *
 * Owns nothing itself: bodies live in the caller's list, which keeps their
 * addresses stable, and are registered with the PhysicsWorld on creation.
 */
class PhysicsFactory {
public:
    /**
     * @brief Construct a new Physics Factory object.
     *
     * @param world Reference to the PhysicsWorld.
     * @param bodies Reference to the storage list for bodies.
     */
    PhysicsFactory(PhysicsWorld& world, std::list<RigidBody>& bodies);

    /**
     * @brief Create a Box RigidBody.
     *
     * @param pos World position.
     * @param halfExtents Half-extents of the box (width/2, height/2, depth/2).
     * @param settings Damping and sleep settings.
     * @param mass Mass in kg.
     * @param isStatic If true, mass is ignored (infinite) and body doesn't move.
     * @param vel Initial velocity.
     * @return RigidBody* Pointer to the created body.
     */
    RigidBody* CreateBox(const Vec3& pos, const Vec3& halfExtents, const BodySettings& settings, float mass, bool isStatic = false, const Vec3& vel = {0,0,0});

    /**
     * @brief Create a static infinite plane.
     *
     * @param pos A point on the plane.
     * @param normal Plane normal; {0,1,0} gives a floor.
     * @return RigidBody* Pointer to the created body.
     */
    RigidBody* CreatePlane(const Vec3& pos, const Vec3& normal = {0.0f, 1.0f, 0.0f});

    /**
     * @brief Create a static triangle mesh body.
     *
     * @param pos World position of the mesh origin.
     * @param mesh Shared pointer to a successfully built TriangleMesh.
     * @return RigidBody* Pointer to the created body, or nullptr when mesh is null.
     */
    RigidBody* CreateMesh(const Vec3& pos, std::shared_ptr<TriangleMesh> mesh);

    /**
     * @brief Remove a body from the world and release its storage.
     *
     * @return true if the body was found in storage.
     */
    bool Destroy(RigidBody* body);

private:
    PhysicsWorld& world;
    std::list<RigidBody>& bodies;

    RigidBody* CreateBodyBase(const Vec3& pos, float mass, bool isStatic, const Vec3& vel);
};
