#pragma once

#include "../../math/Vec3.h"
#include "../../math/Quat.h"
#include "../shapes/BoxShape.h"
#include "../shapes/PlaneShape.h"
#include "TriangleMesh.h"

#include <memory>

enum class ColliderType {Box, Plane, Mesh};

struct Collider {
    ColliderType type;
    BoxShape box;
    PlaneShape plane;
    std::shared_ptr<TriangleMesh> mesh;

    Collider() : type(ColliderType::Box) {}

    static Collider createBox(Vec3 halfExtents) {
        Collider c;
        c.type = ColliderType::Box;
        c.box = BoxShape(halfExtents);
        return c;
    }

    static Collider createPlane(Vec3 normal = {0.0f, 1.0f, 0.0f}) {
        Collider c;
        c.type = ColliderType::Plane;
        c.plane = PlaneShape(normal);
        return c;
    }

    static Collider createMesh(std::shared_ptr<TriangleMesh> meshPtr) {
        Collider c;
        c.type = ColliderType::Mesh;
        c.mesh = std::move(meshPtr);
        return c;
    }
};
