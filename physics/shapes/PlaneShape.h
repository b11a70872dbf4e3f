#pragma once

#include "../../math/Vec3.h"

// Infinite plane through the body origin. The normal is in body space;
// a body with identity orientation gets an upward-facing floor.
struct PlaneShape {
	Vec3 normal = {0.0f, 1.0f, 0.0f};
	PlaneShape() = default;
	PlaneShape(const Vec3& n) : normal(n.normalized()) {}
};
