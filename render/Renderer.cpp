#include "Renderer.h"
#include "../scene/VisualNode.h"
#include "../math/Quat.h"
#include <algorithm>
#include <raylib.h>
#include <cmath>

bool Renderer::init(int width, int height, const char* title) {
    SetConfigFlags(FLAG_MSAA_4X_HINT | FLAG_WINDOW_RESIZABLE);
    InitWindow(width, height, title);
    SetTargetFPS(60);

    mainCam.up = {0.0f, 1.0f, 0.0f};
    mainCam.fovy = 45.0f;
    mainCam.projection = CAMERA_PERSPECTIVE;
    updateCamera();

    return IsWindowReady();
}

void Renderer::updateCamera() {
    float yawRad = camYaw * (PI/180.0f);
    float pitchRad = camPitch * (PI/180.0f);

    // Offset from target to eye; pitch above the horizon is positive.
    Vec3 offset = {
        cosf(pitchRad) * cosf(yawRad),
        sinf(pitchRad),
        cosf(pitchRad) * sinf(yawRad)
    };
    Vec3 eye = orbitTarget + offset * orbitDistance;

    mainCam.position = {eye.x, eye.y, eye.z};
    mainCam.target = {orbitTarget.x, orbitTarget.y, orbitTarget.z};
}

void Renderer::frameBounds(const Aabb& bounds) {
    if (bounds.isEmpty()) return;
    orbitTarget = bounds.center();

    Vec3 size = bounds.size();
    float radius = 0.5f * sqrtf(size.x * size.x + size.y * size.y + size.z * size.z);
    float halfFov = 0.5f * mainCam.fovy * (PI/180.0f);
    float dist = radius / std::max(0.1f, sinf(halfFov));

    maxDistance = std::max(40.0f, dist * 2.0f);
    orbitDistance = std::clamp(dist, minDistance, maxDistance);
    updateCamera();
}

void Renderer::beginFrame() {
    BeginDrawing();
    ClearBackground(Color{30, 32, 36, 255});

    BeginMode3D(mainCam);
    in3D = true;
}

void Renderer::drawStage(const Model& model, float scale) {
    if (!in3D || model.meshCount <= 0) return;
    DrawModel(model, {0.0f, 0.0f, 0.0f}, scale, WHITE);
}

void Renderer::drawDie(const Model& model, const VisualNode& node) {
    if (!in3D || !node.visible || model.meshCount <= 0) return;

    // The node holds the body transform; the model origin sits at pivotOffset in body space.
    Vec3 origin = node.position + node.orientation.rotate(node.pivotOffset);

    Vec3 axis;
    float angleDeg = 0.0f;
    node.orientation.toAxisAngle(axis, angleDeg);

    DrawModelEx(model, {origin.x, origin.y, origin.z}, {axis.x, axis.y, axis.z}, angleDeg, {1.0f, 1.0f, 1.0f}, WHITE);
}

void Renderer::end3D() {
    if (!in3D) return;
    EndMode3D();
    in3D = false;
}

void Renderer::setUiBlockRect(Rectangle r) {
    uiBlockRect = r;
    hasUiBlockRect = (r.width > 0.0f && r.height > 0.0f);
}

void Renderer::endFrame() {
    end3D();
    EndDrawing();

    Vector2 mouse = GetMousePosition();
    bool mouseOverUi = hasUiBlockRect && CheckCollisionPointRec(mouse, uiBlockRect);

    if (!mouseOverUi && IsMouseButtonDown(MOUSE_BUTTON_RIGHT)) {
        Vector2 delta = GetMouseDelta();
        camYaw += delta.x * 0.3f;
        camPitch += delta.y * 0.3f;
        if (camPitch > 89.0f) camPitch = 89.0f;
        if (camPitch < 5.0f) camPitch = 5.0f;
    }

    if (!mouseOverUi) {
        float wheel = GetMouseWheelMove();
        if (fabsf(wheel) > 1e-6f) {
            orbitDistance = std::clamp(orbitDistance - wheel * 1.5f, minDistance, maxDistance);
        }
    }

    updateCamera();
}

void Renderer::shutdown() {
    CloseWindow();
}

Renderer::AimRay Renderer::getAimRay(Vector2 screenPos) const {
    Ray ray = GetMouseRay(screenPos, mainCam);
    AimRay out;
    out.origin = {ray.position.x, ray.position.y, ray.position.z};
    out.direction = Vec3{ray.direction.x, ray.direction.y, ray.direction.z}.normalized();
    return out;
}
