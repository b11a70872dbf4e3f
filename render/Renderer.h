#pragma once

#include "../math/Vec3.h"
#include "../math/Aabb.h"
#include <raylib.h>

struct VisualNode;

class Renderer {
public:
    struct AimRay {
        Vec3 origin;
        Vec3 direction;
    };

    bool init(int width, int height, const char* title);
    void beginFrame();
    void drawStage(const Model& model, float scale);
    void drawDie(const Model& model, const VisualNode& node);
    void end3D();
    void setUiBlockRect(Rectangle r);
    void endFrame();
    void shutdown();

    // Points the orbit at the centre of the bounds and backs off far enough to
    // keep the whole box in view.
    void frameBounds(const Aabb& bounds);

    AimRay getAimRay(Vector2 screenPos) const;

private:
    bool in3D = false;
    Camera3D mainCam = { 0 };
    Vec3 orbitTarget = {0.0f, 0.0f, 0.0f};
    float orbitDistance = 12.0f;
    float camYaw = 225.0f;
    float camPitch = 35.0f;
    float minDistance = 3.0f;
    float maxDistance = 40.0f;

    bool hasUiBlockRect = false;
    Rectangle uiBlockRect = {0.0f, 0.0f, 0.0f, 0.0f};

    void updateCamera();
};
