#include "UI.h"
#include <vector>

namespace UI {

    static std::vector<Rectangle> g_blockRects;

    void beginFrame() {
        g_blockRects.clear();
    }

    void blockRect(Rectangle r) {
        if (r.width > 0.0f && r.height > 0.0f) g_blockRects.push_back(r);
    }

    bool isBlocked() {
        Vector2 m = GetMousePosition();
        for (const Rectangle& r : g_blockRects) {
            if (CheckCollisionPointRec(m, r)) return true;
        }
        return false;
    }

    bool Button(Rectangle r, const char* text) {
        Vector2 m = GetMousePosition();
        bool hot = CheckCollisionPointRec(m, r);

        Color bg = hot ? Color{45, 45, 45, 255} : Color{25, 25, 25, 255};
        DrawRectangleRec(r, bg);
        DrawRectangleLinesEx(r, 1.0f, Color{70, 70, 70, 255});

        int tw = MeasureText(text, 18);
        int tx = (int)(r.x + 0.5f * (r.width - (float)tw));
        int ty = (int)(r.y + 0.5f * (r.height - 18.0f));
        DrawText(text, tx, ty, 18, RAYWHITE);
        return hot && IsMouseButtonPressed(MOUSE_BUTTON_LEFT);
    }

    void Label(float x, float y, const char* text, int fontSize, Color color) {
        DrawText(text, (int)x, (int)y, fontSize, color);
    }

    void Panel(Rectangle r) {
        DrawRectangleRec(r, Color{15, 15, 15, 200});
        DrawRectangleLinesEx(r, 1.0f, Color{70, 70, 70, 255});
        blockRect(r);
    }
}
