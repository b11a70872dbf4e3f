#pragma once
#include <raylib.h>

namespace UI {
    // True while the cursor is over a UI panel registered with blockRect.
    bool isBlocked();
    void blockRect(Rectangle r);
    void beginFrame();

    bool Button(Rectangle r, const char* text);
    void Label(float x, float y, const char* text, int fontSize = 18, Color color = RAYWHITE);
    void Panel(Rectangle r);
}
