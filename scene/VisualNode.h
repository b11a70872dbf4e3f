#pragma once

#include "../math/Vec3.h"
#include "../math/Quat.h"

#include <cstdint>
#include <list>

// Render-side transform of one spawned die. Written only by the sync step.
struct VisualNode {
    uint32_t id = 0;
    int modelId = -1;
    Vec3 position;
    Quat orientation;
    // Offset from the body centre to the model origin, in body space.
    Vec3 pivotOffset;
    bool visible = true;
};

// Flat list of live visual nodes. std::list keeps node addresses stable.
class SceneGraph {
public:
    VisualNode* add(const VisualNode& node) {
        nodes.push_back(node);
        VisualNode* ptr = &nodes.back();
        if (ptr->id == 0) ptr->id = nextId++;
        return ptr;
    }

    bool remove(const VisualNode* node) {
        for (auto it = nodes.begin(); it != nodes.end(); ++it) {
            if (&*it == node) {
                nodes.erase(it);
                return true;
            }
        }
        return false;
    }

    bool contains(const VisualNode* node) const {
        for (const VisualNode& n : nodes) {
            if (&n == node) return true;
        }
        return false;
    }

    size_t size() const { return nodes.size(); }
    const std::list<VisualNode>& all() const { return nodes; }

private:
    std::list<VisualNode> nodes;
    uint32_t nextId = 1;
};
