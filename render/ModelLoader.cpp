#include "ModelLoader.h"
#include <string>
#include <utility>

namespace ModelLoader {

    static Mat4 toMat4(const Matrix& t) {
        Mat4 out;
        out.m[0] = t.m0;   out.m[1] = t.m1;   out.m[2] = t.m2;   out.m[3] = t.m3;
        out.m[4] = t.m4;   out.m[5] = t.m5;   out.m[6] = t.m6;   out.m[7] = t.m7;
        out.m[8] = t.m8;   out.m[9] = t.m9;   out.m[10] = t.m10; out.m[11] = t.m11;
        out.m[12] = t.m12; out.m[13] = t.m13; out.m[14] = t.m14; out.m[15] = t.m15;
        return out;
    }

    std::string resolvePath(const std::string& path) {
        if (path.empty() || FileExists(path.c_str())) return path;
        if (path[0] == '/') return path;
        std::string candidate = std::string(GetApplicationDirectory()) + path;
        if (FileExists(candidate.c_str())) return candidate;
        return path;
    }

    SceneAsset toSceneAsset(const Model& model, const std::string& source, int modelId) {
        SceneAsset asset;
        asset.source = source;
        asset.modelId = modelId;

        const Mat4 world = toMat4(model.transform);
        for (int i = 0; i < model.meshCount; ++i) {
            const Mesh& mesh = model.meshes[i];
            if (!mesh.vertices || mesh.vertexCount <= 0) continue;

            MeshNode node;
            node.name = source + "#" + std::to_string(i);
            node.world = world;
            node.positions.reserve((size_t)mesh.vertexCount);
            for (int v = 0; v < mesh.vertexCount; ++v) {
                node.positions.push_back({mesh.vertices[v * 3 + 0], mesh.vertices[v * 3 + 1], mesh.vertices[v * 3 + 2]});
            }
            if (mesh.indices && mesh.triangleCount > 0) {
                node.indices.reserve((size_t)mesh.triangleCount * 3);
                for (int k = 0; k < mesh.triangleCount * 3; ++k) {
                    node.indices.push_back((uint32_t)mesh.indices[k]);
                }
            }
            asset.meshes.push_back(std::move(node));
        }
        return asset;
    }

    bool load(const std::string& path, int modelId, Model& outModel, SceneAsset& outAsset, std::string& error) {
        const std::string full = resolvePath(path);
        if (!FileExists(full.c_str())) {
            error = "file not found: " + path;
            return false;
        }

        Model model = LoadModel(full.c_str());
        SceneAsset asset = toSceneAsset(model, path, modelId);
        if (asset.meshes.empty()) {
            UnloadModel(model);
            error = "no mesh data in " + path;
            return false;
        }

        outModel = model;
        outAsset = std::move(asset);
        TraceLog(LOG_INFO, "MODEL: Loaded '%s' (%d meshes)", full.c_str(), (int)outAsset.meshes.size());
        return true;
    }
}
