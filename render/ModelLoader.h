#pragma once

#include "../scene/SceneAsset.h"
#include <raylib.h>
#include <string>

namespace ModelLoader {
    // Resolves a relative asset path against the executable's directory, so
    // the app finds its assets regardless of the working directory.
    std::string resolvePath(const std::string& path);

    // Copies every mesh's CPU-side positions and indices into a SceneAsset.
    // Meshes without vertex data are left out.
    SceneAsset toSceneAsset(const Model& model, const std::string& source, int modelId);

    // Loads a model from disk. On success outModel owns the GPU copy and
    // outAsset holds the geometry; on failure error says why and outModel is
    // left unloaded.
    bool load(const std::string& path, int modelId, Model& outModel, SceneAsset& outAsset, std::string& error);
}
