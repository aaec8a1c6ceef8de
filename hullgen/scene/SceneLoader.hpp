#pragma once

#include "core/Error.hpp"
#include "scene/Scene.hpp"
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace Hullgen {

/**
 * @brief Scene loading front end
 *
 * glTF 2.0 (.gltf / .glb) goes through GltfReader, which keeps accessors
 * exactly as authored. Every other format Assimp knows is read through
 * Assimp without post-processing, as a single scene.
 */
class SceneLoader {
public:
    /**
     * @brief Load a scene file
     * @return The scene, or ErrorCode::SceneLoadError
     */
    [[nodiscard]] static std::expected<Scene, Error> Load(const std::filesystem::path& path);

    /**
     * @brief Check if a file extension (".glb", "gltf", ...) can be loaded
     */
    [[nodiscard]] static bool IsSupported(const std::string& extension);
};

} // namespace Hullgen
