#pragma once

#include "core/Error.hpp"
#include "scene/Scene.hpp"
#include <expected>
#include <filesystem>

namespace Hullgen {

/**
 * @brief glTF 2.0 reader built on tinygltf
 *
 * Position and index accessors are copied out as stored in the file:
 * nothing is triangulated, generated or renamed. A primitive without a
 * POSITION attribute or without indices keeps that stream empty, and every
 * scene of the document is returned, not only the default one.
 */
class GltfReader {
public:
    /**
     * @brief Read a .gltf or .glb file
     * @return The scene, or ErrorCode::SceneLoadError for files tinygltf
     *         rejects and for accessors that point outside their buffers
     */
    [[nodiscard]] static std::expected<Scene, Error> Read(const std::filesystem::path& path);

    /**
     * @brief True for ".gltf" and ".glb" (case-insensitive)
     */
    [[nodiscard]] static bool HandlesExtension(const std::filesystem::path& path);
};

} // namespace Hullgen
