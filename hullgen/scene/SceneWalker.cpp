#include "scene/SceneWalker.hpp"
#include "core/Logger.hpp"
#include "math/Transform.hpp"
#include "mesh/MeshExtractor.hpp"

namespace Hullgen {

std::string MeshDisplayName(const MeshRef& mesh, const ConversionConfig& config) {
    return mesh.name.empty() ? config.placeholderName : mesh.name;
}

WalkResult WalkScene(const Scene& scene, const ConversionConfig& config) {
    WalkResult result;

    for (const auto& graph : scene.scenes) {
        for (const auto& node : graph.nodes) {
            if (!node.mesh) {
                continue;
            }

            auto raw = ExtractMesh(*node.mesh);
            if (!raw) {
                HULLGEN_LOG_ERROR("Skipping node '{}': {}", node.name, raw.error().ToString());
                result.failures.push_back(raw.error());
                continue;
            }

            PointTransform transform = ComposeTransform(node.transform);
            transform.ApplyInPlace(raw->vertices);

            WorldMesh world;
            world.name = MeshDisplayName(*node.mesh, config);
            world.mesh = std::move(*raw);

            HULLGEN_LOG_DEBUG("Node '{}' -> mesh '{}' ({} vertices, {} triangles)",
                              node.name, world.name,
                              world.mesh.GetVertexCount(), world.mesh.GetTriangleCount());

            result.meshes.push_back(std::move(world));
        }
    }

    return result;
}

} // namespace Hullgen
