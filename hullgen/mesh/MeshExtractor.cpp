#include "mesh/MeshExtractor.hpp"
#include "core/Logger.hpp"

namespace Hullgen {

std::expected<RawMesh, Error> ExtractMesh(const MeshRef& mesh) {
    RawMesh result;
    size_t droppedDegenerate = 0;

    for (size_t p = 0; p < mesh.primitives.size(); ++p) {
        const auto& primitive = mesh.primitives[p];
        if (!primitive.positions) {
            continue;
        }

        const auto& positions = *primitive.positions;
        const auto base = static_cast<uint32_t>(result.vertices.size());
        result.vertices.insert(result.vertices.end(), positions.begin(), positions.end());

        if (!primitive.indices) {
            HULLGEN_LOG_WARN("Mesh '{}' primitive {} has no indices; its {} vertices stay unconnected",
                             mesh.name, p, positions.size());
            continue;
        }

        const auto& indices = *primitive.indices;
        if (indices.size() % 3 != 0) {
            return std::unexpected(Error(ErrorCode::MalformedMesh,
                "mesh '" + mesh.name + "' primitive " + std::to_string(p) +
                " has " + std::to_string(indices.size()) + " indices, not a multiple of 3"));
        }

        for (size_t i = 0; i < indices.size(); i += 3) {
            Triangle tri = {indices[i], indices[i + 1], indices[i + 2]};
            for (auto& index : tri) {
                if (index >= positions.size()) {
                    return std::unexpected(Error(ErrorCode::MalformedMesh,
                        "mesh '" + mesh.name + "' primitive " + std::to_string(p) +
                        " references vertex " + std::to_string(index) + " of " +
                        std::to_string(positions.size())));
                }
                index += base;
            }

            if (tri[0] == tri[1] || tri[1] == tri[2] || tri[0] == tri[2]) {
                ++droppedDegenerate;
                continue;
            }
            result.triangles.push_back(tri);
        }
    }

    if (droppedDegenerate > 0) {
        HULLGEN_LOG_WARN("Mesh '{}': dropped {} degenerate triangles", mesh.name, droppedDegenerate);
    }

    return result;
}

} // namespace Hullgen
