#include "mesh/MeshAggregator.hpp"

namespace Hullgen {

RawMesh CombineMeshes(const std::vector<WorldMesh>& meshes) {
    RawMesh combined;

    size_t totalVertices = 0;
    size_t totalTriangles = 0;
    for (const auto& m : meshes) {
        totalVertices += m.mesh.vertices.size();
        totalTriangles += m.mesh.triangles.size();
    }
    combined.vertices.reserve(totalVertices);
    combined.triangles.reserve(totalTriangles);

    for (const auto& m : meshes) {
        const auto offset = static_cast<uint32_t>(combined.vertices.size());
        combined.vertices.insert(combined.vertices.end(), m.mesh.vertices.begin(), m.mesh.vertices.end());
        for (const auto& tri : m.mesh.triangles) {
            combined.triangles.push_back({tri[0] + offset, tri[1] + offset, tri[2] + offset});
        }
    }

    return combined;
}

std::vector<MeshGroup> GroupMeshes(std::vector<WorldMesh> meshes,
                                   bool combine,
                                   const std::string& combinedName) {
    std::vector<MeshGroup> groups;

    if (combine) {
        if (meshes.empty()) {
            return groups;
        }
        MeshGroup group;
        group.name = combinedName;
        group.mesh = CombineMeshes(meshes);
        group.sourceMeshCount = meshes.size();
        groups.push_back(std::move(group));
        return groups;
    }

    groups.reserve(meshes.size());
    for (auto& m : meshes) {
        MeshGroup group;
        group.name = std::move(m.name);
        group.mesh = std::move(m.mesh);
        groups.push_back(std::move(group));
    }
    return groups;
}

} // namespace Hullgen
