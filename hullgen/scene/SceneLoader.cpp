#include "scene/SceneLoader.hpp"
#include "scene/GltfReader.hpp"
#include "core/Logger.hpp"

#include <assimp/Importer.hpp>
#include <assimp/scene.h>
#include <assimp/postprocess.h>

namespace fs = std::filesystem;

namespace Hullgen {

namespace {
    glm::vec3 ConvertVec3(const aiVector3D& v) {
        return glm::vec3(v.x, v.y, v.z);
    }

    NodeTransform ConvertTransform(const aiMatrix4x4& matrix) {
        aiVector3D scaling;
        aiQuaternion rotation;
        aiVector3D position;
        matrix.Decompose(scaling, rotation, position);

        NodeTransform transform;
        transform.translation = ConvertVec3(position);
        transform.rotation = MakeQuat(rotation.w, rotation.x, rotation.y, rotation.z);
        transform.scale = ConvertVec3(scaling);
        return transform;
    }

    MeshPrimitive ConvertPrimitive(const aiMesh* mesh) {
        MeshPrimitive primitive;

        if (mesh->HasPositions()) {
            std::vector<glm::vec3> positions;
            positions.reserve(mesh->mNumVertices);
            for (unsigned int i = 0; i < mesh->mNumVertices; ++i) {
                positions.push_back(ConvertVec3(mesh->mVertices[i]));
            }
            primitive.positions = std::move(positions);
        }

        if (mesh->HasFaces()) {
            std::vector<uint32_t> indices;
            indices.reserve(static_cast<size_t>(mesh->mNumFaces) * 3);
            for (unsigned int i = 0; i < mesh->mNumFaces; ++i) {
                const aiFace& face = mesh->mFaces[i];
                for (unsigned int j = 0; j < face.mNumIndices; ++j) {
                    indices.push_back(face.mIndices[j]);
                }
            }
            primitive.indices = std::move(indices);
        }

        return primitive;
    }

    SceneNode ConvertNode(const aiNode* node, const aiScene* scene) {
        SceneNode result;
        result.name = node->mName.C_Str();
        result.transform = ConvertTransform(node->mTransformation);

        if (node->mNumMeshes > 0) {
            MeshRef mesh;
            mesh.name = scene->mMeshes[node->mMeshes[0]]->mName.C_Str();
            for (unsigned int i = 0; i < node->mNumMeshes; ++i) {
                mesh.primitives.push_back(ConvertPrimitive(scene->mMeshes[node->mMeshes[i]]));
            }
            result.mesh = std::move(mesh);
        }

        for (unsigned int i = 0; i < node->mNumChildren; ++i) {
            result.children.push_back(ConvertNode(node->mChildren[i], scene));
        }

        return result;
    }

    std::expected<Scene, Error> LoadWithAssimp(const fs::path& path) {
        Assimp::Importer importer;
        const aiScene* scene = importer.ReadFile(path.string(), aiProcess_ValidateDataStructure);

        if (!scene || (scene->mFlags & AI_SCENE_FLAGS_INCOMPLETE) || !scene->mRootNode) {
            return std::unexpected(Error(ErrorCode::SceneLoadError,
                                         "failed to load " + path.string() + ": " + importer.GetErrorString()));
        }

        SceneGraph graph;
        graph.name = scene->mRootNode->mName.C_Str();

        // Non-glTF importers hang the file's objects under a mesh-less root
        const aiNode* root = scene->mRootNode;
        if (root->mNumMeshes == 0) {
            for (unsigned int i = 0; i < root->mNumChildren; ++i) {
                graph.nodes.push_back(ConvertNode(root->mChildren[i], scene));
            }
        } else {
            graph.nodes.push_back(ConvertNode(root, scene));
        }

        Scene result;
        result.sourcePath = path;
        result.scenes.push_back(std::move(graph));

        HULLGEN_LOG_DEBUG("Loaded {} meshes, {} top-level nodes",
                          scene->mNumMeshes, result.GetTopLevelNodeCount());
        return result;
    }
}

std::expected<Scene, Error> SceneLoader::Load(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::unexpected(Error(ErrorCode::SceneLoadError, "file not found: " + path.string()));
    }

    HULLGEN_LOG_INFO("Loading scene: {}", path.string());

    if (GltfReader::HandlesExtension(path)) {
        return GltfReader::Read(path);
    }
    return LoadWithAssimp(path);
}

bool SceneLoader::IsSupported(const std::string& extension) {
    Assimp::Importer importer;
    std::string ext = extension;
    if (!ext.empty() && ext[0] != '.') {
        ext = "." + ext;
    }
    if (GltfReader::HandlesExtension(fs::path("scene" + ext))) {
        return true;
    }
    return importer.IsExtensionSupported(ext);
}

} // namespace Hullgen
