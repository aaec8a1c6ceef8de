#include "scene/GltfReader.hpp"
#include "core/Logger.hpp"

// tinygltf parses with the same nlohmann/json the rest of the library uses
#include <nlohmann/json.hpp>

#define TINYGLTF_IMPLEMENTATION
#define TINYGLTF_NO_INCLUDE_JSON
#define TINYGLTF_NO_STB_IMAGE
#define TINYGLTF_NO_STB_IMAGE_WRITE
#define TINYGLTF_NO_EXTERNAL_IMAGE
#include <tiny_gltf.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace Hullgen {

namespace {
    Error AccessorError(int accessorIndex, const std::string& what) {
        return Error(ErrorCode::SceneLoadError, "accessor " + std::to_string(accessorIndex) + ": " + what);
    }

    // Textures play no part in collision shapes
    bool SkipImageData(tinygltf::Image*, const int, std::string*, std::string*,
                       int, int, const unsigned char*, int, void*) {
        return true;
    }

    std::string LowerExtension(const fs::path& path) {
        std::string ext = path.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return ext;
    }

    /**
     * @brief Byte range of an accessor inside its buffer
     *
     * data stays null for accessors without a buffer view; their elements
     * are all zero.
     */
    struct AccessorBytes {
        const unsigned char* data = nullptr;
        size_t count = 0;
        size_t stride = 0;
    };

    std::expected<AccessorBytes, Error> LocateAccessor(const tinygltf::Model& model, int accessorIndex,
                                                       size_t elementSize) {
        const tinygltf::Accessor& accessor = model.accessors[accessorIndex];
        if (accessor.sparse.isSparse) {
            return std::unexpected(AccessorError(accessorIndex, "sparse accessors are not supported"));
        }

        AccessorBytes bytes;
        bytes.count = accessor.count;
        bytes.stride = elementSize;

        if (accessor.bufferView < 0 || bytes.count == 0) {
            return bytes;
        }
        if (accessor.bufferView >= static_cast<int>(model.bufferViews.size())) {
            return std::unexpected(AccessorError(accessorIndex, "invalid buffer view"));
        }

        const tinygltf::BufferView& view = model.bufferViews[accessor.bufferView];
        if (view.buffer < 0 || view.buffer >= static_cast<int>(model.buffers.size())) {
            return std::unexpected(AccessorError(accessorIndex, "invalid buffer"));
        }
        const tinygltf::Buffer& buffer = model.buffers[view.buffer];

        if (view.byteStride > 0) {
            bytes.stride = view.byteStride;
        }
        if (bytes.stride < elementSize) {
            return std::unexpected(AccessorError(accessorIndex, "stride is smaller than one element"));
        }

        const size_t begin = view.byteOffset + accessor.byteOffset;
        const size_t end = begin + (bytes.count - 1) * bytes.stride + elementSize;
        if (end > view.byteOffset + view.byteLength || end > buffer.data.size()) {
            return std::unexpected(AccessorError(accessorIndex, "range exceeds its buffer"));
        }

        bytes.data = buffer.data.data() + begin;
        return bytes;
    }

    std::expected<std::vector<glm::vec3>, Error> ReadPositions(const tinygltf::Model& model, int accessorIndex) {
        const tinygltf::Accessor& accessor = model.accessors[accessorIndex];
        if (accessor.componentType != TINYGLTF_COMPONENT_TYPE_FLOAT || accessor.type != TINYGLTF_TYPE_VEC3) {
            return std::unexpected(AccessorError(accessorIndex, "POSITION must be a float VEC3"));
        }

        auto bytes = LocateAccessor(model, accessorIndex, sizeof(float) * 3);
        if (!bytes) {
            return std::unexpected(bytes.error());
        }

        std::vector<glm::vec3> positions(bytes->count, glm::vec3(0.0f));
        if (bytes->data) {
            for (size_t i = 0; i < bytes->count; ++i) {
                float xyz[3];
                std::memcpy(xyz, bytes->data + i * bytes->stride, sizeof(xyz));
                positions[i] = glm::vec3(xyz[0], xyz[1], xyz[2]);
            }
        }
        return positions;
    }

    std::expected<std::vector<uint32_t>, Error> ReadIndices(const tinygltf::Model& model, int accessorIndex) {
        const tinygltf::Accessor& accessor = model.accessors[accessorIndex];
        if (accessor.type != TINYGLTF_TYPE_SCALAR) {
            return std::unexpected(AccessorError(accessorIndex, "indices must be SCALAR"));
        }

        const int componentSize = tinygltf::GetComponentSizeInBytes(static_cast<uint32_t>(accessor.componentType));
        if (componentSize <= 0) {
            return std::unexpected(AccessorError(accessorIndex, "unknown index component type"));
        }

        auto bytes = LocateAccessor(model, accessorIndex, static_cast<size_t>(componentSize));
        if (!bytes) {
            return std::unexpected(bytes.error());
        }

        std::vector<uint32_t> indices(bytes->count, 0);
        if (!bytes->data) {
            return indices;
        }

        for (size_t i = 0; i < bytes->count; ++i) {
            const unsigned char* p = bytes->data + i * bytes->stride;
            switch (accessor.componentType) {
                case TINYGLTF_COMPONENT_TYPE_UNSIGNED_BYTE:
                    indices[i] = *p;
                    break;
                case TINYGLTF_COMPONENT_TYPE_UNSIGNED_SHORT: {
                    uint16_t value;
                    std::memcpy(&value, p, sizeof(value));
                    indices[i] = value;
                    break;
                }
                case TINYGLTF_COMPONENT_TYPE_UNSIGNED_INT: {
                    uint32_t value;
                    std::memcpy(&value, p, sizeof(value));
                    indices[i] = value;
                    break;
                }
                default:
                    return std::unexpected(AccessorError(accessorIndex, "indices must be U8, U16 or U32"));
            }
        }
        return indices;
    }

    NodeTransform ConvertTransform(const tinygltf::Node& node) {
        if (node.matrix.size() == 16) {
            // glTF matrices are column-major, like glm
            glm::mat4 matrix(1.0f);
            for (int column = 0; column < 4; ++column) {
                for (int row = 0; row < 4; ++row) {
                    matrix[column][row] = static_cast<float>(node.matrix[column * 4 + row]);
                }
            }
            return DecomposeMatrix(matrix);
        }

        NodeTransform transform;
        if (node.translation.size() == 3) {
            transform.translation = glm::vec3(static_cast<float>(node.translation[0]),
                                              static_cast<float>(node.translation[1]),
                                              static_cast<float>(node.translation[2]));
        }
        if (node.rotation.size() == 4) {
            transform.rotation = QuatFromXYZW({static_cast<float>(node.rotation[0]),
                                               static_cast<float>(node.rotation[1]),
                                               static_cast<float>(node.rotation[2]),
                                               static_cast<float>(node.rotation[3])});
        }
        if (node.scale.size() == 3) {
            transform.scale = glm::vec3(static_cast<float>(node.scale[0]),
                                        static_cast<float>(node.scale[1]),
                                        static_cast<float>(node.scale[2]));
        }
        return transform;
    }

    /**
     * @brief Turns the nodes of a parsed tinygltf model into SceneNodes
     *
     * Meshes are converted once and copied into every node that uses them.
     */
    class ModelConverter {
    public:
        explicit ModelConverter(const tinygltf::Model& model)
            : m_model(model)
            , m_meshes(model.meshes.size())
            , m_onPath(model.nodes.size(), false) {}

        std::expected<SceneNode, Error> ConvertNode(int index) {
            if (index < 0 || index >= static_cast<int>(m_model.nodes.size())) {
                return std::unexpected(Error(ErrorCode::SceneLoadError,
                                             "invalid node index " + std::to_string(index)));
            }
            if (m_onPath[index]) {
                return std::unexpected(Error(ErrorCode::SceneLoadError,
                                             "node " + std::to_string(index) + " is its own ancestor"));
            }

            const tinygltf::Node& node = m_model.nodes[index];
            SceneNode result;
            result.name = node.name;
            result.transform = ConvertTransform(node);

            if (node.mesh >= 0) {
                auto mesh = ConvertMesh(node.mesh);
                if (!mesh) {
                    return std::unexpected(mesh.error());
                }
                result.mesh = *mesh;
            }

            m_onPath[index] = true;
            for (int child : node.children) {
                auto converted = ConvertNode(child);
                if (!converted) {
                    return std::unexpected(converted.error());
                }
                result.children.push_back(std::move(*converted));
            }
            m_onPath[index] = false;

            return result;
        }

    private:
        std::expected<MeshRef, Error> ConvertMesh(int index) {
            if (index >= static_cast<int>(m_model.meshes.size())) {
                return std::unexpected(Error(ErrorCode::SceneLoadError,
                                             "invalid mesh index " + std::to_string(index)));
            }
            if (m_meshes[index]) {
                return *m_meshes[index];
            }

            const tinygltf::Mesh& mesh = m_model.meshes[index];
            MeshRef ref;
            ref.name = mesh.name;

            for (size_t i = 0; i < mesh.primitives.size(); ++i) {
                const tinygltf::Primitive& source = mesh.primitives[i];
                if (source.mode != TINYGLTF_MODE_TRIANGLES && source.mode >= 0) {
                    HULLGEN_LOG_WARN("Mesh '{}' primitive {} has mode {}; its indices are read as a triangle list",
                                     mesh.name, i, source.mode);
                }

                MeshPrimitive primitive;

                auto position = source.attributes.find("POSITION");
                if (position != source.attributes.end()) {
                    if (!IsAccessor(position->second)) {
                        return std::unexpected(AccessorError(position->second, "does not exist"));
                    }
                    auto positions = ReadPositions(m_model, position->second);
                    if (!positions) {
                        return std::unexpected(positions.error());
                    }
                    primitive.positions = std::move(*positions);
                }

                if (source.indices >= 0) {
                    if (!IsAccessor(source.indices)) {
                        return std::unexpected(AccessorError(source.indices, "does not exist"));
                    }
                    auto indices = ReadIndices(m_model, source.indices);
                    if (!indices) {
                        return std::unexpected(indices.error());
                    }
                    primitive.indices = std::move(*indices);
                }

                ref.primitives.push_back(std::move(primitive));
            }

            m_meshes[index] = ref;
            return ref;
        }

        bool IsAccessor(int index) const {
            return index >= 0 && index < static_cast<int>(m_model.accessors.size());
        }

        const tinygltf::Model& m_model;
        std::vector<std::optional<MeshRef>> m_meshes;
        std::vector<bool> m_onPath;
    };
}

std::expected<Scene, Error> GltfReader::Read(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::unexpected(Error(ErrorCode::SceneLoadError, "file not found: " + path.string()));
    }

    tinygltf::TinyGLTF loader;
    loader.SetImageLoader(SkipImageData, nullptr);

    tinygltf::Model model;
    std::string err;
    std::string warn;

    const bool binary = LowerExtension(path) == ".glb";
    const bool loaded = binary
        ? loader.LoadBinaryFromFile(&model, &err, &warn, path.string())
        : loader.LoadASCIIFromFile(&model, &err, &warn, path.string());

    if (!warn.empty()) {
        HULLGEN_LOG_WARN("glTF: {}", warn);
    }
    if (!loaded) {
        return std::unexpected(Error(ErrorCode::SceneLoadError, "failed to load " + path.string() + ": " + err));
    }

    ModelConverter converter(model);

    Scene result;
    result.sourcePath = path;

    for (const tinygltf::Scene& source : model.scenes) {
        SceneGraph graph;
        graph.name = source.name;

        for (int index : source.nodes) {
            auto node = converter.ConvertNode(index);
            if (!node) {
                return std::unexpected(Error(node.error().code, path.string() + ": " + node.error().message));
            }
            graph.nodes.push_back(std::move(*node));
        }

        result.scenes.push_back(std::move(graph));
    }

    HULLGEN_LOG_DEBUG("Read {} meshes in {} scenes, {} top-level nodes",
                      model.meshes.size(), result.scenes.size(), result.GetTopLevelNodeCount());
    return result;
}

bool GltfReader::HandlesExtension(const fs::path& path) {
    const std::string ext = LowerExtension(path);
    return ext == ".gltf" || ext == ".glb";
}

} // namespace Hullgen
