#include "decomposition/VhacdDecomposer.hpp"
#include "core/Logger.hpp"

#include <limits>
#include <string>

#define ENABLE_VHACD_IMPLEMENTATION 1
#include <VHACD.h>

namespace Hullgen {

namespace {
    /**
     * @brief Forwards V-HACD diagnostics to the library logger
     */
    class VhacdLogger : public VHACD::IVHACD::IUserLogger {
    public:
        void Log(const char* const msg) override {
            HULLGEN_LOG_DEBUG("[vhacd] {}", msg);
        }
    };

    class VhacdProgress : public VHACD::IVHACD::IUserCallback {
    public:
        void Update(const double overallProgress,
                    const double stageProgress,
                    const char* const stage,
                    const char* operation) override {
            HULLGEN_LOG_TRACE("[vhacd] {:.0f}% {} ({:.0f}%) {}",
                              overallProgress, stage, stageProgress, operation);
        }
    };

    VHACD::FillMode ToVhacdFillMode(FillMode mode) {
        switch (mode) {
            case FillMode::SurfaceOnly: return VHACD::FillMode::SURFACE_ONLY;
            case FillMode::Raycast:     return VHACD::FillMode::RAYCAST_FILL;
            case FillMode::FloodFill:
            default:                    return VHACD::FillMode::FLOOD_FILL;
        }
    }
}

void VhacdDecomposer::Releaser::operator()(VHACD::IVHACD* instance) const {
    if (instance) {
        instance->Release();
    }
}

VhacdDecomposer::VhacdDecomposer()
    : m_instance(VHACD::CreateVHACD()) {}

VhacdDecomposer::~VhacdDecomposer() = default;

uint32_t VhacdDecomposer::VoxelBudget(uint32_t voxelResolution) {
    const uint64_t r = voxelResolution;
    const uint64_t budget = r * r * r;
    return budget > std::numeric_limits<uint32_t>::max()
        ? std::numeric_limits<uint32_t>::max()
        : static_cast<uint32_t>(budget);
}

std::expected<std::vector<ConvexHull>, Error>
VhacdDecomposer::Decompose(const RawMesh& mesh, const DecompositionParameters& params) {
    if (!m_instance) {
        return std::unexpected(Error(ErrorCode::DecompositionError, "V-HACD instance could not be created"));
    }

    VhacdLogger logger;
    VhacdProgress progress;

    VHACD::IVHACD::Parameters p;
    p.m_logger = &logger;
    p.m_callback = &progress;
    p.m_maxConvexHulls = params.maxHulls;
    p.m_resolution = VoxelBudget(params.voxelResolution);
    p.m_fillMode = ToVhacdFillMode(EffectiveFillMode(params));
    p.m_maxNumVerticesPerCH = params.maxVerticesPerHull;
    p.m_shrinkWrap = true;
    p.m_asyncACD = false;

    std::vector<float> points;
    points.reserve(mesh.vertices.size() * 3);
    for (const auto& v : mesh.vertices) {
        points.push_back(v.x);
        points.push_back(v.y);
        points.push_back(v.z);
    }

    std::vector<uint32_t> triangles;
    triangles.reserve(mesh.triangles.size() * 3);
    for (const auto& t : mesh.triangles) {
        triangles.insert(triangles.end(), t.begin(), t.end());
    }

    bool ok = m_instance->Compute(points.data(),
                                  static_cast<uint32_t>(mesh.vertices.size()),
                                  triangles.data(),
                                  static_cast<uint32_t>(mesh.triangles.size()),
                                  p);
    if (!ok) {
        m_instance->Clean();
        return std::unexpected(Error(ErrorCode::DecompositionError, "V-HACD failed to decompose the mesh"));
    }

    std::vector<ConvexHull> hulls;
    const uint32_t count = m_instance->GetNConvexHulls();
    hulls.reserve(count);

    for (uint32_t i = 0; i < count; ++i) {
        VHACD::IVHACD::ConvexHull ch;
        if (!m_instance->GetConvexHull(i, ch)) {
            m_instance->Clean();
            return std::unexpected(Error(ErrorCode::DecompositionError,
                                         "V-HACD did not return hull " + std::to_string(i)));
        }

        ConvexHull hull;
        hull.points.reserve(ch.m_points.size());
        for (const auto& v : ch.m_points) {
            hull.points.emplace_back(static_cast<float>(v.mX),
                                     static_cast<float>(v.mY),
                                     static_cast<float>(v.mZ));
        }
        hull.triangles.reserve(ch.m_triangles.size());
        for (const auto& t : ch.m_triangles) {
            hull.triangles.push_back({t.mI0, t.mI1, t.mI2});
        }
        hulls.push_back(std::move(hull));
    }

    m_instance->Clean();
    return hulls;
}

} // namespace Hullgen
