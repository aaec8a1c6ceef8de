#pragma once

#include "decomposition/ConvexDecomposer.hpp"
#include <memory>

namespace VHACD {
class IVHACD;
}

namespace Hullgen {

/**
 * @brief IConvexDecomposer backed by V-HACD 4
 *
 * Runs V-HACD synchronously with shrink-wrapping enabled so hull points lie
 * on the source surface. One V-HACD instance is reused across calls.
 */
class VhacdDecomposer : public IConvexDecomposer {
public:
    VhacdDecomposer();
    ~VhacdDecomposer() override;

    VhacdDecomposer(const VhacdDecomposer&) = delete;
    VhacdDecomposer& operator=(const VhacdDecomposer&) = delete;

    [[nodiscard]] std::expected<std::vector<ConvexHull>, Error>
    Decompose(const RawMesh& mesh, const DecompositionParameters& params) override;

    /**
     * @brief Total voxel budget V-HACD expects for a per-axis resolution
     */
    [[nodiscard]] static uint32_t VoxelBudget(uint32_t voxelResolution);

private:
    struct Releaser {
        void operator()(VHACD::IVHACD* instance) const;
    };

    std::unique_ptr<VHACD::IVHACD, Releaser> m_instance;
};

} // namespace Hullgen
