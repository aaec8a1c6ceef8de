#include "export/ObjWriter.hpp"
#include "export/FileOutput.hpp"
#include <spdlog/fmt/fmt.h>
#include <iterator>

namespace Hullgen {

std::string FormatObj(const std::string& name, const ConvexHull& hull) {
    std::string out;
    auto it = std::back_inserter(out);

    fmt::format_to(it, "o {}\n", name);
    for (const auto& p : hull.points) {
        fmt::format_to(it, "v {} {} {}\n", p.x, p.y, p.z);
    }
    for (const auto& t : hull.triangles) {
        fmt::format_to(it, "f {} {} {}\n",
                       static_cast<uint64_t>(t[0]) + 1,
                       static_cast<uint64_t>(t[1]) + 1,
                       static_cast<uint64_t>(t[2]) + 1);
    }
    return out;
}

std::expected<std::filesystem::path, Error>
WriteHullObj(const std::filesystem::path& directory,
             const std::string& name,
             const std::string& suffix,
             const ConvexHull& hull) {
    std::filesystem::path path = directory / (name + suffix + ".obj");
    auto written = WriteTextFile(path, FormatObj(name, hull));
    if (!written) {
        return std::unexpected(written.error());
    }
    return path;
}

} // namespace Hullgen
