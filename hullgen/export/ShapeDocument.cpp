#include "export/ShapeDocument.hpp"
#include "export/FileOutput.hpp"
#include <spdlog/fmt/fmt.h>
#include <cstdlib>

namespace Hullgen {

namespace {
    // nlohmann keeps every number as a double. Widening through the
    // shortest float text writes 0.1f as 0.1 instead of 0.10000000149011612.
    double ToDocumentNumber(float value) {
        const std::string text = fmt::format("{}", value);
        return std::strtod(text.c_str(), nullptr);
    }
}

nlohmann::json BuildShapeDocument(const std::vector<DecomposedGroup>& groups) {
    nlohmann::json shapes = nlohmann::json::array();

    for (const auto& group : groups) {
        for (const auto& hull : group.hulls) {
            nlohmann::json points = nlohmann::json::array();
            for (const auto& p : hull.points) {
                nlohmann::json point;
                point["x"] = ToDocumentNumber(p.x);
                point["y"] = ToDocumentNumber(p.y);
                point["z"] = ToDocumentNumber(p.z);
                points.push_back(std::move(point));
            }

            nlohmann::json tris = nlohmann::json::array();
            for (const auto& t : hull.triangles) {
                tris.push_back(nlohmann::json::array({t[0], t[1], t[2]}));
            }

            nlohmann::json shape;
            shape["points"] = std::move(points);
            shape["tris"] = std::move(tris);
            shapes.push_back(std::move(shape));
        }
    }

    nlohmann::json document;
    document["shapes"] = std::move(shapes);
    return document;
}

std::string SerializeShapeDocument(const nlohmann::json& document) {
    return document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::expected<std::filesystem::path, Error>
WriteShapeDocument(const std::filesystem::path& directory,
                   const std::string& baseName,
                   const std::string& suffix,
                   const nlohmann::json& document) {
    std::filesystem::path path = directory / (baseName + suffix + ".json");
    auto written = WriteTextFile(path, SerializeShapeDocument(document));
    if (!written) {
        return std::unexpected(written.error());
    }
    return path;
}

} // namespace Hullgen
