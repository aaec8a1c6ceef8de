#include "export/FileOutput.hpp"
#include <fstream>
#include <system_error>

namespace Hullgen {

std::expected<void, Error> WriteTextFile(const std::filesystem::path& path,
                                         std::string_view contents) {
    std::ofstream file(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(Error(ErrorCode::WriteError, "cannot create " + path.string()));
    }

    file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    file.flush();
    if (!file) {
        return std::unexpected(Error(ErrorCode::WriteError, "failed writing " + path.string()));
    }
    return {};
}

std::expected<void, Error> EnsureDirectory(const std::filesystem::path& directory) {
    std::error_code ec;
    if (std::filesystem::is_directory(directory, ec)) {
        return {};
    }

    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return std::unexpected(Error(ErrorCode::WriteError,
                                     "cannot create directory " + directory.string() + ": " + ec.message()));
    }
    return {};
}

} // namespace Hullgen
