#include "recordc/internal/FileSystem.hpp"

#include "spdlog/spdlog.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>
#include <vector>

#if defined(__unix__) || defined(__APPLE__)
#    include <stdlib.h>
#else
#    error Need to define makeUniqueDirectory() for this operating system.
#endif

namespace recordc {

fs::path defaultWorkspaceBase() {
    std::error_code ec;
    auto path = fs::temp_directory_path(ec);
    if (ec) {
        SPDLOG_WARN("No temporary directory available ({}), using current directory", ec.message());
        return fs::current_path();
    }
    return path;
}

fs::path makeUniqueDirectory(const fs::path& base, std::string_view prefix, std::string& reason) {
    std::error_code ec;
    fs::create_directories(base, ec);
    if (ec) {
        reason = ec.message();
        return fs::path();
    }

    // mkdtemp() modifies the template in place, so it needs a mutable, null-terminated buffer.
    auto pattern = (base / fs::path(std::string(prefix) + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.emplace_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
        reason = std::strerror(errno);
        return fs::path();
    }

    return fs::path(buffer.data());
}

bool readFile(const fs::path& filePath, std::string& contents) {
    std::error_code ec;
    if (!fs::exists(filePath, ec)) {
        SPDLOG_ERROR("File: '{}' not found", filePath.string());
        return false;
    }

    std::ifstream inFile(filePath, std::ifstream::binary);
    if (!inFile) {
        SPDLOG_ERROR("File: '{}' open error", filePath.string());
        return false;
    }
    contents.assign(std::istreambuf_iterator<char>(inFile), std::istreambuf_iterator<char>());
    if (inFile.bad()) {
        SPDLOG_ERROR("File: '{}' read error", filePath.string());
        return false;
    }

    return true;
}

bool writeFile(const fs::path& filePath, std::string_view contents) {
    std::ofstream outFile(filePath, std::ofstream::binary | std::ofstream::trunc);
    if (!outFile) {
        SPDLOG_ERROR("File: '{}' create error", filePath.string());
        return false;
    }
    outFile.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    outFile.close();
    if (!outFile) {
        SPDLOG_ERROR("File: '{}' write error", filePath.string());
        return false;
    }

    SPDLOG_DEBUG("Wrote {} bytes to '{}'", contents.size(), filePath.string());
    return true;
}

} // namespace recordc
