#ifndef SRC_RECORDC_INTERNAL_FILE_SYSTEM_HPP_
#define SRC_RECORDC_INTERNAL_FILE_SYSTEM_HPP_

#if __has_include(<filesystem>)
#    include <filesystem>
namespace fs = std::filesystem;
#else
#    include <experimental/filesystem>
namespace fs = std::experimental::filesystem;
#endif

#include <string>
#include <string_view>

namespace recordc {

// Base directory for build workspaces when none is configured.
fs::path defaultWorkspaceBase();

// Creates a new, uniquely named directory under base whose name starts with prefix. OS-specific code. On failure
// returns an empty path and fills in reason.
fs::path makeUniqueDirectory(const fs::path& base, std::string_view prefix, std::string& reason);

bool readFile(const fs::path& filePath, std::string& contents);
bool writeFile(const fs::path& filePath, std::string_view contents);

} // namespace recordc

#endif // SRC_RECORDC_INTERNAL_FILE_SYSTEM_HPP_
