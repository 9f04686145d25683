#ifndef SRC_RECORDC_WORKSPACE_HPP_
#define SRC_RECORDC_WORKSPACE_HPP_

#include "recordc/internal/FileSystem.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace recordc {

class ErrorReporter;

// A private scratch directory holding the generated sources and built artifact for one record schema. Owned by
// exactly one parser handle, or by the Builder while a build is in progress. The directory and everything in it is
// deleted on destruction unless setKeep(true) was called.
class Workspace {
private:
    struct PassKey {
        explicit PassKey() = default;
    };

public:
    Workspace() = delete;
    // Only callable from create().
    Workspace(PassKey, fs::path path);
    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;
    ~Workspace();

    // Creates a new, uniquely named directory under base. Reports kWorkspaceCreateFailed and returns nullptr on
    // failure.
    static std::unique_ptr<Workspace> create(const fs::path& base, std::string_view prefix,
            ErrorReporter* errorReporter);

    const fs::path& path() const { return m_path; }
    fs::path filePath(std::string_view fileName) const { return m_path / fs::path(std::string(fileName)); }

    // Writes contents to fileName inside the workspace and tracks the file. Reports kSourceWriteFailed on failure.
    bool writeFile(std::string_view fileName, std::string_view contents, ErrorReporter* errorReporter);
    // Tracks a file created by some other tool, such as the compiled artifact.
    void trackFile(std::string_view fileName);
    const std::vector<fs::path>& files() const { return m_files; }

    bool keep() const { return m_keep; }
    void setKeep(bool keep) { m_keep = keep; }

    // Deletes the directory. Idempotent. Returns false if anything could not be deleted.
    bool remove();
    bool isRemoved() const { return m_removed; }

private:
    fs::path m_path;
    std::vector<fs::path> m_files;
    bool m_keep;
    bool m_removed;
};

} // namespace recordc

#endif // SRC_RECORDC_WORKSPACE_HPP_
