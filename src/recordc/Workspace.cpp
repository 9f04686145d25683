#include "recordc/Workspace.hpp"

#include "recordc/ErrorReporter.hpp"

#include "spdlog/spdlog.h"

#include <system_error>
#include <utility>

namespace recordc {

Workspace::Workspace(PassKey, fs::path path): m_path(std::move(path)), m_keep(false), m_removed(false) {}

Workspace::~Workspace() {
    if (m_keep) {
        SPDLOG_INFO("Keeping workspace '{}'", m_path.string());
        return;
    }
    remove();
}

// static
std::unique_ptr<Workspace> Workspace::create(const fs::path& base, std::string_view prefix,
        ErrorReporter* errorReporter) {
    std::string reason;
    auto path = makeUniqueDirectory(base, prefix, reason);
    if (path.empty()) {
        errorReporter->addWorkspaceCreateError((base / fs::path(std::string(prefix))).string(), reason);
        return nullptr;
    }

    SPDLOG_DEBUG("Created workspace '{}'", path.string());
    return std::make_unique<Workspace>(PassKey(), std::move(path));
}

bool Workspace::writeFile(std::string_view fileName, std::string_view contents, ErrorReporter* errorReporter) {
    auto path = filePath(fileName);
    if (!recordc::writeFile(path, contents)) {
        errorReporter->addSourceWriteError(path.string());
        return false;
    }
    trackFile(fileName);
    return true;
}

void Workspace::trackFile(std::string_view fileName) {
    m_files.emplace_back(filePath(fileName));
}

bool Workspace::remove() {
    if (m_removed) { return true; }

    for (const auto& file : m_files) {
        SPDLOG_INFO("Removing file '{}'", file.string());
    }

    std::error_code ec;
    fs::remove_all(m_path, ec);
    if (ec) {
        SPDLOG_ERROR("Failed to remove workspace '{}': {}", m_path.string(), ec.message());
        return false;
    }

    m_removed = true;
    return true;
}

} // namespace recordc
