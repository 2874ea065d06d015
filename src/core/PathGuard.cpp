#include "PathGuard.hpp"
#include <spdlog/spdlog.h>

namespace mcpkit {

namespace fs = std::filesystem;

PathGuard::PathGuard(const std::vector<std::string>& allowed_directories) {
    if (allowed_directories.empty()) {
        throw std::invalid_argument("At least one allowed directory is required");
    }

    for (const auto& dir : allowed_directories) {
        if (dir.empty()) {
            throw std::invalid_argument("Allowed directory cannot be empty");
        }
        roots_.push_back(normalize(dir));
        spdlog::debug("Allowed directory: {}", roots_.back().string());
    }
}

fs::path PathGuard::normalize(const fs::path& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        throw std::invalid_argument("Cannot resolve path '" + path.string() + "': " + ec.message());
    }

    fs::path normalized = fs::weakly_canonical(absolute, ec);
    if (ec) {
        normalized = absolute.lexically_normal();
    }

    // Drop a trailing separator so "/a/b/" and "/a/b" compare equal
    if (!normalized.has_filename() && normalized.has_parent_path() &&
        normalized != normalized.root_path()) {
        normalized = normalized.parent_path();
    }
    return normalized;
}

bool PathGuard::is_within(const fs::path& path, const fs::path& root) {
    auto path_it = path.begin();
    for (auto root_it = root.begin(); root_it != root.end(); ++root_it, ++path_it) {
        if (path_it == path.end() || *path_it != *root_it) {
            return false;
        }
    }
    return true;
}

fs::path PathGuard::validate(const std::string& path) const {
    if (path.empty()) {
        throw std::invalid_argument("Path cannot be empty");
    }

    fs::path normalized = normalize(path);
    for (const auto& root : roots_) {
        if (is_within(normalized, root)) {
            return normalized;
        }
    }

    spdlog::warn("Rejected path outside allowed directories: {}", path);
    throw AccessDenied("Access denied: Path '" + path + "' is outside allowed directories");
}

bool PathGuard::is_allowed(const std::string& path) const {
    try {
        validate(path);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const AccessDenied&) {
        return false;
    }
}

} // namespace mcpkit
