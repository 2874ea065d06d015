#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcpkit {

/**
 * @brief Raised when a path resolves outside every allowed directory
 */
class AccessDenied : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Confines file system access to a set of allowed root directories
 *
 * Paths are made absolute against the current working directory and
 * normalized with weakly_canonical (existing prefixes have symlinks resolved),
 * then compared component by component against each allowed root.
 */
class PathGuard {
public:
    /**
     * @brief Construct guard over allowed directories
     * @param allowed_directories Root directories; must not be empty
     */
    explicit PathGuard(const std::vector<std::string>& allowed_directories);

    /**
     * @brief Validate a user-supplied path
     * @param path Path to check (relative paths resolve against cwd)
     * @return Normalized absolute path
     * @throws std::invalid_argument if path is empty
     * @throws AccessDenied if path is outside all allowed directories
     */
    std::filesystem::path validate(const std::string& path) const;

    /**
     * @brief Non-throwing variant of validate()
     */
    bool is_allowed(const std::string& path) const;

    /**
     * @brief Allowed roots as given (after normalization)
     */
    const std::vector<std::filesystem::path>& allowed_directories() const { return roots_; }

private:
    static std::filesystem::path normalize(const std::filesystem::path& path);
    static bool is_within(const std::filesystem::path& path, const std::filesystem::path& root);

    std::vector<std::filesystem::path> roots_;
};

} // namespace mcpkit
