#pragma once

#include "core/CancellationToken.hpp"
#include "core/PathGuard.hpp"
#include "mcp/ITool.hpp"
#include "schema/TypeShape.hpp"
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace mcpkit {

enum class SearchPatternType {
    Simple,    // case-insensitive substring
    Wildcard,  // * and ?, whole name
    Regex
};

template <>
struct EnumNames<SearchPatternType> {
    static std::vector<std::string> names() { return {"simple", "wildcard", "regex"}; }
};

/**
 * @brief Parse a pattern type name, ignoring case
 * @throws std::invalid_argument for unknown names
 */
SearchPatternType parse_search_pattern_type(const std::string& name);

struct SearchFilesArgs {
    std::string path;
    std::string pattern;
    std::optional<SearchPatternType> pattern_type;
    std::optional<std::vector<std::string>> exclude_patterns;

    static TypeShape shape();
};

void from_json(const json& j, SearchFilesArgs& args);

/**
 * @brief MCP tool searching a directory tree for matching names
 *
 * Matching is case-insensitive and applies to entry names. An entry is
 * skipped (with its subtree) when any component of its path relative to the
 * search root equals an exclude pattern. Symbolic links are not followed.
 */
class SearchFilesTool {
public:
    static constexpr const char* kName = "search_files";

    explicit SearchFilesTool(std::shared_ptr<const PathGuard> guard);

    static std::shared_ptr<ITool> create(std::shared_ptr<const PathGuard> guard);

    ToolResponse execute(const SearchFilesArgs& args, const CancellationToken& token) const;

    /**
     * @brief Build the name matcher for a pattern
     * @throws std::regex_error for an invalid regex pattern
     */
    static std::regex make_matcher(const std::string& pattern, SearchPatternType type);

private:
    void search(const std::filesystem::path& directory,
                const std::filesystem::path& root,
                const std::regex& matcher,
                const std::vector<std::string>& excludes,
                std::vector<std::string>& results,
                const CancellationToken& token) const;

    std::shared_ptr<const PathGuard> guard_;
};

struct FileInfoArgs {
    std::string path;

    static TypeShape shape();
};

void from_json(const json& j, FileInfoArgs& args);

/**
 * @brief MCP tool reporting metadata of a file or directory
 *
 * Lines: size, modified, isDirectory, isFile, isSymlink, permissions (octal).
 */
class GetFileInfoTool {
public:
    static constexpr const char* kName = "get_file_info";

    explicit GetFileInfoTool(std::shared_ptr<const PathGuard> guard);

    static std::shared_ptr<ITool> create(std::shared_ptr<const PathGuard> guard);

    ToolResponse execute(const FileInfoArgs& args, const CancellationToken& token) const;

private:
    std::shared_ptr<const PathGuard> guard_;
};

/**
 * @brief No-argument MCP tool listing the directories the server may access
 */
class ListAllowedDirectoriesTool {
public:
    static constexpr const char* kName = "list_allowed_directories";

    static std::shared_ptr<ITool> create(std::shared_ptr<const PathGuard> guard);
};

} // namespace mcpkit
