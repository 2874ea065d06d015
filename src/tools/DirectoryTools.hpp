#pragma once

#include "core/CancellationToken.hpp"
#include "core/PathGuard.hpp"
#include "mcp/ITool.hpp"
#include "schema/TypeShape.hpp"
#include <memory>
#include <string>

namespace mcpkit {

struct DirectoryPathArgs {
    std::string path;

    static TypeShape shape();
};

void from_json(const json& j, DirectoryPathArgs& args);

/**
 * @brief MCP tool listing one directory
 *
 * One line per entry, "[DIR] name" or "[FILE] name", sorted.
 */
class ListDirectoryTool {
public:
    static constexpr const char* kName = "list_directory";

    explicit ListDirectoryTool(std::shared_ptr<const PathGuard> guard);

    static std::shared_ptr<ITool> create(std::shared_ptr<const PathGuard> guard);

    ToolResponse execute(const DirectoryPathArgs& args, const CancellationToken& token) const;

private:
    std::shared_ptr<const PathGuard> guard_;
};

/**
 * @brief MCP tool returning a recursive directory tree as JSON
 *
 * Output is an array of {name, type: "file"|"directory", children?},
 * directories first, then by name. Symbolic links are reported as files
 * and not followed.
 */
class DirectoryTreeTool {
public:
    static constexpr const char* kName = "directory_tree";

    explicit DirectoryTreeTool(std::shared_ptr<const PathGuard> guard);

    static std::shared_ptr<ITool> create(std::shared_ptr<const PathGuard> guard);

    ToolResponse execute(const DirectoryPathArgs& args, const CancellationToken& token) const;

private:
    json build_tree(const std::filesystem::path& directory, const CancellationToken& token) const;

    std::shared_ptr<const PathGuard> guard_;
};

} // namespace mcpkit
