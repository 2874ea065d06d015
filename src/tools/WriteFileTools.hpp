#pragma once

#include "core/CancellationToken.hpp"
#include "core/PathGuard.hpp"
#include "mcp/ITool.hpp"
#include "schema/TypeShape.hpp"
#include <memory>
#include <string>

namespace mcpkit {

struct WriteFileArgs {
    std::string path;
    std::string content;

    static TypeShape shape();
};

void from_json(const json& j, WriteFileArgs& args);

/**
 * @brief MCP tool creating or overwriting a text file
 *
 * The parent directory must already exist.
 */
class WriteFileTool {
public:
    static constexpr const char* kName = "write_file";

    explicit WriteFileTool(std::shared_ptr<const PathGuard> guard);

    static std::shared_ptr<ITool> create(std::shared_ptr<const PathGuard> guard);

    ToolResponse execute(const WriteFileArgs& args, const CancellationToken& token) const;

private:
    std::shared_ptr<const PathGuard> guard_;
};

struct CreateDirectoryArgs {
    std::string path;

    static TypeShape shape();
};

void from_json(const json& j, CreateDirectoryArgs& args);

/**
 * @brief MCP tool creating a directory with all missing parents
 *
 * Succeeds silently if the directory already exists.
 */
class CreateDirectoryTool {
public:
    static constexpr const char* kName = "create_directory";

    explicit CreateDirectoryTool(std::shared_ptr<const PathGuard> guard);

    static std::shared_ptr<ITool> create(std::shared_ptr<const PathGuard> guard);

    ToolResponse execute(const CreateDirectoryArgs& args, const CancellationToken& token) const;

private:
    std::shared_ptr<const PathGuard> guard_;
};

struct MoveFileArgs {
    std::string source;
    std::string destination;

    static TypeShape shape();
};

void from_json(const json& j, MoveFileArgs& args);

/**
 * @brief MCP tool moving or renaming a file or directory
 *
 * Fails if the source is missing or the destination already exists.
 */
class MoveFileTool {
public:
    static constexpr const char* kName = "move_file";

    explicit MoveFileTool(std::shared_ptr<const PathGuard> guard);

    static std::shared_ptr<ITool> create(std::shared_ptr<const PathGuard> guard);

    ToolResponse execute(const MoveFileArgs& args, const CancellationToken& token) const;

private:
    std::shared_ptr<const PathGuard> guard_;
};

} // namespace mcpkit
