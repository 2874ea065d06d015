#pragma once

#include "core/CancellationToken.hpp"
#include "core/PathGuard.hpp"
#include "mcp/ITool.hpp"
#include "schema/TypeShape.hpp"
#include <memory>
#include <string>
#include <vector>

namespace mcpkit {

struct ReadFileArgs {
    std::string path;

    static TypeShape shape();
};

void from_json(const json& j, ReadFileArgs& args);

/**
 * @brief MCP tool returning the full text of one file
 */
class ReadFileTool {
public:
    static constexpr const char* kName = "read_file";

    explicit ReadFileTool(std::shared_ptr<const PathGuard> guard);

    /**
     * @brief Create the registrable tool
     */
    static std::shared_ptr<ITool> create(std::shared_ptr<const PathGuard> guard);

    ToolResponse execute(const ReadFileArgs& args, const CancellationToken& token) const;

private:
    std::shared_ptr<const PathGuard> guard_;
};

struct ReadMultipleFilesArgs {
    std::vector<std::string> paths;

    static TypeShape shape();
};

void from_json(const json& j, ReadMultipleFilesArgs& args);

/**
 * @brief MCP tool reading several files in one call
 *
 * Each file is reported as "<path>:\n<content>\n" or "<path>: Error - <msg>";
 * entries keep input order and are separated by "\n---\n". A failing file
 * does not abort the batch.
 */
class ReadMultipleFilesTool {
public:
    static constexpr const char* kName = "read_multiple_files";

    explicit ReadMultipleFilesTool(std::shared_ptr<const PathGuard> guard);

    static std::shared_ptr<ITool> create(std::shared_ptr<const PathGuard> guard);

    static std::optional<std::string> validate(const ReadMultipleFilesArgs& args);

    ToolResponse execute(const ReadMultipleFilesArgs& args, const CancellationToken& token) const;

private:
    std::shared_ptr<const PathGuard> guard_;
};

/**
 * @brief Read a whole file as text
 * @throws std::runtime_error if the path is not a readable regular file
 */
std::string read_text_file(const std::filesystem::path& path);

} // namespace mcpkit
