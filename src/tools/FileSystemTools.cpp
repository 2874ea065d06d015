#include "FileSystemTools.hpp"
#include "ArchiveTools.hpp"
#include "DirectoryTools.hpp"
#include "ReadFileTools.hpp"
#include "SearchTools.hpp"
#include "WriteFileTools.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace mcpkit {

std::vector<std::shared_ptr<ITool>> filesystem_tools(std::shared_ptr<const PathGuard> guard) {
    if (!guard) {
        throw std::invalid_argument("PathGuard cannot be null");
    }

    return {
        ReadFileTool::create(guard),
        ReadMultipleFilesTool::create(guard),
        WriteFileTool::create(guard),
        CreateDirectoryTool::create(guard),
        MoveFileTool::create(guard),
        ListDirectoryTool::create(guard),
        DirectoryTreeTool::create(guard),
        SearchFilesTool::create(guard),
        GetFileInfoTool::create(guard),
        ListAllowedDirectoriesTool::create(guard),
        ArchiveOperationsTool::create(guard)
    };
}

void register_filesystem_tools(ToolRegistry& registry,
                               const std::vector<std::string>& allowed_directories) {
    auto guard = std::make_shared<const PathGuard>(allowed_directories);

    for (const auto& directory : guard->allowed_directories()) {
        spdlog::info("Allowed directory: {}", directory.string());
    }

    for (auto& tool : filesystem_tools(guard)) {
        registry.register_tool(std::move(tool));
    }
}

} // namespace mcpkit
