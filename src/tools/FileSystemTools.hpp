#pragma once

#include "core/PathGuard.hpp"
#include "mcp/ITool.hpp"
#include "mcp/ToolRegistry.hpp"
#include <memory>
#include <string>
#include <vector>

namespace mcpkit {

/**
 * @brief All file system tools sharing one path guard
 */
std::vector<std::shared_ptr<ITool>> filesystem_tools(std::shared_ptr<const PathGuard> guard);

/**
 * @brief Register the file system tools confined to the given directories
 * @throws std::invalid_argument if allowed_directories is empty or a tool name is taken
 */
void register_filesystem_tools(ToolRegistry& registry,
                               const std::vector<std::string>& allowed_directories);

} // namespace mcpkit
