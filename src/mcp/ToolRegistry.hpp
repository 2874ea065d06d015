#pragma once

#include "ITool.hpp"
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace mcpkit {

/**
 * @brief Thread-safe name -> tool map
 *
 * Only membership is guarded; tools handed out by get() stay valid (shared
 * ownership) even if unregistered while executing.
 */
class ToolRegistry {
public:
    /**
     * @brief Add a tool
     * @throws std::invalid_argument if tool is null, unnamed, or name is taken
     */
    void register_tool(std::shared_ptr<ITool> tool);

    /**
     * @brief Remove a tool
     * @return false if no tool with this name was registered
     */
    bool unregister_tool(const std::string& name);

    /**
     * @brief Look up a tool
     * @return Tool or nullptr if absent
     */
    std::shared_ptr<ITool> get(const std::string& name) const;

    /**
     * @brief Snapshot of all registered tools, ordered by name
     */
    std::vector<std::shared_ptr<ITool>> list() const;

    bool contains(const std::string& name) const;
    size_t size() const;
    bool empty() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<ITool>> tools_;
};

} // namespace mcpkit
