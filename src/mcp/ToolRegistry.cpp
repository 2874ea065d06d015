#include "ToolRegistry.hpp"
#include <mutex>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace mcpkit {

void ToolRegistry::register_tool(std::shared_ptr<ITool> tool) {
    if (!tool) {
        throw std::invalid_argument("Tool cannot be null");
    }

    std::string name = tool->name();
    if (name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }

    std::unique_lock lock(mutex_);
    auto [it, inserted] = tools_.emplace(name, std::move(tool));
    if (!inserted) {
        throw std::invalid_argument("Tool '" + name + "' is already registered");
    }
    spdlog::info("Registered tool: {}", name);
}

bool ToolRegistry::unregister_tool(const std::string& name) {
    std::unique_lock lock(mutex_);
    bool removed = tools_.erase(name) > 0;
    if (removed) {
        spdlog::info("Unregistered tool: {}", name);
    }
    return removed;
}

std::shared_ptr<ITool> ToolRegistry::get(const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::shared_ptr<ITool>> ToolRegistry::list() const {
    std::shared_lock lock(mutex_);
    std::vector<std::shared_ptr<ITool>> result;
    result.reserve(tools_.size());
    for (const auto& [name, tool] : tools_) {
        result.push_back(tool);
    }
    return result;
}

bool ToolRegistry::contains(const std::string& name) const {
    std::shared_lock lock(mutex_);
    return tools_.count(name) > 0;
}

size_t ToolRegistry::size() const {
    std::shared_lock lock(mutex_);
    return tools_.size();
}

bool ToolRegistry::empty() const {
    std::shared_lock lock(mutex_);
    return tools_.empty();
}

} // namespace mcpkit
