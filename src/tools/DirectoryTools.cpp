#include "DirectoryTools.hpp"
#include "mcp/TypedTool.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>
#include <spdlog/spdlog.h>

namespace mcpkit {

namespace fs = std::filesystem;

namespace {

void require_directory(const fs::path& path, const std::string& requested) {
    if (!fs::exists(path)) {
        throw std::runtime_error("Directory not found: " + requested);
    }
    if (!fs::is_directory(path)) {
        throw std::runtime_error("Not a directory: " + requested);
    }
}

} // namespace

TypeShape DirectoryPathArgs::shape() {
    return ObjectShape()
        .field("path", &DirectoryPathArgs::path,
               FieldOptions().with_required().with_description("Path to the directory"))
        .build();
}

void from_json(const json& j, DirectoryPathArgs& args) {
    args.path = j.at("path").get<std::string>();
}

ListDirectoryTool::ListDirectoryTool(std::shared_ptr<const PathGuard> guard)
    : guard_(std::move(guard)) {
    if (!guard_) {
        throw std::invalid_argument("PathGuard cannot be null");
    }
}

std::shared_ptr<ITool> ListDirectoryTool::create(std::shared_ptr<const PathGuard> guard) {
    auto tool = std::make_shared<ListDirectoryTool>(std::move(guard));
    return make_typed_tool<DirectoryPathArgs>(
        kName,
        "Get a detailed listing of all files and directories in a specified path. "
        "Entries are prefixed with [FILE] or [DIR]. Only works within allowed directories.",
        [tool](const DirectoryPathArgs& args, const CancellationToken& token) {
            return tool->execute(args, token);
        });
}

ToolResponse ListDirectoryTool::execute(const DirectoryPathArgs& args,
                                        const CancellationToken& token) const {
    token.throw_if_cancelled();
    try {
        auto path = guard_->validate(args.path);
        require_directory(path, args.path);

        std::vector<std::string> lines;
        for (const auto& entry : fs::directory_iterator(path)) {
            std::error_code ec;
            bool is_dir = entry.is_directory(ec);
            lines.push_back((is_dir ? "[DIR] " : "[FILE] ") + entry.path().filename().string());
        }
        std::sort(lines.begin(), lines.end());

        std::string text;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) {
                text += '\n';
            }
            text += lines[i];
        }
        return ToolResponse::success(text);
    } catch (const std::exception& e) {
        return ToolResponse::error(std::string("Error listing directory: ") + e.what());
    }
}

DirectoryTreeTool::DirectoryTreeTool(std::shared_ptr<const PathGuard> guard)
    : guard_(std::move(guard)) {
    if (!guard_) {
        throw std::invalid_argument("PathGuard cannot be null");
    }
}

std::shared_ptr<ITool> DirectoryTreeTool::create(std::shared_ptr<const PathGuard> guard) {
    auto tool = std::make_shared<DirectoryTreeTool>(std::move(guard));
    return make_typed_tool<DirectoryPathArgs>(
        kName,
        "Get a recursive tree view of files and directories as a JSON structure. "
        "Each entry includes 'name', 'type' (file/directory) and 'children' for "
        "directories. Only works within allowed directories.",
        [tool](const DirectoryPathArgs& args, const CancellationToken& token) {
            return tool->execute(args, token);
        });
}

ToolResponse DirectoryTreeTool::execute(const DirectoryPathArgs& args,
                                        const CancellationToken& token) const {
    try {
        auto path = guard_->validate(args.path);
        require_directory(path, args.path);

        json tree = build_tree(path, token);
        return ToolResponse::success(tree.dump(2, ' ', false, json::error_handler_t::replace));
    } catch (const OperationCancelled&) {
        throw;
    } catch (const std::exception& e) {
        return ToolResponse::error(std::string("Error building directory tree: ") + e.what());
    }
}

json DirectoryTreeTool::build_tree(const fs::path& directory, const CancellationToken& token) const {
    guard_->validate(directory.string());

    std::vector<json> directories;
    std::vector<json> files;

    for (const auto& entry : fs::directory_iterator(directory)) {
        token.throw_if_cancelled();

        std::error_code ec;
        bool is_dir = entry.is_directory(ec) && !entry.is_symlink(ec);
        std::string name = entry.path().filename().string();

        if (is_dir) {
            directories.push_back({
                {"name", name},
                {"type", "directory"},
                {"children", build_tree(entry.path(), token)}
            });
        } else {
            files.push_back({
                {"name", name},
                {"type", "file"}
            });
        }
    }

    auto by_name = [](const json& a, const json& b) {
        return a["name"].get<std::string>() < b["name"].get<std::string>();
    };
    std::sort(directories.begin(), directories.end(), by_name);
    std::sort(files.begin(), files.end(), by_name);

    json result = json::array();
    for (auto& node : directories) {
        result.push_back(std::move(node));
    }
    for (auto& node : files) {
        result.push_back(std::move(node));
    }
    return result;
}

} // namespace mcpkit
