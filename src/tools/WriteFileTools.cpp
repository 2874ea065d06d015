#include "WriteFileTools.hpp"
#include "mcp/TypedTool.hpp"
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace mcpkit {

namespace fs = std::filesystem;

TypeShape WriteFileArgs::shape() {
    return ObjectShape()
        .field("path", &WriteFileArgs::path,
               FieldOptions().with_required().with_description("Path to the file to write"))
        .field("content", &WriteFileArgs::content,
               FieldOptions().with_required().with_description("Content to write to the file"))
        .build();
}

void from_json(const json& j, WriteFileArgs& args) {
    args.path = j.at("path").get<std::string>();
    args.content = j.at("content").get<std::string>();
}

WriteFileTool::WriteFileTool(std::shared_ptr<const PathGuard> guard)
    : guard_(std::move(guard)) {
    if (!guard_) {
        throw std::invalid_argument("PathGuard cannot be null");
    }
}

std::shared_ptr<ITool> WriteFileTool::create(std::shared_ptr<const PathGuard> guard) {
    auto tool = std::make_shared<WriteFileTool>(std::move(guard));
    return make_typed_tool<WriteFileArgs>(
        kName,
        "Create a new file or completely overwrite an existing file with new content. "
        "Only works within allowed directories.",
        [tool](const WriteFileArgs& args, const CancellationToken& token) {
            return tool->execute(args, token);
        });
}

ToolResponse WriteFileTool::execute(const WriteFileArgs& args, const CancellationToken& token) const {
    token.throw_if_cancelled();
    try {
        auto path = guard_->validate(args.path);

        if (fs::is_directory(path)) {
            throw std::runtime_error("Path is a directory: " + args.path);
        }

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Cannot open file for writing: " + args.path);
        }
        file << args.content;
        file.flush();
        if (!file) {
            throw std::runtime_error("Error while writing file: " + args.path);
        }

        spdlog::debug("Wrote {} bytes to {}", args.content.size(), path.string());
        return ToolResponse::success("Successfully wrote to " + args.path);
    } catch (const std::exception& e) {
        return ToolResponse::error(std::string("Error writing file: ") + e.what());
    }
}

TypeShape CreateDirectoryArgs::shape() {
    return ObjectShape()
        .field("path", &CreateDirectoryArgs::path,
               FieldOptions().with_required().with_description("Path to the directory to create"))
        .build();
}

void from_json(const json& j, CreateDirectoryArgs& args) {
    args.path = j.at("path").get<std::string>();
}

CreateDirectoryTool::CreateDirectoryTool(std::shared_ptr<const PathGuard> guard)
    : guard_(std::move(guard)) {
    if (!guard_) {
        throw std::invalid_argument("PathGuard cannot be null");
    }
}

std::shared_ptr<ITool> CreateDirectoryTool::create(std::shared_ptr<const PathGuard> guard) {
    auto tool = std::make_shared<CreateDirectoryTool>(std::move(guard));
    return make_typed_tool<CreateDirectoryArgs>(
        kName,
        "Create a new directory or ensure a directory exists. Creates parent "
        "directories as needed. Only works within allowed directories.",
        [tool](const CreateDirectoryArgs& args, const CancellationToken& token) {
            return tool->execute(args, token);
        });
}

ToolResponse CreateDirectoryTool::execute(const CreateDirectoryArgs& args,
                                          const CancellationToken& token) const {
    token.throw_if_cancelled();
    try {
        auto path = guard_->validate(args.path);

        if (fs::exists(path) && !fs::is_directory(path)) {
            throw std::runtime_error("Path exists and is not a directory: " + args.path);
        }
        fs::create_directories(path);

        return ToolResponse::success("Successfully created directory " + args.path);
    } catch (const std::exception& e) {
        return ToolResponse::error(std::string("Error creating directory: ") + e.what());
    }
}

TypeShape MoveFileArgs::shape() {
    return ObjectShape()
        .field("source", &MoveFileArgs::source,
               FieldOptions().with_required().with_description("Source path"))
        .field("destination", &MoveFileArgs::destination,
               FieldOptions().with_required().with_description("Destination path"))
        .build();
}

void from_json(const json& j, MoveFileArgs& args) {
    args.source = j.at("source").get<std::string>();
    args.destination = j.at("destination").get<std::string>();
}

MoveFileTool::MoveFileTool(std::shared_ptr<const PathGuard> guard)
    : guard_(std::move(guard)) {
    if (!guard_) {
        throw std::invalid_argument("PathGuard cannot be null");
    }
}

std::shared_ptr<ITool> MoveFileTool::create(std::shared_ptr<const PathGuard> guard) {
    auto tool = std::make_shared<MoveFileTool>(std::move(guard));
    return make_typed_tool<MoveFileArgs>(
        kName,
        "Move or rename files and directories. If the destination exists, the "
        "operation will fail. Both source and destination must be within allowed directories.",
        [tool](const MoveFileArgs& args, const CancellationToken& token) {
            return tool->execute(args, token);
        });
}

ToolResponse MoveFileTool::execute(const MoveFileArgs& args, const CancellationToken& token) const {
    token.throw_if_cancelled();
    try {
        auto source = guard_->validate(args.source);
        auto destination = guard_->validate(args.destination);

        if (!fs::exists(fs::symlink_status(source))) {
            throw std::runtime_error("Source not found: " + args.source);
        }
        if (fs::exists(fs::symlink_status(destination))) {
            throw std::runtime_error("Destination already exists: " + args.destination);
        }

        fs::rename(source, destination);

        spdlog::debug("Moved {} to {}", source.string(), destination.string());
        return ToolResponse::success("Successfully moved " + args.source + " to " + args.destination);
    } catch (const std::exception& e) {
        return ToolResponse::error(std::string("Error moving file: ") + e.what());
    }
}

} // namespace mcpkit
