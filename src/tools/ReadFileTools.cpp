#include "ReadFileTools.hpp"
#include "mcp/TypedTool.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace mcpkit {

namespace fs = std::filesystem;

std::string read_text_file(const fs::path& path) {
    if (!fs::exists(path)) {
        throw std::runtime_error("File not found: " + path.string());
    }
    if (!fs::is_regular_file(path)) {
        throw std::runtime_error("Not a regular file: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path.string());
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Error while reading file: " + path.string());
    }
    return content.str();
}

TypeShape ReadFileArgs::shape() {
    return ObjectShape()
        .field("path", &ReadFileArgs::path,
               FieldOptions().with_required().with_description("Path to the file to read"))
        .build();
}

void from_json(const json& j, ReadFileArgs& args) {
    args.path = j.at("path").get<std::string>();
}

ReadFileTool::ReadFileTool(std::shared_ptr<const PathGuard> guard)
    : guard_(std::move(guard)) {
    if (!guard_) {
        throw std::invalid_argument("PathGuard cannot be null");
    }
}

std::shared_ptr<ITool> ReadFileTool::create(std::shared_ptr<const PathGuard> guard) {
    auto tool = std::make_shared<ReadFileTool>(std::move(guard));
    return make_typed_tool<ReadFileArgs>(
        kName,
        "Read the complete contents of a file from the file system. "
        "Only works within allowed directories.",
        [tool](const ReadFileArgs& args, const CancellationToken& token) {
            return tool->execute(args, token);
        });
}

ToolResponse ReadFileTool::execute(const ReadFileArgs& args, const CancellationToken& token) const {
    token.throw_if_cancelled();
    try {
        auto path = guard_->validate(args.path);
        return ToolResponse::success(read_text_file(path));
    } catch (const std::exception& e) {
        spdlog::debug("read_file failed for {}: {}", args.path, e.what());
        return ToolResponse::error(std::string("Error reading file: ") + e.what());
    }
}

TypeShape ReadMultipleFilesArgs::shape() {
    return ObjectShape()
        .field("paths", &ReadMultipleFilesArgs::paths,
               FieldOptions()
                   .with_required()
                   .with_description("Array of file paths to read")
                   .with_min_items(1))
        .build();
}

void from_json(const json& j, ReadMultipleFilesArgs& args) {
    args.paths = j.at("paths").get<std::vector<std::string>>();
}

ReadMultipleFilesTool::ReadMultipleFilesTool(std::shared_ptr<const PathGuard> guard)
    : guard_(std::move(guard)) {
    if (!guard_) {
        throw std::invalid_argument("PathGuard cannot be null");
    }
}

std::shared_ptr<ITool> ReadMultipleFilesTool::create(std::shared_ptr<const PathGuard> guard) {
    auto tool = std::make_shared<ReadMultipleFilesTool>(std::move(guard));
    return make_typed_tool<ReadMultipleFilesArgs>(
        kName,
        "Read the contents of multiple files in one call. Each file's content is "
        "returned with its path as a reference; failed reads for individual files "
        "don't stop the entire operation. Only works within allowed directories.",
        [tool](const ReadMultipleFilesArgs& args, const CancellationToken& token) {
            return tool->execute(args, token);
        },
        &ReadMultipleFilesTool::validate);
}

std::optional<std::string> ReadMultipleFilesTool::validate(const ReadMultipleFilesArgs& args) {
    if (args.paths.empty()) {
        return std::string("paths must contain at least one entry");
    }
    return std::nullopt;
}

ToolResponse ReadMultipleFilesTool::execute(const ReadMultipleFilesArgs& args,
                                            const CancellationToken& token) const {
    std::string combined;

    for (size_t i = 0; i < args.paths.size(); ++i) {
        token.throw_if_cancelled();

        const std::string& requested = args.paths[i];
        std::string entry;
        try {
            auto path = guard_->validate(requested);
            entry = requested + ":\n" + read_text_file(path) + "\n";
        } catch (const std::exception& e) {
            entry = requested + ": Error - " + e.what();
        }

        if (i > 0) {
            combined += "\n---\n";
        }
        combined += entry;
    }

    return ToolResponse::success(combined);
}

} // namespace mcpkit
