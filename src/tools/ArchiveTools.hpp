#pragma once

#include "core/CancellationToken.hpp"
#include "core/PathGuard.hpp"
#include "mcp/ITool.hpp"
#include "schema/TypeShape.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpkit {

enum class ArchiveOperation {
    Extract,
    Create,
    List,
    Test,
    Info
};

/**
 * @brief Parse an archive operation name, ignoring case
 * @return std::nullopt for unknown names
 */
std::optional<ArchiveOperation> parse_archive_operation(const std::string& name);

/**
 * @brief Container layout chosen from the archive file name
 *
 * .zip, .tar, .tar.gz and .tgz are supported; anything else is Unsupported.
 */
enum class ArchiveFormat {
    Zip,
    Tar,
    TarGzip,
    Unsupported
};

ArchiveFormat archive_format_for(const std::filesystem::path& path);

/**
 * @brief Whether an entry name stays below the extraction root
 *
 * Rejects empty and absolute names, drive letters, backslashes and any
 * ".." component.
 */
bool is_safe_entry_name(const std::string& name);

struct ArchiveOptions {
    std::optional<bool> overwrite;             // default false
    std::optional<bool> preserve_permissions;  // default true
    std::optional<int> compression_level;      // 0-9, default 6
    std::optional<bool> dry_run;               // default false
    std::optional<std::int64_t> max_size_bytes;
    std::optional<std::vector<std::string>> include_patterns;
    std::optional<std::vector<std::string>> exclude_patterns;

    static TypeShape shape();
};

void from_json(const json& j, ArchiveOptions& options);

struct ArchiveOperationArgs {
    std::string operation;
    std::optional<std::string> archive_path;
    std::optional<std::string> source_path;
    std::optional<std::string> archive_output_path;
    std::optional<std::string> extract_to_path;
    std::optional<ArchiveOptions> options;

    static TypeShape shape();
};

void from_json(const json& j, ArchiveOperationArgs& args);

/**
 * @brief MCP tool creating, extracting, listing, testing and describing archives
 *
 * Every path argument goes through the path guard. On extraction each
 * entry is checked twice: its name must be relative without ".."
 * components, and the resolved target must stay below the destination
 * and inside an allowed directory. Only regular files and directories
 * are extracted; links and devices are skipped.
 *
 * Include/exclude patterns are wildcards (* and ?) matched against the
 * entry path relative to the archive root.
 */
class ArchiveOperationsTool {
public:
    static constexpr const char* kName = "archive_operations";
    static constexpr std::int64_t kDefaultMaxSizeBytes = 1024LL * 1024 * 1024;
    static constexpr std::size_t kMaxListedFiles = 20;

    explicit ArchiveOperationsTool(std::shared_ptr<const PathGuard> guard);

    static std::shared_ptr<ITool> create(std::shared_ptr<const PathGuard> guard);

    ToolResponse execute(const ArchiveOperationArgs& args, const CancellationToken& token) const;

private:
    ToolResponse extract(const ArchiveOperationArgs& args, const CancellationToken& token) const;
    ToolResponse create_archive(const ArchiveOperationArgs& args, const CancellationToken& token) const;
    ToolResponse list(const ArchiveOperationArgs& args, const CancellationToken& token) const;
    ToolResponse test(const ArchiveOperationArgs& args, const CancellationToken& token) const;
    ToolResponse info(const ArchiveOperationArgs& args, const CancellationToken& token) const;

    std::shared_ptr<const PathGuard> guard_;
};

} // namespace mcpkit
