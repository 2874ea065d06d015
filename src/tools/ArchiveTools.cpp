#include "ArchiveTools.hpp"
#include "SearchTools.hpp"
#include "mcp/TypedTool.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace mcpkit {

namespace fs = std::filesystem;

namespace {

constexpr size_t kBlockSize = 64 * 1024;

struct ArchiveReadDeleter {
    void operator()(archive* handle) const noexcept { archive_read_free(handle); }
};

struct ArchiveWriteDeleter {
    void operator()(archive* handle) const noexcept { archive_write_free(handle); }
};

struct ArchiveEntryDeleter {
    void operator()(archive_entry* entry) const noexcept { archive_entry_free(entry); }
};

using ArchiveReader = std::unique_ptr<archive, ArchiveReadDeleter>;
using ArchiveWriter = std::unique_ptr<archive, ArchiveWriteDeleter>;
using ArchiveEntryPtr = std::unique_ptr<archive_entry, ArchiveEntryDeleter>;

// Raised when the uncompressed total would pass options.maxSizeBytes
class SizeLimitExceeded : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string error_text(archive* handle) {
    const char* message = archive_error_string(handle);
    return message ? message : "unknown archive error";
}

// ARCHIVE_WARN is logged and tolerated, anything below it throws
void check(archive* handle, int status, const std::string& context) {
    if (status == ARCHIVE_WARN) {
        spdlog::warn("{}: {}", context, error_text(handle));
        return;
    }
    if (status < ARCHIVE_OK) {
        throw std::runtime_error(context + ": " + error_text(handle));
    }
}

ArchiveReader open_reader(const fs::path& path) {
    ArchiveReader reader(archive_read_new());
    if (!reader) {
        throw std::runtime_error("Failed to allocate archive reader");
    }
    check(reader.get(), archive_read_support_filter_all(reader.get()), "Failed to enable filters");
    check(reader.get(), archive_read_support_format_all(reader.get()), "Failed to enable formats");
    check(reader.get(), archive_read_open_filename(reader.get(), path.string().c_str(), kBlockSize),
          "Failed to open archive " + path.string());
    return reader;
}

// false at end of archive
bool next_entry(archive* reader, archive_entry** entry) {
    int status = archive_read_next_header(reader, entry);
    if (status == ARCHIVE_EOF) {
        return false;
    }
    check(reader, status, "Failed to read archive entry");
    return true;
}

template <typename Sink>
std::int64_t read_entry_data(archive* reader, Sink&& sink, const CancellationToken& token) {
    std::vector<char> buffer(kBlockSize);
    std::int64_t total = 0;
    for (;;) {
        token.throw_if_cancelled();
        auto count = archive_read_data(reader, buffer.data(), buffer.size());
        if (count == 0) {
            break;
        }
        if (count < 0) {
            throw std::runtime_error("Failed to read entry data: " + error_text(reader));
        }
        sink(buffer.data(), static_cast<size_t>(count), total);
        total += count;
    }
    return total;
}

std::string format_utc(std::time_t seconds) {
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%d %H:%M:%S") << " UTC";
    return out.str();
}

std::time_t to_time_t(fs::file_time_type time) {
    auto system_time = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        time - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return std::chrono::system_clock::to_time_t(system_time);
}

std::string format_ratio(std::int64_t uncompressed, std::int64_t compressed) {
    double ratio = 0.0;
    if (uncompressed > 0) {
        ratio = (1.0 - static_cast<double>(compressed) / static_cast<double>(uncompressed)) * 100.0;
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << ratio << "%";
    return out.str();
}

class EntryFilter {
public:
    EntryFilter(const std::vector<std::string>& includes, const std::vector<std::string>& excludes) {
        for (const auto& pattern : includes) {
            includes_.push_back(SearchFilesTool::make_matcher(pattern, SearchPatternType::Wildcard));
        }
        for (const auto& pattern : excludes) {
            excludes_.push_back(SearchFilesTool::make_matcher(pattern, SearchPatternType::Wildcard));
        }
    }

    bool accepts(const std::string& name) const {
        auto matches = [&name](const std::regex& matcher) { return std::regex_match(name, matcher); };
        if (!includes_.empty() && std::none_of(includes_.begin(), includes_.end(), matches)) {
            return false;
        }
        return std::none_of(excludes_.begin(), excludes_.end(), matches);
    }

private:
    std::vector<std::regex> includes_;
    std::vector<std::regex> excludes_;
};

struct EffectiveOptions {
    bool overwrite;
    bool preserve_permissions;
    int compression_level;
    bool dry_run;
    std::int64_t max_size_bytes;
    EntryFilter filter;
};

EffectiveOptions effective_options(const std::optional<ArchiveOptions>& given) {
    ArchiveOptions options = given.value_or(ArchiveOptions{});
    return EffectiveOptions{
        options.overwrite.value_or(false),
        options.preserve_permissions.value_or(true),
        std::clamp(options.compression_level.value_or(6), 0, 9),
        options.dry_run.value_or(false),
        options.max_size_bytes.value_or(ArchiveOperationsTool::kDefaultMaxSizeBytes),
        EntryFilter(options.include_patterns.value_or(std::vector<std::string>{}),
                    options.exclude_patterns.value_or(std::vector<std::string>{}))
    };
}

void append_processed(std::ostringstream& out, const std::vector<std::string>& processed) {
    if (processed.empty()) {
        return;
    }
    out << "\n\nProcessed files:";
    size_t shown = std::min(processed.size(), ArchiveOperationsTool::kMaxListedFiles);
    for (size_t i = 0; i < shown; ++i) {
        out << "\n" << processed[i];
    }
    if (processed.size() > shown) {
        out << "\n... and " << (processed.size() - shown) << " more files";
    }
}

void append_errors(std::ostringstream& out, const std::vector<std::string>& errors) {
    if (errors.empty()) {
        return;
    }
    out << "\n\nErrors:";
    for (const auto& error : errors) {
        out << "\n" << error;
    }
}

ToolResponse report(const std::ostringstream& out, bool failed) {
    return failed ? ToolResponse::error(out.str()) : ToolResponse::success(out.str());
}

// Empty optional when the archive is present and has a supported name
std::optional<ToolResponse> check_archive_file(const fs::path& path, const std::string& given) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return ToolResponse::error("Archive file not found: " + given);
    }
    if (archive_format_for(path) == ArchiveFormat::Unsupported) {
        return ToolResponse::error("Unsupported archive format: " + path.extension().string());
    }
    return std::nullopt;
}

void configure_writer(archive* writer, ArchiveFormat format, int level) {
    switch (format) {
        case ArchiveFormat::Zip:
            check(writer, archive_write_set_format_zip(writer), "Failed to select zip format");
            if (level == 0) {
                check(writer, archive_write_set_options(writer, "zip:compression=store"),
                      "Failed to set zip compression");
            } else {
                std::string option = "zip:compression-level=" + std::to_string(level);
                check(writer, archive_write_set_options(writer, option.c_str()),
                      "Failed to set zip compression level");
            }
            break;
        case ArchiveFormat::TarGzip: {
            check(writer, archive_write_set_format_pax_restricted(writer), "Failed to select tar format");
            check(writer, archive_write_add_filter_gzip(writer), "Failed to enable gzip");
            std::string option = "gzip:compression-level=" + std::to_string(std::max(level, 1));
            check(writer, archive_write_set_options(writer, option.c_str()),
                  "Failed to set gzip compression level");
            break;
        }
        case ArchiveFormat::Tar:
            check(writer, archive_write_set_format_pax_restricted(writer), "Failed to select tar format");
            break;
        case ArchiveFormat::Unsupported:
            throw std::invalid_argument("Unsupported archive format");
    }
}

struct SourceFile {
    fs::path path;
    std::string name;
    std::int64_t size;
};

void write_file_entry(archive* writer, const SourceFile& file, const CancellationToken& token) {
    ArchiveEntryPtr entry(archive_entry_new());
    if (!entry) {
        throw std::runtime_error("Failed to allocate archive entry");
    }

    auto status = fs::status(file.path);
    archive_entry_set_pathname(entry.get(), file.name.c_str());
    archive_entry_set_size(entry.get(), file.size);
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), static_cast<mode_t>(status.permissions() & fs::perms::all));
    archive_entry_set_mtime(entry.get(), to_time_t(fs::last_write_time(file.path)), 0);
    check(writer, archive_write_header(writer, entry.get()), "Failed to add " + file.name);

    std::ifstream in(file.path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open file for reading: " + file.path.string());
    }
    std::vector<char> buffer(kBlockSize);
    while (in) {
        token.throw_if_cancelled();
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize count = in.gcount();
        if (count <= 0) {
            break;
        }
        if (archive_write_data(writer, buffer.data(), static_cast<size_t>(count)) < 0) {
            throw std::runtime_error("Failed to write " + file.name + ": " + error_text(writer));
        }
    }
    if (in.bad()) {
        throw std::runtime_error("Failed to read " + file.path.string());
    }
}

} // namespace

std::optional<ArchiveOperation> parse_archive_operation(const std::string& name) {
    std::string lowered = to_lower(name);
    if (lowered == "extract") return ArchiveOperation::Extract;
    if (lowered == "create") return ArchiveOperation::Create;
    if (lowered == "list") return ArchiveOperation::List;
    if (lowered == "test") return ArchiveOperation::Test;
    if (lowered == "info") return ArchiveOperation::Info;
    return std::nullopt;
}

ArchiveFormat archive_format_for(const fs::path& path) {
    std::string name = to_lower(path.filename().string());
    if (ends_with(name, ".zip")) return ArchiveFormat::Zip;
    if (ends_with(name, ".tar.gz") || ends_with(name, ".tgz")) return ArchiveFormat::TarGzip;
    if (ends_with(name, ".tar")) return ArchiveFormat::Tar;
    return ArchiveFormat::Unsupported;
}

bool is_safe_entry_name(const std::string& name) {
    if (name.empty() || name.front() == '/' || name.find('\\') != std::string::npos) {
        return false;
    }
    if (name.size() > 1 && name[1] == ':') {
        return false;
    }
    for (const auto& part : fs::path(name)) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

TypeShape ArchiveOptions::shape() {
    return ObjectShape("Options for the archive operation")
        .field("overwrite", &ArchiveOptions::overwrite,
               FieldOptions().with_description("Overwrite existing files (default false)"))
        .field("preservePermissions", &ArchiveOptions::preserve_permissions,
               FieldOptions().with_description("Restore permission bits on extract (default true)"))
        .field("compressionLevel", &ArchiveOptions::compression_level,
               FieldOptions().with_minimum(0).with_maximum(9)
                   .with_description("Compression level 0-9 for create (default 6)"))
        .field("dryRun", &ArchiveOptions::dry_run,
               FieldOptions().with_description("Report what would happen without writing (default false)"))
        .field("maxSizeBytes", &ArchiveOptions::max_size_bytes,
               FieldOptions().with_minimum(0)
                   .with_description("Limit on total uncompressed bytes (default 1 GiB)"))
        .field("includePatterns", &ArchiveOptions::include_patterns,
               FieldOptions().with_description("Wildcards selecting entries to process"))
        .field("excludePatterns", &ArchiveOptions::exclude_patterns,
               FieldOptions().with_description("Wildcards selecting entries to skip"))
        .build();
}

namespace {

template <typename T>
void read_optional(const json& j, const char* key, std::optional<T>& value) {
    value.reset();
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        value = it->template get<T>();
    }
}

} // namespace

void from_json(const json& j, ArchiveOptions& options) {
    read_optional(j, "overwrite", options.overwrite);
    read_optional(j, "preservePermissions", options.preserve_permissions);
    read_optional(j, "compressionLevel", options.compression_level);
    read_optional(j, "dryRun", options.dry_run);
    read_optional(j, "maxSizeBytes", options.max_size_bytes);
    read_optional(j, "includePatterns", options.include_patterns);
    read_optional(j, "excludePatterns", options.exclude_patterns);
}

TypeShape ArchiveOperationArgs::shape() {
    return ObjectShape()
        .field("operation", &ArchiveOperationArgs::operation,
               FieldOptions().with_required().with_min_length(1)
                   .with_description("Operation: 'extract', 'create', 'list', 'test' or 'info'"))
        .field("archivePath", &ArchiveOperationArgs::archive_path,
               FieldOptions().with_description("Archive to read (extract, list, test, info)"))
        .field("sourcePath", &ArchiveOperationArgs::source_path,
               FieldOptions().with_description("File or directory to compress (create)"))
        .field("archiveOutputPath", &ArchiveOperationArgs::archive_output_path,
               FieldOptions().with_description("Archive to write (create)"))
        .field("extractToPath", &ArchiveOperationArgs::extract_to_path,
               FieldOptions().with_description("Destination directory (extract)"))
        .field("options", &ArchiveOperationArgs::options)
        .build();
}

void from_json(const json& j, ArchiveOperationArgs& args) {
    args.operation = j.at("operation").get<std::string>();
    read_optional(j, "archivePath", args.archive_path);
    read_optional(j, "sourcePath", args.source_path);
    read_optional(j, "archiveOutputPath", args.archive_output_path);
    read_optional(j, "extractToPath", args.extract_to_path);
    read_optional(j, "options", args.options);
}

ArchiveOperationsTool::ArchiveOperationsTool(std::shared_ptr<const PathGuard> guard)
    : guard_(std::move(guard)) {
    if (!guard_) {
        throw std::invalid_argument("PathGuard cannot be null");
    }
}

std::shared_ptr<ITool> ArchiveOperationsTool::create(std::shared_ptr<const PathGuard> guard) {
    auto tool = std::make_shared<ArchiveOperationsTool>(std::move(guard));
    return make_typed_tool<ArchiveOperationArgs>(
        kName,
        "Work with zip and tar archives: 'extract' unpacks an archive into a directory, "
        "'create' compresses a file or directory, 'list' shows the contents, 'test' verifies "
        "every entry can be read and 'info' summarizes the archive. Entries that would land "
        "outside the destination are rejected. Only works within allowed directories.",
        [tool](const ArchiveOperationArgs& args, const CancellationToken& token) {
            return tool->execute(args, token);
        },
        [](const ArchiveOperationArgs& args) -> std::optional<std::string> {
            if (args.operation.empty()) {
                return std::string("operation must not be empty");
            }
            return std::nullopt;
        });
}

ToolResponse ArchiveOperationsTool::execute(const ArchiveOperationArgs& args,
                                            const CancellationToken& token) const {
    token.throw_if_cancelled();

    auto operation = parse_archive_operation(args.operation);
    if (!operation) {
        return ToolResponse::error("Unknown archive operation: " + args.operation);
    }

    try {
        switch (*operation) {
            case ArchiveOperation::Extract: return extract(args, token);
            case ArchiveOperation::Create: return create_archive(args, token);
            case ArchiveOperation::List: return list(args, token);
            case ArchiveOperation::Test: return test(args, token);
            case ArchiveOperation::Info: return info(args, token);
        }
        return ToolResponse::error("Unknown archive operation: " + args.operation);
    } catch (const OperationCancelled&) {
        throw;
    } catch (const std::exception& e) {
        return ToolResponse::error(std::string("Archive operation failed: ") + e.what());
    }
}

ToolResponse ArchiveOperationsTool::extract(const ArchiveOperationArgs& args,
                                            const CancellationToken& token) const {
    if (!args.archive_path || !args.extract_to_path) {
        return ToolResponse::error(
            "Archive path and extract destination path are required for extract operation");
    }

    fs::path archive_path = guard_->validate(*args.archive_path);
    fs::path destination = guard_->validate(*args.extract_to_path);
    if (auto problem = check_archive_file(archive_path, *args.archive_path)) {
        return *problem;
    }

    EffectiveOptions options = effective_options(args.options);
    if (!options.dry_run) {
        fs::create_directories(destination);
    }

    ArchiveReader reader = open_reader(archive_path);
    archive_entry* entry = nullptr;

    size_t extracted = 0;
    size_t skipped = 0;
    std::int64_t total_bytes = 0;
    std::vector<std::string> processed;
    std::vector<std::string> errors;

    while (next_entry(reader.get(), &entry)) {
        token.throw_if_cancelled();

        const char* raw_name = archive_entry_pathname(entry);
        std::string name = raw_name ? raw_name : "";
        auto type = archive_entry_filetype(entry);

        // directories are recreated from the file paths below them
        if (type == AE_IFDIR) {
            continue;
        }
        if (!options.filter.accepts(name)) {
            skipped++;
            continue;
        }
        if (!is_safe_entry_name(name)) {
            errors.push_back("Unsafe path detected: " + name);
            continue;
        }

        fs::path target = (destination / fs::path(name)).lexically_normal();
        fs::path relative = target.lexically_relative(destination);
        if (relative.empty() || *relative.begin() == ".." || !guard_->is_allowed(target.string())) {
            errors.push_back("Unsafe path detected: " + name);
            continue;
        }

        if (type != AE_IFREG) {
            skipped++;
            processed.push_back("Skipped: " + name + " (not a regular file)");
            continue;
        }

        std::int64_t declared = archive_entry_size_is_set(entry) ? archive_entry_size(entry) : 0;
        if (total_bytes + declared > options.max_size_bytes) {
            errors.push_back("Size limit exceeded at " + name + ": limit is " +
                             std::to_string(options.max_size_bytes) + " bytes");
            break;
        }

        std::error_code ec;
        if (fs::exists(target, ec) && !options.overwrite) {
            skipped++;
            processed.push_back("Skipped: " + name + " (file exists)");
            continue;
        }

        if (options.dry_run) {
            extracted++;
            total_bytes += declared;
            processed.push_back("[DRY RUN] Would extract: " + name + " -> " + target.string());
            continue;
        }

        try {
            fs::create_directories(target.parent_path());
            std::ofstream out(target, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw std::runtime_error("cannot open " + target.string() + " for writing");
            }

            std::int64_t remaining = options.max_size_bytes - total_bytes;
            std::int64_t written = read_entry_data(
                reader.get(),
                [&out, remaining](const char* data, size_t count, std::int64_t so_far) {
                    if (so_far + static_cast<std::int64_t>(count) > remaining) {
                        throw SizeLimitExceeded("limit reached while writing");
                    }
                    out.write(data, static_cast<std::streamsize>(count));
                },
                token);
            out.close();
            if (!out) {
                throw std::runtime_error("failed writing " + target.string());
            }

            if (options.preserve_permissions) {
                auto perm = archive_entry_perm(entry) & 0777;
                if (perm != 0) {
                    fs::permissions(target, static_cast<fs::perms>(perm), ec);
                }
            }

            extracted++;
            total_bytes += written;
            processed.push_back("Extracted: " + name);
        } catch (const OperationCancelled&) {
            throw;
        } catch (const SizeLimitExceeded&) {
            fs::remove(target, ec);
            errors.push_back("Size limit exceeded at " + name + ": limit is " +
                             std::to_string(options.max_size_bytes) + " bytes");
            break;
        } catch (const std::exception& e) {
            fs::remove(target, ec);
            errors.push_back("Failed to extract " + name + ": " + e.what());
        }
    }

    spdlog::info("Extracted {} entries ({} bytes) from {}", extracted, total_bytes, archive_path.string());

    std::ostringstream out;
    out << (options.dry_run ? "[DRY RUN] Would extract " : "Extracted ") << extracted
        << " files (" << total_bytes << " bytes), skipped " << skipped;
    append_processed(out, processed);
    append_errors(out, errors);
    return report(out, !errors.empty());
}

ToolResponse ArchiveOperationsTool::create_archive(const ArchiveOperationArgs& args,
                                                   const CancellationToken& token) const {
    if (!args.source_path || !args.archive_output_path) {
        return ToolResponse::error("Source path and archive output path are required for create operation");
    }

    fs::path source = guard_->validate(*args.source_path);
    fs::path output = guard_->validate(*args.archive_output_path);

    std::error_code ec;
    if (!fs::exists(source, ec)) {
        return ToolResponse::error("Source path not found: " + *args.source_path);
    }
    ArchiveFormat format = archive_format_for(output);
    if (format == ArchiveFormat::Unsupported) {
        return ToolResponse::error("Unsupported archive format: " + output.extension().string());
    }

    EffectiveOptions options = effective_options(args.options);
    if (fs::exists(output, ec) && !options.overwrite) {
        return ToolResponse::error("Archive already exists: " + *args.archive_output_path +
                                   " (set overwrite to replace it)");
    }

    std::vector<SourceFile> files;
    std::int64_t total_bytes = 0;

    if (fs::is_regular_file(source)) {
        auto size = static_cast<std::int64_t>(fs::file_size(source));
        files.push_back({source, source.filename().string(), size});
        total_bytes += size;
    } else {
        fs::recursive_directory_iterator it(source, fs::directory_options::skip_permission_denied);
        for (; it != fs::recursive_directory_iterator(); ++it) {
            token.throw_if_cancelled();

            // symbolic links are neither followed nor stored
            if (it->is_symlink(ec) || !it->is_regular_file(ec) || it->path() == output) {
                continue;
            }
            std::string name = it->path().lexically_relative(source).generic_string();
            if (!options.filter.accepts(name)) {
                continue;
            }

            auto size = static_cast<std::int64_t>(it->file_size());
            files.push_back({it->path(), name, size});
            total_bytes += size;
        }
        std::sort(files.begin(), files.end(),
                  [](const SourceFile& a, const SourceFile& b) { return a.name < b.name; });
    }

    if (files.empty()) {
        return ToolResponse::error("No files found to compress");
    }
    if (total_bytes > options.max_size_bytes) {
        return ToolResponse::error("Source size " + std::to_string(total_bytes) +
                                   " bytes exceeds limit of " + std::to_string(options.max_size_bytes) +
                                   " bytes");
    }

    std::vector<std::string> processed;
    processed.reserve(files.size());

    if (!options.dry_run) {
        try {
            ArchiveWriter writer(archive_write_new());
            if (!writer) {
                throw std::runtime_error("Failed to allocate archive writer");
            }
            configure_writer(writer.get(), format, options.compression_level);
            check(writer.get(), archive_write_open_filename(writer.get(), output.string().c_str()),
                  "Failed to create archive " + output.string());

            for (const auto& file : files) {
                write_file_entry(writer.get(), file, token);
                processed.push_back("Added: " + file.name + " (" + std::to_string(file.size) + " bytes)");
            }
            check(writer.get(), archive_write_close(writer.get()), "Failed to finish archive");
        } catch (...) {
            fs::remove(output, ec);
            throw;
        }
    } else {
        for (const auto& file : files) {
            processed.push_back("[DRY RUN] Would add: " + file.name + " (" + std::to_string(file.size) + " bytes)");
        }
    }

    spdlog::info("Archived {} files ({} bytes) into {}", files.size(), total_bytes, output.string());

    std::ostringstream out;
    out << (options.dry_run ? "[DRY RUN] Would create archive with " : "Created archive with ")
        << files.size() << " files (" << total_bytes << " bytes)"
        << "\nArchive path: " << output.string()
        << "\nCompression level: " << options.compression_level;
    append_processed(out, processed);
    return ToolResponse::success(out.str());
}

ToolResponse ArchiveOperationsTool::list(const ArchiveOperationArgs& args,
                                         const CancellationToken& token) const {
    if (!args.archive_path) {
        return ToolResponse::error("Archive path is required for list operation");
    }

    fs::path archive_path = guard_->validate(*args.archive_path);
    if (auto problem = check_archive_file(archive_path, *args.archive_path)) {
        return *problem;
    }

    ArchiveReader reader = open_reader(archive_path);
    archive_entry* entry = nullptr;

    size_t file_count = 0;
    std::int64_t total_bytes = 0;
    std::ostringstream contents;

    while (next_entry(reader.get(), &entry)) {
        token.throw_if_cancelled();

        const char* raw_name = archive_entry_pathname(entry);
        std::string name = raw_name ? raw_name : "";
        contents << "\n" << std::left << std::setw(60) << name << " ";

        if (archive_entry_filetype(entry) == AE_IFDIR) {
            contents << std::setw(16) << "<DIR>";
        } else {
            std::int64_t size = archive_entry_size_is_set(entry) ? archive_entry_size(entry) : 0;
            file_count++;
            total_bytes += size;
            contents << std::setw(16) << (std::to_string(size) + " bytes");
        }
        if (archive_entry_mtime_is_set(entry)) {
            contents << " " << format_utc(archive_entry_mtime(entry));
        }
    }

    const char* format_name = archive_format_name(reader.get());
    auto compressed = static_cast<std::int64_t>(fs::file_size(archive_path));

    std::ostringstream out;
    out << "Archive: " << archive_path.string()
        << "\nFormat: " << (format_name ? format_name : "unknown")
        << "\nTotal files: " << file_count
        << "\nTotal size: " << total_bytes << " bytes"
        << "\nCompressed size: " << compressed << " bytes"
        << "\nCompression ratio: " << format_ratio(total_bytes, compressed)
        << "\n\nContents:\n" << std::string(100, '-')
        << contents.str();
    return ToolResponse::success(out.str());
}

ToolResponse ArchiveOperationsTool::test(const ArchiveOperationArgs& args,
                                         const CancellationToken& token) const {
    if (!args.archive_path) {
        return ToolResponse::error("Archive path is required for test operation");
    }

    fs::path archive_path = guard_->validate(*args.archive_path);
    if (auto problem = check_archive_file(archive_path, *args.archive_path)) {
        return *problem;
    }

    ArchiveReader reader = open_reader(archive_path);
    archive_entry* entry = nullptr;

    size_t file_count = 0;
    size_t tested = 0;
    std::vector<std::string> errors;

    for (;;) {
        try {
            if (!next_entry(reader.get(), &entry)) {
                break;
            }
        } catch (const std::runtime_error& e) {
            // a damaged header leaves the reader unusable
            errors.push_back(e.what());
            break;
        }

        if (archive_entry_filetype(entry) != AE_IFREG) {
            continue;
        }
        file_count++;

        const char* raw_name = archive_entry_pathname(entry);
        std::string name = raw_name ? raw_name : "";
        try {
            std::int64_t read = read_entry_data(
                reader.get(), [](const char*, size_t, std::int64_t) {}, token);
            if (archive_entry_size_is_set(entry) && read != archive_entry_size(entry)) {
                errors.push_back(name + ": expected " + std::to_string(archive_entry_size(entry)) +
                                 " bytes, read " + std::to_string(read));
            } else {
                tested++;
            }
        } catch (const OperationCancelled&) {
            throw;
        } catch (const std::runtime_error& e) {
            errors.push_back(name + ": " + e.what());
        }
    }

    std::ostringstream out;
    out << "Archive: " << archive_path.string()
        << "\nTotal files: " << file_count
        << "\nFiles tested: " << tested
        << "\nFiles with errors: " << errors.size()
        << "\nArchive integrity: " << (errors.empty() ? "OK" : "FAILED");
    append_errors(out, errors);
    return report(out, !errors.empty());
}

ToolResponse ArchiveOperationsTool::info(const ArchiveOperationArgs& args,
                                         const CancellationToken& token) const {
    if (!args.archive_path) {
        return ToolResponse::error("Archive path is required for info operation");
    }

    fs::path archive_path = guard_->validate(*args.archive_path);
    if (auto problem = check_archive_file(archive_path, *args.archive_path)) {
        return *problem;
    }

    ArchiveReader reader = open_reader(archive_path);
    archive_entry* entry = nullptr;

    size_t file_count = 0;
    size_t directory_count = 0;
    std::int64_t total_bytes = 0;
    std::optional<std::time_t> oldest;
    std::optional<std::time_t> newest;

    while (next_entry(reader.get(), &entry)) {
        token.throw_if_cancelled();

        if (archive_entry_filetype(entry) == AE_IFDIR) {
            directory_count++;
        } else {
            file_count++;
            total_bytes += archive_entry_size_is_set(entry) ? archive_entry_size(entry) : 0;
        }

        if (archive_entry_mtime_is_set(entry)) {
            std::time_t mtime = archive_entry_mtime(entry);
            oldest = oldest ? std::min(*oldest, mtime) : mtime;
            newest = newest ? std::max(*newest, mtime) : mtime;
        }
    }

    const char* format_name = archive_format_name(reader.get());
    auto compressed = static_cast<std::int64_t>(fs::file_size(archive_path));

    std::ostringstream out;
    out << "Archive: " << archive_path.string()
        << "\nFormat: " << (format_name ? format_name : "unknown")
        << "\nArchive size: " << compressed << " bytes"
        << "\nModified: " << format_utc(to_time_t(fs::last_write_time(archive_path)))
        << "\n\nFiles: " << file_count
        << "\nDirectories: " << directory_count
        << "\nUncompressed size: " << total_bytes << " bytes"
        << "\nCompressed size: " << compressed << " bytes"
        << "\nCompression ratio: " << format_ratio(total_bytes, compressed);
    if (oldest && newest) {
        out << "\nOldest entry: " << format_utc(*oldest)
            << "\nNewest entry: " << format_utc(*newest);
    }
    return ToolResponse::success(out.str());
}

} // namespace mcpkit
