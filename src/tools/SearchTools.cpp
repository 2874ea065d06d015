#include "SearchTools.hpp"
#include "mcp/TypedTool.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace mcpkit {

namespace fs = std::filesystem;

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string escape_regex(const std::string& text) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string escaped;
    for (char c : text) {
        if (special.find(c) != std::string::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

bool is_excluded(const fs::path& relative, const std::vector<std::string>& excludes) {
    for (const auto& part : relative) {
        std::string component = to_lower(part.string());
        for (const auto& exclude : excludes) {
            if (component == to_lower(exclude)) {
                return true;
            }
        }
    }
    return false;
}

std::string format_time(fs::file_time_type time) {
    // file_time_type has no portable conversion in C++17; shift by the clocks' offset
    auto system_time = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        time - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    std::time_t seconds = std::chrono::system_clock::to_time_t(system_time);

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

} // namespace

SearchPatternType parse_search_pattern_type(const std::string& name) {
    std::string lowered = to_lower(name);
    if (lowered == "simple") return SearchPatternType::Simple;
    if (lowered == "wildcard") return SearchPatternType::Wildcard;
    if (lowered == "regex") return SearchPatternType::Regex;
    throw std::invalid_argument("Unknown pattern type: " + name);
}

TypeShape SearchFilesArgs::shape() {
    return ObjectShape()
        .field("path", &SearchFilesArgs::path,
               FieldOptions().with_required().with_description("Starting directory for search"))
        .field("pattern", &SearchFilesArgs::pattern,
               FieldOptions()
                   .with_required()
                   .with_min_length(1)
                   .with_description("Search pattern - simple text, wildcard (* and ?), or regex "
                                     "depending on patternType"))
        .field("patternType", &SearchFilesArgs::pattern_type,
               FieldOptions().with_description("Type of pattern: 'simple' (default), 'wildcard', or 'regex'"))
        .field("excludePatterns", &SearchFilesArgs::exclude_patterns,
               FieldOptions().with_description("Path components to exclude from the search"))
        .build();
}

void from_json(const json& j, SearchFilesArgs& args) {
    args.path = j.at("path").get<std::string>();
    args.pattern = j.at("pattern").get<std::string>();

    args.pattern_type.reset();
    if (j.contains("patternType") && !j["patternType"].is_null()) {
        args.pattern_type = parse_search_pattern_type(j["patternType"].get<std::string>());
    }

    args.exclude_patterns.reset();
    if (j.contains("excludePatterns") && !j["excludePatterns"].is_null()) {
        args.exclude_patterns = j["excludePatterns"].get<std::vector<std::string>>();
    }
}

SearchFilesTool::SearchFilesTool(std::shared_ptr<const PathGuard> guard)
    : guard_(std::move(guard)) {
    if (!guard_) {
        throw std::invalid_argument("PathGuard cannot be null");
    }
}

std::shared_ptr<ITool> SearchFilesTool::create(std::shared_ptr<const PathGuard> guard) {
    auto tool = std::make_shared<SearchFilesTool>(std::move(guard));
    return make_typed_tool<SearchFilesArgs>(
        kName,
        "Recursively search for files and directories matching a pattern. "
        "Supports 'simple' (partial text match), 'wildcard' (* and ?) and 'regex' "
        "pattern types. The search is case-insensitive and returns full paths. "
        "Only searches within allowed directories.",
        [tool](const SearchFilesArgs& args, const CancellationToken& token) {
            return tool->execute(args, token);
        },
        [](const SearchFilesArgs& args) -> std::optional<std::string> {
            if (args.pattern.empty()) {
                return std::string("pattern must not be empty");
            }
            return std::nullopt;
        });
}

std::regex SearchFilesTool::make_matcher(const std::string& pattern, SearchPatternType type) {
    auto flags = std::regex::ECMAScript | std::regex::icase;

    switch (type) {
        case SearchPatternType::Wildcard: {
            std::string regex;
            for (char c : pattern) {
                if (c == '*') {
                    regex += ".*";
                } else if (c == '?') {
                    regex += '.';
                } else {
                    regex += escape_regex(std::string(1, c));
                }
            }
            return std::regex("^" + regex + "$", flags);
        }
        case SearchPatternType::Regex:
            return std::regex(pattern, flags);
        case SearchPatternType::Simple:
            break;
    }
    return std::regex(escape_regex(pattern), flags);
}

ToolResponse SearchFilesTool::execute(const SearchFilesArgs& args, const CancellationToken& token) const {
    try {
        auto root = guard_->validate(args.path);
        if (!fs::is_directory(root)) {
            throw std::runtime_error("Not a directory: " + args.path);
        }

        std::regex matcher = make_matcher(args.pattern,
                                          args.pattern_type.value_or(SearchPatternType::Simple));
        std::vector<std::string> excludes = args.exclude_patterns.value_or(std::vector<std::string>{});
        std::vector<std::string> results;

        search(root, root, matcher, excludes, results, token);

        if (results.empty()) {
            return ToolResponse::success("No matches found");
        }

        std::sort(results.begin(), results.end());
        std::string text;
        for (size_t i = 0; i < results.size(); ++i) {
            if (i > 0) {
                text += '\n';
            }
            text += results[i];
        }
        return ToolResponse::success(text);
    } catch (const OperationCancelled&) {
        throw;
    } catch (const std::exception& e) {
        return ToolResponse::error(std::string("Error during search: ") + e.what());
    }
}

void SearchFilesTool::search(const fs::path& directory,
                             const fs::path& root,
                             const std::regex& matcher,
                             const std::vector<std::string>& excludes,
                             std::vector<std::string>& results,
                             const CancellationToken& token) const {
    if (!guard_->is_allowed(directory.string())) {
        return;
    }

    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        spdlog::debug("Skipping unreadable directory {}: {}", directory.string(), ec.message());
        return;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::debug("Stopped listing {}: {}", directory.string(), ec.message());
            break;
        }
        token.throw_if_cancelled();

        const fs::path& entry = it->path();
        if (is_excluded(entry.lexically_relative(root), excludes)) {
            continue;
        }

        if (std::regex_search(entry.filename().string(), matcher)) {
            results.push_back(entry.string());
        }

        std::error_code status_ec;
        if (it->is_directory(status_ec) && !it->is_symlink(status_ec)) {
            search(entry, root, matcher, excludes, results, token);
        }
    }
}

TypeShape FileInfoArgs::shape() {
    return ObjectShape()
        .field("path", &FileInfoArgs::path,
               FieldOptions().with_required().with_description("Path to the file or directory"))
        .build();
}

void from_json(const json& j, FileInfoArgs& args) {
    args.path = j.at("path").get<std::string>();
}

GetFileInfoTool::GetFileInfoTool(std::shared_ptr<const PathGuard> guard)
    : guard_(std::move(guard)) {
    if (!guard_) {
        throw std::invalid_argument("PathGuard cannot be null");
    }
}

std::shared_ptr<ITool> GetFileInfoTool::create(std::shared_ptr<const PathGuard> guard) {
    auto tool = std::make_shared<GetFileInfoTool>(std::move(guard));
    return make_typed_tool<FileInfoArgs>(
        kName,
        "Retrieve metadata about a file or directory: size, last modified time, "
        "type and permissions. Only works within allowed directories.",
        [tool](const FileInfoArgs& args, const CancellationToken& token) {
            return tool->execute(args, token);
        });
}

ToolResponse GetFileInfoTool::execute(const FileInfoArgs& args, const CancellationToken& token) const {
    token.throw_if_cancelled();
    try {
        auto path = guard_->validate(args.path);

        auto status = fs::symlink_status(path);
        if (!fs::exists(status)) {
            throw std::runtime_error("Path not found: " + args.path);
        }

        bool is_directory = fs::is_directory(path);
        bool is_file = fs::is_regular_file(path);
        std::uintmax_t size = is_file ? fs::file_size(path) : 0;

        std::ostringstream permissions;
        permissions << std::oct << (static_cast<unsigned>(fs::status(path).permissions()) & 0777u);

        std::ostringstream details;
        details << "size: " << size << '\n'
                << "modified: " << format_time(fs::last_write_time(path)) << '\n'
                << "isDirectory: " << (is_directory ? "true" : "false") << '\n'
                << "isFile: " << (is_file ? "true" : "false") << '\n'
                << "isSymlink: " << (fs::is_symlink(status) ? "true" : "false") << '\n'
                << "permissions: " << permissions.str();

        return ToolResponse::success(details.str());
    } catch (const std::exception& e) {
        return ToolResponse::error(std::string("Error getting file info: ") + e.what());
    }
}

std::shared_ptr<ITool> ListAllowedDirectoriesTool::create(std::shared_ptr<const PathGuard> guard) {
    if (!guard) {
        throw std::invalid_argument("PathGuard cannot be null");
    }
    return std::make_shared<NoArgTool>(
        kName,
        "Returns the list of directories that this server is allowed to access. "
        "Use this to understand which directories are available before trying to access files.",
        [guard](const CancellationToken&) {
            std::string text = "Allowed directories:";
            for (const auto& directory : guard->allowed_directories()) {
                text += '\n';
                text += directory.string();
            }
            return ToolResponse::success(text);
        });
}

} // namespace mcpkit
