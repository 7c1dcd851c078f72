#include "FilenameScanner.hpp"
#include "TaxonomyErrors.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {

TimePoint to_time_point(fs::file_time_type ftime)
{
    return std::chrono::time_point_cast<Clock::duration>(std::chrono::file_clock::to_sys(ftime));
}

void sort_by_relative_path(std::vector<ScannedFile>& files)
{
    std::sort(files.begin(), files.end(), [](const ScannedFile& a, const ScannedFile& b) {
        return a.relative_path < b.relative_path;
    });
}

} // namespace

std::size_t HierarchyScanResult::total_files() const
{
    std::size_t total = loose_files.size();
    for (const auto& folder : folders) {
        total += folder.files.size();
    }
    return total;
}

std::vector<ScannedFile> HierarchyScanResult::all_files() const
{
    std::vector<ScannedFile> files;
    files.reserve(total_files());
    for (const auto& folder : folders) {
        files.insert(files.end(), folder.files.begin(), folder.files.end());
    }
    files.insert(files.end(), loose_files.begin(), loose_files.end());
    return files;
}

FilenameScanner::FilenameScanner(ScanOptions options, std::shared_ptr<spdlog::logger> logger)
    : options_(std::move(options)),
      logger_(std::move(logger))
{
}

std::string FilenameScanner::file_id_for(const std::string& relative_path)
{
    return Utils::fnv1a_hex(relative_path);
}

fs::path FilenameScanner::validate_root(const std::string& root) const
{
    std::error_code ec;
    const fs::path path(root);
    if (!fs::exists(path, ec)) {
        throw ScanError(ScanError::Kind::FolderNotFound, "Folder not found: " + root);
    }
    if (!fs::is_directory(path, ec)) {
        throw ScanError(ScanError::Kind::NotADirectory, "Not a directory: " + root);
    }
    fs::directory_iterator probe(path, ec);
    if (ec) {
        throw ScanError(ScanError::Kind::AccessDenied, "Cannot read " + root + ": " + ec.message());
    }
    fs::path absolute = fs::absolute(path, ec).lexically_normal();
    if (!absolute.has_filename()) {
        absolute = absolute.parent_path();
    }
    return absolute;
}

bool FilenameScanner::is_hidden(const fs::path& path) const
{
    const std::string name = path.filename().string();
    return !name.empty() && name.front() == '.';
}

bool FilenameScanner::accept_file(const fs::directory_entry& entry) const
{
    std::error_code ec;
    if (!entry.is_regular_file(ec)) {
        return false;
    }
    if (!options_.include_hidden && is_hidden(entry.path())) {
        return false;
    }
    const std::string lowered = Utils::to_lower_copy(entry.path().filename().string());
    const std::string extension = Utils::to_lower_copy(entry.path().extension().string());
    if (options_.excluded_names.count(lowered) || (!extension.empty() && options_.excluded_names.count(extension))) {
        return false;
    }
    const auto size = entry.file_size(ec);
    return !ec && size >= options_.min_file_size;
}

ScannedFile FilenameScanner::make_scanned_file(const fs::directory_entry& entry, const fs::path& root) const
{
    std::error_code ec;
    ScannedFile file;
    file.relative_path = entry.path().lexically_relative(root).generic_string();
    file.id = file_id_for(file.relative_path);
    file.name = entry.path().filename().string();
    file.path = entry.path().string();
    std::string extension = entry.path().extension().string();
    if (!extension.empty() && extension.front() == '.') {
        extension.erase(extension.begin());
    }
    file.extension = Utils::to_lower_copy(extension);
    file.size = entry.file_size(ec);
    const auto modified = entry.last_write_time(ec);
    if (!ec) {
        file.modified_at = to_time_point(modified);
        // std::filesystem exposes no creation time.
        file.created_at = file.modified_at;
    }
    return file;
}

std::vector<ScannedFile> FilenameScanner::collect(const fs::path& directory,
                                                  const fs::path& root,
                                                  std::size_t limit,
                                                  std::size_t& skipped) const
{
    std::vector<ScannedFile> files;
    std::error_code ec;
    fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        if (logger_) {
            logger_->warn("Cannot enumerate '{}': {}", directory.string(), ec.message());
        }
        return files;
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            if (logger_) {
                logger_->warn("Enumeration error under '{}': {}", directory.string(), ec.message());
            }
            break;
        }
        const auto& entry = *it;
        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            const std::string name = entry.path().filename().string();
            if (options_.excluded_directories.count(name) || (!options_.include_hidden && is_hidden(entry.path()))) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (files.size() >= limit) {
            break;
        }
        if (!accept_file(entry)) {
            ++skipped;
            continue;
        }
        files.push_back(make_scanned_file(entry, root));
    }
    sort_by_relative_path(files);
    return files;
}

ScanResult FilenameScanner::scan(const std::string& root) const
{
    const fs::path root_path = validate_root(root);
    ScanResult result;
    result.folder_path = root_path.string();
    result.folder_name = root_path.filename().string();
    result.files = collect(root_path, root_path, options_.max_files, result.skipped);
    result.reached_limit = result.files.size() >= options_.max_files;

    if (logger_) {
        logger_->info("Scanned '{}': {} files, {} skipped{}", result.folder_name, result.files.size(),
                      result.skipped, result.reached_limit ? " (file limit reached)" : "");
    }
    return result;
}

HierarchyScanResult FilenameScanner::scan_with_hierarchy(const std::string& root) const
{
    const fs::path root_path = validate_root(root);
    HierarchyScanResult result;
    result.folder_path = root_path.string();
    result.folder_name = root_path.filename().string();

    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(root_path, fs::directory_options::skip_permission_denied, ec)) {
        entries.push_back(entry);
    }
    std::sort(entries.begin(), entries.end(), [](const fs::directory_entry& a, const fs::directory_entry& b) {
        return a.path().filename() < b.path().filename();
    });

    for (const auto& entry : entries) {
        const std::size_t used = result.total_files();
        if (used >= options_.max_files) {
            result.reached_limit = true;
            if (logger_) {
                logger_->warn("Reached file limit of {}", options_.max_files);
            }
            break;
        }

        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            const std::string name = entry.path().filename().string();
            if (options_.excluded_directories.count(name) || (!options_.include_hidden && is_hidden(entry.path()))) {
                ++result.skipped;
                continue;
            }
            ScannedFolder folder;
            folder.name = name;
            folder.path = entry.path().string();
            folder.relative_path = entry.path().lexically_relative(root_path).generic_string();
            folder.files = collect(entry.path(), root_path, options_.max_files - used, result.skipped);
            for (const auto& file : folder.files) {
                folder.total_size += file.size;
            }

            if (folder.files.empty()) {
                continue;
            }
            if (folder.files.size() >= options_.min_files_for_folder) {
                if (logger_) {
                    logger_->debug("Folder unit '{}' ({} files)", folder.name, folder.files.size());
                }
                result.folders.push_back(std::move(folder));
            } else {
                if (logger_) {
                    logger_->debug("Flattening folder '{}' ({} files below threshold)", folder.name, folder.files.size());
                }
                result.loose_files.insert(result.loose_files.end(), folder.files.begin(), folder.files.end());
            }
            continue;
        }

        if (!accept_file(entry)) {
            ++result.skipped;
            continue;
        }
        result.loose_files.push_back(make_scanned_file(entry, root_path));
    }

    if (result.total_files() >= options_.max_files) {
        result.reached_limit = true;
    }
    if (logger_) {
        logger_->info("Hierarchy scan of '{}': {} folders, {} loose files, {} total",
                      result.folder_name, result.folders.size(), result.loose_files.size(), result.total_files());
    }
    return result;
}
