#ifndef FILENAME_SCANNER_HPP
#define FILENAME_SCANNER_HPP

#include "Types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace spdlog { class logger; }

struct ScanOptions {
    std::size_t max_files{10000};
    bool include_hidden{false};
    std::set<std::string> excluded_names{".ds_store", ".localized", ".gitignore", ".gitattributes"};
    std::set<std::string> excluded_directories{"node_modules", ".git", ".svn", "__pycache__", ".cache", "build", "dist"};
    std::uintmax_t min_file_size{100};
    // Sub-folders with fewer files than this are flattened into loose files.
    std::size_t min_files_for_folder{1};
};

struct ScannedFolder {
    std::string name;
    std::string path;
    std::string relative_path;
    std::vector<ScannedFile> files;
    std::uintmax_t total_size{0};
};

struct ScanResult {
    std::string folder_path;
    std::string folder_name;
    std::vector<ScannedFile> files;
    std::size_t skipped{0};
    bool reached_limit{false};
};

struct HierarchyScanResult {
    std::string folder_path;
    std::string folder_name;
    std::vector<ScannedFolder> folders;
    std::vector<ScannedFile> loose_files;
    std::size_t skipped{0};
    bool reached_limit{false};

    std::size_t total_files() const;
    // Folder contents followed by loose files.
    std::vector<ScannedFile> all_files() const;
};

class FilenameScanner {
public:
    explicit FilenameScanner(ScanOptions options = ScanOptions(),
                             std::shared_ptr<spdlog::logger> logger = nullptr);

    // Throws ScanError when the root is missing or not a directory.
    ScanResult scan(const std::string& root) const;
    HierarchyScanResult scan_with_hierarchy(const std::string& root) const;

    // Stable across runs: derived from the path relative to the scan root.
    static std::string file_id_for(const std::string& relative_path);

    const ScanOptions& options() const { return options_; }

private:
    std::filesystem::path validate_root(const std::string& root) const;
    bool is_hidden(const std::filesystem::path& path) const;
    bool accept_file(const std::filesystem::directory_entry& entry) const;
    ScannedFile make_scanned_file(const std::filesystem::directory_entry& entry,
                                  const std::filesystem::path& root) const;
    std::vector<ScannedFile> collect(const std::filesystem::path& directory,
                                     const std::filesystem::path& root,
                                     std::size_t limit,
                                     std::size_t& skipped) const;

    ScanOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif
