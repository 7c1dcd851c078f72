#pragma once

#include "Types.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <string>
#include <utility>

class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        std::random_device rd;
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("file-taxonomy-test-" + std::to_string(stamp) + "-" +
                 std::to_string(rd()) + "-" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path write_file(const std::string& relative, const std::string& contents) const {
        const auto target = path_ / relative;
        std::filesystem::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out << contents;
        return target;
    }

private:
    std::filesystem::path path_;
};

class EnvVarGuard {
public:
    EnvVarGuard(std::string key, std::optional<std::string> value)
        : key_(std::move(key)) {
        if (const char* existing = std::getenv(key_.c_str())) {
            previous_ = std::string(existing);
        }
        apply(value);
    }

    ~EnvVarGuard() {
        apply(previous_);
    }

    EnvVarGuard(const EnvVarGuard&) = delete;
    EnvVarGuard& operator=(const EnvVarGuard&) = delete;

private:
    void apply(const std::optional<std::string>& value) {
        if (value) {
            setenv(key_.c_str(), value->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

    std::string key_;
    std::optional<std::string> previous_;
};

inline ScannedFile make_scanned_file(const std::string& name,
                                     const std::string& relative_dir = std::string())
{
    ScannedFile file;
    file.name = name;
    file.relative_path = relative_dir.empty() ? name : relative_dir + "/" + name;
    file.id = "id-" + file.relative_path;
    file.path = "/data/" + file.relative_path;
    const auto dot = name.rfind('.');
    if (dot != std::string::npos) {
        file.extension = name.substr(dot + 1);
    }
    file.size = 1024;
    return file;
}
