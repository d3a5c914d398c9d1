#pragma once

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <utility>

namespace homematch::test {

// RAII helper to set (or unset, with nullopt) an environment variable and restore it
class EnvGuard {
public:
    EnvGuard(std::string name, std::optional<std::string> value) : name_(std::move(name)) {
        if (const char* orig = std::getenv(name_.c_str())) {
            original_ = orig;
        }
        if (value) {
            ::setenv(name_.c_str(), value->c_str(), 1);
        } else {
            ::unsetenv(name_.c_str());
        }
    }

    ~EnvGuard() {
        if (original_) {
            ::setenv(name_.c_str(), original_->c_str(), 1);
        } else {
            ::unsetenv(name_.c_str());
        }
    }

    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

private:
    std::string name_;
    std::optional<std::string> original_;
};

// Scratch directory removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        path_ = std::filesystem::temp_directory_path() /
                (prefix + std::to_string(
                              std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path write(const std::string& filename, const std::string& content) const {
        auto file = path_ / filename;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file);
        out << content;
        return file;
    }

private:
    std::filesystem::path path_;
};

} // namespace homematch::test
