#pragma once

#include <filesystem>
#include <string>

namespace snipguard::utils {

// Private working directory created with mkdtemp and removed recursively on destruction.
class ScopedTempDir {
public:
    ScopedTempDir(const std::filesystem::path& root, const std::string& prefix);
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace snipguard::utils
