#include "utils/scoped_temp_dir.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>
#include <stdlib.h>

#include "utils/logging.hpp"

namespace snipguard::utils {

ScopedTempDir::ScopedTempDir(const std::filesystem::path& root, const std::string& prefix) {
    const auto base = root.empty() ? std::filesystem::temp_directory_path() : root;
    auto pattern = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw std::system_error(errno, std::generic_category(),
                                "mkdtemp failed for " + pattern);
    }
    path_ = std::filesystem::path(buffer.data());
}

ScopedTempDir::~ScopedTempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        Log(LogLevel::kWarn, "sandbox", "failed to remove temp dir",
            {{"path", path_.string()}, {"error", ec.message()}});
    }
}

}  // namespace snipguard::utils
