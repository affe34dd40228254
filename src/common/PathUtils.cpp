#include "common/PathUtils.h"
#include <system_error>

namespace ustw {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    return getExecutableDir() / relative_path;
}

std::filesystem::path PathUtils::resolveAgainst(const std::string& base_dir, const std::string& path) {
    std::filesystem::path p(path);
    if (p.is_absolute() || base_dir.empty()) {
        return p;
    }
    return std::filesystem::path(base_dir) / p;
}

} // namespace utils
} // namespace ustw
