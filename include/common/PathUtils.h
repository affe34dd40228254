#pragma once

#include <string>
#include <filesystem>

namespace ustw {
namespace utils {

class PathUtils {
public:
    // 실행 파일의 디렉토리 경로 반환 (falls back to the working directory)
    static std::filesystem::path getExecutableDir();

    // 실행 파일 기준 상대 경로를 절대 경로로 변환
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    // Relative paths resolve against base_dir; absolute paths pass through
    static std::filesystem::path resolveAgainst(const std::string& base_dir, const std::string& path);
};

} // namespace utils
} // namespace ustw
