#ifndef TEFP_TEST_PATH_UTILS_H
#define TEFP_TEST_PATH_UTILS_H

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace tefp_test {

// Path from an environment variable, empty if unset or missing on disk.
inline std::string resolve_env_file(const char* env_name) {
    const char* env_value = std::getenv(env_name);
    if (env_value == nullptr || env_value[0] == '\0') {
        return {};
    }
    const std::filesystem::path path(env_value);
    if (!std::filesystem::exists(path)) {
        std::cout << "  [WARN] " << env_name << " is set but file not found: "
                  << env_value << std::endl;
        return {};
    }
    return std::filesystem::absolute(path).string();
}

inline bool require_path_or_skip(const std::string& path,
                                 const char* label,
                                 const char* env_name) {
    if (!path.empty()) return true;
    std::cout << "  [SKIP] Missing " << label;
    if (env_name != nullptr) {
        std::cout << " (set " << env_name << " to enable this test)";
    }
    std::cout << std::endl;
    return false;
}

inline std::string make_temp_dir(const std::string& dirname) {
    auto path = std::filesystem::temp_directory_path() / dirname;
    std::filesystem::create_directories(path);
    return path.string();
}

inline std::string write_text_file(const std::string& dir,
                                   const std::string& name,
                                   const std::vector<std::string>& lines) {
    const auto path = (std::filesystem::path(dir) / name).string();
    std::ofstream out(path);
    for (const auto& line : lines) {
        out << line << '\n';
    }
    return path;
}

inline std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace tefp_test

#endif  // TEFP_TEST_PATH_UTILS_H
