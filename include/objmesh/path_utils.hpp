/**
 * ObjMesh - Path Utilities
 */

#pragma once

#include <string>
#include <string_view>
#include <algorithm>
#include <filesystem>

namespace objmesh {

/**
 * Trim ASCII whitespace (including a trailing CR) from both ends.
 */
inline std::string_view trim(std::string_view s) {
    const char* ws = " \t\r\n\f\v";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

/**
 * Convert backslashes written by Windows exporters to forward slashes.
 */
inline std::string normalize_separators(std::string_view path) {
    std::string result(path);
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

/**
 * Resolve a path found inside an OBJ or MTL file. Absolute paths are kept,
 * relative ones are joined onto base_dir.
 */
inline std::filesystem::path resolve_relative(const std::filesystem::path& base_dir, std::string_view written) {
    std::filesystem::path p(normalize_separators(written));
    if (p.is_absolute() || base_dir.empty()) {
        return p;
    }
    return base_dir / p;
}

} // namespace objmesh
