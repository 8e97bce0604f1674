/**
 * ObjMesh - File utilities
 */

#pragma once

#include "result.hpp"
#include <string>
#include <vector>
#include <filesystem>
#include <cstdint>

namespace objmesh {

/**
 * Read entire file into memory.
 */
Result<std::vector<uint8_t>> read_file(const std::filesystem::path& path);

bool file_exists(const std::filesystem::path& path);

/**
 * Get file extension (lowercase, with dot).
 */
std::string get_extension(const std::filesystem::path& path);

/**
 * Format file size for display.
 */
std::string format_file_size(size_t bytes);

} // namespace objmesh
