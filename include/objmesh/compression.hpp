/**
 * ObjMesh - Compression utilities
 * 
 * zlib streams and CRC-32 as used by PNG chunks.
 */

#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>

namespace objmesh {

/**
 * Compress data with zlib.
 */
std::vector<uint8_t> compress_zlib(const uint8_t* data, size_t size, int level = 6);
std::vector<uint8_t> compress_zlib(const std::vector<uint8_t>& data, int level = 6);

/**
 * CRC-32 as used by PNG chunk trailers.
 */
uint32_t crc32_of(const uint8_t* data, size_t size, uint32_t seed = 0);

} // namespace objmesh
