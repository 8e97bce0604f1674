/**
 * ObjMesh - Compression Implementation
 */

#include "objmesh/compression.hpp"
#include <zlib.h>
#include <stdexcept>
#include <string>

namespace objmesh {

static const char* zlib_error_string(int err) {
    switch (err) {
        case Z_OK:            return "Z_OK";
        case Z_STREAM_END:    return "Z_STREAM_END";
        case Z_NEED_DICT:     return "Z_NEED_DICT";
        case Z_ERRNO:         return "Z_ERRNO";
        case Z_STREAM_ERROR:  return "Z_STREAM_ERROR";
        case Z_DATA_ERROR:    return "Z_DATA_ERROR";
        case Z_MEM_ERROR:     return "Z_MEM_ERROR";
        case Z_BUF_ERROR:     return "Z_BUF_ERROR";
        case Z_VERSION_ERROR: return "Z_VERSION_ERROR";
        default:              return "UNKNOWN_ERROR";
    }
}

std::vector<uint8_t> compress_zlib(const uint8_t* data, size_t size, int level) {
    uLongf bound = compressBound(static_cast<uLong>(size));
    std::vector<uint8_t> result(bound);
    
    int ret = compress2(
        result.data(), &bound,
        data, static_cast<uLong>(size),
        level
    );
    
    if (ret != Z_OK) {
        throw std::runtime_error(std::string("Zlib compression failed: ") + zlib_error_string(ret));
    }
    
    result.resize(bound);
    return result;
}

std::vector<uint8_t> compress_zlib(const std::vector<uint8_t>& data, int level) {
    return compress_zlib(data.data(), data.size(), level);
}

uint32_t crc32_of(const uint8_t* data, size_t size, uint32_t seed) {
    return static_cast<uint32_t>(crc32(seed, data, static_cast<uInt>(size)));
}

} // namespace objmesh
