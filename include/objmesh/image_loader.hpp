/**
 * ObjMesh - Image Loader
 * 
 * Reads one texture file and extracts the metadata an exporter needs:
 * container format, dimensions, channel count and whether any pixel is
 * transparent. Pixels are only decoded where transparency depends on
 * them; DDS is inspected from its header alone.
 */

#pragma once

#include "types.hpp"
#include "result.hpp"
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace objmesh {

class ImageLoader {
public:
    /**
     * Largest decoded image accepted, in bytes (width * height * channels)
     */
    static constexpr uint64_t MAX_DECODED_BYTES = 1ull << 30;
    
    /**
     * Load and inspect an image file.
     * Fails with ImageResolution if the file is missing or corrupt.
     */
    static Result<ImageInfo> load(const std::filesystem::path& path);
    
    /**
     * Inspect an already loaded image. path is only used for the
     * extension and for diagnostics.
     */
    static Result<ImageInfo> decode(std::vector<uint8_t> data, const std::filesystem::path& path);
    
    /**
     * Detect the container from its magic bytes.
     */
    static ImageFormat detect_format(std::span<const uint8_t> data);

private:
    static Result<void> read_stb(ImageInfo& info);
    static Result<void> read_dds(ImageInfo& info);
};

} // namespace objmesh
