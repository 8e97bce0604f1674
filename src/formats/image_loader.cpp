/**
 * ObjMesh - Image Loader Implementation
 */

#include "objmesh/image_loader.hpp"
#include "objmesh/files.hpp"
#include "objmesh/logging.hpp"
#include <climits>
#include <cstring>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

namespace objmesh {

static constexpr uint8_t PNG_SIGNATURE[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};

// DDS header constants
static constexpr uint32_t DDS_MAGIC = 0x20534444; // "DDS "
static constexpr uint32_t DDS_HEADER_SIZE = 124;
static constexpr uint32_t DDPF_ALPHAPIXELS = 0x00000001;

static inline uint32_t read_u32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

ImageFormat ImageLoader::detect_format(std::span<const uint8_t> data) {
    if (data.size() >= 8 && std::memcmp(data.data(), PNG_SIGNATURE, 8) == 0)
        return ImageFormat::Png;
    
    if (data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF)
        return ImageFormat::Jpeg;
    
    if (data.size() >= 6 && std::memcmp(data.data(), "GIF8", 4) == 0 &&
        (data[4] == '7' || data[4] == '9') && data[5] == 'a')
        return ImageFormat::Gif;
    
    if (data.size() >= 2 && data[0] == 'B' && data[1] == 'M')
        return ImageFormat::Bmp;
    
    if (data.size() >= 4 && read_u32_le(data.data()) == DDS_MAGIC)
        return ImageFormat::Dds;
    
    return ImageFormat::Unknown;
}

Result<ImageInfo> ImageLoader::load(const std::filesystem::path& path) {
    if (!file_exists(path)) {
        return Error::image_resolution("Texture file not found", path.string());
    }
    
    auto data = read_file(path);
    if (!data) {
        return Error::image_resolution("Failed to read texture: " + data.error().message, path.string());
    }
    return decode(std::move(data.value()), path);
}

Result<ImageInfo> ImageLoader::decode(std::vector<uint8_t> data, const std::filesystem::path& path) {
    ImageInfo info;
    info.path = path;
    info.extension = get_extension(path);
    info.format = detect_format(data);
    info.source = std::move(data);
    
    Result<void> status;
    if (info.format == ImageFormat::Dds) {
        status = read_dds(info);
    } else {
        status = read_stb(info);
    }
    
    if (!status) {
        return Error::image_resolution(status.error().message, path.string());
    }
    
    LOG_DEBUG("ImageLoader", path.filename().string() << ": " << image_format_string(info.format)
              << " " << info.width << "x" << info.height << ", " << info.channels << " channels"
              << (info.transparent ? ", transparent" : ""));
    return info;
}

Result<void> ImageLoader::read_stb(ImageInfo& info) {
    const auto& data = info.source;
    if (data.empty() || data.size() > static_cast<size_t>(INT_MAX)) {
        return Error::image_resolution("Texture is empty or too large");
    }
    const int size = static_cast<int>(data.size());
    
    int width = 0;
    int height = 0;
    int channels = 0;
    if (!stbi_info_from_memory(data.data(), size, &width, &height, &channels)) {
        if (info.format == ImageFormat::Unknown) {
            LOG_WARNING("ImageLoader", "Unrecognized image container, passing through: " << info.path.string());
            return Result<void>::success();
        }
        return Error::image_resolution(std::string("Invalid ") + image_format_string(info.format) +
                                       " image: " + stbi_failure_reason());
    }
    
    const uint64_t decoded_bytes = static_cast<uint64_t>(width) * static_cast<uint64_t>(height) * 4;
    if (width <= 0 || height <= 0 || decoded_bytes > MAX_DECODED_BYTES) {
        return Error::image_resolution("Image dimensions out of range: " + std::to_string(width) +
                                       "x" + std::to_string(height));
    }
    
    info.width = static_cast<uint32_t>(width);
    info.height = static_cast<uint32_t>(height);
    info.channels = static_cast<uint32_t>(channels);
    
    // JPEG has no alpha; PNG colour keys and GIF transparency only show up once decoded
    const bool may_have_alpha = info.format == ImageFormat::Png || info.format == ImageFormat::Gif ||
                                channels == 2 || channels == 4;
    if (info.format == ImageFormat::Jpeg || !may_have_alpha) {
        return Result<void>::success();
    }
    
    int decoded_channels = 0;
    stbi_uc* pixels = stbi_load_from_memory(data.data(), size, &width, &height, &decoded_channels, 0);
    if (!pixels) {
        return Error::image_resolution(std::string("Failed to decode ") + image_format_string(info.format) +
                                       " image: " + stbi_failure_reason());
    }
    
    info.channels = static_cast<uint32_t>(decoded_channels);
    if (decoded_channels == 2 || decoded_channels == 4) {
        const size_t pixel_count = static_cast<size_t>(width) * static_cast<size_t>(height);
        const stbi_uc* alpha = pixels + decoded_channels - 1;
        for (size_t i = 0; i < pixel_count; i++) {
            if (alpha[i * decoded_channels] != 255) {
                info.transparent = true;
                break;
            }
        }
    }
    
    stbi_image_free(pixels);
    return Result<void>::success();
}

Result<void> ImageLoader::read_dds(ImageInfo& info) {
    const auto& data = info.source;
    if (data.size() < 4 + DDS_HEADER_SIZE) {
        return Error::image_resolution("Truncated DDS header");
    }
    const uint8_t* header = data.data() + 4;
    if (read_u32_le(header) != DDS_HEADER_SIZE) {
        return Error::image_resolution("Invalid DDS header size");
    }
    
    info.height = read_u32_le(header + 8);
    info.width = read_u32_le(header + 12);
    
    const uint32_t pf_flags = read_u32_le(header + 76);
    info.channels = 4;
    info.transparent = (pf_flags & DDPF_ALPHAPIXELS) != 0;
    return Result<void>::success();
}

} // namespace objmesh
