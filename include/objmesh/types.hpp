/**
 * ObjMesh - Common types and definitions
 */

#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <cfloat>
#include <string>
#include <vector>
#include <map>
#include <filesystem>

namespace objmesh {

namespace fs = std::filesystem;

/**
 * Material definition as resolved from an MTL library.
 * Texture paths are kept exactly as written in the library.
 */
struct Material {
    std::string name;
    glm::vec4 ambient_color{0.0f, 0.0f, 0.0f, 1.0f};
    glm::vec4 emission_color{0.0f, 0.0f, 0.0f, 1.0f};
    glm::vec4 diffuse_color{0.5f, 0.5f, 0.5f, 1.0f};
    glm::vec4 specular_color{0.0f, 0.0f, 0.0f, 1.0f};
    float specular_shininess = 0.0f;
    float alpha = 1.0f;
    
    std::string ambient_map;
    std::string emission_map;
    std::string diffuse_map;
    std::string specular_map;
    
    static Material make_default(const std::string& name) {
        Material m;
        m.name = name;
        return m;
    }
};

using MaterialMap = std::map<std::string, Material>;

/**
 * Container formats recognized by the image loader.
 */
enum class ImageFormat {
    Unknown,
    Png,
    Jpeg,
    Gif,
    Bmp,
    Dds
};

constexpr const char* image_format_string(ImageFormat format) {
    switch (format) {
        case ImageFormat::Png:  return "png";
        case ImageFormat::Jpeg: return "jpeg";
        case ImageFormat::Gif:  return "gif";
        case ImageFormat::Bmp:  return "bmp";
        case ImageFormat::Dds:  return "dds";
        default:                return "unknown";
    }
}

/**
 * Metadata for one loaded texture. The encoded bytes are kept so the
 * exporter can embed the image without reading it again.
 */
struct ImageInfo {
    fs::path path;                  // Resolved on-disk path
    std::string extension;          // Lowercase, with dot
    ImageFormat format = ImageFormat::Unknown;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t channels = 0;
    bool transparent = false;
    std::vector<uint8_t> source;
};

using ImageMap = std::map<std::string, ImageInfo>;

/**
 * Presence flags gathered by the metadata pass.
 */
struct ObjInfo {
    bool has_positions = false;
    bool has_normals = false;
    bool has_uvs = false;
    bool has_material_groups = false;
    std::string mtllib;             // First mtllib reference, as written
    uint64_t line_count = 0;
};

/**
 * Non-fatal parse diagnostic.
 */
struct ParseWarning {
    enum class Kind {
        MalformedRecord,     // v / vn / vt with missing or bad numbers
        MalformedFace,       // Bad corner syntax or mixed corner grammars
        UnsupportedPolygon,  // Fewer than 3 or more than 4 corners
        IndexOutOfRange,     // Corner references a record that does not exist
        DegenerateNormal     // Zero-length normal
    };
    
    Kind kind = Kind::MalformedRecord;
    uint64_t line = 0;
    std::string message;
};

constexpr const char* warning_kind_string(ParseWarning::Kind kind) {
    switch (kind) {
        case ParseWarning::Kind::MalformedRecord:    return "MalformedRecord";
        case ParseWarning::Kind::MalformedFace:      return "MalformedFace";
        case ParseWarning::Kind::UnsupportedPolygon: return "UnsupportedPolygon";
        case ParseWarning::Kind::IndexOutOfRange:    return "IndexOutOfRange";
        case ParseWarning::Kind::DegenerateNormal:   return "DegenerateNormal";
        default:                                     return "Unknown";
    }
}

/**
 * Indexed, material-partitioned mesh handed to the exporter.
 */
struct ObjMesh {
    uint32_t vertex_count = 0;
    std::vector<float> vertex_array;    // position, [normal], [uv] per vertex
    glm::vec3 position_min{FLT_MAX};
    glm::vec3 position_max{-FLT_MAX};
    bool has_normals = false;
    bool has_uvs = false;
    std::map<std::string, std::vector<uint32_t>> material_groups;
    MaterialMap materials;
    ImageMap images;
    std::vector<ParseWarning> warnings;
    
    uint32_t stride() const {
        return 3 + (has_normals ? 3 : 0) + (has_uvs ? 2 : 0);
    }
    
    size_t triangle_count() const {
        size_t count = 0;
        for (const auto& [name, indices] : material_groups) {
            count += indices.size() / 3;
        }
        return count;
    }
};

} // namespace objmesh
