/**
 * ObjMesh - Mesh summary implementation
 */

#include "objmesh/summary.hpp"
#include "objmesh/compression.hpp"
#include <fstream>

namespace objmesh {

static nlohmann::json vec_to_json(const glm::vec3& v) {
    return nlohmann::json::array({v.x, v.y, v.z});
}

static nlohmann::json vec_to_json(const glm::vec4& v) {
    return nlohmann::json::array({v.x, v.y, v.z, v.w});
}

nlohmann::json make_summary(const ObjMesh& mesh) {
    nlohmann::json j;
    j["vertex_count"] = mesh.vertex_count;
    j["stride"] = mesh.stride();
    j["triangle_count"] = mesh.triangle_count();
    j["has_normals"] = mesh.has_normals;
    j["has_uvs"] = mesh.has_uvs;
    
    if (mesh.vertex_count > 0) {
        j["position_min"] = vec_to_json(mesh.position_min);
        j["position_max"] = vec_to_json(mesh.position_max);
    }
    
    nlohmann::json groups = nlohmann::json::object();
    for (const auto& [name, indices] : mesh.material_groups) {
        groups[name] = indices.size() / 3;
    }
    j["material_groups"] = groups;
    
    nlohmann::json materials = nlohmann::json::object();
    for (const auto& [name, m] : mesh.materials) {
        nlohmann::json mj;
        mj["ambient_color"] = vec_to_json(m.ambient_color);
        mj["emission_color"] = vec_to_json(m.emission_color);
        mj["diffuse_color"] = vec_to_json(m.diffuse_color);
        mj["specular_color"] = vec_to_json(m.specular_color);
        mj["specular_shininess"] = m.specular_shininess;
        mj["alpha"] = m.alpha;
        if (!m.ambient_map.empty()) mj["ambient_map"] = m.ambient_map;
        if (!m.emission_map.empty()) mj["emission_map"] = m.emission_map;
        if (!m.diffuse_map.empty()) mj["diffuse_map"] = m.diffuse_map;
        if (!m.specular_map.empty()) mj["specular_map"] = m.specular_map;
        materials[name] = mj;
    }
    j["materials"] = materials;
    
    nlohmann::json images = nlohmann::json::object();
    for (const auto& [path, image] : mesh.images) {
        images[path] = {
            {"format", image_format_string(image.format)},
            {"width", image.width},
            {"height", image.height},
            {"channels", image.channels},
            {"transparent", image.transparent},
            {"bytes", image.source.size()},
            {"crc32", crc32_of(image.source.data(), image.source.size())}
        };
    }
    j["images"] = images;
    
    nlohmann::json warnings = nlohmann::json::array();
    for (const auto& w : mesh.warnings) {
        warnings.push_back({
            {"line", w.line},
            {"kind", warning_kind_string(w.kind)},
            {"message", w.message}
        });
    }
    j["warnings"] = warnings;
    
    return j;
}

Result<void> write_summary(const std::filesystem::path& path, const ObjMesh& mesh) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return Error::io_error("Failed to open summary file for writing", path.string());
    }
    file << make_summary(mesh).dump(2) << '\n';
    if (!file.good()) {
        return Error::io_error("Failed to write summary file", path.string());
    }
    return Result<void>::success();
}

} // namespace objmesh
