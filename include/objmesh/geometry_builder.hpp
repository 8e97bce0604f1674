/**
 * ObjMesh - Geometry builder (pass 2)
 * 
 * Consumes OBJ lines one at a time and accumulates the indexed vertex
 * buffer, bounding box and per-material triangle lists. One builder owns
 * all per-parse state, so independent files can be parsed concurrently
 * with one builder each.
 */

#pragma once

#include "types.hpp"
#include "result.hpp"
#include "settings.hpp"
#include "obj_line.hpp"
#include <cstdint>
#include <cfloat>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace objmesh {

class GeometryBuilder {
public:
    /**
     * @param info      Flags from the metadata pass; fixes the vertex layout
     * @param materials Resolved materials; usemtl targets outside this map
     *                  fall back to the default material
     */
    GeometryBuilder(const ObjInfo& info, MaterialMap materials, const LoaderSettings& settings = {});
    
    GeometryBuilder(const GeometryBuilder&) = delete;
    GeometryBuilder& operator=(const GeometryBuilder&) = delete;
    
    /**
     * Process one raw line. Only fails in strict mode, when a parse
     * warning is promoted to a ParseError.
     */
    Result<void> consume_line(std::string_view line, uint64_t line_number);
    
    /**
     * Process an already classified record.
     */
    Result<void> consume(const obj::ObjLine& record, uint64_t line_number);
    
    /**
     * Freeze the accumulated state into the result. The builder is left empty.
     */
    ObjMesh finish();
    
    /**
     * Run the whole geometry pass over a file.
     */
    static Result<ObjMesh> build(const std::filesystem::path& path, const ObjInfo& info,
                                 MaterialMap materials, const LoaderSettings& settings = {});
    
    uint32_t vertex_count() const { return vertex_count_; }
    uint32_t stride() const { return stride_; }
    const std::vector<float>& positions() const { return positions_; }
    const std::vector<float>& normals() const { return normals_; }
    const std::vector<float>& uvs() const { return uvs_; }
    const std::vector<float>& vertex_array() const { return vertex_array_; }
    const std::string& current_material() const { return current_material_; }
    const std::vector<ParseWarning>& warnings() const { return warnings_; }
    
    /**
     * Offset of an OBJ index into an array with the given component count.
     * Positive indices are 1-based; negative indices count back from the
     * array length as it is right now. Returns nullopt for index 0 or any
     * reference outside the array.
     */
    static std::optional<size_t> resolve_offset(int32_t index, size_t array_length, size_t components);

private:
    struct ResolvedCorner {
        size_t position = 0;
        std::optional<size_t> uv;
        std::optional<size_t> normal;
    };
    
    Result<void> add_normal(const glm::vec3& normal, uint64_t line_number);
    Result<void> add_face(const obj::FaceRecord& face, uint64_t line_number);
    Result<void> resolve_corner(const obj::Corner& corner, ResolvedCorner& out, uint64_t line_number);
    uint32_t add_vertex(const obj::Corner& corner, const ResolvedCorner& resolved);
    void emit_vertex(const ResolvedCorner& resolved);
    
    void use_material(const std::string& name);
    void use_default_material();
    
    Result<void> report(ParseWarning::Kind kind, uint64_t line_number, std::string message);
    
    LoaderSettings settings_;
    bool has_normals_ = false;
    bool has_uvs_ = false;
    uint32_t stride_ = 3;
    
    std::vector<float> positions_;
    std::vector<float> normals_;
    std::vector<float> uvs_;
    
    // Corner token as written -> dense vertex id
    std::unordered_map<std::string, uint32_t> vertex_cache_;
    uint32_t vertex_count_ = 0;
    std::vector<float> vertex_array_;
    
    glm::vec3 position_min_{FLT_MAX};
    glm::vec3 position_max_{-FLT_MAX};
    
    MaterialMap materials_;
    std::map<std::string, std::vector<uint32_t>> material_groups_;
    std::vector<uint32_t>* current_indices_ = nullptr;
    std::string current_material_;
    
    std::vector<ParseWarning> warnings_;
};

} // namespace objmesh
