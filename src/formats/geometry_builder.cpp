/**
 * ObjMesh - Geometry builder implementation
 */

#include "objmesh/geometry_builder.hpp"
#include "objmesh/line_reader.hpp"
#include "objmesh/logging.hpp"
#include <type_traits>
#include <utility>

namespace objmesh {

GeometryBuilder::GeometryBuilder(const ObjInfo& info, MaterialMap materials, const LoaderSettings& settings)
    : settings_(settings)
    , has_normals_(info.has_normals)
    , has_uvs_(info.has_uvs)
    , stride_(3 + (info.has_normals ? 3 : 0) + (info.has_uvs ? 2 : 0))
    , materials_(std::move(materials))
{
    // Without any resolved material every face lands in the default group
    if (materials_.empty()) {
        use_default_material();
    }
}

std::optional<size_t> GeometryBuilder::resolve_offset(int32_t index, size_t array_length, size_t components) {
    const size_t count = array_length / components;
    
    if (index > 0) {
        const size_t element = static_cast<size_t>(index) - 1;
        if (element >= count) return std::nullopt;
        return element * components;
    }
    
    if (index < 0) {
        const size_t back = static_cast<size_t>(-static_cast<int64_t>(index));
        if (back > count) return std::nullopt;
        return (count - back) * components;
    }
    
    return std::nullopt;
}

Result<void> GeometryBuilder::consume_line(std::string_view line, uint64_t line_number) {
    return consume(obj::classify_line(line), line_number);
}

Result<void> GeometryBuilder::consume(const obj::ObjLine& record, uint64_t line_number) {
    return std::visit([&](const auto& r) -> Result<void> {
        using T = std::decay_t<decltype(r)>;
        
        if constexpr (std::is_same_v<T, obj::PositionRecord>) {
            positions_.push_back(r.value.x);
            positions_.push_back(r.value.y);
            positions_.push_back(r.value.z);
        } else if constexpr (std::is_same_v<T, obj::NormalRecord>) {
            return add_normal(r.value, line_number);
        } else if constexpr (std::is_same_v<T, obj::UvRecord>) {
            // Flip v so 0.0 is the bottom of the image
            uvs_.push_back(r.value.x);
            uvs_.push_back(1.0f - r.value.y);
        } else if constexpr (std::is_same_v<T, obj::FaceRecord>) {
            return add_face(r, line_number);
        } else if constexpr (std::is_same_v<T, obj::UseMaterial>) {
            use_material(r.name);
        } else if constexpr (std::is_same_v<T, obj::MalformedLine>) {
            return report(r.kind, line_number, r.message);
        }
        // SkipLine, MaterialLibrary, IgnoredLine: nothing to do in this pass
        return Result<void>::success();
    }, record);
}

Result<void> GeometryBuilder::add_normal(const glm::vec3& normal, uint64_t line_number) {
    const float length = glm::length(normal);
    if (length == 0.0f) {
        normals_.insert(normals_.end(), {0.0f, 0.0f, 0.0f});
        return report(ParseWarning::Kind::DegenerateNormal, line_number, "zero-length normal");
    }
    
    const glm::vec3 unit = normal / length;
    normals_.push_back(unit.x);
    normals_.push_back(unit.y);
    normals_.push_back(unit.z);
    return Result<void>::success();
}

Result<void> GeometryBuilder::resolve_corner(const obj::Corner& corner, ResolvedCorner& out, uint64_t line_number) {
    auto position = resolve_offset(corner.position, positions_.size(), 3);
    if (!position) {
        return report(ParseWarning::Kind::IndexOutOfRange, line_number,
                      "position index " + std::to_string(corner.position) + " out of range (" +
                      std::to_string(positions_.size() / 3) + " positions)");
    }
    out.position = *position;
    
    if (corner.uv && has_uvs_) {
        auto uv = resolve_offset(*corner.uv, uvs_.size(), 2);
        if (!uv) {
            return report(ParseWarning::Kind::IndexOutOfRange, line_number,
                          "uv index " + std::to_string(*corner.uv) + " out of range (" +
                          std::to_string(uvs_.size() / 2) + " uvs)");
        }
        out.uv = *uv;
    }
    
    if (corner.normal && has_normals_) {
        auto normal = resolve_offset(*corner.normal, normals_.size(), 3);
        if (!normal) {
            return report(ParseWarning::Kind::IndexOutOfRange, line_number,
                          "normal index " + std::to_string(*corner.normal) + " out of range (" +
                          std::to_string(normals_.size() / 3) + " normals)");
        }
        out.normal = *normal;
    }
    
    return Result<void>::success();
}

Result<void> GeometryBuilder::add_face(const obj::FaceRecord& face, uint64_t line_number) {
    // Validate every corner before emitting anything so a bad reference
    // never leaves half a face behind
    std::array<ResolvedCorner, obj::MAX_FACE_CORNERS> resolved;
    const size_t warnings_before = warnings_.size();
    for (size_t i = 0; i < face.corner_count; i++) {
        if (vertex_cache_.count(face.corners[i].key)) continue;
        OBJMESH_TRY(resolve_corner(face.corners[i], resolved[i], line_number));
        if (warnings_.size() != warnings_before) {
            return Result<void>::success();
        }
    }
    
    if (!current_indices_) {
        use_default_material();
    }
    
    const uint32_t index1 = add_vertex(face.corners[0], resolved[0]);
    const uint32_t index2 = add_vertex(face.corners[1], resolved[1]);
    const uint32_t index3 = add_vertex(face.corners[2], resolved[2]);
    
    current_indices_->push_back(index1);
    current_indices_->push_back(index2);
    current_indices_->push_back(index3);
    
    // Quads split along the 1-3 diagonal
    if (face.corner_count == 4) {
        const uint32_t index4 = add_vertex(face.corners[3], resolved[3]);
        current_indices_->push_back(index1);
        current_indices_->push_back(index3);
        current_indices_->push_back(index4);
    }
    
    return Result<void>::success();
}

uint32_t GeometryBuilder::add_vertex(const obj::Corner& corner, const ResolvedCorner& resolved) {
    auto [it, inserted] = vertex_cache_.try_emplace(corner.key, vertex_count_);
    if (inserted) {
        vertex_count_++;
        emit_vertex(resolved);
    }
    return it->second;
}

void GeometryBuilder::emit_vertex(const ResolvedCorner& resolved) {
    const glm::vec3 position(positions_[resolved.position + 0],
                             positions_[resolved.position + 1],
                             positions_[resolved.position + 2]);
    
    position_min_ = glm::min(position_min_, position);
    position_max_ = glm::max(position_max_, position);
    vertex_array_.insert(vertex_array_.end(), {position.x, position.y, position.z});
    
    if (has_normals_) {
        if (resolved.normal) {
            const size_t n = *resolved.normal;
            vertex_array_.insert(vertex_array_.end(), {normals_[n + 0], normals_[n + 1], normals_[n + 2]});
        } else {
            vertex_array_.insert(vertex_array_.end(), {0.0f, 0.0f, 0.0f});
        }
    }
    
    if (has_uvs_) {
        if (resolved.uv) {
            const size_t u = *resolved.uv;
            vertex_array_.insert(vertex_array_.end(), {uvs_[u + 0], uvs_[u + 1]});
        } else {
            // Some objects in the file may have no uvs; keep the layout uniform
            vertex_array_.insert(vertex_array_.end(), {0.0f, 0.0f});
        }
    }
}

void GeometryBuilder::use_material(const std::string& name) {
    if (materials_.find(name) == materials_.end()) {
        LOG_DEBUG("GeometryBuilder", "usemtl '" << name << "' has no definition, using "
                  << settings_.default_material_name);
        use_default_material();
        return;
    }
    
    current_indices_ = &material_groups_[name];
    current_material_ = name;
}

void GeometryBuilder::use_default_material() {
    const std::string& name = settings_.default_material_name;
    if (materials_.find(name) == materials_.end()) {
        materials_.emplace(name, Material::make_default(name));
    }
    current_indices_ = &material_groups_[name];
    current_material_ = name;
}

Result<void> GeometryBuilder::report(ParseWarning::Kind kind, uint64_t line_number, std::string message) {
    if (settings_.strict) {
        LOG_ERROR("GeometryBuilder", "line " << line_number << ": " << message);
        return Error::parse_error(std::string(warning_kind_string(kind)) + ": " + message,
                                  "line " + std::to_string(line_number));
    }
    
    if (warnings_.size() < settings_.max_logged_warnings) {
        LOG_WARNING("GeometryBuilder", "line " << line_number << ": " << message << ", skipped");
    } else if (warnings_.size() == settings_.max_logged_warnings) {
        LOG_WARNING("GeometryBuilder", "further parse warnings are not logged");
    }
    
    warnings_.push_back(ParseWarning{kind, line_number, std::move(message)});
    return Result<void>::success();
}

ObjMesh GeometryBuilder::finish() {
    ObjMesh mesh;
    mesh.vertex_count = vertex_count_;
    mesh.vertex_array = std::move(vertex_array_);
    mesh.position_min = position_min_;
    mesh.position_max = position_max_;
    mesh.has_normals = has_normals_;
    mesh.has_uvs = has_uvs_;
    mesh.material_groups = std::move(material_groups_);
    mesh.materials = std::move(materials_);
    mesh.warnings = std::move(warnings_);
    
    vertex_cache_.clear();
    positions_.clear();
    normals_.clear();
    uvs_.clear();
    vertex_count_ = 0;
    current_indices_ = nullptr;
    current_material_.clear();
    return mesh;
}

Result<ObjMesh> GeometryBuilder::build(const std::filesystem::path& path, const ObjInfo& info,
                                       MaterialMap materials, const LoaderSettings& settings) {
    LineReader reader;
    OBJMESH_TRY(reader.open(path));
    
    GeometryBuilder builder(info, std::move(materials), settings);
    std::string line;
    while (true) {
        auto more = reader.next(line);
        if (!more) return more.error();
        if (!*more) break;
        OBJMESH_TRY(builder.consume_line(line, reader.line_number()));
    }
    
    ObjMesh mesh = builder.finish();
    LOG_INFO("GeometryBuilder", path.filename().string() << ": " << mesh.vertex_count << " vertices, "
             << mesh.triangle_count() << " triangles, " << mesh.material_groups.size() << " groups, "
             << mesh.warnings.size() << " warnings");
    return mesh;
}

} // namespace objmesh
