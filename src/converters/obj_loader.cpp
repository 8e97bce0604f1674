/**
 * ObjMesh - OBJ Loader Implementation
 */

#include "objmesh/obj_loader.hpp"
#include "objmesh/obj_scanner.hpp"
#include "objmesh/geometry_builder.hpp"
#include "objmesh/path_utils.hpp"
#include "objmesh/logging.hpp"
#include <chrono>

namespace objmesh {

ObjLoader::ObjLoader(LoaderSettings settings,
                     std::shared_ptr<MaterialResolver> materials,
                     std::shared_ptr<ImageResolver> images)
    : settings_(std::move(settings))
    , material_resolver_(materials ? std::move(materials) : std::make_shared<MtlMaterialResolver>())
    , image_resolver_(images ? std::move(images) : std::make_shared<FileImageResolver>())
{
}

Result<MaterialMap> ObjLoader::resolve_materials(const ObjInfo& info, const std::filesystem::path& base_dir) const {
    // Materials only matter if some face group selects one
    if (!info.has_material_groups) {
        LOG_DEBUG("ObjLoader", "No usemtl statements, skipping material library");
        return MaterialMap{};
    }
    if (info.mtllib.empty()) {
        LOG_DEBUG("ObjLoader", "usemtl without mtllib, all groups use the default material");
        return MaterialMap{};
    }
    
    const auto mtl_path = resolve_relative(base_dir, info.mtllib);
    return material_resolver_->resolve(mtl_path);
}

Result<ObjMesh> ObjLoader::load(const std::filesystem::path& obj_path, const std::filesystem::path& base_dir) const {
    const auto start = std::chrono::steady_clock::now();
    const std::filesystem::path input_dir = base_dir.empty() ? obj_path.parent_path() : base_dir;
    
    LOG_INFO("ObjLoader", "Loading " << obj_path.string());
    
    OBJMESH_TRY_ASSIGN(info, ObjScanner::scan(obj_path));
    OBJMESH_TRY_ASSIGN(materials, resolve_materials(info, input_dir));
    
    ImageMap images;
    if (settings_.load_images) {
        auto resolved = image_resolver_->resolve(input_dir, materials);
        if (!resolved) return resolved.error();
        images = std::move(resolved.value());
    }
    
    OBJMESH_TRY_ASSIGN(mesh, GeometryBuilder::build(obj_path, info, std::move(materials), settings_));
    mesh.images = std::move(images);
    
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    LOG_INFO("ObjLoader", obj_path.filename().string() << " loaded in " << elapsed.count() << " ms");
    return mesh;
}

Result<ObjMesh> load_obj(const std::filesystem::path& obj_path,
                         const std::filesystem::path& base_dir,
                         const LoaderSettings& settings) {
    return ObjLoader(settings).load(obj_path, base_dir);
}

} // namespace objmesh
