/**
 * ObjMesh - OBJ Loader
 * 
 * Runs the full conversion: metadata pass, material and texture
 * resolution, geometry pass. Produces an ObjMesh or the first fatal error.
 */

#pragma once

#include "types.hpp"
#include "result.hpp"
#include "settings.hpp"
#include "material_resolver.hpp"
#include "image_resolver.hpp"
#include <filesystem>
#include <memory>

namespace objmesh {

class ObjLoader {
public:
    /**
     * Resolvers default to MtlMaterialResolver / FileImageResolver.
     */
    explicit ObjLoader(LoaderSettings settings = {},
                       std::shared_ptr<MaterialResolver> materials = nullptr,
                       std::shared_ptr<ImageResolver> images = nullptr);
    
    /**
     * Convert an OBJ file. base_dir resolves relative mtllib and texture
     * paths; when empty the OBJ's own directory is used.
     */
    Result<ObjMesh> load(const std::filesystem::path& obj_path,
                         const std::filesystem::path& base_dir = {}) const;
    
    const LoaderSettings& settings() const { return settings_; }

private:
    Result<MaterialMap> resolve_materials(const ObjInfo& info, const std::filesystem::path& base_dir) const;
    
    LoaderSettings settings_;
    std::shared_ptr<MaterialResolver> material_resolver_;
    std::shared_ptr<ImageResolver> image_resolver_;
};

/**
 * Convenience wrapper using the default resolvers.
 */
Result<ObjMesh> load_obj(const std::filesystem::path& obj_path,
                         const std::filesystem::path& base_dir = {},
                         const LoaderSettings& settings = {});

} // namespace objmesh
