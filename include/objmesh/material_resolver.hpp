/**
 * ObjMesh - Material resolution
 * 
 * The geometry pass only needs a name -> Material map. Where that map
 * comes from is pluggable; MtlMaterialResolver reads Wavefront MTL files.
 */

#pragma once

#include "types.hpp"
#include "result.hpp"
#include <filesystem>
#include <string_view>

namespace objmesh {

class MaterialResolver {
public:
    virtual ~MaterialResolver() = default;
    
    /**
     * Resolve every material defined by the library at mtl_path.
     * Failures are fatal for the conversion.
     */
    virtual Result<MaterialMap> resolve(const std::filesystem::path& mtl_path) = 0;
};

/**
 * Incremental MTL text parser.
 * 
 * Recognized statements: newmtl, Ka, Ke, Kd, Ks, Ns, d, Tr,
 * map_Ka, map_Ke, map_Kd, map_Ks. Everything else is ignored.
 */
class MtlParser {
public:
    void parse_line(std::string_view line);
    
    const MaterialMap& materials() const { return materials_; }
    MaterialMap take() { return std::move(materials_); }

private:
    MaterialMap materials_;
    Material* current_ = nullptr;
};

/**
 * Strip texture options (-s 1 1 1, -bm 0.5, -clamp on, ...) from the
 * argument of a map_ statement and return the file name.
 */
std::string_view strip_texture_options(std::string_view args);

class MtlMaterialResolver : public MaterialResolver {
public:
    Result<MaterialMap> resolve(const std::filesystem::path& mtl_path) override;
};

} // namespace objmesh
