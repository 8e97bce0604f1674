/**
 * ObjMesh - Image resolution
 * 
 * Collects the texture paths referenced by resolved materials and loads
 * each distinct path once.
 */

#pragma once

#include "types.hpp"
#include "result.hpp"
#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

namespace objmesh {

class ImageResolver {
public:
    virtual ~ImageResolver() = default;
    
    /**
     * Load every texture referenced by materials. Relative paths are
     * resolved against base_dir; the result is keyed by the path as
     * written in the material. Any failure is fatal.
     */
    virtual Result<ImageMap> resolve(const std::filesystem::path& base_dir, const MaterialMap& materials) = 0;
};

/**
 * Distinct texture paths across all map slots, in first-seen order.
 */
std::vector<std::string> collect_texture_paths(const MaterialMap& materials);

/**
 * Loads textures from disk through ImageLoader. Distinct paths are loaded
 * concurrently and joined before returning.
 */
class FileImageResolver : public ImageResolver {
public:
    Result<ImageMap> resolve(const std::filesystem::path& base_dir, const MaterialMap& materials) override;
    
    /**
     * Number of image loads started by this resolver so far.
     */
    size_t loads_issued() const { return loads_issued_.load(); }

private:
    std::atomic<size_t> loads_issued_{0};
};

} // namespace objmesh
