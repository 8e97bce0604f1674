/**
 * ObjMesh - Image resolution implementation
 */

#include "objmesh/image_resolver.hpp"
#include "objmesh/image_loader.hpp"
#include "objmesh/path_utils.hpp"
#include "objmesh/logging.hpp"
#include <algorithm>
#include <future>

namespace objmesh {

std::vector<std::string> collect_texture_paths(const MaterialMap& materials) {
    std::vector<std::string> paths;
    auto add = [&paths](const std::string& path) {
        if (!path.empty() && std::find(paths.begin(), paths.end(), path) == paths.end()) {
            paths.push_back(path);
        }
    };
    
    for (const auto& [name, material] : materials) {
        add(material.ambient_map);
        add(material.diffuse_map);
        add(material.emission_map);
        add(material.specular_map);
    }
    return paths;
}

Result<ImageMap> FileImageResolver::resolve(const std::filesystem::path& base_dir, const MaterialMap& materials) {
    const auto paths = collect_texture_paths(materials);
    ImageMap images;
    if (paths.empty()) {
        return images;
    }
    
    LOG_INFO("ImageResolver", "Loading " << paths.size() << " textures");
    
    // Fan out one load per distinct path
    std::vector<std::future<Result<ImageInfo>>> futures;
    futures.reserve(paths.size());
    for (const auto& written : paths) {
        const auto resolved = resolve_relative(base_dir, written);
        loads_issued_++;
        futures.push_back(std::async(std::launch::async, [resolved]() {
            return ImageLoader::load(resolved);
        }));
    }
    
    // Join all of them before reporting, so no task outlives the call
    std::vector<Result<ImageInfo>> results;
    results.reserve(futures.size());
    for (auto& f : futures) {
        results.push_back(f.get());
    }
    
    for (size_t i = 0; i < results.size(); i++) {
        if (!results[i]) {
            LOG_ERROR("ImageResolver", "Failed to load '" << paths[i] << "': " << results[i].error().full_message());
            return results[i].error();
        }
        images.emplace(paths[i], std::move(results[i].value()));
    }
    
    return images;
}

} // namespace objmesh
