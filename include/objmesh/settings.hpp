/**
 * ObjMesh - Loader settings
 */

#pragma once

#include "result.hpp"
#include "logging.hpp"
#include <cstddef>
#include <filesystem>
#include <string>

namespace objmesh {

struct LoaderSettings {
    // Promote the first parse warning to a fatal ParseError
    bool strict = false;
    
    // Name of the material substituted for unknown or missing usemtl targets
    std::string default_material_name = "objmeshDefaultMat";
    
    // Warnings beyond this count are still collected but not logged
    size_t max_logged_warnings = 20;
    
    // Resolve textures referenced by materials
    bool load_images = true;
    
    LogLevel log_level = LogLevel::Warning;
};

/**
 * Read settings from a JSON file. Missing keys keep their defaults.
 */
Result<LoaderSettings> load_settings(const std::filesystem::path& path);

/**
 * Write settings to a JSON file.
 */
Result<void> save_settings(const std::filesystem::path& path, const LoaderSettings& settings);

} // namespace objmesh
