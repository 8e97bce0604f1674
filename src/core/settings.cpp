/**
 * ObjMesh - Settings persistence
 */

#include "objmesh/settings.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <fstream>

namespace objmesh {

Result<LoaderSettings> load_settings(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Error::io_error("Failed to open settings file", path.string());
    }
    
    LoaderSettings settings;
    try {
        nlohmann::json j = nlohmann::json::parse(file);
        if (j.contains("strict")) settings.strict = j["strict"].get<bool>();
        if (j.contains("default_material_name")) settings.default_material_name = j["default_material_name"].get<std::string>();
        if (j.contains("max_logged_warnings")) settings.max_logged_warnings = j["max_logged_warnings"].get<size_t>();
        if (j.contains("load_images")) settings.load_images = j["load_images"].get<bool>();
        if (j.contains("log_level")) {
            auto name = j["log_level"].get<std::string>();
            settings.log_level = parse_log_level(name, settings.log_level);
        }
    } catch (const nlohmann::json::exception& e) {
        return Error::invalid_argument(std::string("Invalid settings file: ") + e.what(), path.string());
    }
    
    if (settings.default_material_name.empty()) {
        return Error::invalid_argument("default_material_name must not be empty", path.string());
    }
    
    return settings;
}

Result<void> save_settings(const std::filesystem::path& path, const LoaderSettings& settings) {
    nlohmann::json j;
    j["strict"] = settings.strict;
    j["default_material_name"] = settings.default_material_name;
    j["max_logged_warnings"] = settings.max_logged_warnings;
    j["load_images"] = settings.load_images;
    
    std::string level = log_level_string(settings.log_level);
    for (auto& c : level) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (settings.log_level == LogLevel::None) level = "none";
    j["log_level"] = level;
    
    std::ofstream file(path);
    if (!file.is_open()) {
        return Error::io_error("Failed to write settings file", path.string());
    }
    file << j.dump(4);
    if (!file.good()) {
        return Error::io_error("Failed to write settings file", path.string());
    }
    return Result<void>::success();
}

} // namespace objmesh
