/**
 * ObjMesh - MTL parser implementation
 */

#include "objmesh/material_resolver.hpp"
#include "objmesh/line_reader.hpp"
#include "objmesh/obj_line.hpp"
#include "objmesh/path_utils.hpp"
#include "objmesh/logging.hpp"
#include <map>

namespace objmesh {

namespace {

// Option name -> maximum number of arguments it takes
const std::map<std::string_view, int> TEXTURE_OPTIONS = {
    {"-blendu", 1}, {"-blendv", 1}, {"-bm", 1}, {"-boost", 1},
    {"-cc", 1}, {"-clamp", 1}, {"-imfchan", 1}, {"-texres", 1},
    {"-type", 1}, {"-mm", 2}, {"-o", 3}, {"-s", 3}, {"-t", 3}
};

// Ka 1 0 0, or Ka 0.5 as shorthand for grey
glm::vec4 parse_color(std::string_view rest, const glm::vec4& fallback) {
    auto r = obj::parse_float(obj::next_token(rest));
    if (!r) return fallback;
    auto g = obj::parse_float(obj::next_token(rest));
    auto b = obj::parse_float(obj::next_token(rest));
    if (!g || !b) {
        return glm::vec4(*r, *r, *r, 1.0f);
    }
    return glm::vec4(*r, *g, *b, 1.0f);
}

} // namespace

std::string_view strip_texture_options(std::string_view args) {
    std::string_view rest = trim(args);
    
    while (!rest.empty() && rest.front() == '-') {
        std::string_view lookahead = rest;
        std::string_view option = obj::next_token(lookahead);
        auto it = TEXTURE_OPTIONS.find(option);
        if (it == TEXTURE_OPTIONS.end()) break;
        
        rest = lookahead;
        const bool numeric = it->second > 1;
        for (int i = 0; i < it->second; i++) {
            std::string_view peek = rest;
            std::string_view value = obj::next_token(peek);
            if (value.empty()) break;
            // -o/-s/-t/-mm take a variable count of numbers
            if (numeric && i > 0 && !obj::parse_float(value)) break;
            rest = peek;
        }
        rest = trim(rest);
    }
    
    return rest;
}

void MtlParser::parse_line(std::string_view line) {
    std::string_view rest = trim(line);
    if (rest.empty() || rest.front() == '#') return;
    
    std::string_view keyword = obj::next_token(rest);
    
    if (keyword == "newmtl") {
        std::string name(trim(rest));
        auto [it, inserted] = materials_.try_emplace(name, Material::make_default(name));
        if (!inserted) {
            LOG_WARNING("MtlParser", "Material '" << name << "' defined twice, keeping the last definition");
            it->second = Material::make_default(name);
        }
        current_ = &it->second;
        return;
    }
    
    if (!current_) {
        // Statements before the first newmtl have nothing to apply to
        return;
    }
    
    if (keyword == "Ka") {
        current_->ambient_color = parse_color(rest, current_->ambient_color);
    } else if (keyword == "Ke") {
        current_->emission_color = parse_color(rest, current_->emission_color);
    } else if (keyword == "Kd") {
        current_->diffuse_color = parse_color(rest, current_->diffuse_color);
    } else if (keyword == "Ks") {
        current_->specular_color = parse_color(rest, current_->specular_color);
    } else if (keyword == "Ns") {
        if (auto value = obj::parse_float(obj::next_token(rest))) {
            current_->specular_shininess = *value;
        }
    } else if (keyword == "d") {
        if (auto value = obj::parse_float(obj::next_token(rest))) {
            current_->alpha = *value;
        }
    } else if (keyword == "Tr") {
        if (auto value = obj::parse_float(obj::next_token(rest))) {
            current_->alpha = 1.0f - *value;
        }
    } else if (keyword == "map_Ka") {
        current_->ambient_map = std::string(strip_texture_options(rest));
    } else if (keyword == "map_Ke") {
        current_->emission_map = std::string(strip_texture_options(rest));
    } else if (keyword == "map_Kd") {
        current_->diffuse_map = std::string(strip_texture_options(rest));
    } else if (keyword == "map_Ks") {
        current_->specular_map = std::string(strip_texture_options(rest));
    }
}

Result<MaterialMap> MtlMaterialResolver::resolve(const std::filesystem::path& mtl_path) {
    LineReader reader;
    auto opened = reader.open(mtl_path);
    if (!opened) {
        return Error::material_resolution("Failed to open material library: " + opened.error().message,
                                          mtl_path.string());
    }
    
    MtlParser parser;
    std::string line;
    while (true) {
        auto more = reader.next(line);
        if (!more) {
            return Error::material_resolution("Failed to read material library: " + more.error().message,
                                              mtl_path.string());
        }
        if (!*more) break;
        parser.parse_line(line);
    }
    
    LOG_INFO("MtlParser", mtl_path.filename().string() << ": " << parser.materials().size() << " materials");
    return parser.take();
}

} // namespace objmesh
