/**
 * ObjMesh - OBJ metadata scanner implementation
 */

#include "objmesh/obj_scanner.hpp"
#include "objmesh/line_reader.hpp"
#include "objmesh/path_utils.hpp"
#include "objmesh/logging.hpp"
#include <cctype>

namespace objmesh {

static bool starts_with_keyword(std::string_view line, std::string_view keyword) {
    return line.substr(0, keyword.size()) == keyword;
}

ObjInfo ObjScanner::scan_line(ObjInfo info, std::string_view line) {
    info.line_count++;
    
    line = trim(line);
    if (line.empty()) return info;
    
    if (!info.has_positions && line.size() > 1 && line[0] == 'v' &&
        std::isspace(static_cast<unsigned char>(line[1]))) {
        info.has_positions = true;
    }
    if (!info.has_normals && starts_with_keyword(line, "vn")) {
        info.has_normals = true;
    }
    if (!info.has_uvs && starts_with_keyword(line, "vt")) {
        info.has_uvs = true;
    }
    if (!info.has_material_groups && starts_with_keyword(line, "usemtl")) {
        info.has_material_groups = true;
    }
    
    if (info.mtllib.empty() && starts_with_keyword(line, "mtllib") &&
        line.size() > 6 && std::isspace(static_cast<unsigned char>(line[6]))) {
        info.mtllib = std::string(trim(line.substr(6)));
    }
    
    return info;
}

Result<ObjInfo> ObjScanner::scan(const std::filesystem::path& path) {
    LineReader reader;
    OBJMESH_TRY(reader.open(path));
    
    ObjInfo info;
    std::string line;
    while (true) {
        auto more = reader.next(line);
        if (!more) return more.error();
        if (!*more) break;
        info = scan_line(std::move(info), line);
    }
    
    LOG_DEBUG("ObjScanner", path.filename().string() << ": " << info.line_count << " lines"
              << ", positions=" << info.has_positions
              << ", normals=" << info.has_normals
              << ", uvs=" << info.has_uvs
              << ", usemtl=" << info.has_material_groups
              << ", mtllib='" << info.mtllib << "'");
    
    if (!info.has_positions) {
        LOG_ERROR("ObjScanner", "No position records in " << path.string());
        return Error::missing_geometry(path.string());
    }
    
    return info;
}

} // namespace objmesh
