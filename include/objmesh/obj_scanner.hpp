/**
 * ObjMesh - OBJ metadata scanner (pass 1)
 * 
 * Streams the file once to find out which attributes exist and which
 * material library is referenced, without building any geometry. Running
 * it first lets materials load before the geometry pass and fixes the
 * vertex layout (normals / uvs) for the whole file.
 */

#pragma once

#include "types.hpp"
#include "result.hpp"
#include <filesystem>
#include <string_view>

namespace objmesh {

class ObjScanner {
public:
    /**
     * Fold one line into the flags record. Flags are sticky and only the
     * first mtllib reference is kept.
     */
    static ObjInfo scan_line(ObjInfo info, std::string_view line);
    
    /**
     * Scan a whole file. Fails with MissingGeometry if the file has no
     * position records, or IoError if it cannot be read.
     */
    static Result<ObjInfo> scan(const std::filesystem::path& path);
};

} // namespace objmesh
