/**
 * ObjMesh - Mesh summary
 * 
 * Machine-readable description of a converted mesh (counts, bounds,
 * groups, materials, images, warnings) for tooling and diagnostics.
 */

#pragma once

#include "types.hpp"
#include "result.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>

namespace objmesh {

nlohmann::json make_summary(const ObjMesh& mesh);

Result<void> write_summary(const std::filesystem::path& path, const ObjMesh& mesh);

} // namespace objmesh
