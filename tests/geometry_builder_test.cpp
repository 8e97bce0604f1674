/**
 * ObjMesh - Geometry builder tests
 */

#include "objmesh/geometry_builder.hpp"
#include "objmesh/obj_scanner.hpp"
#include "test_helpers.hpp"
#include <initializer_list>
#include <string_view>

using namespace objmesh;

namespace {

// Run both passes over in-memory lines
ObjMesh build_lines(std::initializer_list<std::string_view> lines,
                    MaterialMap materials = {}, const LoaderSettings& settings = {}) {
    ObjInfo info;
    for (auto line : lines) {
        info = ObjScanner::scan_line(info, line);
    }
    
    GeometryBuilder builder(info, std::move(materials), settings);
    uint64_t n = 0;
    for (auto line : lines) {
        auto status = builder.consume_line(line, ++n);
        EXPECT_TRUE(status) << status.error().full_message();
    }
    return builder.finish();
}

MaterialMap materials_named(std::initializer_list<const char*> names) {
    MaterialMap map;
    for (const char* name : names) {
        map.emplace(name, Material::make_default(name));
    }
    return map;
}

void expect_well_formed(const ObjMesh& mesh) {
    EXPECT_EQ(mesh.vertex_array.size(), static_cast<size_t>(mesh.vertex_count) * mesh.stride());
    for (const auto& [name, indices] : mesh.material_groups) {
        EXPECT_EQ(indices.size() % 3, 0u) << name;
        for (uint32_t index : indices) {
            EXPECT_LT(index, mesh.vertex_count) << name;
        }
    }
    if (mesh.vertex_count > 0) {
        for (int k = 0; k < 3; k++) {
            EXPECT_LE(mesh.position_min[k], mesh.position_max[k]);
        }
    }
}

} // namespace

TEST(GeometryBuilder, ResolveOffset) {
    // Three positions
    EXPECT_EQ(GeometryBuilder::resolve_offset(1, 9, 3), 0u);
    EXPECT_EQ(GeometryBuilder::resolve_offset(3, 9, 3), 6u);
    EXPECT_EQ(GeometryBuilder::resolve_offset(-1, 9, 3), 6u);
    EXPECT_EQ(GeometryBuilder::resolve_offset(-3, 9, 3), 0u);
    EXPECT_FALSE(GeometryBuilder::resolve_offset(0, 9, 3).has_value());
    EXPECT_FALSE(GeometryBuilder::resolve_offset(4, 9, 3).has_value());
    EXPECT_FALSE(GeometryBuilder::resolve_offset(-4, 9, 3).has_value());
    
    // Two uvs
    EXPECT_EQ(GeometryBuilder::resolve_offset(2, 4, 2), 2u);
    EXPECT_EQ(GeometryBuilder::resolve_offset(-2, 4, 2), 0u);
}

TEST(GeometryBuilder, SingleTriangle) {
    auto mesh = build_lines({
        "v 0 0 0",
        "v 1 0 0",
        "v 0 1 0",
        "f 1 2 3",
    });
    
    expect_well_formed(mesh);
    EXPECT_EQ(mesh.vertex_count, 3u);
    EXPECT_EQ(mesh.stride(), 3u);
    EXPECT_FALSE(mesh.has_normals);
    EXPECT_FALSE(mesh.has_uvs);
    
    ASSERT_EQ(mesh.material_groups.size(), 1u);
    const auto& [name, indices] = *mesh.material_groups.begin();
    EXPECT_EQ(name, "objmeshDefaultMat");
    EXPECT_EQ(indices, (std::vector<uint32_t>{0, 1, 2}));
    EXPECT_EQ(mesh.materials.count("objmeshDefaultMat"), 1u);
    
    EXPECT_EQ(mesh.position_min, glm::vec3(0.0f));
    EXPECT_EQ(mesh.position_max, glm::vec3(1.0f, 1.0f, 0.0f));
}

TEST(GeometryBuilder, QuadSplitsAlongFirstDiagonal) {
    auto mesh = build_lines({
        "v 0 0 0",
        "v 1 0 0",
        "v 1 1 0",
        "v 0 1 0",
        "f 1 2 3 4",
    });
    
    expect_well_formed(mesh);
    EXPECT_EQ(mesh.vertex_count, 4u);
    const auto& indices = mesh.material_groups.at("objmeshDefaultMat");
    EXPECT_EQ(indices, (std::vector<uint32_t>{0, 1, 2, 0, 2, 3}));
    EXPECT_EQ(mesh.triangle_count(), 2u);
}

TEST(GeometryBuilder, SharedCornersAreDeduplicated) {
    auto mesh = build_lines({
        "v 0 0 0",
        "v 1 0 0",
        "v 1 1 0",
        "v 0 1 0",
        "f 1 2 3",
        "f 1 3 4",
    });
    
    expect_well_formed(mesh);
    EXPECT_EQ(mesh.vertex_count, 4u);
    EXPECT_EQ(mesh.material_groups.at("objmeshDefaultMat"),
              (std::vector<uint32_t>{0, 1, 2, 0, 2, 3}));
}

TEST(GeometryBuilder, DistinctKeysNeverMerge) {
    // Same position, different uv: two vertices
    auto mesh = build_lines({
        "v 0 0 0",
        "v 1 0 0",
        "v 0 1 0",
        "vt 0 0",
        "vt 1 0",
        "f 1/1 2/1 3/1",
        "f 1/2 2/1 3/1",
    });
    
    expect_well_formed(mesh);
    EXPECT_EQ(mesh.vertex_count, 4u);
    EXPECT_EQ(mesh.material_groups.at("objmeshDefaultMat"),
              (std::vector<uint32_t>{0, 1, 2, 3, 1, 2}));
}

TEST(GeometryBuilder, NegativeIndicesResolveAgainstCurrentCount) {
    auto relative = build_lines({
        "v 1 0 0",
        "v 0 2 0",
        "v 0 0 3",
        "f -1 -2 -3",
    });
    auto absolute = build_lines({
        "v 1 0 0",
        "v 0 2 0",
        "v 0 0 3",
        "f 3 2 1",
    });
    
    expect_well_formed(relative);
    EXPECT_EQ(relative.vertex_array, absolute.vertex_array);
    EXPECT_FLOAT_EQ(relative.vertex_array[2], 3.0f);
}

TEST(GeometryBuilder, NegativeIndicesSeeOnlyEarlierRecords) {
    auto mesh = build_lines({
        "v 0 0 0",
        "v 1 0 0",
        "v 0 1 0",
        "v 5 5 5",
        "f -4 -3 -1",
        "v 9 9 9",
    });
    
    expect_well_formed(mesh);
    EXPECT_EQ(mesh.vertex_count, 3u);
    EXPECT_FLOAT_EQ(mesh.vertex_array[2 * 3], 5.0f);
    EXPECT_EQ(mesh.position_max, glm::vec3(5.0f));
}

TEST(GeometryBuilder, RelativeCornersAreCachedByToken) {
    // "-1" was first seen when it meant position 3; later uses share that vertex
    auto mesh = build_lines({
        "v 0 0 0",
        "v 1 0 0",
        "v 0 1 0",
        "f -3 -2 -1",
        "v 5 5 5",
        "f -4 -3 -1",
    });
    
    expect_well_formed(mesh);
    EXPECT_EQ(mesh.vertex_count, 5u);
    const auto& indices = mesh.material_groups.at("objmeshDefaultMat");
    EXPECT_EQ(indices, (std::vector<uint32_t>{0, 1, 2, 3, 4, 2}));
    EXPECT_EQ(mesh.position_max, glm::vec3(1.0f, 1.0f, 0.0f));
}

TEST(GeometryBuilder, VertexLayoutWithNormalsAndUvs) {
    auto mesh = build_lines({
        "v 0 0 0",
        "v 1 0 0",
        "v 0 1 0",
        "vt 0.2 0.9",
        "vn 0 0 5",
        "f 1/1/1 2/1/1 3/1/1",
    });
    
    expect_well_formed(mesh);
    ASSERT_EQ(mesh.stride(), 8u);
    EXPECT_TRUE(mesh.has_normals);
    EXPECT_TRUE(mesh.has_uvs);
    
    // position, normal, uv
    const float* v = mesh.vertex_array.data() + 8;
    EXPECT_FLOAT_EQ(v[0], 1.0f);
    EXPECT_FLOAT_EQ(v[3], 0.0f);
    EXPECT_FLOAT_EQ(v[4], 0.0f);
    EXPECT_FLOAT_EQ(v[5], 1.0f);
    EXPECT_FLOAT_EQ(v[6], 0.2f);
    EXPECT_NEAR(v[7], 0.1f, 1e-6f);
}

TEST(GeometryBuilder, MissingAttributesArePaddedWithZeros) {
    auto mesh = build_lines({
        "v 0 0 0",
        "v 1 0 0",
        "v 0 1 0",
        "vt 0.5 0.5",
        "vn 1 0 0",
        "f 1 2 3",
    });
    
    expect_well_formed(mesh);
    ASSERT_EQ(mesh.stride(), 8u);
    for (uint32_t i = 0; i < mesh.vertex_count; i++) {
        for (int k = 3; k < 8; k++) {
            EXPECT_FLOAT_EQ(mesh.vertex_array[i * 8 + k], 0.0f);
        }
    }
}

TEST(GeometryBuilder, ZeroLengthNormalWarns) {
    auto mesh = build_lines({
        "v 0 0 0",
        "v 1 0 0",
        "v 0 1 0",
        "vn 0 0 0",
        "f 1//1 2//1 3//1",
    });
    
    expect_well_formed(mesh);
    ASSERT_EQ(mesh.warnings.size(), 1u);
    EXPECT_EQ(mesh.warnings[0].kind, ParseWarning::Kind::DegenerateNormal);
    EXPECT_EQ(mesh.warnings[0].line, 4u);
    EXPECT_FLOAT_EQ(mesh.vertex_array[3], 0.0f);
}

TEST(GeometryBuilder, MaterialGroups) {
    auto mesh = build_lines({
        "v 0 0 0",
        "v 1 0 0",
        "v 0 1 0",
        "v 1 1 0",
        "usemtl red",
        "f 1 2 3",
        "usemtl blue",
        "f 2 4 3",
        "usemtl red",
        "f 1 2 4",
    }, materials_named({"red", "blue"}));
    
    expect_well_formed(mesh);
    ASSERT_EQ(mesh.material_groups.size(), 2u);
    EXPECT_EQ(mesh.material_groups.at("red"), (std::vector<uint32_t>{0, 1, 2, 0, 1, 3}));
    EXPECT_EQ(mesh.material_groups.at("blue"), (std::vector<uint32_t>{1, 3, 2}));
    EXPECT_EQ(mesh.materials.count("objmeshDefaultMat"), 0u);
}

TEST(GeometryBuilder, UnknownMaterialFallsBackToDefault) {
    auto mesh = build_lines({
        "v 0 0 0",
        "v 1 0 0",
        "v 0 1 0",
        "usemtl missing",
        "f 1 2 3",
    }, materials_named({"red"}));
    
    expect_well_formed(mesh);
    ASSERT_EQ(mesh.material_groups.size(), 1u);
    EXPECT_EQ(mesh.material_groups.count("objmeshDefaultMat"), 1u);
    EXPECT_EQ(mesh.materials.count("objmeshDefaultMat"), 1u);
    EXPECT_EQ(mesh.materials.count("red"), 1u);
}

TEST(GeometryBuilder, FacesBeforeUsemtlUseDefault) {
    auto mesh = build_lines({
        "v 0 0 0",
        "v 1 0 0",
        "v 0 1 0",
        "f 1 2 3",
        "usemtl red",
        "f 3 2 1",
    }, materials_named({"red"}));
    
    expect_well_formed(mesh);
    EXPECT_EQ(mesh.material_groups.at("objmeshDefaultMat").size(), 3u);
    EXPECT_EQ(mesh.material_groups.at("red").size(), 3u);
}

TEST(GeometryBuilder, CustomDefaultMaterialName) {
    LoaderSettings settings;
    settings.default_material_name = "fallback";
    auto mesh = build_lines({"v 0 0 0", "v 1 0 0", "v 0 1 0", "f 1 2 3"}, {}, settings);
    EXPECT_EQ(mesh.material_groups.count("fallback"), 1u);
    EXPECT_EQ(mesh.materials.at("fallback").name, "fallback");
}

TEST(GeometryBuilder, OutOfRangeFaceIsSkipped) {
    auto mesh = build_lines({
        "v 0 0 0",
        "v 1 0 0",
        "v 0 1 0",
        "f 1 2 4",
        "f 1 2 3",
    });
    
    expect_well_formed(mesh);
    EXPECT_EQ(mesh.triangle_count(), 1u);
    EXPECT_EQ(mesh.vertex_count, 3u);
    ASSERT_EQ(mesh.warnings.size(), 1u);
    EXPECT_EQ(mesh.warnings[0].kind, ParseWarning::Kind::IndexOutOfRange);
    EXPECT_EQ(mesh.warnings[0].line, 4u);
}

TEST(GeometryBuilder, PartiallyValidFaceEmitsNothing) {
    auto mesh = build_lines({
        "v 0 0 0",
        "v 1 0 0",
        "v 0 1 0",
        "f 1 2 3 9",
    });
    EXPECT_EQ(mesh.vertex_count, 0u);
    EXPECT_EQ(mesh.triangle_count(), 0u);
    EXPECT_TRUE(mesh.vertex_array.empty());
}

TEST(GeometryBuilder, UnsupportedPolygonIsSkipped) {
    auto mesh = build_lines({
        "v 0 0 0",
        "v 1 0 0",
        "v 1 1 0",
        "v 0 1 0",
        "v 0.5 2 0",
        "f 1 2 3 4 5",
    });
    EXPECT_EQ(mesh.triangle_count(), 0u);
    ASSERT_EQ(mesh.warnings.size(), 1u);
    EXPECT_EQ(mesh.warnings[0].kind, ParseWarning::Kind::UnsupportedPolygon);
}

TEST(GeometryBuilder, StrictModeFailsOnFirstWarning) {
    ObjInfo info;
    info.has_positions = true;
    LoaderSettings settings;
    settings.strict = true;
    
    GeometryBuilder builder(info, {}, settings);
    ASSERT_TRUE(builder.consume_line("v 0 0 0", 1));
    auto status = builder.consume_line("f 1 2 3", 2);
    ASSERT_FALSE(status);
    EXPECT_EQ(status.error().code, Error::Code::ParseError);
    EXPECT_EQ(status.error().context, "line 2");
}

class GeometryBuilderFileTest : public test::TempDirTest {};

TEST_F(GeometryBuilderFileTest, BuildFromFile) {
    auto path = write_text("tri.obj", "v 0 0 0\nv 2 0 0\nv 0 2 0\nf 1 2 3\n");
    auto info = ObjScanner::scan(path);
    ASSERT_TRUE(info) << info.error().full_message();
    
    auto mesh = GeometryBuilder::build(path, info.value(), {});
    ASSERT_TRUE(mesh) << mesh.error().full_message();
    EXPECT_EQ(mesh->vertex_count, 3u);
    EXPECT_EQ(mesh->position_max, glm::vec3(2.0f, 2.0f, 0.0f));
}

TEST_F(GeometryBuilderFileTest, StrictBuildReportsLine) {
    auto path = write_text("bad.obj", "v 0 0 0\nv 1 0 0\nv 0 1 0\n\nf 1 2\n");
    auto info = ObjScanner::scan(path);
    ASSERT_TRUE(info);
    
    LoaderSettings settings;
    settings.strict = true;
    auto mesh = GeometryBuilder::build(path, info.value(), {}, settings);
    ASSERT_FALSE(mesh);
    EXPECT_EQ(mesh.error().code, Error::Code::ParseError);
    EXPECT_EQ(mesh.error().context, "line 5");
}

TEST(GeometryBuilder, LoggedWarningsAreCapped) {
    auto& logger = Logger::instance();
    std::vector<std::string> messages;
    logger.set_level(LogLevel::Warning);
    logger.set_console_output(false);
    logger.set_callback([&messages](LogLevel, const std::string& message) {
        messages.push_back(message);
    });
    
    LoaderSettings settings;
    settings.max_logged_warnings = 2;
    auto mesh = build_lines({
        "v 0 0 0",
        "f 1 2 3",
        "f 1 2 3",
        "f 1 2 3",
        "f 1 2 3",
    }, {}, settings);
    
    logger.set_callback(nullptr);
    logger.set_console_output(true);
    logger.set_level(LogLevel::None);
    
    EXPECT_EQ(mesh.warnings.size(), 4u);
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_NE(messages[0].find("[WARN] [GeometryBuilder] line 2"), std::string::npos);
    EXPECT_NE(messages[2].find("further parse warnings are not logged"), std::string::npos);
}

TEST(GeometryBuilder, DanglingSlashSharesVertex) {
    auto mesh = build_lines({
        "v 0 0 0",
        "v 1 0 0",
        "v 0 1 0",
        "f 1/ 2/ 3/",
        "f 1 2 3",
    });
    EXPECT_EQ(mesh.vertex_count, 3u);
    EXPECT_EQ(mesh.triangle_count(), 2u);
}

TEST(GeometryBuilder, OddlyIndentedRecordsAgreeAcrossPasses) {
    auto mesh = build_lines({
        "\fv 0 0 0",
        "\vv 1 0 0",
        "\t v 0 1 0",
        "\f\vvn 0 0 1",
        "f 1//1 2//1 3//1",
    });
    expect_well_formed(mesh);
    EXPECT_TRUE(mesh.has_normals);
    EXPECT_EQ(mesh.stride(), 6u);
    EXPECT_EQ(mesh.vertex_count, 3u);
    EXPECT_FLOAT_EQ(mesh.vertex_array[5], 1.0f);
}
