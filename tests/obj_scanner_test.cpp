/**
 * ObjMesh - Metadata scanner tests
 */

#include "objmesh/obj_scanner.hpp"
#include "test_helpers.hpp"

using namespace objmesh;

TEST(ObjScanner, FlagsAreSticky) {
    ObjInfo info;
    info = ObjScanner::scan_line(info, "v 0 0 0");
    info = ObjScanner::scan_line(info, "# vn 0 0 1");
    EXPECT_TRUE(info.has_positions);
    EXPECT_FALSE(info.has_normals);
    
    info = ObjScanner::scan_line(info, "vt 0 0");
    info = ObjScanner::scan_line(info, "f 1 1 1");
    EXPECT_TRUE(info.has_uvs);
    EXPECT_TRUE(info.has_positions);
    EXPECT_EQ(info.line_count, 4u);
}

TEST(ObjScanner, NormalLineIsNotAPosition) {
    ObjInfo info = ObjScanner::scan_line(ObjInfo{}, "vn 0 0 1");
    EXPECT_TRUE(info.has_normals);
    EXPECT_FALSE(info.has_positions);
}

TEST(ObjScanner, LeadingWhitespaceMatchesClassifier) {
    ObjInfo info;
    info = ObjScanner::scan_line(info, "\fv 1 2 3");
    info = ObjScanner::scan_line(info, "\v\tvn 0 0 1");
    info = ObjScanner::scan_line(info, " \f usemtl red");
    EXPECT_TRUE(info.has_positions);
    EXPECT_TRUE(info.has_normals);
    EXPECT_TRUE(info.has_material_groups);
}

TEST(ObjScanner, FirstMaterialLibraryWins) {
    ObjInfo info;
    info = ObjScanner::scan_line(info, "mtllib first.mtl");
    info = ObjScanner::scan_line(info, "mtllib second.mtl");
    info = ObjScanner::scan_line(info, "  usemtl red");
    EXPECT_EQ(info.mtllib, "first.mtl");
    EXPECT_TRUE(info.has_material_groups);
}

class ObjScannerFileTest : public test::TempDirTest {};

TEST_F(ObjScannerFileTest, ScanFile) {
    auto path = write_text("cube.obj",
        "mtllib cube.mtl\r\n"
        "v 0 0 0\r\n"
        "v 1 0 0\r\n"
        "v 0 1 0\r\n"
        "vn 0 0 1\r\n"
        "usemtl red\r\n"
        "f 1//1 2//1 3//1\r\n");
    
    auto info = ObjScanner::scan(path);
    ASSERT_TRUE(info) << info.error().full_message();
    EXPECT_TRUE(info->has_positions);
    EXPECT_TRUE(info->has_normals);
    EXPECT_FALSE(info->has_uvs);
    EXPECT_TRUE(info->has_material_groups);
    EXPECT_EQ(info->mtllib, "cube.mtl");
    EXPECT_EQ(info->line_count, 7u);
}

TEST_F(ObjScannerFileTest, NoPositionsIsMissingGeometry) {
    auto path = write_text("empty.obj", "# nothing here\nvn 0 0 1\n");
    auto info = ObjScanner::scan(path);
    ASSERT_FALSE(info);
    EXPECT_EQ(info.error().code, Error::Code::MissingGeometry);
    EXPECT_EQ(info.error().message, "Could not process OBJ file, no positions");
}

TEST_F(ObjScannerFileTest, MissingFileIsIoError) {
    auto info = ObjScanner::scan(dir_ / "absent.obj");
    ASSERT_FALSE(info);
    EXPECT_EQ(info.error().code, Error::Code::IoError);
}
