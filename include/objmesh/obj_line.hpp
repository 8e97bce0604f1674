/**
 * ObjMesh - OBJ line classifier
 * 
 * Turns one OBJ text line into a tagged record. The matchers are ordered
 * and exhaustive: every line maps to exactly one alternative of ObjLine.
 */

#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace objmesh {
namespace obj {

/**
 * The four supported face-corner grammars.
 */
enum class CornerGrammar {
    VertexOnly,       // f 1 2 3
    VertexUv,         // f 1/1 2/2 3/3
    VertexUvNormal,   // f 1/1/1 2/2/2 3/3/3
    VertexNormal      // f 1//1 2//2 3//3
};

constexpr const char* corner_grammar_string(CornerGrammar grammar) {
    switch (grammar) {
        case CornerGrammar::VertexOnly:     return "v";
        case CornerGrammar::VertexUv:       return "v/vt";
        case CornerGrammar::VertexUvNormal: return "v/vt/vn";
        case CornerGrammar::VertexNormal:   return "v//vn";
        default:                            return "?";
    }
}

/**
 * One face corner. Indices are unresolved OBJ indices (1-based, or
 * negative for relative references); key is the corner token as written.
 */
struct Corner {
    std::string key;
    int32_t position = 0;
    std::optional<int32_t> uv;
    std::optional<int32_t> normal;
};

constexpr size_t MAX_FACE_CORNERS = 4;

struct SkipLine {};          // Blank line or comment

struct PositionRecord {
    glm::vec3 value{0.0f};
};

struct NormalRecord {
    glm::vec3 value{0.0f};   // As written, not yet normalized
};

struct UvRecord {
    glm::vec2 value{0.0f};   // As written, v not yet flipped
};

struct FaceRecord {
    CornerGrammar grammar = CornerGrammar::VertexOnly;
    std::array<Corner, MAX_FACE_CORNERS> corners;
    size_t corner_count = 0;
};

struct UseMaterial {
    std::string name;
};

struct MaterialLibrary {
    std::string path;
};

struct IgnoredLine {};       // o, g, s, l, p and unknown statements

struct MalformedLine {
    ParseWarning::Kind kind = ParseWarning::Kind::MalformedRecord;
    std::string message;
};

using ObjLine = std::variant<SkipLine, PositionRecord, NormalRecord, UvRecord,
                             FaceRecord, UseMaterial, MaterialLibrary,
                             IgnoredLine, MalformedLine>;

/**
 * Classify a single line (without its terminator).
 */
ObjLine classify_line(std::string_view line);

/**
 * Parse one corner token. Returns nullopt if the token fits none of the
 * four grammars.
 */
std::optional<std::pair<Corner, CornerGrammar>> parse_corner(std::string_view token);

/**
 * Split off the next whitespace-delimited token from rest.
 */
std::string_view next_token(std::string_view& rest);

/**
 * Parse a float the way OBJ writers emit them (optional sign, exponent).
 */
std::optional<float> parse_float(std::string_view token);

} // namespace obj
} // namespace objmesh
