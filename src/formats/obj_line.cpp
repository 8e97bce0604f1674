/**
 * ObjMesh - OBJ line classifier implementation
 */

#include "objmesh/obj_line.hpp"
#include "objmesh/path_utils.hpp"
#include <charconv>

namespace objmesh {
namespace obj {

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::string_view next_token(std::string_view& rest) {
    size_t i = 0;
    while (i < rest.size() && is_space(rest[i])) i++;
    size_t start = i;
    while (i < rest.size() && !is_space(rest[i])) i++;
    std::string_view token = rest.substr(start, i - start);
    rest.remove_prefix(i);
    return token;
}

std::optional<float> parse_float(std::string_view token) {
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1);
    }
    if (token.empty()) return std::nullopt;
    
    float value = 0.0f;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc() || ptr != token.data() + token.size()) {
        return std::nullopt;
    }
    return value;
}

// Signed decimal index, no '+' (matches -?\d+)
static std::optional<int32_t> parse_index(std::string_view token) {
    if (token.empty()) return std::nullopt;
    
    int32_t value = 0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc() || ptr != token.data() + token.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::pair<Corner, CornerGrammar>> parse_corner(std::string_view token) {
    Corner corner;
    corner.key = std::string(token);
    
    size_t first = token.find('/');
    if (first == std::string_view::npos) {
        auto p = parse_index(token);
        if (!p) return std::nullopt;
        corner.position = *p;
        return std::make_pair(std::move(corner), CornerGrammar::VertexOnly);
    }
    
    auto p = parse_index(token.substr(0, first));
    if (!p) return std::nullopt;
    corner.position = *p;
    
    std::string_view tail = token.substr(first + 1);
    size_t second = tail.find('/');
    
    if (second == std::string_view::npos) {
        // "1/" is a vertex-only corner with a dangling separator
        if (tail.empty()) {
            corner.key = std::string(token.substr(0, first));
            return std::make_pair(std::move(corner), CornerGrammar::VertexOnly);
        }
        auto u = parse_index(tail);
        if (!u) return std::nullopt;
        corner.uv = *u;
        return std::make_pair(std::move(corner), CornerGrammar::VertexUv);
    }
    
    std::string_view uv_part = tail.substr(0, second);
    std::string_view normal_part = tail.substr(second + 1);
    
    if (uv_part.empty()) {
        auto n = parse_index(normal_part);
        if (!n) return std::nullopt;
        corner.normal = *n;
        return std::make_pair(std::move(corner), CornerGrammar::VertexNormal);
    }
    
    auto u = parse_index(uv_part);
    if (!u) return std::nullopt;
    corner.uv = *u;
    
    // "1/2/" keeps the vertex/uv grammar
    if (normal_part.empty()) {
        return std::make_pair(std::move(corner), CornerGrammar::VertexUv);
    }
    
    auto n = parse_index(normal_part);
    if (!n) return std::nullopt;
    corner.normal = *n;
    return std::make_pair(std::move(corner), CornerGrammar::VertexUvNormal);
}

template<size_t N>
static bool parse_floats(std::string_view rest, float (&out)[N]) {
    for (size_t i = 0; i < N; i++) {
        auto value = parse_float(next_token(rest));
        if (!value) return false;
        out[i] = *value;
    }
    return true;
}

static ObjLine classify_face(std::string_view rest) {
    FaceRecord face;
    size_t count = 0;
    
    for (std::string_view token = next_token(rest); !token.empty(); token = next_token(rest)) {
        if (count >= MAX_FACE_CORNERS) {
            // Keep counting for the diagnostic
            count++;
            continue;
        }
        
        auto parsed = parse_corner(token);
        if (!parsed) {
            return MalformedLine{ParseWarning::Kind::MalformedFace,
                                 "invalid face corner '" + std::string(token) + "'"};
        }
        
        if (count == 0) {
            face.grammar = parsed->second;
        } else if (parsed->second != face.grammar) {
            return MalformedLine{ParseWarning::Kind::MalformedFace,
                                 std::string("mixed corner formats (") + corner_grammar_string(face.grammar) +
                                 " and " + corner_grammar_string(parsed->second) + ")"};
        }
        
        face.corners[count] = std::move(parsed->first);
        count++;
    }
    
    if (count < 3 || count > MAX_FACE_CORNERS) {
        return MalformedLine{ParseWarning::Kind::UnsupportedPolygon,
                             "face with " + std::to_string(count) + " corners (supported: 3 or 4)"};
    }
    
    face.corner_count = count;
    return face;
}

ObjLine classify_line(std::string_view line) {
    std::string_view rest = trim(line);
    if (rest.empty() || rest.front() == '#') {
        return SkipLine{};
    }
    
    std::string_view keyword = next_token(rest);
    
    if (keyword == "v") {
        float xyz[3];
        if (!parse_floats(rest, xyz)) {
            return MalformedLine{ParseWarning::Kind::MalformedRecord, "position needs three numbers"};
        }
        return PositionRecord{glm::vec3(xyz[0], xyz[1], xyz[2])};
    }
    
    if (keyword == "vn") {
        float xyz[3];
        if (!parse_floats(rest, xyz)) {
            return MalformedLine{ParseWarning::Kind::MalformedRecord, "normal needs three numbers"};
        }
        return NormalRecord{glm::vec3(xyz[0], xyz[1], xyz[2])};
    }
    
    if (keyword == "vt") {
        float uv[2];
        if (!parse_floats(rest, uv)) {
            return MalformedLine{ParseWarning::Kind::MalformedRecord, "texture coordinate needs two numbers"};
        }
        return UvRecord{glm::vec2(uv[0], uv[1])};
    }
    
    if (keyword == "f") {
        return classify_face(rest);
    }
    
    if (keyword == "usemtl") {
        std::string_view name = trim(rest);
        if (name.empty()) return IgnoredLine{};
        return UseMaterial{std::string(name)};
    }
    
    if (keyword == "mtllib") {
        std::string_view path = trim(rest);
        if (path.empty()) return IgnoredLine{};
        return MaterialLibrary{std::string(path)};
    }
    
    return IgnoredLine{};
}

} // namespace obj
} // namespace objmesh
