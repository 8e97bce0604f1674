/**
 * ObjMesh - Result Type
 * 
 * Provides a Result<T> type for consistent error handling across the
 * conversion pipeline. Every fatal condition travels as an Error value;
 * nothing throws across the public API.
 */

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <utility>

namespace objmesh {

/**
 * Error information with code and message
 */
struct Error {
    enum class Code {
        None = 0,
        MissingGeometry,     // OBJ has no position records
        IoError,             // Open or read failure while streaming
        MaterialResolution,  // Material library could not be resolved
        ImageResolution,     // A referenced texture could not be loaded
        ParseError,          // Parse diagnostic promoted to fatal (strict mode)
        InvalidArgument,
        Unknown
    };
    
    Code code = Code::None;
    std::string message;
    std::string context;  // File path, line number, texture path...
    
    Error() = default;
    Error(Code c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(Code c, std::string msg, std::string ctx) 
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}
    
    bool ok() const { return code == Code::None; }
    
    std::string full_message() const {
        if (context.empty()) {
            return message;
        }
        return message + " [" + context + "]";
    }
    
    static Error missing_geometry(const std::string& path) {
        return Error(Code::MissingGeometry, "Could not process OBJ file, no positions", path);
    }
    
    static Error io_error(const std::string& msg, const std::string& path = "") {
        return Error(Code::IoError, msg, path);
    }
    
    static Error material_resolution(const std::string& msg, const std::string& path = "") {
        return Error(Code::MaterialResolution, msg, path);
    }
    
    static Error image_resolution(const std::string& msg, const std::string& path = "") {
        return Error(Code::ImageResolution, msg, path);
    }
    
    static Error parse_error(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::ParseError, msg, ctx);
    }
    
    static Error invalid_argument(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::InvalidArgument, msg, ctx);
    }
};

constexpr const char* error_code_string(Error::Code code) {
    switch (code) {
        case Error::Code::None:               return "None";
        case Error::Code::MissingGeometry:    return "MissingGeometry";
        case Error::Code::IoError:            return "IoError";
        case Error::Code::MaterialResolution: return "MaterialResolution";
        case Error::Code::ImageResolution:    return "ImageResolution";
        case Error::Code::ParseError:         return "ParseError";
        case Error::Code::InvalidArgument:    return "InvalidArgument";
        default:                              return "Unknown";
    }
}

/**
 * Result type that holds either a value T or an Error
 * 
 * Usage:
 *   Result<ObjMesh> mesh = load_obj("model.obj");
 *   if (mesh) {
 *       upload(mesh->vertex_array);
 *   } else {
 *       std::cerr << mesh.error().full_message() << "\n";
 *   }
 */
template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}
    
    bool ok() const { return std::holds_alternative<T>(data_); }
    bool has_value() const { return ok(); }
    explicit operator bool() const { return ok(); }
    
    // Access value (throws if error)
    T& value() {
        if (!ok()) {
            throw std::runtime_error("Result contains error: " + error().message);
        }
        return std::get<T>(data_);
    }
    
    const T& value() const {
        if (!ok()) {
            throw std::runtime_error("Result contains error: " + error().message);
        }
        return std::get<T>(data_);
    }
    
    T value_or(T default_value) const {
        if (ok()) {
            return std::get<T>(data_);
        }
        return default_value;
    }
    
    const Error& error() const {
        if (ok()) {
            static Error no_error;
            return no_error;
        }
        return std::get<Error>(data_);
    }
    
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() { return value(); }
    const T& operator*() const { return value(); }
    
    std::optional<T> to_optional() const {
        if (ok()) {
            return std::get<T>(data_);
        }
        return std::nullopt;
    }

private:
    std::variant<T, Error> data_;
};

/**
 * Specialization for void results (just success/failure)
 */
template<>
class Result<void> {
public:
    Result() : error_(std::nullopt) {}
    Result(Error error) : error_(std::move(error)) {}
    
    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }
    
    const Error& error() const {
        static Error no_error;
        return error_ ? *error_ : no_error;
    }
    
    static Result success() { return Result(); }
    static Result failure(Error err) { return Result(std::move(err)); }

private:
    std::optional<Error> error_;
};

// Early return on error
#define OBJMESH_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (!_result.ok()) { \
            return _result.error(); \
        } \
    } while(0)

#define OBJMESH_TRY_ASSIGN(var, expr) \
    auto _result_##var = (expr); \
    if (!_result_##var.ok()) { \
        return _result_##var.error(); \
    } \
    auto var = std::move(_result_##var.value())

} // namespace objmesh
