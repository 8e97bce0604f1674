/**
 * ObjMesh - Command line entry point
 * 
 *   objmesh model.obj
 *   objmesh model.obj --base-dir ./assets --summary model.json
 *   objmesh --help
 */

#include "objmesh/obj_loader.hpp"
#include "objmesh/settings.hpp"
#include "objmesh/summary.hpp"
#include "objmesh/files.hpp"
#include "objmesh/logging.hpp"

#include <iostream>
#include <string>
#include <filesystem>

// CLI argument parsing
struct CliArgs {
    bool show_help = false;
    bool strict = false;
    bool no_images = false;
    bool verbose = false;
    bool debug_logging = false;
    std::string input_path;
    std::string base_dir;
    std::string config_path;
    std::string summary_path;
    std::string error;
};

void print_help() {
    std::cout << R"(
objmesh - convert Wavefront OBJ files into indexed, material-grouped meshes

Usage:
  objmesh <file.obj> [options]
  objmesh --help

Options:
  --help, -h             Show this help message
  --base-dir, -b <dir>   Directory for relative mtllib and texture paths
                         (default: the OBJ's directory)
  --config, -c <file>    Loader settings (JSON)
  --summary, -s <file>   Write a JSON summary of the converted mesh
  --strict               Treat parse warnings as errors
  --no-images            Do not load textures referenced by materials
  --verbose, -v          Log progress to the console
  --debug, -d            Debug logging, also written to objmesh.log

Exit codes:
  0  success
  1  usage error
  2  conversion failed

)" << std::endl;
}

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;
    
    auto take_value = [&](int& i, std::string& out, const std::string& flag) {
        if (i + 1 < argc) {
            out = argv[++i];
        } else {
            args.error = "Missing value for " + flag;
        }
    };
    
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        
        if (arg == "--help" || arg == "-h") {
            args.show_help = true;
        }
        else if (arg == "--base-dir" || arg == "-b") {
            take_value(i, args.base_dir, arg);
        }
        else if (arg == "--config" || arg == "-c") {
            take_value(i, args.config_path, arg);
        }
        else if (arg == "--summary" || arg == "-s") {
            take_value(i, args.summary_path, arg);
        }
        else if (arg == "--strict") {
            args.strict = true;
        }
        else if (arg == "--no-images") {
            args.no_images = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        }
        else if (arg == "--debug" || arg == "-d") {
            args.debug_logging = true;
        }
        else if (!arg.empty() && arg[0] == '-') {
            args.error = "Unknown option: " + arg;
        }
        else if (args.input_path.empty()) {
            args.input_path = arg;
        }
        else {
            args.error = "Unexpected argument: " + arg;
        }
    }
    
    return args;
}

int run_cli(const CliArgs& args) {
    objmesh::LoaderSettings settings;
    if (!args.config_path.empty()) {
        auto loaded = objmesh::load_settings(args.config_path);
        if (!loaded) {
            std::cerr << "Error: " << loaded.error().full_message() << "\n";
            return 1;
        }
        settings = loaded.value();
    }
    if (args.strict) settings.strict = true;
    if (args.no_images) settings.load_images = false;
    
    auto& logger = objmesh::Logger::instance();
    if (args.debug_logging) {
        logger.set_level(objmesh::LogLevel::Debug);
        if (logger.set_file("objmesh.log")) {
            LOG_INFO("App", "Debug logging enabled, writing objmesh.log");
        } else {
            LOG_WARNING("App", "Could not open objmesh.log, logging to console only");
        }
    } else if (args.verbose) {
        logger.set_level(objmesh::LogLevel::Info);
    } else {
        logger.set_level(settings.log_level);
    }
    
    objmesh::ObjLoader loader(settings);
    auto mesh = loader.load(args.input_path, args.base_dir);
    if (!mesh) {
        const auto& err = mesh.error();
        std::cerr << "Error (" << objmesh::error_code_string(err.code) << "): " << err.full_message() << "\n";
        return 2;
    }
    
    std::cout << "OBJ: " << args.input_path << "\n";
    std::cout << "Vertices:  " << mesh->vertex_count << " (stride " << mesh->stride() << " floats"
              << (mesh->has_normals ? ", normals" : "") << (mesh->has_uvs ? ", uvs" : "") << ")\n";
    std::cout << "Triangles: " << mesh->triangle_count() << "\n";
    if (mesh->vertex_count > 0) {
        std::cout << "Bounds:    [" << mesh->position_min.x << ", " << mesh->position_min.y << ", "
                  << mesh->position_min.z << "] - [" << mesh->position_max.x << ", "
                  << mesh->position_max.y << ", " << mesh->position_max.z << "]\n";
    }
    
    std::cout << "Groups:    " << mesh->material_groups.size() << "\n";
    for (const auto& [name, indices] : mesh->material_groups) {
        std::cout << "  " << name << ": " << indices.size() / 3 << " triangles\n";
    }
    
    std::cout << "Materials: " << mesh->materials.size() << "\n";
    std::cout << "Images:    " << mesh->images.size() << "\n";
    for (const auto& [path, image] : mesh->images) {
        std::cout << "  " << path << ": " << image.width << "x" << image.height
                  << " " << objmesh::image_format_string(image.format)
                  << " (" << objmesh::format_file_size(image.source.size()) << ")"
                  << (image.transparent ? " transparent" : "") << "\n";
    }
    
    std::cout << "Warnings:  " << mesh->warnings.size() << "\n";
    if (args.verbose) {
        for (const auto& w : mesh->warnings) {
            std::cout << "  line " << w.line << ": " << objmesh::warning_kind_string(w.kind)
                      << ": " << w.message << "\n";
        }
    }
    
    if (!args.summary_path.empty()) {
        auto written = objmesh::write_summary(args.summary_path, mesh.value());
        if (!written) {
            std::cerr << "Error: " << written.error().full_message() << "\n";
            return 2;
        }
        std::cout << "Summary written to " << args.summary_path << "\n";
    }
    
    return 0;
}

int main(int argc, char* argv[]) {
    CliArgs args = parse_args(argc, argv);
    
    if (args.show_help) {
        print_help();
        return 0;
    }
    
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << "\n";
        print_help();
        return 1;
    }
    
    if (args.input_path.empty()) {
        std::cerr << "Error: No OBJ file specified\n";
        print_help();
        return 1;
    }
    
    int result = run_cli(args);
    objmesh::Logger::instance().close_file();
    return result;
}
