/**
 * ObjMesh - Line Reader Implementation
 */

#include "objmesh/line_reader.hpp"
#include "objmesh/logging.hpp"

namespace objmesh {

Result<void> LineReader::open(const std::filesystem::path& path) {
    close();
    path_ = path;
    line_number_ = 0;
    
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return Error::io_error("Path is a directory", path.string());
    }
    
    stream_.open(path, std::ios::in | std::ios::binary);
    if (!stream_.is_open()) {
        return Error::io_error("Failed to open file", path.string());
    }
    
    LOG_DEBUG("LineReader", "Opened " << path.string());
    return Result<void>::success();
}

Result<bool> LineReader::next(std::string& line) {
    if (!stream_.is_open()) {
        return Error::io_error("Read from closed stream", path_.string());
    }
    
    if (!std::getline(stream_, line)) {
        if (stream_.bad()) {
            return Error::io_error("Read failure after line " + std::to_string(line_number_), path_.string());
        }
        return false;
    }
    
    ++line_number_;
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

void LineReader::close() {
    if (stream_.is_open()) {
        stream_.close();
    }
    stream_.clear();
}

} // namespace objmesh
