/**
 * ObjMesh - Line Reader
 * 
 * Forward-only, pull-based line cursor. Only the current line is held in
 * memory, so both OBJ passes run in memory bounded by the longest line.
 */

#pragma once

#include "result.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace objmesh {

class LineReader {
public:
    LineReader() = default;
    ~LineReader() = default;
    
    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;
    
    /**
     * Open a file for reading. Fails with IoError if it cannot be opened.
     */
    Result<void> open(const std::filesystem::path& path);
    
    /**
     * Advance to the next line. Returns false at end of stream and an
     * IoError if the underlying stream fails mid-read. A trailing CR is
     * stripped so CRLF files read the same as LF files.
     */
    Result<bool> next(std::string& line);
    
    uint64_t line_number() const { return line_number_; }
    const std::filesystem::path& path() const { return path_; }
    bool is_open() const { return stream_.is_open(); }
    
    void close();

private:
    std::ifstream stream_;
    std::filesystem::path path_;
    uint64_t line_number_ = 0;
};

} // namespace objmesh
