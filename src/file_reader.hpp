#pragma once
/*
 * FileReader
 *
 * Purpose: read a whole file through mmap into a byte rope, no line splitting.
 * Usage: mmap_read_rope(path, out, msg); returns false with msg on failure.
 *        mmap_readlines splits text files (the rc file) on '\n', dropping '\r'.
 */
#include <filesystem>
#include <string>
#include <vector>
#include "byte_rope.hpp"

bool mmap_read_rope(const std::filesystem::path& path,
                    ByteRope& out,
                    std::string& msg);

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg);
